#include <bw/math/root_finder.hpp>
#include <bw/core/errors.hpp>

#include <cmath>
#include <sstream>

namespace bw {
namespace math {

namespace {

struct NewtonOutcome {
  bool        converged;
  double      x;
  int         iters;
  std::string why;   // raison de l'échec si !converged
};

NewtonOutcome newton(const std::function<Evaluation(double)>& f,
                     const RootProblem& pb,
                     const bw::config::SolverConfig& cfg)
{
  double x = pb.initial_guess;
  if (!std::isfinite(x) || x <= pb.domain_lo) {
    return { false, x, 0, "initial guess outside the domain" };
  }

  int it = 0;
  for (; it < cfg.newton_max; ++it) {
    const Evaluation ev = f(x);
    if (!std::isfinite(ev.value)) {
      return { false, x, it, "non-finite function value" };
    }
    if (std::fabs(ev.value) < pb.value_tolerance) {
      return { true, x, it, {} };
    }
    if (!std::isfinite(ev.derivative) || std::fabs(ev.derivative) < cfg.derivative_floor) {
      return { false, x, it, "derivative below numerical floor" };
    }

    const double x_new = x - ev.value / ev.derivative;
    if (!std::isfinite(x_new) || x_new <= pb.domain_lo) {
      return { false, x, it + 1, "iterate left the domain (discount base <= 0)" };
    }
    if (std::fabs(x_new - x) < cfg.yield_tolerance) {
      return { true, x_new, it + 1, {} };
    }
    x = x_new;
  }
  return { false, x, it, "iteration cap reached" };
}

// Signe de f en tolérant +/-inf (ex. prix énorme près de la borne basse), pas NaN.
inline bool usable(double v) { return !std::isnan(v); }

} // namespace

RootResult solve_root(const std::function<Evaluation(double)>& f,
                      const RootProblem& pb,
                      const bw::config::SolverConfig& cfg)
{
  const NewtonOutcome nt = newton(f, pb, cfg);
  if (nt.converged) {
    return { nt.x, nt.iters, false };
  }

  if (cfg.fallback == bw::config::SolverFallback::None) {
    throw ConvergenceError(pb.name + ": Newton failed (" + nt.why + ")", nt.iters, nt.x);
  }

  // Repli bisection : le bracket doit encadrer un changement de signe.
  double a = pb.bracket_lo, b = pb.bracket_hi;
  if (!(a > pb.domain_lo) || !(b > a)) {
    throw ConvergenceError(pb.name + ": invalid bisection bracket", nt.iters, nt.x);
  }
  double fa = f(a).value;
  double fb = f(b).value;
  if (fa == 0.0) return { a, nt.iters, true };
  if (fb == 0.0) return { b, nt.iters, true };
  if (!usable(fa) || !usable(fb) || (fa > 0.0) == (fb > 0.0)) {
    std::ostringstream os;
    os << pb.name << ": Newton failed (" << nt.why << ") and f has no sign change on ["
       << a << ", " << b << "]";
    throw ConvergenceError(os.str(), nt.iters, nt.x);
  }

  int it = nt.iters;
  double mid = 0.5 * (a + b);
  for (int k = 0; k < cfg.bisect_max; ++k, ++it) {
    mid = 0.5 * (a + b);
    const double fm = f(mid).value;
    if (std::isnan(fm)) break;
    if (std::fabs(fm) < pb.value_tolerance || 0.5 * (b - a) < cfg.yield_tolerance) {
      return { mid, it + 1, true };
    }
    if ((fm > 0.0) == (fa > 0.0)) { a = mid; fa = fm; } else { b = mid; }
  }

  throw ConvergenceError(pb.name + ": bisection did not converge", it, mid);
}

} // namespace math
} // namespace bw
