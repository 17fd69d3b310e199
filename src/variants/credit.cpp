#include <bw/variants/credit.hpp>
#include <bw/market/bond.hpp>
#include <bw/math/root_finder.hpp>
#include <bw/core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace bw {
namespace variants {

CreditSpreadOverlay::CreditSpreadOverlay(double recovery_rate)
  : recovery_rate_(recovery_rate) {
  if (!std::isfinite(recovery_rate) || recovery_rate < 0.0 || recovery_rate >= 1.0) {
    throw InvalidInputError("CreditSpreadOverlay: recovery_rate must be in [0, 1)");
  }
}

double default_probability(double credit_spread, double recovery_rate) {
  if (!std::isfinite(recovery_rate) || recovery_rate < 0.0 || recovery_rate >= 1.0) {
    throw InvalidInputError("default_probability: recovery_rate must be in [0, 1)");
  }
  if (!std::isfinite(credit_spread) || credit_spread < 0.0) {
    throw InvalidInputError("default_probability: credit_spread must be >= 0");
  }
  return credit_spread / (1.0 - recovery_rate);
}

// ============================================================================
// TreasuryCurve
// ============================================================================
TreasuryCurve::TreasuryCurve(std::vector<CurvePoint> points)
  : points_(std::move(points)) {
  if (points_.empty()) {
    throw InvalidInputError("TreasuryCurve: no points");
  }
  double prev = 0.0;
  for (const auto& p : points_) {
    if (!std::isfinite(p.time) || !std::isfinite(p.rate) || p.time <= prev) {
      throw InvalidInputError("TreasuryCurve: times must be > 0 and strictly increasing");
    }
    prev = p.time;
  }
}

double TreasuryCurve::rate_at(double t) const noexcept {
  if (t <= points_.front().time) return points_.front().rate;
  if (t >= points_.back().time)  return points_.back().rate;
  auto hi = std::upper_bound(points_.begin(), points_.end(), t,
                             [](double x, const CurvePoint& p) { return x < p.time; });
  auto lo = hi - 1;
  const double w = (t - lo->time) / (hi->time - lo->time);
  return (1.0 - w) * lo->rate + w * hi->rate;
}

// ============================================================================
// Z-spread
// ============================================================================
ZSpreadResult z_spread(const bw::market::Bond& bond,
                       double market_price,
                       const TreasuryCurve& curve,
                       const bw::config::SolverConfig& cfg)
{
  if (!std::isfinite(market_price) || market_price <= 0.0) {
    throw InvalidInputError("z_spread: market price must be > 0");
  }

  const auto& flows = bond.schedule();
  const double fd   = static_cast<double>(flows.payments_per_year());

  std::vector<double> r;
  r.reserve(flows.size());
  double r_max = -std::numeric_limits<double>::infinity();
  for (const auto& cf : flows) {
    r.push_back(curve.rate_at(cf.time));
    r_max = std::max(r_max, r.back());
  }

  // Σ CF (1 + (r_i + s)/f)^(-t f) et sa dérivée en s.
  auto f = [&](double s) -> bw::math::Evaluation {
    double v = 0.0, dv = 0.0;
    for (std::size_t i = 0; i < flows.size(); ++i) {
      const double base = 1.0 + (r[i] + s) / fd;
      const double disc = std::pow(base, -flows[i].time * fd);
      v  += flows[i].amount * disc;
      dv -= flows[i].amount * flows[i].time * disc / base;
    }
    return { v - market_price, dv };
  };

  // Toutes les bases 1 + (r_i + s)/f doivent rester > 0.
  double r_min = r.front();
  for (double x : r) r_min = std::min(r_min, x);

  bw::math::RootProblem pb;
  pb.initial_guess   = 0.0;
  pb.domain_lo       = -fd - r_min;
  pb.bracket_lo      = -0.99 * fd - r_min;
  pb.bracket_hi      = cfg.bracket_hi - r_max;
  pb.value_tolerance = cfg.price_tolerance * bond.terms().face_value;
  pb.name            = "z_spread";

  const bw::math::RootResult res = bw::math::solve_root(f, pb, cfg);
  return { res.root, res.iterations };
}

} // namespace variants
} // namespace bw
