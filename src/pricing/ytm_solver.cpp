#include <bw/pricing/ytm_solver.hpp>
#include <bw/pricing/pricing_engine.hpp>
#include <bw/math/root_finder.hpp>
#include <bw/core/errors.hpp>

#include <cmath>
#include <string>

namespace bw {
namespace pricing {

namespace {

// Résout la composante `axis` (Rate ou Spread) : les deux entrent linéairement
// (pente 1) dans le taux d'actualisation et ne modifient pas les flux.
YtmResult solve_discount_component(const bw::market::Bond& bond,
                                   double market_price,
                                   const bw::market::YieldSpec& hold,
                                   bw::market::ShockAxis axis,
                                   double initial_guess,
                                   const bw::config::SolverConfig& cfg,
                                   const char* name)
{
  if (!std::isfinite(market_price) || market_price <= 0.0) {
    throw InvalidInputError(std::string(name) + ": market price must be > 0");
  }
  if (!std::isfinite(initial_guess)) {
    throw InvalidInputError(std::string(name) + ": initial guess must be finite");
  }

  const auto flows = bond.cash_flows(hold);
  const double fd  = static_cast<double>(flows.payments_per_year());

  // taux d'actualisation = offset + composante
  auto at = [&](double x) {
    bw::market::YieldSpec y = hold;
    if (axis == bw::market::ShockAxis::Spread) y.credit_spread = x; else y.rate = x;
    return y;
  };
  const double offset = bond.discount_rate(at(0.0));

  bw::math::RootProblem pb;
  pb.initial_guess   = initial_guess;
  pb.domain_lo       = -fd - offset;
  pb.bracket_lo      = -0.99 * fd - offset;
  pb.bracket_hi      = cfg.bracket_hi - offset;
  pb.value_tolerance = cfg.price_tolerance * bond.terms().face_value;
  pb.name            = name;

  auto f = [&](double x) -> bw::math::Evaluation {
    const YieldDerivatives d = yield_derivatives(flows, offset + x);
    return { d.pv - market_price, d.dpv };
  };

  const bw::math::RootResult r = bw::math::solve_root(f, pb, cfg);
  return { r.root, r.iterations, r.used_bisection };
}

} // namespace

YtmResult solve_yield(const bw::market::Bond& bond,
                      double market_price,
                      const bw::market::YieldSpec& hold,
                      double initial_guess,
                      const bw::config::SolverConfig& cfg)
{
  return solve_discount_component(bond, market_price, hold, bw::market::ShockAxis::Rate,
                                  initial_guess, cfg, "solve_yield");
}

YtmResult solve_credit_spread(const bw::market::Bond& bond,
                              double market_price,
                              double base_rate,
                              double initial_guess,
                              const bw::config::SolverConfig& cfg)
{
  if (!bond.carries(bw::market::ShockAxis::Spread)) {
    throw InvalidInputError("solve_credit_spread: bond does not carry a credit spread");
  }
  return solve_discount_component(bond, market_price,
                                  bw::market::YieldSpec::corporate(base_rate, 0.0),
                                  bw::market::ShockAxis::Spread,
                                  initial_guess, cfg, "solve_credit_spread");
}

double yield_shift_to_price(const bw::market::Bond& bond,
                            const bw::market::YieldSpec& y,
                            double target_price,
                            const bw::config::SolverConfig& cfg)
{
  const YtmResult r = solve_yield(bond, target_price, y, y.rate, cfg);
  return r.yield - y.rate;
}

} // namespace pricing
} // namespace bw
