#include <bw/risk/sensitivity.hpp>
#include <bw/pricing/pricing_engine.hpp>
#include <bw/core/errors.hpp>

#include <cmath>
#include <string>

namespace bw {
namespace risk {

namespace {

using bw::market::ShockAxis;

AxisSensitivity analytic(const bw::market::Bond& bond, const bw::market::YieldSpec& spec) {
  const auto d = bw::pricing::yield_derivatives(bond.cash_flows(spec), bond.discount_rate(spec));
  return { -d.dpv / d.pv, d.d2pv / d.pv };
}

AxisSensitivity finite_difference(const bw::market::Bond& bond,
                                  const bw::market::YieldSpec& spec,
                                  ShockAxis axis,
                                  double eps)
{
  const double p0 = bw::pricing::price(bond, spec);
  const double pu = bw::pricing::price(bond, spec.shifted(axis,  eps));
  const double pd = bw::pricing::price(bond, spec.shifted(axis, -eps));
  return { -(pu - pd) / (2.0 * eps * p0),
           (pu + pd - 2.0 * p0) / (eps * eps * p0) };
}

} // namespace

AxisSensitivity axis_sensitivity(const bw::market::Bond& bond,
                                 const bw::market::YieldSpec& spec,
                                 ShockAxis axis,
                                 const bw::config::SensitivityConfig& cfg)
{
  if (!bond.carries(axis)) {
    throw InvalidInputError(std::string("axis_sensitivity: ") + bw::market::to_string(bond.kind())
                            + " bond has no " + bw::market::to_string(axis) + " axis");
  }

  const bool fd = cfg.method == bw::config::SensitivityMethod::FiniteDifference
               || axis == ShockAxis::Inflation;
  if (!fd) return analytic(bond, spec);

  if (!std::isfinite(cfg.bump) || cfg.bump <= 0.0) {
    throw InvalidInputError("axis_sensitivity: bump must be > 0");
  }
  return finite_difference(bond, spec, axis, cfg.bump);
}

SensitivityResult sensitivities(const bw::market::Bond& bond,
                                const bw::market::YieldSpec& spec,
                                const bw::config::SensitivityConfig& cfg)
{
  const double p0 = bw::pricing::price(bond, spec);
  const AxisSensitivity rate = axis_sensitivity(bond, spec, ShockAxis::Rate, cfg);

  const double f = static_cast<double>(bond.terms().payments_per_year);

  SensitivityResult out;
  out.price             = p0;
  out.modified_duration = rate.duration;
  out.macaulay_duration = rate.duration * (1.0 + bond.discount_rate(spec) / f);
  out.convexity         = rate.convexity;
  out.dv01              = rate.duration * p0 * 1e-4;

  if (bond.carries(ShockAxis::Spread)) {
    // spread bumpé, taux de base fixé
    bw::config::SensitivityConfig spread_cfg = cfg;
    spread_cfg.method = bw::config::SensitivityMethod::FiniteDifference;
    out.credit_spread_duration = axis_sensitivity(bond, spec, ShockAxis::Spread, spread_cfg).duration;
  }
  if (bond.carries(ShockAxis::Inflation)) {
    out.inflation_duration = axis_sensitivity(bond, spec, ShockAxis::Inflation, cfg).duration;
  }
  return out;
}

} // namespace risk
} // namespace bw
