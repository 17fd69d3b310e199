#include <bw/variants/inflation.hpp>
#include <bw/market/bond.hpp>
#include <bw/math/root_finder.hpp>
#include <bw/pricing/pricing_engine.hpp>
#include <bw/core/errors.hpp>

#include <cmath>
#include <sstream>
#include <vector>

namespace bw {
namespace variants {

InflationIndexation::InflationIndexation(double base_index, double current_index, int lag_months)
  : base_index_(base_index), current_index_(current_index), lag_months_(lag_months) {
  if (!std::isfinite(base_index) || !std::isfinite(current_index)) {
    throw InvalidInputError("InflationIndexation: index levels must be finite");
  }
  if (lag_months < 0) {
    throw InvalidInputError("InflationIndexation: lag_months must be >= 0");
  }
  if (base_index == 0.0 || !(current_index / base_index > 0.0)) {
    std::ostringstream os;
    os << "InflationIndexation: index ratio " << current_index << "/" << base_index << " must be > 0";
    throw DomainError(os.str());
  }
}

double InflationIndexation::ratio_at(double t, double inflation) const {
  const double growth = 1.0 + inflation;
  if (!std::isfinite(growth) || growth <= 0.0) {
    std::ostringstream os;
    os << "InflationIndexation: 1 + inflation = " << growth << " <= 0";
    throw DomainError(os.str());
  }
  return index_ratio() * std::pow(growth, t);
}

double InflationIndexation::indexed_principal(double face_value, double t, double inflation) const {
  return face_value * ratio_at(t, inflation);
}

bw::cashflows::CashFlowSchedule
InflationIndexation::build_cash_flows(const bw::cashflows::CashFlowSchedule& base,
                                      const bw::market::YieldSpec& y) const {
  return base.with_amounts([&](double t, double amount) {
    return amount * ratio_at(t, y.inflation);
  });
}

double breakeven_simple(double nominal_yield, double real_yield) noexcept {
  return nominal_yield - real_yield;
}

double fisher_breakeven(double nominal_yield, double real_yield) {
  if (!(1.0 + real_yield > 0.0)) {
    throw DomainError("fisher_breakeven: 1 + real_yield must be > 0");
  }
  return (1.0 + nominal_yield) / (1.0 + real_yield) - 1.0;
}

double fisher_nominal_yield(double real_yield, double inflation) noexcept {
  return (1.0 + real_yield) * (1.0 + inflation) - 1.0;
}

BreakevenResult breakeven_inflation(const bw::market::Bond& bond,
                                    double nominal_yield,
                                    double real_yield,
                                    const bw::config::SolverConfig& cfg)
{
  // Profil réel (non indexé) : seul le profil temporel des flux compte.
  const auto& flows = bond.schedule();
  const int    freq  = flows.payments_per_year();

  // Valeur cible : flux réels au rendement réel (lève DomainError si base <= 0).
  const double target = bw::pricing::present_value(flows, real_yield);
  // Facteurs nominaux précalculés (lève DomainError si base <= 0).
  std::vector<double> df_nom;
  df_nom.reserve(flows.size());
  for (const auto& cf : flows) {
    df_nom.push_back(bw::pricing::discount_factor(nominal_yield, freq, cf.time));
  }

  auto value = [&](double pi) -> bw::math::Evaluation {
    const double g = 1.0 + pi;
    double v = 0.0, dv = 0.0;
    for (std::size_t i = 0; i < flows.size(); ++i) {
      const double t  = flows[i].time;
      const double gt = std::pow(g, t);
      v  += flows[i].amount * gt * df_nom[i];
      dv += flows[i].amount * t * gt / g * df_nom[i];
    }
    return { v - target, dv };
  };

  bw::math::RootProblem pb;
  pb.initial_guess   = breakeven_simple(nominal_yield, real_yield);
  pb.domain_lo       = -1.0;
  pb.bracket_lo      = -0.99;
  pb.bracket_hi      = cfg.bracket_hi;
  pb.value_tolerance = cfg.price_tolerance * bond.terms().face_value;
  pb.name            = "breakeven_inflation";

  // Si la supposition initiale sort du domaine, on part de 0.
  if (!(pb.initial_guess > pb.domain_lo)) pb.initial_guess = 0.0;

  const bw::math::RootResult r = bw::math::solve_root(value, pb, cfg);
  return { r.root, r.iterations, r.used_bisection };
}

} // namespace variants
} // namespace bw
