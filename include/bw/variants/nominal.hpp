#pragma once
/**
 * @file nominal.hpp
 * @brief Variante nominale : flux inchangés, actualisation au rendement nominal.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/market/bond_terms.hpp>
#include <bw/market/yield_spec.hpp>

#include <optional>

namespace bw {
namespace variants {

struct NominalModel {
  bw::market::BondKind kind() const noexcept { return bw::market::BondKind::Nominal; }

  bw::cashflows::CashFlowSchedule
  build_cash_flows(const bw::cashflows::CashFlowSchedule& base,
                   const bw::market::YieldSpec& /*y*/) const { return base; }

  double discount_rate(const bw::market::YieldSpec& y) const noexcept { return y.rate; }

  bool carries(bw::market::ShockAxis axis) const noexcept {
    return axis == bw::market::ShockAxis::Rate;
  }

  std::optional<double> recovery() const noexcept { return std::nullopt; }
};

} // namespace variants
} // namespace bw
