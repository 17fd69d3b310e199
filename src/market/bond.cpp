#include <bw/market/bond.hpp>

#include <utility>

namespace bw {
namespace market {

Bond::Bond(BondTerms terms, BondModel model, std::string name)
  : terms_(terms),
    model_(std::move(model)),
    base_(bw::cashflows::build_schedule(terms_)),
    name_(std::move(name)) {}

Bond Bond::nominal(BondTerms terms, std::string name) {
  return Bond(terms, bw::variants::NominalModel{}, std::move(name));
}

Bond Bond::inflation_linked(BondTerms terms,
                            bw::variants::InflationIndexation indexation,
                            std::string name) {
  return Bond(terms, indexation, std::move(name));
}

Bond Bond::corporate(BondTerms terms,
                     bw::variants::CreditSpreadOverlay overlay,
                     std::string name) {
  return Bond(terms, overlay, std::move(name));
}

BondKind Bond::kind() const noexcept {
  return std::visit([](const auto& m) { return m.kind(); }, model_);
}

bw::cashflows::CashFlowSchedule Bond::cash_flows(const YieldSpec& y) const {
  return std::visit([&](const auto& m) { return m.build_cash_flows(base_, y); }, model_);
}

double Bond::discount_rate(const YieldSpec& y) const noexcept {
  return std::visit([&](const auto& m) { return m.discount_rate(y); }, model_);
}

bool Bond::carries(ShockAxis axis) const noexcept {
  return std::visit([&](const auto& m) { return m.carries(axis); }, model_);
}

std::optional<double> Bond::recovery_rate() const noexcept {
  return std::visit([](const auto& m) { return m.recovery(); }, model_);
}

const char* to_string(BondKind kind) noexcept {
  switch (kind) {
    case BondKind::Nominal:         return "Nominal";
    case BondKind::InflationLinked: return "InflationLinked";
    case BondKind::Corporate:       return "Corporate";
  }
  return "Unknown";
}

const char* to_string(ShockAxis axis) noexcept {
  switch (axis) {
    case ShockAxis::Rate:      return "rate";
    case ShockAxis::Spread:    return "spread";
    case ShockAxis::Inflation: return "inflation";
  }
  return "unknown";
}

} // namespace market
} // namespace bw
