#pragma once
/**
 * @file bond.hpp
 * @brief Obligation : termes + variante de modèle choisie à la construction.
 *
 * # Variantes (ensemble fermé)
 * - NominalModel         : flux fixes, actualisation à YieldSpec::rate.
 * - InflationIndexation  : flux indexés, actualisation au rendement réel.
 * - CreditSpreadOverlay  : flux fixes, actualisation à rate + credit_spread.
 *
 * Chaque variante expose { build_cash_flows, discount_rate, carries, recovery } ; le
 * reste du moteur passe par Bond::cash_flows / Bond::discount_rate et ne
 * teste jamais le type. kind() ne sert qu'à l'affichage.
 *
 * # Cache
 * - L'échéancier de base (non indexé) est construit une fois à la construction.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/market/bond_terms.hpp>
#include <bw/market/yield_spec.hpp>
#include <bw/variants/credit.hpp>
#include <bw/variants/inflation.hpp>
#include <bw/variants/nominal.hpp>

#include <optional>
#include <string>
#include <variant>

namespace bw {
namespace market {

using BondModel = std::variant<bw::variants::NominalModel,
                               bw::variants::InflationIndexation,
                               bw::variants::CreditSpreadOverlay>;

class Bond {
public:
  /// @throws bw::InvalidInputError si l'échéancier ne peut pas être construit.
  explicit Bond(BondTerms terms,
                BondModel model = bw::variants::NominalModel{},
                std::string name = {});

  static Bond nominal(BondTerms terms, std::string name = {});
  static Bond inflation_linked(BondTerms terms,
                               bw::variants::InflationIndexation indexation,
                               std::string name = {});
  static Bond corporate(BondTerms terms,
                        bw::variants::CreditSpreadOverlay overlay = bw::variants::CreditSpreadOverlay{},
                        std::string name = {});

  const BondTerms& terms() const noexcept { return terms_; }
  const BondModel& model() const noexcept { return model_; }
  const std::string& name() const noexcept { return name_; }
  BondKind kind() const noexcept;

  /// @return Échéancier de base (non indexé), en cache.
  const bw::cashflows::CashFlowSchedule& schedule() const noexcept { return base_; }

  /// @return Flux effectifs pour une base d'actualisation (indexés pour un linker).
  bw::cashflows::CashFlowSchedule cash_flows(const YieldSpec& y) const;

  /// @return Taux d'actualisation annuel appliqué par la variante.
  double discount_rate(const YieldSpec& y) const noexcept;

  /// @return true si la variante porte cet axe de choc.
  bool carries(ShockAxis axis) const noexcept;

  /// @return Taux de recouvrement si la variante porte un risque de crédit.
  std::optional<double> recovery_rate() const noexcept;

private:
  BondTerms terms_;
  BondModel model_;
  bw::cashflows::CashFlowSchedule base_;
  std::string name_;
};

/// @return "Nominal", "InflationLinked" ou "Corporate".
const char* to_string(BondKind kind) noexcept;

/// @return "rate", "spread" ou "inflation".
const char* to_string(ShockAxis axis) noexcept;

} // namespace market
} // namespace bw
