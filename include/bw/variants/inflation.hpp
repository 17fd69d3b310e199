#pragma once
/**
 * @file inflation.hpp
 * @brief Obligations indexées sur l'inflation (linkers) et inflation point mort.
 *
 * # Indexation
 * - index_ratio   = current_index / base_index (niveaux observés avec un décalage,
 *   lag_months, 3 mois par défaut ; le décalage est une donnée de l'appelant).
 * - ratio(t)      = index_ratio * (1 + pi)^t, pi = inflation plate supposée (YieldSpec::inflation).
 * - flux indexé   = flux réel * ratio(t) ; principal indexé = F * ratio(T).
 * - Actualisation au **rendement réel** (YieldSpec::rate).
 *
 * # Inflation point mort (breakeven)
 * - Simple  : nominal - réel.
 * - Fisher  : (1 + nominal) / (1 + réel) - 1.
 * - Root-find : pi tel que les flux indexés à pi, actualisés au rendement nominal,
 *   valent les flux réels actualisés au rendement réel. Même structure que le YTM.
 *
 * # Domaine
 * - index_ratio <= 0 ou 1 + pi <= 0 ⇒ DomainError.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/config/engine_config.hpp>
#include <bw/market/bond_terms.hpp>
#include <bw/market/yield_spec.hpp>

#include <optional>

namespace bw { namespace market { class Bond; } }

namespace bw {
namespace variants {

/// @brief Variante indexée : niveaux d'indice observés + projection plate.
class InflationIndexation {
public:
  /// @throws bw::InvalidInputError si un niveau n'est pas fini ou lag_months < 0.
  /// @throws bw::DomainError si current_index / base_index <= 0.
  explicit InflationIndexation(double base_index = 1.0,
                               double current_index = 1.0,
                               int lag_months = 3);

  double base_index() const noexcept { return base_index_; }
  double current_index() const noexcept { return current_index_; }
  int lag_months() const noexcept { return lag_months_; }

  /// @return current_index / base_index.
  double index_ratio() const noexcept { return current_index_ / base_index_; }

  /// @return index_ratio * (1 + inflation)^t.
  /// @throws bw::DomainError si 1 + inflation <= 0.
  double ratio_at(double t, double inflation) const;

  /// @return F * ratio_at(t, inflation), >= 0.
  double indexed_principal(double face_value, double t, double inflation) const;

  bw::market::BondKind kind() const noexcept { return bw::market::BondKind::InflationLinked; }

  bw::cashflows::CashFlowSchedule
  build_cash_flows(const bw::cashflows::CashFlowSchedule& base,
                   const bw::market::YieldSpec& y) const;

  double discount_rate(const bw::market::YieldSpec& y) const noexcept { return y.rate; }

  bool carries(bw::market::ShockAxis axis) const noexcept {
    return axis == bw::market::ShockAxis::Rate || axis == bw::market::ShockAxis::Inflation;
  }

  std::optional<double> recovery() const noexcept { return std::nullopt; }

private:
  double base_index_;
  double current_index_;
  int    lag_months_;
};

/// @brief Résultat du root-find d'inflation point mort.
struct BreakevenResult {
  double inflation;      ///< pi point mort (décimal).
  int    iterations;
  bool   used_bisection;
};

/// @return nominal_yield - real_yield.
double breakeven_simple(double nominal_yield, double real_yield) noexcept;

/// @return (1 + nominal) / (1 + real) - 1.
/// @throws bw::DomainError si 1 + real_yield <= 0.
double fisher_breakeven(double nominal_yield, double real_yield);

/// @return (1 + real) * (1 + inflation) - 1.
double fisher_nominal_yield(double real_yield, double inflation) noexcept;

/**
 * @brief Inflation point mort par root-find sur le profil de flux de `bond`.
 * @details Résout V(pi) = Σ CF_t (1+pi)^t DF_nominal(t) - Σ CF_t DF_real(t) = 0,
 *          avec CF_t les flux réels (non indexés) de l'obligation.
 * @throws bw::DomainError si une base d'actualisation est <= 0.
 * @throws bw::ConvergenceError si le solveur échoue.
 */
BreakevenResult breakeven_inflation(const bw::market::Bond& bond,
                                    double nominal_yield,
                                    double real_yield,
                                    const bw::config::SolverConfig& cfg = {});

} // namespace variants
} // namespace bw
