#pragma once
/**
 * @file schedule.hpp
 * @brief Échéancier de flux (temps, montant) d'une obligation.
 *
 * # Construction
 * - t_k = k / f pour k = 1..n, n = T * f ; montant = c * F / f ; le dernier
 *   flux ajoute le nominal F.
 * - Si T * f n'est pas entier (tolérance 1e-6) :
 *     * FractionalPeriod::Reject     ⇒ InvalidInputError ;
 *     * FractionalPeriod::ShortFirst ⇒ n = ceil(T * f), t_k = T - (n - k) / f,
 *       première période courte, coupons pleins (prix "dirty").
 *
 * # Invariants
 * - temps > 0 et strictement croissants, vérifiés à la construction.
 * - Vue dérivée, jamais modifiée après création (les variantes en dérivent
 *   une copie, cf. with_amounts).
 */

#include <bw/market/bond_terms.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace bw {
namespace cashflows {

/// @brief Un flux : temps en années (> 0) et montant.
struct CashFlow {
  double time;   ///< Années depuis la date de valorisation.
  double amount; ///< Montant (coupon, ou coupon + principal au dernier flux).
};

/// @brief Liste ordonnée de flux, avec sa fréquence de capitalisation.
class CashFlowSchedule {
public:
  /// @throws bw::InvalidInputError si vide, si un temps <= 0 ou non strictement croissant,
  ///         ou si payments_per_year < 1.
  CashFlowSchedule(std::vector<CashFlow> flows, int payments_per_year);

  const std::vector<CashFlow>& flows() const noexcept { return flows_; }
  int payments_per_year() const noexcept { return freq_; }

  std::size_t size() const noexcept { return flows_.size(); }
  const CashFlow& operator[](std::size_t i) const { return flows_[i]; }
  std::vector<CashFlow>::const_iterator begin() const noexcept { return flows_.begin(); }
  std::vector<CashFlow>::const_iterator end() const noexcept { return flows_.end(); }

  /// @return Temps du dernier flux.
  double maturity() const noexcept { return flows_.back().time; }

  /// @return Somme non actualisée des montants.
  [[nodiscard]] double total_amount() const noexcept;

  /// @brief Copie avec montants transformés : amount' = fn(time, amount).
  [[nodiscard]] CashFlowSchedule
  with_amounts(const std::function<double(double, double)>& fn) const;

private:
  std::vector<CashFlow> flows_;
  int freq_;
};

/// @brief Construit l'échéancier nominal (non indexé) d'une obligation.
/// @throws bw::InvalidInputError si la période finale est fractionnaire et Reject.
CashFlowSchedule build_schedule(const bw::market::BondTerms& terms);

} // namespace cashflows
} // namespace bw
