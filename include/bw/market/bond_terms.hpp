#pragma once
/**
 * @file bond_terms.hpp
 * @brief Termes contractuels d'une obligation à coupon fixe.
 *
 * # Contenu
 * - coupon_rate       : coupon annuel (décimal, ex : 0.0125 pour 1.25 %).
 * - face_value        : nominal (> 0).
 * - payments_per_year : fréquence des coupons (entier >= 1, 2 = semestriel).
 * - years_to_maturity : maturité résiduelle en années (> 0).
 * - fractional_period : traitement d'une maturité qui ne tombe pas sur une date de coupon.
 *
 * # Domaine valide
 * - face_value > 0, coupon_rate >= 0, payments_per_year >= 1, years_to_maturity > 0.
 *
 * # Remarque
 * - Les obligations "nommées" (Treasury 2050, Alphabet 2060, Gilts...) ne vivent
 *   pas ici : elles sont lues depuis data/bonds/*.csv par la couche appelante.
 */

#include <bw/core/errors.hpp>

#include <cmath>

namespace bw {
namespace market {

/// @brief Famille d'obligation (pour l'affichage ; le calcul passe par la variante).
enum class BondKind {
  Nominal,         ///< Coupon fixe, actualisé au rendement nominal.
  InflationLinked, ///< Flux indexés, actualisés au rendement réel.
  Corporate        ///< Actualisé au taux de base + spread de crédit.
};

/// @brief Politique quand years_to_maturity * payments_per_year n'est pas entier.
enum class FractionalPeriod {
  Reject,     ///< InvalidInputError (défaut).
  ShortFirst  ///< Calendrier ancré à maturité, première période courte, coupons pleins.
};

/// @brief Termes d'une obligation (immuables après construction).
struct BondTerms {
public:
  const double coupon_rate;             ///< Coupon annuel (décimal, >= 0).
  const double face_value;              ///< Nominal (> 0).
  const int    payments_per_year;       ///< Fréquence (>= 1).
  const double years_to_maturity;       ///< Maturité en années (> 0).
  const FractionalPeriod fractional_period;

  /// @throws bw::InvalidInputError si un terme sort de son domaine.
  BondTerms(double coupon_rate,
            double face_value,
            int    payments_per_year,
            double years_to_maturity,
            FractionalPeriod fractional = FractionalPeriod::Reject)
      : coupon_rate(coupon_rate),
        face_value(face_value),
        payments_per_year(payments_per_year),
        years_to_maturity(years_to_maturity),
        fractional_period(fractional) {
    if (!std::isfinite(face_value) || face_value <= 0.0) {
      throw InvalidInputError("BondTerms: face_value must be > 0");
    }
    if (!std::isfinite(coupon_rate) || coupon_rate < 0.0) {
      throw InvalidInputError("BondTerms: coupon_rate must be >= 0");
    }
    if (payments_per_year < 1) {
      throw InvalidInputError("BondTerms: payments_per_year must be >= 1");
    }
    if (!std::isfinite(years_to_maturity) || years_to_maturity <= 0.0) {
      throw InvalidInputError("BondTerms: years_to_maturity must be > 0");
    }
  }

  /// @return Montant d'un coupon périodique : c * F / f.
  double coupon_amount() const noexcept {
    return coupon_rate * face_value / static_cast<double>(payments_per_year);
  }
};

} // namespace market
} // namespace bw
