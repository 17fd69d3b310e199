#pragma once
/**
 * @file yield_spec.hpp
 * @brief Base d'actualisation d'une obligation.
 *
 * # Lecture des champs selon la variante
 * - Nominale        : rate = rendement nominal annuel.
 * - Corporate       : rate = taux de base (Treasury), credit_spread = spread de crédit.
 * - Indexée (linker): rate = rendement réel, inflation = inflation annuelle supposée.
 *
 * # Unités
 * - Tout en décimal (0.0085 = 85 bp). La conversion bp → décimal (÷ 10000)
 *   se fait à la frontière (CSV, CLI, GUI), cf. variants::bps_to_fraction.
 *
 * # Domaine
 * - La base 1 + taux_actualisation / f doit rester > 0 ; c'est le moteur de
 *   pricing qui le vérifie (DomainError), pas cette structure.
 */

namespace bw {
namespace market {

/// @brief Axe de choc / de sensibilité.
enum class ShockAxis {
  Rate,      ///< rate (nominal, base Treasury ou réel selon la variante)
  Spread,    ///< credit_spread (corporate uniquement)
  Inflation  ///< inflation supposée (linker uniquement)
};

/// @brief Décomposition du taux d'actualisation.
struct YieldSpec {
  double rate          = 0.0; ///< Nominal, base Treasury ou réel (décimal).
  double credit_spread = 0.0; ///< Spread de crédit (décimal).
  double inflation     = 0.0; ///< Inflation annuelle supposée (décimal).

  static YieldSpec nominal(double y) noexcept { return YieldSpec{ y, 0.0, 0.0 }; }
  static YieldSpec corporate(double base_rate, double spread) noexcept {
    return YieldSpec{ base_rate, spread, 0.0 };
  }
  static YieldSpec inflation_linked(double real_yield, double assumed_inflation) noexcept {
    return YieldSpec{ real_yield, 0.0, assumed_inflation };
  }

  /// @return Copie décalée de `delta` sur l'axe donné.
  YieldSpec shifted(ShockAxis axis, double delta) const noexcept {
    YieldSpec out = *this;
    switch (axis) {
      case ShockAxis::Rate:      out.rate          += delta; break;
      case ShockAxis::Spread:    out.credit_spread += delta; break;
      case ShockAxis::Inflation: out.inflation     += delta; break;
    }
    return out;
  }

  /// @return Valeur courante sur l'axe donné.
  double component(ShockAxis axis) const noexcept {
    switch (axis) {
      case ShockAxis::Rate:      return rate;
      case ShockAxis::Spread:    return credit_spread;
      case ShockAxis::Inflation: return inflation;
    }
    return rate;
  }
};

} // namespace market
} // namespace bw
