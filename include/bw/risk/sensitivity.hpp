#pragma once
/**
 * @file sensitivity.hpp
 * @brief Duration modifiée, convexité, DV01 et sensibilités par axe.
 *
 * # Définitions (P = prix à la base d'actualisation courante)
 * - Duration modifiée : MD = -(1/P) dP/dx
 * - Convexité         : C  = (1/P) d²P/dx²
 * - Macaulay          : MD * (1 + y/f), y = taux d'actualisation de la variante
 * - DV01              : MD * P * 1e-4 (variation de prix pour 1 bp)
 *
 * # Méthodes
 * - Analytique (défaut) : dérivées fermées de pricing_engine.hpp. Valable pour
 *   les axes Rate et Spread, qui entrent avec une pente 1 dans le taux d'actualisation.
 * - Différences finies centrales (bump = SensitivityConfig::bump) :
 *     MD ≈ -(P+ - P-) / (2 eps P0),   C ≈ (P+ + P- - 2 P0) / (eps² P0).
 *   Toujours utilisées pour l'axe Inflation (l'inflation modifie les flux).
 *
 * # Signe sur l'axe Inflation
 * - Le prix d'un linker croît avec l'inflation supposée : la « duration »
 *   d'inflation est donc négative.
 */

#include <bw/config/engine_config.hpp>
#include <bw/market/bond.hpp>
#include <bw/market/yield_spec.hpp>

#include <optional>

namespace bw {
namespace risk {

/// @brief Duration et convexité le long d'un axe de choc.
struct AxisSensitivity {
  double duration;   ///< -(1/P) dP/dx
  double convexity;  ///< (1/P) d²P/dx²
};

struct SensitivityResult {
  double price;
  double modified_duration;
  double macaulay_duration;
  double convexity;
  double dv01;
  std::optional<double> credit_spread_duration; ///< Corporate uniquement.
  std::optional<double> inflation_duration;     ///< Linker uniquement.
};

/**
 * @brief Sensibilité de `bond` à `spec` le long de `axis`.
 * @throws bw::InvalidInputError si la variante ne porte pas l'axe ou si bump <= 0.
 * @throws bw::DomainError si une base d'actualisation (bumpée) est <= 0.
 */
AxisSensitivity axis_sensitivity(const bw::market::Bond& bond,
                                 const bw::market::YieldSpec& spec,
                                 bw::market::ShockAxis axis,
                                 const bw::config::SensitivityConfig& cfg = {});

/**
 * @brief Jeu complet de sensibilités au taux, plus spread / inflation selon la variante.
 * @throws bw::DomainError si une base d'actualisation est <= 0.
 */
SensitivityResult sensitivities(const bw::market::Bond& bond,
                                const bw::market::YieldSpec& spec,
                                const bw::config::SensitivityConfig& cfg = {});

} // namespace risk
} // namespace bw
