#pragma once
/**
 * @file scenario_engine.hpp
 * @brief Tables de chocs : approximations linéaire / convexité contre le reprice exact.
 *
 * # Par choc Δ (axe choisi)
 *   linéaire  = P0 (1 - D Δ)
 *   convexité = linéaire + ½ C Δ² P0
 *   exact     = price(bond, spec décalé de Δ sur l'axe)
 *   variation = (exact - P0) / P0
 *
 * # Garanties
 * - Lignes dans l'ordre des chocs fournis (y compris avec plusieurs workers).
 * - Liste vide ⇒ table sans ligne.
 * - Choc non fini, ou axe non porté par la variante ⇒ InvalidInputError.
 * - Choc qui rend la base 1 + y/f <= 0 ⇒ DomainError (jamais de prix infini).
 *
 * # Grille taux × spread (corporate)
 * - Une ligne par couple (dr, ds), ordre « taux d'abord » ; prix exact au choc
 *   joint, comparé à la somme des deux variations exactes unidimensionnelles.
 * - Seul le choc joint doit rester dans le domaine : si l'un des deux chocs
 *   pris isolément rend la base <= 0, additive_percent_change vaut NaN.
 */

#include <bw/config/engine_config.hpp>
#include <bw/market/bond.hpp>
#include <bw/market/yield_spec.hpp>
#include <bw/risk/sensitivity.hpp>

#include <vector>

namespace bw {
namespace scenario {

struct ScenarioRow {
  double shock;
  double linear_approx_price;
  double convexity_approx_price;
  double exact_price;
  double percent_change;   ///< (exact - P0) / P0, en fraction.
};

struct ScenarioTable {
  double base_price;
  bw::risk::AxisSensitivity sensitivity;  ///< Le long de `axis`, à la base.
  bw::market::ShockAxis axis;
  std::vector<ScenarioRow> rows;
};

struct GridRow {
  double rate_shock;
  double spread_shock;
  double exact_price;
  double percent_change;           ///< Choc joint.
  double additive_percent_change;  ///< Somme des deux chocs pris séparément (NaN hors domaine).
};

/**
 * @brief Évalue chaque choc de `shocks` le long de `axis`.
 * @throws bw::InvalidInputError, bw::DomainError (cf. ci-dessus).
 */
ScenarioTable run_scenario(const bw::market::Bond& bond,
                           const bw::market::YieldSpec& spec,
                           const std::vector<double>& shocks,
                           bw::market::ShockAxis axis = bw::market::ShockAxis::Rate,
                           const bw::config::ScenarioConfig& cfg = {});

/**
 * @brief Grille de chocs joints taux × spread (obligations corporate).
 * @throws bw::InvalidInputError si l'obligation ne porte pas de spread ou choc non fini.
 * @throws bw::DomainError si un choc joint rend la base d'actualisation <= 0.
 */
std::vector<GridRow> run_rate_spread_grid(const bw::market::Bond& bond,
                                          const bw::market::YieldSpec& spec,
                                          const std::vector<double>& rate_shocks,
                                          const std::vector<double>& spread_shocks,
                                          const bw::config::ScenarioConfig& cfg = {});

} // namespace scenario
} // namespace bw
