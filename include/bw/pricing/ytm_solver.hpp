#pragma once
/**
 * @file ytm_solver.hpp
 * @brief Inversion du pricing : rendement (ou spread) qui reproduit un prix de marché.
 *
 * # Méthode
 * - Newton–Raphson sur f(y) = P(y) - prix, f'(y) analytique (cf. pricing_engine.hpp).
 * - Arrêt : |f| < price_tolerance * nominal, ou |Δy| < yield_tolerance ; plafond newton_max.
 * - Échec Newton (|f'| < plancher, base 1 + y/f <= 0, plafond) :
 *     * SolverFallback::Bisection (défaut) : bracket [-0.99 f, bracket_hi] sur le
 *       taux d'actualisation, changement de signe vérifié avant usage ;
 *     * SolverFallback::None : ConvergenceError immédiate.
 *
 * # Composante résolue
 * - solve_yield          : YieldSpec::rate (nominal, base Treasury, ou réel),
 *                          spread / inflation tenus à leur valeur dans `hold`.
 * - solve_credit_spread  : YieldSpec::credit_spread, taux de base fixé (corporate).
 * - yield_shift_to_price : Δrate qui amène le prix à une cible (ex. le pair).
 */

#include <bw/config/engine_config.hpp>
#include <bw/market/bond.hpp>
#include <bw/market/yield_spec.hpp>

namespace bw {
namespace pricing {

struct YtmResult {
  double yield;          ///< Composante résolue (décimal).
  int    iterations;     ///< Newton + éventuelle bisection.
  bool   used_bisection; ///< true si le repli a servi.
};

/**
 * @brief Rendement tel que price(bond, hold avec rate = y) == market_price.
 * @throws bw::InvalidInputError si market_price <= 0 ou non fini.
 * @throws bw::ConvergenceError en cas d'échec (aucune réponse de repli non vérifiée).
 */
YtmResult solve_yield(const bw::market::Bond& bond,
                      double market_price,
                      const bw::market::YieldSpec& hold = {},
                      double initial_guess = 0.05,
                      const bw::config::SolverConfig& cfg = {});

/**
 * @brief Spread implicite au-dessus de base_rate (obligation corporate).
 * @throws bw::InvalidInputError si l'obligation ne porte pas de spread, ou prix invalide.
 * @throws bw::ConvergenceError en cas d'échec.
 */
YtmResult solve_credit_spread(const bw::market::Bond& bond,
                              double market_price,
                              double base_rate,
                              double initial_guess = 0.01,
                              const bw::config::SolverConfig& cfg = {});

/// @return Δrate tel que price(bond, y.shifted(Rate, Δ)) == target_price.
double yield_shift_to_price(const bw::market::Bond& bond,
                            const bw::market::YieldSpec& y,
                            double target_price,
                            const bw::config::SolverConfig& cfg = {});

} // namespace pricing
} // namespace bw
