#pragma once
/**
 * @file root_finder.hpp
 * @brief Newton–Raphson sauvegardé, avec repli explicite par bisection.
 *
 * # Principe
 * - Newton : x_{n+1} = x_n - f(x_n) / f'(x_n), f' fournie par l'appelant.
 * - Convergence : |f(x)| < value_tolerance ou |x_{n+1} - x_n| < cfg.yield_tolerance.
 * - Échec du Newton : |f'| < cfg.derivative_floor, itéré <= domain_lo (hors domaine),
 *   itéré non fini, ou plafond cfg.newton_max atteint.
 * - Repli (cfg.fallback == Bisection) : bisection sur [bracket_lo, bracket_hi]
 *   **uniquement** si f change de signe sur le bracket ; sinon ConvergenceError.
 *
 * # Utilisateurs
 * - YTM (pricing/ytm_solver), breakeven d'inflation (variants/inflation),
 *   Z-spread (variants/credit).
 */

#include <bw/config/engine_config.hpp>

#include <functional>
#include <string>

namespace bw {
namespace math {

/// @brief f(x) et f'(x) évaluées au même point.
struct Evaluation {
  double value;
  double derivative;
};

/// @brief Description d'un problème 1-D.
struct RootProblem {
  double initial_guess;
  double domain_lo;        ///< Borne stricte : x <= domain_lo est hors domaine.
  double bracket_lo;       ///< Bracket de repli (bracket_lo > domain_lo).
  double bracket_hi;
  double value_tolerance;  ///< Tolérance absolue sur |f(x)|.
  std::string name;        ///< Pour les messages d'erreur ("solve_yield", ...).
};

/// @brief Solution trouvée.
struct RootResult {
  double root;
  int    iterations;      ///< Newton + éventuelle bisection.
  bool   used_bisection;  ///< true si le repli a été nécessaire.
};

/// @throws bw::ConvergenceError si ni Newton ni le repli configuré ne convergent.
RootResult solve_root(const std::function<Evaluation(double)>& f,
                      const RootProblem& problem,
                      const bw::config::SolverConfig& cfg);

} // namespace math
} // namespace bw
