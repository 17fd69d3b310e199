#pragma once
/**
 * @file engine_config.hpp
 * @brief Constantes numériques du moteur (solveur, bumps, scénarios).
 *
 * # Objet
 * Regroupe les choix d'implémentation qui n'ont pas de valeur canonique :
 * tolérances et plafonds du Newton, politique de repli, taille du bump
 * des différences finies, parallélisme des scénarios.
 *
 * # Conventions
 * - Taux en décimal (0.05 = 5 %), chocs dans la même unité que le taux choqué.
 * - Les défauts ci-dessous sont ceux utilisés par les CLI et l'interface.
 *
 * # Choix du bump
 * - bump = 1e-4 (1 bp). Entre 1e-5 et 1e-3 la duration et la convexité
 *   par différences finies restent à < 1e-3 (relatif) de l'analytique
 *   sur une obligation 26 ans ; en dessous de 1e-6 l'arrondi domine la convexité.
 */

#include <cstddef> // std::size_t

namespace bw {
namespace config {

/// @brief Que faire quand Newton échoue (dérivée trop faible, itéré hors domaine, plafond).
enum class SolverFallback {
  None,      ///< ConvergenceError immédiate.
  Bisection  ///< Bisection sur un bracket vérifié (changement de signe), sinon ConvergenceError.
};

/// @brief Paramètres du Newton–Raphson sauvegardé (YTM, breakeven, Z-spread).
struct SolverConfig {
  int    newton_max       = 100;    ///< Plafond d'itérations Newton.
  int    bisect_max       = 200;    ///< Plafond d'itérations de bisection.
  double price_tolerance  = 1e-12;  ///< |f(y)| < price_tolerance * nominal.
  double yield_tolerance  = 1e-12;  ///< |y_{n+1} - y_n| < yield_tolerance.
  double derivative_floor = 1e-14;  ///< |f'(y)| en dessous ⇒ échec du Newton.
  double bracket_hi       = 10.0;   ///< Borne haute du bracket de bisection (1000 %).
  SolverFallback fallback = SolverFallback::Bisection;
};

/// @brief Méthode de calcul des sensibilités au taux.
enum class SensitivityMethod {
  Analytic,         ///< Dérivées fermées de la somme actualisée.
  FiniteDifference  ///< Bump & reprice central (±bump).
};

/// @brief Paramètres des sensibilités.
struct SensitivityConfig {
  SensitivityMethod method = SensitivityMethod::Analytic;
  double bump = 1e-4;   ///< Bump absolu (décimal) des différences finies.
};

/// @brief Paramètres du moteur de scénarios.
struct ScenarioConfig {
  std::size_t workers = 1;  ///< 1 = séquentiel ; >1 = répartition sur std::thread.
  SensitivityConfig sensitivity{};
};

/// @brief Configuration complète (utilisée par les CLI et la GUI).
struct EngineConfig {
  SolverConfig      solver{};
  SensitivityConfig sensitivity{};
  ScenarioConfig    scenario{};
};

} // namespace config
} // namespace bw
