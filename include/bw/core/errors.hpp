#pragma once
/**
 * @file errors.hpp
 * @brief Erreurs du moteur obligataire.
 *
 * # Familles
 * - InvalidInputError : termes d'obligation ou séquence de chocs invalides
 *   (nominal <= 0, coupon < 0, fréquence < 1, maturité <= 0, choc non fini...).
 * - DomainError       : base d'actualisation 1 + y/f <= 0, ou ratio d'indexation <= 0.
 * - ConvergenceError  : solveur (YTM, breakeven, Z-spread) sans convergence.
 *
 * # Politique
 * - Levées immédiatement, jamais rattrapées ni relancées dans le cœur :
 *   recalculer une fonction pure avec les mêmes entrées ne peut pas réussir.
 */

#include <cstddef>
#include <stdexcept>
#include <string>

namespace bw {

class InvalidInputError : public std::invalid_argument {
public:
  explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

class DomainError : public std::domain_error {
public:
  explicit DomainError(const std::string& what) : std::domain_error(what) {}
};

class ConvergenceError : public std::runtime_error {
public:
  ConvergenceError(const std::string& what, int iterations, double last_estimate)
    : std::runtime_error(what), iterations_(iterations), last_estimate_(last_estimate) {}

  /// @return Itérations effectuées (Newton + éventuelle bisection).
  int iterations() const noexcept { return iterations_; }
  /// @return Dernier itéré (diagnostic uniquement, jamais une réponse valide).
  double last_estimate() const noexcept { return last_estimate_; }

private:
  int    iterations_;
  double last_estimate_;
};

} // namespace bw
