#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateur de Welford et volatilité historique glissante.
 *
 * - Algorithme de Welford : stable numériquement, une passe.
 * - Variance : échantillon (diviseur n-1) ; NaN si n < 2.
 * - Volatilité historique : écart-type (n-1) des rendements simples
 *   r_i = P_i / P_{i-1} - 1 sur une fenêtre glissante, annualisé par
 *   sqrt(periods_per_year) (252 pour des prix quotidiens).
 */

#include <cstddef> // std::size_t
#include <vector>

namespace bw {
namespace core {

struct RunningStats {
public:
  RunningStats() noexcept;

  /// @brief Ajoute un échantillon.
  void add(double x) noexcept;

  std::size_t count() const noexcept;
  double mean() const noexcept;

  /// @return Variance d'échantillon (diviseur n-1), NaN si n < 2.
  [[nodiscard]] double variance() const noexcept;

  /// @return sqrt(variance()), NaN si n < 2.
  [[nodiscard]] double stddev() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0}; // somme des carrés des écarts à la moyenne (Welford)
};

/**
 * @brief Volatilité historique annualisée, une valeur par prix.
 * @return out[i] = stddev(r_{i-window+1..i}) * sqrt(periods_per_year) ;
 *         NaN tant que moins de `window` rendements sont disponibles (i < window).
 * @throws bw::InvalidInputError si window < 2, periods_per_year <= 0 ou un prix <= 0.
 */
[[nodiscard]] std::vector<double> rolling_volatility(const std::vector<double>& prices,
                                                     std::size_t window = 30,
                                                     double periods_per_year = 252.0);

} // namespace core
} // namespace bw
