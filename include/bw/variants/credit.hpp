#pragma once
/**
 * @file credit.hpp
 * @brief Overlay de spread de crédit pour les obligations corporate.
 *
 * # Principe
 * - Taux d'actualisation = taux de base (Treasury) + spread ; le reste du
 *   pricing est inchangé. Permet des chocs indépendants ou joints taux/spread.
 *
 * # Outils associés
 * - bps_to_fraction / fraction_to_bps : conversion aux frontières.
 * - default_probability : PD annuelle ≈ spread / (1 - recouvrement).
 * - z_spread : spread constant au-dessus d'une courbe Treasury linéaire par
 *   morceaux (extrapolation plate) qui reprice l'obligation.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/config/engine_config.hpp>
#include <bw/market/bond_terms.hpp>
#include <bw/market/yield_spec.hpp>

#include <optional>
#include <vector>

namespace bw { namespace market { class Bond; } }

namespace bw {
namespace variants {

/// @brief Variante corporate : base + spread.
class CreditSpreadOverlay {
public:
  /// @throws bw::InvalidInputError si recovery_rate hors de [0, 1).
  explicit CreditSpreadOverlay(double recovery_rate = 0.4);

  double recovery_rate() const noexcept { return recovery_rate_; }

  bw::market::BondKind kind() const noexcept { return bw::market::BondKind::Corporate; }

  bw::cashflows::CashFlowSchedule
  build_cash_flows(const bw::cashflows::CashFlowSchedule& base,
                   const bw::market::YieldSpec& /*y*/) const { return base; }

  double discount_rate(const bw::market::YieldSpec& y) const noexcept {
    return y.rate + y.credit_spread;
  }

  bool carries(bw::market::ShockAxis axis) const noexcept {
    return axis == bw::market::ShockAxis::Rate || axis == bw::market::ShockAxis::Spread;
  }

  std::optional<double> recovery() const noexcept { return recovery_rate_; }

private:
  double recovery_rate_;
};

inline double bps_to_fraction(double bps) noexcept { return bps / 10000.0; }
inline double fraction_to_bps(double x) noexcept { return x * 10000.0; }

/// @return spread / (1 - recovery_rate).
/// @throws bw::InvalidInputError si recovery_rate hors de [0, 1) ou spread < 0.
double default_probability(double credit_spread, double recovery_rate);

/// @brief Point de courbe Treasury (taux composé à la fréquence de l'obligation).
struct CurvePoint {
  double time;  ///< Années (> 0)
  double rate;  ///< Décimal
};

/// @brief Courbe Treasury linéaire par morceaux, extrapolation plate.
class TreasuryCurve {
public:
  /// @throws bw::InvalidInputError si vide ou temps non strictement croissants.
  explicit TreasuryCurve(std::vector<CurvePoint> points);

  double rate_at(double t) const noexcept;
  const std::vector<CurvePoint>& points() const noexcept { return points_; }

private:
  std::vector<CurvePoint> points_;
};

/// @brief Z-spread trouvé et itérations.
struct ZSpreadResult {
  double spread;     ///< Décimal.
  int    iterations;
};

/**
 * @brief Spread constant s tel que Σ CF_t (1 + (r(t)+s)/f)^(-t f) = market_price.
 * @details Flux de `bond` construits avec un YieldSpec nul (flux non indexés).
 * @throws bw::InvalidInputError si market_price <= 0.
 * @throws bw::ConvergenceError si le solveur échoue.
 */
ZSpreadResult z_spread(const bw::market::Bond& bond,
                       double market_price,
                       const TreasuryCurve& curve,
                       const bw::config::SolverConfig& cfg = {});

} // namespace variants
} // namespace bw
