#pragma once
/**
 * @file pricing_engine.hpp
 * @brief Actualisation d'un échéancier : primitive commune à tout le moteur.
 *
 * # Formule (capitalisation périodique, f = payments_per_year)
 *   DF(t) = (1 + y/f)^(-t f)
 *   P(y)  = Σ CF_t DF(t)
 *   P'(y) = -Σ t CF_t DF(t) / (1 + y/f)
 *   P''(y)=  Σ t (t + 1/f) CF_t DF(t) / (1 + y/f)^2
 *
 * # Domaine
 * - 1 + y/f <= 0 ⇒ bw::DomainError (jamais de prix infini/NaN silencieux).
 *
 * # Pureté
 * - Fonctions pures : mêmes entrées ⇒ même sortie, aucun effet de bord.
 */

#include <bw/cashflows/schedule.hpp>
#include <bw/market/bond.hpp>
#include <bw/market/yield_spec.hpp>

namespace bw {
namespace pricing {

/// @brief Prix et ses deux premières dérivées par rapport au taux d'actualisation.
struct YieldDerivatives {
  double pv;    ///< P(y)
  double dpv;   ///< dP/dy
  double d2pv;  ///< d²P/dy²
};

/// @return (1 + rate/f)^(-t f).
/// @throws bw::DomainError si 1 + rate/f <= 0.
double discount_factor(double rate, int payments_per_year, double t);

/// @return Σ CF_t DF(t) au taux annuel `rate`.
/// @throws bw::DomainError si 1 + rate/f <= 0.
double present_value(const bw::cashflows::CashFlowSchedule& schedule, double rate);

/// @return P, P', P'' analytiques au taux `rate`.
/// @throws bw::DomainError si 1 + rate/f <= 0.
YieldDerivatives yield_derivatives(const bw::cashflows::CashFlowSchedule& schedule, double rate);

/// @brief Prix d'une obligation pour une base d'actualisation (flux de la variante,
///        taux de la variante).
/// @throws bw::DomainError si la base d'actualisation est <= 0 ou le ratio d'indexation <= 0.
double price(const bw::market::Bond& bond, const bw::market::YieldSpec& y);

} // namespace pricing
} // namespace bw
