#pragma once
#include <bw/market/bond.hpp>
#include <bw/market/yield_spec.hpp>
#include <bw/config/engine_config.hpp>

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace bw::io {

// Une ligne de définition d'obligation. Unités "bureau" : pourcentages et bp,
// convertis en décimal par make_bond / make_yield_spec uniquement.
struct BondRow {
  std::string name;
  bw::market::BondKind kind = bw::market::BondKind::Nominal;

  double coupon_pct = std::numeric_limits<double>::quiet_NaN();
  double face       = 100.0;
  int    freq       = 2;
  double maturity   = std::numeric_limits<double>::quiet_NaN();
  bw::market::FractionalPeriod stub = bw::market::FractionalPeriod::Reject;

  // prix de marché et/ou rendement (au moins un des deux)
  double price      = std::numeric_limits<double>::quiet_NaN();
  double yield_pct  = std::numeric_limits<double>::quiet_NaN();  // nominal, base Treasury ou réel

  // corporate
  double spread_bps = 0.0;
  double recovery   = 0.4;

  // linker
  double base_index    = 1.0;
  double current_index = 1.0;
  int    lag_months    = 3;
  double inflation_pct = 0.0;
};

// Lit un CSV de définitions d'obligations (en-tête obligatoire, synonymes acceptés,
// lignes "#..." ignorées). Chaque ligne est validée en construisant l'obligation ;
// les lignes invalides sont écartées et décrites dans `warnings`.
// Retourne uniquement les lignes **valides**.
std::vector<BondRow>
read_bond_csv(const std::string& path,
              std::size_t* num_ignored = nullptr,
              std::vector<std::string>* warnings = nullptr);

// Construit l'obligation décrite par la ligne.
// Lève bw::InvalidInputError / bw::DomainError si les termes sont invalides.
bw::market::Bond make_bond(const BondRow& row);

// Base d'actualisation de la ligne (pourcentages / bp -> décimal).
// `rate` vaut NaN si la ligne ne donne qu'un prix.
bw::market::YieldSpec make_yield_spec(const BondRow& row);

// Base d'actualisation cohérente avec la cotation de la ligne :
// - rendement seul            -> make_yield_spec(row) ;
// - prix seul                 -> rate résolu (spread / inflation de la ligne tenus) ;
// - corporate prix + rendement -> rendement = taux de base, spread implicite résolu.
// Lève bw::ConvergenceError si la résolution échoue.
bw::market::YieldSpec resolve_yield_spec(const bw::market::Bond& bond,
                                         const BondRow& row,
                                         const bw::config::SolverConfig& cfg = {});

// Première ligne dont le nom vaut `name` (insensible à la casse), nullptr sinon.
const BondRow* find_bond_row(const std::vector<BondRow>& rows, const std::string& name);

// Parse "nominal" / "inflation" / "linker" / "corporate" (insensible à la casse).
// Lève bw::InvalidInputError si inconnu.
bw::market::BondKind parse_bond_kind(const std::string& s);

} // namespace bw::io
