#pragma once
#include <bw/variants/credit.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace bw::io {

// Lit une courbe Treasury "time,rate" (rate en %, ex : 4.79). Les points
// invalides (temps <= 0, taux non fini) sont écartés ; les points restants sont triés par temps.
// Lève bw::InvalidInputError si aucun point valide ou temps dupliqués (via TreasuryCurve).
bw::variants::TreasuryCurve
read_curve_csv(const std::string& path,
               std::size_t* num_ignored = nullptr,
               std::vector<std::string>* warnings = nullptr);

// Lit une série de prix de clôture (colonne "close", "price" ou première colonne).
// Les lignes sans prix > 0 sont écartées.
std::vector<double>
read_price_series(const std::string& path,
                  std::size_t* num_ignored = nullptr,
                  std::vector<std::string>* warnings = nullptr);

} // namespace bw::io
