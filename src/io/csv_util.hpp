#pragma once
/**
 * @file csv_util.hpp
 * @brief Helpers texte des lecteurs CSV de bw::io (interne à src/io).
 *
 * # Conventions communes aux fichiers data/
 * - Séparateur ',' ; champs éventuellement entre "...", "" pour un guillemet littéral.
 * - En-tête obligatoire, noms de colonnes insensibles à la casse, synonymes acceptés.
 * - Lignes vides et lignes "#..." ignorées ; fins de ligne Windows tolérées.
 * - Cellule vide ou non numérique -> NaN (la validation se fait plus haut).
 */
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace bw::io::detail {

// --- helpers texte ---

/// @return s sans blancs de tête ni de queue.
inline std::string trim(const std::string& s) {
  static const char* const blanks = " \t\r\n\f\v";
  const auto first = s.find_first_not_of(blanks);
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(blanks);
  return s.substr(first, last - first + 1);
}

/// @return s en minuscules (ASCII).
inline std::string lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

/// @brief Découpe une ligne en champs (trimés) ; virgules protégées entre guillemets.
inline std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields(1);
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c != '"')                                    fields.back() += c;
      else if (i + 1 < line.size() && line[i+1] == '"') { fields.back() += '"'; ++i; }
      else                                             quoted = false;
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.emplace_back();
    } else {
      fields.back() += c;
    }
  }
  for (auto& f : fields) f = trim(f);
  return fields;
}

/// @return Valeur lue, NaN si vide ou s'il reste des caractères après le nombre.
inline double parse_double(const std::string& s) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  if (s.empty()) return nan;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  return (end == s.c_str() || *end != '\0') ? nan : v;
}

/// @return Index de la première colonne trouvée parmi les synonymes, -1 sinon.
/// @note idx est indexé par nom d'en-tête en minuscules.
inline int col(const std::unordered_map<std::string,int>& idx,
               std::initializer_list<const char*> synonyms) {
  for (const char* name : synonyms) {
    const auto it = idx.find(lower(name));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

/// @brief Normalise une ligne lue ; false si elle est vide ou commentée ("#").
inline bool content_line(std::string& line) {
  line = trim(line);
  return !line.empty() && line[0] != '#';
}

} // namespace bw::io::detail
