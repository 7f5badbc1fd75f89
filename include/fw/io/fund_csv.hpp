#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include <fw/market/fund.hpp>

namespace fw::io {

// Lit un catalogue de fonds CSV. En-tête obligatoire, colonnes typiques :
//   name,rate,mgt_fee,minimum_investment
// (synonymes acceptés, ordre libre, lignes '#' ignorées, champs "..." gérés).
// Les lignes invalides (nom vide, taux <= 0, frais < 0, …) sont ignorées.
// num_ignored/warnings sont optionnels pour diagnostic.
std::vector<fw::market::Fund>
read_fund_csv(const std::string& path,
              std::size_t* num_ignored = nullptr,
              std::vector<std::string>* warnings = nullptr);

// Champ numérique tolérant : "1,000" (séparateur de milliers) et "12.5%" acceptés.
// "" ou texte non numérique -> NaN.
double parse_decimal_field(std::string text);

// Écriture sans perte : parse_decimal_field(format_decimal_field(v)) == v.
// Forme courte quand elle suffit ("16.915", "1000"). Non fini -> "".
std::string format_decimal_field(double v);

// Catalogue intégré (deux fonds d’exemple).
std::vector<fw::market::Fund> default_funds();

// CSV si le fichier existe et contient au moins un fonds valide,
// sinon catalogue intégré (avec un message dans warnings).
std::vector<fw::market::Fund>
load_fund_catalog(const std::string& path,
                  std::vector<std::string>* warnings = nullptr);

} // namespace fw::io
