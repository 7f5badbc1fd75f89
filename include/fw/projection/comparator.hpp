#pragma once
/**
 * @file comparator.hpp
 * @brief Comparaison de plusieurs fonds sous des paramètres identiques.
 *
 * # Politique
 * - Un fonds dont l’investissement minimum dépasse le capital initial est
 *   **exclu** avant projection (raison dans `excluded`, ce n’est pas une erreur).
 * - Un fonds dont la projection échoue est ignoré avec un avertissement
 *   (`warnings`), sans interrompre le lot.
 * - `ranked` est trié par solde final décroissant (tri stable : à égalité,
 *   l’ordre d’itération est conservé).
 * - NoResultsError si aucun fonds n’a produit de résultat.
 */

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fw/market/fund.hpp>
#include <fw/config/projection_params.hpp>
#include <fw/projection/projector.hpp>

namespace fw {
namespace projection {

/// @brief Aucun fonds n’a produit de résultat (tous exclus ou en échec).
class NoResultsError : public std::runtime_error {
public:
  explicit NoResultsError(const std::string& what) : std::runtime_error(what) {}
};

struct RankedFund {
  fw::market::Fund  fund;
  ProjectionResult  result;
};

struct FundNote {
  fw::market::Fund fund;
  std::string      reason;
};

struct ComparisonReport {
  std::vector<RankedFund> ranked;   ///< Meilleur en premier.
  std::vector<FundNote>   excluded; ///< Investissement minimum non atteint.
  std::vector<FundNote>   warnings; ///< Projection en échec.
};

/// @brief Projette chaque fonds et classe les résultats.
/// @throws NoResultsError si `ranked` serait vide.
ComparisonReport compare(const std::vector<fw::market::Fund>& funds,
                         const fw::config::ProjectionParams& params);

} // namespace projection
} // namespace fw
