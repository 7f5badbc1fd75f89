#pragma once
/**
 * @file fund.hpp
 * @brief Description d’un fonds monétaire (money market fund).
 *
 * # Contenu
 * - Nom du fonds (non vide).
 * - Taux annuel nominal en **pourcentage** (ex : 16.91 pour 16,91 %).
 * - Frais de gestion annuels en pourcentage (ex : 0.85).
 * - Investissement minimum (montant en devise).
 *
 * # Domaine valide
 * - name non vide
 * - annual_rate > 0 (fini)
 * - annual_fee_rate >= 0 (fini)
 * - minimum_investment >= 0 (fini)
 *
 * Aucune valeur n’est écrêtée : une valeur hors domaine fait échouer la
 * construction.
 */

#include <cmath>     // std::isfinite
#include <stdexcept> // std::invalid_argument
#include <string>
#include <utility>   // std::move

namespace fw {
namespace market {

/// @brief Fonds monétaire, immuable après construction.
struct Fund {
public:
  const std::string name;         ///< Nom affiché (non vide).
  const double annual_rate;       ///< Taux annuel en % (> 0).
  const double annual_fee_rate;   ///< Frais de gestion annuels en % (>= 0).
  const double minimum_investment;///< Investissement minimum (>= 0).

  /// @brief Construit un fonds valide.
  /// @throws std::invalid_argument si une valeur est hors domaine.
  Fund(std::string name, double annual_rate, double annual_fee_rate, double minimum_investment)
      : name(std::move(name)),
        annual_rate(annual_rate),
        annual_fee_rate(annual_fee_rate),
        minimum_investment(minimum_investment) {
    if (this->name.empty()) {
      throw std::invalid_argument("Fund: name must be non-empty");
    }
    if (!std::isfinite(annual_rate) || annual_rate <= 0.0) {
      throw std::invalid_argument("Fund: invalid rate for fund " + this->name);
    }
    if (!std::isfinite(annual_fee_rate) || annual_fee_rate < 0.0) {
      throw std::invalid_argument("Fund: invalid management fee for fund " + this->name);
    }
    if (!std::isfinite(minimum_investment) || minimum_investment < 0.0) {
      throw std::invalid_argument("Fund: invalid minimum investment for fund " + this->name);
    }
  }
};

} // namespace market
} // namespace fw
