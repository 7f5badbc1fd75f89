#pragma once
/**
 * @file projector.hpp
 * @brief Projection d’un dépôt dans un fonds sur tout l’horizon.
 *
 * # Principe
 * - Solde initial = capital initial, date initiale = start_date.
 * - Pour chaque période k = 0..horizon-1 : settle_period, cumul des intérêts
 *   et des frais, avance de la date d’un mois calendaire (jour écrêté).
 * - Total versé = capital initial + un versement par période après la première.
 * - Rendement net (%) = (solde final - total versé) / total versé * 100.
 *
 * # Série mensuelle
 * monthly_balances contient horizon+1 points : l’ouverture (libellé du mois de
 * départ, capital initial) puis chaque borne de période (libellé de la date
 * avancée, solde de clôture).
 *
 * # Échecs
 * Une erreur arithmétique (solde non fini, invariant de période violé) ou une
 * exception pendant la boucle est renvoyée comme CalculationFailure attribuée
 * au fonds. project() ne lève pas pour ces cas.
 */

#include <string>
#include <variant>
#include <vector>

#include <fw/core/calendar.hpp>
#include <fw/market/fund.hpp>
#include <fw/config/projection_params.hpp>
#include <fw/projection/settlement.hpp>

namespace fw {
namespace projection {

/// @brief Un point (libellé de mois, solde) de la progression mensuelle.
struct BalancePoint {
  std::string    label;
  fw::core::Date date;
  double         balance;
};

/// @brief Résumé d’une période (PeriodResult sans la trace journalière).
struct PeriodSummary {
  std::string    label;
  fw::core::Date first_date;
  int            days;
  double         opening_balance;
  double         contribution;
  double         interest;
  double         fee;
  double         closing_balance;
};

/// @brief Résultat complet d’une projection.
struct ProjectionResult {
  std::string fund_name;
  double final_balance{0.0};
  double total_interest{0.0};
  double total_fees{0.0};
  double total_contributed{0.0};
  double net_return_percent{0.0};
  std::vector<BalancePoint>  monthly_balances; ///< horizon + 1 points.
  std::vector<PeriodSummary> periods;          ///< horizon entrées.
  std::vector<DayEntry>      daily;            ///< Vide si keep_daily_series == false.
};

/// @brief Échec de calcul attribué à un fonds.
struct CalculationFailure {
  std::string fund_name;
  std::string reason;

  /// @return "Error calculating returns for <fund>: <reason>"
  std::string message() const;
};

/// @brief Résultat étiqueté : succès ou échec par fonds.
using ProjectionOutcome = std::variant<ProjectionResult, CalculationFailure>;

/// @brief Projette un fonds sur l’horizon des paramètres.
ProjectionOutcome project(const fw::market::Fund& fund,
                          const fw::config::ProjectionParams& params);

/// @return true si l’issue est un succès.
inline bool succeeded(const ProjectionOutcome& o) noexcept {
  return std::holds_alternative<ProjectionResult>(o);
}

} // namespace projection
} // namespace fw
