#pragma once
/**
 * @file settlement.hpp
 * @brief Règlement d’une période mensuelle (versement, intérêts jour par jour, frais).
 *
 * # Ordre des opérations
 * 1. Nombre de jours = longueur réelle du mois calendaire de `first_date` (28..31).
 * 2. Si period_index > 0 : ajout du versement mensuel au solde d’ouverture.
 * 3. Pour chaque jour : intérêt = day_accrual(solde), solde += intérêt.
 * 4. Si frais activés : frais = management_fee(ouverture, clôture avant frais),
 *    solde -= frais.
 *
 * L’ouverture utilisée pour la base des frais est le solde reçu en entrée,
 * **avant** le versement.
 *
 * Fonction pure : aucun état caché, aucune E/S.
 */

#include <cstddef>
#include <string>
#include <vector>

#include <fw/core/calendar.hpp>
#include <fw/market/fund.hpp>
#include <fw/config/projection_params.hpp>

namespace fw {
namespace projection {

/// @brief Un jour de la trace : solde après capitalisation.
struct DayEntry {
  fw::core::Date date;
  double balance;   ///< Solde après ajout de l’intérêt du jour.
  double interest;  ///< Intérêt du jour, net de retenue.
};

/// @brief Résultat d’une période mensuelle.
struct PeriodResult {
  std::string    label;           ///< "January 2024"
  fw::core::Date first_date;      ///< Premier jour de la période.
  int            days;            ///< Nombre de jours accrus.
  double         opening_balance; ///< Solde reçu (avant versement).
  double         contribution;    ///< Versement appliqué (0 pour la 1re période).
  double         closing_balance; ///< Solde final, frais déduits.
  double         interest;        ///< Somme des intérêts journaliers nets.
  double         fee;             ///< Frais prélevés (0 si désactivés).
  std::vector<DayEntry> daily;    ///< Trace jour par jour, dans l’ordre.
};

/**
 * @brief Règle une période mensuelle.
 * @param fund            Fonds projeté.
 * @param params          Paramètres de la projection.
 * @param first_date      Premier jour de la période.
 * @param period_index    Index zéro-based de la période.
 * @param opening_balance Solde d’ouverture.
 * @return PeriodResult (trace journalière toujours remplie).
 */
PeriodResult settle_period(const fw::market::Fund& fund,
                           const fw::config::ProjectionParams& params,
                           const fw::core::Date& first_date,
                           std::size_t period_index,
                           double opening_balance);

/// @return true si clôture, intérêts et frais sont finis.
bool is_finite(const PeriodResult& p) noexcept;

/// @brief Invariant de clôture : clôture == ouverture + versement + intérêts - frais,
/// à rel_tol près (relatif à max(1, |clôture|)).
bool is_consistent(const PeriodResult& p, double rel_tol = 1e-9) noexcept;

} // namespace projection
} // namespace fw
