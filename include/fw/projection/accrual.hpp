#pragma once
/**
 * @file accrual.hpp
 * @brief Intérêt journalier et frais de gestion mensuels.
 *
 * # Définitions
 * - Taux journalier : r = taux_annuel / 365 / 100 (base 365 fixe, même les
 *   années bissextiles).
 * - Intérêt d’un jour après retenue : B * r * (1 - t/100).
 * - Frais mensuels : moyenne(ouverture, clôture avant frais) * frais_annuels / 100 / 12,
 *   arrondis au centime (half-up).
 *
 * Aucun arrondi sur l’intérêt journalier : la précision pleine est reportée
 * au jour suivant (voir InterestRounding pour la variante arrondie).
 *
 * # Préconditions (non vérifiées ici)
 * - r > 0, 0 <= t <= 100. Un taux nul ou négatif est une violation de contrat.
 */

#include <fw/core/money.hpp>

namespace fw {
namespace projection {

/// @return Taux journalier décimal à partir d’un taux annuel en %.
inline double daily_rate(double annual_rate_percent) noexcept {
  return annual_rate_percent / 365.0 / 100.0;
}

/// @brief Intérêt d’un jour, net de retenue à la source.
/// @param balance      Solde courant B.
/// @param rate         Taux journalier décimal r.
/// @param tax_percent  Retenue à la source t en %.
/// @return B * r * (1 - t/100).
inline double day_accrual(double balance, double rate, double tax_percent) noexcept {
  return balance * rate * (1.0 - tax_percent / 100.0);
}

/// @brief Frais de gestion d’une période mensuelle (arrondis au centime).
/// @param opening_balance  Solde d’ouverture de la période.
/// @param closing_balance  Solde de clôture **avant** frais.
/// @param annual_fee_rate  Frais annuels en %.
inline double management_fee(double opening_balance,
                             double closing_balance,
                             double annual_fee_rate) noexcept {
  const double average = (opening_balance + closing_balance) / 2.0;
  return fw::core::round_half_up_cents(average * annual_fee_rate / 100.0 / 12.0);
}

} // namespace projection
} // namespace fw
