#pragma once
/**
 * @file projection_params.hpp
 * @brief Paramètres d’une projection (une requête = un jeu de paramètres).
 *
 * # Contenu
 * - initial_capital         : capital initial (> 0).
 * - monthly_contribution    : versement mensuel (>= 0), appliqué au début de
 *                             chaque période **sauf la première**.
 * - horizon_months          : nombre de périodes mensuelles (> 0).
 * - withholding_tax_percent : retenue à la source sur les intérêts, en % [0,100].
 * - apply_management_fee    : prélève les frais de gestion chaque mois.
 * - start_date              : premier jour de la projection (injecté par
 *                             l’appelant, jamais lu depuis l’horloge).
 *
 * # Politiques
 * - interest_rounding : None (précision pleine, défaut) ou DailyToCent
 *                       (intérêt journalier arrondi au centime, half-up).
 * - keep_daily_series : conserve la série jour par jour dans le résultat.
 *
 * Immuable ; partagé en lecture seule entre tous les fonds comparés.
 */

#include <cmath>     // std::isfinite
#include <stdexcept> // std::invalid_argument

#include <fw/core/calendar.hpp>

namespace fw {
namespace config {

enum class InterestRounding { None, DailyToCent };

/// @brief Paramètres validés d’une projection.
struct ProjectionParams {
  const double initial_capital;
  const double monthly_contribution;
  const int    horizon_months;
  const double withholding_tax_percent;
  const bool   apply_management_fee;
  const fw::core::Date start_date;

  const InterestRounding interest_rounding;
  const bool keep_daily_series;

  /// @throws std::invalid_argument si une valeur est hors domaine.
  ProjectionParams(double initial_capital,
                   double monthly_contribution,
                   int    horizon_months,
                   double withholding_tax_percent,
                   bool   apply_management_fee,
                   fw::core::Date start_date,
                   InterestRounding interest_rounding = InterestRounding::None,
                   bool keep_daily_series = true)
      : initial_capital(initial_capital),
        monthly_contribution(monthly_contribution),
        horizon_months(horizon_months),
        withholding_tax_percent(withholding_tax_percent),
        apply_management_fee(apply_management_fee),
        start_date(start_date),
        interest_rounding(interest_rounding),
        keep_daily_series(keep_daily_series) {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
      throw std::invalid_argument("ProjectionParams: initial capital must be positive");
    }
    if (!std::isfinite(monthly_contribution) || monthly_contribution < 0.0) {
      throw std::invalid_argument("ProjectionParams: monthly contribution cannot be negative");
    }
    if (horizon_months <= 0) {
      throw std::invalid_argument("ProjectionParams: investment period must be positive");
    }
    if (!(withholding_tax_percent >= 0.0 && withholding_tax_percent <= 100.0)) {
      throw std::invalid_argument("ProjectionParams: withholding tax must be between 0 and 100");
    }
    if (!fw::core::is_valid_date(start_date.year, start_date.month, start_date.day)) {
      throw std::invalid_argument("ProjectionParams: invalid start date");
    }
  }
};

} // namespace config
} // namespace fw
