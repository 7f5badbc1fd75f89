#pragma once
/**
 * @file money.hpp
 * @brief Arrondis monétaires.
 *
 * Les montants sont des doubles en unité de devise (ex : 1234.56).
 * Le plus petit incrément est le centime (0.01).
 *
 * # Politique
 * - round_half_up_cents : arrondi au centime, demi vers le haut
 *   (2.345 → 2.35). Les montants négatifs sont arrondis en valeur absolue
 *   (demi en s’éloignant de zéro).
 * - Tolérance : quelques ulp relatifs au montant en centimes, de quoi
 *   reconnaître 2.675 (267.4999… en binaire) comme une demi-valeur sans
 *   remonter 0.004999999999995.
 *
 * # Affichage
 * - format_amount   : "1,234,567.89" (séparateur de milliers, 2 décimales).
 * - format_currency : "KES 1,234,567.89". Une seule devise (shilling kényan).
 */

#include <algorithm> // std::max
#include <cmath>     // std::floor, std::abs
#include <limits>
#include <string>

namespace fw {
namespace core {

/// @brief Arrondi au centime, demi vers le haut.
/// @param amount Montant en unité de devise.
/// @return Montant arrondi à 0.01 près.
inline double round_half_up_cents(double amount) noexcept {
  const double cents = std::abs(amount) * 100.0;
  const double whole = std::floor(cents);
  const double tol   = 4.0 * std::numeric_limits<double>::epsilon() * std::max(1.0, cents);
  const double r     = ((cents - whole) + tol >= 0.5 ? whole + 1.0 : whole) / 100.0;
  return amount < 0.0 ? -r : r;
}

/// @return Montant arrondi au centime, groupé par milliers ("-1,234.50").
std::string format_amount(double amount);

/// @return "KES " + format_amount(amount).
std::string format_currency(double amount);

} // namespace core
} // namespace fw
