#pragma once
/**
 * @file calendar.hpp
 * @brief Arithmétique de dates civiles (calendrier grégorien proleptique).
 *
 * # Contenu
 * - Date : triplet (année, mois, jour), sans fuseau ni heure.
 * - Longueur des mois (28–31) avec années bissextiles.
 * - Ajout de jours exact (traverse fins de mois et d’années).
 * - Ajout de mois avec **écrêtage du jour** : si le jour source n’existe pas
 *   dans le mois cible, on prend le dernier jour valide.
 *     31/01 + 1 mois → 28/02 (ou 29/02 si bissextile)
 *
 * # Attention
 * add_months n’est pas associatif : (31/01 + 1) + 1 = 28/03 alors que
 * 31/01 + 2 = 31/03. Le moteur de projection avance **un mois à la fois**.
 */

#include <string>

namespace fw {
namespace core {

constexpr int MIN_YEAR = 1;
constexpr int MAX_YEAR = 9999;

/// @brief Date civile (année, mois 1..12, jour 1..31).
struct Date {
  int year;
  int month;
  int day;
};

bool operator==(const Date& a, const Date& b) noexcept;
bool operator!=(const Date& a, const Date& b) noexcept;
bool operator<(const Date& a, const Date& b) noexcept;

/// @return true si l’année est bissextile (règle grégorienne).
bool is_leap_year(int year) noexcept;

/// @return Nombre de jours du mois (28..31).
/// @throws std::invalid_argument si month hors [1,12].
int days_in_month(int year, int month);

/// @return Nombre de jours du mois de la date.
int days_in_month(const Date& d);

/// @return true si (year, month, day) désigne un jour existant dans [MIN_YEAR, MAX_YEAR].
bool is_valid_date(int year, int month, int day) noexcept;

/// @brief Construit une date validée.
/// @throws std::invalid_argument si le jour n’existe pas.
Date make_date(int year, int month, int day);

/// @brief Ajoute n jours (n peut être négatif).
/// @throws std::out_of_range si le résultat sort de [MIN_YEAR, MAX_YEAR].
Date add_days(const Date& d, long n);

/// @brief Ajoute n mois, jour écrêté au dernier jour valide du mois cible.
/// @throws std::out_of_range si le résultat sort de [MIN_YEAR, MAX_YEAR].
Date add_months(const Date& d, int n);

/// @return Libellé "Month YYYY" en anglais (ex : "January 2024").
std::string month_label(const Date& d);

/// @brief Parse "YYYY-MM-DD".
/// @throws std::invalid_argument si le format ou la date est invalide.
Date parse_iso_date(const std::string& s);

/// @return "YYYY-MM-DD".
std::string to_iso_string(const Date& d);

} // namespace core
} // namespace fw
