#include "fw/io/fund_csv.hpp"
#include <fstream>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <stdexcept>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// récupère index de colonne via map (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace

namespace fw::io {

double parse_decimal_field(std::string s) {
  s.erase(std::remove(s.begin(), s.end(), ','), s.end());
  s = trim(s);
  if (!s.empty() && s.back()=='%') s.pop_back();
  s = trim(s);
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str() || *end!='\0') return std::numeric_limits<double>::quiet_NaN();
  return v;
}

std::string format_decimal_field(double v) {
  if (!std::isfinite(v)) return std::string();
  // 15 chiffres suffisent pour les saisies usuelles (16.915) ; 17 garantit l’aller-retour
  char buf[32];
  for (int prec : {15, 17}) {
    std::snprintf(buf, sizeof(buf), "%.*g", prec, v);
    if (std::strtod(buf, nullptr) == v) break;
  }
  return std::string(buf);
}

std::vector<fw::market::Fund>
read_fund_csv(const std::string& path,
              std::size_t* num_ignored,
              std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<fw::market::Fund> out;

  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Impossible d'ouvrir le fichier: " + path);
    return out;
  }

  std::string line;
  std::unordered_map<std::string,int> idx;
  bool header_seen = false;
  int iName = -1, iRate = -1, iFee = -1, iMin = -1;
  std::size_t line_no = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      for (int i=0;i<(int)cells.size();++i) idx[lower(trim(cells[i]))] = i;
      iName = col(idx, {"name","fund","fund_name"});
      iRate = col(idx, {"rate","annual_rate","interest_rate"});
      iFee  = col(idx, {"mgt_fee","fee","management_fee","annual_fee_rate"});
      iMin  = col(idx, {"minimum_investment","min_investment","minimum"});
      if (iName<0 || iRate<0) {
        if (warnings) warnings->push_back("En-tête invalide (colonnes name/rate requises): " + path);
        return out;
      }
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    const std::string name = get(iName);
    const double rate = parse_decimal_field(get(iRate));
    // frais et minimum absents ⇒ 0
    const double fee  = iFee >= 0 ? parse_decimal_field(get(iFee)) : 0.0;
    const double mini = iMin >= 0 ? parse_decimal_field(get(iMin)) : 0.0;

    try {
      out.emplace_back(name, rate, fee, mini);
    } catch (const std::invalid_argument& e) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: " + e.what());
    }
  }

  if (!header_seen && warnings) warnings->push_back("Fichier vide: " + path);
  return out;
}

std::vector<fw::market::Fund> default_funds() {
  std::vector<fw::market::Fund> funds;
  funds.emplace_back("My first example fund",  16.91, 0.85, 1000.0);
  funds.emplace_back("My second example fund", 16.86, 0.90, 100.0);
  return funds;
}

std::vector<fw::market::Fund>
load_fund_catalog(const std::string& path, std::vector<std::string>* warnings)
{
  std::size_t ignored = 0;
  auto funds = read_fund_csv(path, &ignored, warnings);
  if (funds.empty()) {
    if (warnings) warnings->push_back("Aucun fonds valide dans " + path + ", catalogue par défaut utilisé");
    return default_funds();
  }
  return funds;
}

} // namespace fw::io
