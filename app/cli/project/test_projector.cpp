#include "fw/projection/projector.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using fw::core::Date;
using fw::config::ProjectionParams;
using fw::projection::ProjectionResult;
using fw::projection::CalculationFailure;

static ProjectionResult ok(const fw::projection::ProjectionOutcome& o) {
  assert(fw::projection::succeeded(o));
  return std::get<ProjectionResult>(o);
}

static bool same(const ProjectionResult& a, const ProjectionResult& b) {
  if (a.fund_name != b.fund_name || a.final_balance != b.final_balance
      || a.total_interest != b.total_interest || a.total_fees != b.total_fees
      || a.total_contributed != b.total_contributed
      || a.net_return_percent != b.net_return_percent) return false;
  if (a.monthly_balances.size() != b.monthly_balances.size()) return false;
  for (std::size_t i = 0; i < a.monthly_balances.size(); ++i) {
    if (a.monthly_balances[i].label   != b.monthly_balances[i].label
     || a.monthly_balances[i].date    != b.monthly_balances[i].date
     || a.monthly_balances[i].balance != b.monthly_balances[i].balance) return false;
  }
  if (a.daily.size() != b.daily.size()) return false;
  for (std::size_t i = 0; i < a.daily.size(); ++i) {
    if (a.daily[i].balance != b.daily[i].balance || a.daily[i].date != b.daily[i].date) return false;
  }
  return true;
}

int main() {
  const fw::market::Fund fund("My first example fund", 16.91, 0.85, 1000.0);

  // 1) Scénario de référence : 1 mois, 15 % de retenue, frais inclus
  {
    const ProjectionParams p(1000.0, 0.0, 1, 15.0, true, Date{2024, 1, 1});
    const auto& res = ok(fw::projection::project(fund, p));

    assert(res.fund_name == fund.name);
    assert(res.final_balance > 1000.0);
    assert(res.final_balance < 1000.0 * (1.0 + 0.1691 / 12.0));
    assert(std::abs(res.final_balance - 1011.570014860816) < 1e-6);
    assert(std::abs(res.total_fees - 0.71) < 1e-12);

    // horizon 1 sans versement : total versé == capital initial, exactement
    assert(res.total_contributed == 1000.0);
    assert(std::abs(res.net_return_percent - (res.final_balance - 1000.0) / 1000.0 * 100.0) < 1e-12);

    assert(res.monthly_balances.size() == 2);
    assert(res.monthly_balances[0].label == "January 2024");
    assert(res.monthly_balances[0].balance == 1000.0);
    assert(res.monthly_balances[1].label == "February 2024");
    assert(res.monthly_balances[1].balance == res.final_balance);
    assert(res.periods.size() == 1);
    assert(res.daily.size() == 31);
  }

  // 2) Idempotence : deux appels identiques ⇒ résultats identiques au bit près
  {
    const ProjectionParams p(25000.0, 1500.0, 18, 15.0, true, Date{2024, 1, 31});
    const auto a = fw::projection::project(fund, p);
    const auto b = fw::projection::project(fund, p);
    assert(same(ok(a), ok(b)));
  }

  // 3) Versements, totaux, série journalière
  {
    const ProjectionParams p(1000.0, 100.0, 12, 15.0, true, Date{2024, 1, 1});
    const auto& res = ok(fw::projection::project(fund, p));

    assert(res.total_contributed == 1000.0 + 11 * 100.0);
    assert(res.periods.size() == 12);
    assert(res.monthly_balances.size() == 13);
    assert(res.daily.size() == 366);   // 2024 bissextile
    assert(res.periods[0].contribution == 0.0);
    assert(res.periods[1].contribution == 100.0);

    double interest = 0.0, fees = 0.0;
    for (std::size_t k = 0; k < res.periods.size(); ++k) {
      const auto& per = res.periods[k];
      interest += per.interest;
      fees     += per.fee;
      assert(per.opening_balance == res.monthly_balances[k].balance);
      assert(per.closing_balance == res.monthly_balances[k + 1].balance);
    }
    assert(interest == res.total_interest);
    assert(fees == res.total_fees);
    assert(std::abs(res.final_balance
                    - (res.total_contributed + res.total_interest - res.total_fees)) < 1e-6);
    assert(std::abs(res.net_return_percent
                    - (res.final_balance - 2100.0) / 2100.0 * 100.0) < 1e-12);
  }

  // 4) Départ un 31 janvier : les dates avancent d’un mois à la fois, jour écrêté
  {
    const ProjectionParams p23(1000.0, 0.0, 3, 15.0, true, Date{2023, 1, 31});
    const auto& r23 = ok(fw::projection::project(fund, p23));
    assert((r23.monthly_balances[1].date == Date{2023, 2, 28}));
    assert((r23.monthly_balances[2].date == Date{2023, 3, 28}));
    assert((r23.periods[1].first_date == Date{2023, 2, 28}));
    assert(r23.periods[1].days == 28);
    assert(r23.periods[2].days == 31);

    const ProjectionParams p24(1000.0, 0.0, 3, 15.0, true, Date{2024, 1, 31});
    const auto& r24 = ok(fw::projection::project(fund, p24));
    assert((r24.monthly_balances[1].date == Date{2024, 2, 29}));
    assert((r24.monthly_balances[2].date == Date{2024, 3, 29}));
    assert(r24.periods[1].days == 29);
  }

  // 5) Série journalière désactivée
  {
    const ProjectionParams p(1000.0, 0.0, 6, 15.0, true, Date{2024, 1, 1},
                             fw::config::InterestRounding::None, /*keep_daily_series=*/false);
    const auto& res = ok(fw::projection::project(fund, p));
    assert(res.daily.empty());
    assert(res.periods.size() == 6);
  }

  // 6) Taux aberrant ⇒ débordement ⇒ CalculationFailure attribuée au fonds
  {
    const fw::market::Fund corrupt("Overflow fund", 1e308, 0.5, 0.0);
    const ProjectionParams p(1000.0, 0.0, 2, 0.0, true, Date{2024, 1, 1});
    const auto out = fw::projection::project(corrupt, p);
    assert(!fw::projection::succeeded(out));
    const auto& f = std::get<CalculationFailure>(out);
    assert(f.fund_name == "Overflow fund");
    assert(!f.reason.empty());
    assert(f.message().find("Overflow fund") != std::string::npos);
  }

  // 6b) Horizon au-delà de l’an 9999 : l’exception du calendrier devient un échec du fonds
  {
    const ProjectionParams p(1000.0, 0.0, 2, 15.0, true, Date{9999, 12, 1});
    const auto out = fw::projection::project(fund, p);
    assert(!fw::projection::succeeded(out));
    const auto& f = std::get<CalculationFailure>(out);
    assert(f.fund_name == fund.name);
    assert(f.reason.find("9999") != std::string::npos);

    // la dernière période représentable passe encore
    const ProjectionParams last(1000.0, 0.0, 1, 15.0, true, Date{9999, 11, 1});
    assert(fw::projection::succeeded(fw::projection::project(fund, last)));
  }

  // 7) Construction invalide : échoue à la construction, jamais en cours de calcul
  {
    auto rejects = [](auto make) {
      try { make(); } catch (const std::invalid_argument&) { return true; }
      return false;
    };
    assert(rejects([]{ fw::market::Fund("", 10.0, 0.5, 0.0); }));
    assert(rejects([]{ fw::market::Fund("X", 0.0, 0.5, 0.0); }));
    assert(rejects([]{ fw::market::Fund("X", 10.0, -0.1, 0.0); }));
    assert(rejects([]{ fw::market::Fund("X", 10.0, 0.5, -1.0); }));
    assert(rejects([]{ ProjectionParams(0.0, 0.0, 1, 15.0, true, Date{2024, 1, 1}); }));
    assert(rejects([]{ ProjectionParams(100.0, -1.0, 1, 15.0, true, Date{2024, 1, 1}); }));
    assert(rejects([]{ ProjectionParams(100.0, 0.0, 0, 15.0, true, Date{2024, 1, 1}); }));
    assert(rejects([]{ ProjectionParams(100.0, 0.0, 1, 100.5, true, Date{2024, 1, 1}); }));
    assert(rejects([]{ ProjectionParams(100.0, 0.0, 1, 15.0, true, Date{2024, 2, 30}); }));
    assert(!rejects([]{ ProjectionParams(100.0, 0.0, 1, 100.0, true, Date{2024, 2, 29}); }));
    assert(rejects([]{ ProjectionParams(100.0, 0.0, 1, 15.0, true, Date{10000, 1, 1}); }));
  }

  std::cout << "Projector OK.\n";
  return 0;
}
