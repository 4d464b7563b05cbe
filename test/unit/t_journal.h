#ifndef _T_JOURNAL_H
#define _T_JOURNAL_H

#include "session.h"

using namespace tally;

// USD is the reference currency; EUR rates start out unknown.
struct journal_fixture {
  session_t  session;
  journal_t& journal;

  currency_id_t     usd;
  currency_id_t     eur;
  wallet_id_t       personal;
  account_id_t      cash;
  account_id_t      bank;
  account_id_t      euros;
  tag_id_t          salary;
  tag_id_t          food;
  tag_id_t          groceries;
  tag_id_t          travel;
  counterparty_id_t cafe;

  journal_fixture() : journal(session.get_journal()) {
    _log_level = LOG_WARN;

    usd = journal.add_currency("USD", "$").id;
    eur = journal.add_currency("EUR", "\xe2\x82\xac").id;

    personal = journal.add_wallet("Personal").id;
    cash     = journal.add_account(personal, usd, "Cash", fixed_t(100L)).id;
    bank     = journal.add_account(personal, usd, "Bank", fixed_t(1000L)).id;
    euros    = journal.add_account(personal, eur, "Euros", fixed_t(200L)).id;

    tag_pool_t& tags(journal.tags());
    salary = tags.create("Salary", tag_pool_t::parents_for(CATEGORY_INCOME)).id;
    food   = tags.create("Food", tag_pool_t::parents_for(CATEGORY_EXPENSE)).id;

    tag_ids_set under_food;
    under_food.insert(food);
    groceries = tags.create("Groceries", under_food).id;
    travel    = tags.create("Travel",
                            tag_pool_t::parents_for(CATEGORY_EXPENSE)).id;

    cafe = journal.add_counterparty("Corner Cafe").id;
  }

  static fixed_t amt(const char * str) {
    return fixed_t::exact(str);
  }

  static datetime_t moment(const int year, const int month, const int day,
                           const int hour = 12) {
    return datetime_t(date_t(static_cast<unsigned short>(year),
                             static_cast<unsigned short>(month),
                             static_cast<unsigned short>(day)),
                      posix_time::hours(hour));
  }

  static xact_header_t on(const int year, const int month, const int day,
                          const int hour = 12) {
    return xact_header_t(moment(year, month, day, hour));
  }

  const fixed_t& balance(const account_id_t id) const {
    return journal.get_account(id).balance;
  }

  tag_id_t tips() const {
    return journal.tags().find("Tips")->id;
  }
};

#endif /* _T_JOURNAL_H */
