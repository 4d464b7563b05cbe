/*
 * Copyright (c) 2003-2025, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <system.hh>

#include "report.h"

namespace tally {

namespace {
  void add_to(rollup_t& rollup, const line_t& line)
  {
    if (line.sign == SIGN_PLUS)
      rollup.income += line.reference_amount();
    else
      rollup.expense += line.reference_amount();
    ++rollup.lines;
  }

  datetime_t start_of(const date_t& day)
  {
    return datetime_t(day);
  }
}

bool is_flow_line(const line_t& line)
{
  return (line.tag != TRANSFER_TAG &&
          line.tag != EXCHANGE_TAG &&
          line.tag != INITIAL_TAG);
}

summary_t summarize(const store_t&                 store,
                    const datetime_t&              begin,
                    const datetime_t&              end,
                    const optional<currency_id_t>& currency)
{
  summary_t summary;

  for (const xact_t * xact : store.get_xacts_in_range(begin, end)) {
    bool touched = ! currency;

    for (const line_t& line : xact->lines) {
      if (currency) {
        if (store.get_account(line.account).currency != *currency)
          continue;
        touched = true;
      }
      if (! is_flow_line(line))
        continue;

      fixed_t value = currency ? line.amount : line.reference_amount();
      if (line.sign == SIGN_PLUS)
        summary.income += value;
      else
        summary.expense += value;
    }

    if (touched)
      ++summary.count;
  }

  DEBUG("report.summary", "[" << begin << ", " << end << "): income "
        << summary.income << ", expense " << summary.expense
        << " over " << summary.count << " transaction(s)");
  return summary;
}

summary_t month_summary(const store_t&                 store,
                        const int                      year,
                        const int                      month,
                        const optional<currency_id_t>& currency)
{
  date_t first;
  try {
    first = date_t(static_cast<unsigned short>(year),
                   static_cast<unsigned short>(month), 1);
  }
  catch (const std::out_of_range&) {
    throw_invalid("month", _f("There is no month %1%-%2%") % year % month);
  }
  return summarize(store, start_of(first),
                   start_of(first + gregorian::months(1)), currency);
}

daily_amounts_t daily_net(const store_t&     store,
                          const account_id_t account,
                          const date_t&      begin,
                          const date_t&      end)
{
  daily_amounts_t net;
  for (const dated_line_t& entry :
         store.get_lines_for_account_in_range(account, start_of(begin),
                                              start_of(end)))
    net[entry.xact->when.date()] += entry.line->signed_amount();
  return net;
}

daily_amounts_t daily_balances(const store_t&     store,
                               const account_id_t account,
                               const date_t&      begin,
                               const date_t&      end,
                               const fixed_t&     end_balance)
{
  daily_amounts_t net(daily_net(store, account, begin, end));
  daily_amounts_t balances;

  fixed_t running = end_balance;
  for (date_t day = end - gregorian::days(1); day >= begin;
       day -= gregorian::days(1)) {
    balances[day] = running;

    daily_amounts_t::const_iterator i = net.find(day);
    if (i != net.end())
      running -= (*i).second;
  }
  return balances;
}

fixed_t balance_at(const store_t&     store,
                   const account_id_t account,
                   const datetime_t&  moment)
{
  fixed_t balance = store.get_account(account).balance;

  for (const dated_line_t& entry :
         store.get_lines_for_account_in_range
           (account, moment, datetime_t(posix_time::pos_infin)))
    balance -= entry.line->signed_amount();

  return balance;
}

tag_rollup_t tag_rollup(const store_t&    store,
                        const datetime_t& begin,
                        const datetime_t& end)
{
  tag_rollup_t rollup;
  for (const xact_t * xact : store.get_xacts_in_range(begin, end))
    for (const line_t& line : xact->lines)
      if (is_flow_line(line))
        add_to(rollup[line.tag], line);
  return rollup;
}

counterparty_rollup_t counterparty_rollup(const store_t&    store,
                                          const datetime_t& begin,
                                          const datetime_t& end)
{
  counterparty_rollup_t rollup;
  for (const xact_t * xact : store.get_xacts_in_range(begin, end)) {
    if (! xact->counterparty)
      continue;
    for (const line_t& line : xact->lines)
      if (is_flow_line(line))
        add_to(rollup[*xact->counterparty], line);
  }
  return rollup;
}

budget_progress_t budget_progress(const store_t&  store,
                                  const budget_t& budget)
{
  budget_progress_t progress;
  progress.target = budget.target;

  tag_ids_set tags(store.tags().with_descendants(budget.tag));

  for (const xact_t * xact :
         store.get_xacts_in_range(start_of(budget.start),
                                  start_of(budget.end))) {
    for (const line_t& line : xact->lines) {
      if (! tags.count(line.tag))
        continue;
      if (line.sign == SIGN_MINUS)
        progress.actual += line.reference_amount();
      else
        progress.actual -= line.reference_amount();
    }
  }

  progress.remaining = progress.target - progress.actual;
  if (progress.target.is_nonzero())
    progress.ratio = progress.actual.to_double() / progress.target.to_double();

  DEBUG("report.budget", "Budget " << budget.id << ": " << progress.actual
        << " of " << progress.target);
  return progress;
}

} // namespace tally
