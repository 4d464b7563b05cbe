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

/**
 * @addtogroup report
 */

/**
 * @file   report.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Aggregates derived from the line set.
 *
 * Every function here reads through the store's query interface and
 * keeps no state, so its result can be recomputed at any time.  Unless
 * a single currency is requested, amounts are converted to the
 * reference currency through each line's own rate snapshot.
 *
 * Transfers, exchanges and initial balances move money between the
 * user's own accounts and are therefore neither income nor expense.
 */
#pragma once

#include "budget.h"
#include "store.h"

namespace tally {

struct summary_t
{
  fixed_t     income;
  fixed_t     expense;
  std::size_t count;

  summary_t() : count(0) {}

  fixed_t net() const {
    return income - expense;
  }
};

struct rollup_t
{
  fixed_t     income;
  fixed_t     expense;
  std::size_t lines;

  rollup_t() : lines(0) {}

  fixed_t net() const {
    return income - expense;
  }
};

struct budget_progress_t
{
  fixed_t target;
  fixed_t actual;
  fixed_t remaining;
  double  ratio;                // actual / target, 0 for a zero target

  budget_progress_t() : ratio(0.0) {}

  bool over_budget() const {
    return actual > target;
  }
};

typedef std::map<date_t, fixed_t>              daily_amounts_t;
typedef std::map<tag_id_t, rollup_t>           tag_rollup_t;
typedef std::map<counterparty_id_t, rollup_t>  counterparty_rollup_t;

/** True for lines that count toward income and expense totals. */
bool is_flow_line(const line_t& line);

summary_t summarize(const store_t&                 store,
                    const datetime_t&              begin,
                    const datetime_t&              end,
                    const optional<currency_id_t>& currency = none);

summary_t month_summary(const store_t&                 store,
                        const int                      year,
                        const int                      month,
                        const optional<currency_id_t>& currency = none);

/** Per-day net movement of one account over [begin, end). */
daily_amounts_t daily_net(const store_t&     store,
                          const account_id_t account,
                          const date_t&      begin,
                          const date_t&      end);

/**
 * End-of-day balances for every day in [begin, end), walking backward
 * from `end_balance', the balance at the close of the last day.
 */
daily_amounts_t daily_balances(const store_t&     store,
                               const account_id_t account,
                               const date_t&      begin,
                               const date_t&      end,
                               const fixed_t&     end_balance);

/** The balance of `account' just before `moment'. */
fixed_t balance_at(const store_t&     store,
                   const account_id_t account,
                   const datetime_t&  moment);

tag_rollup_t tag_rollup(const store_t&    store,
                        const datetime_t& begin,
                        const datetime_t& end);

counterparty_rollup_t counterparty_rollup(const store_t&    store,
                                          const datetime_t& begin,
                                          const datetime_t& end);

/**
 * Net spending, debits minus credits, on the budget's tag and all of
 * its descendants within the budget window.
 */
budget_progress_t budget_progress(const store_t&  store,
                                  const budget_t& budget);

} // namespace tally
