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
 * @addtogroup data
 */

/**
 * @file   journal.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief The in-memory store.
 *
 * journal_t keeps every entity in ordered maps keyed by id and applies
 * each transaction's balance deltas in the same step as its line
 * write.  It also carries the reference-data rules of the schema: the
 * first wallet and the first account of each wallet become defaults,
 * marking a new default clears the old one, and removing a default
 * promotes a survivor.
 */
#pragma once

#include "balance.h"
#include "budget.h"
#include "store.h"

namespace tally {

class journal_t : public store_t, public noncopyable
{
public:
  typedef std::map<currency_id_t, currency_t>         currencies_map;
  typedef std::map<wallet_id_t, wallet_t>             wallets_map;
  typedef std::map<account_id_t, account_t>           accounts_map;
  typedef std::map<counterparty_id_t, counterparty_t> counterparties_map;
  typedef std::map<budget_id_t, budget_t>             budgets_map;
  typedef std::map<xact_id_t, xact_t>                 xacts_map;
  typedef std::map<currency_id_t, fixed_t>            rates_map;

  currencies_map     currencies;
  wallets_map        wallets;
  accounts_map       accounts;
  tag_pool_t         tag_pool;
  counterparties_map counterparties;
  budgets_map        budgets;
  xacts_map          xacts;
  rates_map          rates;

  journal_t();
  virtual ~journal_t() {}

  /*
   * Reference data.
   */
  currency_t& add_currency(const string&                    code,
                           const string&                    symbol,
                           const currency_t::precision_t    precision = 2,
                           const currency_t::flags_t        flags = CURRENCY_FIAT);
  const currency_t& payment_currency() const;

  wallet_t&       add_wallet(const string& name);
  void            set_default_wallet(const wallet_id_t id);
  void            remove_wallet(const wallet_id_t id);
  const wallet_t& default_wallet() const;

  account_t& add_account(const wallet_id_t   wallet,
                         const currency_id_t currency,
                         const string&       name,
                         const fixed_t&      initial = fixed_t(),
                         const account_t::flags_t flags = ACCOUNT_NORMAL);
  void       set_default_account(const account_id_t id);
  void       remove_account(const account_id_t id);
  optional<account_id_t> default_account(const wallet_id_t wallet) const;

  counterparty_t& add_counterparty(const string&           name,
                                   const optional<string>& note = none);

  budget_t& add_budget(const tag_id_t tag,
                       const date_t&  start,
                       const date_t&  end,
                       const fixed_t& target);
  void      remove_budget(const budget_id_t id);

  /**
   * Remove a tag that no line or budget uses.  The tag also leaves
   * every counterparty's affinity set.  Use this rather than
   * `tags().remove()', which knows nothing about the journal.
   */
  void remove_tag(const tag_id_t id);

  tag_pool_t& tags() {
    return tag_pool;
  }

  /*
   * store_t
   */
  virtual const currency_t *     find_currency(const currency_id_t id) const;
  virtual const wallet_t *       find_wallet(const wallet_id_t id) const;
  virtual const account_t *      find_account(const account_id_t id) const;
  virtual const counterparty_t * find_counterparty(const counterparty_id_t id) const;
  virtual const tag_pool_t&      tags() const {
    return tag_pool;
  }
  virtual const currency_t&      reference_currency() const;

  virtual const xact_t *   find_xact(const xact_id_t& id) const;
  virtual xacts_list       get_xacts_in_range(const datetime_t& begin,
                                              const datetime_t& end) const;
  virtual dated_lines_list
  get_lines_for_account_in_range(const account_id_t account,
                                 const datetime_t&  begin,
                                 const datetime_t&  end) const;

  virtual void apply_line_delta(const account_id_t account,
                                const fixed_t&     delta);

  virtual void insert_xact(const xact_t& xact);
  virtual void replace_xact(const xact_t& xact);
  virtual void remove_xact(const xact_id_t& id);

  virtual const account_t&
  find_or_create_shadow_account(const wallet_id_t   wallet,
                                const currency_id_t currency);
  virtual const tag_t&
  find_or_create_tag(const string& name, const category_type_t type);

  virtual optional<fixed_t> latest_rate(const currency_id_t currency) const;
  virtual void set_latest_rate(const currency_id_t currency,
                               const fixed_t&      rate);

  /**
   * Re-derive every balance from the lines and check the reference-data
   * rules.  Returns false, logging the reason under "tally.validate",
   * on the first discrepancy.
   */
  bool valid() const;

private:
  currency_id_t     next_currency_id;
  wallet_id_t       next_wallet_id;
  account_id_t      next_account_id;
  counterparty_id_t next_counterparty_id;
  budget_id_t       next_budget_id;
  bool              writing_lines;

  friend struct line_write_t;

  void check_lines(const lines_list& lines) const;
  void observe_precision(const lines_list& lines);
  void apply_deltas(const account_deltas_t& deltas);
};

} // namespace tally
