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
 * @file   store.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief The persistence surface the engine consumes.
 *
 * The builder, classifier and reports see a store only through this
 * interface.  Lookups come in two flavors: find_*() returns NULL for a
 * missing entity, while get_*() throws store_error.  Timestamp ranges
 * are half-open, [begin, end).
 */
#pragma once

#include "account.h"
#include "currency.h"
#include "tag.h"
#include "xact.h"

namespace tally {

/**
 * @brief A line together with the transaction that owns it.
 */
struct dated_line_t
{
  const xact_t * xact;
  const line_t * line;

  dated_line_t(const xact_t * _xact, const line_t * _line)
    : xact(_xact), line(_line) {}
};

typedef std::vector<const xact_t *> xacts_list;
typedef std::vector<dated_line_t>   dated_lines_list;

class store_t
{
public:
  virtual ~store_t() {}

  /*
   * Reference data.
   */
  virtual const currency_t *     find_currency(const currency_id_t id) const = 0;
  virtual const wallet_t *       find_wallet(const wallet_id_t id) const = 0;
  virtual const account_t *      find_account(const account_id_t id) const = 0;
  virtual const counterparty_t * find_counterparty(const counterparty_id_t id) const = 0;
  virtual const tag_pool_t&      tags() const = 0;
  virtual const currency_t&      reference_currency() const = 0;

  const tag_t * find_tag(const tag_id_t id) const {
    return tags().find(id);
  }

  const currency_t&     get_currency(const currency_id_t id) const;
  const wallet_t&       get_wallet(const wallet_id_t id) const;
  const account_t&      get_account(const account_id_t id) const;
  const counterparty_t& get_counterparty(const counterparty_id_t id) const;
  const tag_t&          get_tag(const tag_id_t id) const;

  /** The currency of the account `id', which must exist. */
  const currency_t& account_currency(const account_id_t id) const {
    return get_currency(get_account(id).currency);
  }

  /*
   * Lines and transactions.
   */
  virtual const xact_t *   find_xact(const xact_id_t& id) const = 0;
  virtual xacts_list       get_xacts_in_range(const datetime_t& begin,
                                              const datetime_t& end) const = 0;
  virtual dated_lines_list
  get_lines_for_account_in_range(const account_id_t account,
                                 const datetime_t&  begin,
                                 const datetime_t&  end) const = 0;

  const xact_t& get_xact(const xact_id_t& id) const;
  lines_list    get_lines_for_xact(const xact_id_t& id) const {
    return get_xact(id).lines;
  }

  /*
   * Commands.  Each of insert_xact, replace_xact and remove_xact writes
   * the lines and applies their balance deltas as one unit; a failure
   * leaves both untouched.  apply_line_delta is only legal while such a
   * write is in progress.
   */
  virtual void apply_line_delta(const account_id_t account,
                                const fixed_t&     delta) = 0;

  virtual void insert_xact(const xact_t& xact) = 0;
  virtual void replace_xact(const xact_t& xact) = 0;
  virtual void remove_xact(const xact_id_t& id) = 0;

  /** Replace only the lines of `id', keeping its header. */
  void replace_xact_lines(const xact_id_t& id, const lines_list& lines) {
    xact_t updated(get_xact(id));
    updated.lines = lines;
    replace_xact(updated);
  }

  /*
   * Idempotent reference lookups, the only ones allowed to create data
   * while an intent is being built.
   */
  virtual const account_t&
  find_or_create_shadow_account(const wallet_id_t   wallet,
                                const currency_id_t currency) = 0;
  virtual const tag_t&
  find_or_create_tag(const string& name, const category_type_t type) = 0;

  /*
   * Exchange-rate cache: the latest known rate of a currency, in
   * reference-currency units per unit.
   */
  virtual optional<fixed_t> latest_rate(const currency_id_t currency) const = 0;
  virtual void set_latest_rate(const currency_id_t currency,
                               const fixed_t&      rate) = 0;
};

} // namespace tally
