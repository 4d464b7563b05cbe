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
 * @addtogroup engine
 */

/**
 * @file   builder.h
 * @author John Wiegley
 *
 * @ingroup engine
 *
 * @brief Expand a typed intent into a canonical line set.
 *
 * Building never writes lines, balances or rates.  The only store calls
 * that may create data are find_or_create_shadow_account() and
 * find_or_create_tag(), both idempotent.  Any failed precondition
 * throws validation_error naming the offending intent field, and no
 * partial result escapes.
 */
#pragma once

#include "intent.h"
#include "store.h"

namespace tally {

class xact_builder_t
{
public:
  store_t& store;
  bool     round_addons;

  explicit xact_builder_t(store_t& _store, const bool _round_addons = true)
    : store(_store), round_addons(_round_addons) {}

  /**
   * Build a transaction with a fresh id.  An unset timestamp in
   * `header' means now.
   */
  xact_t build(const intent_t& intent,
               const xact_header_t& header = xact_header_t());

  /** Build only the lines of `intent'. */
  lines_list build_lines(const intent_t& intent);

  lines_list build_income(const income_intent_t& intent);
  lines_list build_expense(const expense_intent_t& intent);
  lines_list build_transfer(const transfer_intent_t& intent);
  lines_list build_exchange(const exchange_intent_t& intent);
  lines_list build_adjustment(const adjustment_intent_t& intent);

  /** The rate snapshot for a new line in `currency'. */
  fixed_t snapshot_rate(const currency_t& currency) const;

  /** The amount of a percentage add-on over `base'. */
  fixed_t addon_amount(const fixed_t&    base,
                       const fixed_t&    percent,
                       const currency_t& currency) const;

private:
  const account_t& require_account(const char *       field,
                                   const account_id_t id) const;
  const tag_t&     require_category(const char *   field,
                                    const tag_id_t id) const;
  void             require_positive(const char *   field,
                                    const fixed_t& amount) const;
  void             require_non_negative(const char *             field,
                                        const optional<fixed_t>& amount) const;
  void             add_fee(lines_list&              lines,
                           const account_t&         from,
                           const optional<fixed_t>& fee,
                           const fixed_t&           rate) const;
};

/**
 * The adjustment that would bring `account' to `target' from its
 * current balance.
 */
adjustment_intent_t adjustment_to(const store_t&     store,
                                  const account_id_t account,
                                  const fixed_t&     target,
                                  const tag_id_t     kind = ADJUSTMENT_TAG);

} // namespace tally
