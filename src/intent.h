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
 * @file   intent.h
 * @author John Wiegley
 *
 * @ingroup engine
 *
 * @brief What a user means to record, before it becomes lines.
 *
 * An intent is the typed, form-shaped description of a money movement.
 * xact_builder_t expands one into a line set, and decompose() recovers
 * it from a line set, so every intent type here compares by value.
 */
#pragma once

#include "tag.h"
#include "fixed.h"

namespace tally {

/** One category entry of an expense. */
struct split_t
{
  tag_id_t tag;
  fixed_t  amount;

  split_t(const tag_id_t _tag = 0, const fixed_t& _amount = fixed_t())
    : tag(_tag), amount(_amount) {}

  bool operator==(const split_t& other) const {
    return tag == other.tag && amount == other.amount;
  }
};

/**
 * @brief A tip, fee, VAT or discount attached to an expense.
 *
 * An add-on is either absolute or a fraction of the expense base (the
 * sum of its splits); `percent' holds 0.15 for 15%.  A non-zero percent
 * takes precedence.  An add-on with neither produces no line.
 */
struct addon_t
{
  tag_id_t          tag;
  optional<fixed_t> amount;
  optional<fixed_t> percent;

  addon_t(const tag_id_t _tag = 0) : tag(_tag) {}

  static addon_t absolute(const tag_id_t tag, const fixed_t& amount) {
    addon_t addon(tag);
    addon.amount = amount;
    return addon;
  }
  static addon_t percentage(const tag_id_t tag, const fixed_t& percent) {
    addon_t addon(tag);
    addon.percent = percent;
    return addon;
  }

  bool is_percentage() const {
    return percent && percent->is_nonzero();
  }
  bool is_empty() const {
    return ! is_percentage() && ! (amount && amount->is_nonzero());
  }

  bool operator==(const addon_t& other) const {
    return (tag     == other.tag &&
            amount  == other.amount &&
            percent == other.percent);
  }
};

struct new_category_t
{
  string          name;
  category_type_t type;

  new_category_t(const string& _name = "",
                 const category_type_t _type = CATEGORY_INCOME)
    : name(_name), type(_type) {}

  bool operator==(const new_category_t& other) const {
    return name == other.name && type == other.type;
  }
};

struct income_intent_t
{
  account_id_t             account;
  fixed_t                  amount;
  optional<tag_id_t>       category;
  optional<new_category_t> new_category; // minted in place of `category'

  income_intent_t(const account_id_t _account = 0,
                  const fixed_t&     _amount  = fixed_t(),
                  const optional<tag_id_t>& _category = none)
    : account(_account), amount(_amount), category(_category) {}

  bool operator==(const income_intent_t& other) const {
    return (account      == other.account &&
            amount       == other.amount &&
            category     == other.category &&
            new_category == other.new_category);
  }
};

/**
 * @brief Spending from one account, split across categories.
 *
 * When `category_currency' differs from the paying account's currency
 * the splits and add-ons are denominated in it, and `paid_amount' is
 * what left the paying account.
 */
struct expense_intent_t
{
  typedef std::vector<split_t> splits_list;
  typedef std::vector<addon_t> addons_list;

  account_id_t            account;
  splits_list             splits;
  addons_list             addons;
  optional<currency_id_t> category_currency;
  optional<fixed_t>       paid_amount;

  expense_intent_t(const account_id_t _account = 0) : account(_account) {}

  fixed_t base() const {
    fixed_t total;
    for (const split_t& split : splits)
      total += split.amount;
    return total;
  }

  bool operator==(const expense_intent_t& other) const {
    return (account           == other.account &&
            splits            == other.splits &&
            addons            == other.addons &&
            category_currency == other.category_currency &&
            paid_amount       == other.paid_amount);
  }
};

struct transfer_intent_t
{
  account_id_t      from;
  account_id_t      to;
  fixed_t           amount;
  optional<fixed_t> fee;        // charged to `from'

  transfer_intent_t(const account_id_t _from   = 0,
                    const account_id_t _to     = 0,
                    const fixed_t&     _amount = fixed_t(),
                    const optional<fixed_t>& _fee = none)
    : from(_from), to(_to), amount(_amount), fee(_fee) {}

  bool operator==(const transfer_intent_t& other) const {
    return (from   == other.from &&
            to     == other.to &&
            amount == other.amount &&
            fee    == other.fee);
  }
};

struct exchange_intent_t
{
  account_id_t      from;
  account_id_t      to;
  fixed_t           amount;     // leaves `from', in its currency
  fixed_t           received;   // lands on `to', in its currency
  optional<fixed_t> fee;        // charged to `from'

  exchange_intent_t(const account_id_t _from     = 0,
                    const account_id_t _to       = 0,
                    const fixed_t&     _amount   = fixed_t(),
                    const fixed_t&     _received = fixed_t(),
                    const optional<fixed_t>& _fee = none)
    : from(_from), to(_to), amount(_amount), received(_received),
      fee(_fee) {}

  bool operator==(const exchange_intent_t& other) const {
    return (from     == other.from &&
            to       == other.to &&
            amount   == other.amount &&
            received == other.received &&
            fee      == other.fee);
  }
};

/**
 * @brief A manual correction of an account balance.
 *
 * `kind' is INITIAL_TAG or ADJUSTMENT_TAG; `delta' is signed.
 */
struct adjustment_intent_t
{
  account_id_t account;
  fixed_t      delta;
  tag_id_t     kind;

  adjustment_intent_t(const account_id_t _account = 0,
                      const fixed_t&     _delta   = fixed_t(),
                      const tag_id_t     _kind    = ADJUSTMENT_TAG)
    : account(_account), delta(_delta), kind(_kind) {}

  bool operator==(const adjustment_intent_t& other) const {
    return (account == other.account &&
            delta   == other.delta &&
            kind    == other.kind);
  }
};

typedef variant<income_intent_t,
                expense_intent_t,
                transfer_intent_t,
                exchange_intent_t,
                adjustment_intent_t> intent_t;

/**
 * @brief An intent recovered from stored lines, ready for a form.
 *
 * `simple' means the quick form can show it: one split and only
 * percentage add-ons.  `read_only' is set for system adjustments and
 * for line sets the recovered intent cannot represent exactly.
 */
struct editable_intent_t
{
  intent_t intent;
  bool     simple;
  bool     read_only;

  editable_intent_t(const intent_t& _intent = intent_t(),
                    const bool      _simple    = true,
                    const bool      _read_only = false)
    : intent(_intent), simple(_simple), read_only(_read_only) {}
};

/** "income", "expense", "transfer", "exchange" or "adjustment". */
const char * intent_name(const intent_t& intent);

std::ostream& operator<<(std::ostream& out, const intent_t& intent);

} // namespace tally
