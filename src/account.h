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
 * @file   account.h
 * @author John Wiegley
 *
 * @ingroup data
 */
#pragma once

#include "fixed.h"
#include "flags.h"
#include "types.h"

namespace tally {

class wallet_t : public flags::supports_flags<>
{
public:
#define WALLET_NORMAL   0x00
#define WALLET_DEFAULT  0x01
#define WALLET_ARCHIVED 0x02

  wallet_id_t id;
  string      name;

  wallet_t(const wallet_id_t _id = 0, const string& _name = "")
    : supports_flags<>(), id(_id), name(_name) {}

  bool is_default() const {
    return has_flags(WALLET_DEFAULT);
  }
};

/**
 * @brief A balance held in one currency inside a wallet.
 *
 * `balance' is maintained incrementally by the store: it always equals
 * `initial_balance' plus the signed amounts of every live line that
 * references this account.
 */
class account_t : public flags::supports_flags<>
{
public:
#define ACCOUNT_NORMAL   0x00
#define ACCOUNT_DEFAULT  0x01 // the wallet's default account
#define ACCOUNT_SHADOW   0x02 // landing side of mixed-currency expenses
#define ACCOUNT_ARCHIVED 0x04

  account_id_t  id;
  wallet_id_t   wallet;
  currency_id_t currency;
  string        name;
  fixed_t       initial_balance;
  fixed_t       balance;

  account_t(const account_id_t  _id       = 0,
            const wallet_id_t   _wallet   = 0,
            const currency_id_t _currency = 0,
            const string&       _name     = "",
            const fixed_t&      _initial  = fixed_t())
    : supports_flags<>(), id(_id), wallet(_wallet), currency(_currency),
      name(_name), initial_balance(_initial), balance(_initial) {}

  bool is_default() const {
    return has_flags(ACCOUNT_DEFAULT);
  }
  bool is_shadow() const {
    return has_flags(ACCOUNT_SHADOW);
  }

  bool valid() const;
};

/**
 * @brief Someone money is paid to or received from.
 *
 * The affinity set lists tags previously used with this counterparty.
 * It only biases category suggestions; it never constrains them.
 */
class counterparty_t
{
public:
  counterparty_id_t id;
  string            name;
  optional<string>  note;
  tag_ids_set       affinity;

  counterparty_t(const counterparty_id_t _id   = 0,
                 const string&           _name = "",
                 const optional<string>& _note = none)
    : id(_id), name(_name), note(_note) {}

  /**
   * Order `candidates' so that tags in the affinity set come first,
   * keeping the relative order within each group.
   */
  std::vector<tag_id_t>
  suggest_tags(const std::vector<tag_id_t>& candidates) const;
};

} // namespace tally
