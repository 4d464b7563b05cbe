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
 * @file   line.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief One signed entry against one account and tag.
 */
#pragma once

#include "fixed.h"
#include "flags.h"
#include "types.h"

namespace tally {

enum sign_t {
  SIGN_PLUS,                    // increases the account
  SIGN_MINUS                    // decreases the account
};

inline char sign_char(const sign_t sign) {
  return sign == SIGN_PLUS ? '+' : '-';
}

inline sign_t opposite(const sign_t sign) {
  return sign == SIGN_PLUS ? SIGN_MINUS : SIGN_PLUS;
}

class line_t : public flags::supports_flags<>
{
public:
#define LINE_NORMAL 0x00
#define LINE_COMMON 0x01 // an add-on computed from the base amount

  account_id_t      account;
  tag_id_t          tag;
  sign_t            sign;
  fixed_t           amount;     // never negative
  fixed_t           rate;       // reference units per unit, at creation
  optional<fixed_t> pct_value;  // 0.15 for a 15% add-on

  line_t(const account_id_t _account = 0,
         const tag_id_t     _tag     = 0,
         const sign_t       _sign    = SIGN_MINUS,
         const fixed_t&     _amount  = fixed_t(),
         const fixed_t&     _rate    = fixed_t(1L),
         const flags_t      _flags   = LINE_NORMAL)
    : supports_flags<>(_flags), account(_account), tag(_tag), sign(_sign),
      amount(_amount), rate(_rate) {}

  bool is_common() const {
    return has_flags(LINE_COMMON);
  }

  fixed_t signed_amount() const {
    return sign == SIGN_PLUS ? amount : amount.negated();
  }

  /** The unsigned amount expressed in the reference currency. */
  fixed_t reference_amount() const {
    return amount.multiply(rate);
  }

  bool operator==(const line_t& other) const {
    return (account   == other.account &&
            tag       == other.tag &&
            sign      == other.sign &&
            amount    == other.amount &&
            rate      == other.rate &&
            pct_value == other.pct_value &&
            flags()   == other.flags());
  }
  bool operator!=(const line_t& other) const {
    return ! (*this == other);
  }

  bool valid() const;
};

std::ostream& operator<<(std::ostream& out, const line_t& line);

/**
 * Canonical line order: category lines before add-ons, then by tag,
 * account, sign and amount.  Sorting by it makes any computation over a
 * line set independent of the order in which lines were stored.
 */
bool canonical_line_order(const line_t& left, const line_t& right);

} // namespace tally
