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
 * @file   currency.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief A unit of money and its display precision.
 */
#pragma once

#include "fixed.h"
#include "flags.h"
#include "types.h"

namespace tally {

class currency_t : public flags::supports_flags<>
{
public:
#define CURRENCY_NORMAL          0x00
#define CURRENCY_FIAT            0x01
#define CURRENCY_CRYPTO          0x02
#define CURRENCY_PAYMENT_DEFAULT 0x04 // preferred for new expenses
#define CURRENCY_REFERENCE       0x08 // the system currency, rate 1

  typedef fixed_t::precision_t precision_t;

  currency_id_t id;
  string        code;
  string        symbol;
  precision_t   precision;

  currency_t(const currency_id_t  _id        = 0,
             const string&        _code      = "",
             const string&        _symbol    = "",
             const precision_t    _precision = 2,
             const flags_t        _flags     = CURRENCY_FIAT)
    : supports_flags<>(_flags), id(_id), code(_code), symbol(_symbol),
      precision(_precision) {}

  bool is_reference() const {
    return has_flags(CURRENCY_REFERENCE);
  }

  /**
   * Widen the display precision if `amt' needs more fractional digits
   * than currently recorded.  Precision is never narrowed, and never
   * exceeds the fixed-point scale.  Returns true if it changed.
   */
  bool observe(const fixed_t& amt);

  fixed_t round(const fixed_t& amt) const {
    return amt.round(precision);
  }

  /** Render `amt' at this currency's precision, e.g. "12.50 EUR". */
  string format(const fixed_t& amt) const;

  bool valid() const;
};

inline std::ostream& operator<<(std::ostream& out, const currency_t& cur) {
  out << cur.code;
  return out;
}

} // namespace tally
