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

#include "currency.h"

namespace tally {

bool currency_t::observe(const fixed_t& amt)
{
  precision_t needed = amt.precision();
  if (needed > fixed_t::scale_digits)
    needed = fixed_t::scale_digits;

  if (needed > precision) {
    DEBUG("currency.precision", "Widening " << code << " from "
          << int(precision) << " to " << int(needed) << " places");
    precision = needed;
    return true;
  }
  return false;
}

string currency_t::format(const fixed_t& amt) const
{
  std::ostringstream buf;
  amt.print(buf, precision);
  if (! code.empty())
    buf << ' ' << code;
  return buf.str();
}

bool currency_t::valid() const
{
  if (code.empty()) {
    DEBUG("tally.validate", "currency_t: code is empty");
    return false;
  }
  if (precision > fixed_t::scale_digits) {
    DEBUG("tally.validate", "currency_t: precision > 18");
    return false;
  }
  if (has_flags(CURRENCY_FIAT) && has_flags(CURRENCY_CRYPTO)) {
    DEBUG("tally.validate", "currency_t: both fiat and crypto");
    return false;
  }
  return true;
}

} // namespace tally
