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

#include "line.h"

namespace tally {

bool line_t::valid() const
{
  if (account == 0 || tag == 0) {
    DEBUG("tally.validate", "line_t: missing account or tag");
    return false;
  }
  if (! amount.valid() || amount.sign() < 0) {
    DEBUG("tally.validate", "line_t: amount is negative or malformed");
    return false;
  }
  if (! rate.valid() || rate.sign() <= 0) {
    DEBUG("tally.validate", "line_t: rate must be positive");
    return false;
  }
  if (pct_value && ! is_common()) {
    DEBUG("tally.validate", "line_t: a percentage on a non add-on line");
    return false;
  }
  return true;
}

std::ostream& operator<<(std::ostream& out, const line_t& line)
{
  out << sign_char(line.sign) << line.amount
      << " acct " << line.account << " tag " << line.tag
      << " @ " << line.rate;
  if (line.pct_value)
    out << " (" << *line.pct_value << ')';
  if (line.is_common())
    out << " [common]";
  return out;
}

bool canonical_line_order(const line_t& left, const line_t& right)
{
  if (left.is_common() != right.is_common())
    return ! left.is_common();
  if (left.tag != right.tag)
    return left.tag < right.tag;
  if (left.account != right.account)
    return left.account < right.account;
  if (left.sign != right.sign)
    return left.sign < right.sign;
  if (left.amount != right.amount)
    return left.amount < right.amount;
  return left.rate < right.rate;
}

} // namespace tally
