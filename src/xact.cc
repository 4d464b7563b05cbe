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

#include "xact.h"

namespace tally {

xact_id_t xact_t::generate_id()
{
  static uuids::random_generator generator;

  uuids::uuid bytes = generator();
  return hex_encode(bytes.data, 8);
}

bool xact_t::references(const account_id_t account) const
{
  for (const line_t& line : lines)
    if (line.account == account)
      return true;
  return false;
}

bool xact_t::valid() const
{
  if (id.empty()) {
    DEBUG("tally.validate", "xact_t: id is empty");
    return false;
  }
  if (when.is_not_a_date_time()) {
    DEBUG("tally.validate", "xact_t: timestamp not set");
    return false;
  }
  if (lines.empty()) {
    DEBUG("tally.validate", "xact_t: no lines");
    return false;
  }
  for (const line_t& line : lines) {
    if (! line.valid()) {
      DEBUG("tally.validate", "xact_t: line failed to validate");
      return false;
    }
  }
  return true;
}

} // namespace tally
