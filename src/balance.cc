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

#include "balance.h"

namespace tally {

fixed_t balance_delta(const line_t * old_line, const line_t * new_line)
{
  if (! old_line && ! new_line)
    throw_(invariant_violation,
           _("A balance delta requires a line mutation"));

  if (old_line && new_line && old_line->account != new_line->account)
    throw_(invariant_violation,
           _f("A single delta cannot move a line from account %1% to %2%")
           % old_line->account % new_line->account);

  fixed_t delta;
  if (new_line)
    delta += new_line->signed_amount();
  if (old_line)
    delta -= old_line->signed_amount();
  return delta;
}

void line_deltas(account_deltas_t& deltas,
                 const line_t *    old_line,
                 const line_t *    new_line)
{
  if (old_line && new_line && old_line->account != new_line->account) {
    deltas[old_line->account] += balance_delta(old_line, NULL);
    deltas[new_line->account] += balance_delta(NULL, new_line);
  } else {
    fixed_t delta = balance_delta(old_line, new_line);
    deltas[new_line ? new_line->account : old_line->account] += delta;
  }
}

account_deltas_t xact_deltas(const lines_list& old_lines,
                             const lines_list& new_lines)
{
  account_deltas_t deltas;

  for (const line_t& line : old_lines)
    line_deltas(deltas, &line, NULL);
  for (const line_t& line : new_lines)
    line_deltas(deltas, NULL, &line);

  for (account_deltas_t::iterator i = deltas.begin(); i != deltas.end(); ) {
    if ((*i).second.is_zero())
      deltas.erase(i++);
    else
      ++i;
  }

  DEBUG("balance.deltas", "Line set replacement touches "
        << deltas.size() << " account(s)");
  return deltas;
}

} // namespace tally
