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

#include "rates.h"

namespace tally {

fixed_t rate_for(const store_t& store, const currency_id_t currency)
{
  if (optional<fixed_t> rate = store.latest_rate(currency))
    if (rate->sign() > 0)
      return *rate;
  return fixed_t(1L);
}

fixed_t realized_rate(const fixed_t& reference_amount,
                      const fixed_t& other_amount)
{
  if (reference_amount.sign() <= 0 || other_amount.sign() <= 0)
    throw_(amount_error, _("A realized rate needs two positive amounts"));
  return reference_amount.divide(other_amount);
}

rate_updates_t implied_rates(const xact_t& xact, const store_t& store)
{
  rate_updates_t updates;

  std::vector<const line_t *> legs;
  for (const line_t& line : xact.lines)
    if (line.tag == EXCHANGE_TAG)
      legs.push_back(&line);
  if (legs.size() != 2)
    return updates;

  const currency_t& first(store.account_currency(legs[0]->account));
  const currency_t& second(store.account_currency(legs[1]->account));
  if (first.id == second.id || first.is_reference() == second.is_reference())
    return updates;

  const line_t *     reference_leg = first.is_reference() ? legs[0] : legs[1];
  const line_t *     other_leg     = first.is_reference() ? legs[1] : legs[0];
  const currency_t&  other         = first.is_reference() ? second : first;

  if (reference_leg->amount.sign() > 0 && other_leg->amount.sign() > 0) {
    fixed_t rate = realized_rate(reference_leg->amount, other_leg->amount);
    updates[other.id] = rate;
    DEBUG("rates.implied", other.code << " = " << rate << " from "
          << xact.id);
  }
  return updates;
}

void apply_rates(store_t& store, const rate_updates_t& updates)
{
  for (const rate_updates_t::value_type& pair : updates)
    store.set_latest_rate(pair.first, pair.second);
}

fixed_t convert(const store_t&      store,
                const fixed_t&      amount,
                const currency_id_t from,
                const currency_id_t to)
{
  if (from == to)
    return amount;
  return amount.multiply(rate_for(store, from)).divide(rate_for(store, to));
}

} // namespace tally
