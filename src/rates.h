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
 * @file   rates.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Rate snapshots and the latest-rate cache.
 *
 * A rate is always expressed as reference-currency units per one unit
 * of another currency.  The reference currency itself has rate 1, and
 * a currency whose rate was never learned also falls back to 1.
 */
#pragma once

#include "store.h"

namespace tally {

typedef std::map<currency_id_t, fixed_t> rate_updates_t;

/** The cached rate for `currency', or 1 if none is known. */
fixed_t rate_for(const store_t& store, const currency_id_t currency);

/**
 * The rate realized by exchanging `other_amount' of some currency for
 * `reference_amount' of the reference currency.
 */
fixed_t realized_rate(const fixed_t& reference_amount,
                      const fixed_t& other_amount);

/**
 * The cache updates a committed transaction implies.  Only a pair of
 * EXCHANGE legs with exactly one side in the reference currency yields
 * an update, for the currency of the other side.
 */
rate_updates_t implied_rates(const xact_t& xact, const store_t& store);

void apply_rates(store_t& store, const rate_updates_t& updates);

/** Convert through the cached rates, without rounding. */
fixed_t convert(const store_t&      store,
                const fixed_t&      amount,
                const currency_id_t from,
                const currency_id_t to);

} // namespace tally
