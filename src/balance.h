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
 * @file   balance.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Incremental maintenance of account balances.
 *
 * Balances are never summed from scratch when a line is written.
 * Instead, every line mutation produces an exact delta that the store
 * applies to the affected account in the same step as the write:
 *
 *   insert:  balance += signed(new)
 *   delete:  balance -= signed(old)
 *   update:  balance += signed(new) - signed(old)
 *
 * An update that moves a line to another account touches both
 * accounts, which is what line_deltas() is for.
 */
#pragma once

#include "line.h"

namespace tally {

typedef std::map<account_id_t, fixed_t> account_deltas_t;

/**
 * The net change to one account for replacing `old_line' with
 * `new_line'.  Either side may be NULL (insert or delete), but not
 * both.  Both lines must reference the same account; otherwise
 * invariant_violation is thrown.
 */
fixed_t balance_delta(const line_t * old_line, const line_t * new_line);

/**
 * Accumulate into `deltas' the per-account changes for replacing
 * `old_line' with `new_line', including a move between accounts.
 */
void line_deltas(account_deltas_t& deltas,
                 const line_t *    old_line,
                 const line_t *    new_line);

/**
 * The per-account changes for replacing a transaction's whole line set.
 * Accounts whose net change is zero are omitted.
 */
account_deltas_t xact_deltas(const lines_list& old_lines,
                             const lines_list& new_lines);

} // namespace tally
