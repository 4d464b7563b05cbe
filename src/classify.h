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
 * @addtogroup engine
 */

/**
 * @file   classify.h
 * @author John Wiegley
 *
 * @ingroup engine
 *
 * @brief Infer what kind of movement a stored line set represents.
 *
 * Transactions carry no stored type, so the kind is recovered from the
 * line set by an ordered match:
 *
 *  1. an INITIAL or ADJUSTMENT line           => system (read-only)
 *  2. two EXCHANGE lines plus a debited,
 *     non-add-on category line                => multi-currency expense
 *  3. any EXCHANGE line                       => exchange
 *  4. any TRANSFER line                       => transfer
 *  5. the first line in canonical order is +  => income, else expense
 *
 * No rule depends on the order of the lines.
 */
#pragma once

#include "intent.h"
#include "store.h"

namespace tally {

/**
 * @brief The inferred kind of a line set.
 *
 * `multi_currency' is only meaningful for EXPENSE; `system_tag' only
 * for SYSTEM, where it is INITIAL_TAG or ADJUSTMENT_TAG.
 */
struct xact_mode_t
{
  enum kind_t {
    INCOME,
    EXPENSE,
    TRANSFER,
    EXCHANGE,
    SYSTEM
  } kind;

  bool     multi_currency;
  tag_id_t system_tag;

  explicit xact_mode_t(const kind_t   _kind           = EXPENSE,
                       const bool     _multi_currency = false,
                       const tag_id_t _system_tag     = 0)
    : kind(_kind), multi_currency(_multi_currency),
      system_tag(_system_tag) {}

  static xact_mode_t income() {
    return xact_mode_t(INCOME);
  }
  static xact_mode_t expense(const bool multi_currency = false) {
    return xact_mode_t(EXPENSE, multi_currency);
  }
  static xact_mode_t transfer() {
    return xact_mode_t(TRANSFER);
  }
  static xact_mode_t exchange() {
    return xact_mode_t(EXCHANGE);
  }
  static xact_mode_t system(const tag_id_t tag) {
    return xact_mode_t(SYSTEM, false, tag);
  }

  bool is_read_only() const {
    return kind == SYSTEM;
  }

  bool operator==(const xact_mode_t& other) const {
    return (kind           == other.kind &&
            multi_currency == other.multi_currency &&
            system_tag     == other.system_tag);
  }
  bool operator!=(const xact_mode_t& other) const {
    return ! (*this == other);
  }
};

std::ostream& operator<<(std::ostream& out, const xact_mode_t& mode);

xact_mode_t classify(const lines_list& lines, const store_t& store);

/**
 * Recover the editable intent behind `lines'.  This never throws for
 * line sets that reference known accounts: a set that fits none of the
 * shapes the builder produces falls back to income or expense by sign,
 * logs a warning, and comes back read-only if anything was dropped.
 */
editable_intent_t decompose(const lines_list& lines, const store_t& store);

} // namespace tally
