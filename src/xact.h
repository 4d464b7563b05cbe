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
 * @file   xact.h
 * @author John Wiegley
 *
 * @ingroup data
 */
#pragma once

#include "line.h"

namespace tally {

/**
 * @brief Header fields a caller supplies alongside an intent.
 */
struct xact_header_t
{
  datetime_t                  when;
  optional<string>            note;
  optional<counterparty_id_t> counterparty;

  xact_header_t() {}
  explicit xact_header_t(const datetime_t&                  _when,
                         const optional<string>&            _note = none,
                         const optional<counterparty_id_t>& _cp   = none)
    : when(_when), note(_note), counterparty(_cp) {}
};

/**
 * @brief A money movement: a header plus an unordered set of lines.
 *
 * No transaction type is stored; what kind of movement a line set
 * represents is inferred by classify().
 */
class xact_t
{
public:
  xact_id_t                   id;
  datetime_t                  when;
  optional<string>            note;
  optional<counterparty_id_t> counterparty;
  lines_list                  lines;

  xact_t() {}
  xact_t(const xact_id_t& _id, const xact_header_t& header)
    : id(_id), when(header.when), note(header.note),
      counterparty(header.counterparty) {}

  /** Eight random bytes rendered as sixteen hex digits. */
  static xact_id_t generate_id();

  xact_header_t header() const {
    return xact_header_t(when, note, counterparty);
  }

  void add_line(const line_t& line) {
    lines.push_back(line);
  }

  bool references(const account_id_t account) const;

  bool valid() const;
};

} // namespace tally
