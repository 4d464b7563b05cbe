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
 * @file   budget.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief A spending target for a tag over a half-open date window.
 *
 * Only the target is stored; what was actually spent is derived from
 * the lines on every read (see budget_progress() in report.h).
 */
#pragma once

#include "fixed.h"
#include "types.h"

namespace tally {

struct budget_t
{
  budget_id_t id;
  tag_id_t    tag;
  date_t      start;
  date_t      end;              // exclusive
  fixed_t     target;           // in the reference currency

  budget_t(const budget_id_t _id     = 0,
           const tag_id_t    _tag    = 0,
           const date_t&     _start  = date_t(),
           const date_t&     _end    = date_t(),
           const fixed_t&    _target = fixed_t())
    : id(_id), tag(_tag), start(_start), end(_end), target(_target) {}

  bool contains(const date_t& when) const {
    return when >= start && when < end;
  }

  bool valid() const {
    if (start.is_not_a_date() || end.is_not_a_date() || ! (start < end)) {
      DEBUG("tally.validate", "budget_t: window is empty or unset");
      return false;
    }
    if (target.sign() < 0) {
      DEBUG("tally.validate", "budget_t: target is negative");
      return false;
    }
    return true;
  }
};

} // namespace tally
