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
 * @addtogroup report
 */

/**
 * @file   session.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Configuration plus the commit, amend and remove workflow.
 *
 * A session owns a journal and ties the engine's pieces together: an
 * intent is built, written with its balance deltas, its implied rates
 * are cached, and the journal is optionally re-verified.  Options come
 * from process_option() or from TALLY_* environment variables.
 */
#pragma once

#include "builder.h"
#include "classify.h"
#include "journal.h"

namespace tally {

DECLARE_EXCEPTION(option_error, std::runtime_error);

class session_t : public noncopyable
{
public:
  std::unique_ptr<journal_t> journal;

  bool verify;                  // --verify: re-derive balances on commit
  bool update_rates;            // --update-rates: cache implied rates
  bool round_addons;            // --round-addons: round percentage add-ons

  explicit session_t();
  virtual ~session_t() {}

  journal_t& get_journal() {
    return *journal;
  }

  xact_t commit(const intent_t&      intent,
                const xact_header_t& header = xact_header_t());

  /**
   * Rebuild transaction `id' from `intent', replacing its whole line set
   * under the same id.  Header fields left unset keep their stored values.
   */
  xact_t amend(const xact_id_t&     id,
               const intent_t&      intent,
               const xact_header_t& header = xact_header_t());

  void remove(const xact_id_t& id);

  editable_intent_t open(const xact_id_t& id) const;
  xact_mode_t       mode_of(const xact_id_t& id) const;

  /**
   * Set option `name' ("verify", "update-rates", "round-addons",
   * "log-level" or "debug").  Boolean options take yes/no, true/false,
   * on/off or 1/0, and no value means yes.  Unknown names and bad values
   * throw option_error.
   */
  void process_option(const string& name,
                      const optional<string>& value = none);

  /**
   * Apply every TALLY_* variable of `envp' as an option, so that
   * TALLY_UPDATE_RATES=no sets "update-rates" to false.
   */
  void process_environment(const char ** envp,
                           const string& tag = "TALLY_");

  void report_options(std::ostream& out) const;

private:
  void check_journal(const char * operation) const;
};

} // namespace tally
