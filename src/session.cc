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

#include "session.h"
#include "rates.h"

namespace tally {

namespace {
  bool parse_bool(const string& name, const optional<string>& value)
  {
    if (! value)
      return true;

    string str(lowered(trim_copy(*value)));
    if (str.empty() || str == "yes" || str == "true" || str == "on" ||
        str == "1")
      return true;
    if (str == "no" || str == "false" || str == "off" || str == "0")
      return false;

    throw_(option_error, _f("Option '%1%' expects yes or no, not '%2%'")
           % name % *value);
    return false;
  }

  struct log_level_name_t {
    const char * name;
    log_level_t  level;
  };

  const log_level_name_t log_level_names[] = {
    { "off",   LOG_OFF   },
    { "crit",  LOG_CRIT  },
    { "fatal", LOG_FATAL },
    { "error", LOG_ERROR },
    { "warn",  LOG_WARN  },
    { "info",  LOG_INFO  },
    { "debug", LOG_DEBUG },
    { "trace", LOG_TRACE },
    { "all",   LOG_ALL   }
  };

  log_level_t parse_log_level(const optional<string>& value)
  {
    if (value) {
      string str(lowered(trim_copy(*value)));
      for (const log_level_name_t& entry : log_level_names)
        if (str == entry.name)
          return entry.level;
    }
    throw_(option_error, _f("Unknown log level '%1%'") % (value ? *value : ""));
    return LOG_WARN;
  }

  const char * log_level_name(const log_level_t level)
  {
    for (const log_level_name_t& entry : log_level_names)
      if (entry.level == level)
        return entry.name;
    return "?";
  }
}

session_t::session_t()
  : journal(new journal_t), verify(false), update_rates(true),
    round_addons(true)
{
}

void session_t::check_journal(const char * operation) const
{
  if (verify && ! journal->valid())
    throw_(invariant_violation,
           _f("Journal failed to verify after %1%") % operation);
}

xact_t session_t::commit(const intent_t& intent, const xact_header_t& header)
{
  try {
    xact_builder_t builder(*journal, round_addons);
    xact_t         xact(builder.build(intent, header));

    journal->insert_xact(xact);
    if (update_rates)
      apply_rates(*journal, implied_rates(xact, *journal));

    check_journal("commit");
    INFO("Committed " << intent_name(intent) << ' ' << xact.id);
    return xact;
  }
  catch (const std::exception&) {
    add_error_context(_f("While committing %1%:") % intent);
    throw;
  }
}

xact_t session_t::amend(const xact_id_t&     id,
                        const intent_t&      intent,
                        const xact_header_t& header)
{
  try {
    const xact_t& current(journal->get_xact(id));

    xact_header_t fields(header);
    if (fields.when.is_not_a_date_time())
      fields.when = current.when;
    if (! fields.note)
      fields.note = current.note;
    if (! fields.counterparty)
      fields.counterparty = current.counterparty;

    xact_builder_t builder(*journal, round_addons);
    xact_t         xact(builder.build(intent, fields));
    xact.id = id;

    journal->replace_xact(xact);
    if (update_rates)
      apply_rates(*journal, implied_rates(xact, *journal));

    check_journal("amend");
    INFO("Amended " << id << " as " << intent_name(intent));
    return xact;
  }
  catch (const std::exception&) {
    add_error_context(_f("While amending transaction %1%:") % id);
    throw;
  }
}

void session_t::remove(const xact_id_t& id)
{
  journal->remove_xact(id);
  check_journal("remove");
  INFO("Removed " << id);
}

editable_intent_t session_t::open(const xact_id_t& id) const
{
  return decompose(journal->get_xact(id).lines, *journal);
}

xact_mode_t session_t::mode_of(const xact_id_t& id) const
{
  return classify(journal->get_xact(id).lines, *journal);
}

void session_t::process_option(const string&           name,
                               const optional<string>& value)
{
  DEBUG("session.option", "--" << name << '=' << (value ? *value : ""));

  if (name == "verify") {
    verify = verify_enabled = parse_bool(name, value);
  }
  else if (name == "update-rates") {
    update_rates = parse_bool(name, value);
  }
  else if (name == "round-addons") {
    round_addons = parse_bool(name, value);
  }
  else if (name == "log-level") {
    _log_level = parse_log_level(value);
  }
  else if (name == "debug") {
    if (! value || value->empty())
      throw_(option_error, _("Option 'debug' needs a category pattern"));
    try {
      boost::regex check(*value, boost::regex::perl | boost::regex::icase);
    }
    catch (const boost::regex_error& err) {
      throw_(option_error, _f("Bad debug pattern '%1%': %2%")
             % *value % err.what());
    }
    set_debug_category(*value);
  }
  else {
    throw_(option_error, _f("Illegal option --%1%") % name);
  }
}

void session_t::process_environment(const char ** envp, const string& tag)
{
  assert(! tag.empty());

  for (const char ** p = envp; *p; p++) {
    string entry(*p);
    if (! starts_with(entry, tag))
      continue;

    string::size_type eq = entry.find('=');
    if (eq == string::npos)
      continue;

    string name;
    for (string::size_type i = tag.length(); i < eq; i++)
      name += entry[i] == '_' ? '-' :
        static_cast<char>(std::tolower(static_cast<unsigned char>(entry[i])));

    string value(entry.substr(eq + 1));
    if (name.empty() || value.empty())
      continue;

    try {
      process_option(name, value);
    }
    catch (const std::exception&) {
      add_error_context(_f("While parsing environment variable option '%1%':")
                        % *p);
      throw;
    }
  }
}

void session_t::report_options(std::ostream& out) const
{
  out << "verify       = " << (verify ? "yes" : "no") << std::endl
      << "update-rates = " << (update_rates ? "yes" : "no") << std::endl
      << "round-addons = " << (round_addons ? "yes" : "no") << std::endl
      << "log-level    = " << log_level_name(_log_level) << std::endl;
  if (_log_category)
    out << "debug        = " << *_log_category << std::endl;
}

} // namespace tally
