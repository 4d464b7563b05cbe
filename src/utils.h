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
 * @defgroup util General utilities
 */

/**
 * @file   utils.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief General utility facilities used by tally
 */
#pragma once

#include <system.hh>

/**
 * @name Forward declarations
 */
/*@{*/

namespace tally {
  using namespace boost;

  typedef std::string string;
  typedef std::list<string> strings_list;

  typedef posix_time::ptime         ptime;
  typedef ptime::time_duration_type time_duration;
  typedef gregorian::date           date;
  typedef gregorian::date_duration  date_duration;
  typedef posix_time::seconds       seconds;

  typedef ptime datetime_t;
  typedef date  date_t;
}

/*@}*/

/**
 * @name Assertions
 */
/*@{*/

#ifdef assert
#undef assert
#endif

#if !NO_ASSERTS

namespace tally {
  void debug_assert(const string& reason, const string& func,
                    const string& file, std::size_t line);
}

#define assert(x)                                               \
  ((x) ? ((void)0) : tally::debug_assert(#x, BOOST_CURRENT_FUNCTION, \
                                         __FILE__, __LINE__))

#else // !NO_ASSERTS

#define assert(x) ((void)(x))

#endif // !NO_ASSERTS

/*@}*/

/**
 * @name Verification (i.e., heavy asserts)
 */
/*@{*/

namespace tally {
extern bool verify_enabled;
}

#if VERIFY_ON
#define VERIFY(x)   if (tally::verify_enabled) { assert(x); }
#define DO_VERIFY() tally::verify_enabled
#else
#define VERIFY(x)
#define DO_VERIFY() false
#endif

#define IF_VERIFY() if (DO_VERIFY())

/*@}*/

/**
 * @name String helpers
 */
/*@{*/

namespace tally {

inline string lowered(const string& str) {
  string tmp(str);
  to_lower(tmp);
  return tmp;
}

} // namespace tally

/*@}*/

/**
 * @name Tracing and logging
 */
/*@{*/

#if LOGGING_ON

namespace tally {

enum log_level_t {
  LOG_OFF = 0,
  LOG_CRIT,
  LOG_FATAL,
  LOG_ASSERT,
  LOG_ERROR,
  LOG_VERIFY,
  LOG_WARN,
  LOG_INFO,
  LOG_EXCEPT,
  LOG_DEBUG,
  LOG_TRACE,
  LOG_ALL
};

extern log_level_t        _log_level;
extern std::ostream *     _log_stream;
extern std::ostringstream _log_buffer;

void logger_func(log_level_t level);

#define LOGGER(cat) \
    static const char * const _this_category = cat

#if TRACING_ON

extern uint8_t _trace_level;

#define SHOW_TRACE(lvl) \
  (tally::_log_level >= tally::LOG_TRACE && lvl <= tally::_trace_level)
#define TRACE(lvl, msg) \
  (SHOW_TRACE(lvl) ? \
   ((tally::_log_buffer << msg), \
    tally::logger_func(tally::LOG_TRACE)) : (void)0)

#else // TRACING_ON

#define SHOW_TRACE(lvl) false
#define TRACE(lvl, msg)

#endif // TRACING_ON

#if DEBUG_ON

extern optional<std::string>  _log_category;
extern optional<boost::regex> _log_category_re;

void set_debug_category(const optional<string>& category);

inline bool category_matches(const char * cat) {
  if (_log_category) {
    if (! _log_category_re) {
      _log_category_re =
        boost::regex(_log_category->c_str(),
                     boost::regex::perl | boost::regex::icase);
    }
    return boost::regex_search(cat, *_log_category_re);
  }
  return false;
}

#define SHOW_DEBUG(cat) \
  (tally::_log_level >= tally::LOG_DEBUG && tally::category_matches(cat))
#define SHOW_DEBUG_() SHOW_DEBUG(_this_category)

#define DEBUG(cat, msg) \
  (SHOW_DEBUG(cat) ? \
   ((tally::_log_buffer << msg), \
    tally::logger_func(tally::LOG_DEBUG)) : (void)0)
#define DEBUG_(msg) DEBUG(_this_category, msg)

#else // DEBUG_ON

#define SHOW_DEBUG(cat) false
#define SHOW_DEBUG_()   false
#define DEBUG(cat, msg)
#define DEBUG_(msg)

#endif // DEBUG_ON

#define LOG_MACRO(level, msg) \
  (tally::_log_level >= level ? \
   ((tally::_log_buffer << msg), tally::logger_func(level)) : (void)0)

#define SHOW_INFO()     (tally::_log_level >= tally::LOG_INFO)
#define SHOW_WARN()     (tally::_log_level >= tally::LOG_WARN)
#define SHOW_ERROR()    (tally::_log_level >= tally::LOG_ERROR)
#define SHOW_FATAL()    (tally::_log_level >= tally::LOG_FATAL)
#define SHOW_CRITICAL() (tally::_log_level >= tally::LOG_CRIT)

#define INFO(msg)      LOG_MACRO(tally::LOG_INFO, msg)
#define WARN(msg)      LOG_MACRO(tally::LOG_WARN, msg)
#define ERROR(msg)     LOG_MACRO(tally::LOG_ERROR, msg)
#define FATAL(msg)     LOG_MACRO(tally::LOG_FATAL, msg)
#define CRITICAL(msg)  LOG_MACRO(tally::LOG_CRIT, msg)
#define EXCEPTION(msg) LOG_MACRO(tally::LOG_EXCEPT, msg)

} // namespace tally

#else // ! LOGGING_ON

#define LOGGER(cat)

#define SHOW_TRACE(lvl) false
#define TRACE(lvl, msg)
#define SHOW_DEBUG(cat) false
#define SHOW_DEBUG_()   false
#define DEBUG(cat, msg)
#define DEBUG_(msg)

#define SHOW_INFO()     false
#define SHOW_WARN()     false
#define SHOW_ERROR()    false
#define SHOW_FATAL()    false
#define SHOW_CRITICAL() false

#define INFO(msg)
#define WARN(msg)
#define ERROR(msg)
#define FATAL(msg)
#define CRITICAL(msg)
#define EXCEPTION(msg)

#endif // LOGGING_ON

#define IF_TRACE(lvl) if (SHOW_TRACE(lvl))
#define IF_DEBUG(cat) if (SHOW_DEBUG(cat))
#define IF_DEBUG_()   if (SHOW_DEBUG_())
#define IF_INFO()     if (SHOW_INFO())
#define IF_WARN()     if (SHOW_WARN())
#define IF_ERROR()    if (SHOW_ERROR())
#define IF_FATAL()    if (SHOW_FATAL())
#define IF_CRITICAL() if (SHOW_CRITICAL())

/*@}*/

/*
 * These files define the other internal facilities.
 */

#include "error.h"

/**
 * @name General utility functions
 */
/*@{*/

namespace tally {

string hex_encode(const unsigned char * data, std::size_t len);

} // namespace tally

/*@}*/
