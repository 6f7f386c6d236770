/*
 * Copyright (c) 2003-2018, John Wiegley.  All rights reserved.
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
 * @brief General utility facilities used by budget
 */
#ifndef _UTILS_H
#define _UTILS_H

#define TIMERS_ON 1

/**
 * @name Forward declarations
 */
/*@{*/

namespace budget {
  using namespace boost;

  typedef std::string       string;
  typedef std::list<string> strings_list;

  typedef posix_time::ptime         ptime;
  typedef ptime::time_duration_type time_duration;

  typedef boost::filesystem::path             path;
  typedef boost::filesystem::ifstream         ifstream;
  typedef boost::filesystem::ofstream         ofstream;
  typedef boost::filesystem::filesystem_error filesystem_error;
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

namespace budget {
  void debug_assert(const string& reason, const string& func,
                    const string& file, std::size_t line);
}

#define assert(x)                                               \
  ((x) ? ((void)0) : budget::debug_assert(#x, BOOST_CURRENT_FUNCTION, \
                                          __FILE__, __LINE__))

#else // !NO_ASSERTS

#define assert(x) ((void)(x))

#endif // !NO_ASSERTS

/*@}*/

/**
 * @name String helpers
 */
/*@{*/

namespace budget {

extern string empty_string;

strings_list split_arguments(const char * line);

} // namespace budget

/*@}*/

/**
 * @name Tracing and logging
 */
/*@{*/

namespace budget {

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

#if TRACING_ON

extern uint16_t _trace_level;

#define SHOW_TRACE(lvl) \
  (budget::_log_level >= budget::LOG_TRACE && lvl <= budget::_trace_level)
#define TRACE(lvl, msg) \
  (SHOW_TRACE(lvl) ? \
   ((budget::_log_buffer << msg), \
    budget::logger_func(budget::LOG_TRACE)) : (void)0)

#else // TRACING_ON

#define SHOW_TRACE(lvl) false
#define TRACE(lvl, msg)

#endif // TRACING_ON

#if DEBUG_ON

extern optional<std::string>  _log_category;
extern optional<boost::regex> _log_category_re;

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
  (budget::_log_level >= budget::LOG_DEBUG && budget::category_matches(cat))

#define DEBUG(cat, msg) \
  (SHOW_DEBUG(cat) ? \
   ((budget::_log_buffer << msg), \
    budget::logger_func(budget::LOG_DEBUG)) : (void)0)

#else // DEBUG_ON

#define SHOW_DEBUG(cat) false
#define DEBUG(cat, msg)

#endif // DEBUG_ON

#define LOG_MACRO(level, msg) \
  (budget::_log_level >= level ? \
   ((budget::_log_buffer << msg), budget::logger_func(level)) : (void)0)

#define SHOW_INFO() (budget::_log_level >= budget::LOG_INFO)

#define INFO(msg) LOG_MACRO(budget::LOG_INFO, msg)

} // namespace budget

#define IF_DEBUG(cat) if (SHOW_DEBUG(cat))

/*@}*/

/**
 * @name Timers
 * This allows log xacts to specify cumulative time spent.
 */
/*@{*/

#if TIMERS_ON

namespace budget {

void start_timer(const char * name, log_level_t lvl);
void stop_timer(const char * name);
void finish_timer(const char * name);

#if TRACING_ON
#define TRACE_START(name, lvl, msg) \
  (SHOW_TRACE(lvl) ? \
   ((budget::_log_buffer << msg), \
    budget::start_timer(#name, budget::LOG_TRACE)) : ((void)0))
#define TRACE_STOP(name, lvl) \
  (SHOW_TRACE(lvl) ? budget::stop_timer(#name) : ((void)0))
#define TRACE_FINISH(name, lvl) \
  (SHOW_TRACE(lvl) ? budget::finish_timer(#name) : ((void)0))
#else
#define TRACE_START(name, lvl, msg)
#define TRACE_STOP(name, lvl)
#define TRACE_FINISH(name, lvl)
#endif

#define INFO_START(name, msg) \
  (SHOW_INFO() ? \
   ((budget::_log_buffer << msg), \
    budget::start_timer(#name, budget::LOG_INFO)) : ((void)0))
#define INFO_FINISH(name) \
  (SHOW_INFO() ? budget::finish_timer(#name) : ((void)0))

} // namespace budget

#else // !TIMERS_ON

#define TRACE_START(lvl, msg, name)
#define TRACE_STOP(name, lvl)
#define TRACE_FINISH(name, lvl)

#define INFO_START(name, msg)
#define INFO_FINISH(name)

#endif // TIMERS_ON

/*@}*/

/*
 * These files define the other internal facilities.
 */

#include "error.h"

enum caught_signal_t {
  NONE_CAUGHT,
  INTERRUPTED,
  PIPE_CLOSED
};

extern caught_signal_t caught_signal;

void sigint_handler(int sig);
void sigpipe_handler(int sig);

inline void check_for_signal() {
  switch (caught_signal) {
  case NONE_CAUGHT:
    break;
  case INTERRUPTED:
    throw std::runtime_error(_("Interrupted by user (use Control-D to quit)"));
  case PIPE_CLOSED:
    throw std::runtime_error(_("Pipe terminated"));
  }
}

/**
 * @name General utility functions
 */
/*@{*/

#define foreach BOOST_FOREACH

namespace budget {

path expand_path(const path& pathname);
path resolve_path(const path& pathname);

inline char * skip_ws(char * ptr) {
  while (*ptr == ' ' || *ptr == '\t' || *ptr == '\n')
    ptr++;
  return ptr;
}

inline char * trim_ws(char * ptr) {
  std::size_t len = std::strlen(ptr);
  int i = int(len) - 1;
  while (i >= 0 && (ptr[i] == ' ' || ptr[i] == '\t' || ptr[i] == '\n'))
    ptr[i--] = '\0';
  return skip_ws(ptr);
}

/**
 * Terminates the current field of `buf' and returns the start of the next
 * one.  When `variable' is true a field ends only at a tab or at two
 * consecutive spaces, so that single spaces may appear inside it.
 */
inline char * next_element(char * buf, bool variable = false) {
  for (char * p = buf; *p; p++) {
    if (! (*p == ' ' || *p == '\t'))
      continue;

    if (! variable) {
      *p = '\0';
      return skip_ws(p + 1);
    }
    else if (*p == '\t') {
      *p = '\0';
      return skip_ws(p + 1);
    }
    else if (*(p + 1) == ' ') {
      *p = '\0';
      return skip_ws(p + 2);
    }
  }
  return NULL;
}


} // namespace budget

/*@}*/

#endif // _UTILS_H
