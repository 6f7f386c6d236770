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
 * @addtogroup util
 */

/**
 * @file   times.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief date_t objects, their parsing and printing, and the calendar
 * arithmetic the recurrence code relies upon.
 */
#ifndef _TIMES_H
#define _TIMES_H

#include "utils.h"

namespace budget {

DECLARE_EXCEPTION(date_error, std::runtime_error);

typedef boost::posix_time::ptime        datetime_t;
typedef datetime_t::time_duration_type  time_duration_t;

typedef boost::gregorian::date          date_t;

inline bool is_valid(const date_t& moment) {
  return ! moment.is_not_a_date();
}

/**
 * When set, `epoch' replaces the system clock as the notion of "today".
 * Only the command-line layer consults it; nothing below the session
 * ever asks what day it is.
 */
extern optional<datetime_t> epoch;

#ifdef BOOST_DATE_TIME_HAS_HIGH_PRECISION_CLOCK
#define TRUE_CURRENT_TIME() (boost::posix_time::microsec_clock::local_time())
#else
#define TRUE_CURRENT_TIME() (boost::posix_time::second_clock::local_time())
#endif
#define CURRENT_TIME() (epoch ? *epoch : TRUE_CURRENT_TIME())
#define CURRENT_DATE() \
  (epoch ? epoch->date() : boost::gregorian::day_clock::local_day())

date_t parse_date(const char * str);

inline date_t parse_date(const std::string& str) {
  return parse_date(str.c_str());
}

enum format_type_t {
  FMT_WRITTEN, FMT_PRINTED, FMT_CUSTOM
};

std::string format_date(const date_t& when,
                        const format_type_t format_type = FMT_PRINTED,
                        const optional<const char *>& format = none);
void set_date_format(const char * format);
void set_input_date_format(const char * format);

/**
 * @name Calendar arithmetic
 *
 * boost::gregorian::months snaps to the end of the month whenever it
 * starts from a month's last day (Apr 30 + 1 month is May 31).  These
 * helpers never snap: the day is kept, and only clamped when the target
 * month is too short for it.
 */
/*@{*/

typedef date_t::year_type  year_type;
typedef date_t::month_type month_type;
typedef date_t::day_type   day_type;

unsigned short days_in_month(const int year, const int month);

/** The date in `year'/`month' closest to `day', clamped to month end. */
date_t clamped_date(const long year, const long month, const unsigned short day);

/** Advance by `months' (may be negative), keeping `date.day()'. */
date_t add_months(const date_t& date, const long months);

/** Advance by `years', clamping Feb 29 to Feb 28 in common years. */
date_t add_years(const date_t& date, const long years);

/** Calendar months from the month of `from' to the month of `to'. */
long months_between(const date_t& from, const date_t& to);

/*@}*/

void times_initialize();
void times_shutdown();

} // namespace budget

#endif // _TIMES_H
