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

#include <system.hh>

#include "times.h"

namespace budget {

optional<datetime_t> epoch;

namespace {
  class date_io_t : public noncopyable
  {
    string fmt_str;

  public:
    bool has_year;
    bool input;

    date_io_t(const char * _fmt_str, bool _input)
      : fmt_str(_fmt_str),
        has_year(icontains(fmt_str, "%F") || icontains(fmt_str, "%y")),
        input(_input) {
    }

    void set_format(const char * fmt) {
      fmt_str  = fmt;
      has_year = icontains(fmt_str, "%F") || icontains(fmt_str, "%y");
    }

    date_t parse(const char * str) {
      std::tm data;
      std::memset(&data, 0, sizeof(std::tm));
      data.tm_mday = 1;         // some formats have no day

      const char * end = strptime(str, fmt_str.c_str(), &data);
      if (! end || *end != '\0')
        return date_t();

      try {
        return gregorian::date_from_tm(data);
      }
      catch (const std::out_of_range&) {
        // bad_year, bad_month and bad_day_of_month all derive from it
        return date_t();
      }
    }

    std::string format(const date_t& when) {
      std::tm data(gregorian::to_tm(when));
      char buf[128];
      std::strftime(buf, 127, fmt_str.c_str(), &data);
      return buf;
    }
  };

  std::shared_ptr<date_io_t> written_date_io;
  std::shared_ptr<date_io_t> printed_date_io;

  std::deque<std::shared_ptr<date_io_t> > readers;

  bool convert_separators_to_slashes = true;

  date_t parse_date_mask_routine(const char * date_str, date_io_t& io)
  {
    if (std::strlen(date_str) > 127)
      throw_(date_error, _f("Invalid date: %1%") % date_str);

    char buf[128];
    std::strcpy(buf, date_str);

    if (convert_separators_to_slashes) {
      for (char * p = buf; *p; p++)
        if (*p == '.' || *p == '-')
          *p = '/';
    }

    date_t when = io.parse(buf);

    if (! when.is_not_a_date()) {
      DEBUG("times.parse", "Passed date string:  " << date_str);
      DEBUG("times.parse", "Parsed date string:  " << buf);
      DEBUG("times.parse", "Parsed result is:    " << when);

      if (! io.has_year)
        throw_(date_error, _f("Date lacks a year: %1%") % date_str);
    }
    return when;
  }

  date_t parse_date_mask(const char * date_str)
  {
    foreach (std::shared_ptr<date_io_t>& reader, readers) {
      date_t when = parse_date_mask_routine(date_str, *reader.get());
      if (! when.is_not_a_date())
        return when;
    }

    throw_(date_error, _f("Invalid date: %1%") % date_str);
    return date_t();
  }
}

date_t parse_date(const char * str)
{
  return parse_date_mask(str);
}

namespace {
  typedef std::map<std::string, std::shared_ptr<date_io_t> > date_io_map;

  date_io_map temp_date_io;
}

std::string format_date(const date_t&                 when,
                        const format_type_t           format_type,
                        const optional<const char *>& format)
{
  if (format_type == FMT_WRITTEN) {
    return written_date_io->format(when);
  }
  else if (format_type == FMT_CUSTOM && format) {
    date_io_map::iterator i = temp_date_io.find(*format);
    if (i != temp_date_io.end()) {
      return (*i).second->format(when);
    } else {
      std::shared_ptr<date_io_t> formatter(new date_io_t(*format, false));
      temp_date_io.insert(date_io_map::value_type(*format, formatter));
      return formatter->format(when);
    }
  }
  else if (format_type == FMT_PRINTED) {
    return printed_date_io->format(when);
  }
  else {
    assert(false);
    return empty_string;
  }
}

namespace {
  bool is_initialized = false;
}

void set_date_format(const char * format)
{
  printed_date_io->set_format(format);
}

void set_input_date_format(const char * format)
{
  readers.push_front(std::shared_ptr<date_io_t>(new date_io_t(format, true)));
  convert_separators_to_slashes = false;
}

unsigned short days_in_month(const int year, const int month)
{
  return gregorian::gregorian_calendar::end_of_month_day
    (static_cast<year_type>(year), static_cast<month_type>(month));
}

date_t clamped_date(const long year, const long month, const unsigned short day)
{
  if (year < 1400 || year > 9999)
    throw_(date_error, _f("Year %1% is outside the supported calendar") % year);

  unsigned short last = days_in_month(int(year), int(month));
  return date_t(static_cast<unsigned short>(year),
                static_cast<unsigned short>(month),
                day > last ? last : day);
}

date_t add_months(const date_t& date, const long months)
{
  long index = long(date.year()) * 12 + long(date.month()) - 1 + months;
  return clamped_date(index / 12, index % 12 + 1, date.day());
}

date_t add_years(const date_t& date, const long years)
{
  return clamped_date(long(date.year()) + years, date.month(), date.day());
}

long months_between(const date_t& from, const date_t& to)
{
  return ((long(to.year()) - long(from.year())) * 12 +
          (long(to.month()) - long(from.month())));
}

void times_initialize()
{
  if (! is_initialized) {
    written_date_io.reset(new date_io_t("%Y/%m/%d", false));
    printed_date_io.reset(new date_io_t("%Y-%m-%d", false));

    readers.push_back(std::shared_ptr<date_io_t>(new date_io_t("%Y/%m/%d", true)));

    is_initialized = true;
  }
}

void times_shutdown()
{
  if (is_initialized) {
    written_date_io.reset();
    printed_date_io.reset();

    readers.clear();
    temp_date_io.clear();

    convert_separators_to_slashes = true;
    is_initialized = false;
  }
}

} // namespace budget
