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
 * @file   unistring.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief Column-aware handling of UTF-8 text for report output.
 */
#ifndef _UNISTRING_H
#define _UNISTRING_H

namespace budget {

/**
 * @class unistring
 *
 * @brief Abstract working with UTF-32 encoded Unicode strings
 *
 * The input to the string is a UTF-8 encoded budget::string, which can
 * then have its true length taken, or characters extracted.  Every code
 * point is counted as one column.
 */
class unistring
{
public:
  static const std::size_t npos = static_cast<std::size_t>(-1);

  std::vector<boost::uint32_t> utf32chars;

  unistring() {}
  unistring(const std::string& input)
  {
    const char * p   = input.c_str();
    std::size_t  len = input.length();

    if (utf8::is_valid(p, p + len)) {
      utf8::unchecked::utf8to32(p, p + len, std::back_inserter(utf32chars));
    } else {
      // Descriptions come straight from user files; treat stray bytes as
      // one column each rather than refusing to print them.
      std::string fixed;
      utf8::replace_invalid(p, p + len, std::back_inserter(fixed));
      utf8::unchecked::utf8to32(fixed.begin(), fixed.end(),
                                std::back_inserter(utf32chars));
    }
  }

  std::size_t length() const {
    return utf32chars.size();
  }

  std::size_t width() const {
    return length();
  }

  std::string extract(const std::string::size_type begin = 0,
                      const std::string::size_type len   = 0) const
  {
    std::string            utf8result;
    std::string::size_type this_len = length();

    assert(begin <= this_len);

    if (begin < this_len) {
      std::string::size_type count = this_len - begin;
      if (len && len < count)
        count = len;
      utf8::unchecked::utf32to8
        (utf32chars.begin() + static_cast<std::string::difference_type>(begin),
         utf32chars.begin() + static_cast<std::string::difference_type>(begin + count),
         std::back_inserter(utf8result));
    }

    return utf8result;
  }
};

/** Cut `str' down to `width' columns, marking the cut with "..". */
inline std::string truncate(const std::string& str, const std::size_t width)
{
  unistring temp(str);
  if (temp.width() <= width)
    return str;
  if (width <= 2)
    return temp.extract(0, width);
  return temp.extract(0, width - 2) + "..";
}

inline void justify(std::ostream&      out,
                    const std::string& str,
                    int                width,
                    bool               right  = false,
                    bool               redden = false)
{
  if (! right) {
    if (redden) out << "\033[31m";
    out << str;
    if (redden) out << "\033[0m";
  }

  unistring temp(str);

  int spacing = width - int(temp.width());
  while (spacing-- > 0)
    out << ' ';

  if (right) {
    if (redden) out << "\033[31m";
    out << str;
    if (redden) out << "\033[0m";
  }
}

} // namespace budget

#endif // _UNISTRING_H
