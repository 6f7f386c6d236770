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
 * @addtogroup math
 */

/**
 * @file   amount.h
 * @author John Wiegley
 *
 * @ingroup math
 *
 * @brief Exact money quantities.
 *
 * An amount_t is an infinite-precision rational, so that adding up a long
 * register never drifts the way binary floating point does.  Amounts carry
 * no currency: every figure in a journal is in the same unit.  Only the
 * display rounds, to amount_t::display_precision places.
 */
#ifndef _AMOUNT_H
#define _AMOUNT_H

#include "utils.h"

namespace budget {

DECLARE_EXCEPTION(amount_error, std::runtime_error);

/**
 * @class amount_t
 *
 * @brief Encapsulate an exact rational quantity of money.
 */
class amount_t
  : public ordered_field_operators<amount_t>
{
public:
  /** Ready the temporaries used for rounding and output.  Must be called
      before any amount is printed. */
  static void initialize();
  static void shutdown();

  static bool is_initialized;

  typedef uint_least16_t precision_t;

  /** Places after the decimal point when amounts are printed. */
  static precision_t display_precision;

protected:
  mpq_t quantity;

public:
  amount_t() {
    mpq_init(quantity);
  }
  amount_t(const long val) {
    mpq_init(quantity);
    mpq_set_si(quantity, val, 1);
  }
  explicit amount_t(const string& val) {
    mpq_init(quantity);
    parse(val);
  }
  explicit amount_t(const char * val) {
    mpq_init(quantity);
    parse(val);
  }
  amount_t(const amount_t& amt) {
    mpq_init(quantity);
    mpq_set(quantity, amt.quantity);
  }
  ~amount_t() {
    mpq_clear(quantity);
  }

  amount_t& operator=(const amount_t& amt) {
    if (this != &amt)
      mpq_set(quantity, amt.quantity);
    return *this;
  }

  int compare(const amount_t& amt) const {
    return mpq_cmp(quantity, amt.quantity);
  }
  bool operator==(const amount_t& amt) const {
    return mpq_equal(quantity, amt.quantity) != 0;
  }
  bool operator<(const amount_t& amt) const {
    return compare(amt) < 0;
  }

  amount_t& operator+=(const amount_t& amt);
  amount_t& operator-=(const amount_t& amt);
  amount_t& operator*=(const amount_t& amt);
  amount_t& operator/=(const amount_t& amt);

  amount_t operator-() const {
    return negated();
  }
  amount_t negated() const {
    amount_t temp(*this);
    temp.in_place_negate();
    return temp;
  }
  void in_place_negate() {
    mpq_neg(quantity, quantity);
  }

  amount_t abs() const {
    if (sign() < 0)
      return negated();
    return *this;
  }

  int sign() const {
    return mpq_sgn(quantity);
  }
  bool is_zero() const {
    return sign() == 0;
  }
  bool is_nonzero() const {
    return ! is_zero();
  }

  /**
   * Read a decimal quantity: an optional sign and dollar sign, digits
   * with optional thousands commas, and an optional fraction.
   * "1,200.50", "-$20.5" and "+7" are all accepted.
   *
   * @throws amount_error if anything else is found.
   */
  void parse(const string& str);

  /** Digits rounded half-to-even at `precision' places. */
  string to_string(const precision_t precision = display_precision) const;

  /** Enough places to write the quantity exactly, and never fewer than
      display_precision.  Journal files are written this way. */
  string to_written_string() const;

  /** The exact rational, as "num/den" or a plain integer. */
  string to_fullstring() const;

  void print(std::ostream& out) const {
    out << to_string();
  }

  bool valid() const;
};

inline std::ostream& operator<<(std::ostream& out, const amount_t& amt) {
  amt.print(out);
  return out;
}

} // namespace budget

#endif // _AMOUNT_H
