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

#include "amount.h"

namespace budget {

bool                  amount_t::is_initialized    = false;
amount_t::precision_t amount_t::display_precision = 2;

namespace {
  const int extend_by_digits = 6;

  mpfr_t tempfb;
  mpfr_t tempfnum;
  mpfr_t tempfden;

  string stream_out_mpq(const mpq_t                 quant,
                        const amount_t::precision_t precision)
  {
    if (! amount_t::is_initialized)
      throw_(amount_error, _("Amounts cannot be printed before initialization"));

#if DEBUG_ON
    IF_DEBUG("amount.convert") {
      char * tbuf = mpq_get_str(NULL, 10, quant);
      DEBUG("amount.convert", "Rational to convert = " << tbuf);
      std::free(tbuf);
    }
#endif

    // Convert the rational number to a floating-point, extending the
    // floating-point to a large enough size to get a precise answer.

    mpfr_prec_t num_prec =
      static_cast<mpfr_prec_t>(mpz_sizeinbase(mpq_numref(quant), 2));
    num_prec += extend_by_digits * 64;
    if (num_prec < MPFR_PREC_MIN)
      num_prec = MPFR_PREC_MIN;

    mpfr_set_prec(tempfnum, num_prec);
    mpfr_set_z(tempfnum, mpq_numref(quant), MPFR_RNDN);

    mpfr_prec_t den_prec =
      static_cast<mpfr_prec_t>(mpz_sizeinbase(mpq_denref(quant), 2));
    den_prec += extend_by_digits * 64;
    if (den_prec < MPFR_PREC_MIN)
      den_prec = MPFR_PREC_MIN;

    mpfr_set_prec(tempfden, den_prec);
    mpfr_set_z(tempfden, mpq_denref(quant), MPFR_RNDN);

    mpfr_set_prec(tempfb, num_prec + den_prec);
    mpfr_div(tempfb, tempfnum, tempfden, MPFR_RNDN);

    char * buf = NULL;
    if (mpfr_asprintf(&buf, "%.*RNf", int(precision), tempfb) < 0)
      throw_(amount_error,
             _("Cannot output amount to a floating-point representation"));

    string result(buf);
    mpfr_free_str(buf);

    // Rounding a tiny negative value to zero must not print "-0.00".
    if (! result.empty() && result[0] == '-' &&
        result.find_first_not_of("-0.") == string::npos)
      result.erase(0, 1);

    DEBUG("amount.convert", "mpfr_print = " << result
          << " (precision " << precision << ")");

    return result;
  }
}

void amount_t::initialize()
{
  if (! is_initialized) {
    mpfr_init(tempfb);
    mpfr_init(tempfnum);
    mpfr_init(tempfden);

    is_initialized = true;
  }
}

void amount_t::shutdown()
{
  if (is_initialized) {
    mpfr_clear(tempfb);
    mpfr_clear(tempfnum);
    mpfr_clear(tempfden);

    is_initialized = false;
  }
}

amount_t& amount_t::operator+=(const amount_t& amt)
{
  mpq_add(quantity, quantity, amt.quantity);
  return *this;
}

amount_t& amount_t::operator-=(const amount_t& amt)
{
  mpq_sub(quantity, quantity, amt.quantity);
  return *this;
}

amount_t& amount_t::operator*=(const amount_t& amt)
{
  mpq_mul(quantity, quantity, amt.quantity);
  return *this;
}

amount_t& amount_t::operator/=(const amount_t& amt)
{
  if (amt.is_zero())
    throw_(amount_error, _("Divide by zero"));

  mpq_div(quantity, quantity, amt.quantity);
  return *this;
}

void amount_t::parse(const string& str)
{
  string::const_iterator i   = str.begin();
  string::const_iterator end = str.end();

  while (i != end && std::isspace(static_cast<unsigned char>(*i)))
    ++i;
  while (i != end && std::isspace(static_cast<unsigned char>(*(end - 1))))
    --end;

  bool negative = false;
  if (i != end && (*i == '-' || *i == '+')) {
    negative = *i == '-';
    ++i;
  }
  if (i != end && *i == '$')
    ++i;

  string      digits;
  std::size_t places      = 0;
  bool        seen_point  = false;
  std::size_t group_count = 0;
  bool        grouped     = false;

  for (; i != end; ++i) {
    char c = *i;
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits.push_back(c);
      if (seen_point)
        ++places;
      else
        ++group_count;
    }
    else if (c == ',' && ! seen_point) {
      // Thousands separators must follow one to three leading digits, and
      // then split the integer part into groups of exactly three.
      if (group_count == 0 || group_count > 3 ||
          (grouped && group_count != 3))
        throw_(amount_error, _f("Misplaced comma in amount: %1%") % str);
      grouped     = true;
      group_count = 0;
    }
    else if (c == '.' && ! seen_point) {
      seen_point = true;
    }
    else {
      throw_(amount_error, _f("Invalid amount: %1%") % str);
    }
  }

  if (digits.empty() || (grouped && group_count != 3) ||
      (seen_point && places == 0))
    throw_(amount_error, _f("Invalid amount: %1%") % str);

  mpz_t num;
  mpz_init(num);
  mpz_set_str(num, digits.c_str(), 10);
  if (negative)
    mpz_neg(num, num);

  mpz_t den;
  mpz_init(den);
  mpz_ui_pow_ui(den, 10, static_cast<unsigned long>(places));

  mpq_set_num(quantity, num);
  mpq_set_den(quantity, den);
  mpq_canonicalize(quantity);

  mpz_clear(num);
  mpz_clear(den);

  DEBUG("amount.parse", "Parsed '" << str << "' as " << to_fullstring());
}

string amount_t::to_string(const precision_t precision) const
{
  return stream_out_mpq(quantity, precision);
}

string amount_t::to_written_string() const
{
  precision_t places = display_precision;

  // A decimal fraction has a denominator of the form 2^a * 5^b, and
  // needs max(a, b) places.
  mpz_t den;
  mpz_init_set(den, mpq_denref(quantity));

  mpz_t factor;
  mpz_init_set_ui(factor, 2);
  mp_bitcnt_t twos = mpz_remove(den, den, factor);
  mpz_set_ui(factor, 5);
  mp_bitcnt_t fives = mpz_remove(den, den, factor);

  if (mpz_cmp_ui(den, 1) == 0) {
    mp_bitcnt_t needed = twos > fives ? twos : fives;
    if (needed > places)
      places = static_cast<precision_t>(needed);
  } else {
    DEBUG("amount.convert",
          "No exact decimal for " << to_fullstring() << ", rounding");
  }

  mpz_clear(factor);
  mpz_clear(den);

  return to_string(places);
}

string amount_t::to_fullstring() const
{
  char * buf = mpq_get_str(NULL, 10, quantity);
  string result(buf);
  std::free(buf);
  return result;
}

bool amount_t::valid() const
{
  if (mpz_sgn(mpq_denref(quantity)) <= 0) {
    DEBUG("amount.validate", "amount_t: mpz_sgn(mpq_denref(quantity)) <= 0");
    return false;
  }
  return true;
}

} // namespace budget
