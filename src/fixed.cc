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

#include "fixed.h"

namespace tally {

const int64_t                fixed_t::scale = 1000000000000000000LL;
const fixed_t::precision_t   fixed_t::scale_digits;

namespace {
  struct bigint_t
  {
    mpz_t val;

    bigint_t() {
      mpz_init(val);
    }
    explicit bigint_t(const fixed_t& amt) {
      mpz_init(val);
      mpz_set_si(val, static_cast<long>(amt.int_part));
      mpz_mul_si(val, val, static_cast<long>(fixed_t::scale));
      mpz_add_ui(val, val, static_cast<unsigned long>(amt.frac));
    }
    ~bigint_t() {
      mpz_clear(val);
    }

  private:
    bigint_t(const bigint_t&);
    bigint_t& operator=(const bigint_t&);
  };

  void power_of_ten(mpz_t out, const unsigned long exponent)
  {
    mpz_ui_pow_ui(out, 10, exponent);
  }

  // Divide num by den (den > 0), rounding half away from zero.
  void round_div(mpz_t out, const mpz_t num, const mpz_t den)
  {
    bigint_t twice_num;
    bigint_t twice_den;
    const int sign = mpz_sgn(num);

    mpz_abs(twice_num.val, num);
    mpz_mul_2exp(twice_num.val, twice_num.val, 1);
    mpz_add(twice_num.val, twice_num.val, den);
    mpz_mul_2exp(twice_den.val, den, 1);

    mpz_fdiv_q(out, twice_num.val, twice_den.val);
    if (sign < 0)
      mpz_neg(out, out);
  }

  fixed_t from_raw(const mpz_t raw)
  {
    bigint_t whole;
    bigint_t remainder;
    bigint_t unit;

    mpz_set_si(unit.val, static_cast<long>(fixed_t::scale));
    mpz_fdiv_qr(whole.val, remainder.val, raw, unit.val);

    if (! mpz_fits_slong_p(whole.val))
      throw_(amount_error, _("Amount is out of range"));

    return fixed_t(static_cast<int64_t>(mpz_get_si(whole.val)),
                   static_cast<int64_t>(mpz_get_si(remainder.val)));
  }

  /*
   * Parse [+-]digits[.digits][(e|E)[+-]digits] into a raw count of
   * 10^-18 units.  Digits beyond the scale are either rounded away or
   * rejected, depending on `round_excess'.
   */
  void parse_decimal(mpz_t raw, const string& input, const bool round_excess)
  {
    string      str(trim_copy(input));
    std::size_t i = 0;
    bool        negative = false;

    if (i < str.length() && (str[i] == '-' || str[i] == '+'))
      negative = str[i++] == '-';

    string digits;
    long   frac_digits = 0;
    bool   seen_point  = false;

    for (; i < str.length(); i++) {
      const char c = str[i];
      if (std::isdigit(static_cast<unsigned char>(c))) {
        digits += c;
        if (seen_point)
          frac_digits++;
      }
      else if (c == '.' && ! seen_point) {
        seen_point = true;
      }
      else {
        break;
      }
    }

    if (digits.empty())
      throw_(amount_error, _f("Cannot parse amount '%1%'") % input);

    long exponent = 0;
    if (i < str.length() && (str[i] == 'e' || str[i] == 'E')) {
      try {
        exponent = lexical_cast<long>(str.substr(i + 1));
      }
      catch (const bad_lexical_cast&) {
        throw_(amount_error, _f("Cannot parse amount '%1%'") % input);
      }
      if (exponent > 400 || exponent < -400)
        throw_(amount_error, _f("Exponent out of range in '%1%'") % input);
    }
    else if (i != str.length()) {
      throw_(amount_error, _f("Cannot parse amount '%1%'") % input);
    }

    if (mpz_set_str(raw, digits.c_str(), 10) != 0)
      throw_(amount_error, _f("Cannot parse amount '%1%'") % input);

    long shift = fixed_t::scale_digits - frac_digits + exponent;
    if (shift >= 0) {
      bigint_t factor;
      power_of_ten(factor.val, static_cast<unsigned long>(shift));
      mpz_mul(raw, raw, factor.val);
    } else {
      bigint_t divisor;
      power_of_ten(divisor.val, static_cast<unsigned long>(-shift));
      if (! round_excess && ! mpz_divisible_p(raw, divisor.val))
        throw_(amount_error,
               _f("Amount '%1%' has more than %2% decimal places")
               % input % int(fixed_t::scale_digits));
      round_div(raw, raw, divisor.val);
    }

    if (negative)
      mpz_neg(raw, raw);
  }
}

fixed_t::fixed_t(const int64_t _int_part, const int64_t _frac)
  : int_part(_int_part), frac(_frac)
{
  if (frac < 0 || frac >= scale)
    throw_(amount_error, _f("Fraction %1% is outside [0, 10^18)") % _frac);
}

fixed_t fixed_t::exact(const string& str)
{
  bigint_t raw;
  parse_decimal(raw.val, str, false);
  fixed_t result(from_raw(raw.val));
  DEBUG("amount.parse", "exact(\"" << str << "\") = {"
        << result.int_part << ", " << result.frac << "}");
  return result;
}

fixed_t fixed_t::from_double(const double val)
{
  if (! std::isfinite(val))
    throw_(amount_error, _("Cannot convert a non-finite double to an amount"));

  std::ostringstream buf;
  buf << std::setprecision(15) << val;

  bigint_t raw;
  parse_decimal(raw.val, buf.str(), true);
  return from_raw(raw.val);
}

fixed_t fixed_t::from_legacy(const int64_t scaled, const precision_t places)
{
  if (places > scale_digits)
    throw_(amount_error,
           _f("Cannot convert a legacy amount with %1% decimal places")
           % int(places));

  bigint_t raw;
  bigint_t factor;
  mpz_set_si(raw.val, static_cast<long>(scaled));
  power_of_ten(factor.val, scale_digits - places);
  mpz_mul(raw.val, raw.val, factor.val);
  return from_raw(raw.val);
}

int64_t fixed_t::to_legacy(const precision_t places) const
{
  if (places > scale_digits)
    throw_(amount_error,
           _f("Cannot convert to a legacy amount with %1% decimal places")
           % int(places));

  bigint_t raw(*this);
  bigint_t divisor;
  power_of_ten(divisor.val, scale_digits - places);
  round_div(raw.val, raw.val, divisor.val);

  if (! mpz_fits_slong_p(raw.val))
    throw_(amount_error, _("Amount is out of range for a legacy integer"));
  return static_cast<int64_t>(mpz_get_si(raw.val));
}

double fixed_t::to_double() const
{
  bigint_t raw(*this);
  mpq_t    quot;

  mpq_init(quot);
  mpq_set_num(quot, raw.val);
  mpz_set_si(raw.val, static_cast<long>(scale));
  mpq_set_den(quot, raw.val);
  mpq_canonicalize(quot);

  double result = mpq_get_d(quot);
  mpq_clear(quot);
  return result;
}

fixed_t& fixed_t::operator+=(const fixed_t& amt)
{
  int_part += amt.int_part;
  frac     += amt.frac;
  if (frac >= scale) {
    frac -= scale;
    ++int_part;
  }
  return *this;
}

fixed_t& fixed_t::operator-=(const fixed_t& amt)
{
  int_part -= amt.int_part;
  frac     -= amt.frac;
  if (frac < 0) {
    frac += scale;
    --int_part;
  }
  return *this;
}

fixed_t fixed_t::multiply(const fixed_t& amt) const
{
  bigint_t product(*this);
  bigint_t other(amt);
  bigint_t unit;

  mpz_mul(product.val, product.val, other.val);
  mpz_set_si(unit.val, static_cast<long>(scale));
  round_div(product.val, product.val, unit.val);
  return from_raw(product.val);
}

fixed_t fixed_t::divide(const fixed_t& amt) const
{
  if (amt.is_zero())
    throw_(amount_error, _("Divide by zero"));

  bigint_t quotient(*this);
  bigint_t divisor(amt);

  mpz_mul_si(quotient.val, quotient.val, static_cast<long>(scale));
  if (mpz_sgn(divisor.val) < 0) {
    mpz_neg(divisor.val, divisor.val);
    mpz_neg(quotient.val, quotient.val);
  }
  round_div(quotient.val, quotient.val, divisor.val);
  return from_raw(quotient.val);
}

fixed_t fixed_t::round(const precision_t places) const
{
  if (places >= scale_digits)
    return *this;

  bigint_t raw(*this);
  bigint_t unit;
  power_of_ten(unit.val, scale_digits - places);

  round_div(raw.val, raw.val, unit.val);
  mpz_mul(raw.val, raw.val, unit.val);
  return from_raw(raw.val);
}

fixed_t::precision_t fixed_t::precision() const
{
  if (frac == 0)
    return 0;

  precision_t places = scale_digits;
  for (int64_t f = frac; f % 10 == 0; f /= 10)
    --places;
  return places;
}

void fixed_t::print(std::ostream& out,
                    const optional<precision_t>& places) const
{
  fixed_t value(places ? round(*places) : *this);
  fixed_t mag(value.abs());

  if (value.sign() < 0)
    out << '-';
  out << mag.int_part;

  precision_t digits = places ? *places : mag.precision();
  if (digits > scale_digits)
    digits = scale_digits;

  if (digits > 0) {
    std::ostringstream buf;
    buf << std::setw(scale_digits) << std::setfill('0') << mag.frac;
    out << '.' << buf.str().substr(0, digits);
  }
}

bool fixed_t::valid() const
{
  if (frac < 0 || frac >= scale) {
    DEBUG("tally.validate", "fixed_t: frac outside [0, scale)");
    return false;
  }
  return true;
}

} // namespace tally
