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
 * @addtogroup math
 */

/**
 * @file   fixed.h
 * @author John Wiegley
 *
 * @ingroup math
 *
 * @brief Exact money arithmetic: fixed_t.
 *
 * A fixed_t is a pair {int_part, frac} where frac counts units of
 * 10^-18 and always lies in [0, 10^18).  The represented value is
 * int_part + frac / 10^18, so negative values use the floor
 * convention: -0.25 is stored as {-1, 750000000000000000}.
 *
 * Addition and subtraction are carried out directly on the pair.
 * Multiplication, division and rounding go through GMP integers, so
 * that no intermediate result is ever truncated before the final
 * rounding step.
 */
#pragma once

#include "utils.h"

namespace tally {

DECLARE_EXCEPTION(amount_error, std::runtime_error);

/**
 * @class fixed_t
 *
 * @brief Encapsulate an exact decimal amount with 18 fractional digits.
 */
class fixed_t
  : public ordered_field_operators<fixed_t,
           ordered_field_operators<fixed_t, long> >
{
public:
  typedef uint_least8_t precision_t;

  /** The number of frac units in one whole unit (10^18). */
  static const int64_t     scale;
  static const precision_t scale_digits = 18;

  int64_t int_part;
  int64_t frac;

  fixed_t() : int_part(0), frac(0) {}
  fixed_t(const long val) : int_part(val), frac(0) {}

  /**
   * Build an amount from its two components.  `_frac' must already lie
   * within [0, scale); an out of range fraction throws amount_error.
   */
  fixed_t(const int64_t _int_part, const int64_t _frac);

  /**
   * Construction from strings and doubles is always explicit.
   *
   * exact() parses a decimal literal such as "12.50", "-0.75" or
   * "1e-3" with no loss of precision.  Malformed input, or more than 18
   * fractional digits after the exponent is applied, throws
   * amount_error.
   *
   * from_double() first rounds `val' to 15 significant decimal digits,
   * which is what a double can faithfully carry, so that 0.1 becomes
   * exactly 0.1 rather than 0.1000000000000000055...
   */
  static fixed_t exact(const string& str);
  static fixed_t from_double(const double val);

  /**
   * Convert from and to the single-integer scaled representation, where
   * a value is stored as round(value * 10^places).  from_legacy is
   * lossless; to_legacy rounds half away from zero.
   */
  static fixed_t from_legacy(const int64_t scaled, const precision_t places);
  int64_t to_legacy(const precision_t places) const;

  double to_double() const;

  /*
   * Comparison.  With the floor convention, lexicographic order of
   * {int_part, frac} is numeric order.
   */
  int compare(const fixed_t& amt) const {
    if (int_part != amt.int_part)
      return int_part < amt.int_part ? -1 : 1;
    if (frac != amt.frac)
      return frac < amt.frac ? -1 : 1;
    return 0;
  }

  bool operator==(const fixed_t& amt) const {
    return int_part == amt.int_part && frac == amt.frac;
  }
  bool operator<(const fixed_t& amt) const {
    return compare(amt) < 0;
  }
  bool operator==(const long val) const {
    return int_part == val && frac == 0;
  }
  bool operator<(const long val) const {
    return int_part < val;
  }
  bool operator>(const long val) const {
    return int_part > val || (int_part == val && frac > 0);
  }

  /*
   * Binary arithmetic.  Only the in-place operators are defined here;
   * the rest come from boost::ordered_field_operators<>.
   */
  fixed_t& operator+=(const fixed_t& amt);
  fixed_t& operator-=(const fixed_t& amt);
  fixed_t& operator*=(const fixed_t& amt) {
    return *this = multiply(amt);
  }
  fixed_t& operator/=(const fixed_t& amt) {
    return *this = divide(amt);
  }

  /**
   * multiply() and divide() compute the exact rational result and round
   * it half away from zero to the nearest 10^-18.  Division by zero
   * throws amount_error.
   */
  fixed_t multiply(const fixed_t& amt) const;
  fixed_t divide(const fixed_t& amt) const;

  /*
   * Unary arithmetic.
   */
  fixed_t negated() const {
    if (frac == 0)
      return fixed_t(-int_part, 0);
    return fixed_t(-int_part - 1, scale - frac);
  }
  fixed_t operator-() const {
    return negated();
  }
  fixed_t abs() const {
    return int_part < 0 ? negated() : *this;
  }

  /** Round half away from zero to `places' fractional digits. */
  fixed_t round(const precision_t places) const;

  /** The number of fractional digits actually needed to print exactly. */
  precision_t precision() const;

  int sign() const {
    if (int_part < 0)
      return -1;
    return (int_part == 0 && frac == 0) ? 0 : 1;
  }
  bool is_zero() const {
    return int_part == 0 && frac == 0;
  }
  bool is_nonzero() const {
    return ! is_zero();
  }

  /**
   * Printing.  With `places' the value is rounded and padded to that
   * many digits; otherwise it is printed exactly, without trailing
   * zeroes.
   */
  void   print(std::ostream& out,
               const optional<precision_t>& places = none) const;
  string to_string(const optional<precision_t>& places = none) const {
    std::ostringstream buf;
    print(buf, places);
    return buf.str();
  }

  bool valid() const;
};

inline std::ostream& operator<<(std::ostream& out, const fixed_t& amt) {
  amt.print(out);
  return out;
}

} // namespace tally
