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

#include "intent.h"

namespace tally {

namespace {
  struct intent_name_visitor : public static_visitor<const char *>
  {
    const char * operator()(const income_intent_t&) const {
      return "income";
    }
    const char * operator()(const expense_intent_t&) const {
      return "expense";
    }
    const char * operator()(const transfer_intent_t&) const {
      return "transfer";
    }
    const char * operator()(const exchange_intent_t&) const {
      return "exchange";
    }
    const char * operator()(const adjustment_intent_t&) const {
      return "adjustment";
    }
  };

  void print_optional(std::ostream& out, const char * name,
                      const optional<fixed_t>& amount)
  {
    if (amount)
      out << ' ' << name << '=' << *amount;
  }

  struct intent_printer : public static_visitor<>
  {
    std::ostream& out;

    explicit intent_printer(std::ostream& _out) : out(_out) {}

    void operator()(const income_intent_t& intent) const {
      out << "income account=" << intent.account
          << " amount=" << intent.amount;
      if (intent.category)
        out << " category=" << *intent.category;
      if (intent.new_category)
        out << " new_category='" << intent.new_category->name << "'";
    }

    void operator()(const expense_intent_t& intent) const {
      out << "expense account=" << intent.account;
      for (const split_t& split : intent.splits)
        out << " split(" << split.tag << ", " << split.amount << ')';
      for (const addon_t& addon : intent.addons) {
        out << " addon(" << addon.tag;
        print_optional(out, "amount", addon.amount);
        print_optional(out, "percent", addon.percent);
        out << ')';
      }
      if (intent.category_currency)
        out << " currency=" << *intent.category_currency;
      print_optional(out, "paid", intent.paid_amount);
    }

    void operator()(const transfer_intent_t& intent) const {
      out << "transfer " << intent.from << " -> " << intent.to
          << " amount=" << intent.amount;
      print_optional(out, "fee", intent.fee);
    }

    void operator()(const exchange_intent_t& intent) const {
      out << "exchange " << intent.from << " -> " << intent.to
          << " amount=" << intent.amount
          << " received=" << intent.received;
      print_optional(out, "fee", intent.fee);
    }

    void operator()(const adjustment_intent_t& intent) const {
      out << (intent.kind == INITIAL_TAG ? "initial" : "adjustment")
          << " account=" << intent.account << " delta=" << intent.delta;
    }
  };
}

const char * intent_name(const intent_t& intent)
{
  return apply_visitor(intent_name_visitor(), intent);
}

std::ostream& operator<<(std::ostream& out, const intent_t& intent)
{
  apply_visitor(intent_printer(out), intent);
  return out;
}

} // namespace tally
