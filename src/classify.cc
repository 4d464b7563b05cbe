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

#include "classify.h"

namespace tally {

namespace {
  bool is_addon(const line_t& line, const store_t& store)
  {
    return line.is_common() || store.tags().is_common(line.tag);
  }

  // A debited line that records spending on a category.
  bool is_category_debit(const line_t& line, const store_t& store)
  {
    return (line.sign == SIGN_MINUS &&
            line.tag != EXCHANGE_TAG &&
            line.tag != TRANSFER_TAG &&
            line.tag != FEE_TAG &&
            ! is_addon(line, store));
  }

  struct legs_t
  {
    const line_t *              out;
    const line_t *              in;
    optional<fixed_t>           fee;
    std::vector<const line_t *> rest;

    legs_t() : out(NULL), in(NULL) {}
  };

  /*
   * Pick the debited and credited `leg_tag' lines out of `lines'.  With
   * `collect_fee', FEE lines on the debited account are summed into
   * `fee'; everything else lands in `rest'.
   */
  legs_t split_legs(const lines_list& lines, const tag_id_t leg_tag,
                    const bool collect_fee)
  {
    legs_t legs;

    for (const line_t& line : lines) {
      if (line.tag != leg_tag)
        continue;
      if (line.sign == SIGN_MINUS && ! legs.out)
        legs.out = &line;
      else if (line.sign == SIGN_PLUS && ! legs.in)
        legs.in = &line;
    }

    for (const line_t& line : lines) {
      if (&line == legs.out || &line == legs.in)
        continue;
      if (collect_fee && legs.out && line.tag == FEE_TAG &&
          line.sign == SIGN_MINUS && line.account == legs.out->account) {
        legs.fee = legs.fee ? *legs.fee + line.amount : line.amount;
        continue;
      }
      legs.rest.push_back(&line);
    }
    return legs;
  }

  addon_t recover_addon(const line_t& line)
  {
    if (line.pct_value)
      return addon_t::percentage(line.tag, *line.pct_value);
    return addon_t::absolute(line.tag, line.amount);
  }

  editable_intent_t decompose_adjustment(const lines_list& lines,
                                         const tag_id_t    kind)
  {
    const line_t * found = NULL;
    for (const line_t& line : lines)
      if (line.tag == kind) {
        found = &line;
        break;
      }
    assert(found);

    if (lines.size() > 1)
      warning_(_f("Adjustment has %1% lines; only the first is shown")
               % lines.size());

    return editable_intent_t(adjustment_intent_t(found->account,
                                                 found->signed_amount(),
                                                 kind),
                             false, true);
  }

  editable_intent_t decompose_income(const std::vector<const line_t *>& lines,
                                     const store_t& store)
  {
    const line_t * category = NULL;
    for (const line_t * line : lines)
      if (line->sign == SIGN_PLUS && ! is_addon(*line, store)) {
        category = line;
        break;
      }
    if (! category)
      for (const line_t * line : lines)
        if (line->sign == SIGN_PLUS) {
          category = line;
          break;
        }

    if (! category) {
      warning_(_("Income without a credited line"));
      return editable_intent_t(income_intent_t(), false, true);
    }

    bool read_only = lines.size() > 1;
    if (read_only)
      warning_(_f("Income has %1% lines; only one is editable")
               % lines.size());

    return editable_intent_t(income_intent_t(category->account,
                                             category->amount,
                                             category->tag),
                             true, read_only);
  }

  editable_intent_t decompose_expense(const std::vector<const line_t *>& lines,
                                      const store_t&    store,
                                      expense_intent_t& intent,
                                      const account_id_t target)
  {
    bool lossy = false;

    for (const line_t * line : lines) {
      if (line->account != target) {
        DEBUG("classify.decompose", "Line on foreign account: " << *line);
        lossy = true;
      }
      if (is_addon(*line, store)) {
        intent.addons.push_back(recover_addon(*line));
      }
      else if (line->sign == SIGN_MINUS) {
        intent.splits.push_back(split_t(line->tag, line->amount));
      }
      else {
        DEBUG("classify.decompose", "Credited category line: " << *line);
        lossy = true;
      }
    }

    if (intent.splits.empty()) {
      DEBUG("classify.decompose", "Expense without a category line");
      lossy = true;
    }
    if (lossy)
      warning_(_("Expense lines do not fit the expense form; "
                 "showing it read-only"));

    bool simple = intent.splits.size() == 1;
    for (const addon_t& addon : intent.addons)
      if (! addon.is_percentage())
        simple = false;

    return editable_intent_t(intent, simple, lossy);
  }

  std::vector<const line_t *> all_lines(const lines_list& lines)
  {
    std::vector<const line_t *> result;
    for (const line_t& line : lines)
      result.push_back(&line);
    return result;
  }

  editable_intent_t decompose_by_sign(const lines_list& lines,
                                      const store_t&    store,
                                      const char *      reason)
  {
    warning_(_f("Cannot read %1% lines as built (%2%); "
                "treating them as income or expense") % lines.size() % reason);

    editable_intent_t result;
    if (lines.empty()) {
      result = editable_intent_t(expense_intent_t(), false, true);
    }
    else if (std::min_element(lines.begin(), lines.end(),
                              canonical_line_order)->sign == SIGN_PLUS) {
      result = decompose_income(all_lines(lines), store);
    }
    else {
      expense_intent_t intent(lines.front().account);
      for (const line_t& line : lines)
        if (is_category_debit(line, store)) {
          intent.account = line.account;
          break;
        }
      result = decompose_expense(all_lines(lines), store, intent,
                                 intent.account);
    }
    result.read_only = true;
    return result;
  }

  editable_intent_t decompose_transfer(const lines_list& lines,
                                       const store_t&    store)
  {
    legs_t legs(split_legs(lines, TRANSFER_TAG, true));
    if (! legs.out || ! legs.in)
      return decompose_by_sign(lines, store, "a transfer leg is missing");

    bool lossy = ! legs.rest.empty() || legs.out->amount != legs.in->amount;
    if (lossy)
      warning_(_("Transfer lines do not fit the transfer form"));

    return editable_intent_t(transfer_intent_t(legs.out->account,
                                               legs.in->account,
                                               legs.out->amount,
                                               legs.fee),
                             true, lossy);
  }

  editable_intent_t decompose_exchange(const lines_list& lines,
                                       const store_t&    store)
  {
    legs_t legs(split_legs(lines, EXCHANGE_TAG, true));
    if (! legs.out || ! legs.in)
      return decompose_by_sign(lines, store, "an exchange leg is missing");

    bool lossy = ! legs.rest.empty();
    if (lossy)
      warning_(_("Exchange lines do not fit the exchange form"));

    return editable_intent_t(exchange_intent_t(legs.out->account,
                                               legs.in->account,
                                               legs.out->amount,
                                               legs.in->amount,
                                               legs.fee),
                             true, lossy);
  }

  editable_intent_t decompose_multi_currency(const lines_list& lines,
                                             const store_t&    store)
  {
    legs_t legs(split_legs(lines, EXCHANGE_TAG, false));
    if (! legs.out || ! legs.in)
      return decompose_by_sign(lines, store, "an exchange leg is missing");

    expense_intent_t intent(legs.out->account);
    intent.paid_amount       = legs.out->amount;
    intent.category_currency = store.get_account(legs.in->account).currency;

    DEBUG("classify.decompose", "Multi-currency expense paid from "
          << intent.account << " through shadow " << legs.in->account);

    return decompose_expense(legs.rest, store, intent, legs.in->account);
  }
}

std::ostream& operator<<(std::ostream& out, const xact_mode_t& mode)
{
  switch (mode.kind) {
  case xact_mode_t::INCOME:
    out << "income";
    break;
  case xact_mode_t::EXPENSE:
    out << (mode.multi_currency ? "expense (multi-currency)" : "expense");
    break;
  case xact_mode_t::TRANSFER:
    out << "transfer";
    break;
  case xact_mode_t::EXCHANGE:
    out << "exchange";
    break;
  case xact_mode_t::SYSTEM:
    out << "system (" << mode.system_tag << ')';
    break;
  }
  return out;
}

xact_mode_t classify(const lines_list& lines, const store_t& store)
{
  bool        initial         = false;
  bool        adjustment      = false;
  bool        transfer        = false;
  bool        category_debit  = false;
  std::size_t exchange_legs   = 0;

  for (const line_t& line : lines) {
    switch (line.tag) {
    case INITIAL_TAG:
      initial = true;
      break;
    case ADJUSTMENT_TAG:
      adjustment = true;
      break;
    case EXCHANGE_TAG:
      ++exchange_legs;
      break;
    case TRANSFER_TAG:
      transfer = true;
      break;
    default:
      if (is_category_debit(line, store))
        category_debit = true;
      break;
    }
  }

  if (initial)
    return xact_mode_t::system(INITIAL_TAG);
  if (adjustment)
    return xact_mode_t::system(ADJUSTMENT_TAG);
  if (exchange_legs == 2 && category_debit)
    return xact_mode_t::expense(true);
  if (exchange_legs > 0)
    return xact_mode_t::exchange();
  if (transfer)
    return xact_mode_t::transfer();

  if (lines.empty()) {
    warning_(_("Classifying an empty line set as an expense"));
    return xact_mode_t::expense();
  }

  const line_t& first(*std::min_element(lines.begin(), lines.end(),
                                        canonical_line_order));
  return first.sign == SIGN_PLUS ? xact_mode_t::income()
                                 : xact_mode_t::expense();
}

editable_intent_t decompose(const lines_list& lines, const store_t& store)
{
  xact_mode_t mode = classify(lines, store);
  DEBUG("classify.decompose", "Decomposing " << lines.size()
        << " line(s) as " << mode);

  switch (mode.kind) {
  case xact_mode_t::SYSTEM:
    return decompose_adjustment(lines, mode.system_tag);

  case xact_mode_t::TRANSFER:
    return decompose_transfer(lines, store);

  case xact_mode_t::EXCHANGE:
    return decompose_exchange(lines, store);

  case xact_mode_t::EXPENSE:
    if (mode.multi_currency)
      return decompose_multi_currency(lines, store);
    else {
      expense_intent_t intent(lines.empty() ? 0 : lines.front().account);
      for (const line_t& line : lines)
        if (is_category_debit(line, store)) {
          intent.account = line.account;
          break;
        }
      return decompose_expense(all_lines(lines), store, intent,
                               intent.account);
    }

  case xact_mode_t::INCOME:
    return decompose_income(all_lines(lines), store);
  }

  return decompose_by_sign(lines, store, "unknown kind");
}

} // namespace tally
