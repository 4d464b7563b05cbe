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

#include "builder.h"
#include "rates.h"

namespace tally {

namespace {
  struct build_visitor : public static_visitor<lines_list>
  {
    xact_builder_t& builder;

    explicit build_visitor(xact_builder_t& _builder) : builder(_builder) {}

    lines_list operator()(const income_intent_t& intent) const {
      return builder.build_income(intent);
    }
    lines_list operator()(const expense_intent_t& intent) const {
      return builder.build_expense(intent);
    }
    lines_list operator()(const transfer_intent_t& intent) const {
      return builder.build_transfer(intent);
    }
    lines_list operator()(const exchange_intent_t& intent) const {
      return builder.build_exchange(intent);
    }
    lines_list operator()(const adjustment_intent_t& intent) const {
      return builder.build_adjustment(intent);
    }
  };
}

xact_t xact_builder_t::build(const intent_t& intent,
                             const xact_header_t& header)
{
  if (header.counterparty && ! store.find_counterparty(*header.counterparty))
    throw_invalid("counterparty",
                  _f("Unknown counterparty %1%") % *header.counterparty);

  xact_t xact(xact_t::generate_id(), header);
  if (xact.when.is_not_a_date_time())
    xact.when = posix_time::second_clock::local_time();

  xact.lines = build_lines(intent);

  DEBUG("builder.xact", "Built " << intent_name(intent) << ' ' << xact.id
        << " with " << xact.lines.size() << " line(s)");
  return xact;
}

lines_list xact_builder_t::build_lines(const intent_t& intent)
{
  return apply_visitor(build_visitor(*this), intent);
}

fixed_t xact_builder_t::snapshot_rate(const currency_t& currency) const
{
  if (currency.is_reference())
    return fixed_t(1L);
  return rate_for(store, currency.id);
}

fixed_t xact_builder_t::addon_amount(const fixed_t&    base,
                                     const fixed_t&    percent,
                                     const currency_t& currency) const
{
  fixed_t amount = base.multiply(percent);
  return round_addons ? currency.round(amount) : amount;
}

const account_t& xact_builder_t::require_account(const char *       field,
                                                 const account_id_t id) const
{
  if (id == 0)
    throw_invalid(field, _("An account is required"));

  const account_t * acct = store.find_account(id);
  if (! acct)
    throw_invalid(field, _f("Unknown account %1%") % id);
  if (! store.find_currency(acct->currency))
    throw_invalid(field, _f("Account %1% has an unknown currency %2%")
                  % id % acct->currency);
  return *acct;
}

const tag_t& xact_builder_t::require_category(const char *   field,
                                              const tag_id_t id) const
{
  const tag_t * tag = store.find_tag(id);
  if (! tag)
    throw_invalid(field, _f("Unknown category %1%") % id);
  if (is_system_tag(id) || tag->is_common())
    throw_invalid(field, _f("'%1%' cannot be used as a category")
                  % tag->name);
  return *tag;
}

void xact_builder_t::require_positive(const char *   field,
                                      const fixed_t& amount) const
{
  if (amount.sign() <= 0)
    throw_invalid(field, _f("Amount must be greater than zero, not %1%")
                  % amount);
}

void xact_builder_t::require_non_negative(const char *             field,
                                          const optional<fixed_t>& amount) const
{
  if (amount && amount->sign() < 0)
    throw_invalid(field, _f("Amount cannot be negative: %1%") % *amount);
}

void xact_builder_t::add_fee(lines_list&              lines,
                             const account_t&         from,
                             const optional<fixed_t>& fee,
                             const fixed_t&           rate) const
{
  if (fee && fee->is_nonzero())
    lines.push_back(line_t(from.id, FEE_TAG, SIGN_MINUS, *fee, rate,
                           LINE_COMMON));
}

lines_list xact_builder_t::build_income(const income_intent_t& intent)
{
  const account_t& acct(require_account("account", intent.account));
  require_positive("amount", intent.amount);

  tag_id_t category = 0;
  if (intent.new_category) {
    if (trim_copy(intent.new_category->name).empty())
      throw_invalid("new_category", _("A new category needs a name"));
    category = store.find_or_create_tag(intent.new_category->name,
                                        intent.new_category->type).id;
    require_category("new_category", category);
  }
  else if (intent.category) {
    category = require_category("category", *intent.category).id;
  }
  else {
    throw_invalid("category", _("A category is required"));
    return lines_list();
  }

  lines_list lines;
  lines.push_back(line_t(acct.id, category, SIGN_PLUS, intent.amount,
                         snapshot_rate(store.get_currency(acct.currency))));
  return lines;
}

lines_list xact_builder_t::build_expense(const expense_intent_t& intent)
{
  const account_t& acct(require_account("account", intent.account));

  if (intent.splits.empty())
    throw_invalid("splits", _("An expense needs at least one category"));
  for (const split_t& split : intent.splits) {
    require_category("splits", split.tag);
    require_positive("splits", split.amount);
  }

  for (const addon_t& addon : intent.addons) {
    if (! store.find_tag(addon.tag))
      throw_invalid("addons", _f("Unknown add-on tag %1%") % addon.tag);
    if (! store.tags().is_common(addon.tag))
      throw_invalid("addons", _f("Tag %1% cannot be used as an add-on")
                    % addon.tag);
    require_non_negative("addons", addon.amount);
    require_non_negative("addons", addon.percent);
  }

  const currency_t& payer(store.get_currency(acct.currency));
  const currency_t* category = &payer;
  if (intent.category_currency) {
    category = store.find_currency(*intent.category_currency);
    if (! category)
      throw_invalid("category_currency",
                    _f("Unknown currency %1%") % *intent.category_currency);
  }
  const bool mixed = category->id != payer.id;

  fixed_t    base = intent.base();
  fixed_t    net  = base;
  lines_list addon_lines;

  for (const addon_t& addon : intent.addons) {
    if (addon.is_empty())
      continue;

    const sign_t sign = addon.tag == DISCOUNT_TAG ? SIGN_PLUS : SIGN_MINUS;
    line_t line(0, addon.tag, sign, fixed_t(), fixed_t(1L), LINE_COMMON);
    if (addon.is_percentage()) {
      line.amount    = addon_amount(base, *addon.percent, *category);
      line.pct_value = *addon.percent;
    } else {
      line.amount = *addon.amount;
    }

    if (sign == SIGN_PLUS)
      net -= line.amount;
    else
      net += line.amount;

    DEBUG("builder.expense", "Add-on " << line);
    addon_lines.push_back(line);
  }

  fixed_t          payer_rate    = snapshot_rate(payer);
  fixed_t          category_rate = snapshot_rate(*category);
  account_id_t     target        = acct.id;
  lines_list       lines;

  if (mixed) {
    if (! intent.paid_amount || intent.paid_amount->sign() <= 0)
      throw_invalid("paid_amount",
                    _f("The amount paid in %1% is required") % payer.code);
    if (net.sign() <= 0)
      throw_invalid("addons", _f("The expense total must be positive, not %1%")
                    % net);

    const fixed_t& paid(*intent.paid_amount);
    if (payer.is_reference())
      category_rate = realized_rate(paid, net);
    else if (category->is_reference())
      payer_rate = realized_rate(net, paid);

    target = store.find_or_create_shadow_account(acct.wallet,
                                                 category->id).id;

    DEBUG("builder.expense", "Paying " << paid << ' ' << payer.code
          << " for " << net << ' ' << category->code
          << " through shadow account " << target);

    lines.push_back(line_t(acct.id, EXCHANGE_TAG, SIGN_MINUS, paid,
                           payer_rate));
    lines.push_back(line_t(target, EXCHANGE_TAG, SIGN_PLUS, net,
                           category_rate));
  }
  else if (intent.paid_amount) {
    DEBUG("builder.expense", "Ignoring paid amount for a single currency");
  }

  for (const split_t& split : intent.splits)
    lines.push_back(line_t(target, split.tag, SIGN_MINUS, split.amount,
                           category_rate));

  for (line_t& line : addon_lines) {
    line.account = target;
    line.rate    = category_rate;
    lines.push_back(line);
  }
  return lines;
}

lines_list xact_builder_t::build_transfer(const transfer_intent_t& intent)
{
  const account_t& from(require_account("from", intent.from));
  if (intent.to == 0)
    throw_invalid("to", _("A destination account is required"));
  const account_t& to(require_account("to", intent.to));

  if (from.id == to.id)
    throw_invalid("to", _("Cannot transfer to the same account"));
  if (from.currency != to.currency)
    throw_invalid("to", _("A transfer needs accounts of the same currency; "
                          "use an exchange instead"));
  require_positive("amount", intent.amount);
  require_non_negative("fee", intent.fee);

  fixed_t rate = snapshot_rate(store.get_currency(from.currency));

  lines_list lines;
  lines.push_back(line_t(from.id, TRANSFER_TAG, SIGN_MINUS, intent.amount,
                         rate));
  lines.push_back(line_t(to.id, TRANSFER_TAG, SIGN_PLUS, intent.amount,
                         rate));
  add_fee(lines, from, intent.fee, rate);
  return lines;
}

lines_list xact_builder_t::build_exchange(const exchange_intent_t& intent)
{
  const account_t& from(require_account("from", intent.from));
  if (intent.to == 0)
    throw_invalid("to", _("A destination account is required"));
  const account_t& to(require_account("to", intent.to));

  if (from.id == to.id)
    throw_invalid("to", _("Cannot exchange into the same account"));
  if (from.currency == to.currency)
    throw_invalid("to", _("An exchange needs accounts of different "
                          "currencies; use a transfer instead"));
  require_positive("amount", intent.amount);
  require_positive("received", intent.received);
  require_non_negative("fee", intent.fee);

  const currency_t& from_cur(store.get_currency(from.currency));
  const currency_t& to_cur(store.get_currency(to.currency));

  fixed_t from_rate = snapshot_rate(from_cur);
  fixed_t to_rate   = snapshot_rate(to_cur);
  if (from_cur.is_reference())
    to_rate = realized_rate(intent.amount, intent.received);
  else if (to_cur.is_reference())
    from_rate = realized_rate(intent.received, intent.amount);

  DEBUG("builder.exchange", intent.amount << ' ' << from_cur.code << " @ "
        << from_rate << " -> " << intent.received << ' ' << to_cur.code
        << " @ " << to_rate);

  lines_list lines;
  lines.push_back(line_t(from.id, EXCHANGE_TAG, SIGN_MINUS, intent.amount,
                         from_rate));
  lines.push_back(line_t(to.id, EXCHANGE_TAG, SIGN_PLUS, intent.received,
                         to_rate));
  add_fee(lines, from, intent.fee, from_rate);
  return lines;
}

lines_list xact_builder_t::build_adjustment(const adjustment_intent_t& intent)
{
  const account_t& acct(require_account("account", intent.account));

  if (intent.kind != ADJUSTMENT_TAG && intent.kind != INITIAL_TAG)
    throw_invalid("kind", _f("Tag %1% is not an adjustment kind")
                  % intent.kind);
  if (intent.delta.is_zero())
    throw_invalid("delta", _("The adjustment does not change the balance"));

  lines_list lines;
  lines.push_back(line_t(acct.id, intent.kind,
                         intent.delta.sign() > 0 ? SIGN_PLUS : SIGN_MINUS,
                         intent.delta.abs(),
                         snapshot_rate(store.get_currency(acct.currency))));
  return lines;
}

adjustment_intent_t adjustment_to(const store_t&     store,
                                  const account_id_t account,
                                  const fixed_t&     target,
                                  const tag_id_t     kind)
{
  const account_t * acct = store.find_account(account);
  if (! acct)
    throw_invalid("account", _f("Unknown account %1%") % account);
  return adjustment_intent_t(account, target - acct->balance, kind);
}

} // namespace tally
