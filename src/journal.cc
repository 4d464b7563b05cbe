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

#include "journal.h"

namespace tally {

/*
 * Marks the span during which a line write is in progress.  Balance
 * deltas may only be applied inside it.
 */
struct line_write_t
{
  journal_t& journal;

  explicit line_write_t(journal_t& _journal) : journal(_journal) {
    if (journal.writing_lines)
      throw_(invariant_violation, _("Nested line writes are not allowed"));
    journal.writing_lines = true;
  }
  ~line_write_t() {
    journal.writing_lines = false;
  }
};

journal_t::journal_t()
  : next_currency_id(1), next_wallet_id(1), next_account_id(1),
    next_counterparty_id(1), next_budget_id(1), writing_lines(false)
{
}

currency_t& journal_t::add_currency(const string&                 code,
                                    const string&                 symbol,
                                    const currency_t::precision_t precision,
                                    const currency_t::flags_t     flags)
{
  if (trim_copy(code).empty())
    throw_(store_error, _("A currency needs a code"));
  if (precision > fixed_t::scale_digits)
    throw_(store_error, _f("Currency %1% cannot have %2% decimal places")
           % code % int(precision));

  bool has_reference = false;
  for (const currencies_map::value_type& pair : currencies) {
    if (pair.second.code == code)
      throw_(store_error, _f("Currency %1% already exists") % code);
    if (pair.second.is_reference())
      has_reference = true;
  }
  if (has_reference && (flags & CURRENCY_REFERENCE))
    throw_(store_error, _("There is already a reference currency"));

  currency_id_t id = next_currency_id++;
  currency_t&   cur(currencies.insert
                    (currencies_map::value_type
                     (id, currency_t(id, code, symbol, precision, flags)))
                    .first->second);
  if (! has_reference)
    cur.add_flags(CURRENCY_REFERENCE);

  DEBUG("journal.currency", "Added currency " << code << " as " << id);
  return cur;
}

const currency_t& journal_t::payment_currency() const
{
  for (const currencies_map::value_type& pair : currencies)
    if (pair.second.has_flags(CURRENCY_PAYMENT_DEFAULT))
      return pair.second;
  return reference_currency();
}

wallet_t& journal_t::add_wallet(const string& name)
{
  wallet_id_t id     = next_wallet_id++;
  wallet_t&   wallet(wallets.insert(wallets_map::value_type
                                    (id, wallet_t(id, name))).first->second);
  if (wallets.size() == 1)
    wallet.add_flags(WALLET_DEFAULT);
  return wallet;
}

void journal_t::set_default_wallet(const wallet_id_t id)
{
  wallets_map::iterator i = wallets.find(id);
  if (i == wallets.end())
    throw_(store_error, _f("Unknown wallet %1%") % id);

  for (wallets_map::value_type& pair : wallets)
    pair.second.drop_flags(WALLET_DEFAULT);
  (*i).second.add_flags(WALLET_DEFAULT);
}

void journal_t::remove_wallet(const wallet_id_t id)
{
  wallets_map::iterator i = wallets.find(id);
  if (i == wallets.end())
    throw_(store_error, _f("Unknown wallet %1%") % id);

  for (const accounts_map::value_type& pair : accounts)
    if (pair.second.wallet == id)
      throw_(store_error, _f("Wallet '%1%' still holds accounts")
             % (*i).second.name);

  bool was_default = (*i).second.is_default();
  wallets.erase(i);
  if (was_default && ! wallets.empty())
    wallets.begin()->second.add_flags(WALLET_DEFAULT);
}

const wallet_t& journal_t::default_wallet() const
{
  for (const wallets_map::value_type& pair : wallets)
    if (pair.second.is_default())
      return pair.second;
  throw_(store_error, _("There are no wallets"));
  return wallets.begin()->second;
}

account_t& journal_t::add_account(const wallet_id_t        wallet,
                                  const currency_id_t      currency,
                                  const string&            name,
                                  const fixed_t&           initial,
                                  const account_t::flags_t flags)
{
  if (! find_wallet(wallet))
    throw_(store_error, _f("Unknown wallet %1%") % wallet);
  if (! find_currency(currency))
    throw_(store_error, _f("Unknown currency %1%") % currency);

  account_id_t id = next_account_id++;
  account_t&   acct(accounts.insert
                    (accounts_map::value_type
                     (id, account_t(id, wallet, currency, name, initial)))
                    .first->second);
  acct.set_flags(static_cast<account_t::flags_t>(flags & ~ACCOUNT_DEFAULT));

  if (! acct.is_shadow() &&
      ((flags & ACCOUNT_DEFAULT) || ! default_account(wallet)))
    set_default_account(id);

  if (initial.is_nonzero())
    currencies.find(currency)->second.observe(initial);

  DEBUG("journal.account", "Added account " << id << " '" << name
        << "' in wallet " << wallet);
  return acct;
}

void journal_t::set_default_account(const account_id_t id)
{
  accounts_map::iterator i = accounts.find(id);
  if (i == accounts.end())
    throw_(store_error, _f("Unknown account %1%") % id);
  if ((*i).second.is_shadow())
    throw_(store_error, _("A shadow account cannot be a default"));

  for (accounts_map::value_type& pair : accounts)
    if (pair.second.wallet == (*i).second.wallet)
      pair.second.drop_flags(ACCOUNT_DEFAULT);
  (*i).second.add_flags(ACCOUNT_DEFAULT);
}

void journal_t::remove_account(const account_id_t id)
{
  accounts_map::iterator i = accounts.find(id);
  if (i == accounts.end())
    throw_(store_error, _f("Unknown account %1%") % id);

  for (const xacts_map::value_type& pair : xacts)
    if (pair.second.references(id))
      throw_(store_error, _f("Account '%1%' still has lines")
             % (*i).second.name);

  wallet_id_t wallet      = (*i).second.wallet;
  bool        was_default = (*i).second.is_default();
  accounts.erase(i);

  if (was_default) {
    for (accounts_map::value_type& pair : accounts) {
      if (pair.second.wallet == wallet && ! pair.second.is_shadow()) {
        pair.second.add_flags(ACCOUNT_DEFAULT);
        break;
      }
    }
  }
}

optional<account_id_t> journal_t::default_account(const wallet_id_t wallet) const
{
  for (const accounts_map::value_type& pair : accounts)
    if (pair.second.wallet == wallet && pair.second.is_default())
      return pair.first;
  return none;
}

counterparty_t& journal_t::add_counterparty(const string&           name,
                                            const optional<string>& note)
{
  counterparty_id_t id = next_counterparty_id++;
  return counterparties.insert(counterparties_map::value_type
                               (id, counterparty_t(id, name, note)))
    .first->second;
}

budget_t& journal_t::add_budget(const tag_id_t tag,
                                const date_t&  start,
                                const date_t&  end,
                                const fixed_t& target)
{
  if (! tag_pool.find(tag))
    throw_(store_error, _f("Unknown tag %1%") % tag);

  budget_t budget(next_budget_id, tag, start, end, target);
  if (! budget.valid())
    throw_invalid("budget", _("A budget needs a non-empty window and a "
                              "non-negative target"));

  ++next_budget_id;
  return budgets.insert(budgets_map::value_type(budget.id, budget))
    .first->second;
}

void journal_t::remove_budget(const budget_id_t id)
{
  if (budgets.erase(id) == 0)
    throw_(store_error, _f("Unknown budget %1%") % id);
}

void journal_t::remove_tag(const tag_id_t id)
{
  const tag_t * tag = tag_pool.find(id);
  if (! tag)
    throw_(store_error, _f("Unknown tag %1%") % id);

  for (const xacts_map::value_type& pair : xacts)
    for (const line_t& line : pair.second.lines)
      if (line.tag == id)
        throw_(store_error, _f("Tag '%1%' is still used by transaction %2%")
               % tag->name % pair.first);

  for (const budgets_map::value_type& pair : budgets)
    if (pair.second.tag == id)
      throw_(store_error, _f("Tag '%1%' still has budget %2%")
             % tag->name % pair.first);

  tag_pool.remove(id);

  for (counterparties_map::value_type& pair : counterparties)
    pair.second.affinity.erase(id);
}

const currency_t * journal_t::find_currency(const currency_id_t id) const
{
  currencies_map::const_iterator i = currencies.find(id);
  return i == currencies.end() ? NULL : &(*i).second;
}

const wallet_t * journal_t::find_wallet(const wallet_id_t id) const
{
  wallets_map::const_iterator i = wallets.find(id);
  return i == wallets.end() ? NULL : &(*i).second;
}

const account_t * journal_t::find_account(const account_id_t id) const
{
  accounts_map::const_iterator i = accounts.find(id);
  return i == accounts.end() ? NULL : &(*i).second;
}

const counterparty_t *
journal_t::find_counterparty(const counterparty_id_t id) const
{
  counterparties_map::const_iterator i = counterparties.find(id);
  return i == counterparties.end() ? NULL : &(*i).second;
}

const currency_t& journal_t::reference_currency() const
{
  for (const currencies_map::value_type& pair : currencies)
    if (pair.second.is_reference())
      return pair.second;
  throw_(store_error, _("No reference currency has been defined"));
  return currencies.begin()->second;
}

const xact_t * journal_t::find_xact(const xact_id_t& id) const
{
  xacts_map::const_iterator i = xacts.find(id);
  return i == xacts.end() ? NULL : &(*i).second;
}

xacts_list journal_t::get_xacts_in_range(const datetime_t& begin,
                                         const datetime_t& end) const
{
  xacts_list result;
  for (const xacts_map::value_type& pair : xacts)
    if (pair.second.when >= begin && pair.second.when < end)
      result.push_back(&pair.second);

  std::stable_sort(result.begin(), result.end(),
                   [](const xact_t * left, const xact_t * right) {
                     return left->when < right->when;
                   });
  return result;
}

dated_lines_list
journal_t::get_lines_for_account_in_range(const account_id_t account,
                                          const datetime_t&  begin,
                                          const datetime_t&  end) const
{
  dated_lines_list result;
  for (const xact_t * xact : get_xacts_in_range(begin, end))
    for (const line_t& line : xact->lines)
      if (line.account == account)
        result.push_back(dated_line_t(xact, &line));
  return result;
}

void journal_t::apply_line_delta(const account_id_t account,
                                 const fixed_t&     delta)
{
  if (! writing_lines)
    throw_(invariant_violation,
           _f("Delta %1% for account %2% has no matching line write")
           % delta % account);

  accounts_map::iterator i = accounts.find(account);
  if (i == accounts.end())
    throw_(invariant_violation,
           _f("Delta %1% applied to unknown account %2%") % delta % account);

  (*i).second.balance += delta;
  DEBUG("journal.balance", "Account " << account << " moved by " << delta
        << " to " << (*i).second.balance);
}

void journal_t::check_lines(const lines_list& lines) const
{
  if (lines.empty())
    throw_(store_error, _("A transaction needs at least one line"));

  for (const line_t& line : lines) {
    if (! find_account(line.account))
      throw_(store_error, _f("Line references unknown account %1%")
             % line.account);
    if (! tag_pool.find(line.tag))
      throw_(store_error, _f("Line references unknown tag %1%") % line.tag);
    if (! line.valid())
      throw_(store_error, _f("Malformed line: %1%") % line);
  }
}

void journal_t::observe_precision(const lines_list& lines)
{
  for (const line_t& line : lines)
    currencies[get_account(line.account).currency].observe(line.amount);
}

void journal_t::apply_deltas(const account_deltas_t& deltas)
{
  for (const account_deltas_t::value_type& pair : deltas)
    apply_line_delta(pair.first, pair.second);
}

void journal_t::insert_xact(const xact_t& xact)
{
  if (xact.id.empty())
    throw_(store_error, _("A transaction needs an id"));
  if (xacts.count(xact.id))
    throw_(store_error, _f("Transaction %1% already exists") % xact.id);
  check_lines(xact.lines);

  account_deltas_t deltas(xact_deltas(lines_list(), xact.lines));
  {
    line_write_t write(*this);
    xacts.insert(xacts_map::value_type(xact.id, xact));
    apply_deltas(deltas);
  }
  observe_precision(xact.lines);

  DEBUG("journal.xact", "Inserted " << xact.id << " with "
        << xact.lines.size() << " line(s)");
  IF_VERIFY() {
    if (! valid())
      throw_(invariant_violation, _("Journal failed to verify after insert"));
  }
}

void journal_t::replace_xact(const xact_t& xact)
{
  xacts_map::iterator i = xacts.find(xact.id);
  if (i == xacts.end())
    throw_(store_error, _f("Unknown transaction %1%") % xact.id);
  check_lines(xact.lines);

  account_deltas_t deltas(xact_deltas((*i).second.lines, xact.lines));
  {
    line_write_t write(*this);
    (*i).second = xact;
    apply_deltas(deltas);
  }
  observe_precision(xact.lines);

  DEBUG("journal.xact", "Replaced " << xact.id << ", "
        << deltas.size() << " account(s) touched");
}

void journal_t::remove_xact(const xact_id_t& id)
{
  xacts_map::iterator i = xacts.find(id);
  if (i == xacts.end())
    throw_(store_error, _f("Unknown transaction %1%") % id);

  account_deltas_t deltas(xact_deltas((*i).second.lines, lines_list()));
  {
    line_write_t write(*this);
    xacts.erase(i);
    apply_deltas(deltas);
  }

  DEBUG("journal.xact", "Removed " << id);
}

const account_t&
journal_t::find_or_create_shadow_account(const wallet_id_t   wallet,
                                         const currency_id_t currency)
{
  for (const accounts_map::value_type& pair : accounts)
    if (pair.second.is_shadow() && pair.second.wallet == wallet &&
        pair.second.currency == currency)
      return pair.second;

  const currency_t& cur(get_currency(currency));
  DEBUG("journal.account", "Creating " << cur.code
        << " shadow account in wallet " << wallet);
  return add_account(wallet, currency, cur.code + " (shadow)", fixed_t(),
                     ACCOUNT_SHADOW);
}

const tag_t& journal_t::find_or_create_tag(const string&         name,
                                           const category_type_t type)
{
  return tag_pool.find_or_create(name, type);
}

optional<fixed_t> journal_t::latest_rate(const currency_id_t currency) const
{
  const currency_t * cur = find_currency(currency);
  if (cur && cur->is_reference())
    return fixed_t(1L);

  rates_map::const_iterator i = rates.find(currency);
  if (i == rates.end())
    return none;
  return (*i).second;
}

void journal_t::set_latest_rate(const currency_id_t currency,
                                const fixed_t&      rate)
{
  const currency_t& cur(get_currency(currency));
  if (rate.sign() <= 0)
    throw_(store_error, _f("Rate %1% for %2% must be positive")
           % rate % cur.code);

  if (cur.is_reference()) {
    DEBUG("journal.rates", "Ignoring a rate for the reference currency");
    return;
  }
  rates[currency] = rate;
  DEBUG("journal.rates", cur.code << " = " << rate);
}

bool journal_t::valid() const
{
  if (! tag_pool.valid())
    return false;

  std::size_t references = 0;
  for (const currencies_map::value_type& pair : currencies) {
    if (! pair.second.valid())
      return false;
    if (pair.second.is_reference())
      ++references;
  }
  if (! currencies.empty() && references != 1) {
    DEBUG("tally.validate", "journal_t: " << references
          << " reference currencies");
    return false;
  }

  std::size_t default_wallets = 0;
  for (const wallets_map::value_type& pair : wallets)
    if (pair.second.is_default())
      ++default_wallets;
  if (! wallets.empty() && default_wallets != 1) {
    DEBUG("tally.validate", "journal_t: " << default_wallets
          << " default wallets");
    return false;
  }

  std::map<account_id_t, fixed_t> derived;
  std::map<wallet_id_t, int>      default_accounts;

  for (const accounts_map::value_type& pair : accounts) {
    const account_t& acct(pair.second);
    if (! acct.valid())
      return false;
    if (! find_wallet(acct.wallet) || ! find_currency(acct.currency)) {
      DEBUG("tally.validate", "journal_t: account " << acct.id
            << " has a dangling wallet or currency");
      return false;
    }
    if (acct.is_default() && ++default_accounts[acct.wallet] > 1) {
      DEBUG("tally.validate", "journal_t: wallet " << acct.wallet
            << " has several default accounts");
      return false;
    }
    derived[acct.id] = acct.initial_balance;
  }

  for (const xacts_map::value_type& pair : xacts) {
    if (! pair.second.valid())
      return false;
    for (const line_t& line : pair.second.lines) {
      std::map<account_id_t, fixed_t>::iterator i = derived.find(line.account);
      if (i == derived.end()) {
        DEBUG("tally.validate", "journal_t: line in " << pair.first
              << " references unknown account " << line.account);
        return false;
      }
      if (! tag_pool.find(line.tag)) {
        DEBUG("tally.validate", "journal_t: line in " << pair.first
              << " references unknown tag " << line.tag);
        return false;
      }
      (*i).second += line.signed_amount();
    }
  }

  for (const budgets_map::value_type& pair : budgets) {
    if (! tag_pool.find(pair.second.tag)) {
      DEBUG("tally.validate", "journal_t: budget " << pair.first
            << " references unknown tag " << pair.second.tag);
      return false;
    }
  }

  for (const accounts_map::value_type& pair : accounts) {
    if (derived[pair.first] != pair.second.balance) {
      DEBUG("tally.validate", "journal_t: account " << pair.first
            << " balance " << pair.second.balance << " != derived "
            << derived[pair.first]);
      return false;
    }
  }
  return true;
}

} // namespace tally
