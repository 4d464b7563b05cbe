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

#include "store.h"

namespace tally {

const currency_t& store_t::get_currency(const currency_id_t id) const
{
  const currency_t * cur = find_currency(id);
  if (! cur)
    throw_(store_error, _f("Unknown currency %1%") % id);
  return *cur;
}

const wallet_t& store_t::get_wallet(const wallet_id_t id) const
{
  const wallet_t * wallet = find_wallet(id);
  if (! wallet)
    throw_(store_error, _f("Unknown wallet %1%") % id);
  return *wallet;
}

const account_t& store_t::get_account(const account_id_t id) const
{
  const account_t * acct = find_account(id);
  if (! acct)
    throw_(store_error, _f("Unknown account %1%") % id);
  return *acct;
}

const counterparty_t&
store_t::get_counterparty(const counterparty_id_t id) const
{
  const counterparty_t * cp = find_counterparty(id);
  if (! cp)
    throw_(store_error, _f("Unknown counterparty %1%") % id);
  return *cp;
}

const tag_t& store_t::get_tag(const tag_id_t id) const
{
  const tag_t * tag = find_tag(id);
  if (! tag)
    throw_(store_error, _f("Unknown tag %1%") % id);
  return *tag;
}

const xact_t& store_t::get_xact(const xact_id_t& id) const
{
  const xact_t * xact = find_xact(id);
  if (! xact)
    throw_(store_error, _f("Unknown transaction %1%") % id);
  return *xact;
}

} // namespace tally
