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

#include "tag.h"

namespace tally {

namespace {
  struct system_tag_seed_t {
    system_tag_t   id;
    const char *   name;
    tag_t::flags_t flags;
    bool           under_expense;
  };

  const system_tag_seed_t system_tag_seeds[] = {
    { DEFAULT_TAG,    "Default",         TAG_PROTECTED,              false },
    { INITIAL_TAG,    "Initial balance", TAG_PROTECTED,              false },
    { FIAT_TAG,       "Fiat",            TAG_PROTECTED,              false },
    { CRYPTO_TAG,     "Crypto",          TAG_PROTECTED,              false },
    { TRANSFER_TAG,   "Transfer",        TAG_PROTECTED,              false },
    { EXCHANGE_TAG,   "Exchange",        TAG_PROTECTED,              false },
    { INCOME_TAG,     "Income",          TAG_PROTECTED,              false },
    { EXPENSE_TAG,    "Expense",         TAG_PROTECTED,              false },
    { FEE_TAG,        "Fee",             TAG_PROTECTED | TAG_COMMON, true  },
    { DISCOUNT_TAG,   "Discount",        TAG_PROTECTED | TAG_COMMON, true  },
    { ARCHIVED_TAG,   "Archived",        TAG_PROTECTED,              false },
    { ADJUSTMENT_TAG, "Adjustment",      TAG_PROTECTED,              false }
  };
}

tag_pool_t::tag_pool_t() : next_id(last_system_tag + 1)
{
  tags.insert(tags_map::value_type
              (SYSTEM_TAG, tag_t(SYSTEM_TAG, "System", tag_ids_set(),
                                 TAG_PROTECTED)));

  for (const system_tag_seed_t& seed : system_tag_seeds) {
    tag_ids_set parents;
    parents.insert(SYSTEM_TAG);
    if (seed.under_expense)
      parents.insert(EXPENSE_TAG);
    tags.insert(tags_map::value_type
                (seed.id, tag_t(seed.id, seed.name, parents, seed.flags)));
  }

  tag_ids_set addon_parents;
  addon_parents.insert(SYSTEM_TAG);
  addon_parents.insert(EXPENSE_TAG);

  create("Tips", addon_parents, TAG_COMMON | TAG_PROTECTED);
  create("VAT",  addon_parents, TAG_COMMON | TAG_PROTECTED);
}

tag_t& tag_pool_t::create(const string&        name,
                          const tag_ids_set&   parents,
                          const tag_t::flags_t flags)
{
  if (trim_copy(name).empty())
    throw_invalid("name", _("A tag needs a name"));
  if (find(name))
    throw_invalid("name", _f("A tag named '%1%' already exists") % name);

  for (tag_id_t parent : parents)
    if (! find(parent))
      throw_invalid("parents", _f("Unknown parent tag %1%") % parent);

  tag_id_t id = next_id++;
  DEBUG("tag.create", "Creating tag " << id << " '" << name << "'");

  return tags.insert(tags_map::value_type
                     (id, tag_t(id, name, parents, flags))).first->second;
}

tag_t * tag_pool_t::find(const tag_id_t id)
{
  tags_map::iterator i = tags.find(id);
  return i == tags.end() ? NULL : &(*i).second;
}

const tag_t * tag_pool_t::find(const tag_id_t id) const
{
  tags_map::const_iterator i = tags.find(id);
  return i == tags.end() ? NULL : &(*i).second;
}

const tag_t * tag_pool_t::find(const string& name) const
{
  string key = lowered(trim_copy(name));
  for (const tags_map::value_type& pair : tags)
    if (lowered(pair.second.name) == key)
      return &pair.second;
  return NULL;
}

tag_t& tag_pool_t::find_or_create(const string&         name,
                                  const category_type_t type)
{
  if (const tag_t * existing = find(name))
    return *find(existing->id);
  return create(trim_copy(name), parents_for(type));
}

void tag_pool_t::rename(const tag_id_t id, const string& name)
{
  tag_t * tag = find(id);
  if (! tag)
    throw_(store_error, _f("Unknown tag %1%") % id);
  if (tag->has_flags(TAG_PROTECTED))
    throw_invalid("name", _f("Tag '%1%' cannot be renamed") % tag->name);
  if (trim_copy(name).empty())
    throw_invalid("name", _("A tag needs a name"));

  const tag_t * other = find(name);
  if (other && other->id != id)
    throw_invalid("name", _f("A tag named '%1%' already exists") % name);

  tag->name = trim_copy(name);
}

void tag_pool_t::add_parent(const tag_id_t id, const tag_id_t parent)
{
  tag_t * tag = find(id);
  if (! tag)
    throw_(store_error, _f("Unknown tag %1%") % id);
  if (! find(parent))
    throw_invalid("parents", _f("Unknown parent tag %1%") % parent);
  if (parent == id || has_ancestor(parent, id))
    throw_invalid("parents",
                  _f("Parenting '%1%' under tag %2% would form a cycle")
                  % tag->name % parent);

  tag->parents.insert(parent);
}

void tag_pool_t::remove(const tag_id_t id)
{
  tag_t * tag = find(id);
  if (! tag)
    throw_(store_error, _f("Unknown tag %1%") % id);
  if (is_system_tag(id) || tag->has_flags(TAG_PROTECTED))
    throw_invalid("tag", _f("Tag '%1%' cannot be removed") % tag->name);

  for (tags_map::value_type& pair : tags)
    pair.second.parents.erase(id);
  tags.erase(id);
}

bool tag_pool_t::has_ancestor(const tag_id_t id, const tag_id_t ancestor) const
{
  std::vector<tag_id_t> pending;
  tag_ids_set           seen;

  pending.push_back(id);
  while (! pending.empty()) {
    const tag_t * tag = find(pending.back());
    pending.pop_back();
    if (! tag)
      continue;

    for (tag_id_t parent : tag->parents) {
      if (parent == ancestor)
        return true;
      if (seen.insert(parent).second)
        pending.push_back(parent);
    }
  }
  return false;
}

tag_ids_set tag_pool_t::with_descendants(const tag_id_t id) const
{
  tag_ids_set result;
  for (const tags_map::value_type& pair : tags)
    if (pair.first == id || has_ancestor(pair.first, id))
      result.insert(pair.first);
  return result;
}

bool tag_pool_t::is_common(const tag_id_t id) const
{
  const tag_t * tag = find(id);
  return tag && tag->is_common();
}

bool tag_pool_t::is_income_category(const tag_id_t id) const
{
  return ! is_system_tag(id) && has_ancestor(id, INCOME_TAG);
}

bool tag_pool_t::is_expense_category(const tag_id_t id) const
{
  return ! is_system_tag(id) && has_ancestor(id, EXPENSE_TAG);
}

std::vector<tag_id_t> tag_pool_t::categories(const category_type_t type) const
{
  std::vector<tag_id_t> result;
  for (const tags_map::value_type& pair : tags) {
    if (is_system_tag(pair.first) || pair.second.is_common())
      continue;

    bool income  = is_income_category(pair.first);
    bool expense = is_expense_category(pair.first);
    switch (type) {
    case CATEGORY_INCOME:
      if (income)
        result.push_back(pair.first);
      break;
    case CATEGORY_EXPENSE:
      if (expense)
        result.push_back(pair.first);
      break;
    case CATEGORY_BOTH:
      if (income && expense)
        result.push_back(pair.first);
      break;
    }
  }
  return result;
}

tag_ids_set tag_pool_t::parents_for(const category_type_t type)
{
  tag_ids_set parents;
  if (type == CATEGORY_INCOME || type == CATEGORY_BOTH)
    parents.insert(INCOME_TAG);
  if (type == CATEGORY_EXPENSE || type == CATEGORY_BOTH)
    parents.insert(EXPENSE_TAG);
  return parents;
}

bool tag_pool_t::valid() const
{
  if (! find(SYSTEM_TAG) || ! find(INCOME_TAG) || ! find(EXPENSE_TAG)) {
    DEBUG("tally.validate", "tag_pool_t: a system tag is missing");
    return false;
  }

  for (const tags_map::value_type& pair : tags) {
    if (pair.first != pair.second.id) {
      DEBUG("tally.validate", "tag_pool_t: id mismatch for " << pair.first);
      return false;
    }
    for (tag_id_t parent : pair.second.parents) {
      if (! find(parent)) {
        DEBUG("tally.validate", "tag_pool_t: dangling parent " << parent);
        return false;
      }
    }
    if (has_ancestor(pair.first, pair.first)) {
      DEBUG("tally.validate", "tag_pool_t: cycle through " << pair.first);
      return false;
    }
  }
  return true;
}

} // namespace tally
