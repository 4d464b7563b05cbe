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
 * @addtogroup data
 */

/**
 * @file   tag.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Categories and the reserved system tags.
 *
 * Every line carries exactly one tag.  Tags form a directed acyclic
 * graph through their parent sets: a user category is parented under
 * INCOME_TAG, EXPENSE_TAG or both, and add-on tags (fees, tips, VAT,
 * discounts) carry TAG_COMMON.  Ids up to last_system_tag are reserved
 * for tags whose meaning the engine recognizes.
 */
#pragma once

#include "utils.h"
#include "flags.h"
#include "types.h"

namespace tally {

enum system_tag_t {
  SYSTEM_TAG     = 1,
  DEFAULT_TAG    = 2,
  INITIAL_TAG    = 3,
  FIAT_TAG       = 4,
  CRYPTO_TAG     = 5,
  TRANSFER_TAG   = 6,
  EXCHANGE_TAG   = 7,
  INCOME_TAG     = 9,
  EXPENSE_TAG    = 10,
  FEE_TAG        = 13,
  DISCOUNT_TAG   = 18,
  ARCHIVED_TAG   = 22,
  ADJUSTMENT_TAG = 23
};

const tag_id_t last_system_tag = ADJUSTMENT_TAG;

enum category_type_t {
  CATEGORY_INCOME,
  CATEGORY_EXPENSE,
  CATEGORY_BOTH
};

inline bool is_system_tag(const tag_id_t id) {
  return id >= SYSTEM_TAG && id <= last_system_tag;
}

class tag_t : public flags::supports_flags<>
{
public:
#define TAG_NORMAL    0x00
#define TAG_COMMON    0x01 // an add-on: fee, tip, VAT, discount
#define TAG_PROTECTED 0x02 // may not be renamed or removed

  tag_id_t    id;
  string      name;
  tag_ids_set parents;

  tag_t(const tag_id_t     _id      = 0,
        const string&      _name    = "",
        const tag_ids_set& _parents = tag_ids_set(),
        const flags_t      _flags   = TAG_NORMAL)
    : supports_flags<>(_flags), id(_id), name(_name), parents(_parents) {}

  bool has_parent(const tag_id_t parent) const {
    return parents.count(parent) > 0;
  }
  bool is_common() const {
    return has_flags(TAG_COMMON);
  }
};

/**
 * @brief The set of all known tags.
 *
 * A freshly constructed pool holds the system tags, plus "Tips" and
 * "VAT" as protected common expense tags.  User tags receive ids above
 * last_system_tag.
 */
class tag_pool_t
{
public:
  typedef std::map<tag_id_t, tag_t> tags_map;

  tags_map tags;
  tag_id_t next_id;

  tag_pool_t();

  tag_t& create(const string&      name,
                const tag_ids_set& parents,
                const tag_t::flags_t flags = TAG_NORMAL);

  tag_t *       find(const tag_id_t id);
  const tag_t * find(const tag_id_t id) const;

  /** Case-insensitive lookup by name. */
  const tag_t * find(const string& name) const;

  /**
   * Return the tag called `name', creating a category of the given type
   * if no such tag exists yet.  An existing tag is returned as is.
   */
  tag_t& find_or_create(const string& name, const category_type_t type);

  void rename(const tag_id_t id, const string& name);
  void add_parent(const tag_id_t id, const tag_id_t parent);
  void remove(const tag_id_t id);

  /** True if `ancestor' is reachable from `id' through parent links. */
  bool has_ancestor(const tag_id_t id, const tag_id_t ancestor) const;

  /** `id' itself or any tag that descends from it. */
  tag_ids_set with_descendants(const tag_id_t id) const;

  bool is_common(const tag_id_t id) const;
  bool is_income_category(const tag_id_t id) const;
  bool is_expense_category(const tag_id_t id) const;

  /** User categories of a type, excluding add-on tags, ordered by id. */
  std::vector<tag_id_t> categories(const category_type_t type) const;

  static tag_ids_set parents_for(const category_type_t type);

  bool valid() const;
};

} // namespace tally
