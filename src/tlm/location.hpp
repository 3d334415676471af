//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_LOCATION_HPP
#define TLM_LOCATION_HPP

#include <tlm/config.hpp>
//
#include <tlm/int_types.hpp>
#include <tlm/optional.hpp>
#include <tlm/status.hpp>

#include <array>
#include <ostream>
#include <string_view>
#include <tuple>

namespace tlm {

/** \brief The kind of element a library slot address refers to.
 */
enum struct SlotCategory {
  kStorage = 0,
  kTransfer = 1,
  kImportExport = 2,
  kCleaning = 3,
};

/** \brief All slot categories, in the order they are reported by a changer status snapshot.
 */
constexpr std::array<SlotCategory, 4> kAllSlotCategories = {
    SlotCategory::kStorage,
    SlotCategory::kTransfer,
    SlotCategory::kImportExport,
    SlotCategory::kCleaning,
};

/** \brief Returns the canonical (persisted) name of the category: "storage", "transfer",
 * "import-export", or "cleaning".
 */
std::string_view to_string(SlotCategory category);

/** \brief Inverse of to_string; fails with StatusCode::kInvalidSlotCategory if `name` is not one of
 * the canonical names.
 */
StatusOr<SlotCategory> parse_slot_category(std::string_view name);

std::ostream& operator<<(std::ostream& out, SlotCategory t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief A physical position inside the library: a slot or drive element address plus the kind of
 * element it is.
 */
struct Location {
  i64 addr = 0;
  SlotCategory category = SlotCategory::kStorage;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  static Location storage(i64 addr)
  {
    return Location{addr, SlotCategory::kStorage};
  }

  static Location transfer(i64 addr)
  {
    return Location{addr, SlotCategory::kTransfer};
  }

  static Location import_export(i64 addr)
  {
    return Location{addr, SlotCategory::kImportExport};
  }

  bool is_transfer() const
  {
    return this->category == SlotCategory::kTransfer;
  }

  /** \brief Returns true for storage and import/export slots, the only places a volume can rest
   * when it is not mounted.
   */
  bool is_shelf() const
  {
    return this->category == SlotCategory::kStorage ||
           this->category == SlotCategory::kImportExport;
  }
};

inline bool operator==(const Location& l, const Location& r)
{
  return l.addr == r.addr && l.category == r.category;
}

inline bool operator!=(const Location& l, const Location& r)
{
  return !(l == r);
}

inline bool operator<(const Location& l, const Location& r)
{
  return std::make_tuple(l.category, l.addr) < std::make_tuple(r.category, r.addr);
}

std::ostream& operator<<(std::ostream& out, const Location& t);

/** \brief Prints `(addr, category)`, or `null` for an absent location.
 */
std::ostream& operator<<(std::ostream& out, const Optional<Location>& t);

}  // namespace tlm

#endif  // TLM_LOCATION_HPP
