//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_VOLUME_CATEGORY_HPP
#define TLM_VOLUME_CATEGORY_HPP

#include <tlm/config.hpp>
//
#include <tlm/status.hpp>

#include <array>
#include <ostream>
#include <string_view>

namespace tlm {

/** \brief The lifecycle state of a volume.
 *
 * The normal write path is Scratch/Filling -> Allocating (alloc) -> Allocated (loaded for write) ->
 * Filling or Full.  Missing, Damaged and Cleaning are only ever entered by operator action.
 */
enum struct VolumeCategory {
  kUnknown = 0,
  kAllocating = 1,
  kAllocated = 2,
  kScratch = 3,
  kFilling = 4,
  kFull = 5,
  kMissing = 6,
  kDamaged = 7,
  kCleaning = 8,
};

constexpr std::array<VolumeCategory, 9> kAllVolumeCategories = {
    VolumeCategory::kUnknown,  VolumeCategory::kAllocating, VolumeCategory::kAllocated,
    VolumeCategory::kScratch,  VolumeCategory::kFilling,    VolumeCategory::kFull,
    VolumeCategory::kMissing,  VolumeCategory::kDamaged,    VolumeCategory::kCleaning,
};

/** \brief Returns the canonical lowercase name ("unknown", "allocating", ...).
 */
std::string_view to_string(VolumeCategory category);

/** \brief Inverse of to_string; an unrecognized name fails with StatusCode::kInvalidCategory.
 */
StatusOr<VolumeCategory> parse_volume_category(std::string_view name);

/** \brief Returns true iff an operator update may move a volume from category `from` to `to`.
 */
bool is_valid_category_transition(VolumeCategory from, VolumeCategory to);

/** \brief Returns true for the categories `alloc` may hand out (Filling and Scratch).
 */
inline bool is_allocatable(VolumeCategory category)
{
  return category == VolumeCategory::kFilling || category == VolumeCategory::kScratch;
}

std::ostream& operator<<(std::ostream& out, VolumeCategory t);

}  // namespace tlm

#endif  // TLM_VOLUME_CATEGORY_HPP
