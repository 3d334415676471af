//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/volume_category.hpp>
//

#include <batteries/assert.hpp>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string_view to_string(VolumeCategory category)
{
  switch (category) {
    case VolumeCategory::kUnknown:
      return "unknown";
    case VolumeCategory::kAllocating:
      return "allocating";
    case VolumeCategory::kAllocated:
      return "allocated";
    case VolumeCategory::kScratch:
      return "scratch";
    case VolumeCategory::kFilling:
      return "filling";
    case VolumeCategory::kFull:
      return "full";
    case VolumeCategory::kMissing:
      return "missing";
    case VolumeCategory::kDamaged:
      return "damaged";
    case VolumeCategory::kCleaning:
      return "cleaning";
  }
  BATT_PANIC() << "bad VolumeCategory value: " << static_cast<int>(category);
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeCategory> parse_volume_category(std::string_view name)
{
  for (VolumeCategory category : kAllVolumeCategories) {
    if (to_string(category) == name) {
      return category;
    }
  }
  return make_status(StatusCode::kInvalidCategory);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool is_valid_category_transition(VolumeCategory from, VolumeCategory to)
{
  if (from == to) {
    return true;
  }

  // Operators may always take a cartridge out of service.
  //
  if (to == VolumeCategory::kMissing || to == VolumeCategory::kDamaged ||
      to == VolumeCategory::kCleaning) {
    return true;
  }

  switch (from) {
    case VolumeCategory::kUnknown:
      return true;

    case VolumeCategory::kScratch:
    case VolumeCategory::kFilling:
      return to == VolumeCategory::kAllocating;

    case VolumeCategory::kAllocating:
      return to == VolumeCategory::kAllocated || to == VolumeCategory::kScratch ||
             to == VolumeCategory::kFilling;

    case VolumeCategory::kAllocated:
      return to == VolumeCategory::kFilling || to == VolumeCategory::kFull;

    case VolumeCategory::kMissing:
    case VolumeCategory::kDamaged:
      return to == VolumeCategory::kUnknown || to == VolumeCategory::kScratch;

    case VolumeCategory::kFull:
    case VolumeCategory::kCleaning:
      return false;
  }
  return false;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, VolumeCategory t)
{
  return out << to_string(t);
}

}  // namespace tlm
