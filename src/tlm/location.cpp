//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/location.hpp>
//

#include <batteries/assert.hpp>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string_view to_string(SlotCategory category)
{
  switch (category) {
    case SlotCategory::kStorage:
      return "storage";
    case SlotCategory::kTransfer:
      return "transfer";
    case SlotCategory::kImportExport:
      return "import-export";
    case SlotCategory::kCleaning:
      return "cleaning";
  }
  BATT_PANIC() << "bad SlotCategory value: " << static_cast<int>(category);
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<SlotCategory> parse_slot_category(std::string_view name)
{
  for (SlotCategory category : kAllSlotCategories) {
    if (to_string(category) == name) {
      return category;
    }
  }
  return make_status(StatusCode::kInvalidSlotCategory);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, SlotCategory t)
{
  return out << to_string(t);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Location& t)
{
  return out << "(" << t.addr << ", " << t.category << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Optional<Location>& t)
{
  if (!t) {
    return out << "null";
  }
  return out << *t;
}

}  // namespace tlm
