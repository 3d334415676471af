//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/volume_flags.hpp>
//

#include <batteries/assert.hpp>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string_view to_string(VolumeFlag flag)
{
  switch (flag) {
    case VolumeFlag::kTransfering:
      return "transfering";
    case VolumeFlag::kMounted:
      return "mounted";
    case VolumeFlag::kNeedsCleaning:
      return "needs-cleaning";
    case VolumeFlag::kFormatted:
      return "formatted";
  }
  BATT_PANIC() << "bad VolumeFlag value: " << static_cast<u32>(flag);
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string VolumeFlags::to_string() const
{
  std::string out;
  for (VolumeFlag flag : kAllVolumeFlags) {
    if (this->test(flag)) {
      if (!out.empty()) {
        out += ",";
      }
      out += ::tlm::to_string(flag);
    }
  }
  if (out.empty()) {
    out = "none";
  }
  return out;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const VolumeFlags& t)
{
  return out << t.to_string();
}

}  // namespace tlm
