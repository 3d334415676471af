//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/slot_status.hpp>
//

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Slot& t)
{
  out << "Slot{.location=" << t.location() << ", .volume=";
  if (t.volume) {
    out << t.volume->serial;
  } else {
    out << "(empty)";
  }
  return out << ",}";
}

}  // namespace tlm
