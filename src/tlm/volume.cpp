//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/volume.hpp>
//

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool same_location(const Optional<Location>& l, const Optional<Location>& r)
{
  if (!l || !r) {
    return !l && !r;
  }
  return *l == *r;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator==(const Volume& l, const Volume& r)
{
  return l.serial == r.serial                       //
         && same_location(l.location, r.location)  //
         && same_location(l.home, r.home)          //
         && l.category == r.category               //
         && l.flags == r.flags;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status check_volume_invariants(const Volume& volume)
{
  if (volume.is_mounted() && volume.location && !volume.location->is_transfer()) {
    return make_status(StatusCode::kInvalidVolumeState);
  }
  if (volume.flags.bits() & ~VolumeFlags::kAllBits) {
    return make_status(StatusCode::kInvalidVolumeState);
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Volume& t)
{
  return out << "[" << t.serial << " " << t.category << " (loc: " << t.location
             << ") (home: " << t.home << ") (flags: " << t.flags << ")]";
}

}  // namespace tlm
