//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_VOLUME_HPP
#define TLM_VOLUME_HPP

#include <tlm/config.hpp>
//
#include <tlm/location.hpp>
#include <tlm/optional.hpp>
#include <tlm/status.hpp>
#include <tlm/volume_category.hpp>
#include <tlm/volume_flags.hpp>

#include <ostream>
#include <string>

namespace tlm {

// The volume serial number (VOLSER) of a cartridge.
//
using VolumeSerial = std::string;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief The inventory record of one tape cartridge.
 */
struct Volume {
  // Primary key; never changes once the volume is registered.
  //
  VolumeSerial serial;

  // Where the volume physically sits, or None while the changer is moving it.
  //
  Optional<Location> location;

  // The slot a mounted volume returns to when it is unloaded without an explicit destination.
  //
  Optional<Location> home;

  VolumeCategory category = VolumeCategory::kUnknown;

  VolumeFlags flags;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  bool is_in_transit() const
  {
    return !this->location;
  }

  bool is_mounted() const
  {
    return this->flags.test(VolumeFlag::kMounted);
  }
};

bool operator==(const Volume& l, const Volume& r);

inline bool operator!=(const Volume& l, const Volume& r)
{
  return !(l == r);
}

/** \brief Returns true iff both locations are absent, or both are present and equal.
 */
bool same_location(const Optional<Location>& l, const Optional<Location>& r);

/** \brief Checks the flag invariants of a single record: a volume may only be Mounted while it sits
 * in a transfer slot (or is in transit); fails with StatusCode::kInvalidVolumeState otherwise.
 */
Status check_volume_invariants(const Volume& volume);

/** \brief Prints `[SERIAL category (loc: L) (home: H) (flags: F)]`.
 */
std::ostream& operator<<(std::ostream& out, const Volume& t);

}  // namespace tlm

#endif  // TLM_VOLUME_HPP
