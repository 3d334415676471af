//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_SLOT_STATUS_HPP
#define TLM_SLOT_STATUS_HPP

#include <tlm/config.hpp>
//
#include <tlm/location.hpp>
#include <tlm/optional.hpp>
#include <tlm/volume.hpp>

#include <map>
#include <ostream>
#include <vector>

namespace tlm {

/** \brief One element reported by Changer::status().
 */
struct Slot {
  i64 addr = 0;
  SlotCategory category = SlotCategory::kStorage;

  // The media currently in the slot, or None if it is empty.  Only `serial` is meaningful; changers
  // know nothing about inventory categories or flags.
  //
  Optional<Volume> volume;

  Location location() const
  {
    return Location{this->addr, this->category};
  }
};

// The slots of a library grouped by category, each group in ascending address order.
//
using SlotStatus = std::map<SlotCategory, std::vector<Slot>>;

std::ostream& operator<<(std::ostream& out, const Slot& t);

}  // namespace tlm

#endif  // TLM_SLOT_STATUS_HPP
