//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_CHANGER_HPP
#define TLM_CHANGER_HPP

#include <tlm/config.hpp>
//
#include <tlm/location.hpp>
#include <tlm/slot_status.hpp>
#include <tlm/status.hpp>

namespace tlm {

/** \brief A media changer: the robot that moves cartridges between the slots of a library.
 *
 * All operations are synchronous and block for the duration of the mechanical move.  A failed move
 * must leave the physical state exactly as it was before the call.  Implementations know nothing
 * about the inventory; the Inventory is the only component that calls the move operations on behalf
 * of a volume state transition.
 *
 * Only one move should be in flight per physical device at a time; serializing moves against the
 * same device is the responsibility of the caller (or of the implementation).
 */
class Changer
{
 public:
  Changer(const Changer&) = delete;
  Changer& operator=(const Changer&) = delete;

  virtual ~Changer() = default;

  /** \brief Enumerates every slot the device knows about, with the media it holds.  Reflects the
   * physical state at the time of the call.
   */
  virtual StatusOr<SlotStatus> status() = 0;

  /** \brief Moves media from a storage or import/export slot `src` into the transfer slot `dst`.
   */
  virtual Status load(const Location& src, const Location& dst) = 0;

  /** \brief Moves media from the transfer slot `src` back to `dst`.
   */
  virtual Status unload(const Location& src, const Location& dst) = 0;

  /** \brief Moves media between two non-transfer slots without involving a drive.
   */
  virtual Status transfer(const Location& src, const Location& dst) = 0;

 protected:
  Changer() = default;
};

}  // namespace tlm

#endif  // TLM_CHANGER_HPP
