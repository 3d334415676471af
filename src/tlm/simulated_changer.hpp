//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_SIMULATED_CHANGER_HPP
#define TLM_SIMULATED_CHANGER_HPP

#include <tlm/config.hpp>
//
#include <tlm/changer.hpp>
#include <tlm/config_options.hpp>
#include <tlm/optional.hpp>
#include <tlm/volume.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace tlm {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
struct SimulatedChangerOptions {
  // The number of slots of each kind; addresses are numbered from 1.
  //
  i64 storage_slots = kDefaultSimulatedStorageSlots;
  i64 transfer_slots = kDefaultSimulatedTransferSlots;
  i64 import_export_slots = kDefaultSimulatedImportExportSlots;

  /** \brief Reads the optional keys `storage-slots`, `transfer-slots` and `import-export-slots`;
   * any other key is rejected.
   */
  static StatusOr<SimulatedChangerOptions> from_config(const ConfigOptions& options);
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief An in-memory model of a tape library, used for testing and dry runs.
 *
 * The simulation tracks which cartridge sits in which slot, so status() always reports the
 * (simulated) physical truth and moves fail the way a real robot would when the source is empty or
 * the destination is full.  Tests can make the next move fail via `inject_failure`; a failed move
 * never changes the simulated contents.
 */
class SimulatedChanger : public Changer
{
 public:
  static StatusOr<std::unique_ptr<Changer>> make(const ConfigOptions& options);

  explicit SimulatedChanger(const SimulatedChangerOptions& options) noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Changer interface.

  StatusOr<SlotStatus> status() override;

  Status load(const Location& src, const Location& dst) override;

  Status unload(const Location& src, const Location& dst) override;

  Status transfer(const Location& src, const Location& dst) override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Simulation control.

  /** \brief Places a cartridge in an empty slot, as an operator would by hand.
   */
  Status insert(const Location& location, const VolumeSerial& serial);

  /** \brief Takes whatever is in `location` out of the library; returns the removed serial.
   */
  Optional<VolumeSerial> remove(const Location& location);

  /** \brief Returns the serial of the cartridge in `location`, or None if the slot is empty or
   * unknown.
   */
  Optional<VolumeSerial> contents(const Location& location) const;

  /** \brief Makes the next move operation fail with `status` (which must not be ok) without
   * changing the simulated contents.
   */
  void inject_failure(Status status);

  /** \brief The number of successful moves performed so far.
   */
  usize move_count() const;

 private:
  /** \brief Shared implementation of all three moves, after the per-operation precondition check.
   */
  Status move(const char* op_name, const Location& src, const Location& dst);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  mutable std::mutex mutex_;

  // Every known slot, mapped to the cartridge it holds (None if empty).
  //
  std::map<Location, Optional<VolumeSerial>> slots_;

  // If set, the next move fails with this status.
  //
  Optional<Status> pending_failure_;

  usize move_count_ = 0;
};

}  // namespace tlm

#endif  // TLM_SIMULATED_CHANGER_HPP
