//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_INVENTORY_HPP
#define TLM_INVENTORY_HPP

#include <tlm/config.hpp>
//
#include <tlm/changer.hpp>
#include <tlm/inventory_metrics.hpp>
#include <tlm/location.hpp>
#include <tlm/optional.hpp>
#include <tlm/path_name.hpp>
#include <tlm/status.hpp>
#include <tlm/volume.hpp>
#include <tlm/volume_store.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tlm {

enum struct MoveKind {
  kLoad,
  kUnload,
  kTransfer,
};

std::string_view to_string(MoveKind kind);

std::ostream& operator<<(std::ostream& out, MoveKind t);

/** \brief The committed intent of a move: what Phase 1 recorded and what Phase 2 must do.
 */
struct MoveIntent {
  MoveKind kind;
  VolumeSerial serial;

  // Where the volume was when the intent was committed.
  //
  Location src;

  // Where the changer is asked to put it.
  //
  Location dst;
};

std::ostream& operator<<(std::ostream& out, const MoveIntent& t);

/** \brief Result of Inventory::audit.
 */
struct AuditReport {
  // Serials seen for the first time.
  //
  usize added = 0;

  // Known volumes whose record had to change to match the library.
  //
  usize updated = 0;

  // Known volumes whose record already matched.
  //
  usize unchanged = 0;

  // Volumes not in the snapshot whose recorded slot turned out to hold a different cartridge; their
  // location is cleared.
  //
  usize displaced = 0;
};

inline bool operator==(const AuditReport& l, const AuditReport& r)
{
  return l.added == r.added && l.updated == r.updated && l.unchanged == r.unchanged &&
         l.displaced == r.displaced;
}

std::ostream& operator<<(std::ostream& out, const AuditReport& t);

struct InventoryOptions {
  // Used to name the metrics exported by this inventory.
  //
  std::string name = "default";

  // New serials starting with this prefix are registered as cleaning cartridges by audit.  An empty
  // prefix matches nothing.
  //
  std::string cleaning_prefix;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief The durable record of every volume in a tape library, and the only component that asks a
 * Changer to move media.
 *
 * Every move runs in three phases:
 *
 *  1. Lock & validate: in one store transaction, lock the volume row, check the move against the
 *     volume's current location, record the intent (Transfering set, location cleared) and commit.
 *  2. Physical action: call the Changer with no transaction open.
 *  3. Finalize: in a second transaction, record the destination and clear Transfering.
 *
 * If Phase 2 fails, the volume is left in transit (no location, Transfering set); the next audit
 * puts it back wherever the library says it is.  Phases 1 and 3 are exposed separately as
 * prepare_move and finalize_move for callers that drive the changer themselves.
 *
 * All member functions are safe to call concurrently.  Moves of different volumes proceed in
 * parallel; exclusive use of one physical device is the caller's responsibility.
 */
class Inventory
{
 public:
  using Metrics = InventoryMetrics;

  explicit Inventory(std::unique_ptr<VolumeStore> store, const InventoryOptions& options) noexcept;

  Inventory(const Inventory&) = delete;
  Inventory& operator=(const Inventory&) = delete;

  ~Inventory() noexcept;

  const std::string& name() const
  {
    return this->options_.name;
  }

  const Metrics& metrics() const
  {
    return this->metrics_;
  }

  VolumeStore& store() const
  {
    return *this->store_;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Moves.

  /** \brief Moves `serial` from its storage or import/export slot into the transfer slot `dst`.
   *
   * The slot it came from is remembered as the volume's home.  An Allocating volume becomes
   * Allocated.
   */
  Status load(const VolumeSerial& serial, const Location& dst, Changer& changer);

  /** \brief Moves `serial` out of its transfer slot to `dst`, or back to its home slot if `dst` is
   * None.
   */
  Status unload(const VolumeSerial& serial, const Optional<Location>& dst, Changer& changer);

  /** \brief Moves `serial` between two storage or import/export slots.
   */
  Status transfer(const VolumeSerial& serial, const Location& dst, Changer& changer);

  /** \brief Phase 1 of a move.  `dst` may only be None for kUnload.
   */
  StatusOr<MoveIntent> prepare_move(MoveKind kind, const VolumeSerial& serial,
                                    const Optional<Location>& dst);

  /** \brief Phase 3 of a move; call only after the changer reported success for `intent`.
   *
   * Fails with StatusCode::kFinalizeFailed if the record could not be written.
   */
  Status finalize_move(const MoveIntent& intent);

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Allocation and reconciliation.

  /** \brief Picks a volume for new writes: the first Filling or Scratch volume in a storage slot,
   * by (category name, serial), skipping volumes locked by concurrent callers.  A Scratch winner
   * becomes Allocating.  Fails with StatusCode::kExhausted if there is no candidate.
   */
  StatusOr<VolumeSerial> alloc();

  /** \brief Brings the inventory in line with what `changer` reports is physically in the library.
   */
  StatusOr<AuditReport> audit(Changer& changer);

  /** \brief Returns the serial of the volume in the transfer slot at `location.addr`, or None if the
   * drive is empty.
   */
  StatusOr<Optional<VolumeSerial>> loaded(const Location& location);

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Records.

  StatusOr<std::vector<Volume>> volumes();

  StatusOr<Volume> info(const VolumeSerial& serial);

  /** \brief Replaces the record of `volume.serial` (operator action).
   *
   * The category change must be allowed by is_valid_category_transition and the new record must
   * satisfy check_volume_invariants; otherwise fails with StatusCode::kInvalidVolumeState.
   */
  Status update(const Volume& volume);

  /** \brief Registers a new volume.  Its category must be Unknown or Scratch.
   */
  Status add(const Volume& volume);

  /** \brief Destroys every record and recreates an empty schema.
   */
  Status reset();

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Path index.

  Status create(const PathName& path, const VolumeSerial& serial);

  StatusOr<Volume> lookup(const PathName& path);

  StatusOr<std::vector<PathName>> paths(const VolumeSerial& serial);

 private:
  Status move(MoveKind kind, const VolumeSerial& serial, const Optional<Location>& dst,
              Changer& changer);

  Status finalize_move_impl(const MoveIntent& intent);

  bool is_cleaning_serial(const VolumeSerial& serial) const;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const InventoryOptions options_;

  std::unique_ptr<VolumeStore> store_;

  Metrics metrics_;
};

}  // namespace tlm

#endif  // TLM_INVENTORY_HPP
