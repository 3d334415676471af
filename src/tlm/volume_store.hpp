//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_VOLUME_STORE_HPP
#define TLM_VOLUME_STORE_HPP

#include <tlm/config.hpp>
//
#include <tlm/location.hpp>
#include <tlm/optional.hpp>
#include <tlm/path_name.hpp>
#include <tlm/status.hpp>
#include <tlm/volume.hpp>

#include <memory>
#include <vector>

namespace tlm {

/** \brief Durable record backend for the inventory: the `volumes` table and the `tree` path index.
 *
 * Every row in `volumes` can be locked exclusively by at most one Transaction at a time.  Lock
 * acquisition blocks while another transaction holds the row, except for lock_next_allocatable,
 * which skips locked rows.  Readers outside a transaction see only committed state.
 *
 * The store enforces that no two committed volumes share a location; writes that would break this
 * fail with StatusCode::kLocationOccupied.
 */
class VolumeStore
{
 public:
  /** \brief A unit of work against the `volumes` table.  Locks taken by the transaction are held
   * until commit or rollback.  A transaction that is destroyed while still open is rolled back.
   */
  class Transaction
  {
   public:
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    virtual ~Transaction() = default;

    /** \brief Locks the row for `serial` and returns its current value, or None if no such
     * volume exists.  Blocks until any other transaction holding the row finishes.
     */
    virtual StatusOr<Optional<Volume>> lock_volume(const VolumeSerial& serial) = 0;

    /** \brief Locks and returns the volume recorded at `location`, or None if the location is
     * empty (as seen by this transaction).
     */
    virtual StatusOr<Optional<Volume>> lock_volume_at(const Location& location) = 0;

    /** \brief Among volumes with an allocatable category (Filling, Scratch) sitting in a storage
     * slot, ordered by (category name, serial), locks and returns the first one that is not locked
     * by another transaction.  Returns None if there is no such volume.
     */
    virtual StatusOr<Optional<Volume>> lock_next_allocatable() = 0;

    /** \brief Creates a new row, locked by this transaction.  Fails with StatusCode::kAlreadyExists
     * if the serial is taken.
     */
    virtual Status insert_volume(const Volume& volume) = 0;

    /** \brief Replaces the row for `volume.serial`, which must be locked by this transaction.
     */
    virtual Status write_volume(const Volume& volume) = 0;

    /** \brief Makes all writes durable and releases all locks.
     */
    virtual Status commit() = 0;

    /** \brief Discards all writes and releases all locks.  Idempotent.
     */
    virtual void rollback() = 0;

    /** \brief Returns true until commit or rollback is called.
     */
    virtual bool is_open() const = 0;

   protected:
    Transaction() = default;
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  VolumeStore(const VolumeStore&) = delete;
  VolumeStore& operator=(const VolumeStore&) = delete;

  virtual ~VolumeStore() = default;

  virtual StatusOr<std::unique_ptr<Transaction>> begin() = 0;

  /** \brief Returns the committed value of one volume, or None if it does not exist.
   */
  virtual StatusOr<Optional<Volume>> get_volume(const VolumeSerial& serial) = 0;

  /** \brief Returns every committed volume, ordered by serial.
   */
  virtual StatusOr<std::vector<Volume>> list_volumes() = 0;

  /** \brief Returns the committed volume recorded at `location`, or None.
   */
  virtual StatusOr<Optional<Volume>> find_at(const Location& location) = 0;

  /** \brief Maps `path` to `serial` in the tree index.
   *
   * Fails with StatusCode::kAlreadyExists if `path` is already mapped, StatusCode::kVolumeNotFound
   * if `serial` is not a registered volume.
   */
  virtual Status insert_path(const PathName& path, const VolumeSerial& serial) = 0;

  /** \brief Returns the serial `path` is mapped to, or None.
   */
  virtual StatusOr<Optional<VolumeSerial>> lookup_path(const PathName& path) = 0;

  /** \brief Returns every path mapped to `serial`, in ascending order.
   */
  virtual StatusOr<std::vector<PathName>> paths_for(const VolumeSerial& serial) = 0;

  /** \brief Drops all tables and recreates an empty schema.
   */
  virtual Status reset() = 0;

 protected:
  VolumeStore() = default;
};

}  // namespace tlm

#endif  // TLM_VOLUME_STORE_HPP
