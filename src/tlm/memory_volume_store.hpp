//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_MEMORY_VOLUME_STORE_HPP
#define TLM_MEMORY_VOLUME_STORE_HPP

#include <tlm/config.hpp>
//
#include <tlm/int_types.hpp>
#include <tlm/volume_store.hpp>

#include <condition_variable>
#include <map>
#include <mutex>

namespace tlm {

/** \brief A VolumeStore that keeps all records in process memory.
 *
 * Row locks are modeled with a single mutex and a condition variable; writes are staged inside the
 * transaction and published on commit.  Rows inserted by an open transaction are invisible to
 * everyone else until it commits.  Used for tests and for the "memory" inventory backend.
 */
class MemoryVolumeStore : public VolumeStore
{
 public:
  class TransactionImpl;

  MemoryVolumeStore() = default;

  ~MemoryVolumeStore() noexcept override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // VolumeStore interface.

  StatusOr<std::unique_ptr<Transaction>> begin() override;

  StatusOr<Optional<Volume>> get_volume(const VolumeSerial& serial) override;

  StatusOr<std::vector<Volume>> list_volumes() override;

  StatusOr<Optional<Volume>> find_at(const Location& location) override;

  Status insert_path(const PathName& path, const VolumeSerial& serial) override;

  StatusOr<Optional<VolumeSerial>> lookup_path(const PathName& path) override;

  StatusOr<std::vector<PathName>> paths_for(const VolumeSerial& serial) override;

  Status reset() override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns the number of rows currently locked by some transaction.
   */
  usize locked_row_count() const;

 private:
  friend class TransactionImpl;

  struct Row {
    // The last committed value (or, for an uncommitted insert, the value being inserted).
    //
    Volume committed;

    // Id of the transaction holding the row lock; 0 means unlocked.
    //
    u64 locked_by = 0;

    // True while the row was created by a transaction that has not yet committed.
    //
    bool uncommitted_insert = false;
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  mutable std::mutex mutex_;

  // Signalled whenever row locks are released.
  //
  std::condition_variable unlocked_;

  std::map<VolumeSerial, Row> rows_;

  std::map<PathName, VolumeSerial> tree_;

  u64 next_transaction_id_ = 1;

  usize open_transaction_count_ = 0;
};

}  // namespace tlm

#endif  // TLM_MEMORY_VOLUME_STORE_HPP
