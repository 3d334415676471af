//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/memory_volume_store.hpp>
//

#include <tlm/logging.hpp>

#include <batteries/assert.hpp>

#include <algorithm>
#include <set>
#include <tuple>

namespace tlm {

namespace {

bool is_at(const Optional<Location>& location, const Location& target)
{
  return location && *location == target;
}

}  // namespace

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
class MemoryVolumeStore::TransactionImpl : public VolumeStore::Transaction
{
 public:
  using Lock = std::unique_lock<std::mutex>;

  explicit TransactionImpl(MemoryVolumeStore* store, u64 id) noexcept : store_{store}, id_{id}
  {
  }

  ~TransactionImpl() noexcept override
  {
    if (this->open_) {
      TLM_VLOG(1) << "MemoryVolumeStore transaction " << this->id_
                  << " destroyed while open; rolling back";
      this->rollback();
    }
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  StatusOr<Optional<Volume>> lock_volume(const VolumeSerial& serial) override
  {
    Lock lock{this->store_->mutex_};
    BATT_REQUIRE_OK(this->require_open());

    if (!this->acquire(lock, serial)) {
      return Optional<Volume>{None};
    }
    return this->view(serial);
  }

  StatusOr<Optional<Volume>> lock_volume_at(const Location& location) override
  {
    Lock lock{this->store_->mutex_};
    BATT_REQUIRE_OK(this->require_open());

    for (;;) {
      Optional<VolumeSerial> serial = this->find_in_view(location);
      if (!serial) {
        return Optional<Volume>{None};
      }
      // The row may move while we wait for its lock, so check again once we hold it.
      //
      if (this->acquire(lock, *serial)) {
        Optional<Volume> volume = this->view(*serial);
        if (volume && is_at(volume->location, location)) {
          return volume;
        }
      }
    }
  }

  StatusOr<Optional<Volume>> lock_next_allocatable() override
  {
    Lock lock{this->store_->mutex_};
    BATT_REQUIRE_OK(this->require_open());

    Optional<Volume> best;
    for (const auto& [serial, row] : this->store_->rows_) {
      if (row.locked_by != 0 && row.locked_by != this->id_) {
        continue;
      }
      Optional<Volume> volume = this->view(serial);
      if (!volume || !is_allocatable(volume->category) || !volume->location ||
          volume->location->category != SlotCategory::kStorage) {
        continue;
      }
      if (!best || std::make_tuple(to_string(volume->category), std::cref(volume->serial)) <
                       std::make_tuple(to_string(best->category), std::cref(best->serial))) {
        best = std::move(volume);
      }
    }

    if (best) {
      this->store_->rows_[best->serial].locked_by = this->id_;
      this->locked_.insert(best->serial);
    }
    return best;
  }

  Status insert_volume(const Volume& volume) override
  {
    Lock lock{this->store_->mutex_};
    BATT_REQUIRE_OK(this->require_open());

    if (this->store_->rows_.count(volume.serial) != 0) {
      return make_status(StatusCode::kAlreadyExists);
    }
    BATT_REQUIRE_OK(this->check_location_free(volume));

    Row& row = this->store_->rows_[volume.serial];
    row.committed = volume;
    row.locked_by = this->id_;
    row.uncommitted_insert = true;

    this->locked_.insert(volume.serial);
    this->writes_[volume.serial] = volume;

    return OkStatus();
  }

  Status write_volume(const Volume& volume) override
  {
    Lock lock{this->store_->mutex_};
    BATT_REQUIRE_OK(this->require_open());

    auto iter = this->store_->rows_.find(volume.serial);
    if (iter == this->store_->rows_.end()) {
      return make_status(StatusCode::kVolumeNotFound);
    }
    if (iter->second.locked_by != this->id_) {
      TLM_LOG_ERROR() << "write_volume called without holding the row lock; serial="
                      << volume.serial;
      return {batt::StatusCode::kFailedPrecondition};
    }
    BATT_REQUIRE_OK(this->check_location_free(volume));

    this->writes_[volume.serial] = volume;

    return OkStatus();
  }

  Status commit() override
  {
    Lock lock{this->store_->mutex_};
    BATT_REQUIRE_OK(this->require_open());

    // Another transaction may have committed a volume into one of our target locations after we
    // staged the write.
    //
    for (const auto& [serial, volume] : this->writes_) {
      (void)serial;
      Status location_status = this->check_location_free(volume);
      if (!location_status.ok()) {
        this->rollback_locked();
        return location_status;
      }
    }

    for (auto& [serial, volume] : this->writes_) {
      Row& row = this->store_->rows_[serial];
      row.committed = std::move(volume);
      row.uncommitted_insert = false;
    }
    this->writes_.clear();
    this->release_locks();

    return OkStatus();
  }

  void rollback() override
  {
    Lock lock{this->store_->mutex_};
    if (this->open_) {
      this->rollback_locked();
    }
  }

  bool is_open() const override
  {
    Lock lock{this->store_->mutex_};
    return this->open_;
  }

 private:
  Status require_open() const
  {
    if (!this->open_) {
      return make_status(StatusCode::kStoreTransactionClosed);
    }
    return OkStatus();
  }

  /** \brief Waits until the row for `serial` is free (or already ours), then locks it.  Returns
   * false if the row does not exist or is an uncommitted insert by someone else that was rolled
   * back while we waited.
   */
  bool acquire(Lock& lock, const VolumeSerial& serial)
  {
    for (;;) {
      auto iter = this->store_->rows_.find(serial);
      if (iter == this->store_->rows_.end()) {
        return false;
      }
      Row& row = iter->second;
      if (row.locked_by == 0 || row.locked_by == this->id_) {
        row.locked_by = this->id_;
        this->locked_.insert(serial);
        return true;
      }
      this->store_->unlocked_.wait(lock);
    }
  }

  /** \brief Returns the value of the row as this transaction sees it: our own staged write if we
   * have one, otherwise the committed value.  Uncommitted inserts by other transactions are
   * invisible.
   */
  Optional<Volume> view(const VolumeSerial& serial) const
  {
    auto write_iter = this->writes_.find(serial);
    if (write_iter != this->writes_.end()) {
      return write_iter->second;
    }
    auto iter = this->store_->rows_.find(serial);
    if (iter == this->store_->rows_.end() || !this->is_visible(iter->second)) {
      return None;
    }
    return iter->second.committed;
  }

  bool is_visible(const Row& row) const
  {
    return !row.uncommitted_insert || row.locked_by == this->id_;
  }

  Optional<VolumeSerial> find_in_view(const Location& location) const
  {
    for (const auto& [serial, row] : this->store_->rows_) {
      if (!this->is_visible(row)) {
        continue;
      }
      Optional<Volume> volume = this->view(serial);
      if (volume && is_at(volume->location, location)) {
        return serial;
      }
    }
    return None;
  }

  /** \brief Fails with kLocationOccupied if any other visible row is recorded at the location of
   * `volume`.
   */
  Status check_location_free(const Volume& volume) const
  {
    if (!volume.location) {
      return OkStatus();
    }
    for (const auto& [serial, row] : this->store_->rows_) {
      if (serial == volume.serial || !this->is_visible(row)) {
        continue;
      }
      Optional<Volume> other = this->view(serial);
      if (other && is_at(other->location, *volume.location)) {
        TLM_VLOG(1) << "location " << *volume.location << " of " << volume.serial
                    << " is occupied by " << serial;
        return make_status(StatusCode::kLocationOccupied);
      }
    }
    return OkStatus();
  }

  void rollback_locked()
  {
    for (const VolumeSerial& serial : this->locked_) {
      auto iter = this->store_->rows_.find(serial);
      if (iter != this->store_->rows_.end() && iter->second.uncommitted_insert &&
          iter->second.locked_by == this->id_) {
        this->store_->rows_.erase(iter);
      }
    }
    this->writes_.clear();
    this->release_locks();
  }

  void release_locks()
  {
    for (const VolumeSerial& serial : this->locked_) {
      auto iter = this->store_->rows_.find(serial);
      if (iter != this->store_->rows_.end() && iter->second.locked_by == this->id_) {
        iter->second.locked_by = 0;
      }
    }
    this->locked_.clear();
    this->open_ = false;
    this->store_->open_transaction_count_ -= 1;
    this->store_->unlocked_.notify_all();
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  MemoryVolumeStore* const store_;
  const u64 id_;
  bool open_ = true;
  std::set<VolumeSerial> locked_;
  std::map<VolumeSerial, Volume> writes_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class MemoryVolumeStore
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
MemoryVolumeStore::~MemoryVolumeStore() noexcept
{
  std::unique_lock<std::mutex> lock{this->mutex_};
  BATT_CHECK_EQ(this->open_transaction_count_, 0u)
      << "All transactions must be closed before the store is destroyed";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::unique_ptr<VolumeStore::Transaction>> MemoryVolumeStore::begin()
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  const u64 id = this->next_transaction_id_;
  this->next_transaction_id_ += 1;
  this->open_transaction_count_ += 1;

  std::unique_ptr<Transaction> txn = std::make_unique<TransactionImpl>(this, id);
  return txn;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<Volume>> MemoryVolumeStore::get_volume(const VolumeSerial& serial)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  auto iter = this->rows_.find(serial);
  if (iter == this->rows_.end() || iter->second.uncommitted_insert) {
    return Optional<Volume>{None};
  }
  return Optional<Volume>{iter->second.committed};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<Volume>> MemoryVolumeStore::list_volumes()
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  std::vector<Volume> result;
  for (const auto& [serial, row] : this->rows_) {
    (void)serial;
    if (!row.uncommitted_insert) {
      result.emplace_back(row.committed);
    }
  }
  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<Volume>> MemoryVolumeStore::find_at(const Location& location)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  for (const auto& [serial, row] : this->rows_) {
    (void)serial;
    if (!row.uncommitted_insert && is_at(row.committed.location, location)) {
      return Optional<Volume>{row.committed};
    }
  }
  return Optional<Volume>{None};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::insert_path(const PathName& path, const VolumeSerial& serial)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  if (this->tree_.count(path) != 0) {
    return make_status(StatusCode::kAlreadyExists);
  }
  auto iter = this->rows_.find(serial);
  if (iter == this->rows_.end() || iter->second.uncommitted_insert) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  this->tree_.emplace(path, serial);

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<VolumeSerial>> MemoryVolumeStore::lookup_path(const PathName& path)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  auto iter = this->tree_.find(path);
  if (iter == this->tree_.end()) {
    return Optional<VolumeSerial>{None};
  }
  return Optional<VolumeSerial>{iter->second};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<PathName>> MemoryVolumeStore::paths_for(const VolumeSerial& serial)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  std::vector<PathName> result;
  for (const auto& [path, mapped_serial] : this->tree_) {
    if (mapped_serial == serial) {
      result.emplace_back(path);
    }
  }
  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::reset()
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  if (this->open_transaction_count_ != 0) {
    TLM_LOG_ERROR() << "MemoryVolumeStore::reset called with " << this->open_transaction_count_
                    << " open transaction(s)";
    return {batt::StatusCode::kFailedPrecondition};
  }
  this->tree_.clear();
  this->rows_.clear();

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize MemoryVolumeStore::locked_row_count() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return static_cast<usize>(std::count_if(this->rows_.begin(), this->rows_.end(), [](const auto& kv) {
    return kv.second.locked_by != 0;
  }));
}

}  // namespace tlm
