//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/simulated_changer.hpp>
//

#include <batteries/assert.hpp>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<SimulatedChangerOptions> SimulatedChangerOptions::from_config(
    const ConfigOptions& options)
{
  BATT_REQUIRE_OK(reject_unknown_config_keys(
      options, {"storage-slots", "transfer-slots", "import-export-slots"}, "SimulatedChanger"));

  SimulatedChangerOptions result;

  BATT_ASSIGN_OK_RESULT(result.storage_slots,
                        get_config_int(options, "storage-slots", kDefaultSimulatedStorageSlots));

  BATT_ASSIGN_OK_RESULT(result.transfer_slots,
                        get_config_int(options, "transfer-slots", kDefaultSimulatedTransferSlots));

  BATT_ASSIGN_OK_RESULT(
      result.import_export_slots,
      get_config_int(options, "import-export-slots", kDefaultSimulatedImportExportSlots));

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<Changer>> SimulatedChanger::make(const ConfigOptions& options)
{
  BATT_ASSIGN_OK_RESULT(SimulatedChangerOptions sim_options,
                        SimulatedChangerOptions::from_config(options));

  std::unique_ptr<Changer> changer = std::make_unique<SimulatedChanger>(sim_options);
  return changer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
SimulatedChanger::SimulatedChanger(const SimulatedChangerOptions& options) noexcept
{
  initialize_status_codes();

  const auto add_slots = [this](SlotCategory category, i64 count) {
    for (i64 addr = 1; addr <= count; ++addr) {
      this->slots_.emplace(Location{addr, category}, None);
    }
  };

  add_slots(SlotCategory::kStorage, options.storage_slots);
  add_slots(SlotCategory::kTransfer, options.transfer_slots);
  add_slots(SlotCategory::kImportExport, options.import_export_slots);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<SlotStatus> SimulatedChanger::status()
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  SlotStatus result;
  for (const auto& [location, serial] : this->slots_) {
    Slot slot;
    slot.addr = location.addr;
    slot.category = location.category;
    if (serial) {
      Volume volume;
      volume.serial = *serial;
      slot.volume = std::move(volume);
    }
    result[location.category].emplace_back(std::move(slot));
  }

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status SimulatedChanger::load(const Location& src, const Location& dst)
{
  if (!dst.is_transfer()) {
    return {batt::StatusCode::kInvalidArgument};
  }
  return this->move("load", src, dst);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status SimulatedChanger::unload(const Location& src, const Location& dst)
{
  if (!src.is_transfer()) {
    return {batt::StatusCode::kInvalidArgument};
  }
  return this->move("unload", src, dst);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status SimulatedChanger::transfer(const Location& src, const Location& dst)
{
  if (src.is_transfer() || dst.is_transfer()) {
    return {batt::StatusCode::kInvalidArgument};
  }
  return this->move("transfer", src, dst);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status SimulatedChanger::move(const char* op_name, const Location& src, const Location& dst)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  if (this->pending_failure_) {
    Status failure = std::move(*this->pending_failure_);
    this->pending_failure_ = None;
    TLM_VLOG(1) << "SimulatedChanger::" << op_name << "(" << src << " -> " << dst
                << ") injected failure: " << failure;
    return failure;
  }

  auto src_iter = this->slots_.find(src);
  auto dst_iter = this->slots_.find(dst);
  if (src_iter == this->slots_.end() || dst_iter == this->slots_.end()) {
    return make_status(StatusCode::kChangerUnknownSlot);
  }
  if (!src_iter->second) {
    return make_status(StatusCode::kChangerSourceEmpty);
  }
  if (dst_iter->second) {
    return make_status(StatusCode::kChangerDestinationOccupied);
  }

  TLM_VLOG(1) << "SimulatedChanger::" << op_name << "(" << src << " -> " << dst
              << ") serial=" << *src_iter->second;

  dst_iter->second = std::move(src_iter->second);
  src_iter->second = None;
  this->move_count_ += 1;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status SimulatedChanger::insert(const Location& location, const VolumeSerial& serial)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  auto iter = this->slots_.find(location);
  if (iter == this->slots_.end()) {
    return make_status(StatusCode::kChangerUnknownSlot);
  }
  if (iter->second) {
    return make_status(StatusCode::kChangerDestinationOccupied);
  }
  iter->second = serial;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Optional<VolumeSerial> SimulatedChanger::remove(const Location& location)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  auto iter = this->slots_.find(location);
  if (iter == this->slots_.end()) {
    return None;
  }
  Optional<VolumeSerial> removed = std::move(iter->second);
  iter->second = None;

  return removed;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Optional<VolumeSerial> SimulatedChanger::contents(const Location& location) const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  auto iter = this->slots_.find(location);
  if (iter == this->slots_.end()) {
    return None;
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void SimulatedChanger::inject_failure(Status status)
{
  BATT_CHECK(!status.ok());

  std::unique_lock<std::mutex> lock{this->mutex_};
  this->pending_failure_ = std::move(status);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize SimulatedChanger::move_count() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};
  return this->move_count_;
}

}  // namespace tlm
