//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/inventory.hpp>
//

#include <tlm/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <map>
#include <set>

namespace tlm {

namespace {

using Transaction = VolumeStore::Transaction;

/** \brief Logs `status` as the reason for abandoning `txn`, rolls it back and returns `status`.
 */
Status rollback(std::string_view op_name, Transaction& txn, Status status)
{
  TLM_LOG_ERROR() << op_name << ": transaction rolled back due to error: " << status;
  txn.rollback();
  return status;
}

/** \brief Checks `kind` against the current record of a volume; returns the move to make or one of
 * the InvalidTransition codes.
 */
StatusOr<MoveIntent> plan_move(MoveKind kind, const Volume& volume, const Optional<Location>& dst)
{
  MoveIntent intent;
  intent.kind = kind;
  intent.serial = volume.serial;

  switch (kind) {
    case MoveKind::kLoad:
      if (!volume.location || !volume.location->is_shelf()) {
        return make_status(StatusCode::kLoadInvalidSource);
      }
      if (!dst || !dst->is_transfer()) {
        return make_status(StatusCode::kLoadInvalidDestination);
      }
      intent.src = *volume.location;
      intent.dst = *dst;
      break;

    case MoveKind::kUnload: {
      if (!volume.location || !volume.location->is_transfer()) {
        return make_status(StatusCode::kUnloadInvalidSource);
      }
      const Optional<Location>& target = dst ? dst : volume.home;
      if (!target || !target->is_shelf()) {
        return make_status(StatusCode::kUnloadInvalidDestination);
      }
      intent.src = *volume.location;
      intent.dst = *target;
      break;
    }

    case MoveKind::kTransfer:
      if (!volume.location || !volume.location->is_shelf()) {
        return make_status(StatusCode::kTransferInvalidSource);
      }
      if (!dst || !dst->is_shelf()) {
        return make_status(StatusCode::kTransferInvalidDestination);
      }
      intent.src = *volume.location;
      intent.dst = *dst;
      break;

    default:
      BATT_PANIC() << "bad MoveKind value: " << static_cast<int>(kind);
      BATT_UNREACHABLE();
  }

  return intent;
}

Status invoke_changer(Changer& changer, const MoveIntent& intent)
{
  switch (intent.kind) {
    case MoveKind::kLoad:
      return changer.load(intent.src, intent.dst);

    case MoveKind::kUnload:
      return changer.unload(intent.src, intent.dst);

    case MoveKind::kTransfer:
      return changer.transfer(intent.src, intent.dst);

    default:
      break;
  }
  BATT_PANIC() << "bad MoveKind value: " << static_cast<int>(intent.kind);
  BATT_UNREACHABLE();
}

struct Observation {
  Location location;
  VolumeSerial serial;
};

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string_view to_string(MoveKind kind)
{
  switch (kind) {
    case MoveKind::kLoad:
      return "load";
    case MoveKind::kUnload:
      return "unload";
    case MoveKind::kTransfer:
      return "transfer";
  }
  BATT_PANIC() << "bad MoveKind value: " << static_cast<int>(kind);
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, MoveKind t)
{
  return out << to_string(t);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const MoveIntent& t)
{
  return out << "MoveIntent{.kind=" << t.kind << ", .serial=" << t.serial << ", .src=" << t.src
             << ", .dst=" << t.dst << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const AuditReport& t)
{
  return out << "AuditReport{.added=" << t.added << ", .updated=" << t.updated
             << ", .unchanged=" << t.unchanged << ", .displaced=" << t.displaced << ",}";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class Inventory
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Inventory::Inventory(std::unique_ptr<VolumeStore> store, const InventoryOptions& options) noexcept
    : options_{options}
    , store_{std::move(store)}
{
  initialize_status_codes();

  BATT_CHECK(this->store_ != nullptr);

  const auto metric_name = [this](std::string_view property) {
    return batt::to_string("Inventory_", this->options_.name, "_", property);
  };

#define ADD_METRIC_(n) global_metric_registry().add(metric_name(#n), this->metrics_.n)

  ADD_METRIC_(loads);
  ADD_METRIC_(unloads);
  ADD_METRIC_(transfers);
  ADD_METRIC_(allocs);
  ADD_METRIC_(audits);
  ADD_METRIC_(move_failures);
  ADD_METRIC_(finalize_failures);

#undef ADD_METRIC_
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Inventory::~Inventory() noexcept
{
  global_metric_registry()  //
      .remove(this->metrics_.loads)
      .remove(this->metrics_.unloads)
      .remove(this->metrics_.transfers)
      .remove(this->metrics_.allocs)
      .remove(this->metrics_.audits)
      .remove(this->metrics_.move_failures)
      .remove(this->metrics_.finalize_failures);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::load(const VolumeSerial& serial, const Location& dst, Changer& changer)
{
  return this->move(MoveKind::kLoad, serial, dst, changer);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::unload(const VolumeSerial& serial, const Optional<Location>& dst,
                         Changer& changer)
{
  return this->move(MoveKind::kUnload, serial, dst, changer);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::transfer(const VolumeSerial& serial, const Location& dst, Changer& changer)
{
  return this->move(MoveKind::kTransfer, serial, dst, changer);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::move(MoveKind kind, const VolumeSerial& serial, const Optional<Location>& dst,
                       Changer& changer)
{
  BATT_ASSIGN_OK_RESULT(const MoveIntent intent, this->prepare_move(kind, serial, dst));

  // No transaction may be open here; the changer can take minutes.
  //
  Status physical_status = invoke_changer(changer, intent);
  if (!physical_status.ok()) {
    this->metrics_.move_failures.fetch_add(1);
    TLM_LOG_ERROR() << "changer failed to " << kind << " " << serial << " (" << intent.src
                    << " -> " << intent.dst << "); volume left in transit until the next audit: "
                    << physical_status;
    return physical_status;
  }
  TLM_VLOG(1) << "[Inventory::move] physical action done; " << intent;

  BATT_REQUIRE_OK(this->finalize_move(intent));

  switch (kind) {
    case MoveKind::kLoad:
      this->metrics_.loads.fetch_add(1);
      break;
    case MoveKind::kUnload:
      this->metrics_.unloads.fetch_add(1);
      break;
    case MoveKind::kTransfer:
      this->metrics_.transfers.fetch_add(1);
      break;
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<MoveIntent> Inventory::prepare_move(MoveKind kind, const VolumeSerial& serial,
                                             const Optional<Location>& dst)
{
  const std::string op_name = batt::to_string("Inventory::prepare_move(", kind, ")");

  BATT_ASSIGN_OK_RESULT(std::unique_ptr<Transaction> txn, this->store_->begin());

  // Blocks while a concurrent move of the same volume is in Phase 1 or Phase 3.  The loser of such
  // a race sees the winner's committed intent (no location) and fails validation below.
  //
  StatusOr<Optional<Volume>> locked = txn->lock_volume(serial);
  if (!locked.ok()) {
    return rollback(op_name, *txn, locked.status());
  }
  if (!*locked) {
    txn->rollback();
    return make_status(StatusCode::kVolumeNotFound);
  }
  Volume volume = std::move(**locked);

  StatusOr<MoveIntent> intent = plan_move(kind, volume, dst);
  if (!intent.ok()) {
    return rollback(op_name, *txn, intent.status());
  }

  volume.flags.set(VolumeFlag::kTransfering);
  volume.location = None;

  switch (kind) {
    case MoveKind::kLoad:
      volume.flags.set(VolumeFlag::kMounted);
      volume.home = intent->src;
      break;
    case MoveKind::kUnload:
      volume.flags.clear(VolumeFlag::kMounted);
      break;
    case MoveKind::kTransfer:
      break;
  }

  Status write_status = txn->write_volume(volume);
  if (!write_status.ok()) {
    return rollback(op_name, *txn, write_status);
  }
  BATT_REQUIRE_OK(txn->commit());

  TLM_VLOG(1) << "[" << op_name << "] intent committed; " << *intent;

  return intent;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::finalize_move(const MoveIntent& intent)
{
  Status status = this->finalize_move_impl(intent);
  if (!status.ok()) {
    this->metrics_.finalize_failures.fetch_add(1);
    TLM_LOG_ERROR() << "could not record completed " << intent.kind << " of " << intent.serial
                    << " to " << intent.dst << "; inventory and library disagree until the next "
                    << "audit: " << status;
    return make_status(StatusCode::kFinalizeFailed);
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::finalize_move_impl(const MoveIntent& intent)
{
  BATT_ASSIGN_OK_RESULT(std::unique_ptr<Transaction> txn, this->store_->begin());
  BATT_ASSIGN_OK_RESULT(Optional<Volume> locked, txn->lock_volume(intent.serial));
  if (!locked) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  Volume volume = std::move(*locked);

  // An audit may have rewritten the row while the robot was moving, so the postconditions of the
  // move are restated here rather than carried over from Phase 1.
  //
  volume.flags.clear(VolumeFlag::kTransfering);
  volume.location = intent.dst;

  switch (intent.kind) {
    case MoveKind::kLoad:
      volume.flags.set(VolumeFlag::kMounted);
      if (!volume.home) {
        volume.home = intent.src;
      }
      if (volume.category == VolumeCategory::kAllocating) {
        volume.category = VolumeCategory::kAllocated;
      }
      break;
    case MoveKind::kUnload:
      volume.flags.clear(VolumeFlag::kMounted);
      volume.home = None;
      break;
    case MoveKind::kTransfer:
      volume.flags.clear(VolumeFlag::kMounted);
      break;
  }

  BATT_REQUIRE_OK(txn->write_volume(volume));
  BATT_REQUIRE_OK(txn->commit());

  TLM_VLOG(1) << "[Inventory::finalize_move] " << volume;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeSerial> Inventory::alloc()
{
  BATT_ASSIGN_OK_RESULT(std::unique_ptr<Transaction> txn, this->store_->begin());
  BATT_ASSIGN_OK_RESULT(Optional<Volume> candidate, txn->lock_next_allocatable());
  if (!candidate) {
    txn->rollback();
    TLM_LOG_WARNING() << "Inventory::alloc: no scratch or filling volume available";
    return make_status(StatusCode::kExhausted);
  }

  if (candidate->category != VolumeCategory::kFilling) {
    candidate->category = VolumeCategory::kAllocating;
    Status write_status = txn->write_volume(*candidate);
    if (!write_status.ok()) {
      return rollback("Inventory::alloc", *txn, write_status);
    }
  }
  BATT_REQUIRE_OK(txn->commit());

  this->metrics_.allocs.fetch_add(1);
  TLM_VLOG(1) << "[Inventory::alloc] " << *candidate;

  return candidate->serial;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<AuditReport> Inventory::audit(Changer& changer)
{
  BATT_ASSIGN_OK_RESULT(const SlotStatus slots, changer.status());

  std::vector<Observation> observed;
  std::set<VolumeSerial> observed_serials;
  for (SlotCategory category : kAllSlotCategories) {
    auto iter = slots.find(category);
    if (iter == slots.end()) {
      continue;
    }
    for (const Slot& slot : iter->second) {
      if (!slot.volume) {
        continue;
      }
      if (!observed_serials.insert(slot.volume->serial).second) {
        TLM_LOG_ERROR() << "Inventory::audit: changer reported " << slot.volume->serial
                        << " in more than one slot";
        return Status{batt::StatusCode::kInvalidArgument};
      }
      observed.emplace_back(Observation{slot.location(), slot.volume->serial});
    }
  }

  BATT_ASSIGN_OK_RESULT(std::unique_ptr<Transaction> txn, this->store_->begin());

  const auto fail = [&txn](Status status) {
    return rollback("Inventory::audit", *txn, std::move(status));
  };

  AuditReport report;

  // Lock every record the snapshot touches: the volumes seen, and whatever the inventory believes
  // occupies each occupied slot.
  //
  std::map<VolumeSerial, Volume> displaced;
  for (const Observation& obs : observed) {
    StatusOr<Optional<Volume>> occupant = txn->lock_volume_at(obs.location);
    if (!occupant.ok()) {
      return fail(occupant.status());
    }
    if (*occupant && observed_serials.count((*occupant)->serial) == 0) {
      displaced.emplace((*occupant)->serial, **occupant);
    }
  }

  std::map<VolumeSerial, Optional<Volume>> known;
  for (const Observation& obs : observed) {
    StatusOr<Optional<Volume>> current = txn->lock_volume(obs.serial);
    if (!current.ok()) {
      return fail(current.status());
    }
    known.emplace(obs.serial, std::move(*current));
  }

  // Vacate every slot that is about to be reassigned, so volumes can swap places without tripping
  // the one-volume-per-location rule.
  //
  for (auto& [serial, volume] : displaced) {
    TLM_LOG_WARNING() << "Inventory::audit: " << serial << " is not in the library but was recorded"
                      << " at " << volume.location << "; clearing its location";
    volume.location = None;
    Status status = txn->write_volume(volume);
    if (!status.ok()) {
      return fail(status);
    }
    report.displaced += 1;
  }

  for (const Observation& obs : observed) {
    const Optional<Volume>& current = known[obs.serial];
    if (current && current->location && *current->location != obs.location) {
      Volume vacated = *current;
      vacated.location = None;
      Status status = txn->write_volume(vacated);
      if (!status.ok()) {
        return fail(status);
      }
    }
  }

  for (const Observation& obs : observed) {
    const Optional<Volume>& current = known[obs.serial];
    const bool in_transfer_slot = obs.location.is_transfer();

    if (!current) {
      Volume volume;
      volume.serial = obs.serial;
      volume.location = obs.location;
      volume.category =
          this->is_cleaning_serial(obs.serial) ? VolumeCategory::kCleaning : VolumeCategory::kScratch;
      volume.flags.assign(VolumeFlag::kMounted, in_transfer_slot);

      Status status = txn->insert_volume(volume);
      if (!status.ok()) {
        return fail(status);
      }
      TLM_VLOG(1) << "[Inventory::audit] added " << volume;
      report.added += 1;
      continue;
    }

    Volume volume = *current;
    volume.location = obs.location;
    volume.flags.clear(VolumeFlag::kTransfering);
    volume.flags.assign(VolumeFlag::kMounted, in_transfer_slot);
    if (!in_transfer_slot) {
      volume.home = None;
    }

    if (volume == *current) {
      report.unchanged += 1;
      continue;
    }

    Status status = txn->write_volume(volume);
    if (!status.ok()) {
      return fail(status);
    }
    TLM_VLOG(1) << "[Inventory::audit] updated " << *current << " -> " << volume;
    report.updated += 1;
  }

  BATT_REQUIRE_OK(txn->commit());

  this->metrics_.audits.fetch_add(1);
  TLM_LOG_INFO() << "Inventory::audit(" << this->options_.name << ") done; " << report;

  return report;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<VolumeSerial>> Inventory::loaded(const Location& location)
{
  BATT_ASSIGN_OK_RESULT(Optional<Volume> volume,
                        this->store_->find_at(Location::transfer(location.addr)));
  if (!volume) {
    return Optional<VolumeSerial>{None};
  }
  return Optional<VolumeSerial>{volume->serial};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<Volume>> Inventory::volumes()
{
  return this->store_->list_volumes();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Volume> Inventory::info(const VolumeSerial& serial)
{
  BATT_ASSIGN_OK_RESULT(Optional<Volume> volume, this->store_->get_volume(serial));
  if (!volume) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  return std::move(*volume);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::update(const Volume& volume)
{
  BATT_REQUIRE_OK(check_volume_invariants(volume));

  BATT_ASSIGN_OK_RESULT(std::unique_ptr<Transaction> txn, this->store_->begin());
  BATT_ASSIGN_OK_RESULT(Optional<Volume> current, txn->lock_volume(volume.serial));
  if (!current) {
    return make_status(StatusCode::kVolumeNotFound);
  }

  if (!is_valid_category_transition(current->category, volume.category)) {
    TLM_LOG_ERROR() << "Inventory::update: " << volume.serial << " may not change from "
                    << current->category << " to " << volume.category;
    return make_status(StatusCode::kInvalidVolumeState);
  }

  BATT_REQUIRE_OK(txn->write_volume(volume));
  BATT_REQUIRE_OK(txn->commit());

  TLM_VLOG(1) << "[Inventory::update] " << *current << " -> " << volume;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::add(const Volume& volume)
{
  if (volume.category != VolumeCategory::kUnknown &&
      volume.category != VolumeCategory::kScratch) {
    return make_status(StatusCode::kInvalidVolumeState);
  }
  BATT_REQUIRE_OK(check_volume_invariants(volume));

  BATT_ASSIGN_OK_RESULT(std::unique_ptr<Transaction> txn, this->store_->begin());
  BATT_REQUIRE_OK(txn->insert_volume(volume));
  BATT_REQUIRE_OK(txn->commit());

  TLM_VLOG(1) << "[Inventory::add] " << volume;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::reset()
{
  TLM_LOG_WARNING() << "Inventory::reset(" << this->options_.name << "): dropping all records";

  return this->store_->reset();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Inventory::create(const PathName& path, const VolumeSerial& serial)
{
  return this->store_->insert_path(path, serial);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Volume> Inventory::lookup(const PathName& path)
{
  BATT_ASSIGN_OK_RESULT(Optional<VolumeSerial> serial, this->store_->lookup_path(path));
  if (!serial) {
    return make_status(StatusCode::kPathNotFound);
  }
  return this->info(*serial);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<PathName>> Inventory::paths(const VolumeSerial& serial)
{
  return this->store_->paths_for(serial);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool Inventory::is_cleaning_serial(const VolumeSerial& serial) const
{
  return !this->options_.cleaning_prefix.empty() &&
         boost::algorithm::starts_with(serial, this->options_.cleaning_prefix);
}

}  // namespace tlm
