//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/inventory.hpp>
//
#include <tlm/inventory.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tlm/fake_changer.hpp>
#include <tlm/memory_volume_store.hpp>
#include <tlm/simulated_changer.hpp>
#include <tlm/testing/mock_changer.hpp>

#include <batteries/stream_util.hpp>

#include <atomic>
#include <future>
#include <thread>

namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;

using tlm::AuditReport;
using tlm::Inventory;
using tlm::Location;
using tlm::MoveIntent;
using tlm::MoveKind;
using tlm::Optional;
using tlm::SimulatedChanger;
using tlm::StatusCode;
using tlm::Volume;
using tlm::VolumeCategory;
using tlm::VolumeFlag;
using tlm::VolumeSerial;

using MockChanger = StrictMock<tlm::testing::MockChanger>;

constexpr const char* kCleaningPrefix = "CLN";

tlm::SimulatedChangerOptions test_library()
{
  tlm::SimulatedChangerOptions options;
  options.storage_slots = 16;
  options.transfer_slots = 2;
  options.import_export_slots = 2;
  return options;
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
class InventoryTest : public ::testing::Test
{
 public:
  explicit InventoryTest(const std::string& cleaning_prefix = kCleaningPrefix)
      : inventory{std::make_unique<tlm::MemoryVolumeStore>(),
                  tlm::InventoryOptions{"test", cleaning_prefix}}
      , store{dynamic_cast<tlm::MemoryVolumeStore&>(inventory.store())}
  {
  }

  /** \brief Registers `serial` at `location` with the given category.
   */
  void put(const VolumeSerial& serial, const Optional<Location>& location,
           VolumeCategory category = VolumeCategory::kScratch)
  {
    Volume volume;
    volume.serial = serial;
    volume.location = location;
    volume.category = VolumeCategory::kUnknown;
    if (location && location->is_transfer()) {
      volume.flags.set(VolumeFlag::kMounted);
    }
    ASSERT_TRUE(this->inventory.add(volume).ok());

    volume.category = category;
    ASSERT_TRUE(this->inventory.update(volume).ok());
  }

  Volume info(const VolumeSerial& serial)
  {
    tlm::StatusOr<Volume> volume = this->inventory.info(serial);
    BATT_CHECK_OK(volume);
    return *volume;
  }

  Inventory inventory;
  tlm::MemoryVolumeStore& store;
};

class EmptyPrefixInventoryTest : public InventoryTest
{
 public:
  EmptyPrefixInventoryTest() : InventoryTest{""}
  {
  }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Moves.

TEST_F(InventoryTest, LoadScenario)
{
  this->put("V1", Location::storage(10), VolumeCategory::kScratch);

  MockChanger changer;

  EXPECT_CALL(changer, load(Location::storage(10), Location::transfer(1)))
      .WillOnce([&](const Location&, const Location&) -> tlm::Status {
        // Phase 2 runs with the intent committed and no row lock held.
        //
        Volume in_flight = this->info("V1");

        EXPECT_FALSE(in_flight.location);
        EXPECT_EQ(in_flight.home, Optional<Location>{Location::storage(10)});
        EXPECT_TRUE(in_flight.flags.test(VolumeFlag::kTransfering));
        EXPECT_TRUE(in_flight.flags.test(VolumeFlag::kMounted));
        EXPECT_TRUE(tlm::check_volume_invariants(in_flight).ok());
        EXPECT_EQ(this->store.locked_row_count(), 0u);

        return tlm::OkStatus();
      });

  tlm::Status status = this->inventory.load("V1", Location::transfer(1), changer);
  ASSERT_TRUE(status.ok()) << BATT_INSPECT(status);

  Volume v1 = this->info("V1");

  EXPECT_EQ(v1.location, Optional<Location>{Location::transfer(1)});
  EXPECT_EQ(v1.home, Optional<Location>{Location::storage(10)});
  EXPECT_TRUE(v1.flags.test(VolumeFlag::kMounted));
  EXPECT_FALSE(v1.flags.test(VolumeFlag::kTransfering));
  EXPECT_EQ(v1.category, VolumeCategory::kScratch);
  EXPECT_EQ(this->inventory.metrics().loads.load(), 1u);
}

TEST_F(InventoryTest, LoadThenUnloadReturnsHome)
{
  this->put("V1", Location::import_export(2), VolumeCategory::kFilling);

  tlm::FakeChanger changer;

  ASSERT_TRUE(this->inventory.load("V1", Location::transfer(2), changer).ok());
  ASSERT_TRUE(this->inventory.unload("V1", tlm::None, changer).ok());

  Volume v1 = this->info("V1");

  EXPECT_EQ(v1.location, Optional<Location>{Location::import_export(2)});
  EXPECT_FALSE(v1.home);
  EXPECT_TRUE(v1.flags.empty());
  EXPECT_EQ(v1.category, VolumeCategory::kFilling);
  EXPECT_EQ(changer.move_count(), 2u);
  EXPECT_EQ(this->inventory.metrics().unloads.load(), 1u);
}

TEST_F(InventoryTest, UnloadToExplicitDestination)
{
  this->put("V1", Location::storage(1));

  MockChanger changer;
  EXPECT_CALL(changer, load(Location::storage(1), Location::transfer(1)))
      .WillOnce(Return(tlm::OkStatus()));
  EXPECT_CALL(changer, unload(Location::transfer(1), Location::storage(7)))
      .WillOnce(Return(tlm::OkStatus()));

  ASSERT_TRUE(this->inventory.load("V1", Location::transfer(1), changer).ok());
  ASSERT_TRUE(this->inventory.unload("V1", Location::storage(7), changer).ok());

  Volume v1 = this->info("V1");

  EXPECT_EQ(v1.location, Optional<Location>{Location::storage(7)});
  EXPECT_FALSE(v1.home);
  EXPECT_TRUE(v1.flags.empty());
}

TEST_F(InventoryTest, LoadPromotesAllocating)
{
  this->put("V1", Location::storage(1), VolumeCategory::kScratch);

  tlm::StatusOr<VolumeSerial> allocated = this->inventory.alloc();
  ASSERT_TRUE(allocated.ok());
  ASSERT_EQ(*allocated, "V1");
  ASSERT_EQ(this->info("V1").category, VolumeCategory::kAllocating);

  tlm::FakeChanger changer;
  ASSERT_TRUE(this->inventory.load("V1", Location::transfer(1), changer).ok());

  EXPECT_EQ(this->info("V1").category, VolumeCategory::kAllocated);

  // Unload does not change the category.
  //
  ASSERT_TRUE(this->inventory.unload("V1", tlm::None, changer).ok());

  EXPECT_EQ(this->info("V1").category, VolumeCategory::kAllocated);
}

TEST_F(InventoryTest, TransferBetweenShelves)
{
  this->put("V1", Location::storage(3));

  MockChanger changer;
  EXPECT_CALL(changer, transfer(Location::storage(3), Location::import_export(1)))
      .WillOnce(Return(tlm::OkStatus()));

  ASSERT_TRUE(this->inventory.transfer("V1", Location::import_export(1), changer).ok());

  Volume v1 = this->info("V1");

  EXPECT_EQ(v1.location, Optional<Location>{Location::import_export(1)});
  EXPECT_FALSE(v1.home);
  EXPECT_TRUE(v1.flags.empty());
  EXPECT_EQ(this->inventory.metrics().transfers.load(), 1u);
}

TEST_F(InventoryTest, InvalidTransitions)
{
  tlm::suppress_log_output_for_test() = true;

  this->put("S", Location::storage(1));
  this->put("T", Location::transfer(1));

  // The changer must never be called for a rejected move.
  //
  MockChanger changer;

  const auto expect_rejected = [&](tlm::Status status, StatusCode expected) {
    EXPECT_EQ(status, expected) << BATT_INSPECT(status);
    EXPECT_TRUE(tlm::is_invalid_transition(status));
  };

  expect_rejected(this->inventory.load("S", Location::storage(2), changer),
                  StatusCode::kLoadInvalidDestination);
  expect_rejected(this->inventory.load("T", Location::transfer(2), changer),
                  StatusCode::kLoadInvalidSource);
  expect_rejected(this->inventory.unload("S", Location::storage(2), changer),
                  StatusCode::kUnloadInvalidSource);
  expect_rejected(this->inventory.unload("T", Location::transfer(2), changer),
                  StatusCode::kUnloadInvalidDestination);
  expect_rejected(this->inventory.transfer("T", Location::storage(2), changer),
                  StatusCode::kTransferInvalidSource);
  expect_rejected(this->inventory.transfer("S", Location::transfer(2), changer),
                  StatusCode::kTransferInvalidDestination);

  // "T" was registered directly in a drive, so it has no home to go back to.
  //
  expect_rejected(this->inventory.unload("T", tlm::None, changer),
                  StatusCode::kUnloadInvalidDestination);

  EXPECT_EQ(this->inventory.load("NOSUCH", Location::transfer(1), changer),
            StatusCode::kVolumeNotFound);

  // Rejected moves roll back; nothing changed.
  //
  EXPECT_EQ(this->info("S").location, Optional<Location>{Location::storage(1)});
  EXPECT_TRUE(this->info("S").flags.empty());
  EXPECT_EQ(this->info("T").location, Optional<Location>{Location::transfer(1)});
  EXPECT_FALSE(this->info("T").flags.test(VolumeFlag::kTransfering));
  EXPECT_EQ(this->store.locked_row_count(), 0u);

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(InventoryTest, ChangerFailureLeavesVolumeInTransitUntilAudit)
{
  tlm::suppress_log_output_for_test() = true;

  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(10), "V1").ok());

  this->put("V1", Location::storage(10));

  changer.inject_failure(tlm::make_status(StatusCode::kSimulatedChangerFault));

  tlm::Status status = this->inventory.load("V1", Location::transfer(1), changer);

  // The changer's error is returned verbatim.
  //
  EXPECT_EQ(status, StatusCode::kSimulatedChangerFault);
  EXPECT_EQ(this->inventory.metrics().move_failures.load(), 1u);
  EXPECT_EQ(this->inventory.metrics().loads.load(), 0u);

  Volume stuck = this->info("V1");

  EXPECT_FALSE(stuck.location);
  EXPECT_TRUE(stuck.flags.test(VolumeFlag::kTransfering));

  // A volume in transit can't be moved again.
  //
  EXPECT_EQ(this->inventory.load("V1", Location::transfer(2), changer),
            StatusCode::kLoadInvalidSource);

  tlm::StatusOr<AuditReport> report = this->inventory.audit(changer);
  ASSERT_TRUE(report.ok()) << BATT_INSPECT(report.status());
  EXPECT_EQ(report->updated, 1u);
  EXPECT_EQ(report->added, 0u);

  Volume recovered = this->info("V1");

  EXPECT_EQ(recovered.location, Optional<Location>{Location::storage(10)});
  EXPECT_FALSE(recovered.home);
  EXPECT_FALSE(recovered.flags.test(VolumeFlag::kTransfering));
  EXPECT_FALSE(recovered.flags.test(VolumeFlag::kMounted));

  // And the retry now works.
  //
  ASSERT_TRUE(this->inventory.load("V1", Location::transfer(1), changer).ok());
  EXPECT_EQ(changer.contents(Location::transfer(1)).value_or(std::string{}), "V1");

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(InventoryTest, PrepareAndFinalizeSeparately)
{
  this->put("V1", Location::storage(4));

  tlm::StatusOr<MoveIntent> intent =
      this->inventory.prepare_move(MoveKind::kTransfer, "V1", Location::storage(5));
  ASSERT_TRUE(intent.ok()) << BATT_INSPECT(intent.status());

  EXPECT_EQ(intent->kind, MoveKind::kTransfer);
  EXPECT_EQ(intent->serial, "V1");
  EXPECT_EQ(intent->src, Location::storage(4));
  EXPECT_EQ(intent->dst, Location::storage(5));

  // Transfer clears the location too while the move is in flight.
  //
  EXPECT_FALSE(this->info("V1").location);
  EXPECT_TRUE(this->info("V1").flags.test(VolumeFlag::kTransfering));

  ASSERT_TRUE(this->inventory.finalize_move(*intent).ok());

  EXPECT_EQ(this->info("V1").location, Optional<Location>{Location::storage(5)});
  EXPECT_TRUE(this->info("V1").flags.empty());
}

TEST_F(InventoryTest, FinalizeFailure)
{
  tlm::suppress_log_output_for_test() = true;

  this->put("V1", Location::storage(4));

  tlm::StatusOr<MoveIntent> intent =
      this->inventory.prepare_move(MoveKind::kLoad, "V1", Location::transfer(1));
  ASSERT_TRUE(intent.ok());

  // Another volume was recorded in the drive while the robot was moving.
  //
  this->put("INTRUDER", Location::transfer(1));

  EXPECT_EQ(this->inventory.finalize_move(*intent), StatusCode::kFinalizeFailed);
  EXPECT_EQ(this->inventory.metrics().finalize_failures.load(), 1u);
  EXPECT_EQ(this->store.locked_row_count(), 0u);

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(InventoryTest, AuditDuringLoadDoesNotLeakIntoFinalize)
{
  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(10), "V1").ok());

  this->put("V1", Location::storage(10));

  tlm::StatusOr<MoveIntent> intent =
      this->inventory.prepare_move(MoveKind::kLoad, "V1", Location::transfer(1));
  ASSERT_TRUE(intent.ok());

  // The robot has not picked the cartridge up yet; the audit still sees it on the shelf and clears
  // Mounted and home.
  //
  ASSERT_TRUE(this->inventory.audit(changer).ok());
  ASSERT_FALSE(this->info("V1").flags.test(VolumeFlag::kMounted));
  ASSERT_FALSE(this->info("V1").home);

  ASSERT_TRUE(this->inventory.finalize_move(*intent).ok());

  Volume v1 = this->info("V1");

  EXPECT_TRUE(tlm::check_volume_invariants(v1).ok()) << v1;
  EXPECT_EQ(v1.location, Optional<Location>{Location::transfer(1)});
  EXPECT_TRUE(v1.flags.test(VolumeFlag::kMounted));
  EXPECT_FALSE(v1.flags.test(VolumeFlag::kTransfering));
  EXPECT_EQ(v1.home, Optional<Location>{Location::storage(10)});

  // The volume can go back where it came from.
  //
  tlm::FakeChanger fake;
  ASSERT_TRUE(this->inventory.unload("V1", tlm::None, fake).ok());
  EXPECT_EQ(this->info("V1").location, Optional<Location>{Location::storage(10)});
}

TEST_F(InventoryTest, AuditDuringUnloadDoesNotLeakIntoFinalize)
{
  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(10), "V1").ok());

  this->put("V1", Location::storage(10));
  ASSERT_TRUE(this->inventory.load("V1", Location::transfer(1), changer).ok());

  tlm::StatusOr<MoveIntent> intent =
      this->inventory.prepare_move(MoveKind::kUnload, "V1", tlm::None);
  ASSERT_TRUE(intent.ok());
  ASSERT_EQ(intent->dst, Location::storage(10));

  // Still in the drive as far as the library knows; the audit sets Mounted again.
  //
  ASSERT_TRUE(this->inventory.audit(changer).ok());
  ASSERT_TRUE(this->info("V1").flags.test(VolumeFlag::kMounted));

  ASSERT_TRUE(this->inventory.finalize_move(*intent).ok());

  Volume v1 = this->info("V1");

  EXPECT_TRUE(tlm::check_volume_invariants(v1).ok()) << v1;
  EXPECT_EQ(v1.location, Optional<Location>{Location::storage(10)});
  EXPECT_FALSE(v1.flags.test(VolumeFlag::kMounted));
  EXPECT_FALSE(v1.flags.test(VolumeFlag::kTransfering));
  EXPECT_FALSE(v1.home);
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Concurrency.

TEST_F(InventoryTest, ConcurrentLoadsOfOneVolume)
{
  tlm::suppress_log_output_for_test() = true;

  this->put("V1", Location::storage(10));

  std::promise<void> entered_phase2;
  std::promise<void> release_phase2;
  std::shared_future<void> released = release_phase2.get_future().share();

  MockChanger changer;
  EXPECT_CALL(changer, load(Location::storage(10), _))
      .Times(1)
      .WillOnce([&](const Location&, const Location&) -> tlm::Status {
        entered_phase2.set_value();
        released.wait();
        return tlm::OkStatus();
      });

  tlm::Status first_status;
  std::thread first{[&] {
    first_status = this->inventory.load("V1", Location::transfer(1), changer);
  }};

  entered_phase2.get_future().wait();

  // The first load has committed its intent, so the second sees no location and is rejected
  // without reaching the changer.
  //
  tlm::Status second_status = this->inventory.load("V1", Location::transfer(2), changer);

  release_phase2.set_value();
  first.join();

  EXPECT_TRUE(first_status.ok()) << BATT_INSPECT(first_status);
  EXPECT_EQ(second_status, StatusCode::kLoadInvalidSource);
  EXPECT_EQ(this->info("V1").location, Optional<Location>{Location::transfer(1)});

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(InventoryTest, RacingLoadsOfOneVolume)
{
  tlm::suppress_log_output_for_test() = true;

  for (int round = 0; round < 20; ++round) {
    const VolumeSerial serial = batt::to_string("R", round);
    this->put(serial, Location::storage(100 + round));

    std::atomic<int> changer_calls{0};
    MockChanger changer;
    EXPECT_CALL(changer, load(_, _)).WillRepeatedly([&](const Location&, const Location&) {
      changer_calls.fetch_add(1);
      std::this_thread::yield();
      return tlm::OkStatus();
    });

    tlm::Status results[2];
    std::thread racers[2] = {
        std::thread{[&] {
          results[0] = this->inventory.load(serial, Location::transfer(1), changer);
        }},
        std::thread{[&] {
          results[1] = this->inventory.load(serial, Location::transfer(2), changer);
        }},
    };
    for (std::thread& t : racers) {
      t.join();
    }

    EXPECT_EQ(changer_calls.load(), 1);
    EXPECT_NE(results[0].ok(), results[1].ok()) << BATT_INSPECT(results[0]) << BATT_INSPECT(results[1]);
    for (const tlm::Status& status : results) {
      if (!status.ok()) {
        EXPECT_EQ(status, StatusCode::kLoadInvalidSource);
      }
    }

    // Clear the drives for the next round.
    //
    tlm::FakeChanger fake;
    ASSERT_TRUE(this->inventory.unload(serial, tlm::None, fake).ok());
  }

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(InventoryTest, DifferentVolumesMoveInParallel)
{
  this->put("V1", Location::storage(1));
  this->put("V2", Location::storage(2));

  std::promise<void> entered_phase2;
  std::promise<void> release_phase2;
  std::shared_future<void> released = release_phase2.get_future().share();

  MockChanger changer;
  EXPECT_CALL(changer, load(Location::storage(1), Location::transfer(1)))
      .WillOnce([&](const Location&, const Location&) -> tlm::Status {
        entered_phase2.set_value();
        released.wait();
        return tlm::OkStatus();
      });
  EXPECT_CALL(changer, load(Location::storage(2), Location::transfer(2)))
      .WillOnce(Return(tlm::OkStatus()));

  tlm::Status first_status;
  std::thread first{[&] {
    first_status = this->inventory.load("V1", Location::transfer(1), changer);
  }};

  entered_phase2.get_future().wait();

  EXPECT_TRUE(this->inventory.load("V2", Location::transfer(2), changer).ok());
  EXPECT_EQ(this->info("V2").location, Optional<Location>{Location::transfer(2)});

  release_phase2.set_value();
  first.join();

  EXPECT_TRUE(first_status.ok());
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Allocation.

TEST_F(InventoryTest, AllocPrefersFilling)
{
  this->put("B", Location::storage(2), VolumeCategory::kScratch);
  this->put("A", Location::storage(1), VolumeCategory::kFilling);

  for (int i = 0; i < 3; ++i) {
    tlm::StatusOr<VolumeSerial> serial = this->inventory.alloc();
    ASSERT_TRUE(serial.ok());
    EXPECT_EQ(*serial, "A");
    EXPECT_EQ(this->info("A").category, VolumeCategory::kFilling);
  }

  EXPECT_EQ(this->info("B").category, VolumeCategory::kScratch);
  EXPECT_EQ(this->inventory.metrics().allocs.load(), 3u);
}

TEST_F(InventoryTest, AllocPromotesScratchInSerialOrder)
{
  tlm::suppress_log_output_for_test() = true;

  this->put("S3", Location::storage(3));
  this->put("S1", Location::storage(1));
  this->put("S2", Location::storage(2));
  this->put("S0", Location::transfer(1));
  this->put("F0", Location::storage(4), VolumeCategory::kFull);

  std::vector<VolumeSerial> order;
  for (;;) {
    tlm::StatusOr<VolumeSerial> serial = this->inventory.alloc();
    if (!serial.ok()) {
      EXPECT_EQ(serial.status(), StatusCode::kExhausted);
      break;
    }
    EXPECT_EQ(this->info(*serial).category, VolumeCategory::kAllocating);
    order.emplace_back(*serial);
  }

  // S0 sits in a drive and F0 is full; neither is eligible.
  //
  EXPECT_THAT(order, ElementsAre("S1", "S2", "S3"));

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(InventoryTest, AllocExhausted)
{
  tlm::suppress_log_output_for_test() = true;

  EXPECT_EQ(this->inventory.alloc().status(), StatusCode::kExhausted);

  tlm::suppress_log_output_for_test() = false;
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Audit.

TEST_F(InventoryTest, AuditRegistersAndReconciles)
{
  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(1), "A00001").ok());
  ASSERT_TRUE(changer.insert(Location::storage(2), "CLN001").ok());
  ASSERT_TRUE(changer.insert(Location::transfer(1), "B00002").ok());
  ASSERT_TRUE(changer.insert(Location::import_export(1), "C00003").ok());

  // Known, but recorded in the wrong slot; its category and conditions survive the audit.
  //
  this->put("B00002", Location::storage(5), VolumeCategory::kFilling);
  {
    Volume b = this->info("B00002");
    b.flags.set(VolumeFlag::kNeedsCleaning).set(VolumeFlag::kFormatted);
    ASSERT_TRUE(this->inventory.update(b).ok());
  }

  // Not in the library at all; left alone.
  //
  this->put("Z00009", Location::storage(9), VolumeCategory::kFull);

  tlm::StatusOr<AuditReport> report = this->inventory.audit(changer);
  ASSERT_TRUE(report.ok()) << BATT_INSPECT(report.status());

  EXPECT_EQ(*report, (AuditReport{/*added=*/3, /*updated=*/1, /*unchanged=*/0, /*displaced=*/0}));

  EXPECT_EQ(this->info("A00001").category, VolumeCategory::kScratch);
  EXPECT_EQ(this->info("A00001").location, Optional<Location>{Location::storage(1)});
  EXPECT_TRUE(this->info("A00001").flags.empty());

  EXPECT_EQ(this->info("CLN001").category, VolumeCategory::kCleaning);
  EXPECT_EQ(this->info("C00003").location, Optional<Location>{Location::import_export(1)});

  Volume b = this->info("B00002");
  EXPECT_EQ(b.location, Optional<Location>{Location::transfer(1)});
  EXPECT_EQ(b.category, VolumeCategory::kFilling);
  EXPECT_TRUE(b.flags.test(VolumeFlag::kMounted));
  EXPECT_TRUE(b.flags.test(VolumeFlag::kNeedsCleaning));
  EXPECT_TRUE(b.flags.test(VolumeFlag::kFormatted));
  EXPECT_FALSE(b.flags.test(VolumeFlag::kTransfering));

  EXPECT_EQ(this->info("Z00009").location, Optional<Location>{Location::storage(9)});
  EXPECT_EQ(this->info("Z00009").category, VolumeCategory::kFull);

  EXPECT_EQ(this->inventory.metrics().audits.load(), 1u);
}

TEST_F(InventoryTest, AuditIsIdempotent)
{
  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(1), "A00001").ok());
  ASSERT_TRUE(changer.insert(Location::storage(3), "CLN001").ok());
  ASSERT_TRUE(changer.insert(Location::transfer(2), "B00002").ok());

  tlm::StatusOr<AuditReport> first = this->inventory.audit(changer);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first->added, 3u);

  tlm::StatusOr<std::vector<Volume>> before = this->inventory.volumes();
  ASSERT_TRUE(before.ok());

  tlm::StatusOr<AuditReport> second = this->inventory.audit(changer);
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(*second, (AuditReport{/*added=*/0, /*updated=*/0, /*unchanged=*/3, /*displaced=*/0}));

  tlm::StatusOr<std::vector<Volume>> after = this->inventory.volumes();
  ASSERT_TRUE(after.ok());
  EXPECT_EQ(*before, *after);
}

TEST_F(InventoryTest, AuditKeepsHomeOfMountedVolume)
{
  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(6), "V1").ok());

  this->put("V1", Location::storage(6));
  ASSERT_TRUE(this->inventory.load("V1", Location::transfer(1), changer).ok());

  tlm::StatusOr<AuditReport> report = this->inventory.audit(changer);
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report->unchanged, 1u);

  EXPECT_EQ(this->info("V1").home, Optional<Location>{Location::storage(6)});

  ASSERT_TRUE(this->inventory.unload("V1", tlm::None, changer).ok());
  EXPECT_EQ(changer.contents(Location::storage(6)).value_or(std::string{}), "V1");
}

TEST_F(InventoryTest, AuditHandlesSwapsAndDisplacedVolumes)
{
  tlm::suppress_log_output_for_test() = true;

  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(1), "B").ok());
  ASSERT_TRUE(changer.insert(Location::storage(2), "A").ok());
  ASSERT_TRUE(changer.insert(Location::storage(3), "N").ok());

  this->put("A", Location::storage(1));
  this->put("B", Location::storage(2));
  this->put("GONE", Location::storage(3));

  tlm::StatusOr<AuditReport> report = this->inventory.audit(changer);
  ASSERT_TRUE(report.ok()) << BATT_INSPECT(report.status());

  EXPECT_EQ(*report, (AuditReport{/*added=*/1, /*updated=*/2, /*unchanged=*/0, /*displaced=*/1}));

  EXPECT_EQ(this->info("A").location, Optional<Location>{Location::storage(2)});
  EXPECT_EQ(this->info("B").location, Optional<Location>{Location::storage(1)});
  EXPECT_EQ(this->info("N").location, Optional<Location>{Location::storage(3)});
  EXPECT_FALSE(this->info("GONE").location);

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(EmptyPrefixInventoryTest, AuditEmptyPrefixMatchesNothing)
{
  SimulatedChanger changer{test_library()};
  ASSERT_TRUE(changer.insert(Location::storage(1), "CLN001").ok());

  ASSERT_TRUE(this->inventory.audit(changer).ok());

  EXPECT_EQ(this->info("CLN001").category, VolumeCategory::kScratch);
}

TEST_F(InventoryTest, AuditChangerError)
{
  MockChanger changer;
  EXPECT_CALL(changer, status())
      .WillOnce(Return(tlm::make_status(StatusCode::kSimulatedChangerFault)));

  EXPECT_EQ(this->inventory.audit(changer).status(), StatusCode::kSimulatedChangerFault);
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Queries and records.

TEST_F(InventoryTest, Loaded)
{
  this->put("V1", Location::storage(1));

  tlm::FakeChanger changer;
  ASSERT_TRUE(this->inventory.load("V1", Location::transfer(2), changer).ok());

  tlm::StatusOr<Optional<VolumeSerial>> loaded = this->inventory.loaded(Location::transfer(2));
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ(loaded->value_or(VolumeSerial{}), "V1");

  // Empty drive: not an error.
  //
  loaded = this->inventory.loaded(Location::transfer(1));
  ASSERT_TRUE(loaded.ok());
  EXPECT_FALSE(*loaded);

  // Only the address matters.
  //
  loaded = this->inventory.loaded(Location::storage(2));
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ(loaded->value_or(VolumeSerial{}), "V1");
}

TEST_F(InventoryTest, PathIndex)
{
  this->put("V1", Location::storage(1), VolumeCategory::kFilling);

  const tlm::PathName path = *tlm::PathName::parse("/backups/2018/db.tar");

  ASSERT_TRUE(this->inventory.create(path, "V1").ok());
  EXPECT_EQ(this->inventory.create(path, "V1"), StatusCode::kAlreadyExists);
  EXPECT_EQ(this->inventory.create(*tlm::PathName::parse("/other"), "NOSUCH"),
            StatusCode::kVolumeNotFound);

  tlm::StatusOr<Volume> found = this->inventory.lookup(*tlm::PathName::parse("//backups/2018/db.tar/"));
  ASSERT_TRUE(found.ok()) << BATT_INSPECT(found.status());
  EXPECT_EQ(*found, this->info("V1"));

  EXPECT_EQ(this->inventory.lookup(*tlm::PathName::parse("/backups")).status(),
            StatusCode::kPathNotFound);

  ASSERT_TRUE(this->inventory.create(*tlm::PathName::parse("/backups/2017/db.tar"), "V1").ok());

  tlm::StatusOr<std::vector<tlm::PathName>> paths = this->inventory.paths("V1");
  ASSERT_TRUE(paths.ok());
  EXPECT_THAT(*paths, ElementsAre(*tlm::PathName::parse("/backups/2017/db.tar"), path));
}

TEST_F(InventoryTest, AddAndUpdate)
{
  tlm::suppress_log_output_for_test() = true;

  Volume v;
  v.serial = "V1";
  v.location = Location::storage(1);
  v.category = VolumeCategory::kScratch;

  ASSERT_TRUE(this->inventory.add(v).ok());
  EXPECT_EQ(this->inventory.add(v), StatusCode::kAlreadyExists);

  Volume full = v;
  full.serial = "V2";
  full.location = Location::storage(2);
  full.category = VolumeCategory::kFull;
  EXPECT_EQ(this->inventory.add(full), StatusCode::kInvalidVolumeState);

  Volume collide = v;
  collide.serial = "V3";
  EXPECT_EQ(this->inventory.add(collide), StatusCode::kLocationOccupied);

  // Scratch -> Full skips the allocation lifecycle.
  //
  Volume updated = v;
  updated.category = VolumeCategory::kFull;
  EXPECT_EQ(this->inventory.update(updated), StatusCode::kInvalidVolumeState);

  // Mounted outside a transfer slot.
  //
  updated = v;
  updated.flags.set(VolumeFlag::kMounted);
  EXPECT_EQ(this->inventory.update(updated), StatusCode::kInvalidVolumeState);

  updated = v;
  updated.serial = "NOSUCH";
  EXPECT_EQ(this->inventory.update(updated), StatusCode::kVolumeNotFound);

  updated = v;
  updated.category = VolumeCategory::kDamaged;
  updated.location = Location::import_export(2);
  updated.flags.set(VolumeFlag::kNeedsCleaning);
  ASSERT_TRUE(this->inventory.update(updated).ok());
  EXPECT_EQ(this->info("V1"), updated);

  EXPECT_EQ(this->inventory.info("NOSUCH").status(), StatusCode::kVolumeNotFound);

  tlm::suppress_log_output_for_test() = false;
}

TEST_F(InventoryTest, VolumesAndReset)
{
  tlm::suppress_log_output_for_test() = true;

  this->put("C", Location::storage(3));
  this->put("A", Location::storage(1));
  this->put("B", tlm::None);

  tlm::StatusOr<std::vector<Volume>> volumes = this->inventory.volumes();
  ASSERT_TRUE(volumes.ok());
  ASSERT_EQ(volumes->size(), 3u);
  EXPECT_EQ((*volumes)[0].serial, "A");
  EXPECT_EQ((*volumes)[1].serial, "B");
  EXPECT_EQ((*volumes)[2].serial, "C");

  ASSERT_TRUE(this->inventory.reset().ok());

  volumes = this->inventory.volumes();
  ASSERT_TRUE(volumes.ok());
  EXPECT_TRUE(volumes->empty());

  tlm::suppress_log_output_for_test() = false;
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
TEST_F(InventoryTest, SimulatedLibraryWorkflow)
{
  SimulatedChanger changer{test_library()};
  for (int i = 1; i <= 4; ++i) {
    ASSERT_TRUE(changer.insert(Location::storage(i), batt::to_string("T0000", i)).ok());
  }

  ASSERT_TRUE(this->inventory.audit(changer).ok());

  tlm::StatusOr<VolumeSerial> serial = this->inventory.alloc();
  ASSERT_TRUE(serial.ok());
  EXPECT_EQ(*serial, "T00001");

  ASSERT_TRUE(this->inventory.load(*serial, Location::transfer(1), changer).ok());
  EXPECT_EQ(this->info(*serial).category, VolumeCategory::kAllocated);
  EXPECT_EQ(this->inventory.loaded(Location::transfer(1))->value_or(VolumeSerial{}), *serial);
  EXPECT_EQ(changer.contents(Location::transfer(1)).value_or(std::string{}), *serial);

  // The drive is busy; the robot refuses and the record is left in transit.
  //
  tlm::suppress_log_output_for_test() = true;
  EXPECT_EQ(this->inventory.load("T00002", Location::transfer(1), changer),
            StatusCode::kChangerDestinationOccupied);
  tlm::suppress_log_output_for_test() = false;

  ASSERT_TRUE(this->inventory.audit(changer).ok());
  EXPECT_EQ(this->info("T00002").location, Optional<Location>{Location::storage(2)});

  ASSERT_TRUE(this->inventory.unload(*serial, Location::import_export(1), changer).ok());
  ASSERT_TRUE(this->inventory.transfer(*serial, Location::storage(1), changer).ok());

  // A final audit agrees with every record.
  //
  tlm::StatusOr<AuditReport> report = this->inventory.audit(changer);
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(*report, (AuditReport{/*added=*/0, /*updated=*/0, /*unchanged=*/4, /*displaced=*/0}));
}

}  // namespace
