//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_CONFIG_HPP
#define TLM_CONFIG_HPP

#include <tlm/int_types.hpp>

#include <atomic>

namespace tlm {

// The number of pooled connections a PostgresVolumeStore opens when `max-connections` is not
// configured.
//
constexpr usize kDefaultMaxStoreConnections = 4;

// The number of slots of each kind a SimulatedChanger models when no count is configured.
//
constexpr i64 kDefaultSimulatedStorageSlots = 32;
constexpr i64 kDefaultSimulatedTransferSlots = 2;
constexpr i64 kDefaultSimulatedImportExportSlots = 4;

// ** FOR TESTING ONLY **
//
// Suppress ERROR/WARNING level output for expected errors while running unit tests.
//
inline std::atomic<bool>& suppress_log_output_for_test()
{
  static std::atomic<bool> value_{false};
  return value_;
}

}  // namespace tlm

#endif  // TLM_CONFIG_HPP
