//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_STATUS_CODE_HPP
#define TLM_STATUS_CODE_HPP

#include <batteries/status.hpp>

namespace tlm {

enum struct StatusCode {
  kOk = 0,
  kInvalidCategory = 1,
  kInvalidSlotCategory = 2,
  kLoadInvalidSource = 3,
  kLoadInvalidDestination = 4,
  kUnloadInvalidSource = 5,
  kUnloadInvalidDestination = 6,
  kTransferInvalidSource = 7,
  kTransferInvalidDestination = 8,
  kInvalidVolumeState = 9,
  kInvalidPath = 10,
  kVolumeNotFound = 11,
  kPathNotFound = 12,
  kAlreadyExists = 13,
  kExhausted = 14,
  kLocationOccupied = 15,
  kFinalizeFailed = 16,
  kMissingConfigOption = 17,
  kUnknownConfigOption = 18,
  kInvalidConfigValue = 19,
  kUnknownBackend = 20,
  kStoreConnectFailed = 21,
  kStoreQueryFailed = 22,
  kStoreTransactionClosed = 23,
  kChangerSourceEmpty = 24,
  kChangerDestinationOccupied = 25,
  kChangerUnknownSlot = 26,
  kSimulatedChangerFault = 27,
};

bool initialize_status_codes();

::batt::Status make_status(StatusCode code);

/** \brief Returns true iff `status` reports a move whose source or destination slot category does
 * not match the current state of the volume (the InvalidTransition family of codes).
 */
bool is_invalid_transition(const ::batt::Status& status);

}  // namespace tlm

#endif  // TLM_STATUS_CODE_HPP
