//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/status_code.hpp>
//

#include <batteries/status.hpp>

namespace tlm {

#define CODE_WITH_MSG_(code, msg)                                                                  \
  {                                                                                                \
    code, msg " (" #code ")"                                                                       \
  }

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static bool const initialized = batt::Status::register_codes<StatusCode>({
      CODE_WITH_MSG_(StatusCode::kOk, "Ok"),                                             // 0
      CODE_WITH_MSG_(StatusCode::kInvalidCategory, "Unrecognized volume category name"),  // 1
      CODE_WITH_MSG_(StatusCode::kInvalidSlotCategory, "Unrecognized slot category name"),  // 2
      CODE_WITH_MSG_(StatusCode::kLoadInvalidSource,
                     "Invalid transition: load source must be a storage or import/export "
                     "slot"),  // 3
      CODE_WITH_MSG_(StatusCode::kLoadInvalidDestination,
                     "Invalid transition: load destination must be a transfer slot"),  // 4
      CODE_WITH_MSG_(StatusCode::kUnloadInvalidSource,
                     "Invalid transition: unload source must be a transfer slot"),  // 5
      CODE_WITH_MSG_(StatusCode::kUnloadInvalidDestination,
                     "Invalid transition: unload destination must be a storage or import/export "
                     "slot"),  // 6
      CODE_WITH_MSG_(StatusCode::kTransferInvalidSource,
                     "Invalid transition: transfer source must be a storage or import/export "
                     "slot"),  // 7
      CODE_WITH_MSG_(StatusCode::kTransferInvalidDestination,
                     "Invalid transition: transfer destination must be a storage or "
                     "import/export slot"),  // 8
      CODE_WITH_MSG_(StatusCode::kInvalidVolumeState,
                     "The requested volume state violates a category or flag rule"),  // 9
      CODE_WITH_MSG_(StatusCode::kInvalidPath, "Malformed tree path"),                 // 10
      CODE_WITH_MSG_(StatusCode::kVolumeNotFound, "No volume with the given serial"),  // 11
      CODE_WITH_MSG_(StatusCode::kPathNotFound, "No volume is mapped to the given path"),  // 12
      CODE_WITH_MSG_(StatusCode::kAlreadyExists, "The record already exists"),              // 13
      CODE_WITH_MSG_(StatusCode::kExhausted,
                     "No scratch or filling volume is available for allocation"),  // 14
      CODE_WITH_MSG_(StatusCode::kLocationOccupied,
                     "Another volume is already recorded at the given location"),  // 15
      CODE_WITH_MSG_(StatusCode::kFinalizeFailed,
                     "The physical move completed but the inventory could not be updated; run an "
                     "audit"),  // 16
      CODE_WITH_MSG_(StatusCode::kMissingConfigOption,
                     "A required configuration option was not specified"),  // 17
      CODE_WITH_MSG_(StatusCode::kUnknownConfigOption,
                     "Unrecognized configuration option"),  // 18
      CODE_WITH_MSG_(StatusCode::kInvalidConfigValue,
                     "A configuration option has a malformed value"),  // 19
      CODE_WITH_MSG_(StatusCode::kUnknownBackend,
                     "No backend is registered under the given name"),  // 20
      CODE_WITH_MSG_(StatusCode::kStoreConnectFailed,
                     "Could not connect to the inventory database"),  // 21
      CODE_WITH_MSG_(StatusCode::kStoreQueryFailed,
                     "An inventory database statement failed"),  // 22
      CODE_WITH_MSG_(StatusCode::kStoreTransactionClosed,
                     "The inventory transaction was already committed or rolled back"),  // 23
      CODE_WITH_MSG_(StatusCode::kChangerSourceEmpty,
                     "Media changer fault: the source slot holds no media"),  // 24
      CODE_WITH_MSG_(StatusCode::kChangerDestinationOccupied,
                     "Media changer fault: the destination slot is occupied"),  // 25
      CODE_WITH_MSG_(StatusCode::kChangerUnknownSlot,
                     "Media changer fault: no such slot element"),  // 26
      CODE_WITH_MSG_(StatusCode::kSimulatedChangerFault,
                     "SimulatedChanger failed (as requested; TESTING ONLY)"),  // 27
  });
  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
::batt::Status make_status(StatusCode code)
{
  initialize_status_codes();

  return ::batt::Status{code};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool is_invalid_transition(const ::batt::Status& status)
{
  return status == StatusCode::kLoadInvalidSource ||          //
         status == StatusCode::kLoadInvalidDestination ||     //
         status == StatusCode::kUnloadInvalidSource ||        //
         status == StatusCode::kUnloadInvalidDestination ||   //
         status == StatusCode::kTransferInvalidSource ||      //
         status == StatusCode::kTransferInvalidDestination;
}

}  // namespace tlm
