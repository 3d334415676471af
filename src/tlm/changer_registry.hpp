//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_CHANGER_REGISTRY_HPP
#define TLM_CHANGER_REGISTRY_HPP

#include <tlm/config.hpp>
//
#include <tlm/backend_registry.hpp>
#include <tlm/changer.hpp>

namespace tlm {

using ChangerRegistry = BackendRegistry<Changer>;

/** \brief Returns a registry containing every changer backend built into this library:
 * "fake" (FakeChanger) and "simulated" (SimulatedChanger).
 */
ChangerRegistry make_default_changer_registry();

}  // namespace tlm

#endif  // TLM_CHANGER_REGISTRY_HPP
