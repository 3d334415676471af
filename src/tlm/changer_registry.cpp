//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/changer_registry.hpp>
//

#include <tlm/fake_changer.hpp>
#include <tlm/simulated_changer.hpp>

#include <batteries/assert.hpp>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
ChangerRegistry make_default_changer_registry()
{
  ChangerRegistry registry;

  BATT_CHECK_OK(registry.add("fake", &FakeChanger::make));
  BATT_CHECK_OK(registry.add("simulated", &SimulatedChanger::make));

  return registry;
}

}  // namespace tlm
