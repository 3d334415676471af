//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_INVENTORY_METRICS_HPP
#define TLM_INVENTORY_METRICS_HPP

#include <tlm/int_types.hpp>
#include <tlm/metrics.hpp>

namespace tlm {

struct InventoryMetrics {
  CountMetric<u64> loads{0};
  CountMetric<u64> unloads{0};
  CountMetric<u64> transfers{0};
  CountMetric<u64> allocs{0};
  CountMetric<u64> audits{0};

  // Moves whose physical action failed; the volume is left in transit until the next audit.
  //
  CountMetric<u64> move_failures{0};

  // Moves that completed physically but could not be recorded.
  //
  CountMetric<u64> finalize_failures{0};
};

}  // namespace tlm

#endif  // TLM_INVENTORY_METRICS_HPP
