//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_INVENTORY_REGISTRY_HPP
#define TLM_INVENTORY_REGISTRY_HPP

#include <tlm/config.hpp>
//
#include <tlm/backend_registry.hpp>
#include <tlm/config_options.hpp>
#include <tlm/inventory.hpp>

#include <memory>
#include <string>

namespace tlm {

using InventoryRegistry = BackendRegistry<Inventory>;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
struct MemoryInventoryOptions {
  std::string cleaning_prefix;

  /** \brief Requires `cleaning-prefix`; rejects any other key.
   */
  static StatusOr<MemoryInventoryOptions> from_config(const ConfigOptions& options);
};

/** \brief Creates an Inventory over a fresh MemoryVolumeStore.
 */
StatusOr<std::unique_ptr<Inventory>> make_memory_inventory(const ConfigOptions& options);

/** \brief Connects to PostgreSQL and creates an Inventory over it.  The options are validated
 * before any connection attempt.
 */
StatusOr<std::unique_ptr<Inventory>> make_postgres_inventory(const ConfigOptions& options);

/** \brief Returns a registry containing every inventory backend built into this library:
 * "memory" and "postgres".
 */
InventoryRegistry make_default_inventory_registry();

}  // namespace tlm

#endif  // TLM_INVENTORY_REGISTRY_HPP
