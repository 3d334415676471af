//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/inventory_registry.hpp>
//

#include <tlm/memory_volume_store.hpp>
#include <tlm/postgres_volume_store.hpp>

#include <batteries/assert.hpp>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<MemoryInventoryOptions> MemoryInventoryOptions::from_config(
    const ConfigOptions& options)
{
  BATT_REQUIRE_OK(reject_unknown_config_keys(options, {"cleaning-prefix"}, "MemoryInventory"));
  BATT_REQUIRE_OK(require_config_keys(options, {"cleaning-prefix"}, "MemoryInventory"));

  MemoryInventoryOptions result;
  result.cleaning_prefix = options.at("cleaning-prefix");

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::unique_ptr<Inventory>> make_memory_inventory(const ConfigOptions& options)
{
  BATT_ASSIGN_OK_RESULT(MemoryInventoryOptions memory_options,
                        MemoryInventoryOptions::from_config(options));

  InventoryOptions inventory_options;
  inventory_options.name = "memory";
  inventory_options.cleaning_prefix = std::move(memory_options.cleaning_prefix);

  return std::make_unique<Inventory>(std::make_unique<MemoryVolumeStore>(), inventory_options);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::unique_ptr<Inventory>> make_postgres_inventory(const ConfigOptions& options)
{
  BATT_ASSIGN_OK_RESULT(PostgresInventoryOptions postgres_options,
                        PostgresInventoryOptions::from_config(options));

  BATT_ASSIGN_OK_RESULT(std::unique_ptr<PostgresVolumeStore> store,
                        PostgresVolumeStore::open(postgres_options));

  InventoryOptions inventory_options;
  inventory_options.name = "postgres";
  inventory_options.cleaning_prefix = postgres_options.cleaning_prefix;

  return std::make_unique<Inventory>(std::move(store), inventory_options);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
InventoryRegistry make_default_inventory_registry()
{
  InventoryRegistry registry;

  BATT_CHECK_OK(registry.add("memory", &make_memory_inventory));
  BATT_CHECK_OK(registry.add("postgres", &make_postgres_inventory));

  return registry;
}

}  // namespace tlm
