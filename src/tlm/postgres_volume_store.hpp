//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_POSTGRES_VOLUME_STORE_HPP
#define TLM_POSTGRES_VOLUME_STORE_HPP

#include <tlm/config.hpp>
//
#include <tlm/config_options.hpp>
#include <tlm/int_types.hpp>
#include <tlm/volume_store.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward-declared so that libpq-fe.h stays out of the public headers.
//
struct pg_conn;

namespace tlm {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
struct PostgresInventoryOptions {
  std::string dbhost;
  std::string dbname;
  std::string username;
  std::string password;

  // Serials starting with this prefix are registered as cleaning cartridges by an audit.
  //
  std::string cleaning_prefix;

  Optional<i64> port;
  std::string sslmode = "disable";
  usize max_connections = kDefaultMaxStoreConnections;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Validates `options`; all required keys are checked before any connection is made.
   *
   * Required: `dbhost`, `dbname`, `username`, `password`, `cleaning-prefix`.  Optional: `port`,
   * `sslmode`, `max-connections`.
   */
  static StatusOr<PostgresInventoryOptions> from_config(const ConfigOptions& options);

  /** \brief Returns the libpq connection string for these options, with every value quoted.
   */
  std::string connection_string() const;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief A VolumeStore backed by a PostgreSQL database, accessed through libpq.
 *
 * Row locks are PostgreSQL row locks (`SELECT ... FOR UPDATE`); allocation uses `SKIP LOCKED`.
 * Location uniqueness is enforced by a partial unique index on `volumes`.  Connections are pooled;
 * each open Transaction holds one connection until it finishes.
 */
class PostgresVolumeStore : public VolumeStore
{
 public:
  class TransactionImpl;
  class PooledConnection;

  /** \brief Connects to the database (one connection, to fail fast on bad credentials) and returns
   * the store.  The schema is not created; call reset() to bootstrap an empty database.
   */
  static StatusOr<std::unique_ptr<PostgresVolumeStore>> open(
      const PostgresInventoryOptions& options);

  explicit PostgresVolumeStore(const PostgresInventoryOptions& options) noexcept;

  ~PostgresVolumeStore() noexcept override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // VolumeStore interface.

  StatusOr<std::unique_ptr<Transaction>> begin() override;

  StatusOr<Optional<Volume>> get_volume(const VolumeSerial& serial) override;

  StatusOr<std::vector<Volume>> list_volumes() override;

  StatusOr<Optional<Volume>> find_at(const Location& location) override;

  Status insert_path(const PathName& path, const VolumeSerial& serial) override;

  StatusOr<Optional<VolumeSerial>> lookup_path(const PathName& path) override;

  StatusOr<std::vector<PathName>> paths_for(const VolumeSerial& serial) override;

  Status reset() override;

 private:
  /** \brief Takes an idle connection from the pool, opening a new one if the pool is below its
   * limit, or waits for one to be released.
   */
  StatusOr<PooledConnection> acquire_connection();

  void release_connection(pg_conn* conn);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const PostgresInventoryOptions options_;
  const std::string conninfo_;

  std::mutex pool_mutex_;
  std::condition_variable pool_available_;
  std::vector<pg_conn*> idle_connections_;
  usize open_connection_count_ = 0;
};

}  // namespace tlm

#endif  // TLM_POSTGRES_VOLUME_STORE_HPP
