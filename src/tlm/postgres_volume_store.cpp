//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/postgres_volume_store.hpp>
//

#include <tlm/logging.hpp>

#include <batteries/assert.hpp>

#include <boost/lexical_cast.hpp>

#include <libpq-fe.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <sstream>
#include <string_view>
#include <utility>

namespace tlm {

namespace {

// Columns selected for every Volume read; decode_volume depends on this order.
//
#define TLM_PG_VOLUME_COLUMNS                                                                      \
  " serial, (location).addr, (location).category, (home).addr, (home).category, category, flags "

constexpr const char* kLocationIndexName = "volumes_location_key";

constexpr const char* kSchemaSql = R"sql(
DROP TABLE IF EXISTS tree;
DROP TABLE IF EXISTS volumes;
DROP FUNCTION IF EXISTS make_location(bigint, slot_category);
DROP TYPE IF EXISTS location CASCADE;
DROP TYPE IF EXISTS volume_category;
DROP TYPE IF EXISTS slot_category;

CREATE TYPE slot_category AS ENUM (
  'storage', 'transfer', 'import-export', 'cleaning'
);

CREATE TYPE volume_category AS ENUM (
  'unknown', 'allocating', 'allocated', 'scratch', 'filling', 'full', 'missing', 'damaged',
  'cleaning'
);

CREATE TYPE location AS (
  addr bigint,
  category slot_category
);

CREATE FUNCTION make_location(a bigint, c slot_category) RETURNS location AS $$
  SELECT CASE WHEN a IS NULL THEN NULL ELSE ROW(a, c)::location END
$$ LANGUAGE SQL IMMUTABLE;

CREATE TABLE volumes (
  serial text PRIMARY KEY,
  location location,
  home location,
  category volume_category NOT NULL,
  flags integer NOT NULL DEFAULT 0
);

CREATE UNIQUE INDEX volumes_location_key ON volumes (((location).addr), ((location).category))
  WHERE location IS NOT NULL;

CREATE TABLE tree (
  path text PRIMARY KEY,
  serial text NOT NULL REFERENCES volumes (serial)
);
)sql";

//+++++++++++-+-+--+----- --- -- -  -  -   -

struct PgResultDeleter {
  void operator()(PGresult* result) const noexcept
  {
    PQclear(result);
  }
};

using PgResult = std::unique_ptr<PGresult, PgResultDeleter>;

using SqlParam = Optional<std::string>;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status status_from_result(PGconn* conn, const PGresult* result, std::string_view sql)
{
  const char* sqlstate = (result == nullptr) ? nullptr : PQresultErrorField(result, PG_DIAG_SQLSTATE);

  if (sqlstate != nullptr) {
    // unique_violation
    //
    if (std::strcmp(sqlstate, "23505") == 0) {
      const char* constraint = PQresultErrorField(result, PG_DIAG_CONSTRAINT_NAME);
      if (constraint != nullptr && std::strcmp(constraint, kLocationIndexName) == 0) {
        return make_status(StatusCode::kLocationOccupied);
      }
      return make_status(StatusCode::kAlreadyExists);
    }
    // foreign_key_violation
    //
    if (std::strcmp(sqlstate, "23503") == 0) {
      return make_status(StatusCode::kVolumeNotFound);
    }
  }

  TLM_LOG_ERROR() << "statement failed: " << PQerrorMessage(conn) << BATT_INSPECT(sql);
  return make_status(StatusCode::kStoreQueryFailed);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<PgResult> exec_sql(PGconn* conn, const char* sql, const std::vector<SqlParam>& params = {})
{
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const SqlParam& param : params) {
    values.emplace_back(param ? param->c_str() : nullptr);
  }

  PgResult result{PQexecParams(conn, sql, static_cast<int>(values.size()), /*paramTypes=*/nullptr,
                               values.data(), /*paramLengths=*/nullptr, /*paramFormats=*/nullptr,
                               /*resultFormat=*/0)};

  if (result != nullptr) {
    switch (PQresultStatus(result.get())) {
      case PGRES_COMMAND_OK:
      case PGRES_TUPLES_OK:
        return result;
      default:
        break;
    }
  }
  return status_from_result(conn, result.get(), sql);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
SqlParam location_addr_param(const Optional<Location>& location)
{
  if (!location) {
    return None;
  }
  return std::to_string(location->addr);
}

SqlParam location_category_param(const Optional<Location>& location)
{
  if (!location) {
    return None;
  }
  return std::string{to_string(location->category)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::vector<SqlParam> volume_params(const Volume& volume)
{
  return {
      volume.serial,
      location_addr_param(volume.location),
      location_category_param(volume.location),
      location_addr_param(volume.home),
      location_category_param(volume.home),
      std::string{to_string(volume.category)},
      std::to_string(volume.flags.bits()),
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename T>
StatusOr<T> decode_int(const PGresult* result, int row, int column)
{
  T value = 0;
  if (!boost::conversion::try_lexical_convert(PQgetvalue(result, row, column), value)) {
    TLM_LOG_ERROR() << "malformed integer in result column " << column << ": "
                    << PQgetvalue(result, row, column);
    return make_status(StatusCode::kStoreQueryFailed);
  }
  return value;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<Location>> decode_location(const PGresult* result, int row, int addr_column)
{
  if (PQgetisnull(result, row, addr_column)) {
    return Optional<Location>{None};
  }

  Location location;
  BATT_ASSIGN_OK_RESULT(location.addr, decode_int<i64>(result, row, addr_column));
  BATT_ASSIGN_OK_RESULT(location.category,
                        parse_slot_category(PQgetvalue(result, row, addr_column + 1)));

  return Optional<Location>{location};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Volume> decode_volume(const PGresult* result, int row)
{
  Volume volume;
  volume.serial = PQgetvalue(result, row, 0);

  BATT_ASSIGN_OK_RESULT(volume.location, decode_location(result, row, 1));
  BATT_ASSIGN_OK_RESULT(volume.home, decode_location(result, row, 3));
  BATT_ASSIGN_OK_RESULT(volume.category, parse_volume_category(PQgetvalue(result, row, 5)));
  BATT_ASSIGN_OK_RESULT(const u32 flag_bits, decode_int<u32>(result, row, 6));

  volume.flags = VolumeFlags::from_bits(flag_bits);

  return volume;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<Volume>> decode_optional_volume(const PGresult* result)
{
  if (PQntuples(result) == 0) {
    return Optional<Volume>{None};
  }
  BATT_ASSIGN_OK_RESULT(Volume volume, decode_volume(result, 0));

  return Optional<Volume>{std::move(volume)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void append_conninfo(std::ostringstream& out, std::string_view key, std::string_view value)
{
  out << key << "='";
  for (char ch : value) {
    if (ch == '\'' || ch == '\\') {
      out << '\\';
    }
    out << ch;
  }
  out << "' ";
}

}  // namespace

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// struct PostgresInventoryOptions
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<PostgresInventoryOptions> PostgresInventoryOptions::from_config(
    const ConfigOptions& options)
{
  static const std::array<std::string_view, 6> kValidSslModes = {
      "disable", "allow", "prefer", "require", "verify-ca", "verify-full",
  };

  BATT_REQUIRE_OK(reject_unknown_config_keys(options,
                                             {"dbhost", "dbname", "username", "password",
                                              "cleaning-prefix", "port", "sslmode",
                                              "max-connections"},
                                             "PostgresInventory"));

  BATT_REQUIRE_OK(require_config_keys(
      options, {"dbhost", "dbname", "username", "password", "cleaning-prefix"},
      "PostgresInventory"));

  PostgresInventoryOptions result;

  result.dbhost = options.at("dbhost");
  result.dbname = options.at("dbname");
  result.username = options.at("username");
  result.password = options.at("password");
  result.cleaning_prefix = options.at("cleaning-prefix");

  if (get_config_string(options, "port")) {
    BATT_ASSIGN_OK_RESULT(const i64 port, get_config_int(options, "port", 0, /*min_value=*/1));
    result.port = port;
  }

  Optional<std::string> sslmode = get_config_string(options, "sslmode");
  if (sslmode) {
    if (std::find(kValidSslModes.begin(), kValidSslModes.end(), *sslmode) ==
        kValidSslModes.end()) {
      TLM_LOG_ERROR() << "PostgresInventory: bad value for option sslmode: " << *sslmode;
      return make_status(StatusCode::kInvalidConfigValue);
    }
    result.sslmode = std::move(*sslmode);
  }

  BATT_ASSIGN_OK_RESULT(const i64 max_connections,
                        get_config_int(options, "max-connections",
                                       static_cast<i64>(kDefaultMaxStoreConnections),
                                       /*min_value=*/1));
  result.max_connections = static_cast<usize>(max_connections);

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string PostgresInventoryOptions::connection_string() const
{
  std::ostringstream oss;

  append_conninfo(oss, "host", this->dbhost);
  append_conninfo(oss, "dbname", this->dbname);
  append_conninfo(oss, "user", this->username);
  append_conninfo(oss, "password", this->password);
  append_conninfo(oss, "sslmode", this->sslmode);
  if (this->port) {
    append_conninfo(oss, "port", std::to_string(*this->port));
  }

  std::string result = std::move(oss).str();
  result.pop_back();

  return result;
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class PostgresVolumeStore::PooledConnection
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

class PostgresVolumeStore::PooledConnection
{
 public:
  explicit PooledConnection(PostgresVolumeStore* store, PGconn* conn) noexcept
      : store_{store}
      , conn_{conn}
  {
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  PooledConnection(PooledConnection&& that) noexcept
      : store_{that.store_}
      , conn_{std::exchange(that.conn_, nullptr)}
  {
  }

  PooledConnection& operator=(PooledConnection&& that) noexcept
  {
    if (this != &that) {
      this->reset();
      this->store_ = that.store_;
      this->conn_ = std::exchange(that.conn_, nullptr);
    }
    return *this;
  }

  ~PooledConnection() noexcept
  {
    this->reset();
  }

  PGconn* get() const
  {
    return this->conn_;
  }

 private:
  void reset()
  {
    if (this->conn_ != nullptr) {
      this->store_->release_connection(std::exchange(this->conn_, nullptr));
    }
  }

  PostgresVolumeStore* store_;
  PGconn* conn_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class PostgresVolumeStore::TransactionImpl
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

class PostgresVolumeStore::TransactionImpl : public VolumeStore::Transaction
{
 public:
  explicit TransactionImpl(PooledConnection&& conn) noexcept : conn_{std::move(conn)}
  {
  }

  ~TransactionImpl() noexcept override
  {
    if (this->open_) {
      TLM_VLOG(1) << "PostgresVolumeStore transaction destroyed while open; rolling back";
      this->rollback();
    }
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  StatusOr<Optional<Volume>> lock_volume(const VolumeSerial& serial) override
  {
    BATT_ASSIGN_OK_RESULT(PgResult result,
                          this->exec("SELECT" TLM_PG_VOLUME_COLUMNS
                                     "FROM volumes WHERE serial = $1 FOR UPDATE",
                                     {serial}));

    return decode_optional_volume(result.get());
  }

  StatusOr<Optional<Volume>> lock_volume_at(const Location& location) override
  {
    BATT_ASSIGN_OK_RESULT(
        PgResult result,
        this->exec("SELECT" TLM_PG_VOLUME_COLUMNS
                   "FROM volumes WHERE (location).addr = $1 AND (location).category = $2 "
                   "FOR UPDATE",
                   {location_addr_param(location), location_category_param(location)}));

    return decode_optional_volume(result.get());
  }

  StatusOr<Optional<Volume>> lock_next_allocatable() override
  {
    BATT_ASSIGN_OK_RESULT(
        PgResult result,
        this->exec("SELECT" TLM_PG_VOLUME_COLUMNS
                   "FROM volumes "
                   "WHERE category IN ('filling', 'scratch') AND (location).category = 'storage' "
                   "ORDER BY category::text COLLATE \"C\", serial COLLATE \"C\" "
                   "LIMIT 1 FOR UPDATE SKIP LOCKED",
                   {}));

    return decode_optional_volume(result.get());
  }

  Status insert_volume(const Volume& volume) override
  {
    BATT_ASSIGN_OK_RESULT(
        PgResult result,
        this->exec("INSERT INTO volumes (serial, location, home, category, flags) VALUES ("
                   "$1, make_location($2::bigint, $3::slot_category), "
                   "make_location($4::bigint, $5::slot_category), $6::volume_category, "
                   "$7::integer)",
                   volume_params(volume)));

    (void)result;
    return OkStatus();
  }

  Status write_volume(const Volume& volume) override
  {
    BATT_ASSIGN_OK_RESULT(
        PgResult result,
        this->exec("UPDATE volumes SET "
                   "location = make_location($2::bigint, $3::slot_category), "
                   "home = make_location($4::bigint, $5::slot_category), "
                   "category = $6::volume_category, flags = $7::integer "
                   "WHERE serial = $1",
                   volume_params(volume)));

    if (std::strcmp(PQcmdTuples(result.get()), "1") != 0) {
      return make_status(StatusCode::kVolumeNotFound);
    }
    return OkStatus();
  }

  Status commit() override
  {
    BATT_ASSIGN_OK_RESULT(PgResult result, this->exec("COMMIT", {}));
    this->open_ = false;

    // COMMIT of a transaction that already failed succeeds as a ROLLBACK.
    //
    if (std::strcmp(PQcmdStatus(result.get()), "COMMIT") != 0) {
      TLM_LOG_ERROR() << "PostgresVolumeStore: transaction was aborted; COMMIT returned "
                      << PQcmdStatus(result.get());
      return make_status(StatusCode::kStoreQueryFailed);
    }
    return OkStatus();
  }

  void rollback() override
  {
    if (!this->open_) {
      return;
    }
    this->open_ = false;

    StatusOr<PgResult> result = exec_sql(this->conn_.get(), "ROLLBACK");
    TLM_WARN_IF_NOT_OK(result.status());
  }

  bool is_open() const override
  {
    return this->open_;
  }

 private:
  StatusOr<PgResult> exec(const char* sql, const std::vector<SqlParam>& params)
  {
    if (!this->open_) {
      return make_status(StatusCode::kStoreTransactionClosed);
    }
    return exec_sql(this->conn_.get(), sql, params);
  }

  PooledConnection conn_;
  bool open_ = true;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class PostgresVolumeStore
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<PostgresVolumeStore>> PostgresVolumeStore::open(
    const PostgresInventoryOptions& options)
{
  auto store = std::make_unique<PostgresVolumeStore>(options);
  {
    BATT_ASSIGN_OK_RESULT(PooledConnection conn, store->acquire_connection());
    TLM_VLOG(1) << "connected to " << options.dbhost << "/" << options.dbname << " as "
                << options.username;
  }
  return store;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
PostgresVolumeStore::PostgresVolumeStore(const PostgresInventoryOptions& options) noexcept
    : options_{options}
    , conninfo_{options.connection_string()}
{
  initialize_status_codes();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
PostgresVolumeStore::~PostgresVolumeStore() noexcept
{
  std::unique_lock<std::mutex> lock{this->pool_mutex_};

  BATT_CHECK_EQ(this->idle_connections_.size(), this->open_connection_count_)
      << "All transactions must be closed before the store is destroyed";

  for (PGconn* conn : this->idle_connections_) {
    PQfinish(conn);
  }
  this->idle_connections_.clear();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
auto PostgresVolumeStore::acquire_connection() -> StatusOr<PooledConnection>
{
  std::unique_lock<std::mutex> lock{this->pool_mutex_};

  for (;;) {
    if (!this->idle_connections_.empty()) {
      PGconn* conn = this->idle_connections_.back();
      this->idle_connections_.pop_back();
      return PooledConnection{this, conn};
    }
    if (this->open_connection_count_ < this->options_.max_connections) {
      break;
    }
    this->pool_available_.wait(lock);
  }

  // Reserve the slot, then connect without holding the pool lock.
  //
  this->open_connection_count_ += 1;
  lock.unlock();

  PGconn* conn = PQconnectdb(this->conninfo_.c_str());
  if (conn == nullptr || PQstatus(conn) != CONNECTION_OK) {
    TLM_LOG_ERROR() << "could not connect to " << this->options_.dbhost << "/"
                    << this->options_.dbname << ": "
                    << ((conn == nullptr) ? "out of memory" : PQerrorMessage(conn));
    if (conn != nullptr) {
      PQfinish(conn);
    }
    lock.lock();
    this->open_connection_count_ -= 1;
    this->pool_available_.notify_one();

    return make_status(StatusCode::kStoreConnectFailed);
  }

  return PooledConnection{this, conn};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PostgresVolumeStore::release_connection(PGconn* conn)
{
  std::unique_lock<std::mutex> lock{this->pool_mutex_};

  // A broken connection, or one left inside a transaction, is not reused.
  //
  if (PQstatus(conn) == CONNECTION_OK && PQtransactionStatus(conn) == PQTRANS_IDLE) {
    this->idle_connections_.emplace_back(conn);
  } else {
    PQfinish(conn);
    this->open_connection_count_ -= 1;
  }
  this->pool_available_.notify_one();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::unique_ptr<VolumeStore::Transaction>> PostgresVolumeStore::begin()
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());
  BATT_ASSIGN_OK_RESULT(PgResult result, exec_sql(conn.get(), "BEGIN"));
  (void)result;

  std::unique_ptr<Transaction> txn = std::make_unique<TransactionImpl>(std::move(conn));
  return txn;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<Volume>> PostgresVolumeStore::get_volume(const VolumeSerial& serial)
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());
  BATT_ASSIGN_OK_RESULT(
      PgResult result,
      exec_sql(conn.get(), "SELECT" TLM_PG_VOLUME_COLUMNS "FROM volumes WHERE serial = $1",
               {serial}));

  return decode_optional_volume(result.get());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<Volume>> PostgresVolumeStore::list_volumes()
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());
  BATT_ASSIGN_OK_RESULT(
      PgResult result,
      exec_sql(conn.get(),
               "SELECT" TLM_PG_VOLUME_COLUMNS "FROM volumes ORDER BY serial COLLATE \"C\""));

  std::vector<Volume> volumes;
  const int row_count = PQntuples(result.get());
  for (int row = 0; row < row_count; ++row) {
    BATT_ASSIGN_OK_RESULT(Volume volume, decode_volume(result.get(), row));
    volumes.emplace_back(std::move(volume));
  }
  return volumes;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<Volume>> PostgresVolumeStore::find_at(const Location& location)
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());
  BATT_ASSIGN_OK_RESULT(
      PgResult result,
      exec_sql(conn.get(),
               "SELECT" TLM_PG_VOLUME_COLUMNS
               "FROM volumes WHERE (location).addr = $1 AND (location).category = $2",
               {location_addr_param(location), location_category_param(location)}));

  return decode_optional_volume(result.get());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PostgresVolumeStore::insert_path(const PathName& path, const VolumeSerial& serial)
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());
  BATT_ASSIGN_OK_RESULT(PgResult result,
                        exec_sql(conn.get(), "INSERT INTO tree (path, serial) VALUES ($1, $2)",
                                 {path.str(), serial}));
  (void)result;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<VolumeSerial>> PostgresVolumeStore::lookup_path(const PathName& path)
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());
  BATT_ASSIGN_OK_RESULT(
      PgResult result,
      exec_sql(conn.get(), "SELECT serial FROM tree WHERE path = $1", {path.str()}));

  if (PQntuples(result.get()) == 0) {
    return Optional<VolumeSerial>{None};
  }
  return Optional<VolumeSerial>{VolumeSerial{PQgetvalue(result.get(), 0, 0)}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<PathName>> PostgresVolumeStore::paths_for(const VolumeSerial& serial)
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());
  BATT_ASSIGN_OK_RESULT(
      PgResult result,
      exec_sql(conn.get(), "SELECT path FROM tree WHERE serial = $1 ORDER BY path COLLATE \"C\"",
               {serial}));

  std::vector<PathName> paths;
  const int row_count = PQntuples(result.get());
  for (int row = 0; row < row_count; ++row) {
    BATT_ASSIGN_OK_RESULT(PathName path, PathName::parse(PQgetvalue(result.get(), row, 0)));
    paths.emplace_back(std::move(path));
  }
  return paths;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PostgresVolumeStore::reset()
{
  BATT_ASSIGN_OK_RESULT(PooledConnection conn, this->acquire_connection());

  // PQexec runs a multi-statement string as a single transaction.
  //
  PgResult result{PQexec(conn.get(), kSchemaSql)};
  if (result == nullptr || PQresultStatus(result.get()) != PGRES_COMMAND_OK) {
    return status_from_result(conn.get(), result.get(), "<schema>");
  }

  TLM_LOG_INFO() << "inventory schema recreated in " << this->options_.dbname;

  return OkStatus();
}

}  // namespace tlm
