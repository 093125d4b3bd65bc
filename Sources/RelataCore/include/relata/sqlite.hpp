#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "dataset.hpp"
#include "gateway.hpp"
#include "log.hpp"
#include "schema.hpp"
#include "transaction.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relata {
namespace sqlite {

class db_error : public relata::error {
public:
    explicit db_error(const std::string& msg) : relata::error(msg) {}
};

// Gateway constructor arguments.
// Accepts [] (in-memory), ["path"] or [{"path": "...", "read_only": true}].
struct configuration {
    std::string path = ":memory:";
    bool read_only = false;

    static configuration from_json(const nlohmann::json& args);
};

// Row of PRAGMA table_info, in declaration order
struct column_info {
    std::string name;
    std::string type;   // uppercase declared type
    bool not_null = false;
    bool primary_key = false;
};

// ============================================================================
// Database - owning wrapper around a sqlite3 connection
// ============================================================================

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool is_open() const { return db_ != nullptr; }
    void close();

    // Schema management
    void create_table(const std::string& table, const relata::schema& schema);
    bool table_exists(const std::string& name) const;
    std::vector<column_info> get_table_info(const std::string& table) const;
    std::vector<std::string> list_tables() const;

    /// Insert a tuple, returning the new rowid
    int64_t insert(const std::string& table, const tuple_t& tuple);

    /// Rows as tuples keyed by result column name
    tuple_list_t query(const std::string& sql, const value_list_t& params = {});

    /// Execute SQL with optional params. Returns the number of changed rows.
    std::size_t execute(const std::string& sql, const value_list_t& params = {});

    // Transaction support. mode is "deferred", "immediate" or "exclusive".
    void begin_transaction(const std::string& mode = "deferred");
    void commit();
    void rollback();
    void savepoint(const std::string& name);
    void release_savepoint(const std::string& name);
    void rollback_to_savepoint(const std::string& name);
    bool is_in_transaction() const;

    /// Receiver for every statement executed on this connection
    void set_sink(log_sink sink) { sink_ = std::move(sink); }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    log_sink sink_;

    sqlite3* require_open() const;
    void report(const std::string& sql) const;
    void bind_value(sqlite3_stmt* stmt, int index, const value_t& value) const;
    value_t extract_column(sqlite3_stmt* stmt, int index) const;
};

/// Double-quoted SQL identifier
std::string quote_identifier(const std::string& name);

// ============================================================================
// Dataset - lazily evaluated SELECT over one table
// ============================================================================
//
// restrict/project/order build a new dataset with an extended query; nothing
// runs until read(), size() or remove().

class dataset : public relata::dataset {
public:
    using condition = std::pair<std::string, value_list_t>;

    dataset(std::shared_ptr<database> db, std::string table);

    std::shared_ptr<const tuple_list_t> read() const override;
    void insert(tuple_t tuple) override;
    std::size_t size() const override;

    std::shared_ptr<relata::dataset> restrict(const restriction_t& criteria) const override;
    std::shared_ptr<relata::dataset> project(const std::vector<std::string>& names) const override;
    std::shared_ptr<relata::dataset> order(const std::vector<std::string>& names) const override;
    std::size_t remove(const restriction_t& criteria) override;

private:
    std::shared_ptr<database> db_;
    std::string table_;
    std::vector<condition> conditions_;
    std::vector<std::string> columns_;   // empty selects every column
    std::vector<std::string> order_;

    std::string where_clause(const std::vector<condition>& conditions, value_list_t& params) const;
    std::pair<std::string, value_list_t> select_sql() const;
};

// ============================================================================
// Transaction runner
// ============================================================================
//
// BEGIN <mode> ... COMMIT at the outermost level, SAVEPOINT inside an open
// transaction. A requested rollback is reported as rolled_back; an exception
// rolls back and propagates.

class transaction_runner : public relata::transaction_runner {
public:
    explicit transaction_runner(std::shared_ptr<database> db) : db_(std::move(db)) {}

    transaction_result run(const nlohmann::json& options, const block_t& block) override;

private:
    std::shared_ptr<database> db_;
    int depth_ = 0;
};

// RAII guard: rolls back unless commit() or rollback() was called
class transaction_guard {
public:
    transaction_guard(database& db, const std::string& mode);
    ~transaction_guard();

    transaction_guard(const transaction_guard&) = delete;
    transaction_guard& operator=(const transaction_guard&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

// ============================================================================
// SQLite gateway
// ============================================================================

class gateway : public relata::gateway {
public:
    explicit gateway(const nlohmann::json& args = nlohmann::json::array());
    explicit gateway(const configuration& config);
    ~gateway() override;

    std::optional<std::string> declared_adapter() const override { return std::string("sqlite"); }

    /// Dataset over an existing table. Throws db_error if the table is missing.
    std::shared_ptr<relata::dataset> dataset(const std::string& name) override;
    bool dataset_exists(const std::string& name) const override;

    /// Create the table for `schema` if needed and return its dataset
    std::shared_ptr<relata::dataset> create_dataset(const std::string& name, const relata::schema& schema);

    void use_logger(log_sink sink) override;
    const log_sink* logger() const override;

    std::vector<std::string> schema() const override;
    std::vector<attribute> infer_attributes(const std::string& name) const override;

    relata::transaction_runner& transaction_runner(const nlohmann::json& options) override;

    void disconnect() override;

    const configuration& config() const { return config_; }
    database& db() { return *db_; }

private:
    configuration config_;
    std::shared_ptr<database> db_;
    std::unique_ptr<sqlite::transaction_runner> runner_;
    std::optional<log_sink> logger_;
};

/// Reference attribute type for a declared SQLite column type (type affinity rules)
value_kind kind_for_declared_type(const std::string& declared);

} // namespace sqlite
} // namespace relata

#endif // __cplusplus
