#include "relata/sqlite.hpp"
#include "relata/log.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace relata {
namespace sqlite {

namespace {

std::string to_upper(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

const char* sql_type_for(value_kind kind) {
    switch (kind) {
        case value_kind::integer: return "INTEGER";
        case value_kind::real: return "REAL";
        case value_kind::text: return "TEXT";
        case value_kind::blob: return "BLOB";
        case value_kind::any:
        default:
            return "";
    }
}

// Finalizes the statement when it goes out of scope
struct statement {
    sqlite3_stmt* stmt = nullptr;
    ~statement() {
        if (stmt) sqlite3_finalize(stmt);
    }
};

} // namespace

std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

value_kind kind_for_declared_type(const std::string& declared) {
    // SQLite type affinity, section 3.1 of the datatype docs
    auto type = to_upper(declared);
    if (type.find("INT") != std::string::npos) return value_kind::integer;
    if (type.find("CHAR") != std::string::npos || type.find("CLOB") != std::string::npos ||
        type.find("TEXT") != std::string::npos) {
        return value_kind::text;
    }
    if (type.empty()) return value_kind::any;
    if (type.find("BLOB") != std::string::npos) return value_kind::blob;
    if (type.find("REAL") != std::string::npos || type.find("FLOA") != std::string::npos ||
        type.find("DOUB") != std::string::npos) {
        return value_kind::real;
    }
    return value_kind::any;
}

// ============================================================================
// configuration
// ============================================================================

configuration configuration::from_json(const nlohmann::json& args) {
    configuration config;
    if (args.is_null()) {
        return config;
    }

    const nlohmann::json* options = &args;
    if (args.is_array()) {
        if (args.empty()) {
            return config;
        }
        if (args.size() > 1) {
            throw invalid_argument_error("sqlite gateway takes a single argument, got " +
                                         std::to_string(args.size()));
        }
        options = &args.front();
    }

    if (options->is_string()) {
        config.path = options->get<std::string>();
    } else if (options->is_object()) {
        config.path = options->value("path", config.path);
        config.read_only = options->value("read_only", config.read_only);
    } else {
        throw invalid_argument_error("sqlite gateway expects a path or an options object, got " +
                                     options->dump());
    }
    return config;
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Failed to open database " + path + ": " + error);
    }

    execute("PRAGMA foreign_keys = ON");

    // WAL only applies to file databases opened for writing
    if (mode == open_mode::read_write && path != ":memory:" && !path.empty()) {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    LOG_DEBUG("sqlite", "Opened %s (%s)", path.c_str(),
              mode == open_mode::read_only ? "read-only" : "read-write");
}

database::~database() {
    close();
}

void database::close() {
    if (!db_) return;
    if (mode_ == open_mode::read_write && path_ != ":memory:" && !path_.empty()) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    }
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        LOG_WARN("sqlite", "Closing %s: %s", path_.c_str(), sqlite3_errmsg(db_));
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

sqlite3* database::require_open() const {
    if (!db_) {
        throw db_error("Database " + path_ + " is closed");
    }
    return db_;
}

void database::report(const std::string& sql) const {
    LOG_DEBUG("sqlite", "%s", sql.c_str());
    if (sink_) {
        sink_(log_level::debug, sql);
    }
}

std::size_t database::execute(const std::string& sql, const value_list_t& params) {
    auto* db = require_open();
    report(sql);

    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("sqlite", "%s in %s", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return static_cast<std::size_t>(sqlite3_changes(db));
    }

    statement s;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &s.stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("sqlite", "%s in %s", sqlite3_errmsg(db), sql.c_str());
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(s.stmt, index++, param);
    }

    rc = sqlite3_step(s.stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw db_error("Execution failed: " + std::string(sqlite3_errmsg(db)));
    }
    return static_cast<std::size_t>(sqlite3_changes(db));
}

tuple_list_t database::query(const std::string& sql, const value_list_t& params) {
    auto* db = require_open();
    report(sql);

    statement s;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &s.stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("sqlite", "%s in %s", sqlite3_errmsg(db), sql.c_str());
        throw db_error("Failed to prepare query: " + std::string(sqlite3_errmsg(db)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(s.stmt, index++, param);
    }

    tuple_list_t results;
    int col_count = sqlite3_column_count(s.stmt);

    while ((rc = sqlite3_step(s.stmt)) == SQLITE_ROW) {
        tuple_t row;
        for (int i = 0; i < col_count; ++i) {
            row[sqlite3_column_name(s.stmt, i)] = extract_column(s.stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        throw db_error("Query failed: " + std::string(sqlite3_errmsg(db)));
    }
    return results;
}

bool database::table_exists(const std::string& name) const {
    auto* db = require_open();
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

    statement s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.stmt, nullptr) != SQLITE_OK) {
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    sqlite3_bind_text(s.stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(s.stmt) == SQLITE_ROW;
}

std::vector<column_info> database::get_table_info(const std::string& table) const {
    auto* db = require_open();
    std::string sql = "PRAGMA table_info(" + quote_identifier(table) + ")";

    statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.stmt, nullptr) != SQLITE_OK) {
        throw db_error("Failed to prepare table_info statement: " + std::string(sqlite3_errmsg(db)));
    }

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    std::vector<column_info> columns;
    while (sqlite3_step(s.stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 1));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 2));
        if (!name) continue;

        column_info column;
        column.name = name;
        column.type = to_upper(type ? type : "");
        column.not_null = sqlite3_column_int(s.stmt, 3) != 0;
        column.primary_key = sqlite3_column_int(s.stmt, 5) != 0;
        columns.push_back(std::move(column));
    }
    return columns;
}

std::vector<std::string> database::list_tables() const {
    auto* db = require_open();
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' "
                      "AND name NOT LIKE 'sqlite_%' ORDER BY name";

    statement s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.stmt, nullptr) != SQLITE_OK) {
        throw db_error("Failed to list tables: " + std::string(sqlite3_errmsg(db)));
    }

    std::vector<std::string> tables;
    while (sqlite3_step(s.stmt) == SQLITE_ROW) {
        tables.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 0)));
    }
    return tables;
}

void database::create_table(const std::string& table, const relata::schema& schema) {
    if (schema.empty()) {
        throw invalid_argument_error("cannot create table " + table + " from an empty schema");
    }

    auto keys = schema.primary_key();

    std::ostringstream sql;
    sql << "CREATE TABLE " << quote_identifier(table) << " (";

    bool first = true;
    for (const auto& attr : schema) {
        if (!first) sql << ", ";
        first = false;
        sql << quote_identifier(attr.name);

        const char* type = sql_type_for(attr.type.kind);
        if (*type) {
            sql << " " << type;
        }
        if (keys.size() == 1 && attr.primary_key) {
            sql << " PRIMARY KEY";
        }
        if (attr.foreign_key) {
            sql << " REFERENCES " << quote_identifier(*attr.foreign_key);
        }
    }

    if (keys.size() > 1) {
        sql << ", PRIMARY KEY (";
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (i) sql << ", ";
            sql << quote_identifier(keys[i]);
        }
        sql << ")";
    }

    sql << ")";
    execute(sql.str());
}

int64_t database::insert(const std::string& table, const tuple_t& tuple) {
    std::ostringstream sql;
    value_list_t params;

    if (tuple.empty()) {
        sql << "INSERT INTO " << quote_identifier(table) << " DEFAULT VALUES";
    } else {
        sql << "INSERT INTO " << quote_identifier(table) << " (";
        bool first = true;
        for (const auto& [column, value] : tuple) {
            if (!first) sql << ", ";
            sql << quote_identifier(column);
            params.push_back(value);
            first = false;
        }
        sql << ") VALUES (";
        for (std::size_t i = 0; i < params.size(); ++i) {
            if (i) sql << ", ";
            sql << "?";
        }
        sql << ")";
    }

    execute(sql.str(), params);
    return sqlite3_last_insert_rowid(db_);
}

void database::begin_transaction(const std::string& mode) {
    auto upper = to_upper(mode);
    if (upper != "DEFERRED" && upper != "IMMEDIATE" && upper != "EXCLUSIVE") {
        throw invalid_argument_error("Unknown transaction mode: " + mode);
    }
    auto* db = require_open();
    std::string sql = "BEGIN " + upper;
    report(sql);

    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to begin transaction: " + std::string(sqlite3_errmsg(db)));
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

void database::savepoint(const std::string& name) {
    execute("SAVEPOINT " + quote_identifier(name));
}

void database::release_savepoint(const std::string& name) {
    execute("RELEASE SAVEPOINT " + quote_identifier(name));
}

void database::rollback_to_savepoint(const std::string& name) {
    // ROLLBACK TO keeps the savepoint open; release it afterwards
    execute("ROLLBACK TO SAVEPOINT " + quote_identifier(name));
    release_savepoint(name);
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const value_t& value) const {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

value_t database::extract_column(sqlite3_stmt* stmt, int index) const {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const auto* bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

// ============================================================================
// dataset
// ============================================================================

dataset::dataset(std::shared_ptr<database> db, std::string table)
    : db_(std::move(db)), table_(std::move(table)) {
    if (!db_) {
        throw invalid_argument_error("sqlite dataset " + table_ + " requires a database");
    }
}

std::string dataset::where_clause(const std::vector<condition>& conditions, value_list_t& params) const {
    if (conditions.empty()) {
        return "";
    }
    std::ostringstream sql;
    sql << " WHERE ";
    for (std::size_t i = 0; i < conditions.size(); ++i) {
        const auto& [column, values] = conditions[i];
        if (i) sql << " AND ";
        if (values.empty()) {
            sql << "0";
            continue;
        }
        sql << quote_identifier(column) << " IN (";
        for (std::size_t j = 0; j < values.size(); ++j) {
            if (j) sql << ", ";
            sql << "?";
            params.push_back(values[j]);
        }
        sql << ")";
    }
    return sql.str();
}

std::pair<std::string, value_list_t> dataset::select_sql() const {
    value_list_t params;
    std::ostringstream sql;
    sql << "SELECT ";
    if (columns_.empty()) {
        sql << "*";
    } else {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (i) sql << ", ";
            sql << quote_identifier(columns_[i]);
        }
    }
    sql << " FROM " << quote_identifier(table_);
    sql << where_clause(conditions_, params);

    // rowid keeps insertion order as the tiebreaker
    sql << " ORDER BY ";
    for (const auto& column : order_) {
        sql << quote_identifier(column) << ", ";
    }
    sql << "rowid";
    return {sql.str(), std::move(params)};
}

std::shared_ptr<const tuple_list_t> dataset::read() const {
    auto [sql, params] = select_sql();
    return std::make_shared<const tuple_list_t>(db_->query(sql, params));
}

void dataset::insert(tuple_t tuple) {
    db_->insert(table_, tuple);
}

std::size_t dataset::size() const {
    value_list_t params;
    std::string sql = "SELECT COUNT(*) AS count FROM " + quote_identifier(table_) +
                      where_clause(conditions_, params);
    auto rows = db_->query(sql, params);
    return static_cast<std::size_t>(std::get<int64_t>(rows.front().at("count")));
}

std::shared_ptr<relata::dataset> dataset::restrict(const restriction_t& criteria) const {
    auto result = std::make_shared<dataset>(*this);
    for (const auto& [column, values] : criteria) {
        result->conditions_.emplace_back(column, values);
    }
    return result;
}

std::shared_ptr<relata::dataset> dataset::project(const std::vector<std::string>& names) const {
    auto result = std::make_shared<dataset>(*this);
    if (!columns_.empty()) {
        // Projection of a projection keeps only columns present in both
        std::vector<std::string> kept;
        for (const auto& name : names) {
            if (std::find(columns_.begin(), columns_.end(), name) != columns_.end()) {
                kept.push_back(name);
            }
        }
        result->columns_ = std::move(kept);
    } else {
        result->columns_ = names;
    }
    return result;
}

std::shared_ptr<relata::dataset> dataset::order(const std::vector<std::string>& names) const {
    auto result = std::make_shared<dataset>(*this);
    result->order_ = names;
    return result;
}

std::size_t dataset::remove(const restriction_t& criteria) {
    std::vector<condition> conditions = conditions_;
    for (const auto& [column, values] : criteria) {
        conditions.emplace_back(column, values);
    }
    value_list_t params;
    std::string sql = "DELETE FROM " + quote_identifier(table_) + where_clause(conditions, params);
    return db_->execute(sql, params);
}

// ============================================================================
// Transactions
// ============================================================================

transaction_guard::transaction_guard(database& db, const std::string& mode) : db_(db) {
    db_.begin_transaction(mode);
}

transaction_guard::~transaction_guard() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const std::exception& e) {
            LOG_ERROR("transaction", "Rollback in destructor failed: %s", e.what());
        }
    }
}

void transaction_guard::commit() {
    db_.commit();
    completed_ = true;
}

void transaction_guard::rollback() {
    db_.rollback();
    completed_ = true;
}

transaction_result transaction_runner::run(const nlohmann::json& options, const block_t& block) {
    std::string mode = options.is_object() ? options.value("mode", std::string("deferred")) : "deferred";
    relata::transaction handle;

    if (db_->is_in_transaction()) {
        // Nested: a savepoint scopes the inner block
        std::string name = "relata_" + std::to_string(++depth_);
        db_->savepoint(name);
        try {
            block(handle);
        } catch (const std::exception& e) {
            LOG_WARN("transaction", "Rolling back savepoint %s: %s", name.c_str(), e.what());
            --depth_;
            db_->rollback_to_savepoint(name);
            throw;
        }
        --depth_;
        if (handle.rollback_requested()) {
            LOG_INFO("transaction", "Rolled back savepoint %s on request", name.c_str());
            db_->rollback_to_savepoint(name);
            return transaction_result::rolled_back;
        }
        db_->release_savepoint(name);
        return transaction_result::committed;
    }

    LOG_DEBUG("transaction", "Begin (%s)", mode.c_str());
    transaction_guard guard(*db_, mode);
    try {
        block(handle);
    } catch (const std::exception& e) {
        LOG_WARN("transaction", "Rolling back: %s", e.what());
        guard.rollback();
        throw;
    }

    if (handle.rollback_requested()) {
        LOG_INFO("transaction", "Rolled back on request");
        guard.rollback();
        return transaction_result::rolled_back;
    }
    guard.commit();
    LOG_DEBUG("transaction", "Committed");
    return transaction_result::committed;
}

// ============================================================================
// gateway
// ============================================================================

gateway::gateway(const nlohmann::json& args) : gateway(configuration::from_json(args)) {}

gateway::gateway(const configuration& config)
    : config_(config)
    , db_(std::make_shared<database>(config.path, config.read_only ? database::open_mode::read_only
                                                                   : database::open_mode::read_write))
    , runner_(std::make_unique<sqlite::transaction_runner>(db_)) {
    connection_ = db_;
}

gateway::~gateway() = default;

std::shared_ptr<relata::dataset> gateway::dataset(const std::string& name) {
    if (!db_->table_exists(name)) {
        throw db_error("no such table: " + name);
    }
    return std::make_shared<sqlite::dataset>(db_, name);
}

bool gateway::dataset_exists(const std::string& name) const {
    return db_->table_exists(name);
}

std::shared_ptr<relata::dataset> gateway::create_dataset(const std::string& name, const relata::schema& schema) {
    if (!db_->table_exists(name)) {
        db_->create_table(name, schema);
        LOG_DEBUG("sqlite", "Created table %s", name.c_str());
    }
    return std::make_shared<sqlite::dataset>(db_, name);
}

void gateway::use_logger(log_sink sink) {
    logger_ = sink;
    db_->set_sink(std::move(sink));
}

const log_sink* gateway::logger() const {
    return logger_ ? &*logger_ : nullptr;
}

std::vector<std::string> gateway::schema() const {
    return db_->list_tables();
}

std::vector<attribute> gateway::infer_attributes(const std::string& name) const {
    if (!db_->table_exists(name)) {
        throw db_error("cannot infer attributes of missing table " + name);
    }
    std::vector<attribute> attributes;
    for (const auto& column : db_->get_table_info(name)) {
        attribute attr;
        attr.name = column.name;
        attr.type = types::for_kind(kind_for_declared_type(column.type));
        attr.source = name;
        attr.primary_key = column.primary_key;
        attributes.push_back(std::move(attr));
    }
    return attributes;
}

relata::transaction_runner& gateway::transaction_runner(const nlohmann::json&) {
    return *runner_;
}

void gateway::disconnect() {
    LOG_INFO("sqlite", "Disconnecting %s", config_.path.c_str());
    db_->close();
}

} // namespace sqlite
} // namespace relata
