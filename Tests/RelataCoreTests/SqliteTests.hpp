#pragma once

#include <RelataCore.hpp>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlite_tests {

using test_support::val;

inline std::shared_ptr<relata::sqlite::gateway> open_memory_gateway() {
    auto gw = relata::gateway::setup(relata::adapter_id{"sqlite"});
    auto sqlite_gw = std::dynamic_pointer_cast<relata::sqlite::gateway>(gw);
    assert(sqlite_gw != nullptr);
    return sqlite_gw;
}

inline std::size_t count_containing(const std::vector<std::string>& statements, const std::string& needle) {
    std::size_t count = 0;
    for (const auto& sql : statements) {
        if (sql.find(needle) != std::string::npos) ++count;
    }
    return count;
}

// ============================================================================
// test_configuration: constructor arguments and declared type mapping
// ============================================================================

void test_configuration() {
    std::cout << "  test_configuration..." << std::flush;

    using relata::sqlite::configuration;

    auto defaults = configuration::from_json(nlohmann::json::array());
    assert(defaults.path == ":memory:");
    assert(!defaults.read_only);

    auto path_only = configuration::from_json(nlohmann::json::array({"app.db"}));
    assert(path_only.path == "app.db");

    auto object = configuration::from_json(
        nlohmann::json::array({nlohmann::json{{"path", "ro.db"}, {"read_only", true}}}));
    assert(object.path == "ro.db");
    assert(object.read_only);

    bool threw = false;
    try {
        configuration::from_json(nlohmann::json::array({"a.db", "b.db"}));
    } catch (const relata::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        configuration::from_json(nlohmann::json::array({42}));
    } catch (const relata::invalid_argument_error&) {
        threw = true;
    }
    assert(threw);

    using relata::sqlite::kind_for_declared_type;
    assert(kind_for_declared_type("INTEGER") == relata::value_kind::integer);
    assert(kind_for_declared_type("bigint") == relata::value_kind::integer);
    assert(kind_for_declared_type("varchar(20)") == relata::value_kind::text);
    assert(kind_for_declared_type("DOUBLE PRECISION") == relata::value_kind::real);
    assert(kind_for_declared_type("BLOB") == relata::value_kind::blob);
    assert(kind_for_declared_type("") == relata::value_kind::any);
    assert(kind_for_declared_type("NUMERIC") == relata::value_kind::any);

    assert(relata::sqlite::quote_identifier("we\"ird") == "\"we\"\"ird\"");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_relation: relation operations over a table
// ============================================================================

void test_sqlite_relation() {
    std::cout << "  test_sqlite_relation..." << std::flush;

    auto gw = open_memory_gateway();
    assert(gw->adapter() == "sqlite");
    assert(gw->connection() != nullptr);
    assert(!gw->dataset_exists("users"));

    gw->create_dataset("users", test_support::users_schema());
    assert(gw->dataset_exists("users"));
    assert((gw->schema() == std::vector<std::string>{"users"}));

    auto definition = std::make_shared<relata::relation_definition>("users", test_support::users_schema());
    definition->view("names", {"name"}, [](const relata::relation& r, const relata::arguments_t&) {
        return r.order({"name"});
    });
    auto users = gw->relation_for(definition);

    users << relata::tuple_t{{"id", val("1")}, {"name", val("Joe")}};
    users << relata::tuple_t{{"id", val(2)}, {"name", val("Jane")}, {"ignored", val("x")}};
    users << relata::tuple_t{{"id", val(3)}, {"name", val("Ann")}};

    relata::tuple_list_t expected = {
        {{"id", val(1)}, {"name", val("Joe")}},
        {{"id", val(2)}, {"name", val("Jane")}},
        {{"id", val(3)}, {"name", val("Ann")}},
    };
    assert(users.to_a() == expected);
    assert(users.call().collection() == expected);
    assert(users.count() == 3);

    auto some = users.restrict({{"id", {val(1), val(3)}}});
    assert(some.count() == 2);
    assert(some.to_a().back().at("name") == val("Ann"));

    // Chained restrictions combine
    assert(some.restrict({{"name", {val("Ann")}}}).count() == 1);
    assert(users.restrict({{"id", {}}}).count() == 0);

    auto names = users.view("names").to_a();
    relata::tuple_list_t expected_names = {
        {{"name", val("Ann")}}, {{"name", val("Jane")}}, {{"name", val("Joe")}},
    };
    assert(names == expected_names);

    auto ids = users.project({"id"}).project({"id", "name"}).to_a();
    assert(ids.front().size() == 1);

    assert(users.remove({{"name", {val("Jane")}}}) == 1);
    assert(users.count() == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_inferred_schema: attributes come from PRAGMA table_info
// ============================================================================

void test_sqlite_inferred_schema() {
    std::cout << "  test_sqlite_inferred_schema..." << std::flush;

    auto gw = open_memory_gateway();
    gw->db().execute("CREATE TABLE people (id INTEGER PRIMARY KEY, name TEXT NOT NULL, score REAL, photo BLOB)");

    auto columns = gw->db().get_table_info("people");
    assert(columns.size() == 4);
    assert(columns[0].name == "id" && columns[0].primary_key);
    assert(columns[1].not_null);

    auto definition = std::make_shared<relata::relation_definition>("people", relata::schema::infer("people"));
    auto people = gw->relation_for(definition);

    assert(people.schema().size() == 4);
    assert(people["id"] == relata::types::integer());
    assert(people["name"] == relata::types::string());
    assert(people["score"] == relata::types::real());
    assert(people["photo"] == relata::types::blob());
    assert((people.schema().primary_key() == std::vector<std::string>{"id"}));
    assert(*people.schema()["name"].source == "people");

    people << relata::tuple_t{{"id", val(1)}, {"name", val("Ann")}, {"score", val(9.5)},
                              {"photo", relata::value_t(std::vector<uint8_t>{1, 2, 3})}, {"extra", val(1)}};
    auto row = people.call().one_or_throw();
    assert(row.at("score") == val(9.5));
    assert(relata::detail::from_value<std::vector<uint8_t>>(row.at("photo")).size() == 3);

    // Missing columns read back as null
    people << relata::tuple_t{{"id", val(2)}, {"name", val("Ben")}};
    auto ben = people.restrict({{"id", {val(2)}}}).call().one_or_throw();
    assert(relata::is_null(ben.at("score")));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_transactions: commit, requested rollback, exceptions
// ============================================================================

void test_sqlite_transactions() {
    std::cout << "  test_sqlite_transactions..." << std::flush;

    auto gw = open_memory_gateway();
    auto data = gw->create_dataset("users", test_support::users_schema());
    auto users = test_support::relation_over(data, test_support::users_schema());

    assert(&gw->transaction_runner(nlohmann::json::object()) != &relata::no_op_transaction_runner::instance());

    auto committed = gw->transaction([&](relata::transaction&) {
        users << relata::tuple_t{{"id", val(1)}, {"name", val("Kept")}};
        return users.count();
    });
    assert(committed.has_value() && *committed == 1);
    assert(users.count() == 1);
    assert(!gw->db().is_in_transaction());

    // Requested rollback: nothing persists, result is empty
    int calls = 0;
    auto rolled_back = gw->transaction([&](relata::transaction& t) {
        ++calls;
        users << relata::tuple_t{{"id", val(2)}, {"name", val("Gone")}};
        assert(gw->db().is_in_transaction());
        t.rollback();
        return 2;
    });
    assert(calls == 1);
    assert(!rolled_back.has_value());
    assert(users.count() == 1);

    bool kept = gw->transaction([&](relata::transaction& t) {
        users << relata::tuple_t{{"id", val(3)}, {"name", val("Gone")}};
        t.rollback();
    });
    assert(!kept);
    assert(users.count() == 1);

    // Exceptions roll back and propagate
    bool threw = false;
    try {
        gw->transaction([&] {
            users << relata::tuple_t{{"id", val(4)}, {"name", val("Gone")}};
            throw std::runtime_error("fail");
        });
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "fail";
    }
    assert(threw);
    assert(users.count() == 1);
    assert(!gw->db().is_in_transaction());

    // Lock modes
    for (const char* mode : {"deferred", "immediate", "exclusive"}) {
        auto ok = gw->transaction(nlohmann::json{{"mode", mode}}, [&] { return users.count(); });
        assert(ok && *ok == 1);
    }

    threw = false;
    calls = 0;
    try {
        gw->transaction(nlohmann::json{{"mode", "sometimes"}}, [&] { ++calls; });
    } catch (const relata::invalid_argument_error& e) {
        threw = std::string(e.what()) == "Unknown transaction mode: sometimes";
    }
    assert(threw);
    assert(calls == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_nested_transaction: inner blocks use savepoints
// ============================================================================

void test_sqlite_nested_transaction() {
    std::cout << "  test_sqlite_nested_transaction..." << std::flush;

    auto gw = open_memory_gateway();
    auto data = gw->create_dataset("users", test_support::users_schema());
    auto users = test_support::relation_over(data, test_support::users_schema());

    auto outer = gw->transaction([&](relata::transaction&) {
        users << relata::tuple_t{{"id", val(1)}, {"name", val("outer")}};

        auto inner = gw->transaction([&](relata::transaction& t) {
            users << relata::tuple_t{{"id", val(2)}, {"name", val("inner")}};
            t.rollback();
            return true;
        });
        assert(!inner.has_value());

        try {
            gw->transaction([&] {
                users << relata::tuple_t{{"id", val(3)}, {"name", val("inner")}};
                throw std::runtime_error("inner failure");
            });
        } catch (const std::runtime_error&) {
        }

        auto inner_ok = gw->transaction([&] {
            users << relata::tuple_t{{"id", val(4)}, {"name", val("nested")}};
            return 4;
        });
        assert(inner_ok && *inner_ok == 4);

        // Outer transaction is still open
        assert(gw->db().is_in_transaction());
        return users.count();
    });

    assert(outer && *outer == 2);
    auto ids = users.call().pluck("id");
    assert((ids == relata::value_list_t{val(1), val(4)}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_logger: every statement reaches the installed sink
// ============================================================================

void test_sqlite_logger() {
    std::cout << "  test_sqlite_logger..." << std::flush;

    auto gw = open_memory_gateway();
    assert(gw->logger() == nullptr);

    std::vector<std::string> statements;
    gw->use_logger([&](relata::log_level level, const std::string& sql) {
        assert(level == relata::log_level::debug);
        statements.push_back(sql);
    });
    assert(gw->logger() != nullptr);

    auto data = gw->create_dataset("users", test_support::users_schema());
    assert(count_containing(statements, "CREATE TABLE \"users\"") == 1);

    data->insert({{"id", val(1)}, {"name", val("Ann")}});
    assert(count_containing(statements, "INSERT INTO \"users\"") == 1);

    statements.clear();
    data->restrict({{"id", {val(1)}}})->read();
    assert(statements.size() == 1);
    assert(statements[0].find("WHERE \"id\" IN (?)") != std::string::npos);

    statements.clear();
    auto names = data->restrict({{"id", {val(1)}}})->project({"name"})->order({"name"})->read();
    assert(names->size() == 1);
    assert(names->front().size() == 1);
    assert(statements.size() == 1);
    assert(statements[0] == "SELECT \"name\" FROM \"users\" WHERE \"id\" IN (?) ORDER BY \"name\", rowid");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_graph_queries: one child query regardless of root size
// ============================================================================

void test_sqlite_graph_queries() {
    std::cout << "  test_sqlite_graph_queries..." << std::flush;

    auto gw = open_memory_gateway();
    gw->create_dataset("users", test_support::users_schema());
    gw->create_dataset("tasks", test_support::tasks_schema());

    auto users = gw->relation_for(std::make_shared<relata::relation_definition>("users", test_support::users_schema()));

    auto tasks_definition = std::make_shared<relata::relation_definition>("tasks", test_support::tasks_schema());
    tasks_definition->view("for_users", {"id", "user_id"}, [](const relata::relation& r,
                                                             const relata::arguments_t& args) {
        return r.restrict_by(test_support::users_tasks(), relata::argument_loaded(args.back()));
    }, 1);
    auto tasks = gw->relation_for(tasks_definition);

    constexpr int user_count = 25;
    gw->transaction([&] {
        for (int u = 1; u <= user_count; ++u) {
            users << relata::tuple_t{{"id", val(u)}, {"name", val("user" + std::to_string(u))}};
            tasks << relata::tuple_t{{"id", val(u * 100)}, {"user_id", val(u)}, {"title", val("t")}};
        }
    });

    std::vector<std::string> statements;
    gw->use_logger([&](relata::log_level, const std::string& sql) { statements.push_back(sql); });

    auto loaded = users.combine(tasks.curry("for_users")).call();
    assert(loaded.size() == static_cast<std::size_t>(user_count));
    assert(loaded.node("tasks").size() == static_cast<std::size_t>(user_count));
    assert(loaded.node("tasks").collection().front().size() == 2);

    assert(count_containing(statements, "FROM \"users\"") == 1);
    assert(count_containing(statements, "FROM \"tasks\"") == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_errors: failures surface as db_error
// ============================================================================

void test_sqlite_errors() {
    std::cout << "  test_sqlite_errors..." << std::flush;

    auto gw = open_memory_gateway();

    bool threw = false;
    try {
        gw->dataset("missing");
    } catch (const relata::sqlite::db_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        gw->db().query("SELEC nonsense");
    } catch (const relata::error& e) {
        threw = std::string(e.what()).find("Failed to prepare query") != std::string::npos;
    }
    assert(threw);

    // File-backed database survives a reconnect
    auto path = (std::filesystem::temp_directory_path() / "relata_sqlite_test.db").string();
    std::filesystem::remove(path);
    {
        auto file_gw = relata::gateway::setup(relata::adapter_id{"sqlite"}, nlohmann::json::array({path}));
        auto file_sqlite = std::dynamic_pointer_cast<relata::sqlite::gateway>(file_gw);
        assert(file_sqlite->config().path == path);
        auto data = file_sqlite->create_dataset("users", test_support::users_schema());
        data->insert({{"id", val(1)}, {"name", val("persisted")}});
        file_gw->disconnect();
        assert(!file_sqlite->db().is_open());

        threw = false;
        try {
            data->read();
        } catch (const relata::sqlite::db_error&) {
            threw = true;
        }
        assert(threw);
    }
    {
        auto reopened = std::dynamic_pointer_cast<relata::sqlite::gateway>(
            relata::gateway::setup(relata::adapter_id{"sqlite"}, nlohmann::json::array({nlohmann::json{{"path", path}}})));
        assert(reopened->dataset_exists("users"));
        auto rows = reopened->dataset("users")->read();
        assert(rows->size() == 1);
        assert(rows->front().at("name") == val("persisted"));
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");

    std::cout << " OK" << std::endl;
}

} // namespace sqlite_tests
