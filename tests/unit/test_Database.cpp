#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/Database.hpp"
#include "support/Fakes.hpp"

#include <filesystem>
#include <stdexcept>

using namespace netledger::infra;
using netledger::testing::TempDir;

class TestDatabase {
public:
    TestDatabase() : db_(std::make_shared<Database>((dir_ / "history.db").string())) {
        db_->runMigrations();
    }

    std::shared_ptr<Database> get() { return db_; }
    const TempDir& dir() const { return dir_; }

private:
    TempDir dir_;
    std::shared_ptr<Database> db_;
};

TEST_CASE("Database operations", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();

    SECTION("Execute simple SQL") {
        REQUIRE_NOTHROW(db->execute("SELECT 1"));
    }

    SECTION("Prepare and execute statement") {
        auto stmt = db->prepare("SELECT 1 + 1");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 2);
    }

    SECTION("Bound parameters") {
        db->execute("CREATE TABLE kv (k TEXT PRIMARY KEY, v INTEGER, note TEXT)");
        auto insert = db->prepare("INSERT INTO kv (k, v, note) VALUES (?, ?, ?)");
        insert.bind(1, std::string("answer"));
        insert.bind(2, int64_t{42});
        // note left unbound, so it is stored as NULL
        REQUIRE_FALSE(insert.step());
        REQUIRE(db->changes() == 1);

        auto select = db->prepare("SELECT v, note FROM kv WHERE k = ?");
        select.bind(1, std::string("answer"));
        REQUIRE(select.step());
        REQUIRE(select.columnInt64(0) == 42);
        REQUIRE(select.columnIsNull(1));
    }

    SECTION("Transaction commit") {
        db->execute("CREATE TABLE test_tx (id INTEGER PRIMARY KEY, value TEXT)");
        db->transaction([&]() { db->execute("INSERT INTO test_tx (value) VALUES ('test')"); });

        auto stmt = db->prepare("SELECT value FROM test_tx");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnText(0) == "test");
    }

    SECTION("Transaction rollback") {
        db->execute("CREATE TABLE test_rb (id INTEGER PRIMARY KEY, value TEXT)");

        REQUIRE_THROWS_AS(db->transaction([&]() {
                              db->execute("INSERT INTO test_rb (value) VALUES ('test')");
                              throw std::runtime_error("abort");
                          }),
                          std::runtime_error);

        auto stmt = db->prepare("SELECT COUNT(*) FROM test_rb");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
    }

    SECTION("Invalid SQL throws") {
        REQUIRE_THROWS_AS(db->execute("SELEC nothing"), std::runtime_error);
        REQUIRE_THROWS_AS(db->prepare("SELECT * FROM missing_table"), std::runtime_error);
    }
}

TEST_CASE("Database migrations", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();

    SECTION("Schema is at the latest version") {
        REQUIRE(db->schemaVersion() == 2);
        auto stmt = db->prepare("SELECT COUNT(*) FROM scan_runs");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
    }

    SECTION("Running migrations again is a no-op") {
        REQUIRE_NOTHROW(db->runMigrations());
        REQUIRE(db->schemaVersion() == 2);
    }

    SECTION("Reopening keeps the schema") {
        auto path = (testDb.dir() / "history.db").string();
        Database reopened(path);
        REQUIRE(reopened.schemaVersion() == 2);
    }
}
