#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/gleipnir.hpp"
#include "mocks/mock_driver.hpp"
#include <sstream>

using namespace gleipnir;
using namespace gleipnir::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

    std::unique_ptr<driver_connection> open_mock_connection(const std::shared_ptr<mock_database>& db) {
        auto settings = mock_settings();
        return mock_registry(db).resolve("mock")->connect(settings->url(), settings->username(), settings->password());
    }

} // namespace

TEST_CASE("database_transaction - Basic Commit", "[transaction]") {
    auto db = std::make_shared<mock_database>();
    auto conn = open_mock_connection(db);

    SECTION("Construction disables autocommit") {
        REQUIRE(conn->autocommit());
        database_transaction txn(*conn);
        REQUIRE_FALSE(conn->autocommit());
        REQUIRE(txn.is_active());
        txn.commit();
    }

    SECTION("Commit publishes the statements") {
        {
            database_transaction txn(*conn);
            conn->execute_direct("INSERT INTO t VALUES (1)");
            conn->execute_direct("INSERT INTO t VALUES (2)");
            txn.commit();
            REQUIRE(txn.is_committed());
            REQUIRE_FALSE(txn.is_active());
        }
        REQUIRE(db->committed_statements().size() == 2);
        REQUIRE(db->rollbacks() == 0);
    }
}

TEST_CASE("database_transaction - Rollback", "[transaction]") {
    auto db = std::make_shared<mock_database>();
    auto conn = open_mock_connection(db);

    SECTION("Explicit rollback discards statements") {
        {
            database_transaction txn(*conn);
            conn->execute_direct("INSERT INTO t VALUES (1)");
            txn.rollback();
            REQUIRE(txn.is_rolled_back());
        }
        REQUIRE(db->committed_statements().empty());
        REQUIRE(db->rollbacks() == 1);
    }

    SECTION("Destruction without commit rolls back") {
        {
            database_transaction txn(*conn);
            conn->execute_direct("INSERT INTO t VALUES (1)");
        }
        REQUIRE(db->committed_statements().empty());
        REQUIRE(db->rollbacks() == 1);
    }

    SECTION("Exception inside the scope rolls back") {
        try {
            database_transaction txn(*conn);
            conn->execute_direct("INSERT INTO t VALUES (1)");
            throw std::runtime_error("caller failure");
        } catch (const std::runtime_error&) {
        }
        REQUIRE(db->committed_statements().empty());
        REQUIRE(db->rollbacks() == 1);
    }
}

TEST_CASE("database_transaction - Error Handling", "[transaction][error]") {
    auto db = std::make_shared<mock_database>();
    auto conn = open_mock_connection(db);

    SECTION("A finalized transaction cannot be finalized again") {
        database_transaction txn(*conn);
        txn.commit();
        REQUIRE_THROWS_WITH(txn.commit(), ContainsSubstring("already finalized"));
        REQUIRE_THROWS_AS(txn.rollback(), database_error);
    }

    SECTION("Failed rollback in the destructor is logged, not thrown") {
        std::ostringstream log;
        auto logger = std::make_shared<database_logger>(log);
        {
            database_transaction txn(*conn, logger);
            conn->close();
        }
        REQUIRE_THAT(log.str(), ContainsSubstring("event=rollback_failed"));
    }

    SECTION("A rollback failing with a non-driver exception is logged as well") {
        std::ostringstream log;
        auto logger = std::make_shared<database_logger>(log);
        db->fail_rollback(true);
        {
            database_transaction txn(*conn, logger);
            conn->execute_direct("INSERT INTO t VALUES (1)");
        }
        REQUIRE_THAT(log.str(), ContainsSubstring("event=rollback_failed"));
        REQUIRE_THAT(log.str(), ContainsSubstring("mock rollback failure"));
        REQUIRE(db->committed_statements().empty());
    }

    SECTION("Failed commit leaves the transaction active for rollback") {
        db->fail_commit(true);
        database_transaction txn(*conn);
        REQUIRE_THROWS_AS(txn.commit(), database_error);
        REQUIRE(txn.is_active());
        txn.rollback();
        REQUIRE(db->rollbacks() == 1);
    }
}

TEST_CASE("with_transaction - Scoped Helper", "[transaction]") {
    auto db = std::make_shared<mock_database>();
    auto conn = open_mock_connection(db);

    SECTION("Commits and returns the callback value") {
        auto value = with_transaction(*conn, [](database_transaction& txn) {
            txn.connection().execute_direct("UPDATE t SET a = 1");
            return 5;
        });
        REQUIRE(value == 5);
        REQUIRE(db->commits() == 1);
    }

    SECTION("Rolls back when the callback throws") {
        REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction& txn) {
            txn.connection().execute_direct("UPDATE t SET a = 1");
            throw std::logic_error("abort");
        }), std::logic_error);
        REQUIRE(db->commits() == 0);
        REQUIRE(db->rollbacks() == 1);
        REQUIRE(db->committed_statements().empty());
    }
}
