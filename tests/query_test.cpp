#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/database_query.hpp"
#include "../src/sql_text.hpp"
#include <limits>

using namespace gleipnir;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("statement_spec - Construction", "[query]") {
    SECTION("Text and arguments are kept as given") {
        statement_spec spec("SELECT * FROM users WHERE id = ?", {make_value(7)});
        REQUIRE(spec.text() == "SELECT * FROM users WHERE id = ?");
        REQUIRE(spec.has_arguments());
        REQUIRE(spec.args().size() == 1);
        REQUIRE(std::get<std::int64_t>(spec.args()[0]) == 7);
    }

    SECTION("Arguments are optional") {
        statement_spec spec("SELECT 1");
        REQUIRE_FALSE(spec.has_arguments());
    }

    SECTION("Empty text is rejected") {
        REQUIRE_THROWS_AS(statement_spec(""), persistence_failure);
        REQUIRE_THROWS_WITH(statement_spec("   \n"), ContainsSubstring("'query'"));
    }
}

TEST_CASE("statement_builder - Fluent Building", "[query][builder]") {
    SECTION("Builds text, arguments and kind") {
        auto spec = statement_builder{}
            .query("UPDATE users SET name = ? WHERE id = ?")
            .args("bob", 3)
            .kind(statement_kind::update)
            .build();

        REQUIRE(spec.args().size() == 2);
        REQUIRE(std::get<std::string>(spec.args()[0]) == "bob");
        REQUIRE(std::get<std::int64_t>(spec.args()[1]) == 3);
        REQUIRE(spec.kind() == statement_kind::update);
    }

    SECTION("Missing query fails on build") {
        statement_builder builder;
        REQUIRE_THROWS_AS(builder.build(), persistence_failure);
    }

    SECTION("An empty argument list is rejected") {
        statement_builder builder;
        REQUIRE_THROWS_WITH(builder.args(), ContainsSubstring("at least one argument"));
        REQUIRE_THROWS_AS(builder.args(sql_values{}), persistence_failure);
    }

    SECTION("Optional and null arguments bind as NULL") {
        std::optional<int> missing;
        auto spec = statement_builder{}
            .query("INSERT INTO t (a, b) VALUES (?, ?)")
            .args(missing, nullptr)
            .build();
        REQUIRE(is_null(spec.args()[0]));
        REQUIRE(is_null(spec.args()[1]));
    }
}

TEST_CASE("statement_kind - Leading Keyword Classification", "[query][classify]") {
    REQUIRE(classify("SELECT * FROM t") == statement_kind::select);
    REQUIRE(classify("  insert into t values (1)") == statement_kind::insert);
    REQUIRE(classify("Update t SET a = 1") == statement_kind::update);
    REQUIRE(classify("DELETE FROM t") == statement_kind::remove);
    REQUIRE(classify("CREATE TABLE t (id INT)") == statement_kind::other);

    SECTION("Keywords inside literals or comments do not count") {
        REQUIRE(classify("SELECT 'UPDATE me' AS note") == statement_kind::select);
        REQUIRE(classify("-- DELETE everything\nSELECT 1") == statement_kind::select);
        REQUIRE(classify("/* INSERT */ (SELECT 1)") == statement_kind::select);
    }

    SECTION("A leading WITH is classified by its main statement") {
        REQUIRE(classify("WITH x AS (SELECT 1) INSERT INTO t SELECT * FROM x") == statement_kind::insert);
        REQUIRE(classify("with recursive n(v) AS (SELECT 1 UNION SELECT v + 1 FROM n) SELECT v FROM n")
                == statement_kind::select);
        REQUIRE(classify("WITH gone AS (DELETE FROM t RETURNING id) UPDATE u SET flag = true")
                == statement_kind::update);
        REQUIRE(classify("WITH x AS (SELECT 1) DELETE FROM t USING x") == statement_kind::remove);
    }

    SECTION("Declared kind overrides classification") {
        statement_spec spec("SELECT add_user(?)", {make_value("ann")}, statement_kind::insert);
        REQUIRE(classify(spec.text()) == statement_kind::select);
        REQUIRE(spec.declared_kind() == statement_kind::insert);
        REQUIRE(spec.kind() == statement_kind::insert);
    }
}

TEST_CASE("sql - Placeholder Rewriting", "[query][sql]") {
    SECTION("Question marks become numbered parameters") {
        auto [text, count] = sql::rewrite_placeholders("SELECT * FROM t WHERE a = ? AND b = ?");
        REQUIRE(text == "SELECT * FROM t WHERE a = $1 AND b = $2");
        REQUIRE(count == 2);
    }

    SECTION("Quoted question marks are left alone") {
        auto [text, count] = sql::rewrite_placeholders("SELECT '?', \"col?\" FROM t WHERE a = ?");
        REQUIRE(text == "SELECT '?', \"col?\" FROM t WHERE a = $1");
        REQUIRE(count == 1);
    }

    SECTION("Doubled question mark is a literal operator") {
        auto [text, count] = sql::rewrite_placeholders("SELECT data ?? 'key' FROM t");
        REQUIRE(text == "SELECT data ? 'key' FROM t");
        REQUIRE(count == 0);
    }
}

TEST_CASE("sql - Script Splitting", "[query][sql]") {
    SECTION("Splits on semicolons and drops blank statements") {
        auto statements = sql::split_script("CREATE TABLE t (id INT);\n\nINSERT INTO t VALUES (1);\n");
        REQUIRE(statements.size() == 2);
        REQUIRE(statements[0] == "CREATE TABLE t (id INT)");
        REQUIRE(statements[1] == "INSERT INTO t VALUES (1)");
    }

    SECTION("Semicolons in literals and function bodies do not split") {
        auto statements = sql::split_script(
            "INSERT INTO t VALUES ('a;b');\n"
            "CREATE FUNCTION f() RETURNS int AS $$ BEGIN RETURN 1; END; $$ LANGUAGE plpgsql;");
        REQUIRE(statements.size() == 2);
        REQUIRE_THAT(statements[1], ContainsSubstring("RETURN 1; END;"));
    }

    SECTION("Comment-only fragments are dropped") {
        auto statements = sql::split_script("SELECT 1; -- trailing note\n");
        REQUIRE(statements.size() == 1);
    }
}

TEST_CASE("sql - Returning Clause", "[query][sql]") {
    SECTION("Appended after the terminator") {
        REQUIRE(sql::with_returning_all("INSERT INTO users (name) VALUES (?);\n")
                == "INSERT INTO users (name) VALUES (?) RETURNING *");
    }

    SECTION("A trailing line comment is dropped, not extended") {
        auto text = sql::with_returning_all("INSERT INTO users (name) VALUES (?) -- add one user");
        REQUIRE(text == "INSERT INTO users (name) VALUES (?) RETURNING *");
        REQUIRE(sql::contains_keyword(text, "RETURNING"));
    }

    SECTION("Terminator followed by a comment") {
        auto text = sql::with_returning_all("INSERT INTO users (name) VALUES (?); -- trailing\n");
        REQUIRE(text == "INSERT INTO users (name) VALUES (?) RETURNING *");
        REQUIRE(sql::contains_keyword(text, "RETURNING"));
    }

    SECTION("Trailing block comment and literals are handled") {
        REQUIRE(sql::with_returning_all("INSERT INTO notes (body) VALUES ('a; -- b') /* seed */ ;")
                == "INSERT INTO notes (body) VALUES ('a; -- b') RETURNING *");
    }

    SECTION("Main keyword looks past WITH") {
        REQUIRE(sql::main_keyword("WITH src AS (SELECT 'x') INSERT INTO t SELECT * FROM src") == "INSERT");
        REQUIRE(sql::main_keyword("  insert into t values (1)") == "INSERT");
        REQUIRE(sql::main_keyword("CREATE TABLE t (id INT)") == "CREATE");
    }
}

TEST_CASE("sql - Keyword Search", "[query][sql]") {
    REQUIRE(sql::contains_keyword("INSERT INTO t VALUES (1) returning id", "RETURNING"));
    REQUIRE_FALSE(sql::contains_keyword("INSERT INTO t (returning_flag) VALUES (1)", "RETURNING"));
    REQUIRE_FALSE(sql::contains_keyword("INSERT INTO t VALUES ('RETURNING')", "RETURNING"));
}

TEST_CASE("sql_value - Conversions", "[query][value]") {
    REQUIRE(to_parameter_text(sql_value{true}) == "true");
    REQUIRE(to_parameter_text(sql_value{std::int64_t{-12}}) == "-12");
    REQUIRE(to_parameter_text(sql_value{1.5}) == "1.5");
    REQUIRE_FALSE(to_parameter_text(sql_value{}).has_value());

    REQUIRE(value_as<int>(sql_value{std::string("42")}) == 42);
    REQUIRE_FALSE(value_as<int>(sql_value{std::string("forty")}).has_value());
    REQUIRE(value_as<double>(sql_value{std::int64_t{2}}) == 2.0);
    REQUIRE(value_as<bool>(sql_value{std::string("t")}) == true);
    REQUIRE(value_as<std::string>(sql_value{std::int64_t{5}}) == "5");

    SECTION("Integers out of the target range are nullopt") {
        REQUIRE_FALSE(value_as<int>(sql_value{std::int64_t{5000000000}}).has_value());
        REQUIRE_FALSE(value_as<unsigned>(sql_value{std::int64_t{-1}}).has_value());
        REQUIRE(value_as<int>(sql_value{std::int64_t{-2147483648LL}}) == std::numeric_limits<int>::min());
        REQUIRE_FALSE(value_as<int>(sql_value{std::string("5000000000")}).has_value());
    }

    SECTION("Doubles out of the target range are nullopt") {
        REQUIRE_FALSE(value_as<int>(sql_value{1e300}).has_value());
        REQUIRE_FALSE(value_as<long long>(sql_value{9.3e18}).has_value());
        REQUIRE_FALSE(value_as<int>(sql_value{std::numeric_limits<double>::quiet_NaN()}).has_value());
        REQUIRE_FALSE(value_as<int>(sql_value{std::numeric_limits<double>::infinity()}).has_value());
        REQUIRE_FALSE(value_as<float>(sql_value{1e300}).has_value());
        REQUIRE(value_as<int>(sql_value{-2.75}) == -2);
        REQUIRE(value_as<long long>(sql_value{9.0e18}) == 9000000000000000000LL);
    }
}

TEST_CASE("persistence_failure - Cause", "[query][error]") {
    SECTION("Driver cause exposes message and SQLSTATE") {
        persistence_failure failure("wrapped", std::make_exception_ptr(database_error{"boom", "40001"}));
        REQUIRE(failure.has_cause());
        REQUIRE(failure.cause_message() == "boom");
        REQUIRE(failure.sql_state() == "40001");
    }

    SECTION("A cause that is not a std::exception is still readable") {
        persistence_failure failure("wrapped", std::make_exception_ptr(42));
        REQUIRE(failure.cause_message() == "unknown cause");
        REQUIRE(failure.sql_state().empty());
    }

    SECTION("No cause") {
        persistence_failure failure("plain");
        REQUIRE_FALSE(failure.has_cause());
        REQUIRE(failure.cause_message().empty());
    }
}
