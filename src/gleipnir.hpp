#pragma once

/**
 * Gleipnir - transactional query execution over PostgreSQL libpq
 *
 * A header-only library providing:
 * - One connection and one transaction per statement, released on every exit path
 * - A single forward cursor (mapped_result) over rows, generated keys or affected-row counts
 * - Caller-supplied mappers that run after the commit
 * - Versioned SQL migrations recorded in a ledger table
 * - A driver seam (libpq by default) so the core can run against any driver
 *
 * Usage:
 *   #include <gleipnir.hpp>
 *   using namespace gleipnir;
 *
 * Examples:
 *   // Configuration
 *   auto settings = std::make_shared<connection_settings>(
 *       "postgresql", "postgresql://localhost/mydb", "user", "pass");
 *   query_executor executor(settings);
 *
 *   // Select
 *   auto names = executor.execute(
 *       statement_spec{"SELECT name FROM users WHERE age > ?", {make_value(30)}},
 *       [](mapped_result& r) {
 *           std::vector<std::string> out;
 *           while (r.has_next()) out.push_back(r.column<std::string>("name").value_or(""));
 *           return out;
 *       });
 *
 *   // Insert, reading the generated key
 *   auto id = executor.execute(
 *       statement_spec{"INSERT INTO users (name) VALUES (?)", {make_value("ann")}},
 *       [](mapped_result& r) { return r.has_next() ? r.generated_key<long long>() : std::nullopt; });
 *
 *   // Migrations
 *   migration_runner(executor).apply_migrations("db/migrations");
 */

#include "database_error.hpp"
#include "database_value.hpp"
#include "database_logger.hpp"
#include "connection_loader.hpp"
#include "database_driver.hpp"
#include "sql_text.hpp"
#include "database_connection.hpp"
#include "database_query.hpp"
#include "mapped_result.hpp"
#include "database_transaction.hpp"
#include "query_executor.hpp"
#include "persistence_unit.hpp"
#include "migration_runner.hpp"

// Version information
#define GLEIPNIR_VERSION_MAJOR 1
#define GLEIPNIR_VERSION_MINOR 0
#define GLEIPNIR_VERSION_PATCH 0

namespace gleipnir {

    /**
     * Library version information
     */
    constexpr struct version_info {
        int major = GLEIPNIR_VERSION_MAJOR;
        int minor = GLEIPNIR_VERSION_MINOR;
        int patch = GLEIPNIR_VERSION_PATCH;

        [[nodiscard]] constexpr const char* string() const noexcept {
            return "1.0.0";
        }
    } version;

} // namespace gleipnir
