#pragma once

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "database_driver.hpp"
#include "database_error.hpp"
#include "database_logger.hpp"
#include "database_query.hpp"
#include "database_transaction.hpp"
#include "mapped_result.hpp"
#include "query_executor.hpp"
#include "sql_text.hpp"

namespace gleipnir {

    // A validated script named V<digits>__<description>.sql
    struct migration_file {
        std::string version;       // digit run as written in the file name
        std::string description;
        std::filesystem::path path;

        // Version without leading zeros, used for ordering and ledger lookups
        [[nodiscard]] std::string normalized_version() const {
            auto first = version.find_first_not_of('0');
            return first == std::string::npos ? std::string("0") : version.substr(first);
        }
    };

    /**
     * Applies versioned SQL scripts from a directory, once each.
     *
     * Applied versions are recorded in the migration_info ledger table. The whole
     * directory is validated before anything runs; scripts then execute in
     * ascending numeric version order, each in its own transaction. A failing
     * script aborts the run; scripts committed before it stay applied.
     *
     * Not safe to run concurrently against the same database.
     */
    class migration_runner {
    public:
        static constexpr std::string_view ledger_table = "migration_info";

        explicit migration_runner(query_executor& executor)
            : executor_(executor), logger_(executor.logger()) {}

        void apply_migrations(const std::filesystem::path& directory) {
            auto files = discover(directory);
            auto applied = normalized(applied_versions());

            std::size_t executed = 0;
            for (const auto& file : files) {
                if (applied.contains(file.normalized_version())) {
                    logger_->debug("migration_skipped", {
                        {"version", file.version},
                        {"file", file.path.filename().string()}
                    });
                    continue;
                }
                apply(file);
                ++executed;
            }

            logger_->info("migrations_complete", {
                {"directory", directory.string()},
                {"applied", std::to_string(executed)},
                {"skipped", std::to_string(files.size() - executed)}
            });
        }

        // Validated scripts not yet recorded in the ledger, in execution order
        [[nodiscard]] std::vector<migration_file> pending_migrations(const std::filesystem::path& directory) {
            auto files = discover(directory);
            auto applied = normalized(applied_versions());
            std::erase_if(files, [&](const migration_file& file) {
                return applied.contains(file.normalized_version());
            });
            return files;
        }

        // Creates the ledger if needed and returns the recorded versions
        [[nodiscard]] std::set<std::string> applied_versions() {
            (void)executor_.execute(
                statement_spec{"CREATE TABLE IF NOT EXISTS migration_info"
                               "(migration_version TEXT PRIMARY KEY)",
                               {}, statement_kind::other},
                [](mapped_result& result) { return result.rows_affected(); });

            return executor_.execute(
                statement_spec{"SELECT migration_version FROM migration_info"},
                [](mapped_result& result) {
                    std::set<std::string> versions;
                    while (result.has_next()) {
                        if (auto version = result.column<std::string>("migration_version")) {
                            versions.insert(std::move(*version));
                        }
                    }
                    return versions;
                });
        }

        // Validate every entry of the directory and return the scripts sorted by version
        [[nodiscard]] static std::vector<migration_file> discover(const std::filesystem::path& directory) {
            namespace fs = std::filesystem;

            std::error_code ec;
            if (!fs::is_directory(directory, ec)) {
                throw persistence_failure{
                    "Could not access directory '" + directory.string() + "', make sure it exists"};
            }

            static const std::regex pattern(R"(^V(\d+)__(.+)\.sql$)");
            std::vector<migration_file> files;

            try {
                for (const auto& entry : fs::directory_iterator(directory)) {
                    std::string name = entry.path().filename().string();
                    std::smatch match;
                    if (!entry.is_regular_file() || !std::regex_match(name, match, pattern) ||
                        !std::ifstream(entry.path()).good()) {
                        throw persistence_failure{
                            "Unable to access SQL file '" + name +
                            "', make sure it is named V<version>__<description>.sql and is readable"};
                    }
                    files.push_back(migration_file{match[1].str(), match[2].str(), entry.path()});
                }
            } catch (const fs::filesystem_error&) {
                throw persistence_failure{
                    "Could not list directory '" + directory.string() + "'", std::current_exception()};
            }

            std::sort(files.begin(), files.end(), [](const migration_file& a, const migration_file& b) {
                auto va = a.normalized_version();
                auto vb = b.normalized_version();
                if (va.size() != vb.size()) return va.size() < vb.size();
                return va < vb;
            });

            auto duplicate = std::adjacent_find(files.begin(), files.end(),
                [](const migration_file& a, const migration_file& b) {
                    return a.normalized_version() == b.normalized_version();
                });
            if (duplicate != files.end()) {
                throw persistence_failure{
                    "Migration version " + duplicate->version + " is used by both '" +
                    duplicate->path.filename().string() + "' and '" +
                    std::next(duplicate)->path.filename().string() + "'"};
            }
            return files;
        }

    private:
        void apply(const migration_file& file) {
            executor_.with_connection([&](driver_connection& conn) {
                database_transaction txn(conn, logger_);
                try {
                    auto statements = sql::split_script(read_script(file.path));
                    for (const auto& text : statements) {
                        conn.execute_direct(text);
                    }

                    auto record = conn.prepare("INSERT INTO migration_info (migration_version) VALUES (?)");
                    record->bind(1, sql_value{file.version});
                    (void)record->execute();
                    record->close();

                    txn.commit();
                    logger_->info("migration_applied", {
                        {"version", file.version},
                        {"file", file.path.filename().string()},
                        {"statements", std::to_string(statements.size())}
                    });
                } catch (const std::exception& e) {
                    if (txn.is_active()) {
                        try {
                            txn.rollback();
                        } catch (const std::exception& rollback_error) {
                            logger_->error("rollback_failed", {{"error", rollback_error.what()}});
                        }
                    }
                    logger_->error("migration_failed", {
                        {"version", file.version},
                        {"file", file.path.filename().string()},
                        {"error", e.what()}
                    });
                    throw persistence_failure{
                        "Unable to perform migration '" + file.path.filename().string() + "'",
                        std::current_exception()};
                }
            });
        }

        static std::string read_script(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                throw persistence_failure{"Unable to open migration script '" + path.string() + "'"};
            }
            std::ostringstream content;
            content << in.rdbuf();
            if (in.bad()) {
                throw persistence_failure{"Unable to read migration script '" + path.string() + "'"};
            }
            return content.str();
        }

        static std::set<std::string> normalized(const std::set<std::string>& versions) {
            std::set<std::string> out;
            for (const auto& version : versions) {
                out.insert(migration_file{version, {}, {}}.normalized_version());
            }
            return out;
        }

        query_executor& executor_;
        std::shared_ptr<database_logger> logger_;
    };

} // namespace gleipnir
