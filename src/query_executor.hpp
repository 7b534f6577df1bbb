#pragma once

#include <algorithm>
#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include "connection_loader.hpp"
#include "database_connection.hpp"
#include "database_driver.hpp"
#include "database_error.hpp"
#include "database_logger.hpp"
#include "database_query.hpp"
#include "database_transaction.hpp"
#include "mapped_result.hpp"

namespace gleipnir {

    /**
     * Runs one statement per call inside its own connection and transaction.
     *
     * execute() opens a connection, disables autocommit, prepares and binds the
     * statement, materializes the outcome into a mapped_result, commits, and only
     * then hands the result to the caller's mapper. Driver failures before the
     * commit roll back and surface as persistence_failure; exceptions thrown by
     * the mapper happen after the commit and propagate untouched.
     *
     * The executor holds no per-call state and may be shared between threads.
     */
    class query_executor {
    public:
        explicit query_executor(std::shared_ptr<const connection_loader> loader,
                                driver_registry registry = driver_registry::with_defaults(),
                                std::shared_ptr<database_logger> logger = make_stderr_logger())
            : loader_(std::move(loader)),
              registry_(std::move(registry)),
              logger_(logger ? std::move(logger) : make_stderr_logger()) {
            validate::require_non_null(loader_.get(), "connection_loader");
        }

        // Disable copy and move
        query_executor(const query_executor&) = delete;
        query_executor& operator=(const query_executor&) = delete;

        template<typename Mapper>
        requires std::invocable<Mapper&, mapped_result&>
        std::invoke_result_t<Mapper&, mapped_result&> execute(const statement_spec& spec, Mapper&& mapper) {
            auto conn = open_connection();
            mapped_result result = collect(*conn, spec);
            // Committed; the connection stays open until the mapper returns
            return std::invoke(mapper, result);
        }

        // Run func on a fresh connection with autocommit disabled; func owns commit/rollback
        template<typename Func>
        requires std::invocable<Func&, driver_connection&>
        std::invoke_result_t<Func&, driver_connection&> with_connection(Func&& func) {
            auto conn = open_connection();
            return std::invoke(func, *conn);
        }

        [[nodiscard]] const std::shared_ptr<database_logger>& logger() const noexcept {
            return logger_;
        }

        [[nodiscard]] const driver_registry& registry() const noexcept {
            return registry_;
        }

    private:
        [[nodiscard]] std::unique_ptr<driver_connection> open_connection() const {
            std::string driver_name = loader_->driver();
            validate::require_non_empty(driver_name, "driver");
            auto driver = registry_.resolve(driver_name);

            std::string url = loader_->url();
            std::string username = loader_->username();
            std::string password = loader_->password();
            validate::require_non_empty(url, "url");
            validate::require_non_empty(username, "username");
            validate::require_non_empty(password, "password");

            try {
                auto conn = driver->connect(url, username, password);
                if (!conn) {
                    throw database_error{"Driver '" + driver_name + "' returned no connection"};
                }
                conn->set_autocommit(false);
                logger_->debug("connection_accepted", {{"driver", driver_name}});
                return conn;
            } catch (const database_error& e) {
                logger_->error("connection_failed", {{"driver", driver_name}, {"error", e.what()}});
                throw persistence_failure{"Connection has failed", std::current_exception()};
            }
        }

        [[nodiscard]] mapped_result collect(driver_connection& conn, const statement_spec& spec) {
            database_transaction txn(conn, logger_);

            try {
                if (spec.has_arguments()) {
                    logger_->info("statement_built", {
                        {"sql", spec.text()},
                        {"args", std::to_string(spec.args().size())}
                    });
                }

                auto statement = conn.prepare(spec.text(), key_mode::return_generated_keys);
                const auto& args = spec.args();
                for (std::size_t i = 0; i < args.size(); ++i) {
                    statement->bind(static_cast<int>(i) + 1, args[i]);
                }

                mapped_result result = materialize(*statement, spec);
                statement->close();
                txn.commit();
                return result;
            } catch (const persistence_failure&) {
                rollback_after_failure(txn);
                throw;
            } catch (const std::exception& e) {
                rollback_after_failure(txn);
                logger_->error("statement_failed", {{"sql", spec.text()}, {"error", e.what()}});
                throw persistence_failure{
                    "The execution of the query statement has failed", std::current_exception()};
            }
        }

        [[nodiscard]] static mapped_result materialize(driver_statement& statement, const statement_spec& spec) {
            if (statement.execute()) {
                auto set = statement.result_set();
                if (!set) {
                    throw database_error{"Driver reported a result set but did not return one"};
                }
                return drain_rows(*set);
            }

            switch (spec.kind()) {
                case statement_kind::insert: {
                    auto keys = statement.generated_keys();
                    sql_values list;
                    while (keys && keys->next()) {
                        list.push_back(keys->value(0));
                    }
                    return mapped_result::from_generated_keys(std::move(list));
                }
                case statement_kind::update:
                case statement_kind::remove:
                    return mapped_result::from_rows_affected(statement.update_count());
                default:
                    // DDL and other commands without a result set
                    return mapped_result::from_rows_affected(std::max(statement.update_count(), 0LL));
            }
        }

        [[nodiscard]] static mapped_result drain_rows(driver_result_set& set) {
            const int column_count = set.column_count();
            std::vector<std::string> names;
            names.reserve(static_cast<std::size_t>(column_count));
            for (int col = 0; col < column_count; ++col) {
                names.push_back(set.column_name(col));
            }

            std::vector<result_row> rows;
            while (set.next()) {
                result_row row;
                for (int col = 0; col < column_count; ++col) {
                    row.add(names[static_cast<std::size_t>(col)], set.value(col));
                }
                rows.push_back(std::move(row));
            }
            return mapped_result::from_rows(std::move(names), std::move(rows));
        }

        void rollback_after_failure(database_transaction& txn) const {
            if (!txn.is_active()) return;
            try {
                txn.rollback();
            } catch (const std::exception& e) {
                logger_->error("rollback_failed", {{"error", e.what()}});
            }
        }

        std::shared_ptr<const connection_loader> loader_;
        driver_registry registry_;
        std::shared_ptr<database_logger> logger_;
    };

} // namespace gleipnir
