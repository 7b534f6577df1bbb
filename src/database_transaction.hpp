#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include "database_driver.hpp"
#include "database_error.hpp"
#include "database_logger.hpp"

namespace gleipnir {

    /**
     * RAII transaction over a driver connection.
     *
     * Construction switches autocommit off, which opens the transaction. If the
     * guard is destroyed while still active the transaction is rolled back.
     */
    class database_transaction {
    public:
        explicit database_transaction(driver_connection& conn,
                                      std::shared_ptr<database_logger> logger = nullptr)
            : conn_(conn), logger_(std::move(logger)), committed_(false), rolled_back_(false) {
            conn_.set_autocommit(false);
        }

        ~database_transaction() {
            if (is_active()) {
                // Auto-rollback if neither commit nor rollback was called
                try {
                    rollback();
                } catch (const std::exception& e) {
                    if (logger_) {
                        logger_->error("rollback_failed", {{"error", e.what()}});
                    }
                }
            }
        }

        // Disable copy and move
        database_transaction(const database_transaction&) = delete;
        database_transaction& operator=(const database_transaction&) = delete;

        // Commit transaction
        void commit() {
            if (committed_ || rolled_back_) {
                throw database_error{"Transaction already finalized"};
            }
            conn_.commit();
            committed_ = true;
        }

        // Rollback transaction
        void rollback() {
            if (committed_ || rolled_back_) {
                throw database_error{"Transaction already finalized"};
            }
            rolled_back_ = true;
            conn_.rollback();
        }

        // Check transaction state
        [[nodiscard]] bool is_active() const noexcept {
            return !committed_ && !rolled_back_;
        }

        [[nodiscard]] bool is_committed() const noexcept {
            return committed_;
        }

        [[nodiscard]] bool is_rolled_back() const noexcept {
            return rolled_back_;
        }

        // Get underlying connection
        [[nodiscard]] driver_connection& connection() noexcept {
            return conn_;
        }

    private:
        driver_connection& conn_;
        std::shared_ptr<database_logger> logger_;
        bool committed_;
        bool rolled_back_;
    };

    // Scoped transaction helper: commits after func returns, rolls back if it throws
    template<typename Func>
    requires std::invocable<Func, database_transaction&>
    auto with_transaction(driver_connection& conn, Func&& func,
                          std::shared_ptr<database_logger> logger = nullptr) {
        database_transaction txn(conn, std::move(logger));

        if constexpr (std::is_void_v<std::invoke_result_t<Func, database_transaction&>>) {
            std::invoke(std::forward<Func>(func), txn);
            txn.commit();
        } else {
            auto result = std::invoke(std::forward<Func>(func), txn);
            txn.commit();
            return result;
        }
    }

} // namespace gleipnir
