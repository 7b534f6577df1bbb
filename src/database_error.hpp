#pragma once

#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gleipnir {

    // Error raised by a driver (libpq or any registered driver)
    struct database_error : public std::runtime_error {
        std::string sql_state;
        std::source_location location;

        database_error(std::string msg, std::string state = "",
                      std::source_location loc = std::source_location::current())
            : std::runtime_error(msg), sql_state(std::move(state)), location(loc) {}

        std::string message() const { return what(); }
    };

    /**
     * The single error kind surfaced by the persistence layer.
     *
     * Wraps the driver-level cause (if any) so callers can inspect it without
     * depending on driver types. Mapper exceptions are never wrapped in this type.
     */
    class persistence_failure : public std::runtime_error {
    public:
        explicit persistence_failure(std::string msg,
                                     std::exception_ptr cause = nullptr,
                                     std::source_location loc = std::source_location::current())
            : std::runtime_error(msg), cause_(std::move(cause)), location_(loc) {}

        [[nodiscard]] bool has_cause() const noexcept {
            return static_cast<bool>(cause_);
        }

        [[nodiscard]] const std::exception_ptr& cause() const noexcept {
            return cause_;
        }

        // Message of the wrapped cause, empty when there is none
        [[nodiscard]] std::string cause_message() const {
            if (!cause_) return "";
            try {
                std::rethrow_exception(cause_);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "unknown cause";
            }
        }

        // SQLSTATE of the wrapped cause when it came from a driver
        [[nodiscard]] std::string sql_state() const {
            if (!cause_) return "";
            try {
                std::rethrow_exception(cause_);
            } catch (const database_error& e) {
                return e.sql_state;
            } catch (...) {
                return "";
            }
        }

        [[nodiscard]] const std::source_location& location() const noexcept {
            return location_;
        }

    private:
        std::exception_ptr cause_;
        std::source_location location_;
    };

    // Argument and configuration checks shared by the core
    namespace validate {

        inline const std::string& require_non_empty(const std::string& value, std::string_view name) {
            if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
                throw persistence_failure{
                    "The '" + std::string(name) + "' parameter has not been initialized"};
            }
            return value;
        }

        template<typename T>
        T* require_non_null(T* ptr, std::string_view name) {
            if (!ptr) {
                throw persistence_failure{
                    "The '" + std::string(name) + "' parameter has not been initialized"};
            }
            return ptr;
        }

        template<typename T>
        const std::vector<T>& require_least_one_argument(const std::vector<T>& args, std::string_view name) {
            if (args.empty()) {
                throw persistence_failure{
                    "The '" + std::string(name) + "' parameter must have at least one argument"};
            }
            return args;
        }

    } // namespace validate

} // namespace gleipnir
