#pragma once

#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

namespace gleipnir {

    /**
     * Supplies everything needed to open a connection.
     *
     * All four values are required; an empty value is reported as a
     * persistence_failure when the executor tries to connect.
     */
    class connection_loader {
    public:
        virtual ~connection_loader() = default;

        // Registered driver name, e.g. "postgresql"
        [[nodiscard]] virtual std::string driver() const = 0;

        // libpq URI or key/value conninfo; a "jdbc:" prefix is accepted
        [[nodiscard]] virtual std::string url() const = 0;

        [[nodiscard]] virtual std::string username() const = 0;

        [[nodiscard]] virtual std::string password() const = 0;
    };

    // Plain values, typically filled with designated initializers
    struct connection_settings : public connection_loader {
        std::string driver_name = "postgresql";
        std::string database_url;
        std::string user;
        std::string secret;

        connection_settings() = default;

        connection_settings(std::string driver_name_, std::string database_url_,
                            std::string user_, std::string secret_)
            : driver_name(std::move(driver_name_)), database_url(std::move(database_url_)),
              user(std::move(user_)), secret(std::move(secret_)) {}

        [[nodiscard]] std::string driver() const override { return driver_name; }
        [[nodiscard]] std::string url() const override { return database_url; }
        [[nodiscard]] std::string username() const override { return user; }
        [[nodiscard]] std::string password() const override { return secret; }
    };

    // Reads GLEIPNIR_DB_DRIVER, GLEIPNIR_DB_URL, GLEIPNIR_DB_USER and GLEIPNIR_DB_PASSWORD
    class environment_connection_loader : public connection_loader {
    public:
        explicit environment_connection_loader(std::string prefix = "GLEIPNIR_DB_")
            : prefix_(std::move(prefix)) {}

        [[nodiscard]] std::string driver() const override { return read("DRIVER"); }
        [[nodiscard]] std::string url() const override { return read("URL"); }
        [[nodiscard]] std::string username() const override { return read("USER"); }
        [[nodiscard]] std::string password() const override { return read("PASSWORD"); }

    private:
        [[nodiscard]] std::string read(std::string_view key) const {
            std::string name = prefix_ + std::string(key);
            const char* value = std::getenv(name.c_str());
            return value ? std::string(value) : std::string();
        }

        std::string prefix_;
    };

} // namespace gleipnir
