#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
#include "database_query.hpp"
#include "mapped_result.hpp"
#include "query_executor.hpp"

namespace gleipnir {

    // A built statement bound to the executor that will run it
    class query_collector {
    public:
        query_collector(query_executor& executor, statement_spec spec)
            : executor_(executor), spec_(std::move(spec)) {}

        template<typename Mapper>
        requires std::invocable<Mapper&, mapped_result&>
        std::invoke_result_t<Mapper&, mapped_result&> execute(Mapper&& mapper) {
            return executor_.execute(spec_, std::forward<Mapper>(mapper));
        }

        [[nodiscard]] const statement_spec& statement() const noexcept {
            return spec_;
        }

    private:
        query_executor& executor_;
        statement_spec spec_;
    };

    /**
     * Entry point for repository code:
     *
     *   persistence_unit unit(executor);
     *   auto id = unit.persist([&](statement_builder& q) -> statement_builder& {
     *       return q.query("INSERT INTO users (name) VALUES (?)").args(name);
     *   }).execute([](mapped_result& r) {
     *       return r.has_next() ? r.generated_key<long long>() : std::nullopt;
     *   });
     */
    class persistence_unit {
    public:
        explicit persistence_unit(query_executor& executor)
            : executor_(executor) {}

        template<typename Builder>
        requires std::invocable<Builder&, statement_builder&>
        [[nodiscard]] query_collector persist(Builder&& fn) {
            statement_builder builder;
            decltype(auto) built = std::invoke(fn, builder);
            return query_collector(executor_, built.build());
        }

        // Hand a fresh builder to a callback that produces any value (e.g. a statement_spec)
        template<typename Builder>
        requires std::invocable<Builder&, statement_builder&>
        auto build(Builder&& fn) {
            statement_builder builder;
            return std::invoke(fn, builder);
        }

        [[nodiscard]] query_executor& executor() noexcept {
            return executor_;
        }

    private:
        query_executor& executor_;
    };

} // namespace gleipnir
