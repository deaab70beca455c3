#pragma once
#include <tuple>
#include <utility>

namespace mediastream::server {

template<typename Func, typename... Aspects>
router::coro_http_handler_type router::make_coro_http_handler(Func&& handler, Aspects&&... asps)
{
    if constexpr (sizeof...(Aspects) == 0) {
        return [handler = std::forward<Func>(handler)](request& req,
                                                       response& resp) mutable
               -> net::awaitable<void> { co_await helper::co_invoke(handler, req, resp); };
    }
    else {
        return [handler = std::forward<Func>(handler),
                aspects = std::make_tuple(std::forward<Aspects>(asps)...)](
                   request& req, response& resp) mutable -> net::awaitable<void> {
            if (co_await helper::run_aspects<helper::phase::before>(aspects, req, resp))
                co_await helper::co_invoke(handler, req, resp);

            // after aspects run even when the handler was skipped
            co_await helper::run_aspects<helper::phase::after>(aspects, req, resp);
        };
    }
}

template<typename Func, typename... Aspects>
void router::set_http_handler(http::verb method,
                              std::string_view key,
                              Func&& handler,
                              Aspects&&... asps)
{
    set_http_handler_impl(
        method,
        key,
        make_coro_http_handler(std::forward<Func>(handler), std::forward<Aspects>(asps)...));
}

template<http::verb... method, typename Func, typename... Aspects>
    requires std::is_member_function_pointer_v<Func>
void router::set_http_handler(std::string_view key,
                              Func handler,
                              util::class_type_t<Func>& owner,
                              Aspects&&... asps)
{
    auto bound = [handler, &owner](request& req, response& resp) {
        return std::invoke(handler, owner, req, resp);
    };
    set_http_handler<method...>(key, std::move(bound), std::forward<Aspects>(asps)...);
}

} // namespace mediastream::server
