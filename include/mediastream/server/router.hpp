#pragma once
#include "mediastream/config.hpp"
#include "mediastream/server/helper.hpp"
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>
#include <functional>
#include <type_traits>
#include <string_view>

namespace mediastream::server {

class request;
class response;

/**
 * Maps request paths onto handlers.
 *
 * Path segments are static (`videos`), named (`:id`) or constrained by a regular expression
 * (`{id:^\d+$}`); a trailing `*` matches the rest of the path. Handlers may return `void` or
 * `net::awaitable<void>`. Aspects with `before`/`after` members run around the handler; a
 * `before` returning false skips it.
 */
class router
{
public:
    virtual ~router() = default;

    template<typename Func, typename... Aspects>
    void
    set_http_handler(http::verb method, std::string_view key, Func&& handler, Aspects&&... asps);

    template<http::verb... method, typename Func, typename... Aspects>
        requires(!std::is_member_function_pointer_v<std::decay_t<Func>>)
    void set_http_handler(std::string_view key, Func&& handler, Aspects&&... asps)
    {
        static_assert(sizeof...(method) >= 1, "must set method");
        (set_http_handler(method, key, handler, asps...), ...);
    }

    template<http::verb... method, typename Func, typename... Aspects>
        requires std::is_member_function_pointer_v<Func>
    void set_http_handler(std::string_view key,
                          Func handler,
                          util::class_type_t<Func>& owner,
                          Aspects&&... asps);

protected:
    using coro_http_handler_type =
        std::function<net::awaitable<void>(request& req, response& resp)>;

    template<typename Func, typename... Aspects>
    coro_http_handler_type make_coro_http_handler(Func&& handler, Aspects&&... asps);

    virtual void set_http_handler_impl(http::verb method,
                                       std::string_view key,
                                       coro_http_handler_type&& handler) = 0;
};

} // namespace mediastream::server

#include "mediastream/server/router.inl"
