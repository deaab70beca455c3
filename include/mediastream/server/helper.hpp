#pragma once
#include "mediastream/config.hpp"
#include "mediastream/util/type_traits.h"
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <tuple>
#include <type_traits>

namespace mediastream::server {

class request;
class response;

namespace helper {

template<typename T>
constexpr inline bool is_awaitable_v =
    util::is_specialization_v<std::remove_cvref_t<T>, net::awaitable>;

template<typename T>
struct awaited
{
    using type = T;
};
template<typename T>
struct awaited<net::awaitable<T>>
{
    using type = T;
};

template<typename Func, typename... Args>
using awaited_result_t = typename awaited<std::invoke_result_t<Func, Args...>>::type;

/// Invoke `fn`, awaiting the result when `fn` is a coroutine.
template<typename Func, typename... Args>
net::awaitable<awaited_result_t<Func&&, Args&&...>> co_invoke(Func&& fn, Args&&... args)
{
    if constexpr (is_awaitable_v<std::invoke_result_t<Func&&, Args&&...>>)
        co_return co_await std::invoke(std::forward<Func>(fn), std::forward<Args>(args)...);
    else
        co_return std::invoke(std::forward<Func>(fn), std::forward<Args>(args)...);
}

template<typename T>
constexpr inline bool has_before_v = requires(T& aspect, request& req, response& resp) {
    aspect.before(req, resp);
};

template<typename T>
constexpr inline bool has_after_v = requires(T& aspect, request& req, response& resp) {
    aspect.after(req, resp);
};

enum class phase
{
    before,
    after
};

template<phase Phase, typename Aspect>
net::awaitable<void> run_aspect(Aspect& aspect, request& req, response& resp, bool& ok)
{
    if (!ok)
        co_return;

    if constexpr (Phase == phase::before && has_before_v<Aspect>)
        ok = co_await co_invoke([&]() { return aspect.before(req, resp); });
    else if constexpr (Phase == phase::after && has_after_v<Aspect>)
        ok = co_await co_invoke([&]() { return aspect.after(req, resp); });
}

/// Run one phase of every aspect in order. The first aspect returning false stops the rest.
template<phase Phase, typename Tuple>
net::awaitable<bool> run_aspects(Tuple& aspects, request& req, response& resp)
{
    bool ok = true;
    co_await std::apply(
        [&](auto&... aspect) -> net::awaitable<void> {
            ((co_await run_aspect<Phase>(aspect, req, resp, ok)), ...);
        },
        aspects);
    co_return ok;
}

} // namespace helper
} // namespace mediastream::server
