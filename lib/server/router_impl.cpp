#include "router_impl.h"
#include "mediastream/util/misc.hpp"
#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>
#include <set>
#include <stdexcept>

namespace mediastream::server {

namespace detail {

static auto split_segments(std::string_view path)
{
    auto segments = util::split(path, "/");

    if (path.ends_with("/"))
        segments.push_back(std::string_view());

    return segments;
}

} // namespace detail

router_impl::router_impl()
    : root_(std::make_unique<node>())
{
}

void router_impl::set_http_handler_impl(http::verb method,
                                        std::string_view path,
                                        coro_http_handler_type&& handler)
{
    auto segments            = detail::split_segments(path);
    auto target              = insert(root_.get(), segments, 0);
    target->handlers[method] = std::move(handler);
}

router_impl::node* router_impl::insert(node* parent,
                                       const std::vector<std::string_view>& segments,
                                       size_t index)
{
    if (index >= segments.size())
        return parent;

    const auto& seg = segments.at(index);

    if (segments.size() - 1 == index && seg == "*") {
        if (!parent->wildcard_child) {
            auto child             = std::make_unique<node>();
            child->key             = seg;
            child->type            = node::node_type::wildcard_node;
            parent->wildcard_child = std::move(child);
        }
        return insert(parent->wildcard_child.get(), segments, index + 1);
    }

    if (!seg.empty() && seg.starts_with(":")) {
        auto iter = std::ranges::find_if(parent->param_children,
                                         [&](const auto& child) { return child->key == seg; });
        if (iter != parent->param_children.end())
            return insert(iter->get(), segments, index + 1);

        auto child        = std::make_unique<node>();
        child->key        = seg;
        child->type       = node::node_type::param_node;
        child->param_name = seg.substr(1);

        parent->param_children.push_back(std::move(child));
        return insert(parent->param_children.back().get(), segments, index + 1);
    }

    if (!seg.empty() && seg.front() == '{' && seg.back() == '}') {
        auto iter = std::ranges::find_if(parent->regex_children,
                                         [&](const auto& child) { return child->key == seg; });
        if (iter != parent->regex_children.end())
            return insert(iter->get(), segments, index + 1);

        std::string_view inside = seg.substr(1, seg.size() - 2);
        size_t pos              = inside.find(':');
        if (pos == std::string_view::npos)
            throw std::invalid_argument(fmt::format("route segment '{}' has no pattern", seg));

        auto pattern = inside.substr(pos + 1);

        auto child        = std::make_unique<node>();
        child->key        = seg;
        child->type       = node::node_type::regex_node;
        child->param_name = inside.substr(0, pos);
        child->regex      = std::regex(pattern.begin(), pattern.end());

        parent->regex_children.push_back(std::move(child));
        return insert(parent->regex_children.back().get(), segments, index + 1);
    }

    auto [iter, inserted] =
        parent->static_children.try_emplace(std::string(seg), std::make_unique<node>());
    if (inserted) {
        iter->second->key  = seg;
        iter->second->type = node::node_type::static_node;
    }
    return insert(iter->second.get(), segments, index + 1);
}

const router_impl::node*
router_impl::find_route(const request& req, params_type& params, std::string& allow) const
{
    auto segments = detail::split_segments(req.path());

    std::set<std::string> allows;
    auto found = match_nodes(root_.get(), segments, 0, params, [&](const node* candidate) {
        for (const auto& v : candidate->handlers)
            allows.insert(std::string(util::to_std_view(http::to_string(v.first))));

        return candidate->handlers.contains(req.method());
    });

    allow = boost::join(allows, ", ");
    return found;
}

net::awaitable<bool> router_impl::pre_routing(request& req, response& resp) const
{
    switch (req.method()) {
        case http::verb::get:
        case http::verb::head:
        case http::verb::options: co_return true;
        default: break;
    }

    params_type params;
    std::string allow;
    if (find_route(req, params, allow))
        co_return true;

    // The unread body makes the connection unusable for the next request.
    resp.keep_alive(false);
    if (!allow.empty()) {
        resp.set(http::field::allow, allow);
        resp.set_error_content(http::status::method_not_allowed);
        co_return false;
    }
    resp.set_error_content(http::status::not_found);
    co_return false;
}

net::awaitable<void> router_impl::proc_routing(request& req, response& resp) const
{
    params_type params;
    std::string allow;

    if (auto found = find_route(req, params, allow); found) {
        req.set_path_param(std::move(params));
        co_await found->handlers.at(req.method())(req, resp);
        co_return;
    }
    if (!allow.empty()) {
        resp.set(http::field::allow, allow);
        resp.set_error_content(http::status::method_not_allowed);
        co_return;
    }
    resp.set_error_content(http::status::not_found);
}

const router_impl::node* router_impl::match_nodes(const node* parent,
                                                  const std::vector<std::string_view>& segments,
                                                  size_t index,
                                                  params_type& params,
                                                  const match_handler& handler) const
{
    if (!parent)
        return nullptr;

    if (index == segments.size()) {
        if (!handler(parent))
            return nullptr;
        return parent;
    }

    const auto& seg = segments[index];

    // static
    if (auto iter = parent->static_children.find(std::string(seg));
        iter != parent->static_children.end())
    {
        if (auto found = match_nodes(iter->second.get(), segments, index + 1, params, handler))
            return found;
    }

    // regex
    for (const auto& child : parent->regex_children) {
        if (std::regex_match(seg.begin(), seg.end(), child->regex)) {
            params[child->param_name] = std::string(seg);
            if (auto found = match_nodes(child.get(), segments, index + 1, params, handler))
                return found;
            params.erase(child->param_name);
        }
    }

    // param
    for (const auto& child : parent->param_children) {
        params[child->param_name] = std::string(seg);
        if (auto found = match_nodes(child.get(), segments, index + 1, params, handler))
            return found;
        params.erase(child->param_name);
    }

    // wildcard
    if (parent->wildcard_child) {
        std::string rest;
        for (size_t i = index; i < segments.size(); ++i) {
            if (!rest.empty())
                rest += "/";
            rest += segments[i];
        }
        params["*"] = std::move(rest);
        if (auto found = match_nodes(
                parent->wildcard_child.get(), segments, segments.size(), params, handler))
            return found;
        params.erase("*");
    }
    return nullptr;
}

} // namespace mediastream::server
