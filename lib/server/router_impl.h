#pragma once
#include "mediastream/server/request.hpp"
#include "mediastream/server/response.hpp"
#include "mediastream/server/router.hpp"
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mediastream::server {

class router_impl : public router
{
public:
    router_impl();

    /// Decide before the body is read whether a request with a payload has a handler.
    net::awaitable<bool> pre_routing(request& req, response& resp) const;
    net::awaitable<void> proc_routing(request& req, response& resp) const;

protected:
    void set_http_handler_impl(http::verb method,
                               std::string_view path,
                               coro_http_handler_type&& handler) override;

private:
    struct node
    {
        enum class node_type
        {
            static_node,
            param_node,
            regex_node,
            wildcard_node,
        };

        std::string key;
        std::string param_name;
        std::regex regex;
        node_type type = node_type::static_node;

        std::unordered_map<http::verb, coro_http_handler_type> handlers;

        std::unordered_map<std::string, std::unique_ptr<node>> static_children;
        std::vector<std::unique_ptr<node>> param_children;
        std::vector<std::unique_ptr<node>> regex_children;
        std::unique_ptr<node> wildcard_child;
    };

    using params_type   = std::unordered_map<std::string, std::string>;
    using match_handler = std::function<bool(const node* node)>;

    static node* insert(node* parent, const std::vector<std::string_view>& segments, size_t index);

    const node* match_nodes(const node* parent,
                            const std::vector<std::string_view>& segments,
                            size_t index,
                            params_type& params,
                            const match_handler& handler) const;

    /// The node handling `req`, collecting the methods of every node the path reaches.
    const node* find_route(const request& req, params_type& params, std::string& allow) const;

    std::unique_ptr<node> root_;
};

} // namespace mediastream::server
