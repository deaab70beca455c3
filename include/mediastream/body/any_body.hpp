#pragma once
#include "mediastream/body/blob_body.hpp"
#include "mediastream/body/empty_body.hpp"
#include "mediastream/body/form_data_body.hpp"
#include "mediastream/body/json_body.hpp"
#include "mediastream/body/string_body.hpp"
#include <memory>
#include <type_traits>
#include <variant>

namespace mediastream::body {

/**
 * A body whose concrete type is chosen per message.
 *
 * Requests are read as `form_data_body` for multipart content and as `string_body`
 * otherwise. Responses are written with whatever body value was assigned.
 */
struct any_body
{
    template<typename T, typename... Bodies>
    struct match_body;

    template<typename T, typename Body, typename... Bodies>
    struct match_body<T, Body, Bodies...>
    {
        using type = std::conditional_t<std::is_same_v<T, typename Body::value_type>,
                                        Body,
                                        typename match_body<T, Bodies...>::type>;
    };

    template<typename T>
    struct match_body<T>
    {
        using type = void;
    };

    template<typename... Bodies>
    class variant_value : public std::variant<typename Bodies::value_type...>
    {
    public:
        using std::variant<typename Bodies::value_type...>::variant;

        template<typename Body>
        bool is_body_type() const
        {
            return std::holds_alternative<typename Body::value_type>(*this);
        }

        template<class Body>
        typename Body::value_type& as() &
        {
            using body_type = typename match_body<typename Body::value_type, Bodies...>::type;
            static_assert(!std::is_void_v<body_type>, "No matching Body type found");
            return std::get<typename Body::value_type>(*this);
        }

        template<class Body>
        const typename Body::value_type& as() const&
        {
            using body_type = typename match_body<typename Body::value_type, Bodies...>::type;
            static_assert(!std::is_void_v<body_type>, "No matching Body type found");
            return std::get<typename Body::value_type>(*this);
        }
    };

    using value_type =
        variant_value<empty_body, string_body, json_body, form_data_body, blob_body>;

    class writer
    {
    public:
        using const_buffers_type = net::const_buffer;

        template<bool isRequest, class Fields>
        explicit writer(http::header<isRequest, Fields>& h, value_type& b)
            : writer(static_cast<http::fields&>(h), b)
        {
        }
        explicit writer(http::fields& h, value_type& b);
        ~writer();

        void init(beast::error_code& ec);
        boost::optional<std::pair<const_buffers_type, bool>> get(beast::error_code& ec);

    private:
        class impl;
        std::unique_ptr<impl> impl_;
    };

    class reader
    {
    public:
        using const_buffers_type = net::const_buffer;

        template<bool isRequest, class Fields>
        explicit reader(http::header<isRequest, Fields>& h, value_type& b)
            : reader(static_cast<http::fields&>(h), b)
        {
        }
        explicit reader(http::fields& h, value_type& b);
        ~reader();

        void init(boost::optional<std::uint64_t> const& content_length, beast::error_code& ec);
        std::size_t put(const_buffers_type const& buffers, beast::error_code& ec);
        void finish(beast::error_code& ec);

    private:
        class impl;
        std::unique_ptr<impl> impl_;
    };
};

} // namespace mediastream::body
