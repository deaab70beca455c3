#include "mediastream/body/any_body.hpp"
#include <boost/asio/error.hpp>

namespace mediastream::body {
namespace detail {

template<class Body, class = void>
struct has_writer : std::false_type
{
};
template<class Body>
struct has_writer<Body, std::void_t<typename Body::writer>> : std::true_type
{
};

class proxy_writer
{
public:
    using ptr = std::unique_ptr<proxy_writer>;

    virtual ~proxy_writer()                          = default;
    virtual void init(beast::error_code& ec) = 0;
    virtual boost::optional<std::pair<any_body::writer::const_buffers_type, bool>>
    get(beast::error_code& ec) = 0;
};

class proxy_reader
{
public:
    using ptr = std::unique_ptr<proxy_reader>;

    virtual ~proxy_reader() = default;
    virtual void init(boost::optional<std::uint64_t> const& content_length,
                      beast::error_code& ec)       = 0;
    virtual std::size_t put(any_body::reader::const_buffers_type const& buffers,
                            beast::error_code& ec) = 0;
    virtual void finish(beast::error_code& ec)     = 0;
};

template<class Body>
class proxy_writer_impl : public proxy_writer
{
public:
    proxy_writer_impl(http::fields& h, typename Body::value_type& b)
        : writer_(h, b)
    {
    }
    void init(beast::error_code& ec) override { writer_.init(ec); }
    boost::optional<std::pair<any_body::writer::const_buffers_type, bool>>
    get(beast::error_code& ec) override
    {
        return writer_.get(ec);
    }

private:
    typename Body::writer writer_;
};

// Request-only bodies end up here if a handler assigns one to a response.
class unwritable_proxy : public proxy_writer
{
public:
    void init(beast::error_code& ec) override { ec = net::error::operation_not_supported; }
    boost::optional<std::pair<any_body::writer::const_buffers_type, bool>>
    get(beast::error_code& ec) override
    {
        ec = net::error::operation_not_supported;
        return boost::none;
    }
};

template<class Body>
class proxy_reader_impl : public proxy_reader
{
public:
    proxy_reader_impl(http::fields& h, typename Body::value_type& b)
        : reader_(h, b)
    {
    }
    void init(boost::optional<std::uint64_t> const& content_length,
              beast::error_code& ec) override
    {
        reader_.init(content_length, ec);
    }
    std::size_t put(any_body::reader::const_buffers_type const& buffers,
                    beast::error_code& ec) override
    {
        return reader_.put(buffers, ec);
    }
    void finish(beast::error_code& ec) override { reader_.finish(ec); }

private:
    typename Body::reader reader_;
};

} // namespace detail

class any_body::writer::impl
{
public:
    impl(http::fields& header, any_body::value_type& body)
        : header_(header)
        , body_(body)
    {
    }
    void init(beast::error_code& ec)
    {
        proxy_ = create_proxy_writer(header_, body_);
        proxy_->init(ec);
    }
    boost::optional<std::pair<any_body::writer::const_buffers_type, bool>>
    get(beast::error_code& ec)
    {
        return proxy_->get(ec);
    }

private:
    template<typename... Bodies>
    static detail::proxy_writer::ptr create_proxy_writer(http::fields& h,
                                                         any_body::variant_value<Bodies...>& body)
    {
        return std::visit(
            [&](auto& t) -> detail::proxy_writer::ptr {
                using value_type = std::decay_t<decltype(t)>;
                using body_type  = typename any_body::match_body<value_type, Bodies...>::type;
                static_assert(!std::is_void_v<body_type>, "No matching Body type found");

                if constexpr (detail::has_writer<body_type>::value)
                    return std::make_unique<detail::proxy_writer_impl<body_type>>(h, t);
                else
                    return std::make_unique<detail::unwritable_proxy>();
            },
            body);
    }

    http::fields& header_;
    any_body::value_type& body_;
    detail::proxy_writer::ptr proxy_;
};

class any_body::reader::impl
{
public:
    impl(http::fields& header, any_body::value_type& body)
        : header_(header)
        , body_(body)
    {
    }
    void init(boost::optional<std::uint64_t> const& content_length, beast::error_code& ec)
    {
        auto content_type = header_[http::field::content_type];

        if (content_type.starts_with("multipart/form-data"))
            proxy_ = create_proxy_reader<form_data_body>(header_, body_);
        else
            proxy_ = create_proxy_reader<string_body>(header_, body_);

        proxy_->init(content_length, ec);
    }
    std::size_t put(const_buffers_type const& buffers, beast::error_code& ec)
    {
        return proxy_->put(buffers, ec);
    }
    void finish(beast::error_code& ec) { proxy_->finish(ec); }

private:
    template<class Body>
    static detail::proxy_reader::ptr create_proxy_reader(http::fields& h, any_body::value_type& b)
    {
        if (!b.is_body_type<Body>())
            b = typename Body::value_type {};
        return std::make_unique<detail::proxy_reader_impl<Body>>(h, b.as<Body>());
    }

    http::fields& header_;
    any_body::value_type& body_;
    detail::proxy_reader::ptr proxy_;
};

any_body::writer::writer(http::fields& h, value_type& b)
    : impl_(std::make_unique<impl>(h, b))
{
}

any_body::writer::~writer() = default;

void any_body::writer::init(beast::error_code& ec)
{
    impl_->init(ec);
}

boost::optional<std::pair<any_body::writer::const_buffers_type, bool>>
any_body::writer::get(beast::error_code& ec)
{
    return impl_->get(ec);
}

any_body::reader::reader(http::fields& h, value_type& b)
    : impl_(std::make_unique<impl>(h, b))
{
}

any_body::reader::~reader() = default;

void any_body::reader::init(boost::optional<std::uint64_t> const& content_length,
                            beast::error_code& ec)
{
    impl_->init(content_length, ec);
}

std::size_t any_body::reader::put(const_buffers_type const& buffers, beast::error_code& ec)
{
    return impl_->put(buffers, ec);
}

void any_body::reader::finish(beast::error_code& ec)
{
    impl_->finish(ec);
}

} // namespace mediastream::body
