/**
 * @file http_client.cpp
 * @brief HTTP client adapter implementations
 */

#include "sms/relay/delivery/http_client.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>

namespace sms::relay::delivery {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string to_std_string(beast::string_view view) {
    return std::string(view.data(), view.size());
}

/**
 * @brief State of one request/response exchange on the io_context
 */
struct exchange {
    http::request<http::string_body> request;
    http::response<http::string_body> response;
    beast::flat_buffer buffer;
    std::optional<http_error> failure;
    bool completed = false;

    void fail(beast::error_code ec, http_error otherwise) {
        failure = ec == beast::error::timeout ? http_error::timeout : otherwise;
    }
};

template <class Stream>
void write_then_read(Stream& stream, exchange& ex) {
    http::async_write(stream, ex.request, [&stream, &ex](beast::error_code ec, std::size_t) {
        if (ec) {
            ex.fail(ec, http_error::io_error);
            return;
        }
        http::async_read(stream, ex.buffer, ex.response,
                         [&ex](beast::error_code ec, std::size_t) {
                             if (ec) {
                                 ex.fail(ec, http_error::io_error);
                                 return;
                             }
                             ex.completed = true;
                         });
    });
}

/**
 * @brief Resolve and connect the lowest layer of @p stream, then call @p next
 */
template <class Stream, class Next>
void open_connection(tcp::resolver& resolver, Stream& stream, const parsed_url& url,
             std::chrono::milliseconds timeout, exchange& ex, Next next) {
    resolver.async_resolve(
        url.host, url.port,
        [&stream, &ex, timeout, next](beast::error_code ec,
                                      const tcp::resolver::results_type& results) {
            if (ec) {
                ex.failure = http_error::resolve_failed;
                return;
            }
            auto& layer = beast::get_lowest_layer(stream);
            layer.expires_after(timeout);
            layer.async_connect(results,
                                [&ex, next](beast::error_code ec, const tcp::endpoint&) {
                                    if (ec) {
                                        ex.fail(ec, http_error::connect_failed);
                                        return;
                                    }
                                    next();
                                });
        });
}

/**
 * @brief Run the io_context until the exchange ends or the deadline passes
 */
std::expected<http_response, http_error> finish(asio::io_context& ioc,
                                                tcp::resolver& resolver,
                                                beast::tcp_stream& layer, exchange& ex,
                                                std::chrono::milliseconds timeout) {
    ioc.run_for(timeout);

    beast::error_code ignored;
    if (!ex.completed && !ex.failure) {
        // Deadline passed while resolving or mid-exchange
        resolver.cancel();
        layer.socket().close(ignored);
        ioc.restart();
        ioc.run();
        return std::unexpected(http_error::timeout);
    }

    layer.socket().shutdown(tcp::socket::shutdown_both, ignored);
    layer.socket().close(ignored);

    if (ex.failure) {
        return std::unexpected(*ex.failure);
    }

    http_response response;
    response.status_code = static_cast<int>(ex.response.result_int());
    for (const auto& field : ex.response) {
        response.headers.emplace_back(to_std_string(field.name_string()),
                                      to_std_string(field.value()));
    }
    response.body = std::move(ex.response.body());
    return response;
}

/**
 * @brief Client TLS context: TLS 1.2 or newer, peer verification per @p options
 */
std::expected<std::unique_ptr<ssl::context>, http_error> make_tls_context(
    const tls_options& options) {
    auto context = std::make_unique<ssl::context>(ssl::context::tls_client);
    SSL_CTX_set_min_proto_version(context->native_handle(), TLS1_2_VERSION);

    if (!options.verify_peer) {
        context->set_verify_mode(ssl::verify_none);
        return context;
    }

    beast::error_code ec;
    if (options.ca_file.empty()) {
        context->set_default_verify_paths(ec);
    } else {
        context->load_verify_file(options.ca_file.string(), ec);
    }
    if (ec) {
        return std::unexpected(http_error::tls_failed);
    }
    context->set_verify_mode(ssl::verify_peer);
    return context;
}

}  // namespace

// =============================================================================
// http_response / URL helpers
// =============================================================================

std::optional<std::string_view> http_response::get_header(
    std::string_view name) const noexcept {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

std::expected<parsed_url, http_error> parse_url(std::string_view url) {
    parsed_url result;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected(http_error::invalid_url);
    }
    auto scheme = url.substr(0, scheme_end);
    if (iequals(scheme, "https")) {
        result.secure = true;
        result.port = "443";
    } else if (!iequals(scheme, "http")) {
        return std::unexpected(http_error::invalid_url);
    }
    url.remove_prefix(scheme_end + 3);

    auto path_pos = url.find_first_of("/?");
    auto authority = url.substr(0, path_pos);
    if (path_pos != std::string_view::npos) {
        auto target = url.substr(path_pos);
        result.target = target.front() == '/' ? std::string(target)
                                              : "/" + std::string(target);
    }

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port = authority.substr(colon + 1);
        if (port.empty() ||
            !std::all_of(port.begin(), port.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            })) {
            return std::unexpected(http_error::invalid_url);
        }
        result.port = std::string(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return std::unexpected(http_error::invalid_url);
    }
    result.host = std::string(authority);
    return result;
}

// =============================================================================
// http_client_adapter
// =============================================================================

std::expected<http_response, http_error> http_client_adapter::get(
    std::string_view url, std::chrono::milliseconds timeout) {
    http_request request;
    request.method = http_method::get;
    request.url = std::string(url);
    request.timeout = timeout;
    return execute(request);
}

// =============================================================================
// callback_http_client
// =============================================================================

callback_http_client::callback_http_client(execute_callback callback)
    : callback_(std::move(callback)) {}

std::expected<http_response, http_error> callback_http_client::execute(
    const http_request& request) {
    if (!callback_) {
        return std::unexpected(http_error::io_error);
    }
    return callback_(request);
}

// =============================================================================
// beast_http_client
// =============================================================================

beast_http_client::beast_http_client(std::string user_agent, tls_options tls)
    : user_agent_(std::move(user_agent)), tls_(std::move(tls)) {}

std::expected<http_response, http_error> beast_http_client::execute(
    const http_request& request) {
    auto url = parse_url(request.url);
    if (!url) {
        return std::unexpected(url.error());
    }

    exchange ex;
    ex.request.method(request.method == http_method::post ? http::verb::post
                                                          : http::verb::get);
    ex.request.target(url->target);
    ex.request.version(11);
    ex.request.set(http::field::host, url->host);
    ex.request.set(http::field::user_agent, user_agent_);
    for (const auto& [name, value] : request.headers) {
        ex.request.set(name, value);
    }
    if (request.method == http_method::post) {
        ex.request.body() = request.body;
        ex.request.prepare_payload();
    }

    asio::io_context ioc;
    tcp::resolver resolver(ioc);

    if (!url->secure) {
        beast::tcp_stream stream(ioc);
        open_connection(resolver, stream, *url, request.timeout, ex,
                [&stream, &ex]() { write_then_read(stream, ex); });
        return finish(ioc, resolver, stream, ex, request.timeout);
    }

    auto context = make_tls_context(tls_);
    if (!context) {
        return std::unexpected(context.error());
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, **context);
    if (SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str()) != 1) {
        return std::unexpected(http_error::tls_failed);
    }
    if (tls_.verify_peer && SSL_set1_host(stream.native_handle(), url->host.c_str()) != 1) {
        return std::unexpected(http_error::tls_failed);
    }

    open_connection(resolver, stream, *url, request.timeout, ex, [&stream, &ex]() {
        stream.async_handshake(ssl::stream_base::client, [&stream, &ex](beast::error_code ec) {
            if (ec) {
                ex.fail(ec, http_error::tls_failed);
                return;
            }
            write_then_read(stream, ex);
        });
    });
    return finish(ioc, resolver, beast::get_lowest_layer(stream), ex, request.timeout);
}

}  // namespace sms::relay::delivery
