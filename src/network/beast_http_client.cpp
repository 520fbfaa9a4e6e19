#include "splatlink/network/beast_http_client.hpp"
#include "splatlink/core/logger.hpp"
#include "splatlink/core/utils.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace splatlink::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::optional<Url> Url::parse(const std::string& url) {
    using core::utils::StringUtils;

    const std::string scheme = "http://";
    if (!StringUtils::starts_with(StringUtils::to_lower(url), scheme)) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string target = slash == std::string::npos ? "/" : rest.substr(slash);

    if (authority.empty()) {
        return std::nullopt;
    }

    Url parsed;
    parsed.target = target;

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
        if (parsed.port.empty() ||
            parsed.port.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
    } else {
        parsed.host = authority;
        parsed.port = "80";
    }

    // Bracketed IPv6 literal
    if (parsed.host.size() > 2 && parsed.host.front() == '[' && parsed.host.back() == ']') {
        parsed.host = parsed.host.substr(1, parsed.host.size() - 2);
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }

    return parsed;
}

BeastHttpClient::BeastHttpClient()
    : user_agent_(std::string("splatlink/1.0 ") + BOOST_BEAST_VERSION_STRING) {
}

BeastHttpClient::BeastHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
}

core::Result BeastHttpClient::get(const std::string& url,
                                  std::chrono::milliseconds timeout,
                                  HttpResponse& response) {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid URL: " + url);
    }

    Request request{http::verb::get, parsed->target, 11};
    request.set(http::field::host, parsed->host);
    request.set(http::field::user_agent, user_agent_);

    return perform(*parsed, request, timeout, response);
}

core::Result BeastHttpClient::post_multipart(const std::string& url,
                                             const MultipartForm& form,
                                             std::chrono::milliseconds timeout,
                                             HttpResponse& response) {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid URL: " + url);
    }

    Request request{http::verb::post, parsed->target, 11};
    request.set(http::field::host, parsed->host);
    request.set(http::field::user_agent, user_agent_);
    request.set(http::field::content_type, form.content_type());
    request.body() = form.encode();
    request.prepare_payload();

    return perform(*parsed, request, timeout, response);
}

core::Result BeastHttpClient::perform(const Url& url,
                                      Request& request,
                                      std::chrono::milliseconds timeout,
                                      HttpResponse& response) {
    net::io_context io_context;
    tcp::resolver resolver(io_context);
    beast::tcp_stream stream(io_context);
    beast::flat_buffer buffer;

    http::response_parser<http::vector_body<std::uint8_t>> parser;
    parser.body_limit(boost::none);

    beast::error_code failure;
    const char* failed_step = nullptr;
    bool finished = false;

    auto fail = [&](const beast::error_code& ec, const char* step) {
        failure = ec;
        failed_step = step;
    };

    const std::string method(request.method_string().data(), request.method_string().size());
    const std::string target(request.target().data(), request.target().size());

    LOG_DEBUG("HTTP {} http://{}:{}{}", method, url.host, url.port, target);

    resolver.async_resolve(url.host, url.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                fail(ec, "resolve");
                return;
            }

            // One deadline covers connect, write and read
            stream.expires_after(timeout);
            stream.async_connect(results,
                [&](beast::error_code ec, tcp::endpoint) {
                    if (ec) {
                        fail(ec, "connect");
                        return;
                    }

                    http::async_write(stream, request,
                        [&](beast::error_code ec, std::size_t) {
                            if (ec) {
                                fail(ec, "write");
                                return;
                            }

                            http::async_read(stream, buffer, parser,
                                [&](beast::error_code ec, std::size_t) {
                                    if (ec) {
                                        fail(ec, "read");
                                        return;
                                    }
                                    finished = true;
                                });
                        });
                });
        });

    try {
        // Guards the resolve step, which tcp_stream's deadline does not cover
        io_context.run_for(timeout + std::chrono::milliseconds(100));
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::NETWORK_ERROR,
                            "HTTP request to " + url.host + " failed: " + e.what());
    }

    if (!finished && !failed_step) {
        io_context.stop();
        return core::Result(core::ErrorCode::TIMEOUT,
                            "Request to " + url.host + " timed out after " +
                            core::utils::StringUtils::format_duration(timeout));
    }

    if (failed_step) {
        if (failure == beast::error::timeout) {
            return core::Result(core::ErrorCode::TIMEOUT,
                                std::string("Timed out during ") + failed_step + " to " + url.host);
        }
        return core::Result(core::ErrorCode::NETWORK_ERROR,
                            std::string("HTTP ") + failed_step + " failed: " + failure.message());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    auto message = parser.release();
    response.status = message.result_int();
    response.reason.assign(message.reason().data(), message.reason().size());
    response.body = std::move(message.body());

    LOG_TRACE("HTTP {} {} -> {} ({} bytes)", method, target, response.status, response.body.size());

    return core::Result();
}

}
