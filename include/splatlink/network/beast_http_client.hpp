#pragma once

#include "splatlink/network/http_client.hpp"
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace splatlink::network {

// HttpClient over Boost.Beast. Each request runs on its own io_context on the
// calling thread, so concurrent calls share no state.
class BeastHttpClient : public HttpClient {
public:
    BeastHttpClient();
    explicit BeastHttpClient(std::string user_agent);

    core::Result get(const std::string& url,
                     std::chrono::milliseconds timeout,
                     HttpResponse& response) override;

    core::Result post_multipart(const std::string& url,
                                const MultipartForm& form,
                                std::chrono::milliseconds timeout,
                                HttpResponse& response) override;

private:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    core::Result perform(const Url& url,
                         Request& request,
                         std::chrono::milliseconds timeout,
                         HttpResponse& response);

    std::string user_agent_;
};

} // namespace splatlink::network
