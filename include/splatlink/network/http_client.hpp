#pragma once

#include "splatlink/core/result.hpp"
#include "splatlink/network/multipart.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace splatlink::network {

struct HttpResponse {
    unsigned status = 0;
    std::string reason;
    std::vector<std::uint8_t> body;

    bool ok() const { return status >= 200 && status < 300; }
    std::string body_text() const { return std::string(body.begin(), body.end()); }
};

// http://host[:port][/path] split into its request parts
struct Url {
    std::string host;
    std::string port;
    std::string target;

    static std::optional<Url> parse(const std::string& url);
};

// Blocking HTTP seam used by the pipeline. Implementations must be safe to
// call from several threads at once; every call carries its own deadline.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual core::Result get(const std::string& url,
                             std::chrono::milliseconds timeout,
                             HttpResponse& response) = 0;

    virtual core::Result post_multipart(const std::string& url,
                                        const MultipartForm& form,
                                        std::chrono::milliseconds timeout,
                                        HttpResponse& response) = 0;
};

} // namespace splatlink::network
