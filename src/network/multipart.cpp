#include "splatlink/network/multipart.hpp"
#include "splatlink/core/utils.hpp"
#include "splatlink/crypto/crypto_types.hpp"
#include "splatlink/crypto/random.hpp"

namespace splatlink::network {

namespace {

// Quoted Content-Disposition parameter; '"', CR and LF are percent-encoded
// the way browsers encode form field and file names
std::string escape_quoted(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"': escaped += "%22"; break;
            case '\r': escaped += "%0D"; break;
            case '\n': escaped += "%0A"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

}

MultipartForm::MultipartForm()
    : boundary_("----splatlink" + crypto::SecureRandom::generate_hex(crypto::BOUNDARY_RANDOM_BYTES)) {
}

MultipartForm::MultipartForm(std::string boundary)
    : boundary_(std::move(boundary)) {
}

void MultipartForm::add_file(const std::string& name,
                             const std::string& filename,
                             const std::string& content_type,
                             std::vector<std::uint8_t> data) {
    parts_.push_back(MultipartPart{name, filename, content_type, std::move(data)});
}

std::string MultipartForm::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartForm::encode() const {
    size_t total = 0;
    for (const auto& part : parts_) {
        total += part.data.size() + part.name.size() + part.filename.size() + 160;
    }

    std::string body;
    body.reserve(total + boundary_.size() + 8);

    for (const auto& part : parts_) {
        body += "--" + boundary_ + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + escape_quoted(part.name) + "\"";
        if (!part.filename.empty()) {
            body += "; filename=\"" + escape_quoted(part.filename) + "\"";
        }
        body += "\r\n";
        body += "Content-Type: " + part.content_type + "\r\n\r\n";
        body.append(reinterpret_cast<const char*>(part.data.data()), part.data.size());
        body += "\r\n";
    }

    body += "--" + boundary_ + "--\r\n";
    return body;
}

std::string MultipartForm::content_type_for(const std::filesystem::path& path) {
    auto extension = core::utils::StringUtils::to_lower(path.extension().string());

    if (extension == ".jpg" || extension == ".jpeg") return "image/jpeg";
    if (extension == ".png") return "image/png";
    if (extension == ".bmp") return "image/bmp";

    return "application/octet-stream";
}

}
