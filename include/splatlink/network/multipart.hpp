#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace splatlink::network {

struct MultipartPart {
    std::string name;
    std::string filename;
    std::string content_type;
    std::vector<std::uint8_t> data;
};

// multipart/form-data body builder (RFC 7578)
class MultipartForm {
public:
    MultipartForm();
    explicit MultipartForm(std::string boundary);

    void add_file(const std::string& name,
                  const std::string& filename,
                  const std::string& content_type,
                  std::vector<std::uint8_t> data);

    const std::string& boundary() const { return boundary_; }
    const std::vector<MultipartPart>& parts() const { return parts_; }

    std::string content_type() const;
    std::string encode() const;

    static std::string content_type_for(const std::filesystem::path& path);

private:
    std::string boundary_;
    std::vector<MultipartPart> parts_;
};

} // namespace splatlink::network
