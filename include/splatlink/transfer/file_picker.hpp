#pragma once

#include <filesystem>
#include <optional>

namespace splatlink::transfer {

// Source of the image to upload (native dialog, console prompt, ...)
class FilePicker {
public:
    virtual ~FilePicker() = default;

    // Blocks until a file is chosen; nullopt when the user cancels
    virtual std::optional<std::filesystem::path> pick_file() = 0;
};

} // namespace splatlink::transfer
