#pragma once

#include "splatlink/core/cli.hpp"
#include "splatlink/core/result.hpp"
#include "splatlink/transfer/file_picker.hpp"
#include "splatlink/transfer/pipeline_config.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace splatlink::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }

    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Prompts for an image path on a text stream; an empty line cancels
class ConsoleFilePicker : public transfer::FilePicker {
public:
    ConsoleFilePicker(std::istream& input, std::ostream& output);

    std::optional<std::filesystem::path> pick_file() override;

private:
    std::istream& input_;
    std::ostream& output_;
};

class FetchCommandHandler : public CommandHandler {
public:
    FetchCommandHandler(const CommandLineParser& parser, transfer::PipelineConfig config);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload an image and fetch its PLY artifact"; }
    std::string get_usage() const override { return "splatlink fetch [image] [--no-cache]"; }

private:
    const CommandLineParser& parser_;
    transfer::PipelineConfig config_;

    CommandResult run_pipeline(const std::filesystem::path& image_path);
};

class DownloadCommandHandler : public CommandHandler {
public:
    DownloadCommandHandler(const CommandLineParser& parser, transfer::PipelineConfig config);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download the PLY artifact of a finished job"; }
    std::string get_usage() const override { return "splatlink download <job_id> [--info]"; }

private:
    const CommandLineParser& parser_;
    transfer::PipelineConfig config_;
};

class CacheCommandHandler : public CommandHandler {
public:
    explicit CacheCommandHandler(transfer::PipelineConfig config);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show statistics or remove expired cache entries"; }
    std::string get_usage() const override { return "splatlink cache <stats|sweep>"; }

private:
    transfer::PipelineConfig config_;
};

// Copies an artifact to "loaded_{unix_millis}.ply" in the artifact directory
// and removes older loaded_*.ply copies, so renderers that cache assets by
// path pick up the new file.
Result publish_reload_copy(const std::filesystem::path& artifact,
                           const std::filesystem::path& asset_directory,
                           std::filesystem::path& copy_path);

} // namespace splatlink::core
