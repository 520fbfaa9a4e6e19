#pragma once

#include "splatlink/core/cli.hpp"
#include "splatlink/core/command_handler.hpp"
#include "splatlink/transfer/pipeline_config.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace splatlink::core {

class CommandRegistry {
public:
    CommandRegistry(const CommandLineParser& parser, const transfer::PipelineConfig& config);

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    void print_help() const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

} // namespace splatlink::core
