#include "splatlink/transfer/transfer_status.hpp"
#include <fmt/format.h>

namespace splatlink::transfer {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

int percent(double progress) {
    return static_cast<int>(progress * 100.0 + 0.5);
}

}

bool is_terminal(const TransferStatus& status) {
    return std::holds_alternative<status::Idle>(status) ||
           std::holds_alternative<status::Completed>(status) ||
           std::holds_alternative<status::Error>(status);
}

const char* status_name(const TransferStatus& status) {
    return std::visit(overloaded{
        [](const status::Idle&) { return "Idle"; },
        [](const status::SelectingFile&) { return "SelectingFile"; },
        [](const status::Uploading&) { return "Uploading"; },
        [](const status::Processing&) { return "Processing"; },
        [](const status::Downloading&) { return "Downloading"; },
        [](const status::Completed&) { return "Completed"; },
        [](const status::Error&) { return "Error"; },
    }, status);
}

std::string describe(const TransferStatus& status) {
    return std::visit(overloaded{
        [](const status::Idle&) { return std::string("Idle"); },
        [](const status::SelectingFile&) { return std::string("Waiting for file selection..."); },
        [](const status::Uploading& s) { return fmt::format("Uploading... {}%", percent(s.progress)); },
        [](const status::Processing& s) { return s.stage; },
        [](const status::Downloading& s) { return fmt::format("Downloading PLY... {}%", percent(s.progress)); },
        [](const status::Completed& s) {
            return fmt::format("Completed in {:.2f}s: {}", s.total_time, s.artifact_path.string());
        },
        [](const status::Error& s) { return "Error: " + s.message; },
    }, status);
}

}
