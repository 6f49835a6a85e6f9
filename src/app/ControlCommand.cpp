#include "app/ControlCommand.hpp"

#include <charconv>
#include <sstream>
#include <vector>

namespace beamstate::app {

namespace {

std::vector<std::string> tokenize(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

template <typename T>
std::optional<T> parseNumber(const std::string& text) {
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<ControlCommand> parseControlCommand(const std::string& text) {
    auto tokens = tokenize(text);
    if (tokens.empty()) {
        return std::nullopt;
    }

    const auto& verb = tokens[0];
    ControlCommand command;

    if (verb == "status" && tokens.size() == 1) {
        command.type = ControlCommand::Type::Status;
        return command;
    }

    if (verb == "check" && tokens.size() == 2) {
        auto id = parseNumber<int64_t>(tokens[1]);
        if (!id || *id <= 0) {
            return std::nullopt;
        }
        command.type = ControlCommand::Type::Check;
        command.nodeId = *id;
        return command;
    }

    if (verb == "maintenance" && tokens.size() == 2) {
        if (tokens[1] != "on" && tokens[1] != "off") {
            return std::nullopt;
        }
        command.type = ControlCommand::Type::Maintenance;
        command.enabled = tokens[1] == "on";
        return command;
    }

    if (verb == "scan" && (tokens.size() == 2 || tokens.size() == 3)) {
        command.type = ControlCommand::Type::Scan;
        command.cidr = tokens[1];
        if (tokens.size() == 3) {
            auto group = parseNumber<int64_t>(tokens[2]);
            if (!group || *group < 0) {
                return std::nullopt;
            }
            command.groupId = *group;
        }
        return command;
    }

    if (verb == "trace" && tokens.size() <= 2) {
        command.type = ControlCommand::Type::Trace;
        if (tokens.size() == 2) {
            auto limit = parseNumber<size_t>(tokens[1]);
            if (!limit || *limit == 0) {
                return std::nullopt;
            }
            command.limit = *limit;
        }
        return command;
    }

    return std::nullopt;
}

std::string formatControlCommand(const ControlCommand& command) {
    switch (command.type) {
    case ControlCommand::Type::Status:
        return "status";
    case ControlCommand::Type::Check:
        return "check " + std::to_string(command.nodeId);
    case ControlCommand::Type::Maintenance:
        return command.enabled ? "maintenance on" : "maintenance off";
    case ControlCommand::Type::Scan:
        return command.groupId > 0
                   ? "scan " + command.cidr + " " + std::to_string(command.groupId)
                   : "scan " + command.cidr;
    case ControlCommand::Type::Trace:
        return "trace " + std::to_string(command.limit);
    }
    return "status";
}

} // namespace beamstate::app
