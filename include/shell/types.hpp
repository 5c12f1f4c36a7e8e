#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace lc::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    std::string usage;                       // e.g. "copy <source> <target> [--overwrite]"
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
};

}
