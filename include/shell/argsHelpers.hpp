#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>

namespace lc::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult ok(std::string out, nlohmann::json data);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);

std::optional<int> parseInt(const std::string& sv);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

}
