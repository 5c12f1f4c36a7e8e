#pragma once

#include "shell/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lc::shell {

class Router {
public:
    void registerCommand(const std::string& name,
                         std::string description,
                         std::string usage,
                         CommandHandler handler,
                         const std::unordered_set<std::string>& aliases = {});

    [[nodiscard]] CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] CommandResult executeArgs(const std::vector<std::string>& args) const;

    // Full command listing, or one command's usage when name is known
    [[nodiscard]] std::string renderHelp(const std::string& name = {}) const;

    [[nodiscard]] bool knows(const std::string& nameOrAlias) const;

private:
    std::map<std::string, CommandInfo> commands_;  // sorted for help output
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string joinAliases(const std::unordered_set<std::string>& aliases);
};

} // namespace lc::shell
