#include "shell/Router.hpp"
#include "shell/Token.hpp"
#include "shell/Parser.hpp"
#include "shell/argsHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

using namespace lc::shell;
using namespace lc::logging;

void Router::registerCommand(const std::string& name, std::string description, std::string usage,
                             CommandHandler handler, const std::unordered_set<std::string>& aliases) {
    const std::string key = normalize(name);

    CommandInfo info{description.empty() ? "No description provided." : std::move(description),
                     std::move(usage), std::move(handler), {}};

    for (const std::string& alias : aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::knows(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::executeArgs(const std::vector<std::string>& args) const {
    return execute(parseTokens(tokenize(args)));
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty() || call.name == "help") {
        const auto topic = call.positionals.empty() ? std::string() : call.positionals.front();
        if (call.name.empty() && !hasKey(call, "help") && !hasKey(call, "h"))
            return {2, renderHelp(), "No command provided."};
        return ok(renderHelp(topic));
    }

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return {2, renderHelp(), fmt::format("Unknown command or alias: {}", call.name)};

    if (hasKey(call, "help") || hasKey(call, "h")) return ok(renderHelp(canonical));

    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);
    return commands_.at(canonical).handler(call);
}

std::string Router::renderHelp(const std::string& name) const {
    if (!name.empty()) {
        const auto canonical = canonicalFor(name);
        if (const auto it = commands_.find(canonical); it != commands_.end())
            return fmt::format("Usage: lockcopy {}\n\n  {}\n  Aliases: {}\n",
                               it->second.usage, it->second.description, joinAliases(it->second.aliases));
    }

    std::string out = "Usage: lockcopy <command> [arguments] [--config <path>] [--json]\n\nCommands:\n";
    for (const auto& [key, info] : commands_)
        out += fmt::format("  {:<58} {}\n", info.usage, info.description);
    out += "\nRun 'lockcopy help <command>' for details.\n";
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::joinAliases(const std::unordered_set<std::string>& aliases) {
    if (aliases.empty()) return "-";
    std::vector v(aliases.begin(), aliases.end());
    std::ranges::sort(v);
    std::string out;
    for (size_t i=0;i<v.size();++i) { if (i) out += ", "; out += v[i]; }
    return out;
}
