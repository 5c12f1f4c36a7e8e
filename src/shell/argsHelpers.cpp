#include "shell/argsHelpers.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

using namespace lc::shell;

CommandResult lc::shell::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult lc::shell::ok(std::string out) { return {0, std::move(out), ""}; }

CommandResult lc::shell::ok(std::string out, nlohmann::json data) {
    CommandResult res{0, std::move(out), ""};
    res.data = std::move(data);
    res.has_data = true;
    return res;
}

std::optional<std::string> lc::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool lc::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool lc::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<unsigned int> lc::shell::parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) {
            return std::nullopt; // overflow
        }
    }

    return static_cast<unsigned int>(v);
}

std::optional<int> lc::shell::parseInt(const std::string& sv) {
    int v = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (sv.empty() || ec != std::errc() || ptr != sv.data() + sv.size()) return std::nullopt;
    return v;
}
