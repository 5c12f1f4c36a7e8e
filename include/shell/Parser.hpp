#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <string>
#include <vector>
#include <optional>
#include <unordered_set>

namespace lc::shell {

// Flags that never take a value, so "--overwrite src dst" keeps src positional
inline const std::unordered_set<std::string> BOOLEAN_FLAGS = {
    "overwrite", "ignore-locks", "recurse", "r", "json", "help", "h", "backup", "readonly", "writable"
};

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& booleanFlags = BOOLEAN_FLAGS) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;
    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto key = t.text;
            if (!booleanFlags.contains(key) && i + 1 < toks.size() && toks[i+1].type == TokenType::Word) {
                setOpt(call, key, toks[i+1].text);
                ++i; // consumed value
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        // Command name = first Word, the rest are positionals
        if (call.name.empty() && !stop_flags) call.name = t.text;
        else call.positionals.push_back(t.text);
    }

    return call;
}

}
