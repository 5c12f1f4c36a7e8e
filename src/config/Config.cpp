#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace lc::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root.IsMap()) return cfg;

    if (auto node = root["lock_queue"]) YAML::convert<LockQueueConfig>::decode(node, cfg.lock_queue);
    if (auto node = root["copy"]) YAML::convert<CopyConfig>::decode(node, cfg.copy);
    if (auto node = root["shares"]) YAML::convert<SharesConfig>::decode(node, cfg.shares);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return {};
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

std::string dumpConfig(const Config& config) {
    YAML::Node root;
    root["lock_queue"] = config.lock_queue;
    root["copy"] = config.copy;
    root["shares"] = config.shares;
    root["logging"] = config.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

} // namespace lc::config
