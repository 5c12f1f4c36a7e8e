#pragma once

#include "config/Config.hpp"
#include "notify/Notifier.hpp"

#include <memory>

namespace lc::shell {

class Router;

struct CommandContext {
    config::Config config;
    std::shared_ptr<notify::Notifier> notifier;
};

void registerAllCommands(Router& router, const std::shared_ptr<CommandContext>& ctx);

void registerCopyCommands(Router& router, const std::shared_ptr<CommandContext>& ctx);
void registerQueueCommands(Router& router, const std::shared_ptr<CommandContext>& ctx);
void registerToolCommands(Router& router, const std::shared_ptr<CommandContext>& ctx);

}
