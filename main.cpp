// Shell
#include "shell/Router.hpp"
#include "shell/Parser.hpp"
#include "shell/Token.hpp"
#include "shell/argsHelpers.hpp"
#include "shell/commands.hpp"

// Notifications
#include "notify/JsonLinesObserver.hpp"
#include "notify/LoggingObserver.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdlib>
#include <iostream>

using namespace lc::config;
using namespace lc::logging;
using namespace lc::shell;

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto call = parseTokens(tokenize(args));
    const bool json = hasKey(call, "json");

    try {
        if (const auto path = optVal(call, "config"); path && !path->empty()) ConfigRegistry::init(*path);
        else ConfigRegistry::init();

        LogRegistry::init(ConfigRegistry::get().logging.log_dir);

        auto ctx = std::make_shared<CommandContext>();
        ctx->config = ConfigRegistry::get();
        ctx->notifier = std::make_shared<lc::notify::Notifier>();
        if (json) ctx->notifier->subscribe(std::make_shared<lc::notify::JsonLinesObserver>(std::cout));
        else ctx->notifier->subscribe(std::make_shared<lc::notify::LoggingObserver>());

        Router router;
        registerAllCommands(router, ctx);

        const auto result = router.execute(call);

        if (json && result.has_data) {
            auto data = result.data;
            data["event"] = "result";
            std::cout << data.dump() << std::endl;
        } else if (!result.stdout_text.empty()) {
            std::cout << result.stdout_text << std::flush;
        }
        if (!result.stderr_text.empty()) std::cerr << result.stderr_text << std::endl;

        return result.exit_code;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::lockcopy()->error("[lockcopy] {}: {}", call.name, e.what());
        else std::cerr << "lockcopy: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
