/// @file main.cpp
/// @brief rally_cli entry point.
///
/// Rates players, estimates skills, scores partnerships or lists player
/// pools from a league match file. Tables go to stdout, log lines to stderr.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "rally/app/app_config.hpp"
#include "rally/app/cli_runner.hpp"
#include "rally/foundation/config_manager.hpp"
#include "rally/foundation/console_logger.hpp"
#include "rally/foundation/rally_logger.hpp"
#include "rally/version.hpp"

namespace {

constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

int fail(const rally::foundation::RallyError& error) {
    std::cerr << "error [" << error.subsystem() << "]: " << error.message() << "\n";
    (void)rally::foundation::RallyLogger::instance().flush();
    return kExitFatal;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 1, argv + argc);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (args.size() == 1 && (args[0] == "--version" || args[0] == "-v")) {
        std::cout << "rally_cli " << RALLY_VERSION_STRING << "\n";
        return EXIT_SUCCESS;
    }

    auto options = rally::app::parseCliArgs(args);
    if (!options) {
        std::cerr << options.error().message() << "\n" << rally::app::usage();
        return kExitUsage;
    }

    kcenon::common::interfaces::GlobalLoggerRegistry::instance().set_default_logger(
        std::make_shared<rally::foundation::ConsoleLogger>(std::cerr));

    rally::foundation::ConfigManager config;
    auto loadResult = rally::app::loadConfigFile(config, options.value().configPath);
    if (!loadResult) {
        return fail(loadResult.error());
    }

    auto appConfig = rally::app::loadRallyConfig(config);
    if (!appConfig) {
        return fail(appConfig.error());
    }
    if (appConfig.value().logLevel) {
        rally::foundation::RallyLogger::instance().setAllLevels(*appConfig.value().logLevel);
    }

    auto run = rally::app::runCommand(options.value(), appConfig.value(), std::cout);
    if (!run) {
        return fail(run.error());
    }

    std::cout.flush();
    auto flushed = rally::foundation::RallyLogger::instance().flush();
    if (!flushed) {
        std::cerr << "warning: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
