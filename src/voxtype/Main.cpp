// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <voxtype/App.hpp>
#include <voxtype/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <optional>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "voxtype - dictate into the active window" };
    app.require_subcommand(0, 1);

    auto configPath = std::string {};
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log threshold (error|warning|info|debug|trace)");

    auto language = std::string {};
    auto engine = std::string {};
    auto* runCommand = app.add_subcommand("run", "Record one session and type the transcript (default)");
    runCommand->add_option("-l,--language", language, "Language mode (auto|en|cs)");
    runCommand->add_option("-e,--engine", engine, "Engine to try first");

    auto* stopCommand = app.add_subcommand("stop", "Stop the running session");
    auto* statusCommand = app.add_subcommand("status", "Probe the configured engines");
    auto* pingCommand = app.add_subcommand("ping", "Check whether a session or the daemon is alive");

    auto langCode = std::string {};
    auto* langCommand = app.add_subcommand("lang", "Show or set the language mode");
    langCommand->add_option("code", langCode, "New language mode (auto|en|cs)");

    auto* daemonCommand = app.add_subcommand("daemon", "Serve a warm local model over a unix socket");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        // --help and --version exit with 0; everything else is a usage error.
        auto const rc = app.exit(e);
        return rc == 0 ? 0 : static_cast<int>(voxtype::ExitCode::Usage);
    }

    if (verbose)
        voxtype::log::setLevel(voxtype::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = voxtype::log::levelFromString(logLevel);
        if (!level)
        {
            voxtype::log::error("Unknown log level '{}'", logLevel);
            return static_cast<int>(voxtype::ExitCode::Usage);
        }
        voxtype::log::setLevel(*level);
    }

    if (auto const* command = app.get_subcommands().empty() ? nullptr : app.get_subcommands().front())
        voxtype::log::setRole(std::format("voxtype-{}", command->get_name()));
    else
        voxtype::log::setRole("voxtype-run");

    // Helper processes that exit early must not kill us through a broken pipe.
    std::signal(SIGPIPE, SIG_IGN);

    auto const resolvedConfigPath = configPath.empty() ? voxtype::defaultConfigPath() : configPath;
    auto configResult = configPath.empty() ? voxtype::loadConfig() : voxtype::loadConfigFromFile(configPath);
    if (!configResult)
    {
        voxtype::log::error("Failed to load config: {}", configResult.error().message);
        return static_cast<int>(voxtype::ExitCode::Failure);
    }

    if (!configResult->paths.logFile.empty())
        voxtype::log::setLogFile(configResult->paths.logFile);

    auto runOptions = voxtype::RunOptions {};
    if (!language.empty())
    {
        auto const mode = voxtype::parseLanguageMode(language);
        if (!mode)
        {
            voxtype::log::error("{}", mode.error().message);
            return static_cast<int>(voxtype::exitCodeFor(mode.error().code));
        }
        runOptions.language = *mode;
    }
    runOptions.engine = engine;

    auto application = voxtype::App(std::move(*configResult), resolvedConfigPath);

    auto exitCode = voxtype::ExitCode::Success;
    if (*stopCommand)
        exitCode = application.stop();
    else if (*statusCommand)
        exitCode = application.status();
    else if (*pingCommand)
        exitCode = application.ping();
    else if (*langCommand)
        exitCode = application.lang(langCode.empty() ? std::nullopt : std::optional { langCode });
    else if (*daemonCommand)
        exitCode = application.daemon();
    else
        exitCode = application.run(runOptions);

    // Detached engine calls may still log or notify; leave without running static destructors.
    if (application.hasDetachedWork())
    {
        std::fflush(nullptr);
        std::quick_exit(static_cast<int>(exitCode));
    }

    return static_cast<int>(exitCode);
}
