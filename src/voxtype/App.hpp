// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/Engine.hpp>
#include <voxtype/Config.hpp>
#include <voxtype/ExitCode.hpp>

#include <memory>
#include <optional>
#include <string>

namespace voxtype
{

/// @brief Options of the `run` command.
struct RunOptions
{
    std::optional<LanguageMode> language;

    /// @brief If set, this engine is tried first.
    std::string engine;
};

/// @brief Creates the engine an entry of the `engines` config section describes.
[[nodiscard]] auto createEngine(const EngineConfig& config) -> std::shared_ptr<Engine>;

/// @brief Implements the voxtype commands on top of the session pipeline.
class App
{
  public:
    /// @param config The loaded configuration.
    /// @param configPath Where `lang` persists changes.
    App(AppConfig config, std::string configPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Records one session and injects the transcript progressively.
    [[nodiscard]] auto run(const RunOptions& options) -> ExitCode;

    /// @brief Tells whether the last run() left engine calls running on detached workers.
    [[nodiscard]] auto hasDetachedWork() const -> bool;

    /// @brief Asks a running session to stop.
    [[nodiscard]] auto stop() -> ExitCode;

    /// @brief Probes every configured engine and prints its availability.
    [[nodiscard]] auto status() -> ExitCode;

    /// @brief Reports whether a session or the daemon is alive.
    [[nodiscard]] auto ping() -> ExitCode;

    /// @brief Prints the language mode, or sets and persists @p code.
    [[nodiscard]] auto lang(const std::optional<std::string>& code) -> ExitCode;

    /// @brief Serves a warm local engine on the daemon socket until interrupted.
    [[nodiscard]] auto daemon() -> ExitCode;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voxtype
