// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Engine.hpp>
#include <ipc/Transport.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace voxtype
{

/// @brief Configuration for the engine that delegates to a running voxtype daemon.
struct DaemonEngineConfig
{
    std::string name = "daemon";
    std::string socketPath = "/tmp/voxtype.sock";
    std::chrono::milliseconds timeout { 15000 };
    std::chrono::milliseconds probeTimeout { 2000 };
};

/// @brief Opens a fresh connection to the daemon.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>()>;

/// @brief Engine that forwards phrases to a warm local model served by `voxtype daemon`.
///
/// Every call uses its own connection, so concurrent workers never share a transport.
class DaemonEngine: public Engine
{
  public:
    /// @brief Connects over the unix socket named in @p config.
    explicit DaemonEngine(DaemonEngineConfig config);

    /// @brief Connects through @p factory instead of the unix socket.
    DaemonEngine(DaemonEngineConfig config, TransportFactory factory);

    [[nodiscard]] auto name() const -> std::string_view override { return _config.name; }
    [[nodiscard]] auto defaultTimeout() const -> std::chrono::milliseconds override { return _config.timeout; }
    [[nodiscard]] auto probe() -> Result<bool> override;
    [[nodiscard]] auto transcribe(const AudioChunk& chunk, LanguageMode language, std::chrono::milliseconds timeout)
        -> Result<TranscriptionResult> override;

  private:
    [[nodiscard]] auto call(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

    DaemonEngineConfig _config;
    TransportFactory _factory;
    std::atomic<int64_t> _nextId = 1;
};

} // namespace voxtype
