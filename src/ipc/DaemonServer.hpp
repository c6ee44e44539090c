// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <engine/Engine.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

namespace voxtype
{

/// @brief Configuration of the transcription daemon.
struct DaemonServerConfig
{
    std::string socketPath = "/tmp/voxtype.sock";

    /// @brief How often blocked accept/receive calls look at the stop token.
    std::chrono::milliseconds pollInterval { 250 };
};

/// @brief Keeps an engine warm and serves transcription requests over a unix socket.
///
/// Speaks line-delimited JSON-RPC 2.0. Methods:
///   - ping: returns {"pong": true}
///   - status: returns {"engine", "requests"}
///   - transcribe: params {sequence, language, sampleRate, samples[int16]},
///     returns {sequence, text, language, engine}
///
/// Each client connection is served on its own thread.
class DaemonServer
{
  public:
    DaemonServer(DaemonServerConfig config, std::shared_ptr<Engine> engine);
    ~DaemonServer();

    DaemonServer(const DaemonServer&) = delete;
    DaemonServer& operator=(const DaemonServer&) = delete;

    /// @brief Binds the listening socket, replacing a stale socket file.
    [[nodiscard]] auto bind() -> VoidResult;

    /// @brief Accepts clients until @p stopToken is signalled. bind() must have succeeded.
    [[nodiscard]] auto serve(std::stop_token stopToken) -> VoidResult;

    /// @brief Dispatches one JSON-RPC message and returns the reply.
    /// @return The response, or a null json for notifications.
    [[nodiscard]] auto handle(const nlohmann::json& message) -> nlohmann::json;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voxtype
