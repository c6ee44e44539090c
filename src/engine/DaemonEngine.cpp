// SPDX-License-Identifier: Apache-2.0
#include "DaemonEngine.hpp"

#include <core/Log.hpp>
#include <ipc/JsonRpc.hpp>
#include <ipc/UnixSocketTransport.hpp>

#include <format>

namespace voxtype
{

namespace
{

    /// @brief Maps transport-level failures onto the engine error taxonomy.
    auto toEngineError(Error error) -> Error
    {
        switch (error.code)
        {
            case ErrorCode::ProtocolError: error.code = ErrorCode::MalformedResponse; break;
            case ErrorCode::TransportError:
            case ErrorCode::InvalidArgument: error.code = ErrorCode::NetworkUnreachable; break;
            default: break;
        }
        return error;
    }

} // namespace

DaemonEngine::DaemonEngine(DaemonEngineConfig config):
    DaemonEngine(config, [path = config.socketPath]() -> Result<std::unique_ptr<Transport>> {
        return UnixSocketTransport::connect(path).transform(
            [](std::unique_ptr<UnixSocketTransport> t) -> std::unique_ptr<Transport> { return t; });
    })
{
}

DaemonEngine::DaemonEngine(DaemonEngineConfig config, TransportFactory factory):
    _config(std::move(config)), _factory(std::move(factory))
{
}

auto DaemonEngine::call(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto transport = _factory();
    if (!transport)
        return std::unexpected(toEngineError(transport.error()));

    auto const request = jsonrpc::makeRequest(_nextId++, method, std::move(params));

    auto reply = (*transport)
                     ->send(request)
                     .and_then([&]() { return (*transport)->receive(timeout); })
                     .and_then([](const nlohmann::json& msg) -> Result<nlohmann::json> {
                         return jsonrpc::parseResponse(msg).and_then(
                             [](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                                 if (resp.error)
                                     return std::unexpected(jsonrpc::toError(*resp.error));
                                 return resp.result.value_or(nlohmann::json::object());
                             });
                     });
    (*transport)->close();

    if (!reply)
        return std::unexpected(toEngineError(reply.error()));
    return reply;
}

auto DaemonEngine::probe() -> Result<bool>
{
    return call("ping", nullptr, _config.probeTimeout).transform([](const nlohmann::json& result) {
        return result.value("pong", false);
    });
}

auto DaemonEngine::transcribe(const AudioChunk& chunk,
                              LanguageMode language,
                              std::chrono::milliseconds timeout) -> Result<TranscriptionResult>
{
    auto params = nlohmann::json {
        { "sequence", chunk.sequence },
        { "language", languageModeToString(language) },
        { "sampleRate", chunk.sampleRate },
        { "samples", chunk.samples },
    };

    auto reply = call("transcribe", std::move(params), timeout);
    if (!reply)
        return std::unexpected(reply.error());

    if (!reply->is_object() || !reply->contains("text") || !(*reply)["text"].is_string())
        return makeError(ErrorCode::MalformedResponse, "Daemon reply lacks text");

    log::debug("Daemon transcribed #{} via {}", chunk.sequence, reply->value("engine", std::string { "?" }));

    return TranscriptionResult {
        .sequence = chunk.sequence,
        .text = (*reply)["text"].get<std::string>(),
        .language = language,
        .engine = _config.name,
        .success = true,
        .error = std::nullopt,
    };
}

} // namespace voxtype
