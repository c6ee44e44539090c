// SPDX-License-Identifier: Apache-2.0
#include "DaemonServer.hpp"

#include <core/Log.hpp>
#include <ipc/JsonRpc.hpp>
#include <ipc/UnixSocketTransport.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <list>
#include <mutex>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace voxtype
{

namespace
{

    auto parseChunk(const nlohmann::json& params) -> Result<std::pair<AudioChunk, LanguageMode>>
    {
        if (!params.is_object())
            return makeError(ErrorCode::InvalidArgument, "transcribe expects an object");
        if (!params.contains("samples") || !params["samples"].is_array())
            return makeError(ErrorCode::InvalidArgument, "transcribe requires a samples array");

        auto chunk = AudioChunk {};
        chunk.sequence = params.value("sequence", SequenceNumber { 0 });
        chunk.sampleRate = params.value("sampleRate", std::uint32_t { 16000 });
        if (chunk.sampleRate == 0)
            return makeError(ErrorCode::InvalidArgument, "sampleRate must be positive");

        auto const& samples = params["samples"];
        chunk.samples.reserve(samples.size());
        for (auto const& sample: samples)
        {
            if (!sample.is_number_integer())
                return makeError(ErrorCode::InvalidArgument, "samples must be integers");
            auto const value = sample.get<int>();
            if (value < -32768 || value > 32767)
                return makeError(ErrorCode::InvalidArgument, "sample out of 16-bit range");
            chunk.samples.push_back(static_cast<std::int16_t>(value));
        }

        auto const code = params.value("language", std::string { "auto" });
        auto const language = languageModeFromString(code);
        if (!language)
            return makeError(ErrorCode::InvalidArgument, std::format("Unsupported language: {}", code));

        return std::pair { std::move(chunk), *language };
    }

} // namespace

struct DaemonServer::Impl
{
    DaemonServerConfig config;
    std::shared_ptr<Engine> engine;
    int listenFd = -1;
    std::atomic<std::uint64_t> requestCount = 0;

    struct Client
    {
        std::atomic<bool> done = false;
        std::jthread thread;
    };
    std::mutex clientsMutex;
    std::list<Client> clients;

    ~Impl()
    {
        stopClients();
        if (listenFd >= 0)
        {
            ::close(listenFd);
            auto ec = std::error_code {};
            std::filesystem::remove(config.socketPath, ec);
        }
    }

    void stopClients()
    {
        auto lock = std::lock_guard(clientsMutex);
        for (auto& client: clients)
            client.thread.request_stop();
        clients.clear();
    }

    auto transcribe(const nlohmann::json& params) -> Result<nlohmann::json>
    {
        auto parsed = parseChunk(params);
        if (!parsed)
            return std::unexpected(parsed.error());
        auto const& [chunk, language] = *parsed;

        log::debug("Daemon transcribing #{} ({:.1f}s, {})",
                   chunk.sequence,
                   chunk.durationSeconds(),
                   languageModeToString(language));

        return engine->transcribe(chunk, language, engine->defaultTimeout())
            .transform([](const TranscriptionResult& result) {
                return nlohmann::json {
                    { "sequence", result.sequence },
                    { "text", result.text },
                    { "language", languageModeToString(result.language) },
                    { "engine", result.engine },
                };
            });
    }

    void serveClient(std::stop_token stopToken, std::unique_ptr<UnixSocketTransport> transport, DaemonServer& server)
    {
        while (!stopToken.stop_requested() && transport->isConnected())
        {
            auto message = transport->receive(config.pollInterval);
            if (!message)
            {
                if (message.error().code == ErrorCode::Timeout)
                    continue;
                if (message.error().code == ErrorCode::ProtocolError)
                {
                    if (auto sent = transport->send(
                            jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, message.error().message));
                        !sent)
                        break;
                    continue;
                }
                log::debug("Daemon client gone: {}", message.error());
                break;
            }

            auto reply = server.handle(*message);
            if (reply.is_null())
                continue;
            if (auto sent = transport->send(reply); !sent)
            {
                log::warning("Daemon failed to reply: {}", sent.error());
                break;
            }
        }
    }
};

DaemonServer::DaemonServer(DaemonServerConfig config, std::shared_ptr<Engine> engine):
    _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->engine = std::move(engine);
}

DaemonServer::~DaemonServer()
{
    _impl->stopClients();
}

auto DaemonServer::bind() -> VoidResult
{
    auto const& path = _impl->config.socketPath;

    auto addr = sockaddr_un {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
        return makeError(ErrorCode::InvalidArgument, std::format("Socket path too long: {}", path));
    std::memcpy(addr.sun_path, path.data(), path.size());

    // A previous daemon that died leaves its socket file behind.
    auto ec = std::error_code {};
    if (std::filesystem::exists(path, ec))
    {
        if (auto probe = UnixSocketTransport::connect(path); probe)
            return makeError(ErrorCode::SessionAlreadyActive, std::format("A daemon is already serving {}", path));
        log::info("Removing stale daemon socket {}", path);
        std::filesystem::remove(path, ec);
    }

    auto const fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return makeError(ErrorCode::TransportError, std::format("socket() failed: {}", strerror(errno)));

    if (::bind(fd, reinterpret_cast<sockaddr const*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 8) != 0)
    {
        auto const savedErrno = errno;
        ::close(fd);
        return makeError(ErrorCode::TransportError, std::format("Cannot listen on {}: {}", path, strerror(savedErrno)));
    }

    ::chmod(path.c_str(), 0666);
    _impl->listenFd = fd;
    log::info("Daemon listening on {} with engine '{}'", path, _impl->engine->name());
    return {};
}

auto DaemonServer::serve(std::stop_token stopToken) -> VoidResult
{
    if (_impl->listenFd < 0)
        return makeError(ErrorCode::TransportError, "Daemon socket not bound");

    while (!stopToken.stop_requested())
    {
        auto pfd = pollfd { .fd = _impl->listenFd, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(_impl->config.pollInterval.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto const clientFd = ::accept4(_impl->listenFd, nullptr, nullptr, SOCK_CLOEXEC);
        if (clientFd < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED)
                continue;
            return makeError(ErrorCode::TransportError, std::format("accept() failed: {}", strerror(errno)));
        }

        log::debug("Daemon accepted client");
        auto lock = std::lock_guard(_impl->clientsMutex);
        std::erase_if(_impl->clients, [](const Impl::Client& client) { return client.done.load(); });
        auto& client = _impl->clients.emplace_back();
        client.thread = std::jthread(
            [this, &done = client.done, transport = std::make_unique<UnixSocketTransport>(clientFd)](
                std::stop_token token) mutable {
                _impl->serveClient(token, std::move(transport), *this);
                done = true;
            });
    }

    log::info("Daemon stopping");
    return {};
}

auto DaemonServer::handle(const nlohmann::json& message) -> nlohmann::json
{
    auto request = jsonrpc::parseRequest(message);
    if (!request)
        return jsonrpc::makeErrorResponse(
            message.is_object() ? message.value("id", nlohmann::json {}) : nlohmann::json {},
            jsonrpc::codes::InvalidRequest,
            request.error().message);

    if (request->isNotification())
        return nullptr;

    auto const& id = request->id;
    auto const& method = request->method;

    if (method == "ping")
        return jsonrpc::makeResponse(id, nlohmann::json { { "pong", true } });

    if (method == "status")
        return jsonrpc::makeResponse(id,
                                     nlohmann::json {
                                         { "engine", _impl->engine->name() },
                                         { "requests", _impl->requestCount.load() },
                                     });

    if (method == "transcribe")
    {
        ++_impl->requestCount;
        auto result = _impl->transcribe(request->params);
        if (!result)
        {
            if (result.error().code == ErrorCode::InvalidArgument)
                return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, result.error().message);
            log::warning("Daemon transcription failed: {}", result.error());
            return jsonrpc::makeErrorResponse(id, result.error());
        }
        return jsonrpc::makeResponse(id, std::move(*result));
    }

    return jsonrpc::makeErrorResponse(
        id, jsonrpc::codes::MethodNotFound, std::format("Unknown method: {}", method));
}

} // namespace voxtype
