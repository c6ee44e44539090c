// SPDX-License-Identifier: Apache-2.0
#include "UnixSocketTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace voxtype
{

UnixSocketTransport::UnixSocketTransport(int fd): _fd(fd)
{
}

UnixSocketTransport::~UnixSocketTransport()
{
    close();
}

auto UnixSocketTransport::connect(std::string_view path) -> Result<std::unique_ptr<UnixSocketTransport>>
{
    auto addr = sockaddr_un {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
        return makeError(ErrorCode::InvalidArgument, std::format("Socket path too long: {}", path));
    std::memcpy(addr.sun_path, path.data(), path.size());

    auto const fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return makeError(ErrorCode::TransportError, std::format("socket() failed: {}", strerror(errno)));

    if (::connect(fd, reinterpret_cast<sockaddr const*>(&addr), sizeof(addr)) != 0)
    {
        auto const savedErrno = errno;
        ::close(fd);
        return makeError(ErrorCode::NetworkUnreachable,
                         std::format("Cannot connect to {}: {}", path, strerror(savedErrno)));
    }

    return std::make_unique<UnixSocketTransport>(fd);
}

auto UnixSocketTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (_fd < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto offset = std::size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::send(_fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("Socket write failed: {}", strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }
    return {};
}

auto UnixSocketTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (_fd < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto const newlinePos = _readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _readBuffer.substr(0, newlinePos);
            _readBuffer.erase(0, newlinePos + 1);

            if (line.empty())
                continue;

            return json::parse(line);
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::Timeout, "Timed out waiting for message");

        auto pfd = pollfd { .fd = _fd, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
        }
        if (ready == 0)
            return makeError(ErrorCode::Timeout, "Timed out waiting for message");

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_fd, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            close();
            return makeError(ErrorCode::TransportError, "Connection closed by peer");
        }
        _readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
    }
}

void UnixSocketTransport::close()
{
    if (_fd < 0)
        return;
    ::close(_fd);
    _fd = -1;
}

auto UnixSocketTransport::isConnected() const -> bool
{
    return _fd >= 0;
}

} // namespace voxtype
