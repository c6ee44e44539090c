// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ipc/Transport.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace voxtype
{

/// @brief Transport over a connected AF_UNIX stream socket, one JSON document per line.
class UnixSocketTransport: public Transport
{
  public:
    /// @brief Takes ownership of an already connected socket descriptor.
    explicit UnixSocketTransport(int fd);
    ~UnixSocketTransport() override;

    UnixSocketTransport(const UnixSocketTransport&) = delete;
    UnixSocketTransport& operator=(const UnixSocketTransport&) = delete;

    /// @brief Connects to a listening socket at @p path.
    [[nodiscard]] static auto connect(std::string_view path) -> Result<std::unique_ptr<UnixSocketTransport>>;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    int _fd = -1;
    std::string _readBuffer;
};

} // namespace voxtype
