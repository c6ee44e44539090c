// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace voxtype
{

/// @brief Status and body of a completed HTTP exchange.
struct HttpResponse
{
    long status = 0;
    std::string body;
};

/// @brief One part of a multipart/form-data request body.
struct MultipartPart
{
    std::string name;
    std::string data;

    /// @brief If non-empty, the part is sent as a file upload with this filename.
    std::string filename;
    std::string contentType;
};

/// @brief Minimal blocking HTTP client on top of libcurl.
///
/// Every request uses its own easy handle, so one client may be shared between threads.
/// Transport failures map to NetworkUnreachable, exceeded time bounds to Timeout.
/// HTTP status codes are returned as-is; interpreting them is up to the caller.
class HttpClient
{
  public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// @brief Performs a GET request.
    /// @param url The request URL.
    /// @param headers Extra headers, each "Name: value".
    /// @param timeout Upper bound for the whole exchange.
    [[nodiscard]] auto get(std::string_view url,
                           std::span<const std::string> headers,
                           std::chrono::milliseconds timeout) -> Result<HttpResponse>;

    /// @brief Performs a multipart/form-data POST request.
    /// @param url The request URL.
    /// @param headers Extra headers, each "Name: value".
    /// @param parts The form parts.
    /// @param timeout Upper bound for the whole exchange.
    [[nodiscard]] auto postMultipart(std::string_view url,
                                     std::span<const std::string> headers,
                                     std::span<const MultipartPart> parts,
                                     std::chrono::milliseconds timeout) -> Result<HttpResponse>;

  private:
    bool _globalInitialized = false;
};

} // namespace voxtype
