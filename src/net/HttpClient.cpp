// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <format>
#include <memory>
#include <mutex>

namespace voxtype
{

namespace
{

    auto curlGlobalMutex = std::mutex {};
    auto curlGlobalRefCount = 0;

    auto acquireCurlGlobal() -> bool
    {
        auto lock = std::lock_guard(curlGlobalMutex);
        if (curlGlobalRefCount == 0)
        {
            auto const rc = curl_global_init(CURL_GLOBAL_DEFAULT);
            if (rc != CURLE_OK)
            {
                log::error("curl_global_init failed: {}", curl_easy_strerror(rc));
                return false;
            }
        }
        ++curlGlobalRefCount;
        return true;
    }

    void releaseCurlGlobal()
    {
        auto lock = std::lock_guard(curlGlobalMutex);
        if (curlGlobalRefCount <= 0)
            return;
        if (--curlGlobalRefCount == 0)
            curl_global_cleanup();
    }

    auto writeCallback(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        auto* body = static_cast<std::string*>(userData);
        body->append(data, size * count);
        return size * count;
    }

    struct EasyDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    struct MimeDeleter
    {
        void operator()(curl_mime* mime) const { curl_mime_free(mime); }
    };

    using CurlHandle = std::unique_ptr<CURL, EasyDeleter>;
    using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;
    using CurlMime = std::unique_ptr<curl_mime, MimeDeleter>;

    auto mapCurlError(CURLcode code, std::string_view url) -> Error
    {
        auto const message = std::format("{}: {}", url, curl_easy_strerror(code));
        switch (code)
        {
            case CURLE_OPERATION_TIMEDOUT: return Error { ErrorCode::Timeout, message };
            default: return Error { ErrorCode::NetworkUnreachable, message };
        }
    }

    auto makeHeaderList(std::span<const std::string> headers) -> CurlHeaders
    {
        curl_slist* list = nullptr;
        for (auto const& header: headers)
            list = curl_slist_append(list, header.c_str());
        return CurlHeaders { list };
    }

    auto perform(CURL* handle, std::string_view url, std::chrono::milliseconds timeout) -> Result<HttpResponse>
    {
        auto response = HttpResponse {};
        auto const urlString = std::string(url);

        curl_easy_setopt(handle, CURLOPT_URL, urlString.c_str());
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);

        auto const rc = curl_easy_perform(handle);
        if (rc != CURLE_OK)
            return std::unexpected(mapCurlError(rc, url));

        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
        log::trace("HTTP {} -> {} ({} bytes)", url, response.status, response.body.size());
        return response;
    }

} // namespace

HttpClient::HttpClient(): _globalInitialized(acquireCurlGlobal())
{
}

HttpClient::~HttpClient()
{
    if (_globalInitialized)
        releaseCurlGlobal();
}

auto HttpClient::get(std::string_view url,
                     std::span<const std::string> headers,
                     std::chrono::milliseconds timeout) -> Result<HttpResponse>
{
    auto handle = CurlHandle { curl_easy_init() };
    if (!handle)
        return makeError(ErrorCode::NetworkUnreachable, "curl_easy_init failed");

    auto headerList = makeHeaderList(headers);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);

    return perform(handle.get(), url, timeout);
}

auto HttpClient::postMultipart(std::string_view url,
                               std::span<const std::string> headers,
                               std::span<const MultipartPart> parts,
                               std::chrono::milliseconds timeout) -> Result<HttpResponse>
{
    auto handle = CurlHandle { curl_easy_init() };
    if (!handle)
        return makeError(ErrorCode::NetworkUnreachable, "curl_easy_init failed");

    auto mime = CurlMime { curl_mime_init(handle.get()) };
    for (auto const& part: parts)
    {
        auto* field = curl_mime_addpart(mime.get());
        curl_mime_name(field, part.name.c_str());
        curl_mime_data(field, part.data.data(), part.data.size());
        if (!part.filename.empty())
            curl_mime_filename(field, part.filename.c_str());
        if (!part.contentType.empty())
            curl_mime_type(field, part.contentType.c_str());
    }

    auto headerList = makeHeaderList(headers);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle.get(), CURLOPT_MIMEPOST, mime.get());

    return perform(handle.get(), url, timeout);
}

} // namespace voxtype
