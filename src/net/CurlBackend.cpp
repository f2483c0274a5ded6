// SPDX-License-Identifier: Apache-2.0
#include "CurlBackend.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <condition_variable>
#include <format>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace toolmesh
{

namespace
{

    /// @brief Initializes libcurl once per process. curl_global_cleanup() is never called.
    auto ensureCurlInitialized() -> VoidResult
    {
        static auto const code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK)
            return makeError(ErrorCode::TransportInitError,
                             std::format("curl_global_init failed: {}", curl_easy_strerror(code)));
        return {};
    }

    auto trim(std::string_view text) -> std::string_view
    {
        constexpr auto Whitespace = std::string_view { " \t\r\n" };
        auto const first = text.find_first_not_of(Whitespace);
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(Whitespace);
        return text.substr(first, last - first + 1);
    }

    auto writeBody(char* data, std::size_t size, std::size_t count, void* userdata) -> std::size_t
    {
        static_cast<std::string*>(userdata)->append(data, size * count);
        return size * count;
    }

    auto writeHeader(char* data, std::size_t size, std::size_t count, void* userdata) -> std::size_t
    {
        auto* headers = static_cast<Headers*>(userdata);
        auto const length = size * count;
        auto const line = std::string_view(data, length);

        // A new status line starts a new response (100 Continue, redirects).
        if (line.starts_with("HTTP/"))
        {
            headers->clear();
            return length;
        }

        auto const colon = line.find(':');
        if (colon != std::string_view::npos)
            (*headers)[lowerCase(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        return length;
    }

    auto classify(CURLcode code) -> ErrorCode
    {
        switch (code)
        {
            case CURLE_OPERATION_TIMEDOUT: return ErrorCode::RequestTimeout;
            default: return ErrorCode::ConnectionError;
        }
    }

    /// @brief Owns a curl_slist of request headers.
    struct HeaderList
    {
        curl_slist* list = nullptr;

        HeaderList() = default;
        HeaderList(const HeaderList&) = delete;
        HeaderList& operator=(const HeaderList&) = delete;
        ~HeaderList() { curl_slist_free_all(list); }

        void append(const std::string& line) { list = curl_slist_append(list, line.c_str()); }
    };

    auto hostOf(std::string_view url) -> Result<std::string>
    {
        auto* handle = curl_url();
        if (!handle)
            return makeError(ErrorCode::TransportInitError, "curl_url failed");

        char* host = nullptr;
        auto rc = curl_url_set(handle, CURLUPART_URL, std::string(url).c_str(), 0);
        if (rc == CURLUE_OK)
            rc = curl_url_get(handle, CURLUPART_HOST, &host, 0);
        curl_url_cleanup(handle);

        if (rc != CURLUE_OK)
            return makeError(ErrorCode::TransportInitError, std::format("Invalid URL '{}'", url));

        auto result = std::string(host);
        curl_free(host);

        if (result.size() > 2 && result.front() == '[' && result.back() == ']')
            result = result.substr(1, result.size() - 2);
        return result;
    }

} // namespace

struct CurlBackend::Impl
{
    TransportConfig config;
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> shareLocks;

    std::mutex poolMutex;
    std::condition_variable poolChanged;
    std::vector<CURL*> idle;
    std::size_t handleCount = 0;
    std::size_t capacity = 1;
    bool open = false;

    static void lockShared(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr)
    {
        static_cast<Impl*>(userptr)->shareLocks[static_cast<std::size_t>(data)].lock();
    }

    static void unlockShared(CURL* /*handle*/, curl_lock_data data, void* userptr)
    {
        static_cast<Impl*>(userptr)->shareLocks[static_cast<std::size_t>(data)].unlock();
    }

    /// @brief Takes an idle handle or creates one while below capacity.
    auto acquire(std::chrono::milliseconds timeout) -> Result<CURL*>
    {
        auto lock = std::unique_lock(poolMutex);
        auto const ready = poolChanged.wait_for(
            lock, timeout, [this] { return !open || !idle.empty() || handleCount < capacity; });

        if (!open)
            return makeError(ErrorCode::TransportClosed, "Connection pool is closed");
        if (!ready)
            return makeError(ErrorCode::RequestTimeout, "Timed out waiting for a pooled connection");

        if (!idle.empty())
        {
            auto* handle = idle.back();
            idle.pop_back();
            return handle;
        }

        auto* handle = curl_easy_init();
        if (!handle)
            return makeError(ErrorCode::ConnectionError, "curl_easy_init failed");
        ++handleCount;
        return handle;
    }

    void release(CURL* handle)
    {
        curl_easy_reset(handle);
        auto lock = std::lock_guard(poolMutex);
        idle.push_back(handle);
        poolChanged.notify_all();
    }
};

CurlBackend::CurlBackend(): _impl(std::make_unique<Impl>())
{
}

CurlBackend::~CurlBackend()
{
    close();
}

auto CurlBackend::open(const TransportConfig& config) -> VoidResult
{
    if (auto initialized = ensureCurlInitialized(); !initialized)
        return initialized;

    auto lock = std::lock_guard(_impl->poolMutex);
    if (_impl->open)
        return {};

    auto* share = curl_share_init();
    if (!share)
        return makeError(ErrorCode::TransportInitError, "curl_share_init failed");

    curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &Impl::lockShared);
    curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &Impl::unlockShared);
    curl_share_setopt(share, CURLSHOPT_USERDATA, _impl.get());
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);

    _impl->config = config;
    _impl->share = share;
    _impl->capacity =
        std::max<std::size_t>(1, std::min(config.maxConnectionsPerDestination, config.maxConnections));
    _impl->open = true;
    return {};
}

auto CurlBackend::resolve(std::string_view url) -> VoidResult
{
    auto host = hostOf(url);
    if (!host)
        return std::unexpected(host.error());

    auto hints = addrinfo {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    auto const rc = getaddrinfo(host->c_str(), nullptr, &hints, &found);
    if (rc != 0)
        return makeError(ErrorCode::TransportInitError,
                         std::format("Cannot resolve host '{}': {}", *host, gai_strerror(rc)));

    freeaddrinfo(found);
    return {};
}

auto CurlBackend::execute(const WireRequest& request) -> Result<WireResponse>
{
    auto acquired = _impl->acquire(request.timeout);
    if (!acquired)
        return std::unexpected(acquired.error());

    struct Lease
    {
        Impl& pool;
        CURL* handle;
        ~Lease() { pool.release(handle); }
    } const lease { *_impl, *acquired };

    auto const& config = _impl->config;
    auto* handle = lease.handle;

    auto responseBody = std::string {};
    auto responseHeaders = Headers {};
    auto headerList = HeaderList {};
    auto errorBuffer = std::array<char, CURL_ERROR_SIZE> {};

    for (const auto& [name, value]: request.headers)
        headerList.append(std::format("{}: {}", name, value));
    headerList.append("Expect:");

    curl_easy_setopt(handle, CURLOPT_SHARE, _impl->share);
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errorBuffer.data());
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connectTimeout.count()));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, config.keepaliveEnabled ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_FORBID_REUSE, config.keepaliveEnabled ? 0L : 1L);
    curl_easy_setopt(handle, CURLOPT_DNS_CACHE_TIMEOUT, static_cast<long>(config.dnsCacheTtl.count()));
    curl_easy_setopt(handle, CURLOPT_MAXCONNECTS, static_cast<long>(config.maxConnections));
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.list);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &writeBody);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &writeHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &responseHeaders);

    if (request.method == "GET")
    {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }
    else
    {
        if (request.method != "POST")
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
    }

    auto const code = curl_easy_perform(handle);
    if (code != CURLE_OK)
    {
        auto const* const reason = errorBuffer[0] != '\0' ? errorBuffer.data() : curl_easy_strerror(code);
        return makeError(classify(code), std::format("{} {}: {}", request.method, request.url, reason));
    }

    auto status = 0L;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    log::trace("{} {} -> {} ({} bytes)", request.method, request.url, status, responseBody.size());

    return WireResponse {
        .status = static_cast<int>(status),
        .headers = std::move(responseHeaders),
        .body = std::move(responseBody),
    };
}

void CurlBackend::close()
{
    auto lock = std::unique_lock(_impl->poolMutex);
    if (!_impl->open)
        return;

    _impl->open = false;
    _impl->poolChanged.notify_all();
    _impl->poolChanged.wait(lock, [this] { return _impl->idle.size() == _impl->handleCount; });

    for (auto* handle: _impl->idle)
        curl_easy_cleanup(handle);
    _impl->idle.clear();
    _impl->handleCount = 0;

    curl_share_cleanup(_impl->share);
    _impl->share = nullptr;
}

auto CurlBackend::isOpen() const -> bool
{
    auto lock = std::lock_guard(_impl->poolMutex);
    return _impl->open;
}

} // namespace toolmesh
