// SPDX-License-Identifier: Apache-2.0
#include "Transport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/Compression.hpp>

#include <algorithm>
#include <format>

namespace toolmesh
{

namespace
{

    using Clock = std::chrono::steady_clock;

    auto isJsonContentType(std::string_view contentType) -> bool
    {
        return lowerCase(contentType).find("application/json") != std::string::npos;
    }

    auto millisecondsSince(Clock::time_point start) -> double
    {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

} // namespace

Transport::Transport(std::string destination,
                     std::string baseUrl,
                     TransportConfig config,
                     std::unique_ptr<HttpBackend> backend):
    _destination(std::move(destination)),
    _baseUrl(std::move(baseUrl)),
    _config(std::move(config)),
    _retryPolicy(_config),
    _backend(std::move(backend))
{
}

Transport::~Transport()
{
    shutdown();
}

auto Transport::initialize() -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed)
            return makeError(ErrorCode::TransportClosed,
                             std::format("Transport '{}' has been shut down", _destination));
        if (_initialized)
            return {};

        auto opened = _backend->open(_config);
        if (!opened)
            return std::unexpected(opened.error());
        _initialized = true;
    }

    // DNS failures are soft: the destination may come up later.
    if (auto resolved = _backend->resolve(_baseUrl); !resolved)
        log::warning("Transport '{}': {}", _destination, resolved.error().message);

    log::debug("Transport '{}' initialized: {} connections, compression {}, retry {} x{}",
               _destination,
               _config.maxConnectionsPerDestination,
               _config.compressionEnabled ? contentEncodingFor(_config.compressionAlgorithm) : "off",
               retryStrategyName(_config.retryStrategy),
               _config.maxRetries);
    return {};
}

void Transport::shutdown()
{
    auto lock = std::unique_lock(_mutex);
    if (_closed)
        return;

    _closed = true;
    _stateChanged.notify_all();
    _stateChanged.wait(lock, [this] { return _inFlight == 0; });

    if (_initialized)
    {
        _backend->close();
        log::info("Transport '{}' shut down", _destination);
    }
}

auto Transport::request(const CallEnvelope& envelope, const std::optional<StatusSet>& retryableStatuses)
    -> Result<HttpResponse>
{
    if (!isInitialized())
    {
        if (auto initialized = initialize(); !initialized)
            return std::unexpected(initialized.error());
    }

    if (auto begun = beginRequest(); !begun)
        return std::unexpected(begun.error());

    struct InFlightGuard
    {
        Transport& transport;
        ~InFlightGuard() { transport.endRequest(); }
    } const guard { *this };

    auto const startedAt = Clock::now();
    auto deadline = std::optional<Clock::time_point> {};
    if (envelope.timeout)
        deadline = startedAt + *envelope.timeout;

    auto const fail = [this](Error error) -> Result<HttpResponse> {
        _stats.recordFailure();
        return std::unexpected(std::move(error));
    };

    auto body = prepareBody(envelope.body);
    if (!body)
        return fail(body.error());

    auto wire = WireRequest {
        .method = envelope.method,
        .url = envelope.url,
        .headers = envelope.headers,
        .body = std::move(body->bytes),
        .timeout = _config.requestTimeout,
        .connectTimeout = _config.connectTimeout,
    };
    if (body->compressed)
        wire.headers["Content-Encoding"] = std::string(contentEncodingFor(_config.compressionAlgorithm));

    auto const& retryable = retryableStatuses ? *retryableStatuses : _config.retryableStatuses;
    auto const maxAttempts = _retryPolicy.maxAttempts();
    auto lastStatus = 0;
    auto lastTransportError = std::optional<Error> {};

    for (auto attempt = 1; attempt <= maxAttempts; ++attempt)
    {
        if (attempt > 1)
        {
            auto const delay = _retryPolicy.delay(attempt - 1);
            _stats.recordRetry();
            log::debug("{} {}: retry {}/{} in {:.0f} ms",
                       wire.method,
                       wire.url,
                       attempt - 1,
                       maxAttempts - 1,
                       delay.count());

            if (auto slept = backoff(delay, deadline); !slept)
            {
                auto error = std::move(slept.error());
                error.status = lastStatus;
                error.attempts = attempt - 1;
                return fail(std::move(error));
            }
        }

        if (deadline)
        {
            auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            if (remaining <= std::chrono::milliseconds::zero())
                return fail(Error {
                    .code = ErrorCode::RequestTimeout,
                    .message = std::format("{} {} timed out after {} attempts", wire.method, wire.url, attempt - 1),
                    .status = lastStatus,
                    .attempts = attempt - 1,
                });
            wire.timeout = remaining;
        }
        wire.connectTimeout = std::min(_config.connectTimeout, wire.timeout);

        _stats.recordAttempt(wire.body.size());
        auto const attemptStartedAt = Clock::now();
        auto response = _backend->execute(wire);

        if (!response)
        {
            auto error = std::move(response.error());
            if (error.code == ErrorCode::RequestTimeout)
                _stats.recordTimeoutError();
            else
                _stats.recordConnectionError();
            error.attempts = attempt;
            log::debug("{} {}: attempt {} failed: {}", wire.method, wire.url, attempt, error.message);

            if (deadline && Clock::now() >= *deadline)
                return fail(Error {
                    .code = ErrorCode::RequestTimeout,
                    .message = std::format("{} {} timed out: {}", wire.method, wire.url, error.message),
                    .attempts = attempt,
                });

            lastStatus = 0;
            lastTransportError = std::move(error);
            continue;
        }

        _stats.recordResponse(response->body.size(), millisecondsSince(attemptStartedAt));
        lastStatus = response->status;
        lastTransportError.reset();

        if (retryable.contains(response->status))
        {
            log::debug("{} {}: attempt {} returned retryable status {}",
                       wire.method,
                       wire.url,
                       attempt,
                       response->status);
            continue;
        }

        if (response->status >= 400)
            return fail(Error {
                .code = ErrorCode::RequestFailed,
                .message = std::format("{} {} returned HTTP {}", wire.method, wire.url, response->status),
                .status = response->status,
                .attempts = attempt,
            });

        auto decoded = decode(std::move(*response));
        if (!decoded)
            return fail(decoded.error());

        _stats.recordSuccess();
        return decoded;
    }

    auto error = Error {
        .code = ErrorCode::RequestFailed,
        .message = std::format("{} {} failed after {} attempts", wire.method, wire.url, maxAttempts),
        .status = lastStatus,
        .attempts = maxAttempts,
    };
    if (lastTransportError)
    {
        error.message += std::format(": {}", lastTransportError->message);
        error.cause = std::make_shared<const Error>(std::move(*lastTransportError));
    }
    else
    {
        error.message += std::format(" (last status {})", lastStatus);
    }

    log::warning("Transport '{}': {}", _destination, error.message);
    return fail(std::move(error));
}

auto Transport::stats() const -> NetworkStatsSnapshot
{
    return _stats.snapshot();
}

void Transport::resetStats()
{
    _stats.reset();
}

auto Transport::destination() const -> const std::string&
{
    return _destination;
}

auto Transport::config() const -> const TransportConfig&
{
    return _config;
}

auto Transport::isInitialized() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _initialized;
}

auto Transport::isClosed() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closed;
}

auto Transport::beginRequest() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (_closed)
        return makeError(ErrorCode::TransportClosed, std::format("Transport '{}' has been shut down", _destination));
    ++_inFlight;
    return {};
}

void Transport::endRequest()
{
    auto lock = std::lock_guard(_mutex);
    --_inFlight;
    _stateChanged.notify_all();
}

auto Transport::prepareBody(const std::optional<std::string>& body) -> Result<PreparedBody>
{
    auto result = PreparedBody {};
    if (!body || body->empty())
        return result;

    result.bytes = *body;
    if (!_config.compressionEnabled || _config.compressionAlgorithm == CompressionAlgorithm::None
        || body->size() < _config.compressionThresholdBytes)
        return result;

    auto compressed = compress(_config.compressionAlgorithm, *body);
    if (!compressed)
        return std::unexpected(compressed.error());

    // Incompressible payloads go out as they are.
    if (compressed->size() >= body->size())
    {
        log::trace("Transport '{}': {} byte body did not shrink, sending uncompressed", _destination, body->size());
        return result;
    }

    _stats.recordCompression(body->size(), compressed->size());
    result.bytes = std::move(*compressed);
    result.compressed = true;
    return result;
}

auto Transport::decode(WireResponse response) -> Result<HttpResponse>
{
    auto result = HttpResponse {
        .status = response.status,
        .headers = std::move(response.headers),
        .rawBody = std::move(response.body),
    };

    auto const contentType = result.headers.find("content-type");
    if (contentType == result.headers.end() || !isJsonContentType(contentType->second))
        return result;

    if (result.rawBody.empty())
    {
        result.json = nullptr;
        return result;
    }

    auto parsed = json::parse(result.rawBody, ErrorCode::InvalidResponse);
    if (!parsed)
        return std::unexpected(parsed.error());
    result.json = std::move(*parsed);
    return result;
}

auto Transport::backoff(RetryDelay delay, const std::optional<Clock::time_point>& deadline) -> VoidResult
{
    auto lock = std::unique_lock(_mutex);
    auto const wakeAt = Clock::now() + std::chrono::ceil<Clock::duration>(delay);
    auto const expires = deadline && *deadline <= wakeAt;

    if (_stateChanged.wait_until(lock, expires ? *deadline : wakeAt, [this] { return _closed; }))
        return makeError(ErrorCode::TransportClosed,
                         std::format("Transport '{}' was shut down during retry backoff", _destination));

    if (expires)
        return makeError(ErrorCode::RequestTimeout, "Call deadline expired during retry backoff");

    return {};
}

} // namespace toolmesh
