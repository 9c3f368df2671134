// SPDX-License-Identifier: Apache-2.0
#include "RequestTracker.hpp"

#include <core/Log.hpp>
#include <core/Time.hpp>

#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cmath>

namespace mcpmux
{

namespace
{
    auto optionalTimestamp(const std::optional<std::chrono::system_clock::time_point>& time) -> nlohmann::json
    {
        if (!time)
            return nullptr;
        return formatTimestamp(*time);
    }
} // namespace

auto toString(RequestStatus status) -> std::string_view
{
    switch (status)
    {
        case RequestStatus::Pending: return "pending";
        case RequestStatus::InProgress: return "in_progress";
        case RequestStatus::Completed: return "completed";
        case RequestStatus::Failed: return "failed";
    }
    return "pending";
}

auto requestStatusFromString(std::string_view name) -> std::optional<RequestStatus>
{
    for (auto const status:
         { RequestStatus::Pending, RequestStatus::InProgress, RequestStatus::Completed, RequestStatus::Failed })
    {
        if (toString(status) == name)
            return status;
    }
    return std::nullopt;
}

RequestTracker::RequestTracker(RequestTrackerOptions options): _options(options)
{
}

auto RequestTracker::create(std::string_view backendId,
                            std::string_view toolName,
                            nlohmann::json arguments,
                            std::string_view clientAddress) -> std::string
{
    auto const now = std::chrono::system_clock::now();
    auto lock = std::lock_guard(_mutex);

    auto id = boost::uuids::to_string(_uuids());
    _requests.push_back(TrackedRequest {
        .requestId = id,
        .backendId = std::string(backendId),
        .toolName = std::string(toolName),
        .arguments = std::move(arguments),
        .clientAddress = std::string(clientAddress),
        .status = RequestStatus::Pending,
        .createdAt = now,
    });
    _index[id] = std::prev(_requests.end());
    evictLocked(now);

    log::debug("Created request {} for {}/{}", id, backendId, toolName);
    return id;
}

void RequestTracker::start(std::string_view requestId)
{
    auto lock = std::lock_guard(_mutex);
    auto* request = findLocked(requestId);
    if (!request)
        return;

    request->status = RequestStatus::InProgress;
    request->startedAt = std::chrono::system_clock::now();
}

void RequestTracker::complete(std::string_view requestId, nlohmann::json result)
{
    auto lock = std::lock_guard(_mutex);
    auto* request = findLocked(requestId);
    if (!request)
        return;

    request->result = std::move(result);
    finishLocked(*request, RequestStatus::Completed);
    log::debug("Completed request {} in {:.1f} ms", requestId, request->durationMs.value_or(0.0));
}

void RequestTracker::fail(std::string_view requestId, std::string_view error)
{
    auto lock = std::lock_guard(_mutex);
    auto* request = findLocked(requestId);
    if (!request)
        return;

    request->error = std::string(error);
    finishLocked(*request, RequestStatus::Failed);
    log::debug("Request {} failed: {}", requestId, error);
}

auto RequestTracker::get(std::string_view requestId) const -> std::optional<TrackedRequest>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _index.find(requestId);
    if (it == _index.end())
        return std::nullopt;
    return *it->second;
}

auto RequestTracker::list(std::size_t limit,
                          std::optional<RequestStatus> status,
                          std::optional<std::string> backendId) const -> std::vector<TrackedRequest>
{
    auto lock = std::lock_guard(_mutex);
    auto requests = std::vector<TrackedRequest> {};
    for (auto it = _requests.rbegin(); it != _requests.rend() && requests.size() < limit; ++it)
    {
        if (status && it->status != *status)
            continue;
        if (backendId && it->backendId != *backendId)
            continue;
        requests.push_back(*it);
    }
    return requests;
}

auto RequestTracker::statistics() const -> RequestStatistics
{
    auto lock = std::lock_guard(_mutex);

    auto stats = RequestStatistics {};
    stats.total = _requests.size();
    for (auto const status:
         { RequestStatus::Pending, RequestStatus::InProgress, RequestStatus::Completed, RequestStatus::Failed })
        stats.byStatus[std::string(toString(status))] = 0;

    auto totalDuration = 0.0;
    for (const auto& request: _requests)
    {
        ++stats.byStatus[std::string(toString(request.status))];
        ++stats.byBackend[request.backendId];

        if (request.status == RequestStatus::Completed && request.durationMs)
        {
            totalDuration += *request.durationMs;
            ++stats.completed;
        }
    }

    if (stats.completed > 0)
        stats.averageDurationMs = std::round(totalDuration / static_cast<double>(stats.completed) * 100.0) / 100.0;
    return stats;
}

auto RequestTracker::size() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _requests.size();
}

auto RequestTracker::findLocked(std::string_view requestId) -> TrackedRequest*
{
    auto const it = _index.find(requestId);
    return it != _index.end() ? &*it->second : nullptr;
}

void RequestTracker::finishLocked(TrackedRequest& request, RequestStatus status)
{
    auto const now = std::chrono::system_clock::now();
    request.status = status;
    request.completedAt = now;

    auto const since = request.startedAt.value_or(request.createdAt);
    request.durationMs = std::chrono::duration<double, std::milli>(now - since).count();
}

void RequestTracker::evictLocked(std::chrono::system_clock::time_point now)
{
    auto const cutoff = now - _options.retention;
    auto expired = std::size_t { 0 };
    while (!_requests.empty() && _requests.front().createdAt < cutoff)
    {
        _index.erase(_requests.front().requestId);
        _requests.pop_front();
        ++expired;
    }

    while (_requests.size() > std::max<std::size_t>(_options.maxEntries, 1))
    {
        _index.erase(_requests.front().requestId);
        _requests.pop_front();
    }

    if (expired > 0)
        log::info("Dropped {} request record(s) past the retention window", expired);
}

auto toJson(const TrackedRequest& request) -> nlohmann::json
{
    return nlohmann::json {
        { "requestId", request.requestId },
        { "backend", request.backendId },
        { "toolName", request.toolName },
        { "arguments", request.arguments },
        { "status", toString(request.status) },
        { "createdAt", formatTimestamp(request.createdAt) },
        { "startedAt", optionalTimestamp(request.startedAt) },
        { "completedAt", optionalTimestamp(request.completedAt) },
        { "durationMs", request.durationMs ? nlohmann::json(*request.durationMs) : nlohmann::json(nullptr) },
        { "result", request.result },
        { "error", request.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(request.error) },
        { "clientAddress", request.clientAddress.empty() ? nlohmann::json(nullptr) : nlohmann::json(request.clientAddress) },
    };
}

auto toJson(const RequestStatistics& statistics) -> nlohmann::json
{
    return nlohmann::json {
        { "totalRequests", statistics.total },
        { "byStatus", statistics.byStatus },
        { "byBackend", statistics.byBackend },
        { "averageDurationMs", statistics.averageDurationMs },
        { "completedRequests", statistics.completed },
    };
}

} // namespace mcpmux
