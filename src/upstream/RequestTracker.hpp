// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/uuid/random_generator.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

enum class RequestStatus
{
    Pending,
    InProgress,
    Completed,
    Failed,
};

[[nodiscard]] auto toString(RequestStatus status) -> std::string_view;
[[nodiscard]] auto requestStatusFromString(std::string_view name) -> std::optional<RequestStatus>;

/// @brief One tool call as seen by the gateway.
struct TrackedRequest
{
    std::string requestId;
    std::string backendId;
    std::string toolName;
    nlohmann::json arguments;
    std::string clientAddress;
    RequestStatus status = RequestStatus::Pending;
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    std::optional<double> durationMs;
    nlohmann::json result; // null unless completed
    std::string error;
};

struct RequestStatistics
{
    std::size_t total = 0;
    std::map<std::string, std::size_t> byStatus;
    std::map<std::string, std::size_t> byBackend;
    double averageDurationMs = 0.0; ///< Over completed requests only.
    std::size_t completed = 0;
};

struct RequestTrackerOptions
{
    std::size_t maxEntries = 1000;
    std::chrono::seconds retention { 24 * 3600 };
};

/// @brief Bounded in-memory history of tool calls.
///
/// Entries are kept in creation order. Creating an entry first drops everything older
/// than the retention window, then evicts the oldest entries beyond the size limit.
/// Updates to unknown (evicted) ids are ignored.
class RequestTracker
{
  public:
    explicit RequestTracker(RequestTrackerOptions options = {});

    RequestTracker(const RequestTracker&) = delete;
    RequestTracker& operator=(const RequestTracker&) = delete;

    /// @brief Records a new Pending request.
    /// @return The generated request id (a random UUID).
    [[nodiscard]] auto create(std::string_view backendId,
                              std::string_view toolName,
                              nlohmann::json arguments,
                              std::string_view clientAddress = {}) -> std::string;

    void start(std::string_view requestId);
    void complete(std::string_view requestId, nlohmann::json result = nullptr);
    void fail(std::string_view requestId, std::string_view error);

    [[nodiscard]] auto get(std::string_view requestId) const -> std::optional<TrackedRequest>;

    /// @brief Returns up to @p limit requests, newest first, optionally filtered.
    [[nodiscard]] auto list(std::size_t limit = 100,
                            std::optional<RequestStatus> status = std::nullopt,
                            std::optional<std::string> backendId = std::nullopt) const
        -> std::vector<TrackedRequest>;

    [[nodiscard]] auto statistics() const -> RequestStatistics;
    [[nodiscard]] auto size() const -> std::size_t;

  private:
    RequestTrackerOptions _options;

    mutable std::mutex _mutex;
    std::list<TrackedRequest> _requests;
    std::map<std::string, std::list<TrackedRequest>::iterator, std::less<>> _index;
    boost::uuids::random_generator _uuids;

    [[nodiscard]] auto findLocked(std::string_view requestId) -> TrackedRequest*;
    void finishLocked(TrackedRequest& request, RequestStatus status);
    void evictLocked(std::chrono::system_clock::time_point now);
};

[[nodiscard]] auto toJson(const TrackedRequest& request) -> nlohmann::json;
[[nodiscard]] auto toJson(const RequestStatistics& statistics) -> nlohmann::json;

} // namespace mcpmux
