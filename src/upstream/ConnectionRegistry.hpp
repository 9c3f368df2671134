// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <upstream/Backend.hpp>
#include <upstream/ProcessSupervisor.hpp>
#include <upstream/UpstreamClient.hpp>

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpmux
{

/// @brief Owns the configured backends and their live clients.
///
/// The backend map is guarded by a short reader/writer lock. Each backend has its own
/// lifecycle mutex (connect, reconnect, remove) and state mutex (status, client), so
/// slow backends never serialize unrelated ones.
class ConnectionRegistry
{
  public:
    ConnectionRegistry(ProcessSupervisor& supervisor, Connector connector, McpClientTimeouts timeouts = {});
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// @brief Validates, registers and connects a backend.
    ///
    /// Only configuration problems are errors. Spawn, health-check and handshake failures
    /// leave the backend registered with status Crashed and lastError set.
    /// @return The backend id, or a ConfigError (nothing is registered in that case).
    [[nodiscard]] auto add(BackendSpec spec) -> Result<std::string>;

    /// @brief Unregisters the backend, drops its client and stops its process.
    /// @return Success, or NotFound.
    auto remove(std::string_view id) -> VoidResult;

    /// @brief Returns the live client of a Ready backend, or nullptr.
    [[nodiscard]] auto get(std::string_view id) const -> std::shared_ptr<UpstreamClient>;

    [[nodiscard]] auto list() const -> std::vector<BackendInfo>;
    [[nodiscard]] auto info(std::string_view id) const -> Result<BackendInfo>;
    [[nodiscard]] auto status(std::string_view id) const -> Result<BackendStatus>;
    [[nodiscard]] auto contains(std::string_view id) const -> bool;

    /// @brief Returns the supervised process of a Service backend, if any.
    [[nodiscard]] auto processOf(std::string_view id) const -> std::optional<ProcessHandle>;

    /// @brief Drops the client and restarts the connection cycle (re-resolving secrets).
    /// @return The backend id, NotFound, ConfigError, or InvalidArgument while a connect is in progress.
    [[nodiscard]] auto reconnect(std::string_view id) -> Result<std::string>;

    /// @brief Moves a Ready or Connecting backend to Crashed and drops its client.
    /// @return True if the status changed.
    auto markCrashed(std::string_view id, std::string_view reason) -> bool;

    /// @brief Moves Ready backends whose client lost its peer (a stdio server that exited) to Crashed.
    /// @return The ids of the backends that changed.
    auto markDisconnected() -> std::vector<std::string>;

    /// @brief Closes every client in parallel and moves every backend to Stopped.
    ///        Processes are left to the supervisor.
    void closeAll();

  private:
    struct Slot;

    ProcessSupervisor& _supervisor;
    Connector _connector;
    McpClientTimeouts _timeouts;

    mutable std::shared_mutex _mutex;
    std::map<std::string, std::shared_ptr<Slot>, std::less<>> _slots;

    [[nodiscard]] auto find(std::string_view id) const -> std::shared_ptr<Slot>;
    [[nodiscard]] auto resolveSecrets(const BackendSpec& spec) const -> Result<BackendSpec>;
    void connect(Slot& slot, const BackendSpec& resolved);
    auto transition(Slot& slot, BackendStatus to, std::string lastError = {}) -> bool;
};

} // namespace mcpmux
