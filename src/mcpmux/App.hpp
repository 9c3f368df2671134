// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcpmux/Config.hpp>

#include <cstdint>
#include <memory>

namespace mcpmux
{

/// @brief The gateway process: upstream aggregator, auth gate and HTTP front, wired from one AppConfig.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Applies the logging settings, resolves server secrets, starts the configured
    ///        backends and binds the listener.
    /// @return Success, or the first ConfigError/IoError that prevents serving.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves until SIGINT, SIGTERM or requestStop(), then drains and shuts down.
    /// @return The process exit code.
    [[nodiscard]] auto run() -> int;

    /// @brief Makes run() return. Safe to call from any thread.
    void requestStop();

    /// @brief The port the listener is bound to, 0 before initialize().
    [[nodiscard]] auto port() const -> uint16_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpmux
