// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpmux/App.hpp>
#include <mcpmux/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpmux - aggregates many MCP servers behind one endpoint" };

    auto configPath = std::string {};
    auto host = std::string {};
    auto port = uint16_t { 0 };
    auto logFile = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--host", host, "Address to listen on");
    app.add_option("--port", port, "Port to listen on")->check(CLI::Range(1, 65535));
    app.add_option("--log-file", logFile, "Also write the log to this file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? mcpmux::loadConfig() : mcpmux::loadConfigFromFile(configPath);

    if (!configResult)
    {
        mcpmux::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (auto overridden = mcpmux::applyEnvironmentOverrides(config); !overridden)
    {
        mcpmux::log::error("Invalid environment: {}", overridden.error().message);
        return 1;
    }

    // Apply CLI overrides
    if (!host.empty())
        config.server.host = host;
    if (port != 0)
        config.server.port = port;
    if (!logFile.empty())
        config.logging.file = logFile;
    if (verbose)
        config.logging.level = "debug";

    auto application = mcpmux::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mcpmux::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
