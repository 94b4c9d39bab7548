#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/EchoTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <atomic>

namespace {
    std::atomic<bool> shutdown_requested{false};
    mini_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int) {
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    // stdout carries protocol frames only, so logs go to stderr or a file
    void setup_logger(const std::string& log_file) {
        std::shared_ptr<spdlog::logger> logger;
        if (log_file.empty()) {
            logger = spdlog::stderr_color_mt("mini-mcp");
        } else {
            logger = spdlog::basic_logger_mt("mini-mcp", log_file);
            logger->flush_on(spdlog::level::info);
        }
        spdlog::set_default_logger(logger);
    }

    void register_builtins(mini_mcp::MCPServer& server) {
        auto echo_tool = std::make_shared<mini_mcp::EchoTool>();
        server.register_tool(
            mini_mcp::EchoTool::get_info(),
            [echo_tool](const nlohmann::json& args) {
                return echo_tool->execute(args);
            }
        );

        server.register_resource({
            "file:///README.md",
            "README",
            "Project readme",
            "text/markdown"
        });
        server.register_resource({
            "https://modelcontextprotocol.io",
            "MCP website",
            "Model Context Protocol home page",
            "text/html"
        });
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"mini-mcp - minimal MCP server over stdio"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string log_file;
    app.add_option("--log-file", log_file, "Write logs to this file instead of stderr");

    std::string server_name = mini_mcp::kDefaultServerName;
    app.add_option("--name", server_name, "Server name reported by initialize")
        ->default_val(mini_mcp::kDefaultServerName);

    std::string server_version = mini_mcp::kDefaultServerVersion;
    app.add_option("--server-version", server_version, "Server version reported by initialize")
        ->default_val(mini_mcp::kDefaultServerVersion);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mini-mcp version " << mini_mcp::kDefaultServerVersion << std::endl;
        return 0;
    }

    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical}
    };

    auto level_it = levels.find(log_level);
    if (level_it == levels.end()) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    try {
        setup_logger(log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to set up logging: " << e.what() << std::endl;
        return 1;
    }
    spdlog::set_level(level_it->second);

    spdlog::info("Starting mini-mcp stdio server");
    spdlog::info("Log level: {}", log_level);

    try {
        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        auto transport = std::make_unique<mini_mcp::StdioTransport>();
        auto server = std::make_unique<mini_mcp::MCPServer>(
            std::move(transport), mini_mcp::ServerInfo{server_name, server_version});

        // Store global reference for signal handler
        global_server = server.get();

        register_builtins(*server);

        spdlog::info("All tools and resources registered, starting server");

        // Run server (blocks until stopped)
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly{}", shutdown_requested ? " after signal" : "");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
