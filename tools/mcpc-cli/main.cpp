// ─────────────────────────────────────────────────────────────────────────────
// mcpc-cli - connect to an MCP server and run one operation
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   # stdio (the server is spawned and supervised)
//   mcpc-cli -c npx -a -y -a @modelcontextprotocol/server-filesystem -a /tmp --list-tools
//   mcpc-cli -c python3 -a server.py --call-tool read_file --tool-args '{"path":"/tmp/a"}'
//
//   # network
//   mcpc-cli -t event-stream -u http://localhost:8080/sse --list-resources
//   mcpc-cli -t http -u https://example.com/mcp -H 'Authorization: Bearer x' --ping
//
// Ctrl-C disconnects cleanly: the transport is closed and a spawned server is
// terminated together with its children.

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcpc/debug/protocol_log.hpp"
#include "mcpc/log/logger.hpp"
#include "mcpc/log/spdlog_logger.hpp"
#include "mcpc/process/process_supervisor.hpp"
#include "mcpc/security/command_validator.hpp"
#include "mcpc/service/connection_service.hpp"
#include "mcpc/transport/transport_factory.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcpc;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const Error& error) {
    std::cerr << color::c(color::red) << to_string(error.category) << ": " << color::c(color::reset)
              << error.message << "\n";
    if (error.evidence.has_value()) {
        std::cerr << color::c(color::dim) << "  output: " << *error.evidence << color::c(color::reset) << "\n";
    }
    if (error.remediation.has_value()) {
        std::cerr << color::c(color::yellow) << "  hint: " << color::c(color::reset) << *error.remediation << "\n";
    }
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

/// Names and descriptions of a list result's entries.
void print_listing(const std::string& title, const Json& items, const char* label_key) {
    print_header(title);
    if (items.empty()) {
        std::cout << color::c(color::dim) << "(none)" << color::c(color::reset) << "\n";
        return;
    }
    for (const auto& item : items) {
        std::cout << color::c(color::bold) << color::c(color::yellow) << "• "
                  << item.value(label_key, std::string("?")) << color::c(color::reset) << "\n";
        if (item.contains("description") && item["description"].is_string()) {
            std::cout << "  " << color::c(color::dim) << item["description"].get<std::string>()
                      << color::c(color::reset) << "\n";
        }
    }
}

/// Text blocks of a tools/call or prompts/get result, JSON for anything else.
void print_content(const Json& content) {
    for (const auto& block : content) {
        if (block.value("type", std::string()) == "text") {
            std::cout << block.value("text", std::string()) << "\n";
        } else {
            print_json(block);
        }
    }
}

std::pair<std::string, std::string> split_pair(const std::string& text, char separator) {
    const auto pos = text.find(separator);
    if (pos == std::string::npos) {
        return {text, ""};
    }
    std::string value = text.substr(pos + 1);
    const auto start = value.find_first_not_of(" \t");
    value = start == std::string::npos ? std::string() : value.substr(start);
    return {text.substr(0, pos), value};
}

std::optional<Json> parse_arguments(const std::string& text) {
    if (text.empty()) {
        return Json::object();
    }
    auto parsed = parse_json(text);
    if (parsed.has_value() == false || parsed->is_object() == false) {
        print_error("Arguments must be a JSON object: " + text);
        return std::nullopt;
    }
    return std::move(*parsed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int run_operation(ConnectionService& service, const cxxopts::ParseResult& result, bool json_output) {
    auto report = [](const Error& error) {
        print_error(error);
        return 1;
    };

    if (result.count("list-tools")) {
        auto tools = service.list_tools();
        if (tools.has_value() == false) {
            return report(tools.error());
        }
        json_output ? print_json(*tools) : print_listing("Tools", (*tools)["tools"], "name");
        return 0;
    }

    if (result.count("call-tool")) {
        auto arguments = parse_arguments(result["tool-args"].as<std::string>());
        if (arguments.has_value() == false) {
            return 1;
        }
        // Fetch schemas first so empty array arguments are shaped correctly.
        if (auto tools = service.list_tools(); tools.has_value() == false) {
            return report(tools.error());
        }
        auto called = service.call_tool(result["call-tool"].as<std::string>(), std::move(*arguments));
        if (called.has_value() == false) {
            return report(called.error());
        }
        if (json_output) {
            print_json(*called);
        } else {
            print_content(called->value("content", Json::array()));
        }
        return called->value("isError", false) ? 1 : 0;
    }

    if (result.count("list-resources")) {
        auto resources = service.list_resources();
        if (resources.has_value() == false) {
            return report(resources.error());
        }
        json_output ? print_json(*resources) : print_listing("Resources", (*resources)["resources"], "uri");
        return 0;
    }

    if (result.count("read-resource")) {
        auto contents = service.read_resource(result["read-resource"].as<std::string>());
        if (contents.has_value() == false) {
            return report(contents.error());
        }
        print_json(*contents);
        return 0;
    }

    if (result.count("list-prompts")) {
        auto prompts = service.list_prompts();
        if (prompts.has_value() == false) {
            return report(prompts.error());
        }
        json_output ? print_json(*prompts) : print_listing("Prompts", (*prompts)["prompts"], "name");
        return 0;
    }

    if (result.count("get-prompt")) {
        auto arguments = parse_arguments(result["prompt-args"].as<std::string>());
        if (arguments.has_value() == false) {
            return 1;
        }
        auto prompt = service.get_prompt(result["get-prompt"].as<std::string>(), std::move(*arguments));
        if (prompt.has_value() == false) {
            return report(prompt.error());
        }
        print_json(*prompt);
        return 0;
    }

    if (result.count("ping")) {
        if (auto pong = service.ping(); pong.has_value() == false) {
            return report(pong.error());
        }
        std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << "pong\n";
        return 0;
    }

    // Default: server info
    if (auto info = service.server_info(); info.has_value()) {
        print_json(*info);
    }
    return 0;
}

void dump_protocol_log(const ProtocolLog& log) {
    print_header("Protocol log");
    for (const auto& entry : log.snapshot()) {
        std::cerr << format_entry(entry) << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpc-cli", "MCP client connection tool");

    options.add_options()
        // Connection
        ("t,transport", "stdio, event-stream (sse) or http", cxxopts::value<std::string>()->default_value("stdio"))
        ("c,command", "Server command (stdio)", cxxopts::value<std::string>())
        ("a,args", "Server argument (repeatable)", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("e,env", "Server environment variable NAME=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("u,url", "Server URL (event-stream, http)", cxxopts::value<std::string>())
        ("H,header", "HTTP header 'Name: Value' (repeatable)", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("timeout", "Connect and request timeout in milliseconds", cxxopts::value<int>()->default_value("30000"))

        // Operations
        ("list-tools", "List tools")
        ("call-tool", "Call a tool by name", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for --call-tool", cxxopts::value<std::string>()->default_value("{}"))
        ("list-resources", "List resources")
        ("read-resource", "Read a resource by URI", cxxopts::value<std::string>())
        ("list-prompts", "List prompts")
        ("get-prompt", "Get a prompt by name", cxxopts::value<std::string>())
        ("prompt-args", "JSON arguments for --get-prompt", cxxopts::value<std::string>()->default_value("{}"))
        ("ping", "Ping the server")

        // Output
        ("j,json", "Print raw JSON results")
        ("no-color", "Disable colored output")
        ("debug", "Print the protocol log on exit")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Write logs to a rotating file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = result.count("no-color") == 0;
        const bool json_output = result.count("json") > 0;

        // Logging
        const auto level = parse_log_level(result["log-level"].as<std::string>());
        if (level.has_value() == false) {
            print_error("Unknown log level: " + result["log-level"].as<std::string>());
            return 1;
        }
        if (result.count("log-file")) {
            set_logger(make_rotating_file_logger(result["log-file"].as<std::string>(), *level));
        } else {
            set_logger(make_stderr_logger(*level));
        }

        // Connection config
        ConnectionConfig config;
        const auto kind = parse_transport_kind(result["transport"].as<std::string>());
        if (kind.has_value() == false) {
            print_error("Unknown transport: " + result["transport"].as<std::string>());
            return 1;
        }
        config.transport = *kind;
        config.timeout = std::chrono::milliseconds(result["timeout"].as<int>());
        config.client_name = "mcpc-cli";

        if (result.count("command")) {
            config.command = result["command"].as<std::string>();
        }
        for (const auto& arg : result["args"].as<std::vector<std::string>>()) {
            if (arg.empty() == false) {
                config.args.push_back(arg);
            }
        }
        for (const auto& assignment : result["env"].as<std::vector<std::string>>()) {
            if (assignment.empty() == false) {
                auto [name, value] = split_pair(assignment, '=');
                config.env[name] = value;
            }
        }
        if (result.count("url")) {
            config.url = result["url"].as<std::string>();
        }
        for (const auto& header : result["header"].as<std::vector<std::string>>()) {
            if (header.empty() == false) {
                auto [name, value] = split_pair(header, ':');
                config.headers[name] = value;
            }
        }

        // Composition root: every collaborator is created here and passed down.
        ProcessSupervisor supervisor;
        CommandValidator validator;
        TransportFactory factory;
        auto protocol_log = std::make_shared<ProtocolLog>();
        ConnectionService service(supervisor, validator, factory, protocol_log);

        std::atomic<bool> interrupted{false};
        asio::io_context signal_io;
        asio::signal_set signals(signal_io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            get_logger().info_fmt("Signal {} received, disconnecting", signal_number);
            interrupted = true;
            service.disconnect();
        });
        std::thread signal_thread([&signal_io] { signal_io.run(); });

        auto shutdown_signals = [&] {
            asio::error_code ignored;
            signals.cancel(ignored);
            signal_io.stop();
            signal_thread.join();
        };

        int exit_code = 0;
        if (auto connected = service.connect(config); connected.has_value() == false) {
            print_error(connected.error());
            exit_code = 1;
        } else if (interrupted.load() == false) {
            exit_code = run_operation(service, result, json_output);
        }

        service.disconnect();
        shutdown_signals();

        if (result.count("debug")) {
            dump_protocol_log(*protocol_log);
        }
        return interrupted.load() ? 130 : exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
