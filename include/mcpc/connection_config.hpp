#pragma once

#include "mcpc/transport/http_client.hpp"
#include "mcpc/transport/transport.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace mcpc {

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionConfig
// ─────────────────────────────────────────────────────────────────────────────
// What the presentation layer hands to ConnectionService::connect(). `command`
// and `args` apply to stdio only; `url` and `headers` to the network kinds.
// The service copies it on connect; later edits do not affect a connection.

struct ConnectionConfig {
    TransportKind transport{TransportKind::Stdio};

    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  ///< Added to the inherited environment
    std::string working_directory;

    std::string url;
    HeaderMap headers;

    std::chrono::milliseconds timeout{30000};

    std::string client_name{"mcpc"};
    std::string client_version{"0.1.0"};
};

}  // namespace mcpc
