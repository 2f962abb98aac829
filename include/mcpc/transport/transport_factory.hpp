#pragma once

#include "mcpc/connection_config.hpp"
#include "mcpc/process/process_supervisor.hpp"
#include "mcpc/transport/http_client.hpp"
#include "mcpc/transport/stdio_transport.hpp"
#include "mcpc/transport/transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace mcpc {

/// How long establishing a connection of a given kind may take.
struct ContextStrategy {
    /// Bound passed to Transport::start(); nullopt means unbounded.
    std::optional<std::chrono::milliseconds> connect_timeout;
    /// Bound applied to every request after the connection is up.
    std::chrono::milliseconds request_timeout;
};

/// Stdio and http are bounded by the caller's timeout. The event-stream GET
/// must outlive any caller deadline, so its connection is unbounded.
[[nodiscard]] ContextStrategy context_strategy(TransportKind kind,
                                               std::chrono::milliseconds caller_timeout) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// TransportFactory
// ─────────────────────────────────────────────────────────────────────────────

class TransportFactory {
public:
    using HttpClientFactory = std::function<std::shared_ptr<IHttpClient>()>;

    /// Network transports get a cpr client per connection.
    TransportFactory();
    explicit TransportFactory(HttpClientFactory http_client_factory);

    /// Builds an unstarted transport for `config`. Stdio needs `process`, whose
    /// pipes move into the transport. Missing or unsupported inputs are
    /// Transport errors.
    [[nodiscard]] Result<std::unique_ptr<Transport>> build(
        const ConnectionConfig& config,
        SpawnedProcess* process,
        DiagnosticOutputHandler on_diagnostic_output = {}) const;

private:
    HttpClientFactory http_client_factory_;
};

}  // namespace mcpc
