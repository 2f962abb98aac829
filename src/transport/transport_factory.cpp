#include "mcpc/transport/transport_factory.hpp"

#include "mcpc/transport/event_stream_transport.hpp"
#include "mcpc/transport/http_transport.hpp"

#include <format>

namespace mcpc {

ContextStrategy context_strategy(TransportKind kind, std::chrono::milliseconds caller_timeout) noexcept {
    switch (kind) {
        case TransportKind::EventStream:
            return ContextStrategy{std::nullopt, caller_timeout};
        case TransportKind::Stdio:
        case TransportKind::Http:
            break;
    }
    return ContextStrategy{caller_timeout, caller_timeout};
}

TransportFactory::TransportFactory()
    : http_client_factory_([] { return std::shared_ptr<IHttpClient>(make_http_client()); })
{}

TransportFactory::TransportFactory(HttpClientFactory http_client_factory)
    : http_client_factory_(std::move(http_client_factory))
{}

Result<std::unique_ptr<Transport>> TransportFactory::build(
    const ConnectionConfig& config,
    SpawnedProcess* process,
    DiagnosticOutputHandler on_diagnostic_output) const {

    switch (config.transport) {
        case TransportKind::Stdio: {
            if (config.command.empty()) {
                return tl::unexpected(Error::transport("stdio transport requires a command"));
            }
            if (process == nullptr) {
                return tl::unexpected(Error::transport("stdio transport requires a spawned process"));
            }
            StdioTransportConfig stdio_config;
            stdio_config.on_diagnostic_output = std::move(on_diagnostic_output);
            return std::make_unique<StdioTransport>(std::move(process->pipes), std::move(stdio_config));
        }

        case TransportKind::EventStream: {
            if (config.url.empty()) {
                return tl::unexpected(Error::transport("event-stream transport requires a URL"));
            }
            auto client = http_client_factory_();
            if (client == nullptr) {
                return tl::unexpected(Error::transport("No HTTP client available"));
            }
            EventStreamTransportConfig sse_config;
            sse_config.url = config.url;
            sse_config.headers = config.headers;
            sse_config.connect_timeout = config.timeout;
            return std::make_unique<EventStreamTransport>(std::move(sse_config), std::move(client));
        }

        case TransportKind::Http: {
            if (config.url.empty()) {
                return tl::unexpected(Error::transport("http transport requires a URL"));
            }
            auto client = http_client_factory_();
            if (client == nullptr) {
                return tl::unexpected(Error::transport("No HTTP client available"));
            }
            HttpTransportConfig http_config;
            http_config.url = config.url;
            http_config.headers = config.headers;
            http_config.connect_timeout = config.timeout;
            return std::make_unique<HttpTransport>(std::move(http_config), std::move(client));
        }
    }

    return tl::unexpected(Error::transport(
        std::format("Unsupported transport kind {}", static_cast<int>(config.transport))));
}

}  // namespace mcpc
