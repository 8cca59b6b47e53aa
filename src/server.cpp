#include "mockmcp/server.hpp"
#include "mockmcp/codec.hpp"
#include "mockmcp/coerce.hpp"
#include "mockmcp/error.hpp"
#include "mockmcp/log.hpp"
#include "mockmcp/router.hpp"
#include "mockmcp/transport/stdio_transport.hpp"

#include <atomic>
#include <cctype>
#include <mutex>
#include <string>

namespace mockmcp {

namespace {

std::string_view trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // anonymous namespace

// ----------- MockServer::Impl -----------

struct MockServer::Impl {
    Options opts;
    Logger logger;
    Router router;
    ToolRegistry tools;

    // Transport reference for the shutdown() path, which may come from another thread
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};

    explicit Impl(Options o)
        : opts(std::move(o)),
          logger(opts.server_info.name, opts.log_level, opts.log_sink) {}

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            nlohmann::json requested = coerce::member(params, "protocolVersion");

            InitializeResult result;
            result.protocol_version = coerce::is_truthy(requested)
                ? requested
                : nlohmann::json(opts.default_protocol_version);
            result.capabilities.tools = nlohmann::json{{"listChanged", false}};
            result.server_info = opts.server_info;

            logger.debug("initialize: protocol " + coerce::to_display_string(result.protocol_version));

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // notifications/initialized
        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            logger.debug("client initialized");
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json{{"tools", tools.list()}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            nlohmann::json name = coerce::member(params, "name");
            nlohmann::json arguments = coerce::member(params, "arguments");
            if (!arguments.is_object()) arguments = nlohmann::json::object();

            const ToolHandler* handler = name.is_string()
                ? tools.find(name.get<std::string>())
                : nullptr;
            if (!handler) {
                std::string display = coerce::to_display_string(name);
                logger.warning("unknown tool: " + display);
                return JsonRpcError{error::MethodNotFound, "Tool not found: " + display};
            }

            logger.debug("tools/call " + name.get<std::string>());
            CallToolResult tool_result = (*handler)(arguments);
            nlohmann::json j;
            to_json(j, tool_result);
            return j;
        });
    }

    std::optional<JsonRpcResponse> handle(const JsonRpcRequest& req) {
        logger.debug("<- " + coerce::to_display_string(req.method));
        auto resp = router.dispatch(req);
        if (resp && resp->is_error() && resp->error().code == error::MethodNotFound
            && !router.has_handler(req.method_name())) {
            logger.warning(resp->error().message);
        }
        return resp;
    }

    // Per-message pipeline; nothing thrown here may end the serve loop.
    void on_message(const JsonRpcRequest& req) {
        std::optional<JsonRpcResponse> resp;
        try {
            resp = handle(req);
        } catch (const std::exception& e) {
            logger.warning(std::string("request failed: ") + e.what());
            resp = MockServer::parse_error(e.what());
        }
        if (resp) send(*resp);
    }

    void on_error(const std::exception_ptr& err) {
        try {
            std::rethrow_exception(err);
        } catch (const McpParseError& e) {
            logger.warning(std::string("parse error: ") + e.what());
            send(MockServer::parse_error(e.what()));
        } catch (const McpTransportError& e) {
            logger.error(e.what());
        }
    }

    void send(const JsonRpcResponse& resp) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) return;
        try {
            transport->send(resp);
        } catch (const McpTransportError& e) {
            // The peer is gone; stop reading.
            logger.error(e.what());
            transport->shutdown();
        }
    }
};

// ----------- MockServer -----------

MockServer::MockServer() : MockServer(Options{}) {}

MockServer::MockServer(Options opts) : impl_(std::make_unique<Impl>(std::move(opts))) {
    register_builtin_tools(impl_->tools, impl_->opts.slow_default_delay);
    impl_->setup_handlers();
}

MockServer::~MockServer() = default;

std::optional<JsonRpcResponse> MockServer::handle(const JsonRpcRequest& req) {
    return impl_->handle(req);
}

std::optional<std::string> MockServer::handle_line(std::string_view line) {
    std::string_view raw = trim(line);
    if (raw.empty()) return std::nullopt;

    std::optional<JsonRpcResponse> resp;
    try {
        resp = impl_->handle(Codec::parse(raw));
    } catch (const McpParseError& e) {
        impl_->logger.warning(std::string("parse error: ") + e.what());
        resp = parse_error(e.what());
    } catch (const std::exception& e) {
        impl_->logger.warning(std::string("request failed: ") + e.what());
        resp = parse_error(e.what());
    }
    if (!resp) return std::nullopt;
    return Codec::serialize(*resp);
}

JsonRpcResponse MockServer::parse_error(const std::string& detail) {
    return JsonRpcResponse::failure(nullptr, error::ParseError, "Parse error: " + detail);
}

const ToolRegistry& MockServer::tools() const {
    return impl_->tools;
}

void MockServer::serve(std::unique_ptr<ITransport> transport) {
    impl_->running = true;

    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    impl_->logger.info("serving " + impl_->opts.server_info.name + " " +
                       impl_->opts.server_info.version);

    t->start(
        [this](JsonRpcRequest req) { impl_->on_message(req); },
        [this](std::exception_ptr err) { impl_->on_error(err); });

    impl_->logger.info("input closed");
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    impl_->running = false;
}

void MockServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void MockServer::shutdown() {
    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool MockServer::is_running() const {
    return impl_->running;
}

} // namespace mockmcp
