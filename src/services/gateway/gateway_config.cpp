/// @file gateway_config.cpp
/// @brief buildGatewayConfig() implementation.

#include "gcb/service/gateway_config.hpp"

#include <algorithm>
#include <map>

namespace gcb::service {

using gcb::foundation::ConfigManager;
using gcb::foundation::ErrorCode;
using gcb::foundation::GatewayError;
using gcb::foundation::GatewayResult;
using gcb::foundation::LogCategory;

namespace {

/// Reads optional keys, remembering the first hard error.
class KeyReader {
public:
    explicit KeyReader(const ConfigManager& config) : config_(config) {}

    template <typename T, typename F>
    void read(std::string_view key, F&& apply) {
        if (error_) {
            return;
        }
        auto value = config_.get<T>(key);
        if (value) {
            apply(std::move(value).value());
        } else if (value.error().code() != ErrorCode::ConfigKeyNotFound) {
            error_ = std::move(value).error();
        }
    }

    std::vector<std::string> list(std::string_view key) {
        if (error_) {
            return {};
        }
        auto value = config_.getList(key);
        if (value) {
            return std::move(value).value();
        }
        if (value.error().code() != ErrorCode::ConfigKeyNotFound) {
            error_ = std::move(value).error();
        }
        return {};
    }

    void fail(std::string message) {
        if (!error_) {
            error_ = GatewayError(ErrorCode::InvalidArgument, std::move(message));
        }
    }

    [[nodiscard]] const std::optional<GatewayError>& error() const { return error_; }

private:
    const ConfigManager& config_;
    std::optional<GatewayError> error_;
};

uint16_t toPort(KeyReader& reader, std::string_view key, int value) {
    if (value < 0 || value > 65535) {
        reader.fail(std::string(key) + " out of range: " + std::to_string(value));
        return 0;
    }
    return static_cast<uint16_t>(value);
}

void readGateway(KeyReader& r, GatewayConfig& cfg) {
    r.read<bool>("gateway.listen_enabled", [&](bool v) { cfg.listenEnabled = v; });
    r.read<std::string>("gateway.listen_host", [&](std::string v) { cfg.listenHost = std::move(v); });
    r.read<int>("gateway.listen_port", [&](int v) {
        cfg.listenPort = toPort(r, "gateway.listen_port", v);
    });
    r.read<std::string>("gateway.path", [&](std::string v) { cfg.path = std::move(v); });
    r.read<std::string>("gateway.duplicate_policy", [&](const std::string& v) {
        if (v == "supersede") {
            cfg.duplicatePolicy = DuplicatePolicy::Supersede;
        } else if (v == "reject") {
            cfg.duplicatePolicy = DuplicatePolicy::Reject;
        } else {
            r.fail("gateway.duplicate_policy must be 'supersede' or 'reject', got '" + v + "'");
        }
    });

    auto& s = cfg.session;
    r.read<int>("gateway.heartbeat_interval_ms", [&](int v) {
        s.heartbeatInterval = std::chrono::milliseconds(v);
    });
    r.read<int>("gateway.pong_timeout_ms", [&](int v) { s.pongTimeout = std::chrono::milliseconds(v); });
    r.read<int>("gateway.auth_timeout_seconds", [&](int v) { s.authTimeout = std::chrono::seconds(v); });
    r.read<int>("gateway.backoff_initial_ms", [&](int v) {
        s.backoffInitial = std::chrono::milliseconds(v);
    });
    r.read<int>("gateway.backoff_max_ms", [&](int v) { s.backoffMax = std::chrono::milliseconds(v); });
    r.read<double>("gateway.backoff_multiplier", [&](double v) { s.backoffMultiplier = v; });
    r.read<unsigned int>("gateway.max_reconnect_attempts", [&](unsigned int v) {
        s.maxReconnectAttempts = v;
    });
    r.read<unsigned int>("gateway.max_connect_attempts", [&](unsigned int v) {
        s.maxConnectAttempts = v;
    });
    r.read<unsigned int>("gateway.queue_capacity", [&](unsigned int v) { s.queueCapacity = v; });
    r.read<bool>("gateway.remove_on_give_up", [&](bool v) { cfg.removeOnGiveUp = v; });

    r.read<unsigned int>("gateway.rate_limit_capacity", [&](unsigned int v) {
        cfg.rateLimitCapacity = v;
    });
    r.read<unsigned int>("gateway.rate_limit_refill_rate", [&](unsigned int v) {
        cfg.rateLimitRefillRate = v;
    });

    r.read<int>("gateway.tick_interval_ms", [&](int v) { cfg.tickInterval = std::chrono::milliseconds(v); });
    r.read<unsigned int>("gateway.worker_threads", [&](unsigned int v) { cfg.workerThreads = v; });
    r.read<int>("gateway.query_timeout_ms", [&](int v) { cfg.queryTimeout = std::chrono::milliseconds(v); });
    r.read<int>("gateway.status_poll_interval_seconds", [&](int v) {
        cfg.statusPollInterval = std::chrono::seconds(v);
    });
    r.read<int>("gateway.http_timeout_ms", [&](int v) { cfg.httpTimeout = std::chrono::milliseconds(v); });

    r.read<std::string>("logging.level", [&](const std::string& v) {
        auto level = foundation::parseLogLevel(v);
        if (!level) {
            r.fail("logging.level: unknown level '" + v + "'");
        }
        cfg.logLevel = level;
    });
}

void readBindingAndCommands(KeyReader& r, GatewayConfig& cfg) {
    r.read<unsigned int>("binding.code_length", [&](unsigned int v) { cfg.binding.codeLength = v; });
    r.read<int>("binding.ttl_seconds", [&](int v) { cfg.binding.ttl = std::chrono::seconds(v); });
    r.read<int>("binding.settled_retention_seconds", [&](int v) {
        cfg.binding.settledRetention = std::chrono::seconds(v);
    });
    r.read<unsigned int>("binding.outbox_capacity", [&](unsigned int v) {
        cfg.binding.outboxCapacity = v;
    });

    r.read<std::string>("commands.auto_forward_prefix", [&](std::string v) {
        cfg.autoForward.prefix = std::move(v);
    });
    cfg.autoForward.sessions = r.list("commands.auto_forward_sessions");
}

/// `gateway.server_ids` / `gateway.tokens`, paired by index.
void readLegacyWhitelist(KeyReader& r, std::map<std::string, ServerEntry>& servers) {
    auto ids = r.list("gateway.server_ids");
    auto tokens = r.list("gateway.tokens");
    if (ids.size() != tokens.size()) {
        GCB_LOG_WARN(LogCategory::Config,
                     "whitelist config length mismatch: " + std::to_string(ids.size())
                         + " server id(s), " + std::to_string(tokens.size())
                         + " token(s); extra entries ignored");
    }
    auto n = std::min(ids.size(), tokens.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (ids[i].empty() || tokens[i].empty()) {
            continue;
        }
        auto& entry = servers[ids[i]];
        entry.serverId = ids[i];
        entry.token = tokens[i];
    }
}

void readServerSection(KeyReader& r, const ConfigManager& config, const std::string& id,
                       std::map<std::string, ServerEntry>& servers) {
    auto& entry = servers[id];
    entry.serverId = id;
    auto key = [&](const char* leaf) { return "servers." + id + "." + leaf; };

    r.read<std::string>(key("token"), [&](std::string v) { entry.token = std::move(v); });
    r.read<std::string>(key("mode"), [&](const std::string& v) {
        if (v == "listen") {
            entry.mode = ConnectMode::Listen;
        } else if (v == "dial") {
            entry.mode = ConnectMode::Dial;
        } else {
            r.fail(key("mode") + " must be 'listen' or 'dial', got '" + v + "'");
        }
    });
    r.read<std::string>(key("dial_host"), [&](std::string v) { entry.dialHost = std::move(v); });
    r.read<int>(key("dial_port"), [&](int v) { entry.dialPort = toPort(r, key("dial_port"), v); });

    if (config.hasKey(key("forward_targets"))) {
        entry.forward.targets = parseForwardTargets(r.list(key("forward_targets")));
    }
    r.read<bool>(key("forward_chat"), [&](bool v) { entry.forward.forwardChat = v; });
    r.read<bool>(key("forward_player_events"), [&](bool v) { entry.forward.forwardPlayerEvents = v; });
    r.read<bool>(key("forward_server_state"), [&](bool v) { entry.forward.forwardServerState = v; });
    r.read<bool>(key("forward_command_results"), [&](bool v) {
        entry.forward.forwardCommandResults = v;
    });

    if (config.hasKey(key("http_host"))) {
        HttpEndpoint http;
        r.read<std::string>(key("http_host"), [&](std::string v) { http.host = std::move(v); });
        r.read<int>(key("http_port"), [&](int v) { http.port = toPort(r, key("http_port"), v); });
        r.read<std::string>(key("http_token"), [&](std::string v) { http.token = std::move(v); });
        if (http.port == 0) {
            r.fail(key("http_port") + " is required with http_host");
        }
        if (http.token.empty()) {
            http.token = entry.token;
        }
        entry.http = std::move(http);
    }
}

void validate(KeyReader& r, GatewayConfig& cfg) {
    const auto& s = cfg.session;
    if (s.pongTimeout.count() <= 0) r.fail("gateway.pong_timeout_ms must be positive");
    if (s.authTimeout.count() <= 0) r.fail("gateway.auth_timeout_seconds must be positive");
    if (s.backoffInitial.count() <= 0) r.fail("gateway.backoff_initial_ms must be positive");
    if (s.backoffMax < s.backoffInitial) r.fail("gateway.backoff_max_ms must be >= backoff_initial_ms");
    if (s.backoffMultiplier < 1.0) r.fail("gateway.backoff_multiplier must be >= 1");
    if (s.queueCapacity == 0) r.fail("gateway.queue_capacity must be positive");
    if (cfg.tickInterval.count() <= 0) r.fail("gateway.tick_interval_ms must be positive");
    if (cfg.workerThreads == 0) r.fail("gateway.worker_threads must be positive");
    if (cfg.queryTimeout.count() <= 0) r.fail("gateway.query_timeout_ms must be positive");
    if (cfg.binding.codeLength == 0 || cfg.binding.codeLength > 18) {
        r.fail("binding.code_length must be between 1 and 18");
    }
    if (cfg.binding.ttl.count() <= 0) r.fail("binding.ttl_seconds must be positive");

    for (const auto& server : cfg.servers) {
        if (server.token.empty()) {
            r.fail("server '" + server.serverId + "' has no token");
        }
        if (server.mode == ConnectMode::Dial && (server.dialHost.empty() || server.dialPort == 0)) {
            r.fail("server '" + server.serverId + "' uses dial mode without dial_host/dial_port");
        }
    }
}

} // anonymous namespace

GatewayResult<GatewayConfig> buildGatewayConfig(const ConfigManager& config) {
    GatewayConfig cfg;
    KeyReader reader(config);

    readGateway(reader, cfg);
    readBindingAndCommands(reader, cfg);

    std::map<std::string, ServerEntry> servers;
    readLegacyWhitelist(reader, servers);
    for (const auto& id : config.childKeys("servers")) {
        readServerSection(reader, config, id, servers);
    }
    for (auto& [id, entry] : servers) {
        cfg.servers.push_back(std::move(entry));
    }

    validate(reader, cfg);
    if (reader.error()) {
        return GatewayResult<GatewayConfig>::err(*reader.error());
    }

    if (cfg.servers.empty()) {
        GCB_LOG_WARN(LogCategory::Config, "no server whitelist configured; every AUTH will fail");
    }
    return GatewayResult<GatewayConfig>::ok(std::move(cfg));
}

} // namespace gcb::service
