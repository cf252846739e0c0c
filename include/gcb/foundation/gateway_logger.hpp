#pragma once

/// @file gateway_logger.hpp
/// @brief GatewayLogger wrapping the kcenon logger interface for categorized,
///        structured gateway logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gcb/foundation/gateway_result.hpp"

namespace gcb::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Gateway log categories; each has its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Startup, shutdown, wiring
    Network  = 1, ///< Listener, dialer, transports
    Protocol = 2, ///< Frame decode/encode
    Session  = 3, ///< Connection state machine and registry
    Routing  = 4, ///< Forwarding and outbound routing
    Binding  = 5, ///< Account binding handshake
    Query    = 6, ///< Status queries and HTTP fallback
    Config   = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Network", "Protocol", "Session", "Routing", "Binding", "Query", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context appended to a log line as `{key=value, ...}`.
///
/// Never put a credential in here; use tokenFingerprint() instead.
///
/// @code
///   LogContext ctx;
///   ctx.serverId = "Survival";
///   ctx.correlationId = request.correlationId;
///   GatewayLogger::instance().logWithContext(
///       LogLevel::Debug, LogCategory::Query, "status request sent", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> serverId;
    std::optional<std::string> transportId;
    std::optional<std::string> correlationId;
    std::unordered_map<std::string, std::string> extra;
};

/// Categorized logger for the gateway.
///
/// Lines are routed to a kcenon ILogger registered in GlobalLoggerRegistry
/// under "gcb.<Category>", falling back to the registry's default logger.
/// With nothing registered, output goes to the registry's null logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Network  | Info          |
/// | Protocol | Info          |
/// | Session  | Info          |
/// | Routing  | Info          |
/// | Binding  | Info          |
/// | Query    | Info          |
/// | Config   | Info          |
class GatewayLogger {
public:
    GatewayLogger();
    ~GatewayLogger();

    GatewayLogger(const GatewayLogger&) = delete;
    GatewayLogger& operator=(const GatewayLogger&) = delete;
    GatewayLogger(GatewayLogger&&) noexcept;
    GatewayLogger& operator=(GatewayLogger&&) noexcept;

    /// Log a message under the given category; no-op below the category level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GatewayResult<void> flush();

    static GatewayLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace" / "debug" / ... (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);

} // namespace gcb::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name GCB_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define GCB_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef GCB_MIN_LOG_LEVEL
    #define GCB_MIN_LOG_LEVEL 0
#endif

#define GCB_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= GCB_MIN_LOG_LEVEL &&                        \
            ::gcb::foundation::GatewayLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::gcb::foundation::GatewayLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define GCB_LOG_CTX(level, cat, msg, ctx)                                          \
    do {                                                                           \
        if (static_cast<int>(level) >= GCB_MIN_LOG_LEVEL &&                        \
            ::gcb::foundation::GatewayLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::gcb::foundation::GatewayLogger::instance().logWithContext(           \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
    } while (0)

#define GCB_LOG_DEBUG(cat, msg) \
    GCB_LOG(::gcb::foundation::LogLevel::Debug, (cat), (msg))

#define GCB_LOG_INFO(cat, msg) \
    GCB_LOG(::gcb::foundation::LogLevel::Info, (cat), (msg))

#define GCB_LOG_WARN(cat, msg) \
    GCB_LOG(::gcb::foundation::LogLevel::Warning, (cat), (msg))

#define GCB_LOG_ERROR(cat, msg) \
    GCB_LOG(::gcb::foundation::LogLevel::Error, (cat), (msg))

/// @}
