#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the chat bridge gateway.

#include <cstdint>
#include <string_view>

namespace gcb::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the origin of a
/// failure can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    InvalidState = 0x0005,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ConnectionFailed = 0x0101,
    TransportLost = 0x0102,
    SendFailed = 0x0103,
    ListenFailed = 0x0104,
    TransportNotFound = 0x0105,
    RateLimited = 0x0106,

    // Protocol (0x0200 - 0x02FF)
    MalformedMessage = 0x0200,
    UnexpectedMessage = 0x0201,
    EncodeFailed = 0x0202,

    // Session (0x0300 - 0x03FF)
    SessionClosed = 0x0300,
    QueueOverflow = 0x0301,
    HeartbeatTimeout = 0x0302,
    ReconnectExhausted = 0x0303,

    // Routing (0x0400 - 0x04FF)
    ServerNotFound = 0x0400,
    ServerNotConnected = 0x0401,
    DuplicateServerId = 0x0402,
    InvalidForwardTarget = 0x0403,
    UnknownCommand = 0x0404,

    // Auth (0x0500 - 0x05FF)
    AuthenticationFailed = 0x0500,
    InvalidToken = 0x0501,
    UnknownServerId = 0x0502,
    AuthTimeout = 0x0503,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,

    // Binding (0x0900 - 0x09FF)
    CodeNotFound = 0x0900,
    CodeExpired = 0x0901,
    AlreadyConfirmed = 0x0902,
    CodeCollision = 0x0903,
    CodeSpaceExhausted = 0x0904,
    RandomSourceFailed = 0x0905,

    // Query (0x0A00 - 0x0AFF)
    QueryTimeout = 0x0A00,
    QueryRejected = 0x0A01,
    HttpRequestFailed = 0x0A02,
    HttpStatusError = 0x0A03,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Protocol";
        case 0x0300: return "Session";
        case 0x0400: return "Routing";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Binding";
        case 0x0A00: return "Query";
        default: return "Unknown";
    }
}

/// Short stable name for the codes surfaced to chat users and logs.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:              return "Success";
        case ErrorCode::TransportLost:        return "TransportLost";
        case ErrorCode::MalformedMessage:     return "MalformedMessage";
        case ErrorCode::QueueOverflow:        return "QueueOverflow";
        case ErrorCode::ServerNotFound:       return "ServerNotFound";
        case ErrorCode::ServerNotConnected:   return "ServerNotConnected";
        case ErrorCode::DuplicateServerId:    return "DuplicateServerId";
        case ErrorCode::AuthenticationFailed: return "AuthenticationFailed";
        case ErrorCode::CodeNotFound:         return "CodeNotFound";
        case ErrorCode::CodeExpired:          return "CodeExpired";
        case ErrorCode::AlreadyConfirmed:     return "AlreadyConfirmed";
        case ErrorCode::CodeCollision:        return "CodeCollision";
        case ErrorCode::QueryTimeout:         return "Timeout";
        case ErrorCode::HttpRequestFailed:    return "HttpRequestFailed";
        case ErrorCode::HttpStatusError:      return "HttpStatusError";
        default:                              return "Error";
    }
}

} // namespace gcb::foundation
