//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy for the toolhost subsystem and JSON-RPC error payload mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Failure classes surfaced by the client, registry and settings layers.
enum class ErrorCategory {
    SpawnError,
    HandshakeTimeout,
    HandshakeProtocolError,
    RequestTimeout,
    ProtocolError,
    NotRunning,
    ToolNotFound,
    ConfigLoadError,
    ServerNotFound,
    ServerStopped,
    ServerExited,
    InvalidConfig,
    ProbeError,
    TransportError
};

inline const char* toString(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::SpawnError: return "SpawnError";
        case ErrorCategory::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorCategory::HandshakeProtocolError: return "HandshakeProtocolError";
        case ErrorCategory::RequestTimeout: return "RequestTimeout";
        case ErrorCategory::ProtocolError: return "ProtocolError";
        case ErrorCategory::NotRunning: return "NotRunning";
        case ErrorCategory::ToolNotFound: return "ToolNotFound";
        case ErrorCategory::ConfigLoadError: return "ConfigLoadError";
        case ErrorCategory::ServerNotFound: return "ServerNotFound";
        case ErrorCategory::ServerStopped: return "ServerStopped";
        case ErrorCategory::ServerExited: return "ServerExited";
        case ErrorCategory::InvalidConfig: return "InvalidConfig";
        case ErrorCategory::ProbeError: return "ProbeError";
        case ErrorCategory::TransportError: return "TransportError";
    }
    return "Unknown";
}

// Structured error payload as received from a provider ({ code, message, data? }).
struct ProtocolErrorInfo {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// ToolHostError
// Purpose: Exception type carried through futures for every toolhost failure.
// Fields:
//   category(): Failure class.
//   protocolError(): Provider payload, present for ProtocolError and HandshakeProtocolError raised from
//                    an error response.
//==========================================================================================================
class ToolHostError : public std::runtime_error {
public:
    ToolHostError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}
    ToolHostError(ErrorCategory category, const std::string& message, ProtocolErrorInfo info)
        : std::runtime_error(message), category_(category), info_(std::move(info)) {}

    ErrorCategory category() const noexcept { return category_; }
    const std::optional<ProtocolErrorInfo>& protocolError() const noexcept { return info_; }

private:
    ErrorCategory category_;
    std::optional<ProtocolErrorInfo> info_;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to ProtocolErrorInfo.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<ProtocolErrorInfo> populated when shape is valid.
inline std::optional<ProtocolErrorInfo> errorInfoFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.find("code");
    const JSONValue* message = errVal.find("message");
    if (!code || !message) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !std::holds_alternative<std::string>(message->value)) {
        return std::nullopt;
    }
    ProtocolErrorInfo e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(message->value);
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
    }
    return e;
}

// Create a JSONValue error object from ProtocolErrorInfo.
inline JSONValue makeErrorValue(const ProtocolErrorInfo& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Builds the ProtocolError raised when a provider answers a request with an error payload.
// The message keeps the provider's text verbatim after a fixed prefix.
inline ToolHostError makeProtocolError(const JSONValue& errVal) {
    auto info = errorInfoFromErrorValue(errVal);
    if (!info) {
        ProtocolErrorInfo raw;
        raw.code = JSONRPCErrorCodes::InternalError;
        raw.message = SerializeJSON(errVal);
        raw.data = errVal;
        return ToolHostError(ErrorCategory::ProtocolError, "Provider error: " + raw.message, std::move(raw));
    }
    std::string message = "Provider error: " + info->message;
    return ToolHostError(ErrorCategory::ProtocolError, message, std::move(*info));
}

// Returns the category of a ToolHostError held by eptr, or nullopt for any other exception.
inline std::optional<ErrorCategory> categoryOf(const std::exception_ptr& eptr) {
    if (!eptr) return std::nullopt;
    try {
        std::rethrow_exception(eptr);
    } catch (const ToolHostError& e) {
        return e.category();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace errors
} // namespace toolhost
