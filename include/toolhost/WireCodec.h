//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WireCodec.h
// Purpose: Newline-delimited JSON-RPC envelope encoding, decoding, classification and line buffering
//========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

//========================================================================================================
// Envelope
// Purpose: One wire message. Every field except jsonrpc is optional; which ones are present decides
//          whether the message is a request, a response or a notification.
//========================================================================================================
struct Envelope {
    std::string jsonrpc = "2.0";
    std::optional<JSONRPCId> id;
    std::optional<std::string> method;
    std::optional<JSONValue> params;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    static Envelope Request(int64_t id, std::string method, std::optional<JSONValue> params = std::nullopt);
    static Envelope Notification(std::string method, std::optional<JSONValue> params = std::nullopt);
    static Envelope Result(JSONRPCId id, JSONValue result);
    static Envelope Error(JSONRPCId id, JSONValue error);
};

enum class MessageKind {
    Request,
    Response,
    Notification,
    Unknown
};

// Response: id plus result or error. Request: method plus id. Notification: method without id.
MessageKind ClassifyEnvelope(const Envelope& env);

//========================================================================================================
// EncodeEnvelope
// Purpose: Serializes an envelope as exactly one line of JSON terminated by a single '\n'.
//========================================================================================================
std::string EncodeEnvelope(const Envelope& env);

enum class DecodeOutcome {
    Envelope,   // a JSON object was decoded
    Foreign,    // blank or not starting with '{'; silently dropped by callers
    ParseError  // starts with '{' but is not a valid JSON object
};

struct DecodeResult {
    DecodeOutcome outcome{DecodeOutcome::Foreign};
    Envelope envelope;
    std::string error;
};

//========================================================================================================
// DecodeLine
// Purpose: Decodes one line (without its terminator). Providers commonly print banners or progress
//          text on stdout; such lines come back as Foreign rather than as an error.
// Args:
//   line: Raw line content.
// Returns:
//   DecodeResult; envelope is meaningful only when outcome == DecodeOutcome::Envelope.
//========================================================================================================
DecodeResult DecodeLine(std::string_view line);

//========================================================================================================
// LineBuffer
// Purpose: Accumulates arbitrary byte chunks and emits complete lines in arrival order.
// Notes:
//   - A trailing '\r' is stripped from each line.
//   - When the pending partial line grows beyond maxLineBytes it is discarded up to the next '\n'.
//========================================================================================================
class LineBuffer {
public:
    using LineSink = std::function<void(std::string&&)>;

    explicit LineBuffer(std::size_t maxLineBytes = 16u * 1024u * 1024u);

    // Appends a chunk; invokes sink once per completed line.
    void Append(std::string_view chunk, const LineSink& sink);

    // Emits any unterminated remainder as a final line (used at end of stream).
    void Flush(const LineSink& sink);

    std::size_t PendingBytes() const { return pending_.size(); }
    std::size_t DroppedLines() const { return dropped_; }

private:
    std::string pending_;
    std::size_t maxLineBytes_;
    bool discarding_{false};
    std::size_t dropped_{0};
};

} // namespace toolhost
