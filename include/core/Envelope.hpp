#pragma once
#include <cstddef>
#include <string>
#include "common/Json.hpp"
#include "common/Result.hpp"

namespace core {

// ============================================================================
// CommandEnvelope - Inbound request shape: {type, params}
// ============================================================================
// `type` is the routing key. `params` is always an object after parsing
// (absent or null params become {}).
// ============================================================================

struct CommandEnvelope {
    std::string type;
    common::Json params = common::Json::object();

    // Parse already-validated JSON text into the envelope shape.
    // Errors (InvalidEnvelope): not an object, non-scalar type, non-object params.
    // A missing or null type parses to an empty string; callers reject it.
    static common::Result<CommandEnvelope> parse(const std::string& json_text);
};

// ============================================================================
// ResponseEnvelope - Outbound reply shape
// ============================================================================
//   success: {"status":"success","result":<payload>}
//   error:   {"status":"error","error":<message>,"command":<type>,"stackTrace":<trace>}
// ============================================================================

class ResponseEnvelope {
public:
    static constexpr std::size_t kMaxEchoLength = 50;

    static common::Json success(common::Json result);

    // `command` defaults to "Unknown"; `stack_trace` is omitted when empty.
    static common::Json error(
        const std::string& message,
        const std::string& command = "Unknown",
        const std::string& stack_trace = ""
    );

    // {"status":"success","result":{"message":"pong"}}
    static common::Json pong();

    // {"status":"error","error":"Invalid JSON format","command":null,"receivedText":...}
    static common::Json invalid_json(const std::string& received_text);

    // Compact dump; invalid UTF-8 is replaced rather than thrown on.
    static std::string serialize(const common::Json& envelope);
};

// ============================================================================
// Response - Payload helpers for tools reporting their own outcome
// ============================================================================
// Tools wrap domain failures in {"success":false,...} and return them as a
// normal result; only exceptions become error envelopes.
// ============================================================================

class Response {
public:
    static common::Json success(const std::string& message, common::Json data = nullptr);
    static common::Json error(const std::string& message, common::Json data = nullptr);
};

// ============================================================================
// Text helpers shared by the dispatcher and transports
// ============================================================================

namespace text {

    std::string trim(const std::string& str);

    bool is_blank(const std::string& str);

    // Case-insensitive match against the reserved liveness token.
    bool is_ping(const std::string& str);

    // True only for text that starts/ends like an object or array and parses.
    bool is_valid_json(const std::string& str);

    // Keeps at most `max_length` bytes (never splitting a UTF-8 sequence) and
    // appends "..." when anything was cut.
    std::string truncate_for_echo(const std::string& str,
                                  std::size_t max_length = ResponseEnvelope::kMaxEchoLength);

} // namespace text

} // namespace core
