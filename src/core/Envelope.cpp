#include "core/Envelope.hpp"
#include <algorithm>
#include <cctype>

namespace core {

using common::Json;

// ============================================================================
// CommandEnvelope
// ============================================================================

common::Result<CommandEnvelope> CommandEnvelope::parse(const std::string& json_text) {
    Json document = Json::parse(json_text);

    if (!document.is_object()) {
        return common::Result<CommandEnvelope>::err(
            common::ErrorCode::InvalidEnvelope, "Command must be a JSON object");
    }

    CommandEnvelope envelope;

    auto type_it = document.find("type");
    if (type_it != document.end() && !type_it->is_null()) {
        if (type_it->is_string()) {
            envelope.type = type_it->get<std::string>();
        } else if (type_it->is_primitive()) {
            // Numbers and booleans route by their literal text
            envelope.type = type_it->dump();
        } else {
            return common::Result<CommandEnvelope>::err(
                common::ErrorCode::InvalidEnvelope, "Command type must be a string");
        }
    }

    auto params_it = document.find("params");
    if (params_it != document.end() && !params_it->is_null()) {
        if (!params_it->is_object()) {
            return common::Result<CommandEnvelope>::err(
                common::ErrorCode::InvalidEnvelope, "Command params must be a JSON object");
        }
        envelope.params = std::move(*params_it);
    }

    return common::Result<CommandEnvelope>::ok(std::move(envelope));
}

// ============================================================================
// ResponseEnvelope
// ============================================================================

Json ResponseEnvelope::success(Json result) {
    Json response = Json::object();
    response["status"] = "success";
    response["result"] = std::move(result);
    return response;
}

Json ResponseEnvelope::error(
    const std::string& message,
    const std::string& command,
    const std::string& stack_trace
) {
    Json response = Json::object();
    response["status"] = "error";
    response["error"] = message;
    response["command"] = command;
    if (!stack_trace.empty()) {
        response["stackTrace"] = stack_trace;
    }
    return response;
}

Json ResponseEnvelope::pong() {
    return success(Json{{"message", "pong"}});
}

Json ResponseEnvelope::invalid_json(const std::string& received_text) {
    Json response = Json::object();
    response["status"] = "error";
    response["error"] = "Invalid JSON format";
    response["command"] = nullptr;
    response["receivedText"] = text::truncate_for_echo(received_text);
    return response;
}

std::string ResponseEnvelope::serialize(const Json& envelope) {
    return envelope.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// ============================================================================
// Response (tool payloads)
// ============================================================================

Json Response::success(const std::string& message, Json data) {
    Json payload = Json::object();
    payload["success"] = true;
    payload["message"] = message;
    if (!data.is_null()) {
        payload["data"] = std::move(data);
    }
    return payload;
}

Json Response::error(const std::string& message, Json data) {
    Json payload = Json::object();
    payload["success"] = false;
    payload["error"] = message;
    if (!data.is_null()) {
        payload["data"] = std::move(data);
    }
    return payload;
}

// ============================================================================
// Text helpers
// ============================================================================

namespace text {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

bool is_blank(const std::string& str) {
    return std::all_of(str.begin(), str.end(), is_space);
}

bool is_ping(const std::string& str) {
    static const char kPing[] = "ping";
    if (str.size() != sizeof(kPing) - 1) return false;
    for (size_t i = 0; i < str.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(str[i])) != kPing[i]) return false;
    }
    return true;
}

bool is_valid_json(const std::string& str) {
    std::string trimmed = trim(str);
    if (trimmed.empty()) return false;

    const char first = trimmed.front();
    const char last = trimmed.back();
    if (!((first == '{' && last == '}') || (first == '[' && last == ']'))) {
        return false;
    }

    return Json::accept(trimmed);
}

std::string truncate_for_echo(const std::string& str, std::size_t max_length) {
    if (str.size() <= max_length) return str;

    // Back off to the start of a UTF-8 sequence
    std::size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut) + "...";
}

} // namespace text

} // namespace core
