#pragma once
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include "common/Json.hpp"

namespace core {
namespace command {

// ============================================================================
// HandlerResult - What a tool hands back to the dispatcher
// ============================================================================
// Two cases:
//   - Immediate: the payload is ready now (synchronous completion)
//   - Deferred:  the tool started work spanning several ticks; the payload
//                arrives through the future. An exception stored in the
//                future is reported as a handler failure.
// ============================================================================

class HandlerResult {
public:
    enum class Kind { Immediate, Deferred };

    HandlerResult(common::Json value)
        : value_(std::in_place_index<0>, std::move(value)) {}

    static HandlerResult immediate(common::Json value) {
        return HandlerResult(std::move(value));
    }

    static HandlerResult deferred(std::shared_future<common::Json> future) {
        if (!future.valid()) {
            throw std::invalid_argument("HandlerResult::deferred requires a valid future");
        }
        return HandlerResult(std::move(future));
    }

    Kind kind() const { return value_.index() == 0 ? Kind::Immediate : Kind::Deferred; }
    bool is_deferred() const { return kind() == Kind::Deferred; }

    const common::Json& value() const {
        if (is_deferred()) {
            throw std::logic_error("HandlerResult::value called on deferred result");
        }
        return std::get<0>(value_);
    }

    const std::shared_future<common::Json>& future() const {
        if (!is_deferred()) {
            throw std::logic_error("HandlerResult::future called on immediate result");
        }
        return std::get<1>(value_);
    }

private:
    explicit HandlerResult(std::shared_future<common::Json> future)
        : value_(std::in_place_index<1>, std::move(future)) {}

    std::variant<common::Json, std::shared_future<common::Json>> value_;
};

// A tool: params object in, result out. May throw; the dispatcher converts
// any exception into an error envelope.
using CommandHandler = std::function<HandlerResult(const common::Json& params)>;

// ============================================================================
// ToolDescriptor - One handler-providing unit offered for discovery
// ============================================================================
// type_name:    the unit's own identifier (e.g. "ManageAsset")
// command_name: explicit wire name; when empty, derived from type_name
// handler:      empty means the unit has no usable entry point (skipped)
// ============================================================================

struct ToolDescriptor {
    std::string type_name;
    std::string command_name;
    CommandHandler handler;
};

// ============================================================================
// UnknownCommandError - Raised when a command name has no registry entry
// ============================================================================

class UnknownCommandError : public std::runtime_error {
public:
    explicit UnknownCommandError(const std::string& command_name)
        : std::runtime_error("Unknown or unsupported command type: " + command_name)
        , command_name_(command_name) {}

    const std::string& command_name() const noexcept { return command_name_; }

private:
    std::string command_name_;
};

} // namespace command
} // namespace core
