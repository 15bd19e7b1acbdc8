#include "core/CommandRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace core {
namespace command {

// ============================================================================
// Construction
// ============================================================================

CommandRegistry::CommandRegistry(ToolCatalog catalog, std::shared_ptr<interfaces::ILogger> logger)
    : catalog_(std::move(catalog)), logger_(std::move(logger)) {}

// ============================================================================
// Lifecycle
// ============================================================================

void CommandRegistry::initialize() {
    if (is_initialized()) return;

    std::lock_guard<std::mutex> lock(init_mutex_);

    // Double-check after acquiring lock
    if (is_initialized()) return;

    auto_discover_tools();
    initialized_.store(true, std::memory_order_release);
}

void CommandRegistry::auto_discover_tools() {
    for (const auto& descriptor : catalog_.descriptors()) {
        try {
            register_tool(descriptor);
        } catch (const std::exception& ex) {
            logger_->error("[Registry] Failed to register tool " + descriptor.type_name + ": " + ex.what());
        }
    }

    logger_->info("[Registry] Auto-discovered " + std::to_string(handlers_.size()) + " tools");
}

void CommandRegistry::register_tool(const ToolDescriptor& descriptor) {
    std::string command_name = descriptor.command_name;
    if (command_name.empty()) {
        command_name = to_snake_case(descriptor.type_name);
    }

    if (command_name.empty()) {
        logger_->error("[Registry] Skipping tool with neither a type name nor a command name");
        return;
    }

    if (!descriptor.handler) {
        logger_->warn("[Registry] Tool " + descriptor.type_name +
                      " is listed but has no handler; skipped");
        return;
    }

    if (handlers_.count(command_name) > 0) {
        logger_->warn("[Registry] Duplicate command name '" + command_name + "' detected. "
                      "Tool " + descriptor.type_name + " will override previously registered handler.");
    }

    handlers_[command_name] = descriptor.handler;
    logger_->debug("[Registry] Registered " + command_name + " (" + descriptor.type_name + ")");
}

// ============================================================================
// Lookup
// ============================================================================

const CommandHandler& CommandRegistry::get_handler(const std::string& command_name) const {
    if (!is_initialized()) {
        throw UnknownCommandError(command_name);
    }

    auto it = handlers_.find(command_name);
    if (it == handlers_.end()) {
        throw UnknownCommandError(command_name);
    }
    return it->second;
}

bool CommandRegistry::has_handler(const std::string& command_name) const {
    return is_initialized() && handlers_.count(command_name) > 0;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> names;
    if (!is_initialized()) return names;

    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t CommandRegistry::size() const {
    return is_initialized() ? handlers_.size() : 0;
}

// ============================================================================
// Naming
// ============================================================================

std::string CommandRegistry::to_snake_case(const std::string& name) {
    if (name.empty()) return name;

    // Underscore before a capitalised word, then between lower/digit and upper
    static const std::regex word_start("(.)([A-Z][a-z]+)");
    static const std::regex case_change("([a-z0-9])([A-Z])");

    std::string result = std::regex_replace(name, word_start, "$1_$2");
    result = std::regex_replace(result, case_change, "$1_$2");

    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace command
} // namespace core
