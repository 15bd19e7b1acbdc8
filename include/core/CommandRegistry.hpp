#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/ICommand.hpp"
#include "core/ToolCatalog.hpp"
#include "interfaces/ILogger.hpp"

namespace core {
namespace command {

// ============================================================================
// CommandRegistry - Command name -> handler lookup
// ============================================================================
// Populated once by initialize() from a ToolCatalog; read-only afterwards.
//
// Discovery rules:
// - Name is the descriptor's command_name, or to_snake_case(type_name)
// - Duplicate names: the later descriptor wins and a warning is logged
// - Descriptors without a handler are skipped with a warning
//
// Thread Safety:
// - initialize(): Thread-safe and idempotent
// - get_handler()/has_handler(): Lock-free reads once initialize() returned
// ============================================================================

class CommandRegistry {
public:
    CommandRegistry(ToolCatalog catalog, std::shared_ptr<interfaces::ILogger> logger);

    // Deleted copy (handlers are referenced by the dispatcher)
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    // ========== Lifecycle ==========

    // Scan the catalog and register every usable tool. Later calls are no-ops.
    void initialize();

    bool is_initialized() const { return initialized_.load(std::memory_order_acquire); }

    // ========== Lookup ==========

    // Throws UnknownCommandError when `command_name` is not registered
    // (including before initialize()).
    const CommandHandler& get_handler(const std::string& command_name) const;

    bool has_handler(const std::string& command_name) const;

    // Registered names, sorted
    std::vector<std::string> command_names() const;

    size_t size() const;

    // ========== Naming ==========

    // PascalCase/camelCase -> snake_case (ManageAsset -> manage_asset)
    static std::string to_snake_case(const std::string& name);

private:
    void auto_discover_tools();
    void register_tool(const ToolDescriptor& descriptor);

    ToolCatalog catalog_;
    std::shared_ptr<interfaces::ILogger> logger_;

    std::mutex init_mutex_;
    std::atomic<bool> initialized_{false};
    std::unordered_map<std::string, CommandHandler> handlers_;
};

} // namespace command
} // namespace core
