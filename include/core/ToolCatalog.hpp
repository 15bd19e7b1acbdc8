#pragma once
#include <string>
#include <utility>
#include <vector>
#include "core/ICommand.hpp"

namespace core {
namespace command {

// ============================================================================
// ToolCatalog - Startup-time list of handler-providing units
// ============================================================================
// Built once by the process entry point (or a test) and handed to the
// CommandRegistry, which walks it in insertion order during discovery.
//
// Usage:
//   ToolCatalog catalog;
//   catalog.add("ExecuteMenuItem", execute_menu_item)        // -> execute_menu_item
//          .add_named("manage_editor", "ManageEditor", manage_editor);
// ============================================================================

class ToolCatalog {
public:
    ToolCatalog& add(ToolDescriptor descriptor) {
        descriptors_.push_back(std::move(descriptor));
        return *this;
    }

    // Command name derived from the type name
    ToolCatalog& add(std::string type_name, CommandHandler handler) {
        return add(ToolDescriptor{std::move(type_name), "", std::move(handler)});
    }

    // Explicit command name
    ToolCatalog& add_named(std::string command_name, std::string type_name, CommandHandler handler) {
        return add(ToolDescriptor{std::move(type_name), std::move(command_name), std::move(handler)});
    }

    const std::vector<ToolDescriptor>& descriptors() const { return descriptors_; }
    size_t size() const { return descriptors_.size(); }
    bool empty() const { return descriptors_.empty(); }

private:
    std::vector<ToolDescriptor> descriptors_;
};

} // namespace command
} // namespace core
