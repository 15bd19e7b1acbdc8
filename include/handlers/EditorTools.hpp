#pragma once
#include <memory>
#include <set>
#include <string>
#include "common/Json.hpp"
#include "core/ICommand.hpp"
#include "core/ThreadPool.hpp"
#include "core/ToolCatalog.hpp"
#include "handlers/EditorState.hpp"
#include "handlers/TestRunnerTool.hpp"
#include "interfaces/ILogger.hpp"

namespace handlers {

// ============================================================================
// ManageEditorTool - Play mode, active tool and tag control
// ============================================================================
// Command: manage_editor
// Actions: get_state, play, pause, stop, set_active_tool, add_tag, remove_tag
// Domain failures come back as {"success":false,...} payloads.
// ============================================================================

class ManageEditorTool final {
public:
    static constexpr const char* kCommandName = "manage_editor";
    static constexpr const char* kTypeName = "ManageEditor";

    explicit ManageEditorTool(std::shared_ptr<EditorState> state)
        : state_(std::move(state)) {}

    common::Json handle(const common::Json& params);

private:
    common::Json set_active_tool(const std::string& tool_name);
    common::Json add_tag(const std::string& tag);
    common::Json remove_tag(const std::string& tag);

    std::shared_ptr<EditorState> state_;
};

// ============================================================================
// ExecuteMenuItemTool - Runs a registered menu action by path
// ============================================================================
// Command: execute_menu_item (derived from the type name)
// Params:  menu_path | menuPath
// ============================================================================

class ExecuteMenuItemTool final {
public:
    static constexpr const char* kTypeName = "ExecuteMenuItem";

    ExecuteMenuItemTool(std::shared_ptr<EditorState> state,
                        std::shared_ptr<interfaces::ILogger> logger)
        : state_(std::move(state)), logger_(std::move(logger)) {}

    common::Json handle(const common::Json& params);

    // Paths refused regardless of registration (case-insensitive)
    static bool is_blocked(const std::string& menu_path);

private:
    std::shared_ptr<EditorState> state_;
    std::shared_ptr<interfaces::ILogger> logger_;
};

// Reads a parameter as text: strings verbatim, other scalars dumped,
// missing or null as an empty string.
std::string string_param(const common::Json& params, const char* key);

// Adds manage_editor, execute_menu_item and run_tests to `catalog`
void register_builtin_tools(
    core::command::ToolCatalog& catalog,
    std::shared_ptr<EditorState> state,
    std::shared_ptr<SelfCheckSuite> suite,
    std::shared_ptr<core::ThreadPool> pool,
    std::shared_ptr<interfaces::ILogger> logger
);

} // namespace handlers
