#include "handlers/EditorTools.hpp"
#include "core/Envelope.hpp"
#include <algorithm>
#include <cctype>

namespace handlers {

using common::Json;
using core::Response;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string string_param(const Json& params, const char* key) {
    if (!params.is_object()) return "";
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// ============================================================================
// ManageEditorTool
// ============================================================================

Json ManageEditorTool::handle(const Json& params) {
    const std::string action = to_lower(string_param(params, "action"));
    if (action.empty()) {
        return Response::error("Action parameter is required.");
    }

    if (action == "get_state") {
        Json data = Json::object();
        data["playing"] = state_->is_playing();
        data["paused"] = state_->is_paused();
        data["activeTool"] = state_->active_tool();
        return Response::success("Retrieved editor state.", std::move(data));
    }

    if (action == "play") {
        if (state_->enter_play_mode()) {
            return Response::success("Entered play mode.");
        }
        return Response::success("Already in play mode.");
    }

    if (action == "pause") {
        if (!state_->is_playing()) {
            return Response::error("Cannot pause/resume: Not in play mode.");
        }
        state_->toggle_pause();
        return Response::success(state_->is_paused() ? "Game paused." : "Game resumed.");
    }

    if (action == "stop") {
        if (state_->exit_play_mode()) {
            return Response::success("Exited play mode.");
        }
        return Response::success("Already stopped (not in play mode).");
    }

    if (action == "set_active_tool") {
        const std::string tool_name = string_param(params, "toolName");
        if (tool_name.empty()) {
            return Response::error("'toolName' parameter required for set_active_tool.");
        }
        return set_active_tool(tool_name);
    }

    if (action == "add_tag" || action == "remove_tag") {
        const std::string tag = string_param(params, "tagName");
        if (tag.empty()) {
            return Response::error("'tagName' parameter required for " + action + ".");
        }
        return action == "add_tag" ? add_tag(tag) : remove_tag(tag);
    }

    return Response::error("Unknown action: '" + action +
                           "'. Supported actions: get_state, play, pause, stop, set_active_tool, add_tag, remove_tag.");
}

Json ManageEditorTool::set_active_tool(const std::string& tool_name) {
    const std::string canonical = EditorState::canonical_tool_name(tool_name);
    if (canonical.empty()) {
        return Response::error("Could not parse '" + tool_name +
                               "' as a standard tool (View, Move, Rotate, Scale, Rect, Transform).");
    }
    state_->set_active_tool(canonical);
    return Response::success("Set active tool to '" + canonical + "'.");
}

Json ManageEditorTool::add_tag(const std::string& tag) {
    if (std::all_of(tag.begin(), tag.end(), [](unsigned char c) { return std::isspace(c); })) {
        return Response::error("Tag name cannot be empty or whitespace.");
    }
    if (!state_->add_tag(tag)) {
        return Response::error("Tag '" + tag + "' already exists.");
    }
    return Response::success("Tag '" + tag + "' added successfully.");
}

Json ManageEditorTool::remove_tag(const std::string& tag) {
    if (tag == EditorState::kUntaggedTag) {
        return Response::error("Cannot remove the built-in 'Untagged' tag.");
    }
    if (!state_->remove_tag(tag)) {
        return Response::error("Tag '" + tag + "' does not exist.");
    }
    return Response::success("Tag '" + tag + "' removed successfully.");
}

// ============================================================================
// ExecuteMenuItemTool
// ============================================================================

bool ExecuteMenuItemTool::is_blocked(const std::string& menu_path) {
    static const std::set<std::string> blocked = {"file/quit"};
    return blocked.count(to_lower(menu_path)) > 0;
}

Json ExecuteMenuItemTool::handle(const Json& params) {
    std::string menu_path = string_param(params, "menu_path");
    if (menu_path.empty()) {
        menu_path = string_param(params, "menuPath");
    }

    if (menu_path.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Response::error("Required parameter 'menu_path' or 'menuPath' is missing or empty.");
    }

    if (is_blocked(menu_path)) {
        return Response::error("Execution of menu item '" + menu_path + "' is blocked for safety reasons.");
    }

    logger_->info("[ExecuteMenuItem] Executing '" + menu_path + "'");

    try {
        if (!state_->execute_menu_item(menu_path)) {
            logger_->error("[ExecuteMenuItem] No menu item registered at '" + menu_path + "'");
            return Response::error("Failed to execute menu item '" + menu_path +
                                   "'. It might be invalid, disabled, or context-dependent.");
        }
    } catch (const std::exception& e) {
        logger_->error("[ExecuteMenuItem] '" + menu_path + "' threw: " + e.what());
        return Response::error("Error executing menu item '" + menu_path + "': " + e.what());
    }

    return Response::success("Executed menu item: '" + menu_path + "'.");
}

// ============================================================================
// Wiring
// ============================================================================

void register_builtin_tools(
    core::command::ToolCatalog& catalog,
    std::shared_ptr<EditorState> state,
    std::shared_ptr<SelfCheckSuite> suite,
    std::shared_ptr<core::ThreadPool> pool,
    std::shared_ptr<interfaces::ILogger> logger
) {
    using core::command::HandlerResult;

    auto manage_editor = std::make_shared<ManageEditorTool>(state);
    auto execute_menu_item = std::make_shared<ExecuteMenuItemTool>(state, logger);
    auto run_tests = std::make_shared<RunTestsTool>(std::move(suite), std::move(pool));

    catalog
        .add_named(ManageEditorTool::kCommandName, ManageEditorTool::kTypeName,
            [manage_editor](const Json& params) -> HandlerResult {
                return manage_editor->handle(params);
            })
        .add(ExecuteMenuItemTool::kTypeName,
            [execute_menu_item](const Json& params) -> HandlerResult {
                return execute_menu_item->handle(params);
            })
        .add_named(RunTestsTool::kCommandName, RunTestsTool::kTypeName,
            [run_tests](const Json& params) -> HandlerResult {
                return run_tests->handle(params);
            });
}

} // namespace handlers
