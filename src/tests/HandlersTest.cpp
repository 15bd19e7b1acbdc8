// ============================================================================
// Handlers Test Program
// ============================================================================
// Built-in tools on their own and wired through registry + dispatcher:
// - ManageEditorTool (play mode, active tool, tags)
// - ExecuteMenuItemTool (lookup, blocklist, failing actions)
// - SelfCheckSuite / RunTestsTool (deferred, timeout)
//
// Run with: ./HandlersTest
// ============================================================================

#include "TestHarness.hpp"
#include "core/CommandDispatcher.hpp"
#include "handlers/EditorTools.hpp"
#include "testing/CapturingLogger.hpp"
#include "testing/ManualTickHost.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using common::Json;
using handlers::EditorState;
using handlers::ExecuteMenuItemTool;
using handlers::ManageEditorTool;
using handlers::RunTestsTool;
using handlers::SelfCheckSuite;

namespace {

bool succeeded(const Json& payload, const std::string& message = "") {
    return payload.value("success", false) &&
           (message.empty() || payload.value("message", "") == message);
}

bool failed_with(const Json& payload, const std::string& fragment) {
    return payload.contains("success") && payload["success"] == false &&
           payload.value("error", "").find(fragment) != std::string::npos;
}

} // namespace

void test_manage_editor() {
    test_group("ManageEditorTool");

    auto state = std::make_shared<EditorState>();
    ManageEditorTool tool(state);

    log_test("action required", failed_with(tool.handle(Json::object()), "Action parameter is required."));

    {
        Json r = tool.handle(Json{{"action", "get_state"}});
        bool ok = succeeded(r) && r["data"]["playing"] == false && r["data"]["paused"] == false &&
                  r["data"]["activeTool"] == "Move";
        log_test("get_state reports defaults", ok, r.dump());
    }

    log_test("pause outside play mode fails",
             failed_with(tool.handle(Json{{"action", "pause"}}), "Not in play mode"));

    log_test("play", succeeded(tool.handle(Json{{"action", "PLAY"}}), "Entered play mode.") &&
                     state->is_playing());
    log_test("play again", succeeded(tool.handle(Json{{"action", "play"}}), "Already in play mode."));
    log_test("pause toggles on", succeeded(tool.handle(Json{{"action", "pause"}}), "Game paused.") &&
                                 state->is_paused());
    log_test("pause toggles off", succeeded(tool.handle(Json{{"action", "pause"}}), "Game resumed.") &&
                                  !state->is_paused());
    log_test("stop", succeeded(tool.handle(Json{{"action", "stop"}}), "Exited play mode.") &&
                     !state->is_playing());
    log_test("stop again",
             succeeded(tool.handle(Json{{"action", "stop"}}), "Already stopped (not in play mode)."));

    log_test("set_active_tool needs toolName",
             failed_with(tool.handle(Json{{"action", "set_active_tool"}}), "'toolName' parameter required"));
    log_test("set_active_tool canonicalizes",
             succeeded(tool.handle(Json{{"action", "set_active_tool"}, {"toolName", "rotate"}})) &&
             state->active_tool() == "Rotate");
    log_test("unknown tool rejected",
             failed_with(tool.handle(Json{{"action", "set_active_tool"}, {"toolName", "Hammer"}}), "Hammer") &&
             state->active_tool() == "Rotate");

    log_test("add_tag", succeeded(tool.handle(Json{{"action", "add_tag"}, {"tagName", "Enemy"}})) &&
                        state->tags().count("Enemy") == 1);
    log_test("duplicate tag rejected",
             failed_with(tool.handle(Json{{"action", "add_tag"}, {"tagName", "Enemy"}}), "already exists"));
    log_test("remove_tag", succeeded(tool.handle(Json{{"action", "remove_tag"}, {"tagName", "Enemy"}})));
    log_test("built-in tag protected",
             failed_with(tool.handle(Json{{"action", "remove_tag"}, {"tagName", "Untagged"}}), "built-in"));

    log_test("unknown action",
             failed_with(tool.handle(Json{{"action", "fly"}}), "Unknown action: 'fly'"));
}

void test_execute_menu_item() {
    test_group("ExecuteMenuItemTool");

    auto state = std::make_shared<EditorState>();
    auto logger = std::make_shared<testing::CapturingLogger>();
    int saves = 0;
    state->add_menu_item("File/Save", [&saves]() { saves++; });
    state->add_menu_item("File/Quit", []() {});
    state->add_menu_item("Broken/Item", []() { throw std::runtime_error("menu exploded"); });

    ExecuteMenuItemTool tool(state, logger);

    log_test("path required", failed_with(tool.handle(Json::object()), "missing or empty"));
    log_test("menu_path spelling",
             succeeded(tool.handle(Json{{"menu_path", "File/Save"}})) && saves == 1);
    log_test("menuPath spelling",
             succeeded(tool.handle(Json{{"menuPath", "File/Save"}})) && saves == 2);
    log_test("unknown path",
             failed_with(tool.handle(Json{{"menuPath", "File/Nope"}}), "Failed to execute menu item"));
    log_test("blocked path never runs",
             failed_with(tool.handle(Json{{"menuPath", "file/QUIT"}}), "blocked for safety"));
    log_test("throwing action reported",
             failed_with(tool.handle(Json{{"menuPath", "Broken/Item"}}), "menu exploded") &&
             logger->contains("ERROR", "menu exploded"));
}

void test_self_checks() {
    test_group("SelfCheckSuite / RunTestsTool");

    log_test("mode aliases",
             SelfCheckSuite::parse_mode("edit").is_ok() && SelfCheckSuite::parse_mode("EditMode").is_ok() &&
             SelfCheckSuite::parse_mode("PLAY").is_ok() && SelfCheckSuite::parse_mode("fast").is_err());

    log_test("timeout parsing",
             RunTestsTool::parse_timeout(Json::object()) == 600 &&
             RunTestsTool::parse_timeout(Json{{"timeoutSeconds", 5}}) == 5 &&
             RunTestsTool::parse_timeout(Json{{"timeoutSeconds", "7"}}) == 7 &&
             RunTestsTool::parse_timeout(Json{{"timeoutSeconds", -1}}) == 600 &&
             RunTestsTool::parse_timeout(Json{{"timeoutSeconds", "soon"}}) == 600);

    auto suite = std::make_shared<SelfCheckSuite>();
    suite->add("passes", SelfCheckSuite::Mode::Edit, []() {});
    suite->add("fails", SelfCheckSuite::Mode::Edit, []() { throw std::runtime_error("nope"); });
    suite->add("play_only", SelfCheckSuite::Mode::Play, []() {});

    auto pool = std::make_shared<core::ThreadPool>(1);
    RunTestsTool tool(suite, pool);

    {
        auto result = tool.handle(Json::object());
        bool deferred = result.is_deferred();
        Json payload = deferred ? result.future().get() : result.value();
        bool ok = deferred && succeeded(payload) &&
                  payload["data"]["summary"]["total"] == 2 &&
                  payload["data"]["summary"]["passed"] == 1 &&
                  payload["data"]["summary"]["failed"] == 1 &&
                  payload["message"] == "EditMode tests completed: 1/2 passed, 1 failed, 0 skipped";
        log_test("edit run is deferred and counted", ok, payload.dump());
        log_test("failure message recorded",
                 payload["data"]["results"][1]["message"] == "nope" &&
                 payload["data"]["results"][1]["state"] == "Failed");
    }

    {
        auto result = tool.handle(Json{{"mode", "play"}});
        Json payload = result.future().get();
        log_test("play run selects play cases", payload["data"]["summary"]["total"] == 1);
    }

    {
        auto result = tool.handle(Json{{"mode", "turbo"}});
        log_test("bad mode answered immediately",
                 !result.is_deferred() && failed_with(result.value(), "Unknown test mode"));
    }

    {
        auto result = tool.handle(Json{{"mode", 3}});
        log_test("non-string mode rejected",
                 !result.is_deferred() && failed_with(result.value(), "Unknown test mode: '3'"));
    }

    {
        auto slow_suite = std::make_shared<SelfCheckSuite>();
        slow_suite->add("slow", SelfCheckSuite::Mode::Edit, []() {
            std::this_thread::sleep_for(1200ms);
        });
        slow_suite->add("never_started", SelfCheckSuite::Mode::Edit, []() {});

        RunTestsTool slow_tool(slow_suite, pool);
        Json payload = slow_tool.handle(Json{{"timeoutSeconds", 1}}).future().get();
        log_test("timeout reported as tool error",
                 failed_with(payload, "Test run timed out after 1 seconds") &&
                 payload["data"]["summary"]["skipped"] == 1,
                 payload.dump());
    }

    pool->shutdown();

    {
        auto late = pool->submit([]() { return 1; });
        bool rejected = false;
        try {
            late.get();
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        log_test("pool refuses work after shutdown", rejected);
    }
}

void test_builtin_wiring() {
    test_group("builtin tools through the dispatcher");

    auto logger = std::make_shared<testing::CapturingLogger>();
    auto host = std::make_shared<testing::ManualTickHost>();
    auto state = std::make_shared<EditorState>();
    auto suite = std::make_shared<SelfCheckSuite>();
    auto pool = std::make_shared<core::ThreadPool>(2);
    suite->add("trivial", SelfCheckSuite::Mode::Edit, []() {});

    core::command::ToolCatalog catalog;
    handlers::register_builtin_tools(catalog, state, suite, pool, logger);
    auto registry = std::make_shared<core::command::CommandRegistry>(std::move(catalog), logger);
    core::command::CommandDispatcher dispatcher(registry, host, logger);
    dispatcher.start();

    auto play = dispatcher.execute_command_async(R"({"type":"manage_editor","params":{"action":"play"}})");
    auto menu = dispatcher.execute_command_async(R"({"type":"execute_menu_item","params":{"menuPath":"Missing/Item"}})");
    auto tests = dispatcher.execute_command_async(R"({"type":"run_tests","params":{"timeoutSeconds":30}})");

    host->tick();

    log_test("builtin names registered",
             registry->command_names() ==
                 std::vector<std::string>{"execute_menu_item", "manage_editor", "run_tests"});

    {
        Json r = Json::parse(play.get());
        log_test("manage_editor via dispatcher",
                 r["status"] == "success" && r["result"]["message"] == "Entered play mode." &&
                 state->is_playing(), r.dump());
    }

    {
        Json r = Json::parse(menu.get());
        log_test("tool-level failure is still a success envelope",
                 r["status"] == "success" && r["result"]["success"] == false, r.dump());
    }

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (tests.wait_for(0ms) != std::future_status::ready &&
           std::chrono::steady_clock::now() < deadline) {
        host->tick();
        std::this_thread::sleep_for(2ms);
    }

    {
        bool ready = tests.wait_for(0ms) == std::future_status::ready;
        Json r = ready ? Json::parse(tests.get()) : Json();
        log_test("run_tests resolves across ticks",
                 ready && r["status"] == "success" && r["result"]["data"]["summary"]["passed"] == 1,
                 r.dump());
    }

    dispatcher.stop();
    pool->shutdown();
}

int main() {
    std::cout << "Handlers Test Suite" << std::endl;
    std::cout << "===================" << std::endl;

    test_manage_editor();
    test_execute_menu_item();
    test_self_checks();
    test_builtin_wiring();

    print_summary();
    return exit_code();
}
