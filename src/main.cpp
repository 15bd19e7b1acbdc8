#include "core/BridgeConfig.hpp"
#include "core/BridgeServer.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/CommandRegistry.hpp"
#include "core/Envelope.hpp"
#include "core/Logger.hpp"
#include "core/NetworkDefs.hpp"
#include "core/ThreadPool.hpp"
#include "core/TickLoop.hpp"
#include "handlers/EditorTools.hpp"

#include <pthread.h>
#include <signal.h>
#include <iostream>
#include <stdexcept>

namespace {

// Menu actions run on the host thread inside execute_menu_item
void install_menu_items(handlers::EditorState& state, std::shared_ptr<interfaces::ILogger> logger) {
    handlers::EditorState* editor = &state;

    state.add_menu_item("Edit/Play", [editor]() {
        if (!editor->enter_play_mode()) editor->exit_play_mode();
    });
    state.add_menu_item("Edit/Pause", [editor]() { editor->toggle_pause(); });
    state.add_menu_item("File/Save Project", [logger]() {
        logger->info("[Editor] Project saved");
    });
    state.add_menu_item("Assets/Refresh", [logger]() {
        logger->info("[Editor] Asset database refreshed");
    });
    state.add_menu_item("File/Quit", [logger]() {
        logger->warn("[Editor] Quit requested from the menu");
    });
}

void expect(bool condition, const std::string& what) {
    if (!condition) throw std::runtime_error("expected " + what);
}

// Checks must stay off host-confined state: they run on the worker pool
void install_self_checks(handlers::SelfCheckSuite& suite) {
    using Mode = handlers::SelfCheckSuite::Mode;

    suite.add("Envelope.PongShape", Mode::Edit, []() {
        expect(core::ResponseEnvelope::serialize(core::ResponseEnvelope::pong()) ==
                   R"({"status":"success","result":{"message":"pong"}})",
               "canonical pong");
    });
    suite.add("Envelope.EchoIsBounded", Mode::Edit, []() {
        const auto echo = core::text::truncate_for_echo(std::string(200, 'x'));
        expect(echo.size() == core::ResponseEnvelope::kMaxEchoLength + 3, "50 chars plus ellipsis");
    });
    suite.add("Registry.SnakeCase", Mode::Edit, []() {
        expect(core::command::CommandRegistry::to_snake_case("ManageAsset") == "manage_asset",
               "ManageAsset -> manage_asset");
    });
    suite.add("Editor.StandardTools", Mode::Play, []() {
        expect(handlers::EditorState::canonical_tool_name("rotate") == "Rotate",
               "case-insensitive tool lookup");
    });
}

} // namespace

int main(int argc, char** argv) {
    auto loaded = core::BridgeConfig::load(argc, argv);
    if (loaded.is_err()) {
        std::cerr << "[Main] " << common::error_code_name(loaded.error().code) << ": "
                  << loaded.error().message << "\n"
                  << core::BridgeConfig::usage(argv[0]);
        return 2;
    }
    const core::BridgeConfig config = loaded.unwrap();
    if (config.show_help) {
        std::cout << core::BridgeConfig::usage(argv[0]);
        return 0;
    }

    init_network();

    // Block termination signals before any thread starts; the main thread
    // collects them with sigwait().
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto logger = std::make_shared<core::ConsoleLogger>(config.debug_logs);
    logger->info("[Main] hostbridge starting (" + config.describe() + ")");

    // 1. Host-side services
    auto pool = std::make_shared<core::ThreadPool>(config.worker_threads, logger);
    auto state = std::make_shared<handlers::EditorState>();
    auto suite = std::make_shared<handlers::SelfCheckSuite>();
    install_menu_items(*state, logger);
    install_self_checks(*suite);

    // 2. Tools
    core::command::ToolCatalog catalog;
    handlers::register_builtin_tools(catalog, state, suite, pool, logger);
    auto registry = std::make_shared<core::command::CommandRegistry>(std::move(catalog), logger);

    // 3. Host loop + dispatcher
    auto loop = std::make_shared<core::TickLoop>(
        std::chrono::milliseconds(config.frame_interval_ms), logger);
    auto dispatcher = std::make_shared<core::command::CommandDispatcher>(registry, loop, logger);

    loop->start();
    loop->post([registry]() { registry->initialize(); });
    dispatcher->start();

    // 4. Transport
    core::BridgeServer server(
        config.bind_address,
        static_cast<uint16_t>(config.port),
        std::chrono::milliseconds(config.request_timeout_ms),
        dispatcher,
        logger
    );

    auto started = server.start();
    if (started.is_err()) {
        logger->error(std::string("[Main] ") + common::error_code_name(started.error().code) + ": " +
                      started.error().message);
        dispatcher->stop();
        loop->stop();
        pool->shutdown();
        return 1;
    }

    // 5. Run until signalled
    int received = 0;
    sigwait(&signals, &received);
    logger->info(std::string("[Main] Received ") + (received == SIGINT ? "SIGINT" : "SIGTERM") +
                 ", shutting down");

    server.stop();
    dispatcher->stop();
    loop->stop();
    pool->shutdown();
    cleanup_network();

    const auto stats = dispatcher->get_stats();
    logger->info("[Main] Dispatched " + std::to_string(stats.total_dispatched) +
                 " commands (" + std::to_string(stats.succeeded) + " ok, " +
                 std::to_string(stats.failed) + " failed, " +
                 std::to_string(stats.cancelled) + " cancelled)");
    return 0;
}
