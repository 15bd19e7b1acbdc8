#include "handlers/TestRunnerTool.hpp"
#include "core/Envelope.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace handlers {

using common::Json;
using core::Response;

// ============================================================================
// SelfCheckSuite
// ============================================================================

void SelfCheckSuite::add(std::string name, Mode mode, Body body) {
    if (name.empty() || !body) {
        throw std::invalid_argument("self-check needs a name and a body");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    cases_.push_back(Case{std::move(name), mode, std::move(body)});
}

size_t SelfCheckSuite::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cases_.size();
}

SelfCheckSuite::RunResult SelfCheckSuite::run(Mode mode, Clock::time_point deadline) const {
    std::vector<Case> selected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& c : cases_) {
            if (c.mode == mode) selected.push_back(c);
        }
    }

    RunResult result;
    result.mode = mode;
    result.total = selected.size();

    for (const auto& c : selected) {
        CaseResult outcome;
        outcome.name = c.name;

        if (Clock::now() >= deadline) {
            outcome.skipped = true;
            outcome.message = "Not started before the deadline";
            result.skipped++;
            result.timed_out = true;
            result.cases.push_back(std::move(outcome));
            continue;
        }

        const auto start = Clock::now();
        try {
            c.body();
            outcome.passed = true;
        } catch (const std::exception& e) {
            outcome.message = e.what();
        } catch (...) {
            outcome.message = "Non-standard exception";
        }
        outcome.duration_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();

        if (outcome.passed) result.passed++;
        else result.failed++;
        result.cases.push_back(std::move(outcome));
    }

    return result;
}

Json SelfCheckSuite::RunResult::to_json() const {
    Json results = Json::array();
    for (const auto& c : cases) {
        Json entry = Json::object();
        entry["name"] = c.name;
        entry["state"] = c.skipped ? "Skipped" : (c.passed ? "Passed" : "Failed");
        entry["durationMs"] = c.duration_ms;
        if (!c.message.empty()) entry["message"] = c.message;
        results.push_back(std::move(entry));
    }

    Json summary = Json::object();
    summary["total"] = total;
    summary["passed"] = passed;
    summary["failed"] = failed;
    summary["skipped"] = skipped;

    Json data = Json::object();
    data["mode"] = mode_name(mode);
    data["summary"] = std::move(summary);
    data["results"] = std::move(results);
    return data;
}

common::Result<SelfCheckSuite::Mode> SelfCheckSuite::parse_mode(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.find_first_not_of(" \t\r\n") == std::string::npos) {
        return common::Result<Mode>::err(common::ErrorCode::InvalidEnvelope,
                                         "'mode' parameter cannot be empty");
    }
    if (lowered == "edit" || lowered == "editmode") return common::Result<Mode>::ok(Mode::Edit);
    if (lowered == "play" || lowered == "playmode") return common::Result<Mode>::ok(Mode::Play);

    return common::Result<Mode>::err(common::ErrorCode::InvalidEnvelope,
                                     "Unknown test mode: '" + text + "'. Use 'edit' or 'play'");
}

const char* SelfCheckSuite::mode_name(Mode mode) {
    return mode == Mode::Edit ? "EditMode" : "PlayMode";
}

// ============================================================================
// RunTestsTool
// ============================================================================

int RunTestsTool::parse_timeout(const Json& params) {
    if (!params.is_object()) return kDefaultTimeoutSeconds;

    auto it = params.find("timeoutSeconds");
    if (it == params.end()) return kDefaultTimeoutSeconds;

    long long value = 0;
    if (it->is_number_integer()) {
        value = it->get<long long>();
    } else if (it->is_string()) {
        const std::string text = it->get<std::string>();
        char* end = nullptr;
        value = std::strtoll(text.c_str(), &end, 10);
        if (text.empty() || *end != '\0') return kDefaultTimeoutSeconds;
    } else {
        return kDefaultTimeoutSeconds;
    }

    if (value <= 0 || value > 24 * 60 * 60) return kDefaultTimeoutSeconds;
    return static_cast<int>(value);
}

core::command::HandlerResult RunTestsTool::handle(const Json& params) {
    std::string mode_text = "edit";
    if (params.is_object()) {
        auto it = params.find("mode");
        if (it != params.end() && !it->is_null()) {
            if (!it->is_string()) {
                return Response::error("Unknown test mode: '" + it->dump() + "'. Use 'edit' or 'play'");
            }
            if (!it->get<std::string>().empty()) {
                mode_text = it->get<std::string>();
            }
        }
    }

    auto mode = SelfCheckSuite::parse_mode(mode_text);
    if (mode.is_err()) {
        return Response::error(mode.error().message);
    }

    const int timeout_seconds = parse_timeout(params);
    const auto deadline = SelfCheckSuite::Clock::now() + std::chrono::seconds(timeout_seconds);
    const SelfCheckSuite::Mode selected = mode.unwrap();
    auto suite = suite_;

    auto future = pool_->submit([suite, selected, deadline, timeout_seconds]() -> Json {
        const auto result = suite->run(selected, deadline);

        if (result.timed_out) {
            return Response::error("Test run timed out after " +
                                   std::to_string(timeout_seconds) + " seconds",
                                   result.to_json());
        }

        const std::string message =
            std::string(SelfCheckSuite::mode_name(selected)) + " tests completed: " +
            std::to_string(result.passed) + "/" + std::to_string(result.total) + " passed, " +
            std::to_string(result.failed) + " failed, " +
            std::to_string(result.skipped) + " skipped";

        return Response::success(message, result.to_json());
    });

    return core::command::HandlerResult::deferred(future.share());
}

} // namespace handlers
