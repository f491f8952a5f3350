/// @file test_queues.cpp
/// @brief Tests for DeferredEventQueue, ErrorQueue and TaskQueue

#include <catch2/catch_test_macros.hpp>
#include <fixiplug/hooks/deferred_queue.hpp>
#include <fixiplug/hooks/error_queue.hpp>
#include <fixiplug/hooks/task_queue.hpp>
#include <fixiplug/core/log.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fixi_hooks;

namespace {

DeferredEventQueue::Limits small_limits() {
    DeferredEventQueue::Limits limits;
    limits.max_queue = 10;
    limits.batch_size = 3;
    limits.loop_warn_threshold = 2;
    limits.loop_drop_threshold = 4;
    return limits;
}

/// Attaches a warn-level ring buffer to the hooks logger for one scope
class WarningCapture {
public:
    WarningCapture()
        : m_logger(fixi_core::hooks_logger())
        , m_sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64)) {
        m_sink->set_level(spdlog::level::warn);
        m_sink->set_pattern("%v");
        m_previous_level = m_logger->level();
        m_logger->set_level(spdlog::level::trace);
        m_logger->sinks().push_back(m_sink);
    }

    ~WarningCapture() {
        auto& sinks = m_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
        m_logger->set_level(m_previous_level);
    }

    WarningCapture(const WarningCapture&) = delete;
    WarningCapture& operator=(const WarningCapture&) = delete;

    [[nodiscard]] std::vector<std::string> lines() const { return m_sink->last_formatted(); }

    [[nodiscard]] std::size_t count_containing(const std::string& text) const {
        auto all = lines();
        return static_cast<std::size_t>(std::count_if(all.begin(), all.end(),
            [&](const std::string& line) { return line.find(text) != std::string::npos; }));
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> m_sink;
    spdlog::level::level_enum m_previous_level = spdlog::level::info;
};

} // namespace

// =============================================================================
// DeferredEventQueue
// =============================================================================

TEST_CASE("DeferredEventQueue: default limits", "[hooks][deferred]") {
    DeferredEventQueue queue;
    REQUIRE(queue.limits().max_queue == 1000);
    REQUIRE(queue.limits().batch_size == 50);
    REQUIRE(queue.limits().loop_warn_threshold == 100);
    REQUIRE(queue.limits().loop_drop_threshold == 500);
}

TEST_CASE("DeferredEventQueue: batches preserve FIFO order", "[hooks][deferred]") {
    DeferredEventQueue queue(small_limits());
    for (int i = 0; i < 5; ++i) {
        REQUIRE(queue.push("h" + std::to_string(i), Event{{"n", i}}) == EmitOutcome::Queued);
    }

    auto first = queue.take_batch();
    REQUIRE(first.size() == 3);
    REQUIRE(first[0].hook_name == "h0");
    REQUIRE(first[2].event["n"] == 2);

    auto second = queue.take_batch();
    REQUIRE(second.size() == 2);
    REQUIRE(second[1].hook_name == "h4");

    REQUIRE(queue.empty());
    REQUIRE(queue.take_batch().empty());
    REQUIRE(queue.stats().batches == 2);
    REQUIRE(queue.stats().drained == 5);
}

TEST_CASE("DeferredEventQueue: overflow", "[hooks][deferred]") {
    DeferredEventQueue queue(small_limits());
    for (int i = 0; i < 10; ++i) {
        queue.push("h" + std::to_string(i), Event::object());
    }
    REQUIRE(queue.is_full());

    REQUIRE(queue.push("late", Event::object()) == EmitOutcome::DroppedOverflow);
    REQUIRE(queue.size() == 10);
    REQUIRE(queue.stats().dropped_overflow == 1);
    REQUIRE(queue.emission_count("late") == 0);
}

TEST_CASE("DeferredEventQueue: loop detection", "[hooks][deferred]") {
    DeferredEventQueue queue(small_limits());

    for (int i = 0; i < 4; ++i) {
        REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::Queued);
    }
    REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::DroppedLoop);
    REQUIRE(queue.emission_count("loop") == 5);
    REQUIRE(queue.stats().dropped_loop == 1);
    REQUIRE(queue.size() == 4);

    SECTION("other hooks unaffected") {
        REQUIRE(queue.push("other", Event::object()) == EmitOutcome::Queued);
    }

    SECTION("reset re-opens the hook") {
        queue.reset_counters();
        REQUIRE(queue.emission_count("loop") == 0);
        REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::Queued);
    }
}

TEST_CASE("DeferredEventQueue: overflow warns once per hook", "[hooks][deferred][log]") {
    WarningCapture capture;
    DeferredEventQueue queue(small_limits());
    for (int i = 0; i < 10; ++i) {
        queue.push("h" + std::to_string(i), Event::object());
    }
    REQUIRE(capture.lines().empty());

    REQUIRE(queue.push("alpha", Event::object()) == EmitOutcome::DroppedOverflow);
    REQUIRE(queue.push("beta", Event::object()) == EmitOutcome::DroppedOverflow);
    REQUIRE(queue.push("alpha", Event::object()) == EmitOutcome::DroppedOverflow);

    REQUIRE(queue.stats().dropped_overflow == 3);
    REQUIRE(queue.size() == 10);
    REQUIRE(capture.count_containing("dropping event 'alpha'") == 1);
    REQUIRE(capture.count_containing("dropping event 'beta'") == 1);
    REQUIRE(capture.lines().size() == 2);

    SECTION("a new drain cycle warns again") {
        queue.reset_counters();
        REQUIRE(queue.push("alpha", Event::object()) == EmitOutcome::DroppedOverflow);
        REQUIRE(capture.count_containing("dropping event 'alpha'") == 2);
    }
}

TEST_CASE("DeferredEventQueue: loop thresholds log warnings", "[hooks][deferred][log]") {
    WarningCapture capture;
    DeferredEventQueue queue(small_limits());
    const auto& limits = queue.limits();

    for (std::size_t i = 0; i < limits.loop_warn_threshold; ++i) {
        REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::Queued);
    }
    REQUIRE(capture.count_containing("possible event loop") == 0);

    REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::Queued);
    REQUIRE(queue.emission_count("loop") == limits.loop_warn_threshold + 1);
    REQUIRE(capture.count_containing("Hook 'loop' emitted 3 times in one drain cycle") == 1);

    while (queue.emission_count("loop") < limits.loop_drop_threshold) {
        REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::Queued);
    }
    REQUIRE(capture.count_containing("dropping further emits") == 0);
    REQUIRE(capture.count_containing("possible event loop") == 1);

    REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::DroppedLoop);
    REQUIRE(queue.emission_count("loop") == limits.loop_drop_threshold + 1);
    REQUIRE(capture.count_containing("Hook 'loop' emitted 5 times without the queue draining") == 1);

    REQUIRE(queue.push("loop", Event::object()) == EmitOutcome::DroppedLoop);
    REQUIRE(capture.count_containing("dropping further emits") == 1);
}

TEST_CASE("DeferredEventQueue: outcome names", "[hooks][deferred]") {
    REQUIRE(std::string(emit_outcome_name(EmitOutcome::Queued)) == "Queued");
    REQUIRE(std::string(emit_outcome_name(EmitOutcome::DroppedLoop)) == "DroppedLoop");
}

// =============================================================================
// ErrorQueue
// =============================================================================

TEST_CASE("ErrorQueue: take_all drains in order", "[hooks][errors]") {
    ErrorQueue queue;
    queue.push(ErrorEntry{"a", "h1", "boom", Event{{"x", 1}}});
    queue.push(ErrorEntry{"b", "h2", "bang", Event::object()});

    REQUIRE(queue.size() == 2);
    auto entries = queue.take_all();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].plugin_id == "a");
    REQUIRE(entries[1].error == "bang");
    REQUIRE(queue.empty());
    REQUIRE(queue.total_captured() == 2);
}

TEST_CASE("ErrorEntry: payload shape", "[hooks][errors]") {
    ErrorEntry entry{"auth", "beforeRequest", "token expired", Event{{"url", "/x"}}};
    auto payload = entry.to_event();

    REQUIRE(payload["pluginId"] == "auth");
    REQUIRE(payload["hookName"] == "beforeRequest");
    REQUIRE(payload["error"] == "token expired");
    REQUIRE(payload["event"]["url"] == "/x");
}

// =============================================================================
// TaskQueue
// =============================================================================

TEST_CASE("TaskQueue: tick runs only tasks queued before it", "[hooks][tasks]") {
    TaskQueue tasks;
    std::vector<int> ran;

    tasks.post([&] {
        ran.push_back(1);
        tasks.post([&] { ran.push_back(2); });
    });

    REQUIRE(tasks.tick() == 1);
    REQUIRE(ran == std::vector<int>{1});
    REQUIRE(tasks.pending() == 1);

    REQUIRE(tasks.tick() == 1);
    REQUIRE(ran == std::vector<int>{1, 2});
    REQUIRE(tasks.idle());
    REQUIRE(tasks.ticks() == 2);
}

TEST_CASE("TaskQueue: failing task does not stop the tick", "[hooks][tasks]") {
    TaskQueue tasks;
    int ran = 0;

    tasks.post([] { throw std::runtime_error("task failed"); }, "failing");
    tasks.post([&ran] { ++ran; });

    REQUIRE(tasks.tick() == 2);
    REQUIRE(ran == 1);
}

TEST_CASE("TaskQueue: run_until_idle", "[hooks][tasks]") {
    TaskQueue tasks;
    int remaining = 5;

    std::function<void()> step = [&] {
        if (--remaining > 0) {
            tasks.post(step);
        }
    };
    tasks.post(step);

    REQUIRE(tasks.run_until_idle() == 5);
    REQUIRE(remaining == 0);

    SECTION("tick limit") {
        remaining = 100;
        tasks.post(step);
        tasks.run_until_idle(3);
        REQUIRE(tasks.pending() == 1);
        tasks.clear();
    }
}
