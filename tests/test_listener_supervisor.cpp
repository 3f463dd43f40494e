#include <catch2/catch_test_macros.hpp>

#include "hotkey/listener_supervisor.hpp"

#include <chrono>
#include <deque>
#include <expected>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Returns scripted results from run(); an exhausted script means success.
class ScriptedSource : public KeyEventSource {
public:
    std::deque<std::expected<void, std::string>> script;
    KeyHandler on_down;
    KeyHandler on_up;
    int runs = 0;
    std::function<void()> during_run;

    void set_handlers(KeyHandler down, KeyHandler up) override {
        on_down = std::move(down);
        on_up = std::move(up);
    }

    std::expected<void, std::string> run() override {
        ++runs;
        if (during_run) during_run();
        if (script.empty()) return {};
        auto next = script.front();
        script.pop_front();
        return next;
    }

    void stop() override {}
};

struct CapturedLog {
    std::vector<std::pair<LogLevel, std::string>> lines;
    Logger log{LogLevel::Debug, [this](LogLevel level, std::string_view msg) {
                   lines.emplace_back(level, std::string(msg));
               }};

    int count(LogLevel level) const {
        int n = 0;
        for (auto& [l, _] : lines) n += l == level;
        return n;
    }
};

} // namespace

TEST_CASE("ListenerSupervisor", "[hotkey][supervisor]") {
    CapturedLog captured;
    HotkeyStateMachine machine(HotkeyBindings{}, captured.log);
    ScriptedSource source;
    std::vector<std::chrono::milliseconds> delays;

    ListenerSupervisor::Policy policy;
    policy.base_delay = 100ms;
    policy.max_restarts = 3;

    ListenerSupervisor supervisor(source, machine, captured.log, policy,
                                  [&](std::chrono::milliseconds d) {
                                      delays.push_back(d);
                                      return true;
                                  });

    SECTION("HandlersForwardToStateMachine") {
        REQUIRE(source.on_down(keys::F1));
        REQUIRE(machine.active_mode() == TransmissionMode::Plain);
        REQUIRE(source.on_up(keys::F1));
        REQUIRE(machine.active_mode() == TransmissionMode::None);
    }

    SECTION("CleanExitIsNotRestarted") {
        supervisor.run();
        REQUIRE(source.runs == 1);
        REQUIRE(delays.empty());
        REQUIRE(supervisor.state() == ListenerState::Stopped);
    }

    SECTION("RecoversAfterFailure") {
        source.script.push_back(std::unexpected("device vanished"));
        supervisor.run();
        REQUIRE(source.runs == 2);
        REQUIRE(delays == std::vector<std::chrono::milliseconds>{100ms});
        REQUIRE(supervisor.state() == ListenerState::Stopped);
    }

    SECTION("LinearBackoffThenFatal") {
        for (int i = 0; i < 4; ++i) {
            source.script.push_back(std::unexpected("read error " + std::to_string(i)));
        }
        std::string fatal_reason;
        supervisor.on_fatal([&](const std::string& reason) { fatal_reason = reason; });

        supervisor.run();

        REQUIRE(source.runs == 4);
        REQUIRE(delays == std::vector<std::chrono::milliseconds>{100ms, 200ms, 300ms});
        REQUIRE(supervisor.state() == ListenerState::Failed);
        REQUIRE(fatal_reason == "read error 3");
        REQUIRE(captured.count(LogLevel::Critical) == 1);
        REQUIRE(captured.count(LogLevel::Error) == 4);
    }

    SECTION("FailureAbandonsActiveTransmission") {
        source.during_run = [&] {
            if (source.runs == 1) source.on_down(keys::F1);
        };
        source.script.push_back(std::unexpected("device vanished"));

        std::vector<TransmissionMode> orphans;
        supervisor.on_orphan([&](TransmissionMode mode) { orphans.push_back(mode); });

        supervisor.run();

        REQUIRE(machine.active_mode() == TransmissionMode::None);
        REQUIRE(captured.count(LogLevel::Warn) == 1);
        REQUIRE(orphans == std::vector<TransmissionMode>{TransmissionMode::Plain});
    }

    SECTION("FailureWhileIdleReportsNoOrphan") {
        source.script.push_back(std::unexpected("device vanished"));
        int orphans = 0;
        supervisor.on_orphan([&](TransmissionMode) { ++orphans; });

        supervisor.run();

        REQUIRE(orphans == 0);
    }

    SECTION("PolicyChangeAppliesAtNextFailure") {
        source.script.push_back(std::unexpected("first"));
        source.script.push_back(std::unexpected("second"));
        source.during_run = [&] {
            if (source.runs == 2) {
                ListenerSupervisor::Policy tighter;
                tighter.base_delay = 40ms;
                tighter.max_restarts = 1;
                supervisor.set_policy(tighter);
            }
        };
        bool fatal = false;
        supervisor.on_fatal([&](const std::string&) { fatal = true; });

        supervisor.run();

        // One restart at the old base, then the new budget of one is spent.
        REQUIRE(delays == std::vector<std::chrono::milliseconds>{100ms});
        REQUIRE(fatal);
        REQUIRE(supervisor.state() == ListenerState::Failed);
        REQUIRE(supervisor.policy().base_delay == 40ms);
    }

    SECTION("InterruptedSleepStops") {
        ListenerSupervisor interrupted(source, machine, captured.log, policy,
                                       [](std::chrono::milliseconds) { return false; });
        source.script.push_back(std::unexpected("gone"));
        source.script.push_back(std::unexpected("gone"));
        interrupted.run();
        REQUIRE(source.runs == 1);
        REQUIRE(interrupted.state() == ListenerState::Stopped);
    }
}
