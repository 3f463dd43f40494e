#include <catch2/catch_test_macros.hpp>

#include "hotkey/hotkey_state_machine.hpp"

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct Harness {
    Logger log{LogLevel::Critical};
    std::chrono::steady_clock::time_point now{};
    HotkeyStateMachine machine{HotkeyBindings{}, log, HotkeyStateMachine::kDefaultDebounce,
                               [this] { return now; }};
    std::vector<HotkeyEvent> events;

    Harness() {
        machine.subscribe([this](const HotkeyEvent& ev) { events.push_back(ev); });
    }

    void press(KeyId key) { machine.on_key_down(key); }
    void release(KeyId key) { machine.on_key_up(key); }

    void tap(KeyId key) {
        press(key);
        release(key);
    }
};

} // namespace

TEST_CASE("HotkeyStateMachine", "[hotkey]") {
    Harness h;

    SECTION("PlainHoldStartsAndEnds") {
        REQUIRE(h.machine.on_key_down(keys::F1));
        REQUIRE(h.machine.active_mode() == TransmissionMode::Plain);
        REQUIRE(h.machine.on_key_up(keys::F1));
        REQUIRE(h.machine.active_mode() == TransmissionMode::None);

        REQUIRE(h.events.size() == 2);
        REQUIRE(h.events[0].kind == HotkeyEventKind::TransmissionStarted);
        REQUIRE(h.events[0].mode == TransmissionMode::Plain);
        REQUIRE(h.events[1].kind == HotkeyEventKind::TransmissionEnded);
        REQUIRE(h.events[1].mode == TransmissionMode::Plain);
    }

    SECTION("ModifierSelectsMode") {
        h.press(keys::LeftShift);
        h.press(keys::F2);
        REQUIRE(h.machine.active_mode() == TransmissionMode::Prompt);
        h.release(keys::F2);
        h.release(keys::LeftShift);

        h.press(keys::RightCtrl);
        h.press(keys::F2);
        REQUIRE(h.machine.active_mode() == TransmissionMode::CopyPrompt);
        h.release(keys::F2);

        h.press(keys::F3);
        REQUIRE(h.machine.active_mode() == TransmissionMode::VisionHold);
        h.release(keys::F3);
        h.release(keys::RightCtrl);

        REQUIRE(h.machine.active_mode() == TransmissionMode::None);
        REQUIRE(h.events.size() == 6);
    }

    SECTION("ModifiersAreNeverSuppressed") {
        REQUIRE_FALSE(h.machine.on_key_down(keys::LeftCtrl));
        REQUIRE(h.machine.modifier_held(keys::Modifier::Control));
        REQUIRE_FALSE(h.machine.on_key_up(keys::LeftCtrl));
        REQUIRE_FALSE(h.machine.modifier_held(keys::Modifier::Control));
        REQUIRE(h.events.empty());
    }

    SECTION("UnboundKeysPassThrough") {
        REQUIRE_FALSE(h.machine.on_key_down(keys::A));
        REQUIRE_FALSE(h.machine.on_key_up(keys::A));

        // Trigger-2 and Trigger-3 need a modifier.
        REQUIRE_FALSE(h.machine.on_key_down(keys::F2));
        REQUIRE_FALSE(h.machine.on_key_up(keys::F2));
        REQUIRE_FALSE(h.machine.on_key_down(keys::F3));
        REQUIRE_FALSE(h.machine.on_key_up(keys::F3));
        REQUIRE(h.events.empty());
    }

    SECTION("SecondStartWhileActiveIsNoOp") {
        h.press(keys::F1);
        REQUIRE(h.events.size() == 1);

        h.press(keys::LeftShift);
        REQUIRE(h.machine.on_key_down(keys::F2)); // still swallowed
        REQUIRE(h.machine.active_mode() == TransmissionMode::Plain);
        REQUIRE(h.events.size() == 1);

        // Releasing the rejected key does not end the plain capture.
        REQUIRE(h.machine.on_key_up(keys::F2));
        REQUIRE(h.machine.active_mode() == TransmissionMode::Plain);
        REQUIRE(h.events.size() == 1);
    }

    SECTION("TriggerOneReleaseWithControlHeldKeepsPlainCapture") {
        h.press(keys::F1);
        h.press(keys::LeftCtrl);
        h.release(keys::F1);

        REQUIRE(h.machine.active_mode() == TransmissionMode::Plain);
        REQUIRE(h.events.size() == 1);

        h.release(keys::LeftCtrl);
        h.release(keys::F1);
        REQUIRE(h.machine.active_mode() == TransmissionMode::None);
        REQUIRE(h.events.back().kind == HotkeyEventKind::TransmissionEnded);
    }

    SECTION("ReleaseOfOtherKeyDoesNotEnd") {
        h.press(keys::LeftShift);
        h.press(keys::F2);
        h.release(keys::LeftShift);
        h.tap(keys::F1); // Plain is rejected while Prompt is active
        REQUIRE(h.machine.active_mode() == TransmissionMode::Prompt);
        h.release(keys::F2);
        REQUIRE(h.machine.active_mode() == TransmissionMode::None);
    }

    SECTION("TtsDebounce") {
        h.press(keys::LeftCtrl);

        h.now = std::chrono::steady_clock::time_point{} + 1s;
        REQUIRE(h.machine.on_key_down(keys::F1));
        h.release(keys::F1);
        h.now += 150ms;
        REQUIRE(h.machine.on_key_down(keys::F1)); // dropped, but still swallowed
        h.release(keys::F1);

        REQUIRE(h.events.size() == 1);
        REQUIRE(h.events[0].kind == HotkeyEventKind::TtsTriggered);

        h.now += 250ms;
        h.tap(keys::F1);
        REQUIRE(h.events.size() == 2);
        REQUIRE(h.machine.active_mode() == TransmissionMode::None);
    }

    SECTION("TtsAcceptedWhileCapturing") {
        h.press(keys::LeftShift);
        h.press(keys::F2);
        h.release(keys::LeftShift);
        h.press(keys::LeftCtrl);
        h.tap(keys::F1);

        REQUIRE(h.events.size() == 2);
        REQUIRE(h.events[1].kind == HotkeyEventKind::TtsTriggered);
        REQUIRE(h.machine.active_mode() == TransmissionMode::Prompt);
    }

    SECTION("VisionImmediateFiresOnce") {
        h.press(keys::LeftShift);
        REQUIRE(h.machine.on_key_down(keys::F3));
        REQUIRE(h.machine.on_key_up(keys::F3));

        REQUIRE(h.events.size() == 1);
        REQUIRE(h.events[0].kind == HotkeyEventKind::VisionCaptureStarted);
        REQUIRE(h.events[0].mode == TransmissionMode::VisionImmediate);
        REQUIRE(h.machine.active_mode() == TransmissionMode::None);
    }

    SECTION("AtMostOneModeActive") {
        const KeyId keys_pool[] = {keys::F1, keys::F2, keys::F3, keys::LeftCtrl,
                                   keys::LeftShift, keys::A};
        int active = 0;
        int started = 0;
        int ended = 0;
        h.machine.subscribe([&](const HotkeyEvent& ev) {
            if (ev.kind == HotkeyEventKind::TransmissionStarted) {
                ++started;
                ++active;
                REQUIRE(active == 1);
            } else if (ev.kind == HotkeyEventKind::TransmissionEnded) {
                ++ended;
                --active;
                REQUIRE(active == 0);
            }
        });

        uint32_t seed = 12345;
        for (int i = 0; i < 2000; ++i) {
            seed = seed * 1103515245u + 12345u;
            KeyId key = keys_pool[(seed >> 16) % 6];
            h.now += 37ms;
            if ((seed >> 8) & 1) {
                h.press(key);
            } else {
                h.release(key);
            }
            REQUIRE(active == (h.machine.is_transmitting() ? 1 : 0));
        }
        REQUIRE(started - ended == active);
    }

    SECTION("AbandonDropsWithoutEvent") {
        h.press(keys::F1);
        auto orphan = h.machine.abandon();
        REQUIRE(orphan);
        REQUIRE(*orphan == TransmissionMode::Plain);
        REQUIRE(h.machine.active_mode() == TransmissionMode::None);
        REQUIRE_FALSE(h.machine.abandon());

        h.release(keys::F1);
        REQUIRE(h.events.size() == 1);
    }

    SECTION("RebindingTakesEffect") {
        h.machine.set_bindings({keys::F12, keys::F2, keys::F3});
        REQUIRE_FALSE(h.machine.on_key_down(keys::F1));
        REQUIRE(h.machine.on_key_down(keys::F12));
        REQUIRE(h.machine.active_mode() == TransmissionMode::Plain);
    }

    SECTION("ListenersRunInRegistrationOrder") {
        std::vector<int> order;
        h.machine.subscribe([&](const HotkeyEvent&) { order.push_back(1); });
        h.machine.subscribe([&](const HotkeyEvent&) { order.push_back(2); });
        h.press(keys::F1);
        REQUIRE(order == std::vector<int>{1, 2});
    }
}
