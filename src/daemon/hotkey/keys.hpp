#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using KeyId = uint32_t;

// Values match Linux evdev key codes (linux/input-event-codes.h).
namespace keys {

inline constexpr KeyId LeftCtrl = 29;
inline constexpr KeyId LeftShift = 42;
inline constexpr KeyId RightShift = 54;
inline constexpr KeyId LeftAlt = 56;
inline constexpr KeyId RightCtrl = 97;
inline constexpr KeyId RightAlt = 100;

inline constexpr KeyId F1 = 59;
inline constexpr KeyId F2 = 60;
inline constexpr KeyId F3 = 61;
inline constexpr KeyId F4 = 62;
inline constexpr KeyId F12 = 88;
inline constexpr KeyId A = 30;

enum class Modifier { Shift, Control, Alt };

constexpr bool is_modifier(KeyId key) {
    return key == LeftShift || key == RightShift ||
           key == LeftCtrl || key == RightCtrl ||
           key == LeftAlt || key == RightAlt;
}

constexpr std::optional<Modifier> modifier_of(KeyId key) {
    if (key == LeftShift || key == RightShift) return Modifier::Shift;
    if (key == LeftCtrl || key == RightCtrl) return Modifier::Control;
    if (key == LeftAlt || key == RightAlt) return Modifier::Alt;
    return std::nullopt;
}

// Accepts "F1".."F24", "Pause", "ScrollLock", "Insert" (case-insensitive).
std::optional<KeyId> from_name(std::string_view name);
std::string name_of(KeyId key);

} // namespace keys
