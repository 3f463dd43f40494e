#include "hotkey/keys.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace keys {

namespace {

constexpr std::array<std::pair<std::string_view, KeyId>, 27> kNamedKeys = {{
    {"f1", 59}, {"f2", 60}, {"f3", 61}, {"f4", 62}, {"f5", 63}, {"f6", 64},
    {"f7", 65}, {"f8", 66}, {"f9", 67}, {"f10", 68}, {"f11", 87}, {"f12", 88},
    {"f13", 183}, {"f14", 184}, {"f15", 185}, {"f16", 186}, {"f17", 187},
    {"f18", 188}, {"f19", 189}, {"f20", 190}, {"f21", 191}, {"f22", 192},
    {"f23", 193}, {"f24", 194},
    {"pause", 119}, {"scrolllock", 70}, {"insert", 110},
}};

} // namespace

std::optional<KeyId> from_name(std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = std::ranges::find_if(kNamedKeys, [&lower](const auto& p) { return p.first == lower; });
    if (it == kNamedKeys.end()) return std::nullopt;
    return it->second;
}

std::string name_of(KeyId key) {
    auto it = std::ranges::find_if(kNamedKeys, [key](const auto& p) { return p.second == key; });
    if (it == kNamedKeys.end()) return "key" + std::to_string(key);

    std::string name(it->first);
    if (name.front() == 'f') {
        name.front() = 'F';
    } else {
        name.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));
    }
    return name;
}

} // namespace keys
