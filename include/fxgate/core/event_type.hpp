/**
 * @file event_type.hpp
 * @brief fxgate source file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace fxg {

/**
 * @brief Mutually exclusive effect categories coordinated by the engine.
 */
enum class EventType {
    Jumpscare,
    ScreenShake,
    VhsDistortion,
    ChromaticAberration,
    Glitch,
    PhantomTyping,
    EntitySpawn,
    Whisper,
    ContextTrigger,
    TimeDilation,
    EasterEgg,
};

inline constexpr std::size_t kEventTypeCount = 11;

const std::array<EventType, kEventTypeCount>& allEventTypes();

/// Wire name, e.g. "screen_shake".
const char* toString(EventType type);

/// Accepts wire names and CamelCase names, case-insensitive.
std::optional<EventType> parseEventType(const std::string& text);

} // namespace fxg
