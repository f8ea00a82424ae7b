#include "fxgate/core/event_type.hpp"

#include <algorithm>
#include <cctype>

namespace fxg {

const std::array<EventType, kEventTypeCount>& allEventTypes() {
    static const std::array<EventType, kEventTypeCount> types = {
        EventType::Jumpscare,     EventType::ScreenShake,    EventType::VhsDistortion,
        EventType::ChromaticAberration, EventType::Glitch,   EventType::PhantomTyping,
        EventType::EntitySpawn,   EventType::Whisper,        EventType::ContextTrigger,
        EventType::TimeDilation,  EventType::EasterEgg,
    };
    return types;
}

const char* toString(EventType type) {
    switch (type) {
    case EventType::Jumpscare:
        return "jumpscare";
    case EventType::ScreenShake:
        return "screen_shake";
    case EventType::VhsDistortion:
        return "vhs_distortion";
    case EventType::ChromaticAberration:
        return "chromatic_aberration";
    case EventType::Glitch:
        return "glitch";
    case EventType::PhantomTyping:
        return "phantom_typing";
    case EventType::EntitySpawn:
        return "entity_spawn";
    case EventType::Whisper:
        return "whisper";
    case EventType::ContextTrigger:
        return "context_trigger";
    case EventType::TimeDilation:
        return "time_dilation";
    case EventType::EasterEgg:
        return "easter_egg";
    }
    return "unknown";
}

std::optional<EventType> parseEventType(const std::string& text) {
    // Fold "ScreenShake", "screen_shake" and "SCREEN-SHAKE" to one spelling.
    std::string normalized;
    normalized.reserve(text.size());
    for (const unsigned char c : text) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(c)));
    }

    for (const auto type : allEventTypes()) {
        std::string candidate = toString(type);
        candidate.erase(std::remove(candidate.begin(), candidate.end(), '_'), candidate.end());
        if (candidate == normalized) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace fxg
