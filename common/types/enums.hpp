#pragma once

#include <cstdint>
#include <string_view>

namespace pixels {

enum class Colorway : uint8_t {
    Unknown = 0,
    OnyxBlack = 1,
    HematiteGrey = 2,
    MidnightGalaxy = 3,
    AuroraSky = 4,
    Clear = 5,
    WhiteAurora = 6,
    Custom = 0xFF,
};

inline std::string_view to_string(Colorway colorway) {
    switch (colorway) {
        case Colorway::Unknown: return "unknown";
        case Colorway::OnyxBlack: return "onyx_black";
        case Colorway::HematiteGrey: return "hematite_grey";
        case Colorway::MidnightGalaxy: return "midnight_galaxy";
        case Colorway::AuroraSky: return "aurora_sky";
        case Colorway::Clear: return "clear";
        case Colorway::WhiteAurora: return "white_aurora";
        case Colorway::Custom: return "custom";
    }
    return "unknown";
}

// Values outside the known set map to Unknown so newer dice still decode
inline Colorway colorway_from_raw(uint8_t value) {
    if (value <= static_cast<uint8_t>(Colorway::WhiteAurora) ||
        value == static_cast<uint8_t>(Colorway::Custom)) {
        return static_cast<Colorway>(value);
    }
    return Colorway::Unknown;
}

enum class DieType : uint8_t {
    Unknown = 0,
    D4 = 1,
    D6 = 2,
    D8 = 3,
    D10 = 4,
    D00 = 5,
    D12 = 6,
    D20 = 7,
    D6Pipped = 8,
    D6Fudge = 9,
};

constexpr uint8_t die_type_max = static_cast<uint8_t>(DieType::D6Fudge);

inline std::string_view to_string(DieType type) {
    switch (type) {
        case DieType::Unknown: return "unknown";
        case DieType::D4: return "d4";
        case DieType::D6: return "d6";
        case DieType::D8: return "d8";
        case DieType::D10: return "d10";
        case DieType::D00: return "d00";
        case DieType::D12: return "d12";
        case DieType::D20: return "d20";
        case DieType::D6Pipped: return "d6pipped";
        case DieType::D6Fudge: return "d6fudge";
    }
    return "unknown";
}

inline DieType die_type_from_raw(uint8_t value) {
    return value <= die_type_max ? static_cast<DieType>(value) : DieType::Unknown;
}

// Number of faces for a die type, 0 when unknown
inline int face_count(DieType type) {
    switch (type) {
        case DieType::D4: return 4;
        case DieType::D6:
        case DieType::D6Pipped:
        case DieType::D6Fudge: return 6;
        case DieType::D8: return 8;
        case DieType::D10:
        case DieType::D00: return 10;
        case DieType::D12: return 12;
        case DieType::D20: return 20;
        case DieType::Unknown: break;
    }
    return 0;
}

enum class RollState : uint8_t {
    Unknown = 0,
    Rolled = 1,
    Handling = 2,
    Rolling = 3,
    Crooked = 4,
    OnFace = 5,
};

constexpr uint8_t roll_state_max = static_cast<uint8_t>(RollState::OnFace);

inline std::string_view to_string(RollState state) {
    switch (state) {
        case RollState::Unknown: return "unknown";
        case RollState::Rolled: return "rolled";
        case RollState::Handling: return "handling";
        case RollState::Rolling: return "rolling";
        case RollState::Crooked: return "crooked";
        case RollState::OnFace: return "on_face";
    }
    return "unknown";
}

inline RollState roll_state_from_raw(uint8_t value) {
    return value <= roll_state_max ? static_cast<RollState>(value) : RollState::Unknown;
}

} // namespace pixels
