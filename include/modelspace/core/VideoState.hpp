#pragma once
#include <cstdint>
#include <string_view>

namespace MS {

// Liveness/visibility state of a single session, as reported by the chat server.
enum class VideoState : std::int64_t {
    FreeChat  = 0,
    Reset     = 1,
    Away      = 2,
    Confirming = 11,
    Private   = 12,
    GroupShow = 13,
    Club      = 14,
    KillModel = 15,
    CamToCamOn  = 20,
    CamToCamOff = 21,
    Online    = 90,
    ReceivingPrivate = 91,
    Voyeur    = 92,
    ReceivingGroup = 93,
    ReceivingClub  = 94,
    Null      = 126,
    Offline   = 127
};

// Bits of the per-session "flags" property.
namespace SessionFlag {
inline constexpr std::int64_t Bookmark         = 1;
inline constexpr std::int64_t Suspended        = 2;
inline constexpr std::int64_t TruePrivate      = 4;
inline constexpr std::int64_t GuestsMuted      = 8;
inline constexpr std::int64_t BasicsMuted      = 16;
inline constexpr std::int64_t OfficialSoftware = 32;
} // namespace SessionFlag

namespace UserLevel {
inline constexpr std::int64_t Guest   = 0;
inline constexpr std::int64_t Basic   = 1;
inline constexpr std::int64_t Premium = 2;
inline constexpr std::int64_t Model   = 4;
inline constexpr std::int64_t Admin   = 5;
} // namespace UserLevel

[[nodiscard]] constexpr auto toInteger(VideoState state) -> std::int64_t {
    return static_cast<std::int64_t>(state);
}

[[nodiscard]] inline auto videoStateToString(VideoState state) -> std::string_view {
    switch (state) {
    case VideoState::FreeChat:
        return "free_chat";
    case VideoState::Reset:
        return "reset";
    case VideoState::Away:
        return "away";
    case VideoState::Confirming:
        return "confirming";
    case VideoState::Private:
        return "private";
    case VideoState::GroupShow:
        return "group_show";
    case VideoState::Club:
        return "club";
    case VideoState::KillModel:
        return "kill_model";
    case VideoState::CamToCamOn:
        return "c2c_on";
    case VideoState::CamToCamOff:
        return "c2c_off";
    case VideoState::Online:
        return "online";
    case VideoState::ReceivingPrivate:
        return "rx_private";
    case VideoState::Voyeur:
        return "voyeur";
    case VideoState::ReceivingGroup:
        return "rx_group";
    case VideoState::ReceivingClub:
        return "rx_club";
    case VideoState::Null:
        return "null";
    case VideoState::Offline:
        return "offline";
    }
    return "unknown";
}

} // namespace MS
