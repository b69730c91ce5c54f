/*
* @license
* (C) zachbabanov
*
*/

#ifndef HPLAYER_EVENTS_HPP
#define HPLAYER_EVENTS_HPP

#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace hplayer::events {

    // Properties the controller asks the player to push; the id is echoed in
    // every property-change notification.
    constexpr int OBSERVE_TIME_POS = 1;
    constexpr int OBSERVE_PAUSE = 2;
    constexpr int OBSERVE_DURATION = 3;
    constexpr int OBSERVE_VOLUME = 4;
    constexpr int OBSERVE_EOF = 5;

    struct PositionChanged { double seconds; };
    struct DurationChanged { double seconds; };
    struct PauseChanged { bool paused; };
    struct VolumeChanged { int level; };
    struct EndOfFile { std::string reason; };
    struct ChannelLost {};

    using PlayerEvent = std::variant<PositionChanged, DurationChanged, PauseChanged,
                                     VolumeChanged, EndOfFile, ChannelLost>;

    /**
     * @brief Translate one asynchronous player notification into a typed event.
     *
     * Handles "property-change" for time-pos, duration, pause, volume and
     * eof-reached, and "end-file". Anything else (including property changes
     * carrying no data) yields std::nullopt.
     */
    std::optional<PlayerEvent> parse_event(const nlohmann::json &msg);

    std::string describe(const PlayerEvent &ev);

} // namespace hplayer::events

#endif // HPLAYER_EVENTS_HPP
