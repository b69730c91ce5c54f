/*
* @license
* (C) zachbabanov
*
*/

#include <events.hpp>

#include <cmath>

#include <fmt/core.h>

using json = nlohmann::json;

namespace hplayer::events {

    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    std::optional<PlayerEvent> parse_event(const json &msg) {
        if (!msg.is_object()) return std::nullopt;
        auto it = msg.find("event");
        if (it == msg.end() || !it->is_string()) return std::nullopt;
        const std::string ev = it->get<std::string>();

        if (ev == "end-file") {
            std::string reason = "eof";
            auto r = msg.find("reason");
            if (r != msg.end() && r->is_string()) reason = r->get<std::string>();
            return PlayerEvent{EndOfFile{reason}};
        }
        if (ev != "property-change") return std::nullopt;

        auto name_it = msg.find("name");
        auto data_it = msg.find("data");
        if (name_it == msg.end() || !name_it->is_string()) return std::nullopt;
        // the player sends property-change without data while a property is unavailable
        if (data_it == msg.end() || data_it->is_null()) return std::nullopt;

        const std::string name = name_it->get<std::string>();
        const json &data = *data_it;

        if (name == "time-pos" && data.is_number()) {
            double v = data.get<double>();
            if (!std::isfinite(v)) return std::nullopt;
            return PlayerEvent{PositionChanged{v < 0.0 ? 0.0 : v}};
        }
        if (name == "duration" && data.is_number()) {
            double v = data.get<double>();
            if (!std::isfinite(v) || v < 0.0) return std::nullopt;
            return PlayerEvent{DurationChanged{v}};
        }
        if (name == "pause" && data.is_boolean()) {
            return PlayerEvent{PauseChanged{data.get<bool>()}};
        }
        if (name == "volume" && data.is_number()) {
            return PlayerEvent{VolumeChanged{(int)std::lround(data.get<double>())}};
        }
        if (name == "eof-reached" && data.is_boolean()) {
            if (data.get<bool>()) return PlayerEvent{EndOfFile{"eof"}};
            return std::nullopt;
        }
        return std::nullopt;
    }

    std::string describe(const PlayerEvent &ev) {
        return std::visit(overloaded{
            [](const PositionChanged &e) { return fmt::format("position={:.2f}", e.seconds); },
            [](const DurationChanged &e) { return fmt::format("duration={:.2f}", e.seconds); },
            [](const PauseChanged &e) { return fmt::format("pause={}", e.paused); },
            [](const VolumeChanged &e) { return fmt::format("volume={}", e.level); },
            [](const EndOfFile &e) { return fmt::format("end-of-file reason={}", e.reason); },
            [](const ChannelLost &) { return std::string("channel-lost"); },
        }, ev);
    }

} // namespace hplayer::events
