#ifndef MAGTORQ_SERIALIZATION_LAYOUT_JSON_HPP
#define MAGTORQ_SERIALIZATION_LAYOUT_JSON_HPP

#include <nlohmann/json.hpp>
#include <geometry/layer_geometry.hpp>
#include "config_json.hpp"

namespace magtorq {

NLOHMANN_JSON_SERIALIZE_ENUM(WindingDirection, {
    {WindingDirection::Clockwise, "clockwise"},
    {WindingDirection::CounterClockwise, "counter_clockwise"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TransitionKind, {
    {TransitionKind::Inner, "inner"},
    {TransitionKind::Outer, "outer"},
    {TransitionKind::Feed, "feed"},
})

// Transition serialization
inline void to_json(nlohmann::json& j, const Transition& t) {
    j = {
        {"from_layer", t.from_layer},
        {"to_layer", t.to_layer},
        {"kind", t.kind},
        {"position", t.position},
        {"drill", t.drill},
        {"pad_diameter", t.pad_diameter}
    };
}

inline void from_json(const nlohmann::json& j, Transition& t) {
    t.from_layer = j.at("from_layer").get<int>();
    t.to_layer = j.at("to_layer").get<int>();
    t.kind = j.at("kind").get<TransitionKind>();
    t.position = j.at("position").get<Vec2>();
    t.drill = j.value("drill", 0.0);
    t.pad_diameter = j.value("pad_diameter", 0.0);
}

// LayerGeometry serialization
inline void to_json(nlohmann::json& j, const LayerGeometry& layer) {
    j = {
        {"index", layer.index},
        {"direction", layer.direction},
        {"turns", layer.turns},
        {"outer_lead", layer.outer_lead},
        {"inner_lead", layer.inner_lead},
        {"entry", layer.entry},
        {"exit", layer.exit}
    };
}

inline void from_json(const nlohmann::json& j, LayerGeometry& layer) {
    layer.index = j.at("index").get<int>();
    layer.direction = j.at("direction").get<WindingDirection>();
    layer.turns = j.at("turns").get<std::vector<std::vector<Vec2>>>();
    layer.outer_lead = j.at("outer_lead").get<std::vector<Vec2>>();
    layer.inner_lead = j.at("inner_lead").get<std::vector<Vec2>>();
    layer.entry = j.at("entry").get<Vec2>();
    layer.exit = j.at("exit").get<Vec2>();
}

// CoilLayout serialization
inline nlohmann::json coil_layout_to_json(const CoilLayout& layout) {
    nlohmann::json j;
    j["trace_width"] = layout.trace_width();
    j["terminal_layer"] = layout.terminal_layer();
    j["layers"] = layout.layers();
    j["transitions"] = layout.transitions();
    return j;
}

// CoilLayout deserialization
inline CoilLayout coil_layout_from_json(const nlohmann::json& j) {
    auto layers = j.at("layers").get<std::vector<LayerGeometry>>();
    auto transitions = j.at("transitions").get<std::vector<Transition>>();
    return CoilLayout(std::move(layers), std::move(transitions),
                      j.at("terminal_layer").get<int>(),
                      j.at("trace_width").get<double>());
}

}  // namespace magtorq

#endif // MAGTORQ_SERIALIZATION_LAYOUT_JSON_HPP
