#include "laneflow/export/StylePalette.h"
#include "laneflow/core/Errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace laneflow {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const ColorSpec CLASSIC_BLUE = {"#dae8fc", "#6c8ebf", "#333333"};

std::map<std::string, ColorSpec> classicColors() {
    return {
        {"blue", CLASSIC_BLUE},
        {"green", {"#d5e8d4", "#82b366", "#333333"}},
        {"orange", {"#ffe6cc", "#d79b00", "#333333"}},
        {"red", {"#f8cecc", "#b85450", "#333333"}},
        {"purple", {"#e1d5e7", "#9673a6", "#333333"}},
        {"gray", {"#f5f5f5", "#666666", "#333333"}},
        {"white", {"#ffffff", "#666666", "#333333"}},
    };
}

std::map<std::string, ColorSpec> darkModernColors() {
    return {
        {"blue", {"#1e3a5f", "#4a9eff", "#e6edf3"}},
        {"green", {"#1f3d2b", "#3fb950", "#e6edf3"}},
        {"orange", {"#3d2c14", "#f0883e", "#e6edf3"}},
        {"red", {"#3d1d20", "#f85149", "#e6edf3"}},
        {"purple", {"#2d2545", "#a371f7", "#e6edf3"}},
        {"gray", {"#262c36", "#8b949e", "#e6edf3"}},
        {"white", {"#30363d", "#c9d1d9", "#e6edf3"}},
    };
}

}  // namespace

StylePalette::StylePalette()
    : StylePalette(classic()) {}

StylePalette::StylePalette(std::string name, std::string description,
                           std::string background, bool shadow,
                           std::map<std::string, ColorSpec> colors,
                           StyleDefaults defaults)
    : name_(std::move(name)),
      description_(std::move(description)),
      background_(std::move(background)),
      shadow_(shadow),
      defaults_(std::move(defaults)) {
    for (auto& [colorName, spec] : colors) {
        colors_[toLower(colorName)] = std::move(spec);
    }
    // "blue" is the fallback of every lookup
    colors_.emplace("blue", CLASSIC_BLUE);
}

StylePalette StylePalette::classic() {
    return StylePalette("Classic", "Light pastel swimlanes on a white canvas",
                        "#ffffff", false, classicColors(), StyleDefaults{});
}

StylePalette StylePalette::darkModern() {
    StyleDefaults defaults;
    defaults.nodeFontStyle = 1;
    defaults.nodeShadow = true;
    defaults.arcSize = 12;
    defaults.edgeColor = "#8b949e";
    defaults.edgeLabelColor = "#e6edf3";
    defaults.edgeLabelBackground = "#0d1117";
    return StylePalette("Dark Modern", "High-contrast accents on a dark canvas",
                        "#0d1117", true, darkModernColors(), defaults);
}

StylePalette StylePalette::preset(const std::string& name) {
    const std::string key = toLower(name);
    if (key == "classic") return classic();
    if (key == "dark-modern") return darkModern();

    std::string available;
    for (const auto& preset : presetNames()) {
        if (!available.empty()) available += ", ";
        available += preset;
    }
    throw std::invalid_argument("Style '" + name + "' not found. Available: " + available);
}

std::vector<std::string> StylePalette::presetNames() {
    return {"classic", "dark-modern"};
}

StylePalette StylePalette::fromJson(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DiagramParseError(std::string("Malformed style JSON: ") + e.what());
    }
    if (!document.is_object()) {
        throw DiagramParseError("Style document must be a JSON object");
    }

    try {
        const StylePalette base = classic();
        StyleDefaults defaults = base.defaults();

        const json canvas = document.value("canvas", json::object());
        std::string background = canvas.value("background", base.background());
        bool shadow = canvas.value("shadow", base.shadow());

        std::map<std::string, ColorSpec> colors;
        if (document.contains("palette")) {
            for (const auto& [colorName, entry] : document.at("palette").items()) {
                colors[colorName] = ColorSpec{entry.at("fill").get<std::string>(),
                                              entry.at("stroke").get<std::string>(),
                                              entry.value("font", std::string("#333333"))};
            }
        } else {
            colors = classicColors();
        }

        const json d = document.value("defaults", json::object());
        defaults.nodeFontSize = d.value("node_font_size", defaults.nodeFontSize);
        defaults.groupFontSize = d.value("group_font_size", defaults.groupFontSize);
        defaults.nodeFontStyle = d.value("node_font_style", defaults.nodeFontStyle);
        defaults.nodeStrokeWidth = d.value("node_stroke_width", defaults.nodeStrokeWidth);
        defaults.nodeShadow = d.value("node_shadow", defaults.nodeShadow);
        defaults.rounded = d.value("rounded", defaults.rounded);
        defaults.arcSize = d.value("arc_size", defaults.arcSize);
        defaults.edgeColor = d.value("edge_color", defaults.edgeColor);
        defaults.edgeWidth = d.value("edge_width", defaults.edgeWidth);
        defaults.edgeLabelColor = d.value("edge_label_color", defaults.edgeLabelColor);
        defaults.edgeLabelBackground = d.value("edge_label_bg", defaults.edgeLabelBackground);

        return StylePalette(document.value("name", std::string("Custom")),
                            document.value("description", std::string()),
                            std::move(background), shadow, std::move(colors), std::move(defaults));
    } catch (const json::exception& e) {
        throw DiagramParseError(std::string("Invalid style field: ") + e.what());
    }
}

StylePalette StylePalette::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw DiagramParseError("Cannot open style file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

const ColorSpec& StylePalette::color(const std::string& name) const {
    auto it = colors_.find(toLower(name));
    if (it == colors_.end()) {
        return colors_.at("blue");
    }
    return it->second;
}

bool StylePalette::hasColor(const std::string& name) const {
    return colors_.count(toLower(name)) > 0;
}

std::vector<std::string> StylePalette::colorNames() const {
    std::vector<std::string> names;
    names.reserve(colors_.size());
    for (const auto& [colorName, spec] : colors_) {
        names.push_back(colorName);
    }
    return names;
}

bool StylePalette::hasCustomBackground() const {
    return toLower(background_) != "#ffffff";
}

}  // namespace laneflow
