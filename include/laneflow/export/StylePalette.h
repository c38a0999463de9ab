#pragma once

#include <map>
#include <string>
#include <vector>

namespace laneflow {

/// Fill, stroke and font color of one named palette entry
struct ColorSpec {
    std::string fill;
    std::string stroke;
    std::string font = "#333333";

    bool operator==(const ColorSpec& o) const = default;
};

/// Rendering defaults shared by every cell of a style
struct StyleDefaults {
    int nodeFontSize = 12;
    int groupFontSize = 14;
    int nodeFontStyle = 0;            ///< draw.io fontStyle bit mask, 0 = plain
    int nodeStrokeWidth = 1;
    bool nodeShadow = false;
    bool rounded = true;
    int arcSize = 0;                  ///< 0 = format default
    std::string edgeColor = "#666666";
    int edgeWidth = 2;
    std::string edgeLabelColor;       ///< Empty = format default
    std::string edgeLabelBackground;  ///< Empty = format default
};

/// Immutable style: named colors plus canvas and cell defaults.
///
/// Passed by const reference into exporters. Two presets are built in
/// ("classic" and "dark-modern"); others are loaded from JSON style files:
/// @code{.json}
/// {
///   "name": "Ocean", "description": "...",
///   "canvas": {"background": "#ffffff", "shadow": false},
///   "palette": {"blue": {"fill": "#dae8fc", "stroke": "#6c8ebf", "font": "#333333"}},
///   "defaults": {"node_font_size": 12, "edge_color": "#666666", "edge_width": 2}
/// }
/// @endcode
class StylePalette {
public:
    /// The classic preset
    StylePalette();

    StylePalette(std::string name, std::string description,
                 std::string background, bool shadow,
                 std::map<std::string, ColorSpec> colors,
                 StyleDefaults defaults);

    static StylePalette classic();
    static StylePalette darkModern();

    /// Built-in preset by name
    /// @throws std::invalid_argument naming the available presets
    static StylePalette preset(const std::string& name);
    static std::vector<std::string> presetNames();

    /// Parse a style document. Missing sections keep the classic values.
    /// @throws DiagramParseError on malformed JSON or wrong value types
    static StylePalette fromJson(const std::string& text);

    /// @throws DiagramParseError if the file cannot be read or parsed
    static StylePalette loadFile(const std::string& path);

    /// Colors for a name, case-insensitive. Unknown names use "blue".
    const ColorSpec& color(const std::string& name) const;
    bool hasColor(const std::string& name) const;
    std::vector<std::string> colorNames() const;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::string& background() const { return background_; }
    bool shadow() const { return shadow_; }
    const StyleDefaults& defaults() const { return defaults_; }

    /// True when the canvas is not plain white and needs a backdrop
    bool hasCustomBackground() const;

private:
    std::string name_;
    std::string description_;
    std::string background_;
    bool shadow_ = false;
    std::map<std::string, ColorSpec> colors_;
    StyleDefaults defaults_;
};

}  // namespace laneflow
