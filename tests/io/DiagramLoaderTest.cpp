#include <gtest/gtest.h>
#include <laneflow/core/Errors.h>
#include <laneflow/core/Graph.h>
#include <laneflow/io/DiagramLoader.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace laneflow;
using json = nlohmann::json;

namespace {

bool hasError(const std::vector<std::string>& errors, const std::string& text) {
    return std::any_of(errors.begin(), errors.end(),
                       [&](const std::string& e) { return e.find(text) != std::string::npos; });
}

const char* VALID_DIAGRAM = R"json({
    "title": "Review",
    "style": "dark-modern",
    "direction": "LR",
    "groups": [
        {"id": "author", "label": "Author", "color": "purple"},
        {"id": "reviewer"}
    ],
    "nodes": [
        {"id": "draft", "label": "Write draft", "group": "author", "shape": "task", "marker": "user"},
        {"id": "review", "group": "reviewer", "shape": "gateway", "gateway_type": "parallel"},
        {"id": "done", "label": "Published", "shape": "event", "outline": "end", "color": "green"}
    ],
    "connections": [
        {"from": "draft", "to": "review"},
        {"from": "review", "to": "draft", "label": "changes", "style": "dashed"},
        {"from": "review", "to": "done"}
    ]
})json";

}  // namespace

TEST(DiagramLoaderTest, ParsesCompleteDocument) {
    DiagramDescriptor diagram = DiagramLoader::parse(std::string(VALID_DIAGRAM));

    EXPECT_EQ(diagram.title, "Review");
    EXPECT_EQ(diagram.style, "dark-modern");
    EXPECT_EQ(diagram.direction, Direction::LeftRight);

    ASSERT_EQ(diagram.groups.size(), 2u);
    EXPECT_EQ(diagram.groups[0].label, "Author");
    EXPECT_EQ(diagram.groups[0].color, "purple");
    EXPECT_EQ(diagram.groups[1].label, "reviewer");
    EXPECT_EQ(diagram.groups[1].color, "blue");

    ASSERT_EQ(diagram.nodes.size(), 3u);
    EXPECT_EQ(diagram.nodes[0].group, std::optional<std::string>("author"));
    EXPECT_EQ(diagram.nodes[0].shape.shape, "task");
    EXPECT_EQ(diagram.nodes[0].shape.marker, std::optional<std::string>("user"));
    EXPECT_EQ(diagram.nodes[1].label, "review");
    EXPECT_EQ(diagram.nodes[1].shape.gatewayType, std::optional<std::string>("parallel"));
    EXPECT_FALSE(diagram.nodes[2].group.has_value());
    EXPECT_EQ(diagram.nodes[2].color, std::optional<std::string>("green"));

    ASSERT_EQ(diagram.connections.size(), 3u);
    EXPECT_EQ(diagram.connections[1].label, "changes");
    EXPECT_EQ(diagram.connections[1].style, LineStyle::Dashed);
    EXPECT_EQ(diagram.connections[2].style, LineStyle::Solid);
}

TEST(DiagramLoaderTest, DefaultsForMinimalDocument) {
    DiagramDescriptor diagram = DiagramLoader::parse(std::string(R"({"nodes": [{"id": "a"}]})"));
    EXPECT_EQ(diagram.title, "Diagram");
    EXPECT_TRUE(diagram.style.empty());
    EXPECT_EQ(diagram.direction, Direction::TopDown);
    EXPECT_EQ(diagram.nodes[0].label, "a");
    EXPECT_EQ(diagram.nodes[0].shape.shape, "rectangle");
}

TEST(DiagramLoaderTest, ParsesFromStream) {
    std::istringstream in(VALID_DIAGRAM);
    DiagramDescriptor diagram = DiagramLoader::parse(in);
    EXPECT_EQ(diagram.nodes.size(), 3u);
}

TEST(DiagramLoaderTest, MalformedJson) {
    try {
        DiagramLoader::parse(std::string("{\"nodes\": ["));
        FAIL() << "expected DiagramParseError";
    } catch (const DiagramParseError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Malformed JSON:", 0), 0u);
    }
}

TEST(DiagramLoaderTest, RequiresObjectWithNodesOrGroups) {
    EXPECT_EQ(DiagramLoader::validate(json::array()),
              std::vector<std::string>{"Input must be a JSON object"});
    EXPECT_TRUE(hasError(DiagramLoader::validate(json::object()), "Input must have 'nodes' or 'groups'"));
    EXPECT_TRUE(DiagramLoader::validate(json{{"groups", json::array()}}).empty());
}

TEST(DiagramLoaderTest, ReportsNodeErrors) {
    json doc = json::parse(R"({
        "nodes": [
            {"label": "no id"},
            {"id": 7},
            {"id": "a", "shape": "star"},
            {"id": "a"},
            {"id": "t", "shape": "task", "marker": "robot"},
            {"id": "e", "shape": "event", "symbol": "bell", "outline": "dotted"},
            {"id": "g", "shape": "gateway", "gateway_type": "complex"},
            "not an object"
        ]
    })");

    const auto errors = DiagramLoader::validate(doc);
    EXPECT_TRUE(hasError(errors, "Node 0 missing 'id'"));
    EXPECT_TRUE(hasError(errors, "Node 1 'id' must be a string"));
    EXPECT_TRUE(hasError(errors, "Node 'a' has unknown shape: 'star'"));
    EXPECT_TRUE(hasError(errors, "Duplicate node id: a"));
    EXPECT_TRUE(hasError(errors, "Node 't' has unknown task marker: 'robot'"));
    EXPECT_TRUE(hasError(errors, "Node 'e' has unknown event symbol: 'bell'"));
    EXPECT_TRUE(hasError(errors, "Node 'e' has unknown event outline: 'dotted'"));
    EXPECT_TRUE(hasError(errors, "Node 'g' has unknown gateway type: 'complex'"));
    EXPECT_TRUE(hasError(errors, "Node 7 must be an object"));
}

TEST(DiagramLoaderTest, ReportsGroupAndReferenceErrors) {
    json doc = json::parse(R"({
        "direction": "RL",
        "groups": [{"id": "g"}, {"id": "g"}, {"label": "anonymous"}],
        "nodes": [{"id": "a", "group": "missing"}],
        "connections": [
            {"from": "a"},
            {"from": "a", "to": "ghost"},
            {"from": "a", "to": "a", "style": "dotted"}
        ]
    })");

    const auto errors = DiagramLoader::validate(doc);
    EXPECT_TRUE(hasError(errors, "Unknown direction: 'RL'"));
    EXPECT_TRUE(hasError(errors, "Duplicate group id: g"));
    EXPECT_TRUE(hasError(errors, "Group 2 missing 'id'"));
    EXPECT_TRUE(hasError(errors, "Node 'a' references unknown group: 'missing'"));
    EXPECT_TRUE(hasError(errors, "Connection 0 missing 'to'"));
    EXPECT_TRUE(hasError(errors, "Connection 1 'to' references unknown id: ghost"));
    EXPECT_TRUE(hasError(errors, "Connection 2 has unknown style: 'dotted'"));
}

TEST(DiagramLoaderTest, FromJsonListsEveryError) {
    json doc = json::parse(R"({"nodes": [{"id": "a", "shape": "star"}], "connections": [{"from": "a", "to": "b"}]})");
    try {
        DiagramLoader::fromJson(doc);
        FAIL() << "expected DiagramParseError";
    } catch (const DiagramParseError& e) {
        const std::string message = e.what();
        EXPECT_EQ(message.rfind("Invalid diagram (2 errors):", 0), 0u);
        EXPECT_NE(message.find("\n  - Node 'a' has unknown shape: 'star'"), std::string::npos);
        EXPECT_NE(message.find("\n  - Connection 0 'to' references unknown id: b"), std::string::npos);
    }
}

TEST(DiagramLoaderTest, ForeignShapeAttributeRejectedByGraph) {
    DiagramDescriptor diagram = DiagramLoader::parse(
        std::string(R"({"nodes": [{"id": "a", "shape": "rectangle", "marker": "user"}]})"));
    EXPECT_THROW(Graph::fromDescriptor(diagram), InvalidShapeAttributeError);
}

TEST(DiagramLoaderTest, SelfLoopPassesValidationButNotGraph) {
    DiagramDescriptor diagram = DiagramLoader::parse(
        std::string(R"({"nodes": [{"id": "a"}], "connections": [{"from": "a", "to": "a"}]})"));
    EXPECT_THROW(Graph::fromDescriptor(diagram), UnsupportedSelfLoopError);
}

TEST(DiagramLoaderTest, ParseDirection) {
    EXPECT_EQ(DiagramLoader::parseDirection("TD"), Direction::TopDown);
    EXPECT_EQ(DiagramLoader::parseDirection("LR"), Direction::LeftRight);
    EXPECT_THROW(DiagramLoader::parseDirection("td"), DiagramParseError);
}

TEST(DiagramLoaderTest, LoadFile) {
    const auto path = std::filesystem::temp_directory_path() / "laneflow_loader_test.json";
    {
        std::ofstream out(path);
        out << VALID_DIAGRAM;
    }
    DiagramDescriptor diagram = DiagramLoader::loadFile(path.string());
    EXPECT_EQ(diagram.title, "Review");
    std::filesystem::remove(path);

    EXPECT_THROW(DiagramLoader::loadFile("/nonexistent-dir/diagram.json"), DiagramParseError);
}
