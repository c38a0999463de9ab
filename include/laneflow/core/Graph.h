#pragma once

#include "Descriptors.h"
#include "Shapes.h"
#include "Types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace laneflow {

/// Routing case of a connection, decided by the Edge Router
enum class RouteCase {
    Intra,          ///< Adjacent nodes in the same group (or both loose)
    ForwardCross,   ///< Target group comes after the source group
    BackwardCross,  ///< Target group comes before the source group
    IntraSkip,      ///< Same group, with siblings stacked in between
    SelfLoop        ///< Source == target; never routed
};

const char* toString(RouteCase routeCase);

/// Computed route of a connection.
///
/// Waypoints are absolute canvas coordinates. Use Graph::toContainerLocal()
/// to express them relative to the route's container.
struct EdgeRoute {
    RouteCase routeCase = RouteCase::Intra;
    GroupIndex container = INVALID_GROUP;      ///< INVALID_GROUP = canvas root
    AnchorSide sourceSide = AnchorSide::Bottom;
    AnchorSide targetSide = AnchorSide::Top;
    std::vector<Point> waypoints;
    bool pinned = false;                       ///< Anchors must be enforced by the exporter

    bool hasGroupContainer() const { return container != INVALID_GROUP; }
};

struct NodeData {
    NodeIndex index = INVALID_NODE;
    std::string id;
    std::string label;
    std::optional<std::string> color;
    ShapeAttributes shape;
    GroupIndex group = INVALID_GROUP;
    uint32_t stackIndex = 0;        ///< Position within its group (or among loose nodes)

    // Node Sizer
    Size size;
    bool bottomLabel = false;       ///< Caption renders below the body

    // Group Layout / Canvas Layout
    Point localPosition;            ///< Relative to the owning group's origin (absolute if loose)
    Point position;                 ///< Absolute canvas position (top-left)

    bool isGrouped() const { return group != INVALID_GROUP; }
    Rect bounds() const { return {position, size}; }
    Rect localBounds() const { return {localPosition, size}; }
    Point center() const { return bounds().center(); }
};

struct GroupData {
    GroupIndex index = INVALID_GROUP;
    std::string id;
    std::string label;
    std::string color;
    std::vector<NodeIndex> members;  ///< Stacking order

    Size size;
    Point position;                  ///< Absolute canvas position (top-left)

    bool empty() const { return members.empty(); }
    Rect bounds() const { return {position, size}; }
};

struct EdgeData {
    EdgeIndex index = INVALID_EDGE;
    NodeIndex source = INVALID_NODE;
    NodeIndex target = INVALID_NODE;
    std::string label;
    LineStyle style = LineStyle::Solid;

    EdgeRoute route;                 ///< Valid once the graph reached LayoutStage::Routed
};

/// Progress of the layout pipeline. Each pass requires its predecessor's
/// stage and resets any later stage.
enum class LayoutStage {
    Built,
    Sized,
    Grouped,
    Placed,
    Routed
};

const char* toString(LayoutStage stage);

/// Diagram graph: groups, nodes and connections in input order.
///
/// Entities live in dense arrays indexed by NodeIndex/GroupIndex/EdgeIndex;
/// string ids resolve through hash maps built while the graph is populated.
/// Groups must be added before the nodes that reference them.
class Graph {
public:
    explicit Graph(Direction direction = Direction::TopDown);

    /// Build a graph from validated descriptors, preserving input order.
    /// @throws StructuralInputError (or a subclass) on the first rejected entry
    static Graph fromDescriptor(const DiagramDescriptor& descriptor);

    // Construction
    GroupIndex addGroup(const GroupDescriptor& group);
    NodeIndex addNode(const NodeDescriptor& node);
    EdgeIndex addEdge(const ConnectionDescriptor& connection);

    Direction direction() const { return direction_; }
    const std::string& title() const { return title_; }
    void setTitle(const std::string& title) { title_ = title; }

    // Lookup by id
    bool hasNode(const std::string& id) const { return nodeIds_.count(id) > 0; }
    bool hasGroup(const std::string& id) const { return groupIds_.count(id) > 0; }
    std::optional<NodeIndex> findNode(const std::string& id) const;
    std::optional<GroupIndex> findGroup(const std::string& id) const;

    /// @throws UnknownNodeReferenceError if no node has this id
    NodeIndex nodeIndex(const std::string& id) const;
    /// @throws UnknownNodeReferenceError if no group has this id
    GroupIndex groupIndex(const std::string& id) const;

    // Access by index. Throws std::out_of_range on an invalid index.
    const NodeData& node(NodeIndex index) const { return nodes_.at(index); }
    NodeData& node(NodeIndex index) { return nodes_.at(index); }
    const NodeData& node(const std::string& id) const { return nodes_[nodeIndex(id)]; }

    const GroupData& group(GroupIndex index) const { return groups_.at(index); }
    GroupData& group(GroupIndex index) { return groups_.at(index); }
    const GroupData& group(const std::string& id) const { return groups_[groupIndex(id)]; }

    const EdgeData& edge(EdgeIndex index) const { return edges_.at(index); }
    EdgeData& edge(EdgeIndex index) { return edges_.at(index); }

    const std::vector<NodeData>& nodes() const { return nodes_; }
    std::vector<NodeData>& nodes() { return nodes_; }
    const std::vector<GroupData>& groups() const { return groups_; }
    std::vector<GroupData>& groups() { return groups_; }
    const std::vector<EdgeData>& edges() const { return edges_; }
    std::vector<EdgeData>& edges() { return edges_; }

    size_t nodeCount() const { return nodes_.size(); }
    size_t groupCount() const { return groups_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    bool hasGroups() const { return !groups_.empty(); }

    /// Nodes without a group, in input order
    const std::vector<NodeIndex>& looseNodes() const { return looseNodes_; }

    // Canvas (Canvas Layout / Edge Router)
    Size canvasSize() const { return canvasSize_; }
    void setCanvasSize(Size size) { canvasSize_ = size; }

    /// Grow the canvas so that @p point lies at least @p margin inside it
    void growCanvasToContain(const Point& point, float margin);

    /// Title band of every swimlane, as laid out by Group Layout
    float groupHeaderSize() const { return groupHeaderSize_; }
    void setGroupHeaderSize(float size) { groupHeaderSize_ = size; }

    /// Bounding box of all loose nodes (empty when there are none)
    Rect looseBounds() const { return looseBounds_; }
    void setLooseBounds(const Rect& bounds) { looseBounds_ = bounds; }

    /// Union of every group and node rectangle
    Rect contentBounds() const;

    /// Absolute rectangle of a container: a group, or the whole canvas
    Rect containerBounds(GroupIndex container) const;

    /// Convert an absolute canvas point into the container's local frame
    Point toContainerLocal(const Point& absolute, GroupIndex container) const;

    // Pipeline stage tracking
    LayoutStage stage() const { return stage_; }

    /// Throw LayoutInvariantViolation unless the graph reached @p required
    void requireStage(LayoutStage required, const char* pass) const;

    /// Record completion of a pass. Later stages are implicitly discarded.
    void setStage(LayoutStage stage) { stage_ = stage; }

private:
    Direction direction_;
    std::string title_ = "Diagram";

    std::vector<GroupData> groups_;
    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
    std::vector<NodeIndex> looseNodes_;

    std::unordered_map<std::string, NodeIndex> nodeIds_;
    std::unordered_map<std::string, GroupIndex> groupIds_;

    Size canvasSize_;
    Rect looseBounds_;
    float groupHeaderSize_ = 30.0f;
    LayoutStage stage_ = LayoutStage::Built;
};

}  // namespace laneflow
