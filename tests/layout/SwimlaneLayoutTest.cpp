#include <gtest/gtest.h>
#include <laneflow/common/Logger.h>
#include <laneflow/core/Errors.h>
#include <laneflow/layout/SwimlaneLayout.h>
#include <laneflow/layout/util/LayoutSerializer.h>

#include <string>
#include <thread>
#include <vector>

#include "TestDiagrams.h"

using namespace laneflow;
using laneflow::test::DiagramBuilder;

namespace {

DiagramDescriptor orderFlow(Direction direction = Direction::TopDown) {
    return DiagramBuilder(direction)
        .group("customer").group("shop").group("warehouse")
        .node("start", "customer", "event")
        .node("pay", "customer", "task")
        .node("check", "shop", "gateway")
        .node("reserve", "shop", "task")
        .node("confirm", "shop", "task")
        .node("pick", "warehouse")
        .node("ship", "warehouse", "task")
        .node("done", "warehouse", "event")
        .node("audit")
        .edge("start", "pay")
        .edge("pay", "check")
        .edge("check", "reserve", "yes")
        .edge("check", "pay", "retry", LineStyle::Dashed)
        .edge("reserve", "confirm")
        .edge("check", "confirm", "back-order", LineStyle::Dashed)
        .edge("confirm", "pick")
        .edge("pick", "ship")
        .edge("ship", "done")
        .edge("done", "audit")
        .edge("audit", "start")
        .build();
}

}  // namespace

TEST(SwimlaneLayoutTest, RunsAllPasses) {
    SwimlaneLayout layout;
    Graph graph = layout.layout(orderFlow());

    EXPECT_EQ(graph.stage(), LayoutStage::Routed);
    EXPECT_EQ(graph.edge(3).route.routeCase, RouteCase::BackwardCross);
    EXPECT_EQ(graph.edge(5).route.routeCase, RouteCase::IntraSkip);
    EXPECT_EQ(graph.edge(9).route.routeCase, RouteCase::ForwardCross);
    EXPECT_EQ(graph.edge(10).route.routeCase, RouteCase::BackwardCross);
}

TEST(SwimlaneLayoutTest, IsDeterministic) {
    SwimlaneLayout layout;
    Graph first = layout.layout(orderFlow());
    Graph second = layout.layout(orderFlow());

    for (NodeIndex i = 0; i < first.nodeCount(); ++i) {
        EXPECT_EQ(first.node(i).bounds(), second.node(i).bounds());
    }
    for (EdgeIndex i = 0; i < first.edgeCount(); ++i) {
        EXPECT_EQ(first.edge(i).route.waypoints, second.edge(i).route.waypoints);
    }
    EXPECT_EQ(first.canvasSize(), second.canvasSize());
}

TEST(SwimlaneLayoutTest, RelayoutStartsFromScratch) {
    SwimlaneLayout layout;
    Graph graph = layout.layout(orderFlow());
    const Rect before = graph.node("confirm").bounds();

    EXPECT_NO_THROW(layout.layout(graph));
    EXPECT_EQ(graph.node("confirm").bounds(), before);
}

TEST(SwimlaneLayoutTest, EverythingFitsOnCanvas) {
    for (Direction direction : {Direction::TopDown, Direction::LeftRight}) {
        Graph graph = SwimlaneLayout().layout(orderFlow(direction));
        const Rect canvas(Point(), graph.canvasSize());

        for (const auto& group : graph.groups()) {
            EXPECT_TRUE(canvas.contains(group.bounds())) << group.id;
            for (NodeIndex member : group.members) {
                EXPECT_TRUE(group.bounds().contains(graph.node(member).bounds()));
            }
        }
        for (const auto& node : graph.nodes()) {
            EXPECT_TRUE(canvas.contains(node.bounds())) << node.id;
        }
        for (const auto& edge : graph.edges()) {
            for (const Point& wp : edge.route.waypoints) {
                EXPECT_TRUE(canvas.contains(wp));
            }
        }
    }
}

TEST(SwimlaneLayoutTest, GroupsDoNotOverlap) {
    Graph graph = SwimlaneLayout().layout(orderFlow());
    for (size_t i = 0; i < graph.groupCount(); ++i) {
        for (size_t j = i + 1; j < graph.groupCount(); ++j) {
            EXPECT_FALSE(graph.group(static_cast<GroupIndex>(i)).bounds().intersects(
                graph.group(static_cast<GroupIndex>(j)).bounds()));
        }
    }
}

TEST(SwimlaneLayoutTest, EmptyDiagram) {
    Graph graph = SwimlaneLayout().layout(DiagramBuilder().build());
    EXPECT_EQ(graph.stage(), LayoutStage::Routed);
    EXPECT_EQ(graph.canvasSize(), Size(1200.0f, 800.0f));
}

TEST(SwimlaneLayoutTest, InvalidOptionsRejected) {
    LayoutOptions options;
    options.nodeGap = -1.0f;
    EXPECT_THROW(SwimlaneLayout{options}, std::invalid_argument);

    SwimlaneLayout layout;
    options = LayoutOptions{};
    options.backwardEdgeClearance = 0.0f;
    EXPECT_THROW(layout.setOptions(options), std::invalid_argument);
    EXPECT_FLOAT_EQ(layout.options().backwardEdgeClearance, 40.0f);
}

TEST(SwimlaneLayoutTest, CustomOptionsApply) {
    LayoutOptions options;
    options.groupGap = 100.0f;
    SwimlaneLayout layout(options);

    Graph graph = layout.layout(DiagramBuilder().group("g1").group("g2").build());
    EXPECT_FLOAT_EQ(graph.group(1).position.x, 420.0f);
}

TEST(SwimlaneLayoutTest, StructuralErrorsPropagate) {
    EXPECT_THROW(SwimlaneLayout().layout(DiagramBuilder().node("a").edge("a", "zzz").build()),
                 UnknownNodeReferenceError);
}

TEST(SwimlaneLayoutTest, ConcurrentLayoutsMatchSequentialResult) {
    const DiagramDescriptor diagram = orderFlow();
    const std::string expected = LayoutSerializer::toJson(SwimlaneLayout().layout(diagram));

    // Start without a backend so the threads race to create the default one
    Logger::setBackend(nullptr);

    constexpr int threadCount = 8;
    constexpr int runsPerThread = 20;
    std::vector<std::vector<std::string>> results(threadCount);
    std::vector<std::thread> workers;
    for (int t = 0; t < threadCount; ++t) {
        workers.emplace_back([&diagram, &results, t] {
            for (int run = 0; run < runsPerThread; ++run) {
                results[t].push_back(LayoutSerializer::toJson(SwimlaneLayout().layout(diagram)));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& perThread : results) {
        ASSERT_EQ(perThread.size(), static_cast<size_t>(runsPerThread));
        for (const auto& json : perThread) {
            EXPECT_EQ(json, expected);
        }
    }
}
