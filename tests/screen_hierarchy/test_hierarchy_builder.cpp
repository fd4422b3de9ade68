#include <gtest/gtest.h>
#include <screen_hierarchy/bounds.hpp>
#include <screen_hierarchy/hierarchy_builder.hpp>
#include <screen_loaders/sample_screen.hpp>
#include "../support/elements.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace screen_hierarchy;
using test_support::element;
using test_support::hidden_element;

namespace {

struct RecordingObserver : HierarchyObserver {
    std::vector<std::string> events;

    void node_attached(const UIElement& child, const UIElement& parent, Attachment how) override {
        events.push_back("attach " + child.id + " " + parent.id + " " + std::string(to_string(how)));
    }
    void semantic_parent_resolved(const UIElement& hidden, const UIElement& parent, SemanticRule rule) override {
        events.push_back("semantic " + hidden.id + " " + parent.id + " " + std::string(to_string(rule)));
    }
    void fallback_triggered(Fallback fallback, std::size_t) override {
        events.push_back("fallback " + std::string(to_string(fallback)));
    }
    void root_selected(const UIElement& root, RootSelection how) override {
        events.push_back("root " + root.id + " " + std::string(to_string(how)));
    }

    bool saw(const std::string& event) const {
        return std::find(events.begin(), events.end(), event) != events.end();
    }
};

std::string parent_id(const HierarchyAnalysisResult& r, const std::string& id) {
    const HierarchyNode* n = r.find(id);
    return n && n->parent ? n->parent->id() : "";
}

std::map<std::string, std::string> parent_map(const HierarchyAnalysisResult& r) {
    std::map<std::string, std::string> out;
    for (const auto& e : r.elements()) out[e.id] = parent_id(r, e.id);
    return out;
}

std::size_t count_roots(const HierarchyAnalysisResult& r) {
    std::size_t roots = 0;
    for (const auto& e : r.elements()) {
        if (!r.find(e.id)->parent) ++roots;
    }
    if (r.has_synthetic_root()) ++roots;
    return roots;
}

} // namespace

TEST(HierarchyBuilder, NestedRectanglesFormAChain) {
    const auto r = analyze_hierarchy({
        element("A", 0, 0, 1000, 2000),
        element("B", 50, 100, 950, 800),
        element("C", 100, 200, 300, 280),
    });
    ASSERT_FALSE(r.empty());
    EXPECT_EQ(r.root()->id(), "A");
    EXPECT_EQ(parent_id(r, "B"), "A");
    EXPECT_EQ(parent_id(r, "C"), "B");
    EXPECT_EQ(r.max_depth(), 2);
    ASSERT_EQ(r.leaf_nodes().size(), 1u);
    EXPECT_EQ(r.leaf_nodes().front()->id(), "C");
    EXPECT_EQ(r.find("C")->depth, 2);
    EXPECT_EQ(r.find("B")->attachment, Attachment::Containment);
    EXPECT_FALSE(r.relaxed_retry());
    EXPECT_FALSE(r.has_synthetic_root());
}

TEST(HierarchyBuilder, HiddenLabelAttachesSemantically) {
    UIElement label = hidden_element("T", "app:id/content", "android.widget.TextView", "联系人");
    UIElement container = element("L", 50, 1400, 450, 1480);
    container.resource_id = "app:id/container";
    container.class_name = "LinearLayout";

    RecordingObserver observer;
    const auto r = analyze_hierarchy({label, container}, {}, &observer);
    EXPECT_EQ(r.root()->id(), "L");
    EXPECT_EQ(parent_id(r, "T"), "L");
    EXPECT_EQ(r.find("T")->attachment, Attachment::Semantic);
    EXPECT_TRUE(observer.saw("semantic T L namespace-container"));
    EXPECT_TRUE(observer.saw("root L single-candidate"));
}

TEST(HierarchyBuilder, NearDuplicateRectanglesAreNotNested) {
    // 97 * 100 / (100 * 100) = 0.97, above the 0.95 cutoff.
    HierarchyOptions options;
    options.synthesize_root = true;
    const auto r = analyze_hierarchy({
        element("P", 0, 0, 100, 100),
        element("E", 0, 0, 97, 100),
    }, options);
    EXPECT_NE(parent_id(r, "E"), "P");
    EXPECT_NE(parent_id(r, "P"), "E");
    EXPECT_TRUE(r.has_synthetic_root());
    EXPECT_TRUE(r.relaxed_retry());
    EXPECT_EQ(r.root()->children.size(), 2u);
    EXPECT_EQ(count_roots(r), 1u);
}

TEST(HierarchyBuilder, EmptyInputGivesEmptyResult) {
    const auto r = analyze_hierarchy({});
    EXPECT_TRUE(r.empty());
    EXPECT_EQ(r.root(), nullptr);
    EXPECT_EQ(r.size(), 0u);
    EXPECT_TRUE(r.leaf_nodes().empty());
    EXPECT_EQ(r.find("anything"), nullptr);
}

TEST(HierarchyBuilder, SingleElementIsItsOwnRoot) {
    const auto r = analyze_hierarchy({element("only", 0, 0, 10, 10)});
    EXPECT_EQ(r.root()->id(), "only");
    EXPECT_EQ(r.max_depth(), 0);
    ASSERT_EQ(r.leaf_nodes().size(), 1u);
    EXPECT_TRUE(r.root()->is_leaf);
}

TEST(HierarchyBuilder, SmallestEnclosingRectangleIsTheParent) {
    const auto r = analyze_hierarchy({
        element("screen", 0, 0, 1080, 2340),
        element("card", 0, 500, 1080, 900),
        element("row", 0, 600, 1080, 700),
        element("button", 900, 610, 1060, 690),
    });
    EXPECT_EQ(parent_id(r, "button"), "row");
    EXPECT_EQ(parent_id(r, "row"), "card");
    EXPECT_EQ(parent_id(r, "card"), "screen");
}

TEST(HierarchyBuilder, EqualAreaCandidatesResolveInDumpOrder) {
    const auto r = analyze_hierarchy({
        element("p1", 0, 0, 100, 100),
        element("p2", 0, 0, 100, 100),
        element("c", 10, 10, 20, 20),
    });
    EXPECT_EQ(parent_id(r, "c"), "p1");
}

TEST(HierarchyBuilder, ChildrenKeepDumpOrder) {
    const auto r = analyze_hierarchy({
        element("root", 0, 0, 1000, 1000),
        element("big", 0, 500, 1000, 900),
        element("small", 0, 0, 100, 100),
        element("mid", 0, 100, 500, 400),
    });
    const auto& kids = r.root()->children;
    ASSERT_EQ(kids.size(), 3u);
    EXPECT_EQ(kids[0]->id(), "big");
    EXPECT_EQ(kids[1]->id(), "small");
    EXPECT_EQ(kids[2]->id(), "mid");
    EXPECT_EQ(kids[2]->index_in_parent, 2u);
}

TEST(HierarchyBuilder, RelaxedRetryJoinsSlightOverhang) {
    RecordingObserver observer;
    const auto r = analyze_hierarchy({
        element("A", 0, 0, 100, 100),
        element("B", 50, 50, 105, 90), // 5px past A's right edge
    }, {}, &observer);
    EXPECT_TRUE(r.relaxed_retry());
    EXPECT_EQ(r.effective_tolerance(), 8);
    EXPECT_EQ(parent_id(r, "B"), "A");
    EXPECT_FALSE(r.has_synthetic_root());
    EXPECT_TRUE(observer.saw("fallback relaxed-tolerance"));
}

TEST(HierarchyBuilder, NearDuplicateIsAdoptedByTheLargerRectangleByDefault) {
    const auto r = analyze_hierarchy({
        element("P", 0, 0, 100, 100),
        element("E", 0, 0, 97, 100),
    });
    EXPECT_FALSE(r.has_synthetic_root());
    EXPECT_EQ(r.root()->id(), "P");
    EXPECT_EQ(parent_id(r, "E"), "P");
    EXPECT_EQ(r.find("E")->attachment, Attachment::Adopted);
}

TEST(HierarchyBuilder, DisconnectedIslandsGetASyntheticRootWhenRequested) {
    HierarchyOptions options;
    options.synthesize_root = true;
    RecordingObserver observer;
    const auto r = analyze_hierarchy({
        element("left", 0, 0, 100, 100),
        element("right", 500, 0, 700, 300),
        element("inner", 10, 10, 50, 50),
    }, options, &observer);
    ASSERT_TRUE(r.has_synthetic_root());
    EXPECT_EQ(r.root()->id(), "__screen_root__");
    EXPECT_EQ(*r.root()->element->bounds, (Bounds{0, 0, 700, 300}));
    EXPECT_EQ(r.size(), 4u);
    // Largest island first.
    ASSERT_EQ(r.root()->children.size(), 2u);
    EXPECT_EQ(r.root()->children[0]->id(), "right");
    EXPECT_EQ(r.root()->children[1]->id(), "left");
    EXPECT_EQ(r.find("left")->attachment, Attachment::Adopted);
    EXPECT_EQ(parent_id(r, "inner"), "left");
    EXPECT_TRUE(observer.saw("fallback synthetic-root"));
    EXPECT_TRUE(observer.saw("root __screen_root__ synthesized"));
}

TEST(HierarchyBuilder, SyntheticRootIdAvoidsCollisions) {
    HierarchyOptions options;
    options.synthesize_root = true;
    const auto r = analyze_hierarchy({
        element("__screen_root__", 0, 0, 10, 10),
        element("other", 100, 100, 200, 200),
    }, options);
    ASSERT_TRUE(r.has_synthetic_root());
    EXPECT_NE(r.root()->id(), "__screen_root__");
    EXPECT_EQ(parent_id(r, "__screen_root__"), r.root()->id());
}

TEST(HierarchyBuilder, DisconnectedIslandsAreAdoptedByTheLargestElement) {
    RecordingObserver observer;
    const auto r = analyze_hierarchy({
        element("small", 0, 0, 10, 10),
        element("large", 20, 20, 60, 60),
    }, {}, &observer);
    EXPECT_FALSE(r.has_synthetic_root());
    EXPECT_EQ(r.root()->id(), "large");
    EXPECT_EQ(parent_id(r, "small"), "large");
    EXPECT_EQ(r.find("small")->attachment, Attachment::Adopted);
    EXPECT_TRUE(observer.saw("fallback largest-element-root"));
}

TEST(HierarchyBuilder, UnparsableAndUnmatchedHiddenElementsAreAdoptedByTheRoot) {
    UIElement broken;
    broken.id = "broken";
    const auto r = analyze_hierarchy({
        element("screen", 0, 0, 1080, 2340),
        broken,
        hidden_element("orphan", "", "android.view.View"),
    });
    EXPECT_EQ(r.root()->id(), "screen");
    EXPECT_FALSE(r.relaxed_retry());
    EXPECT_EQ(parent_id(r, "broken"), "screen");
    EXPECT_EQ(parent_id(r, "orphan"), "screen");
    EXPECT_EQ(r.find("broken")->attachment, Attachment::Adopted);
    EXPECT_EQ(r.size(), 3u);
}

TEST(HierarchyBuilder, OnlyHiddenElementsStillYieldOneRoot) {
    const auto r = analyze_hierarchy({
        hidden_element("h1", "a:id/one"),
        hidden_element("h2", "b:id/two"),
    });
    ASSERT_TRUE(r.has_synthetic_root());
    EXPECT_TRUE(is_hidden(*r.root()->element));
    EXPECT_EQ(r.root()->children.size(), 2u);
    EXPECT_EQ(count_roots(r), 1u);
}

TEST(HierarchyBuilder, ZeroAreaLineNestsButNeverParents) {
    const auto r = analyze_hierarchy({
        element("screen", 0, 0, 1080, 2340),
        element("divider", 0, 500, 1080, 500),
        element("dot", 0, 500, 0, 500),
    });
    EXPECT_EQ(parent_id(r, "divider"), "screen");
    EXPECT_EQ(parent_id(r, "dot"), "screen");
}

TEST(HierarchyBuilder, ExtremeCoordinatesStillNest) {
    constexpr int kMax = std::numeric_limits<int>::max();
    const auto r = analyze_hierarchy({
        element("wide", -2000000000, 0, kMax, 100),
        element("edge", kMax, 0, kMax, 10),
        element("band", -2000000000, 20, 2000000000, 80),
    });
    EXPECT_EQ(r.root()->id(), "wide");
    EXPECT_EQ(parent_id(r, "edge"), "wide");
    EXPECT_EQ(parent_id(r, "band"), "wide");
    EXPECT_EQ(count_roots(r), 1u);
}

TEST(HierarchyBuilder, DuplicateOrEmptyIdsAreRejected) {
    EXPECT_THROW(analyze_hierarchy({element("a", 0, 0, 1, 1), element("a", 0, 0, 2, 2)}),
        std::invalid_argument);
    EXPECT_THROW(analyze_hierarchy({element("", 0, 0, 1, 1)}), std::invalid_argument);
}

TEST(HierarchyBuilder, SampleScreenProperties) {
    const auto elements = screen_loaders::generate_sample_screen();
    const auto r = analyze_hierarchy(elements);

    // Round trip: every input element is indexed exactly once.
    EXPECT_EQ(r.size(), elements.size());
    for (const auto& e : elements) ASSERT_NE(r.find(e.id), nullptr) << e.id;

    EXPECT_EQ(count_roots(r), 1u);
    EXPECT_EQ(r.root()->id(), "screen");

    // Every containment edge is geometrically sound.
    for (const auto& e : elements) {
        const HierarchyNode* n = r.find(e.id);
        if (!n->parent || n->attachment != Attachment::Containment) continue;
        const auto& pb = *n->parent->element->bounds;
        EXPECT_TRUE(contains(pb, *e.bounds, r.effective_tolerance())) << e.id;
        EXPECT_GT(area(pb), area(*e.bounds)) << e.id;
    }

    EXPECT_EQ(parent_id(r, "tab_phone"), "bottom_nav");
    EXPECT_EQ(parent_id(r, "tab_phone_icon"), "tab_phone");
    EXPECT_EQ(parent_id(r, "tab_phone_container"), "tab_phone");
    EXPECT_EQ(parent_id(r, "tab_phone_label"), "tab_phone_container");
    EXPECT_EQ(parent_id(r, "tab_contacts_container"), "tab_contacts");
    EXPECT_EQ(parent_id(r, "tab_favorites_label"), "tab_favorites_container");
    EXPECT_EQ(r.max_depth(), 4);
}

TEST(HierarchyBuilder, IsIdempotent) {
    const auto elements = screen_loaders::generate_sample_screen();
    const auto first = analyze_hierarchy(elements);
    const auto second = analyze_hierarchy(elements);
    EXPECT_EQ(parent_map(first), parent_map(second));
    EXPECT_EQ(first.max_depth(), second.max_depth());
}

TEST(HierarchyBuilder, ResultSurvivesMove) {
    auto r = analyze_hierarchy({element("A", 0, 0, 100, 100), element("B", 10, 10, 20, 20)});
    HierarchyAnalysisResult moved = std::move(r);
    ASSERT_NE(moved.find("B"), nullptr);
    EXPECT_EQ(moved.find("B")->element->id, "B");
    EXPECT_EQ(moved.find("B")->parent, moved.root());
}

TEST(SpdlogObserver, ForwardsBuilderEvents) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("hierarchy_test", sink);
    logger->set_level(spdlog::level::debug);
    logger->set_pattern("%v");

    SpdlogHierarchyObserver observer(logger);
    analyze_hierarchy({element("A", 0, 0, 100, 100), element("B", 10, 10, 20, 20)}, {}, &observer);
    logger->flush();

    const std::string text = out.str();
    EXPECT_NE(text.find("attach B -> A (containment)"), std::string::npos) << text;
    EXPECT_NE(text.find("root A [0,0][100,100] (single-candidate)"), std::string::npos) << text;
}
