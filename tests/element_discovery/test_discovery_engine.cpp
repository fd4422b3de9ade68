#include <gtest/gtest.h>
#include <element_discovery/discovery_engine.hpp>
#include <screen_loaders/sample_screen.hpp>
#include "../support/elements.hpp"
#include <string>
#include <vector>

using namespace element_discovery;
using screen_hierarchy::HierarchyAnalysisResult;
using screen_hierarchy::HierarchyOptions;
using screen_hierarchy::analyze_hierarchy;
using screen_model::UIElement;
using test_support::clickable;
using test_support::element;
using test_support::with_text;

namespace {

std::vector<std::string> ids(const std::vector<DiscoveredElement>& group) {
    std::vector<std::string> out;
    for (const auto& d : group) out.push_back(d.element->id);
    return out;
}

class SampleScreenDiscovery : public ::testing::Test {
protected:
    void SetUp() override {
        hierarchy_ = analyze_hierarchy(screen_loaders::generate_sample_screen());
    }

    HierarchyAnalysisResult hierarchy_;
};

// Chain c0 > c1 > ... > c{n-1}, each inset by 50px.
std::vector<UIElement> chain(int n) {
    std::vector<UIElement> out;
    for (int i = 0; i < n; ++i)
        out.push_back(element("c" + std::to_string(i), i * 50, i * 50, 1000 - i * 50, 1000 - i * 50));
    return out;
}

} // namespace

TEST_F(SampleScreenDiscovery, IconIsPromotedToItsTab) {
    const auto r = discover(hierarchy_, "tab_phone_icon");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_TRUE(r.promoted);
    EXPECT_EQ(r.requested_target, "tab_phone_icon");
    EXPECT_EQ(r.effective_target, "tab_phone");
    ASSERT_TRUE(r.self.has_value());
    EXPECT_EQ(r.self->element->id, "tab_phone");
    EXPECT_EQ(r.self->relationship, Relationship::Self);
    EXPECT_NE(r.self->reason.find("tab_phone_icon"), std::string::npos);
}

TEST_F(SampleScreenDiscovery, ParentsByDistance) {
    const auto r = discover(hierarchy_, "tab_phone");
    ASSERT_EQ(ids(r.parents), (std::vector<std::string>{"bottom_nav", "screen"}));
    EXPECT_EQ(r.parents[0].relationship, Relationship::DirectParent);
    EXPECT_EQ(r.parents[1].relationship, Relationship::Grandparent);
    EXPECT_DOUBLE_EQ(r.parents[0].confidence, 0.7);
    EXPECT_DOUBLE_EQ(r.parents[1].confidence, 0.35);
    EXPECT_EQ(r.parents[1].depth, 2);
}

TEST_F(SampleScreenDiscovery, HiddenTextLabelLeadsTheChildren) {
    const auto r = discover(hierarchy_, "tab_contacts");
    ASSERT_EQ(ids(r.children),
        (std::vector<std::string>{"tab_contacts_label", "tab_contacts_icon", "tab_contacts_container"}));
    const auto& label = r.children.front();
    EXPECT_EQ(label.relationship, Relationship::Grandchild);
    EXPECT_DOUBLE_EQ(label.confidence, 1.0);
    EXPECT_TRUE(label.has_text);
    EXPECT_EQ(label.depth, 2);
    EXPECT_EQ(label.path, "tab_contacts > tab_contacts_container > tab_contacts_label");
    EXPECT_NE(label.reason.find("联系人"), std::string::npos);
}

TEST_F(SampleScreenDiscovery, SiblingsAndRecommended) {
    const auto r = discover(hierarchy_, "tab_contacts");
    EXPECT_EQ(ids(r.siblings), (std::vector<std::string>{"tab_phone", "tab_favorites"}));
    for (const auto& s : r.siblings) {
        EXPECT_EQ(s.relationship, Relationship::Sibling);
        EXPECT_FALSE(s.depth.has_value());
    }
    // Neither parent is clickable or has text; only the label qualifies.
    EXPECT_EQ(ids(r.recommended), (std::vector<std::string>{"tab_contacts_label"}));
}

TEST_F(SampleScreenDiscovery, PromotionCanBeDisabled) {
    DiscoveryOptions options;
    options.promote_to_clickable = false;
    const auto r = discover(hierarchy_, "tab_phone_icon", options);
    EXPECT_FALSE(r.promoted);
    EXPECT_EQ(r.effective_target, "tab_phone_icon");
    EXPECT_EQ(ids(r.siblings), (std::vector<std::string>{"tab_phone_container"}));
    EXPECT_TRUE(r.children.empty());
}

TEST_F(SampleScreenDiscovery, NearestClickableAncestor) {
    EXPECT_EQ(find_nearest_clickable_ancestor(hierarchy_, "tab_phone")->id(), "tab_phone");
    EXPECT_EQ(find_nearest_clickable_ancestor(hierarchy_, "tab_phone_label")->id(), "tab_phone");
    EXPECT_EQ(find_nearest_clickable_ancestor(hierarchy_, "screen"), nullptr);
    EXPECT_EQ(find_nearest_clickable_ancestor(hierarchy_, "missing"), nullptr);
}

TEST_F(SampleScreenDiscovery, ClassifyRelationship) {
    auto is = [&](const char* target, const char* other, RelationKind kind, int level) {
        const auto c = classify_relationship(hierarchy_, target, other);
        return c.kind == kind && c.level == level;
    };
    EXPECT_TRUE(is("tab_phone", "tab_phone", RelationKind::Self, 0));
    EXPECT_TRUE(is("tab_phone_label", "screen", RelationKind::Ancestor, 4));
    EXPECT_TRUE(is("screen", "tab_phone_label", RelationKind::Descendant, 4));
    EXPECT_TRUE(is("tab_phone", "tab_contacts", RelationKind::Sibling, 0));
    EXPECT_TRUE(is("tab_phone_icon", "tab_contacts_icon", RelationKind::Unrelated, 0));
    EXPECT_TRUE(is("tab_phone", "missing", RelationKind::Unrelated, 0));
}

TEST_F(SampleScreenDiscovery, ConfidenceAlwaysInUnitRange) {
    for (const auto& e : hierarchy_.elements()) {
        const auto r = discover(hierarchy_, e.id);
        for (const auto* group : {&r.parents, &r.children, &r.siblings, &r.recommended}) {
            for (const auto& d : *group) {
                EXPECT_GE(d.confidence, 0.0);
                EXPECT_LE(d.confidence, 1.0);
            }
        }
    }
}

TEST(Discovery, NonClickableIconPromotedTwoLevelsUp) {
    const auto h = analyze_hierarchy({
        clickable(element("Y", 0, 0, 500, 500)),
        element("M", 10, 10, 400, 400),
        element("X", 20, 20, 100, 100),
    });
    const auto r = discover(h, "X");
    EXPECT_TRUE(r.promoted);
    EXPECT_EQ(r.effective_target, "Y");
    EXPECT_TRUE(r.parents.empty());
    EXPECT_EQ(ids(r.children), (std::vector<std::string>{"M", "X"}));
    EXPECT_TRUE(r.siblings.empty());
}

TEST(Discovery, PromotionStopsAtConfiguredDepth) {
    auto elements = chain(5);
    elements[0].clickable = true;
    const auto h = analyze_hierarchy(elements);
    EXPECT_FALSE(discover(h, "c4").promoted); // clickable ancestor is 4 levels up

    DiscoveryOptions options;
    options.promotion_depth = 4;
    EXPECT_EQ(discover(h, "c4", options).effective_target, "c0");
}

TEST(Discovery, TextfulSiblingRankedFirst) {
    UIElement s1 = clickable(element("s1", 200, 0, 300, 100));
    s1.resource_id = "app:id/a";
    UIElement s2 = element("s2", 400, 0, 500, 100);
    s2.resource_id = "app:id/b";
    const auto h = analyze_hierarchy({
        element("parent", 0, 0, 1000, 1000),
        clickable(element("target", 0, 0, 100, 100)),
        s1,
        s2,
        with_text(element("s3", 600, 0, 700, 100), "Next"),
    });
    const auto r = discover(h, "target");
    EXPECT_EQ(ids(r.siblings), (std::vector<std::string>{"s3", "s1", "s2"}));
    EXPECT_DOUBLE_EQ(r.siblings[1].confidence, 0.8);
    EXPECT_DOUBLE_EQ(r.siblings[2].confidence, 0.6);
}

TEST(Discovery, DepthLimitAndLabels) {
    const auto h = analyze_hierarchy(chain(6));
    const auto down = discover(h, "c0");
    ASSERT_EQ(ids(down.children), (std::vector<std::string>{"c1", "c2", "c3"}));
    EXPECT_EQ(down.children[2].relationship, Relationship::Descendant);
    EXPECT_EQ(down.children[2].reason.rfind("3-level descendant", 0), 0u);

    const auto up = discover(h, "c5");
    ASSERT_EQ(ids(up.parents), (std::vector<std::string>{"c4", "c3", "c2"}));
    EXPECT_EQ(up.parents[2].relationship, Relationship::Ancestor);
    EXPECT_DOUBLE_EQ(up.parents[2].confidence, 0.6 / 3);

    DiscoveryOptions shallow;
    shallow.max_depth = 1;
    EXPECT_EQ(discover(h, "c0", shallow).children.size(), 1u);
}

TEST(Discovery, ResultCaps) {
    std::vector<UIElement> elements{element("root", 0, 0, 10000, 100)};
    for (int i = 0; i < 30; ++i)
        elements.push_back(clickable(element("item" + std::to_string(i), i * 100, 0, i * 100 + 90, 90)));
    const auto h = analyze_hierarchy(elements);

    const auto from_root = discover(h, "root");
    EXPECT_EQ(from_root.children.size(), 20u);
    EXPECT_EQ(from_root.recommended.size(), 5u);
    EXPECT_EQ(discover(h, "item0").siblings.size(), 15u);

    DiscoveryOptions options;
    options.max_descendants = 3;
    options.max_recommended = 2;
    const auto capped = discover(h, "root", options);
    EXPECT_EQ(capped.children.size(), 3u);
    EXPECT_EQ(capped.recommended.size(), 2u);
}

TEST(Discovery, SyntheticRootIsNeverAParent) {
    HierarchyOptions hierarchy_options;
    hierarchy_options.synthesize_root = true;
    const auto h = analyze_hierarchy({element("a", 0, 0, 10, 10), element("b", 50, 50, 90, 90)},
        hierarchy_options);
    ASSERT_TRUE(h.has_synthetic_root());
    const auto r = discover(h, "a");
    EXPECT_TRUE(r.parents.empty());
    EXPECT_EQ(ids(r.siblings), (std::vector<std::string>{"b"}));
}

TEST(Discovery, UnknownTargetReportsError) {
    const auto h = analyze_hierarchy(chain(2));
    const auto r = discover(h, "nope");
    EXPECT_FALSE(r.ok());
    EXPECT_FALSE(r.self.has_value());
    EXPECT_TRUE(r.parents.empty());
    EXPECT_TRUE(r.children.empty());
    EXPECT_TRUE(r.siblings.empty());
    EXPECT_TRUE(r.recommended.empty());
}

TEST(Discovery, EmptyHierarchy) {
    const auto h = analyze_hierarchy({});
    const auto r = discover(h, "anything");
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(r.children.empty());
    EXPECT_EQ(find_nearest_clickable_ancestor(h, "anything"), nullptr);
}

TEST(BaseConfidence, BonusesAndClamp) {
    UIElement plain = element("p", 0, 0, 10, 10);
    EXPECT_DOUBLE_EQ(base_confidence(plain, CandidateKind::Self), 0.5);
    EXPECT_DOUBLE_EQ(base_confidence(plain, CandidateKind::Parent), 0.6);

    UIElement text = with_text(plain, "Send");
    EXPECT_DOUBLE_EQ(base_confidence(text, CandidateKind::Self), 0.8);
    EXPECT_DOUBLE_EQ(base_confidence(text, CandidateKind::Child), 1.0);

    UIElement hidden_label = with_text(element("h", 0, 0, 0, 0), "Send");
    EXPECT_DOUBLE_EQ(base_confidence(hidden_label, CandidateKind::Self), 1.0);
}

TEST(RelationshipLabel, Distances) {
    EXPECT_EQ(relationship_label(Relationship::DirectParent, 1), "direct-parent");
    EXPECT_EQ(relationship_label(Relationship::Grandchild, 2), "grandchild");
    EXPECT_EQ(relationship_label(Relationship::Ancestor, 3), "3-level ancestor");
    EXPECT_EQ(relationship_label(Relationship::Descendant, 5), "5-level descendant");
    EXPECT_EQ(to_string(Relationship::Sibling), "sibling");
}
