#include <gtest/gtest.h>
#include "stagedpipe/common/context_shape.hpp"
#include "stagedpipe/common/step_id.hpp"
#include "stagedpipe/model/behavior.hpp"
#include <unordered_set>

using namespace stagedpipe;

namespace
{

struct NamedContext : IBehaviorContext
{
    static const char* shape_name()
    {
        return "Named";
    }
};

struct AnonymousContext : IBehaviorContext
{
};

} // namespace

// =============================================================================
// ContextShape Tests
// =============================================================================

TEST(ContextShapeTests, Of_IsStablePerType)
{
    const auto& a = ContextShape::of<NamedContext>();
    const auto& b = ContextShape::of<NamedContext>();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a, b);
}

TEST(ContextShapeTests, Of_DistinctTypesHaveDistinctShapes)
{
    EXPECT_NE(ContextShape::of<NamedContext>(), ContextShape::of<AnonymousContext>());
    EXPECT_NE(ContextShape::of<NamedContext>().id(), ContextShape::of<AnonymousContext>().id());
}

TEST(ContextShapeTests, Name_UsesDeclaredShapeName)
{
    EXPECT_EQ(ContextShape::of<NamedContext>().name(), "Named");
    EXPECT_FALSE(ContextShape::of<AnonymousContext>().name().empty());
}

TEST(ContextShapeTests, TerminatingContext_IsFlagged)
{
    const auto& shape = ContextShape::of<TerminatingContext<NamedContext>>();
    EXPECT_TRUE(shape.is_terminating());
    EXPECT_EQ(shape.name(), "terminating(Named)");
    EXPECT_FALSE(ContextShape::of<NamedContext>().is_terminating());
}

TEST(ContextShapeTests, Hash_UsableInUnorderedSet)
{
    std::unordered_set<ContextShape> shapes;
    shapes.insert(ContextShape::of<NamedContext>());
    shapes.insert(ContextShape::of<NamedContext>());
    shapes.insert(ContextShape::of<AnonymousContext>());
    EXPECT_EQ(shapes.size(), 2u);
}

// =============================================================================
// Step Id Tests
// =============================================================================

TEST(StepIdTests, IEquals_IgnoresCase)
{
    EXPECT_TRUE(iequals("Audit", "aUDIT"));
    EXPECT_FALSE(iequals("Audit", "Audits"));
}

TEST(StepIdTests, IdMap_LooksUpCaseInsensitively)
{
    IdMap<int> map;
    map.emplace("Authenticate", 1);
    EXPECT_EQ(map.count("AUTHENTICATE"), 1u);
    EXPECT_FALSE(map.emplace("authenticate", 2).second);
}

TEST(StepIdTests, QuoteIds_FormatsList)
{
    EXPECT_EQ(quote_ids({"a", "b"}), "'a', 'b'");
    EXPECT_EQ(quote_ids({}), "");
}
