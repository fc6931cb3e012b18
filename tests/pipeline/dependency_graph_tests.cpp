#include <gtest/gtest.h>
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/pipeline/dependency_graph.hpp"
#include "test_behaviors.hpp"

using namespace stagedpipe;
using namespace stagedpipe_test;

// =============================================================================
// DependencyGraph Tests
// =============================================================================

class DependencyGraphTests : public ::testing::Test
{
protected:
    DependencyGraph graph{"TestContext"};

    StepDescriptorPtr add(const std::string& id)
    {
        auto step = StepDescriptor::create<Step<1>>(id);
        graph.add_step(step);
        return step;
    }
};

TEST_F(DependencyGraphTests, Sort_NoConstraintsKeepsRegistrationOrder)
{
    add("A");
    add("B");
    add("C");
    EXPECT_EQ(ids_of(graph.sort()), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(DependencyGraphTests, Sort_BeforeAndAfter)
{
    add("A");
    add("B")->insert_after("A");
    add("C")->insert_before("A");
    EXPECT_EQ(ids_of(graph.sort()), (std::vector<std::string>{"C", "A", "B"}));
}

TEST_F(DependencyGraphTests, Sort_IdsMatchCaseInsensitively)
{
    add("First");
    add("Second")->insert_before("FIRST");
    EXPECT_EQ(ids_of(graph.sort()), (std::vector<std::string>{"Second", "First"}));
}

TEST_F(DependencyGraphTests, Sort_ChainPulledForward)
{
    add("D")->insert_after("C");
    add("C")->insert_after("B");
    add("B")->insert_after("A");
    add("A");
    EXPECT_EQ(ids_of(graph.sort()), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST_F(DependencyGraphTests, Sort_EachStepEmittedOnce)
{
    add("A");
    add("B")->insert_after("A");
    auto c = add("C");
    c->insert_after("A");
    c->insert_after("B");
    EXPECT_EQ(ids_of(graph.sort()), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(DependencyGraphTests, LinkDependencies_BuildsPreviousLists)
{
    add("A");
    add("B")->insert_after("A");
    add("C")->insert_before("A");
    graph.link_dependencies();

    EXPECT_EQ(graph.previous(0), (std::vector<StepIdx>{2}));
    EXPECT_EQ(graph.previous(1), (std::vector<StepIdx>{0}));
    EXPECT_TRUE(graph.previous(2).empty());
}

TEST_F(DependencyGraphTests, Sort_UnenforcedMissingIsIgnored)
{
    add("A")->insert_after_if_exists("Missing");
    add("B")->insert_before_if_exists("Missing");
    EXPECT_EQ(ids_of(graph.sort()), (std::vector<std::string>{"A", "B"}));
}

TEST_F(DependencyGraphTests, Sort_EnforcedMissingThrows)
{
    add("A");
    add("B")->insert_after("Missing");
    try
    {
        graph.sort();
        FAIL() << "Expected PipelineConfigError";
    }
    catch (const PipelineConfigError& e)
    {
        EXPECT_EQ(e.code(), PipelineConfigErrorCode::UnresolvedDependency);
        EXPECT_NE(std::string{e.what()}.find("'Missing'"), std::string::npos);
        EXPECT_NE(std::string{e.what()}.find("'A', 'B'"), std::string::npos);
        EXPECT_EQ(e.involved_step_ids(), (std::vector<std::string>{"B", "Missing"}));
    }
}

TEST_F(DependencyGraphTests, Sort_CycleThrows)
{
    add("A")->insert_after("C");
    add("B")->insert_after("A");
    add("C")->insert_after("B");
    try
    {
        graph.sort();
        FAIL() << "Expected PipelineConfigError";
    }
    catch (const PipelineConfigError& e)
    {
        EXPECT_EQ(e.code(), PipelineConfigErrorCode::CycleDetected);
        EXPECT_EQ(e.involved_step_ids().size(), 3u);
    }
}

TEST_F(DependencyGraphTests, Sort_SelfReferenceIsCycle)
{
    add("A")->insert_before("A");
    try
    {
        graph.sort();
        FAIL() << "Expected PipelineConfigError";
    }
    catch (const PipelineConfigError& e)
    {
        EXPECT_EQ(e.code(), PipelineConfigErrorCode::CycleDetected);
        EXPECT_EQ(e.involved_step_ids(), (std::vector<std::string>{"A"}));
    }
}

TEST_F(DependencyGraphTests, AddStep_DuplicateThrows)
{
    add("A");
    try
    {
        add("a");
        FAIL() << "Expected PipelineConfigError";
    }
    catch (const PipelineConfigError& e)
    {
        EXPECT_EQ(e.code(), PipelineConfigErrorCode::DuplicateStepId);
    }
}
