#include <gtest/gtest.h>
#include "stagedpipe/common/cancellation.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/common/settings.hpp"
#include "stagedpipe/execution/chain_compiler.hpp"
#include "stagedpipe/pipeline/pipeline_builder.hpp"
#include "test_behaviors.hpp"
#include <atomic>
#include <thread>

using namespace stagedpipe;
using namespace stagedpipe_test;

namespace
{

/**
 * @brief Counts invocations across threads.
 */
class CountingBehavior : public Behavior<TestContext>
{
public:
    void invoke(TestContext& context, const std::function<void()>& next, const CancellationToken&) override
    {
        m_count.fetch_add(1, std::memory_order_relaxed);
        context.trace.push_back("Counting");
        next();
    }

    int count() const
    {
        return m_count.load();
    }

private:
    std::atomic<int> m_count{0};
};

/**
 * @brief Cancels the given source, then continues.
 */
class CancelMidway : public Behavior<TestContext>
{
public:
    explicit CancelMidway(CancellationSource& source)
        : m_source(source)
    {
    }

    void invoke(TestContext& context, const std::function<void()>& next, const CancellationToken&) override
    {
        context.trace.push_back("CancelMidway");
        m_source.cancel();
        next();
    }

private:
    CancellationSource& m_source;
};

/**
 * @brief Hands the next step a token linked to the ambient one.
 */
class DeriveToken : public IBehaviorOf<TestContext, TestContext>
{
public:
    void invoke(TestContext& context, const Next& next, const CancellationToken& token) override
    {
        context.trace.push_back("DeriveToken");
        auto linked = CancellationSource::create_linked(token);
        linked.cancel();
        next(context, linked.token());
    }
};

/**
 * @brief Records what reached it through the previous step's `next`.
 */
class RecordArrival : public IBehaviorOf<TestContext, TestContext>
{
public:
    void invoke(TestContext& context, const Next& next, const CancellationToken& token) override
    {
        arrived_context = &context;
        arrived_cancelled = token.is_cancellation_requested();
        next(context, token);
    }

    TestContext* arrived_context{nullptr};
    bool arrived_cancelled{false};
};

class Failing : public Behavior<TestContext>
{
public:
    void invoke(TestContext& context, const std::function<void()>&, const CancellationToken&) override
    {
        context.trace.push_back("Failing");
        throw std::runtime_error("behavior failed");
    }
};

} // namespace

// =============================================================================
// Compilation
// =============================================================================

class ChainCompilerTests : public ::testing::Test
{
protected:
    Settings settings;
    DefaultBuilder behavior_builder;
    PipelineBuilder builder{settings, behavior_builder};
};

TEST_F(ChainCompilerTests, Build_EmptyPipelineIsNoOp)
{
    auto pipeline = builder.build<TestContext>();
    EXPECT_TRUE(pipeline->empty());

    TestContext context;
    EXPECT_NO_THROW(pipeline->execute(context));
    EXPECT_TRUE(context.trace.empty());
}

TEST_F(ChainCompilerTests, Build_ExposesResolvedOrder)
{
    builder.register_step<Step<1>>("S1");
    builder.register_step<Step<2>>("S2")->insert_after("S1");
    builder.register_step<Step<3>>("S3")->insert_before("S1");

    auto pipeline = builder.build<TestContext>();
    EXPECT_EQ(pipeline->size(), 3u);
    EXPECT_EQ(pipeline->step_ids(), (std::vector<std::string>{"S3", "S1", "S2"}));
    EXPECT_NE(std::dynamic_pointer_cast<Step<3>>(pipeline->behaviors()[0]), nullptr);
}

TEST_F(ChainCompilerTests, Build_ReplacementProducesNewBehavior)
{
    builder.register_step<Step<1>>("X");
    builder.replace_step(ReplaceStep::with<Step<2>>("X"));

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    pipeline->execute(context);
    EXPECT_EQ(context.trace, std::vector<std::string>{"Step2"});
}

TEST_F(ChainCompilerTests, Build_StepFactoryIsUsed)
{
    builder.register_step<Tagged>("T", "", [](IBuilder&) { return std::make_shared<Tagged>("factory"); });

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    pipeline->execute(context);
    EXPECT_EQ(context.trace, std::vector<std::string>{"Tagged:factory"});
}

TEST_F(ChainCompilerTests, Build_BuilderRegistrationIsUsed)
{
    behavior_builder.register_factory<Tagged>([](IBuilder&) { return std::make_shared<Tagged>("builder"); });
    builder.register_step<Tagged>("T");

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    pipeline->execute(context);
    EXPECT_EQ(context.trace, std::vector<std::string>{"Tagged:builder"});
}

TEST_F(ChainCompilerTests, Build_NotBuildableThrows)
{
    builder.register_step<Tagged>("T");
    try
    {
        builder.build<TestContext>();
        FAIL() << "Expected PipelineConfigError";
    }
    catch (const PipelineConfigError& e)
    {
        EXPECT_EQ(e.code(), PipelineConfigErrorCode::BehaviorNotBuildable);
    }
}

TEST_F(ChainCompilerTests, Compose_RootShapeMismatchThrows)
{
    std::vector<ResolvedStep> steps{{"N1", std::make_shared<NextStep<1>>()}};
    try
    {
        ChainCompiler::compose(ContextShape::of<TestContext>(), steps);
        FAIL() << "Expected PipelineConfigError";
    }
    catch (const PipelineConfigError& e)
    {
        EXPECT_EQ(e.code(), PipelineConfigErrorCode::ShapeMismatch);
    }
}

TEST_F(ChainCompilerTests, Compose_AdjacentShapeMismatchThrows)
{
    std::vector<ResolvedStep> steps{{"A", std::make_shared<Step<1>>()},
                                    {"N1", std::make_shared<NextStep<1>>()}};
    try
    {
        ChainCompiler::compose(ContextShape::of<TestContext>(), steps);
        FAIL() << "Expected PipelineConfigError";
    }
    catch (const PipelineConfigError& e)
    {
        EXPECT_EQ(e.code(), PipelineConfigErrorCode::ShapeMismatch);
        EXPECT_EQ(e.involved_step_ids(), (std::vector<std::string>{"A", "N1"}));
    }
}

TEST_F(ChainCompilerTests, Compose_TerminatorNotLastThrows)
{
    std::vector<ResolvedStep> steps{{"Finish", std::make_shared<FinishTest>()},
                                    {"A", std::make_shared<Step<1>>()}};
    EXPECT_THROW(ChainCompiler::compose(ContextShape::of<TestContext>(), steps), PipelineConfigError);
}

TEST_F(ChainCompilerTests, Compose_DefaultChainEntryIsCallable)
{
    CompiledChain chain;
    TestContext context;
    EXPECT_NO_THROW(chain.entry(context, CancellationToken::none()));
    EXPECT_TRUE(context.trace.empty());
}

TEST_F(ChainCompilerTests, CompiledPipeline_OnlyCompilerConstructs)
{
    static_assert(!std::is_constructible_v<CompiledPipeline<TestContext>, CompiledChain>,
                  "CompiledPipeline must be created through ChainCompiler");

    auto pipeline = ChainCompiler::compile_behaviors<TestContext>({std::make_shared<Step<1>>()});
    auto context = std::make_shared<TestContext>();
    pipeline->execute_async(context).get();
    EXPECT_EQ(context->trace, std::vector<std::string>{"Step1"});
}

// =============================================================================
// Execution
// =============================================================================

class ExecutionTests : public ChainCompilerTests
{
};

TEST_F(ExecutionTests, Execute_RunsEachStepOnceInOrder)
{
    builder.register_step<Step<1>>("S1");
    builder.register_step<Step<2>>("S2");
    builder.register_step<Step<3>>("S3");

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    pipeline->execute(context);
    EXPECT_EQ(context.trace, (std::vector<std::string>{"Step1", "Step2", "Step3"}));
}

TEST_F(ExecutionTests, Execute_AcrossStagesToTerminator)
{
    builder.register_step<Step<1>>("A");
    builder.register_step<ToNext>("Connect");
    builder.register_step<NextStep<1>>("N1");
    builder.register_step<FinishNext>("Finish");

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    pipeline->execute(context);
    EXPECT_EQ(context.trace, (std::vector<std::string>{"Step1", "ToNext", "NextStep1", "FinishNext"}));
}

TEST_F(ExecutionTests, Execute_ShortCircuitSkipsRest)
{
    builder.register_step<Step<1>>("A");
    builder.register_step<ShortCircuit>("Stop");
    builder.register_step<Step<2>>("B");
    builder.register_step<FinishTest>("Finish");

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    pipeline->execute(context);
    EXPECT_EQ(context.trace, (std::vector<std::string>{"Step1", "ShortCircuit"}));
}

TEST_F(ExecutionTests, Execute_BehaviorFailurePropagatesUnchanged)
{
    builder.register_step<Failing>("Fail");
    builder.register_step<Step<1>>("A");

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    EXPECT_THROW(pipeline->execute(context), std::runtime_error);
    EXPECT_EQ(context.trace, std::vector<std::string>{"Failing"});
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(ExecutionTests, Execute_PreRequestedTokenStopsAtCheck)
{
    builder.register_step<Step<1>>("A");
    builder.register_step<CheckCancellation>("Check");
    builder.register_step<Step<2>>("B");

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    EXPECT_THROW(pipeline->execute(context, CancellationToken::cancelled()), OperationCancelled);
    EXPECT_EQ(context.trace, (std::vector<std::string>{"Step1", "CheckCancellation"}));
}

TEST_F(ExecutionTests, Execute_UnrequestedTokenRunsFullChain)
{
    builder.register_step<CheckCancellation>("Check");
    builder.register_step<Step<1>>("A");

    CancellationSource source;
    auto pipeline = builder.build<TestContext>();
    TestContext context;
    pipeline->execute(context, source.token());
    EXPECT_EQ(context.trace, (std::vector<std::string>{"CheckCancellation", "Step1"}));
}

TEST_F(ExecutionTests, Execute_ReusableAfterCancellation)
{
    auto pipeline = ChainCompiler::compile_behaviors<TestContext>(
        {std::make_shared<Step<1>>(), std::make_shared<CheckCancellation>()});

    for (int i = 0; i < 2; ++i)
    {
        TestContext cancelled;
        EXPECT_THROW(pipeline->execute(cancelled, CancellationToken::cancelled()), OperationCancelled);
    }

    TestContext context;
    pipeline->execute(context, CancellationToken::none());
    EXPECT_EQ(context.trace, (std::vector<std::string>{"Step1", "CheckCancellation"}));
}

TEST_F(ExecutionTests, Execute_CancellationDuringRunIsObserved)
{
    CancellationSource source;
    builder.register_step<CancelMidway>("Cancel", "", [&source](IBuilder&) {
        return std::make_shared<CancelMidway>(source);
    });
    builder.register_step<CheckCancellation>("Check");
    builder.register_step<Step<1>>("A");

    auto pipeline = builder.build<TestContext>();
    TestContext context;
    EXPECT_THROW(pipeline->execute(context, source.token()), OperationCancelled);
    EXPECT_EQ(context.trace, (std::vector<std::string>{"CancelMidway", "CheckCancellation"}));
}

TEST_F(ExecutionTests, Execute_DerivedTokenReachesLaterSteps)
{
    auto pipeline = ChainCompiler::compile_behaviors<TestContext>(
        {std::make_shared<DeriveToken>(), std::make_shared<CheckCancellation>(), std::make_shared<Step<1>>()});

    TestContext context;
    EXPECT_THROW(pipeline->execute(context), OperationCancelled);
    EXPECT_EQ(context.trace, (std::vector<std::string>{"DeriveToken", "CheckCancellation"}));
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(ExecutionTests, Execute_ConcurrentCallsAreIndependent)
{
    auto counting = std::make_shared<CountingBehavior>();
    auto pipeline = ChainCompiler::compile_behaviors<TestContext>({counting, std::make_shared<Step<1>>()});

    constexpr int kThreads = 8;
    constexpr int kCallsPerThread = 100;
    std::atomic<int> well_formed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&]() {
            for (int i = 0; i < kCallsPerThread; ++i)
            {
                TestContext context;
                pipeline->execute(context);
                if (context.trace == std::vector<std::string>{"Counting", "Step1"})
                {
                    well_formed.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(counting->count(), kThreads * kCallsPerThread);
    EXPECT_EQ(well_formed.load(), kThreads * kCallsPerThread);
}

TEST_F(ExecutionTests, Execute_SimplifiedNextForwardsContextAndToken)
{
    static_assert(std::is_trivially_copyable_v<detail::ForwardBoundNext<TestContext>>,
                  "ForwardBoundNext must be storable in place");
    static_assert(sizeof(detail::ForwardBoundNext<TestContext>) == sizeof(void*),
                  "ForwardBoundNext must hold a single pointer");

    auto record = std::make_shared<RecordArrival>();
    auto pipeline = ChainCompiler::compile_behaviors<TestContext>(
        {std::make_shared<Step<1>>(), record, std::make_shared<Step<2>>()});

    TestContext context;
    pipeline->execute(context);
    EXPECT_EQ(record->arrived_context, &context);
    EXPECT_FALSE(record->arrived_cancelled);
    EXPECT_EQ(context.trace, (std::vector<std::string>{"Step1", "Step2"}));

    CancellationSource source;
    source.cancel();
    TestContext second;
    pipeline->execute(second, source.token());
    EXPECT_EQ(record->arrived_context, &second);
    EXPECT_TRUE(record->arrived_cancelled);
}

TEST_F(ExecutionTests, ExecuteAsync_CompletesAndRethrows)
{
    builder.register_step<CheckCancellation>("Check");
    builder.register_step<Step<1>>("A");
    auto pipeline = builder.build<TestContext>();

    auto context = std::make_shared<TestContext>();
    pipeline->execute_async(context).get();
    EXPECT_EQ(context->trace, (std::vector<std::string>{"CheckCancellation", "Step1"}));

    auto cancelled = std::make_shared<TestContext>();
    auto future = pipeline->execute_async(cancelled, CancellationToken::cancelled());
    EXPECT_THROW(future.get(), OperationCancelled);
}

TEST_F(ExecutionTests, ExecuteAsync_NullContextThrows)
{
    auto pipeline = builder.build<TestContext>();
    EXPECT_THROW(pipeline->execute_async(nullptr), std::invalid_argument);
}
