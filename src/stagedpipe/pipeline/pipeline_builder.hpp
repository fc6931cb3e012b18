/**
 * @file pipeline_builder.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/settings.hpp"
#include "stagedpipe/execution/chain_compiler.hpp"
#include "stagedpipe/execution/compiled_pipeline.hpp"
#include "stagedpipe/model/builder.hpp"
#include "stagedpipe/model/step_descriptor.hpp"
#include "stagedpipe/pipeline/registration_coordinator.hpp"

namespace stagedpipe
{

/**
 * @brief Entry point for configuring and compiling a pipeline.
 *
 * @details
 * `PipelineBuilder` collects registrations, then `build<TRoot>()` runs the
 * whole configuration flow:
 * 1. Registrations are resolved against the settings (RegistrationCoordinator).
 * 2. The live steps are ordered across stages (PipelineModelBuilder).
 * 3. Behaviors are created and composed (ChainCompiler).
 *
 * Every failure is a PipelineConfigError raised before any pipeline exists.
 * `build()` may be called more than once; each call produces an independent
 * pipeline with fresh behavior instances (subject to the builder's
 * registrations).
 *
 * @par Usage
 * @code
 * PipelineBuilder builder(settings, behavior_builder);
 * builder.register_step<Authenticate>("Authenticate");
 * builder.register_step<Audit>("Audit")->insert_after("Authenticate");
 * auto pipeline = builder.build<RequestContext>();
 * pipeline->execute(context, token);
 * @endcode
 *
 * @par Ownership
 * - Holds references to `settings` and `builder`; both must outlive it.
 * - Compiled pipelines do not refer back to the PipelineBuilder.
 */
class PipelineBuilder
{
public:
    PipelineBuilder(const IReadOnlySettings& settings, IBuilder& builder)
        : m_settings(settings)
        , m_builder(builder)
    {
    }

    StepDescriptorPtr register_step(std::string id,
                                    const BehaviorType& type,
                                    std::string description = {},
                                    BehaviorFactory factory = {})
    {
        return m_coordinator.register_step(std::move(id), type, std::move(description),
                                           std::move(factory));
    }

    template <typename TBehavior>
    StepDescriptorPtr register_step(std::string id,
                                    std::string description = {},
                                    BehaviorFactory factory = {})
    {
        return m_coordinator.register_step<TBehavior>(std::move(id), std::move(description),
                                                      std::move(factory));
    }

    void register_step(StepDescriptorPtr descriptor)
    {
        m_coordinator.register_step(std::move(descriptor));
    }

    void remove_step(std::string id)
    {
        m_coordinator.remove_step(std::move(id));
    }

    void replace_step(ReplaceStep replacement)
    {
        m_coordinator.replace_step(std::move(replacement));
    }

    /**
     * @brief Get the ordered step list for a root shape without compiling.
     */
    std::vector<StepDescriptorPtr> build_model(const ContextShape& root_shape) const
    {
        return m_coordinator.build_pipeline_model(root_shape, m_settings);
    }

    /**
     * @brief Resolve, order and compile the pipeline for root context `TRoot`.
     */
    template <typename TRoot>
    CompiledPipelinePtr<TRoot> build() const
    {
        ChainCompiler compiler(m_builder);
        return compiler.compile<TRoot>(build_model(ContextShape::of<TRoot>()));
    }

    const RegistrationCoordinator& coordinator() const noexcept
    {
        return m_coordinator;
    }

private:
    const IReadOnlySettings& m_settings;
    IBuilder& m_builder;
    RegistrationCoordinator m_coordinator;
};

} // namespace stagedpipe
