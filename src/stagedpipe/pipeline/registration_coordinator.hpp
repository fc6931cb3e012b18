/**
 * @file registration_coordinator.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/settings.hpp"
#include "stagedpipe/model/step_descriptor.hpp"

namespace stagedpipe
{

/**
 * @brief Collects step registrations and resolves them into the live step set.
 *
 * @details
 * Registration only records additions, removals and replacements. Nothing is
 * validated and nothing is instantiated until `resolve_registrations()` runs
 * the passes in order:
 * 1. Uniqueness of addition ids (case-insensitive).
 * 2. Replacements, each against an existing addition.
 * 3. Removals (deduplicated), each against an existing addition that no other
 *    live step references.
 * 4. Enablement: steps whose predicate rejects the settings are dropped.
 *
 * Resolution does not change the recorded registrations, so it can run again
 * with different settings. Replacements are applied to the shared descriptors.
 *
 * @par Thread safety
 * - No internal synchronization; configuration is single-threaded.
 */
class RegistrationCoordinator
{
public:
    RegistrationCoordinator() = default;

    /**
     * @brief Register a step for a behavior type.
     * @return The new descriptor, for adding ordering constraints.
     */
    StepDescriptorPtr register_step(std::string id,
                                    const BehaviorType& type,
                                    std::string description = {},
                                    BehaviorFactory factory = {});

    template <typename TBehavior>
    StepDescriptorPtr register_step(std::string id,
                                    std::string description = {},
                                    BehaviorFactory factory = {})
    {
        return register_step(std::move(id), BehaviorType::of<TBehavior>(), std::move(description),
                             std::move(factory));
    }

    /**
     * @brief Register a pre-built descriptor.
     */
    void register_step(StepDescriptorPtr descriptor);

    void remove_step(std::string id);

    void replace_step(ReplaceStep replacement);

    const PipelineModifications& modifications() const noexcept
    {
        return m_modifications;
    }

    /**
     * @brief Validate the registrations and produce the live steps.
     * @return Live steps in registration order.
     * @throws PipelineConfigError with `DuplicateStepId`, `UnknownReplaceTarget`,
     *         `IncompatibleReplacement`, `UnknownRemoveTarget` or
     *         `RemovalHasDependents`.
     */
    std::vector<StepDescriptorPtr> resolve_registrations(const IReadOnlySettings& settings) const;

    /**
     * @brief Resolve the registrations and order them into stages.
     * @param root_shape The shape of the context `execute()` will be given.
     * @return The global step order, root stage first.
     */
    std::vector<StepDescriptorPtr> build_pipeline_model(const ContextShape& root_shape,
                                                        const IReadOnlySettings& settings) const;

    template <typename TRoot>
    std::vector<StepDescriptorPtr> build_pipeline_model_for(const IReadOnlySettings& settings) const
    {
        return build_pipeline_model(ContextShape::of<TRoot>(), settings);
    }

private:
    PipelineModifications m_modifications;
};

} // namespace stagedpipe
