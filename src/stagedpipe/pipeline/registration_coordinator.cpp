/**
 * @file registration_coordinator.cpp
 */
#include "stagedpipe/pipeline/registration_coordinator.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/common/step_id.hpp"
#include "stagedpipe/pipeline/pipeline_model_builder.hpp"

#include <glog/logging.h>

namespace stagedpipe
{

// ============================================================================
// Registration
// ============================================================================

StepDescriptorPtr RegistrationCoordinator::register_step(std::string id,
                                                         const BehaviorType& type,
                                                         std::string description,
                                                         BehaviorFactory factory)
{
    auto descriptor = std::make_shared<StepDescriptor>(std::move(id), type, std::move(description),
                                                       std::move(factory));
    m_modifications.additions.push_back(descriptor);
    return descriptor;
}

void RegistrationCoordinator::register_step(StepDescriptorPtr descriptor)
{
    if (!descriptor)
    {
        throw std::invalid_argument("RegistrationCoordinator::register_step: null descriptor");
    }
    m_modifications.additions.push_back(std::move(descriptor));
}

void RegistrationCoordinator::remove_step(std::string id)
{
    m_modifications.removals.push_back(RemoveStep{std::move(id)});
}

void RegistrationCoordinator::replace_step(ReplaceStep replacement)
{
    m_modifications.replacements.push_back(std::move(replacement));
}

// ============================================================================
// Resolution
// ============================================================================

std::vector<StepDescriptorPtr> RegistrationCoordinator::resolve_registrations(
    const IReadOnlySettings& settings) const
{
    const auto& additions = m_modifications.additions;

    IdMap<StepDescriptorPtr> by_id;
    for (const auto& step : additions)
    {
        auto [it, inserted] = by_id.emplace(step->id(), step);
        if (!inserted)
        {
            const auto& existing = it->second;
            throw PipelineConfigError(
                PipelineConfigErrorCode::DuplicateStepId,
                "Step id '" + step->id() + "' is already registered for behavior '" +
                    existing->behavior_type().name() + "'; cannot register it again for '" +
                    step->behavior_type().name() + "'",
                {existing->id(), step->id()});
        }
    }

    for (const auto& replacement : m_modifications.replacements)
    {
        auto it = by_id.find(replacement.id());
        if (it == by_id.end())
        {
            throw PipelineConfigError(
                PipelineConfigErrorCode::UnknownReplaceTarget,
                "Cannot replace step '" + replacement.id() + "': no step with that id is registered",
                {replacement.id()});
        }
        it->second->replace(replacement);
    }

    IdSet removed;
    for (const auto& removal : m_modifications.removals)
    {
        if (!removed.insert(removal.id).second)
        {
            continue;
        }
        if (by_id.find(removal.id) == by_id.end())
        {
            throw PipelineConfigError(
                PipelineConfigErrorCode::UnknownRemoveTarget,
                "Cannot remove step '" + removal.id + "': no step with that id is registered",
                {removal.id});
        }

        // Only steps that are still live can hold a reference.
        for (const auto& step : additions)
        {
            if (removed.count(step->id()) == 0 && step->references(removal.id))
            {
                throw PipelineConfigError(
                    PipelineConfigErrorCode::RemovalHasDependents,
                    "Cannot remove step '" + removal.id + "': registration with id '" +
                        step->id() + "' depends on it",
                    {removal.id, step->id()});
            }
        }
    }

    std::vector<StepDescriptorPtr> live;
    live.reserve(additions.size());
    for (const auto& step : additions)
    {
        if (removed.count(step->id()) != 0)
        {
            continue;
        }
        if (!step->is_enabled(settings))
        {
            VLOG(1) << "Step '" << step->id() << "' (" << step->behavior_type().name()
                    << ") is disabled by settings";
            continue;
        }
        live.push_back(step);
    }
    return live;
}

std::vector<StepDescriptorPtr> RegistrationCoordinator::build_pipeline_model(
    const ContextShape& root_shape, const IReadOnlySettings& settings) const
{
    PipelineModelBuilder model_builder(root_shape, resolve_registrations(settings));
    return model_builder.build();
}

} // namespace stagedpipe
