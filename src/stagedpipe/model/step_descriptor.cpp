/**
 * @file step_descriptor.cpp
 */
#include "stagedpipe/model/step_descriptor.hpp"
#include "stagedpipe/common/pipeline_exceptions.hpp"
#include "stagedpipe/common/step_id.hpp"

#include <cctype>

namespace stagedpipe
{

namespace
{

bool is_blank(const std::string& text)
{
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

} // namespace

StepDescriptor::StepDescriptor(std::string id,
                               const BehaviorType& type,
                               std::string description,
                               BehaviorFactory factory)
    : m_id(std::move(id))
    , m_type(&type)
    , m_description(std::move(description))
    , m_factory(std::move(factory))
{
    if (m_id.empty())
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::InvalidStepId,
            "A step id must not be empty (behavior '" + type.name() + "')");
    }
}

// ============================================================================
// Ordering constraints
// ============================================================================

void StepDescriptor::insert_before(const std::string& id)
{
    add_dependency(id, DependencyDirection::Before, true);
}

void StepDescriptor::insert_before_if_exists(const std::string& id)
{
    add_dependency(id, DependencyDirection::Before, false);
}

void StepDescriptor::insert_after(const std::string& id)
{
    add_dependency(id, DependencyDirection::After, true);
}

void StepDescriptor::insert_after_if_exists(const std::string& id)
{
    add_dependency(id, DependencyDirection::After, false);
}

void StepDescriptor::add_dependency(const std::string& id, DependencyDirection direction, bool enforced)
{
    if (id.empty())
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::InvalidStepId,
            "Step '" + m_id + "' declares an ordering constraint with an empty id",
            {m_id});
    }
    auto& list = (direction == DependencyDirection::Before) ? m_befores : m_afters;
    list.push_back(Dependency{m_id, id, direction, enforced});
}

bool StepDescriptor::references(const std::string& id) const noexcept
{
    auto matches = [&id](const Dependency& d) { return iequals(d.depends_on_id, id); };
    return std::any_of(m_befores.begin(), m_befores.end(), matches) ||
           std::any_of(m_afters.begin(), m_afters.end(), matches);
}

bool StepDescriptor::is_enabled(const IReadOnlySettings& settings) const
{
    return !m_enabled_when || m_enabled_when(settings);
}

// ============================================================================
// Replacement and instantiation
// ============================================================================

void StepDescriptor::replace(const ReplaceStep& replacement)
{
    if (!iequals(replacement.id(), m_id))
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::UnknownReplaceTarget,
            "Replacement for '" + replacement.id() + "' cannot be applied to step '" + m_id + "'",
            {replacement.id()});
    }

    const BehaviorType& next = replacement.behavior_type();
    if (next.input_shape() != m_type->input_shape() || next.output_shape() != m_type->output_shape() ||
        next.kind() != m_type->kind())
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::IncompatibleReplacement,
            "Cannot replace '" + m_type->name() + "' with '" + next.name() + "' in step '" + m_id +
                "': replacement must consume '" + m_type->input_shape().name() + "', produce '" +
                m_type->output_shape().name() + "' and be of kind " + to_string(m_type->kind()),
            {m_id});
    }

    m_type = &next;
    m_factory = replacement.factory();
    if (!is_blank(replacement.description()))
    {
        m_description = replacement.description();
    }
}

BehaviorPtr StepDescriptor::create_behavior(IBuilder& builder) const
{
    BehaviorPtr behavior = m_factory ? m_factory(builder) : builder.build(*m_type);
    if (!behavior)
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::BehaviorNotBuildable,
            "Step '" + m_id + "' produced no instance of '" + m_type->name() + "'",
            {m_id});
    }
    if (behavior->input_shape() != input_shape() || behavior->output_shape() != output_shape())
    {
        throw PipelineConfigError(
            PipelineConfigErrorCode::ShapeMismatch,
            "Step '" + m_id + "' was registered as '" + m_type->name() + "' but the built '" +
                behavior->class_name() + "' consumes '" + behavior->input_shape().name() +
                "' and produces '" + behavior->output_shape().name() + "'",
            {m_id});
    }
    return behavior;
}

} // namespace stagedpipe
