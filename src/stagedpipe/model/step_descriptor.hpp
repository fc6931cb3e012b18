/**
 * @file step_descriptor.hpp
 * @brief Registration records: step descriptors, removals and replacements.
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/settings.hpp"
#include "stagedpipe/model/behavior.hpp"
#include "stagedpipe/model/behavior_type.hpp"
#include "stagedpipe/model/builder.hpp"

namespace stagedpipe
{

/**
 * @brief Direction of an ordering constraint, relative to the declaring step.
 */
enum class DependencyDirection
{
    Before = 1, ///< The declaring step runs before the referenced step.
    After = 2   ///< The declaring step runs after the referenced step.
};

/**
 * @brief One ordering constraint declared by a step.
 *
 * @details
 * An enforced constraint must resolve to a live step in the same stage. An
 * unenforced ("if exists") constraint is dropped when its target is absent.
 */
struct Dependency
{
    std::string dependant_id;
    std::string depends_on_id;
    DependencyDirection direction;
    bool enforced;
};

/**
 * @brief Decides, from settings, whether a step takes part in the pipeline.
 */
using EnablePredicate = std::function<bool(const IReadOnlySettings&)>;

/**
 * @brief Request to drop a registered step.
 */
struct RemoveStep
{
    std::string id;
};

/**
 * @brief Request to swap the behavior of a registered step.
 *
 * @details
 * The target keeps its id and its ordering constraints. The description is
 * only overwritten when a non-blank one is supplied.
 */
class ReplaceStep
{
public:
    ReplaceStep(std::string id,
                const BehaviorType& type,
                std::string description = {},
                BehaviorFactory factory = {})
        : m_id(std::move(id))
        , m_type(&type)
        , m_description(std::move(description))
        , m_factory(std::move(factory))
    {
    }

    template <typename TBehavior>
    static ReplaceStep with(std::string id, std::string description = {}, BehaviorFactory factory = {})
    {
        return ReplaceStep(std::move(id), BehaviorType::of<TBehavior>(), std::move(description),
                           std::move(factory));
    }

    const std::string& id() const noexcept
    {
        return m_id;
    }

    const BehaviorType& behavior_type() const noexcept
    {
        return *m_type;
    }

    const std::string& description() const noexcept
    {
        return m_description;
    }

    const BehaviorFactory& factory() const noexcept
    {
        return m_factory;
    }

private:
    std::string m_id;
    const BehaviorType* m_type;
    std::string m_description;
    BehaviorFactory m_factory;
};

/**
 * @brief Registered metadata for one pipeline step.
 *
 * @details
 * A descriptor names a behavior type (and optionally a factory), carries the
 * step's ordering constraints and decides whether the step is enabled. No
 * behavior instance exists until `create_behavior()` is called during chain
 * compilation.
 *
 * @par Invariants
 * - `id()` is non-empty and never changes.
 * - Input shape, output shape and kind never change; a replacement must keep
 *   all three.
 * - Constraints accumulate in declaration order.
 *
 * @par Ownership
 * - Shared between the registration coordinator and the stage partitioner via
 *   StepDescriptorPtr. Dropped whole by a removal.
 */
class StepDescriptor
{
public:
    /**
     * @throws PipelineConfigError with `InvalidStepId` if `id` is empty.
     */
    StepDescriptor(std::string id,
                   const BehaviorType& type,
                   std::string description,
                   BehaviorFactory factory = {});

    virtual ~StepDescriptor() = default;

    template <typename TBehavior>
    static std::shared_ptr<StepDescriptor> create(std::string id,
                                                  std::string description = {},
                                                  BehaviorFactory factory = {})
    {
        return std::make_shared<StepDescriptor>(std::move(id), BehaviorType::of<TBehavior>(),
                                                std::move(description), std::move(factory));
    }

    const std::string& id() const noexcept
    {
        return m_id;
    }

    const BehaviorType& behavior_type() const noexcept
    {
        return *m_type;
    }

    const std::string& description() const noexcept
    {
        return m_description;
    }

    bool has_factory() const noexcept
    {
        return static_cast<bool>(m_factory);
    }

    const ContextShape& input_shape() const noexcept
    {
        return m_type->input_shape();
    }

    const ContextShape& output_shape() const noexcept
    {
        return m_type->output_shape();
    }

    BehaviorKind kind() const noexcept
    {
        return m_type->kind();
    }

    bool is_stage_connector() const noexcept
    {
        return m_type->is_stage_connector();
    }

    bool is_terminator() const noexcept
    {
        return m_type->is_terminator();
    }

    const std::vector<Dependency>& befores() const noexcept
    {
        return m_befores;
    }

    const std::vector<Dependency>& afters() const noexcept
    {
        return m_afters;
    }

    /**
     * @brief Require this step to run before `id`.
     * @note Resolution fails if `id` is not registered in the same stage.
     */
    void insert_before(const std::string& id);

    /**
     * @brief Run before `id` if such a step is registered; ignored otherwise.
     */
    void insert_before_if_exists(const std::string& id);

    /**
     * @brief Require this step to run after `id`.
     * @note Resolution fails if `id` is not registered in the same stage.
     */
    void insert_after(const std::string& id);

    /**
     * @brief Run after `id` if such a step is registered; ignored otherwise.
     */
    void insert_after_if_exists(const std::string& id);

    /**
     * @brief True if any constraint of this step references `id`.
     */
    bool references(const std::string& id) const noexcept;

    void set_enabled_when(EnablePredicate predicate)
    {
        m_enabled_when = std::move(predicate);
    }

    /**
     * @brief Decide whether the step is part of the pipeline.
     * @return true unless an enable predicate was set and rejects `settings`.
     */
    virtual bool is_enabled(const IReadOnlySettings& settings) const;

    /**
     * @brief Apply a replacement to this descriptor.
     * @throws PipelineConfigError with `UnknownReplaceTarget` if the ids differ,
     *         or `IncompatibleReplacement` if shapes or kind differ.
     */
    void replace(const ReplaceStep& replacement);

    /**
     * @brief Instantiate the behavior, from the factory if any, else `builder`.
     * @throws PipelineConfigError with `BehaviorNotBuildable` or `ShapeMismatch`.
     */
    BehaviorPtr create_behavior(IBuilder& builder) const;

private:
    void add_dependency(const std::string& id, DependencyDirection direction, bool enforced);

    std::string m_id;
    const BehaviorType* m_type;
    std::string m_description;
    BehaviorFactory m_factory;
    std::vector<Dependency> m_befores;
    std::vector<Dependency> m_afters;
    EnablePredicate m_enabled_when;
};

using StepDescriptorPtr = std::shared_ptr<StepDescriptor>;

/**
 * @brief Everything registered for one pipeline, before resolution.
 */
struct PipelineModifications
{
    std::vector<StepDescriptorPtr> additions;
    std::vector<RemoveStep> removals;
    std::vector<ReplaceStep> replacements;
};

} // namespace stagedpipe
