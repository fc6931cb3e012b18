/**
 * @file builder.hpp
 * @brief IBuilder, the object-construction collaborator, and DefaultBuilder.
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/model/behavior.hpp"
#include "stagedpipe/model/behavior_type.hpp"

namespace stagedpipe
{

class IBuilder;

/**
 * @brief Factory registered for a step or a builder: returns one live behavior.
 */
using BehaviorFactory = std::function<BehaviorPtr(IBuilder&)>;

/**
 * @brief Interface of the service that instantiates behaviors.
 *
 * @details
 * The chain compiler calls `build()` once per step that has no factory of its
 * own. Any dependency-injection container can be adapted to this interface.
 */
class IBuilder
{
public:
    virtual ~IBuilder() = default;

    /**
     * @brief Create (or look up) the behavior for `type`.
     * @throws PipelineConfigError with `BehaviorNotBuildable` if impossible.
     */
    virtual BehaviorPtr build(const BehaviorType& type) = 0;

    /**
     * @brief Create every behavior registered for `type`.
     */
    virtual std::vector<BehaviorPtr> build_all(const BehaviorType& type) = 0;

    /**
     * @brief Create a builder that sees this builder's registrations and may
     * add or override its own.
     */
    virtual std::unique_ptr<IBuilder> create_child_builder() = 0;

    /**
     * @brief Give back an instance obtained from this builder.
     */
    virtual void release(const BehaviorPtr& instance) = 0;

    template <typename TBehavior>
    std::shared_ptr<TBehavior> build()
    {
        return std::dynamic_pointer_cast<TBehavior>(build(BehaviorType::of<TBehavior>()));
    }
};

/**
 * @brief Small in-process builder.
 *
 * @details
 * Resolution order for `build(type)`:
 * 1. The last registration for `type` in this builder.
 * 2. The last registration for `type` in the parent chain.
 * 3. The type's default constructor.
 *
 * A registration is either a factory (a new instance per call) or a shared
 * instance (the same instance every call). Instances created by factories or
 * by default construction are tracked until released or destroyed; the
 * builder never keeps them alive.
 *
 * @par Ownership
 * - A child builder refers to its parent; the parent must outlive the child.
 *
 * @par Thread Safety
 * - No internal synchronization; used during single-threaded setup.
 */
class DefaultBuilder : public IBuilder
{
public:
    DefaultBuilder() = default;

    using IBuilder::build;

    void register_factory(const BehaviorType& type, BehaviorFactory factory);
    void register_instance(const BehaviorType& type, BehaviorPtr instance);

    template <typename TBehavior>
    void register_factory(BehaviorFactory factory)
    {
        register_factory(BehaviorType::of<TBehavior>(), std::move(factory));
    }

    template <typename TBehavior>
    void register_instance(std::shared_ptr<TBehavior> instance)
    {
        register_instance(BehaviorType::of<TBehavior>(), std::move(instance));
    }

    BehaviorPtr build(const BehaviorType& type) override;
    std::vector<BehaviorPtr> build_all(const BehaviorType& type) override;
    std::unique_ptr<IBuilder> create_child_builder() override;
    void release(const BehaviorPtr& instance) override;

    /**
     * @brief Number of built instances neither released nor destroyed.
     */
    size_t tracked_count() const noexcept;

private:
    struct Registration
    {
        BehaviorFactory factory;
        BehaviorPtr instance;
    };

    explicit DefaultBuilder(DefaultBuilder* parent)
        : m_parent(parent)
    {}

    const Registration* find_registration(uint32_t type_id) const;
    void collect_registrations(uint32_t type_id, std::vector<const Registration*>& out) const;
    BehaviorPtr build_from(const Registration& registration, const BehaviorType& type);
    void track(const BehaviorPtr& instance);

    DefaultBuilder* m_parent{nullptr};
    std::unordered_map<uint32_t, std::vector<Registration>> m_registrations{};
    std::vector<std::weak_ptr<IBehavior>> m_tracked{};
};

} // namespace stagedpipe
