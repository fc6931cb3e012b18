/**
 * @file behavior_type.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include "stagedpipe/common/context_shape.hpp"
#include "stagedpipe/model/behavior.hpp"

namespace stagedpipe
{

namespace detail
{

template <typename T, typename = void>
struct has_behavior_name : std::false_type
{};

template <typename T>
struct has_behavior_name<T, std::void_t<decltype(T::behavior_name())>> : std::true_type
{};

uint32_t allocate_behavior_type_id() noexcept;

} // namespace detail

/**
 * @brief Static description of a behavior class.
 *
 * @details
 * A BehaviorType is what a step registers instead of an instance: the
 * behavior's identity, display name, kind and context shapes, captured once
 * from the class's capability interface. Registration, stage partitioning
 * and builders work from this record; no instance exists until the pipeline
 * is compiled.
 *
 * @par Naming
 * - `TBehavior::behavior_name()` if declared, else `typeid(TBehavior).name()`.
 *
 * @par Default construction
 * - If `TBehavior` is default constructible, `default_construct()` creates a
 *   new instance; otherwise it returns nullptr and the behavior must come from
 *   a factory or a builder registration.
 */
class BehaviorType
{
public:
    /**
     * @brief Get the record describing `TBehavior`.
     */
    template <typename TBehavior>
    static const BehaviorType& of()
    {
        static_assert(std::is_base_of_v<IBehavior, TBehavior>,
                      "BehaviorType: TBehavior must implement IBehavior");
        using TIn = typename TBehavior::input_context;
        using TOut = typename TBehavior::output_context;

        static const BehaviorType type{
            detail::allocate_behavior_type_id(),
            display_name<TBehavior>(),
            TBehavior::behavior_kind,
            ContextShape::of<TIn>(),
            ContextShape::of<TOut>(),
            default_constructor<TBehavior>()};
        return type;
    }

    uint32_t id() const noexcept
    {
        return m_id;
    }

    const std::string& name() const noexcept
    {
        return m_name;
    }

    BehaviorKind kind() const noexcept
    {
        return m_kind;
    }

    const ContextShape& input_shape() const noexcept
    {
        return m_input_shape;
    }

    const ContextShape& output_shape() const noexcept
    {
        return m_output_shape;
    }

    bool is_stage_connector() const noexcept
    {
        return m_kind != BehaviorKind::Ordinary;
    }

    bool is_terminator() const noexcept
    {
        return m_kind == BehaviorKind::Terminator;
    }

    bool can_default_construct() const noexcept
    {
        return static_cast<bool>(m_default_constructor);
    }

    /**
     * @brief Create a new instance with the default constructor.
     * @return The instance, or nullptr if the type has no default constructor.
     */
    BehaviorPtr default_construct() const
    {
        return m_default_constructor ? m_default_constructor() : nullptr;
    }

    bool operator==(const BehaviorType& other) const noexcept
    {
        return m_id == other.m_id;
    }

    bool operator!=(const BehaviorType& other) const noexcept
    {
        return !(*this == other);
    }

private:
    BehaviorType(uint32_t id,
                 std::string name,
                 BehaviorKind kind,
                 ContextShape input_shape,
                 ContextShape output_shape,
                 std::function<BehaviorPtr()> default_constructor)
        : m_id(id)
        , m_name(std::move(name))
        , m_kind(kind)
        , m_input_shape(std::move(input_shape))
        , m_output_shape(std::move(output_shape))
        , m_default_constructor(std::move(default_constructor))
    {}

    template <typename TBehavior>
    static std::string display_name()
    {
        if constexpr (detail::has_behavior_name<TBehavior>::value)
        {
            return std::string{TBehavior::behavior_name()};
        }
        else
        {
            return std::string{typeid(TBehavior).name()};
        }
    }

    template <typename TBehavior>
    static std::function<BehaviorPtr()> default_constructor()
    {
        if constexpr (std::is_default_constructible_v<TBehavior> && !std::is_abstract_v<TBehavior>)
        {
            return []() -> BehaviorPtr { return std::make_shared<TBehavior>(); };
        }
        else
        {
            return {};
        }
    }

    uint32_t m_id;
    std::string m_name;
    BehaviorKind m_kind;
    ContextShape m_input_shape;
    ContextShape m_output_shape;
    std::function<BehaviorPtr()> m_default_constructor;
};

} // namespace stagedpipe
