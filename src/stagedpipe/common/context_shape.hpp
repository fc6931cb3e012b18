/**
 * @file context_shape.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"

namespace stagedpipe
{

namespace detail
{

template <typename T, typename = void>
struct has_shape_name : std::false_type
{};

template <typename T>
struct has_shape_name<T, std::void_t<decltype(T::shape_name())>> : std::true_type
{};

template <typename T, typename = void>
struct is_terminating_shape : std::false_type
{};

template <typename T>
struct is_terminating_shape<T, std::void_t<decltype(T::terminating)>>
    : std::integral_constant<bool, T::terminating>
{};

template <typename T>
std::string shape_display_name()
{
    if constexpr (has_shape_name<T>::value)
    {
        return std::string{T::shape_name()};
    }
    else
    {
        return std::string{typeid(T).name()};
    }
}

} // namespace detail

/**
 * @brief An opaque, hashable identifier for the shape of a pipeline context.
 *
 * @details
 * A context shape stands for the context type a pipeline stage operates over.
 * Shapes are allocated once per context type, the first time
 * `ContextShape::of<T>()` is called, and remain stable for the lifetime of the
 * process. Stage grouping, stage transitions and chain validation compare
 * shapes by id only; the name exists for diagnostics.
 *
 * @par Naming
 * - If `T` declares `static ... shape_name()`, its result is used as the name.
 * - Otherwise the implementation-defined `typeid(T).name()` is used.
 *
 * @par Terminating shapes
 * - A context type declaring `static constexpr bool terminating = true`
 *   produces a terminating shape. Terminators output such a shape, and the
 *   stage walk never looks it up as a further stage.
 *
 * @par Value semantics
 * - Copyable and assignable.
 * - Comparison operators compare ids.
 *
 * @par Thread safety
 * - `of<T>()` is safe to call concurrently (function-local static init).
 * - Instances are immutable after construction.
 *
 * @par Standard library integration
 * - `std::hash<ContextShape>` specialization provided.
 */
class ContextShape
{
public:
    /**
     * @brief Get the shape allocated for context type `T`.
     */
    template <typename TContext>
    static const ContextShape& of()
    {
        static_assert(std::is_class_v<TContext>, "ContextShape: context must be a class type");
        static const ContextShape shape{
            allocate_id(),
            detail::shape_display_name<TContext>(),
            detail::is_terminating_shape<TContext>::value};
        return shape;
    }

    uint32_t id() const noexcept
    {
        return m_id;
    }

    const std::string& name() const noexcept
    {
        return m_name;
    }

    bool is_terminating() const noexcept
    {
        return m_terminating;
    }

    bool operator==(const ContextShape& other) const noexcept
    {
        return m_id == other.m_id;
    }

    bool operator!=(const ContextShape& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const ContextShape& other) const noexcept
    {
        return m_id < other.m_id;
    }

    std::size_t hash() const noexcept
    {
        return std::hash<uint32_t>()(m_id);
    }

private:
    ContextShape(uint32_t id, std::string name, bool terminating)
        : m_id(id)
        , m_name(std::move(name))
        , m_terminating(terminating)
    {
    }

    static uint32_t allocate_id() noexcept;

private:
    uint32_t m_id;
    std::string m_name;
    bool m_terminating;
};

} // namespace stagedpipe

namespace std
{

template <>
struct hash<stagedpipe::ContextShape>
{
    std::size_t operator()(const stagedpipe::ContextShape& shape) const noexcept
    {
        return shape.hash();
    }
};

} // namespace std
