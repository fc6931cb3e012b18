/**
 * @file pipeline_exceptions.hpp
 */
#pragma once
#include "stagedpipe/common/common.hpp"

namespace stagedpipe
{

/**
 * @brief Error codes for pipeline configuration failures.
 *
 * @details
 * Every code names a programming or configuration mistake detected while a
 * pipeline is being registered, ordered or compiled. None of them is retried;
 * they abort construction of the pipeline.
 */
enum class PipelineConfigErrorCode
{
    InvalidStepId,
    DuplicateStepId,
    UnknownReplaceTarget,
    IncompatibleReplacement,
    UnknownRemoveTarget,
    RemovalHasDependents,
    UnresolvedDependency,
    CycleDetected,
    MissingRootStage,
    AmbiguousStageConnector,
    MissingStageConnector,
    ShapeMismatch,
    BehaviorNotBuildable,
    SettingsLocked
};

/**
 * @brief Get a stable display name for an error code.
 */
inline const char* to_string(PipelineConfigErrorCode code) noexcept
{
    switch (code)
    {
    case PipelineConfigErrorCode::InvalidStepId:
        return "InvalidStepId";
    case PipelineConfigErrorCode::DuplicateStepId:
        return "DuplicateStepId";
    case PipelineConfigErrorCode::UnknownReplaceTarget:
        return "UnknownReplaceTarget";
    case PipelineConfigErrorCode::IncompatibleReplacement:
        return "IncompatibleReplacement";
    case PipelineConfigErrorCode::UnknownRemoveTarget:
        return "UnknownRemoveTarget";
    case PipelineConfigErrorCode::RemovalHasDependents:
        return "RemovalHasDependents";
    case PipelineConfigErrorCode::UnresolvedDependency:
        return "UnresolvedDependency";
    case PipelineConfigErrorCode::CycleDetected:
        return "CycleDetected";
    case PipelineConfigErrorCode::MissingRootStage:
        return "MissingRootStage";
    case PipelineConfigErrorCode::AmbiguousStageConnector:
        return "AmbiguousStageConnector";
    case PipelineConfigErrorCode::MissingStageConnector:
        return "MissingStageConnector";
    case PipelineConfigErrorCode::ShapeMismatch:
        return "ShapeMismatch";
    case PipelineConfigErrorCode::BehaviorNotBuildable:
        return "BehaviorNotBuildable";
    case PipelineConfigErrorCode::SettingsLocked:
        return "SettingsLocked";
    }
    return "Unknown";
}

/**
 * @brief Exception thrown when a pipeline cannot be configured.
 *
 * @details
 * `PipelineConfigError` is thrown synchronously by registration, ordering,
 * compilation and settings writes. Each exception carries an error code, a
 * descriptive message and the ids of the steps involved (possibly empty),
 * so that callers and tests can tell which registration caused the failure.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class PipelineConfigError : public std::runtime_error
{
public:
    /**
     * @brief Construct a PipelineConfigError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     * @param involved_step_ids Ids of the steps the error is about.
     */
    PipelineConfigError(PipelineConfigErrorCode code,
                        const std::string& message,
                        std::vector<std::string> involved_step_ids = {})
        : std::runtime_error(message)
        , m_code(code)
        , m_involved_step_ids(std::move(involved_step_ids))
    {
    }

    /**
     * @brief Get the error code.
     */
    PipelineConfigErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the ids of the steps involved in this error.
     */
    const std::vector<std::string>& involved_step_ids() const noexcept
    {
        return m_involved_step_ids;
    }

private:
    PipelineConfigErrorCode m_code;
    std::vector<std::string> m_involved_step_ids;
};

/**
 * @brief Exception raised by a behavior that observed a cancellation request.
 *
 * @details
 * The pipeline never catches or translates this exception; it reaches the
 * caller of `execute()` unchanged.
 */
class OperationCancelled : public std::runtime_error
{
public:
    OperationCancelled()
        : std::runtime_error("The operation was cancelled")
    {
    }

    explicit OperationCancelled(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

} // namespace stagedpipe
