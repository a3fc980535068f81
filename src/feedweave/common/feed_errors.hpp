/**
 * @file feed_errors.hpp
 */
#pragma once
#include "feedweave/common/common.hpp"

namespace feedweave
{

/**
 * @brief Error codes for feed engine operations.
 */
enum class FeedErrorCode
{
    MissingDependency,
    CycleDetected,
    InvalidSource,
    SourceNotFound,
    ActionNotFound,
    ActionIdMismatch,
    UnknownAction,
    InvalidActionInput,
    CapabilityNotSupported,
    SourceTimeout
};

/**
 * @brief Get a stable name for an error code, for logs and diagnostics.
 */
inline const char* to_string(FeedErrorCode code) noexcept
{
    switch (code)
    {
        case FeedErrorCode::MissingDependency: return "MissingDependency";
        case FeedErrorCode::CycleDetected: return "CycleDetected";
        case FeedErrorCode::InvalidSource: return "InvalidSource";
        case FeedErrorCode::SourceNotFound: return "SourceNotFound";
        case FeedErrorCode::ActionNotFound: return "ActionNotFound";
        case FeedErrorCode::ActionIdMismatch: return "ActionIdMismatch";
        case FeedErrorCode::UnknownAction: return "UnknownAction";
        case FeedErrorCode::InvalidActionInput: return "InvalidActionInput";
        case FeedErrorCode::CapabilityNotSupported: return "CapabilityNotSupported";
        case FeedErrorCode::SourceTimeout: return "SourceTimeout";
    }
    return "Unknown";
}

/**
 * @brief Exception class for feed engine errors.
 *
 * @details
 * `FeedError` is thrown when the source graph is invalid, when an action is
 * dispatched to a source or action that does not exist, or when a source is
 * asked for a capability it did not declare. It is also the error stored in a
 * `SourceError` when a source misses its deadline. Each exception carries an
 * error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class FeedError : public std::exception
{
public:
    /**
     * @brief Construct a FeedError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    FeedError(FeedErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    FeedErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    FeedErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown by a source's execute_action() for an action id it does not know.
 */
class UnknownActionError : public FeedError
{
public:
    explicit UnknownActionError(std::string action_id)
        : FeedError(FeedErrorCode::UnknownAction, "Unknown action: " + action_id)
        , m_action_id(std::move(action_id))
    {
    }

    const std::string& action_id() const noexcept
    {
        return m_action_id;
    }

private:
    std::string m_action_id;
};

} // namespace feedweave
