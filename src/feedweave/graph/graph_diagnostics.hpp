/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "feedweave/common/common.hpp"

namespace feedweave
{

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents the graph from being built.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    MissingDependency,      ///< A declared dependency is not registered.
    Cycle,                  ///< A cycle was detected in the dependencies.
    DuplicateDependency     ///< A source lists the same dependency twice.
};

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * `involved_sources` lists the ids the issue is about. For MissingDependency
 * it is `{dependent, missing}`; for Cycle it is the cycle path in traversal
 * order, with the first id repeated at the end.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;
    std::vector<std::string> involved_sources;
};

/**
 * @brief Diagnostic information collected while validating a source graph.
 *
 * @details
 * Produced by `SourceGraphBuilder::get_diagnostics()`.
 *
 * @par Error vs Warning
 * - **Errors** prevent the graph from being built: MissingDependency, Cycle.
 * - **Warnings** do not: DuplicateDependency.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class GraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Check whether any error has the given category.
     */
    bool has_error(DiagnosticCategory category) const noexcept
    {
        return std::any_of(m_errors.begin(), m_errors.end(),
            [category](const DiagnosticItem& item) { return item.category == category; });
    }

    // Allow SourceGraphBuilder to populate diagnostics
    friend class SourceGraphBuilder;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace feedweave
