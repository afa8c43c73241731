/**
 * @file ReconcileResult.hpp
 * @brief Scheduling decisions returned by reconciliation passes and their phases.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "domain/ManagedResource.hpp"

namespace chartkeeper::application {

/**
 * @struct ReconcileResult
 * @brief When the resource should be looked at again.
 *
 * A zero result means "do not requeue"; the next pass then only happens on a
 * spec change or an external resync.
 */
struct ReconcileResult {
    bool requeue = false;                 ///< Requeue immediately.
    std::chrono::seconds requeueAfter{0}; ///< Requeue after this delay when > 0.

    bool isZero() const { return !requeue && requeueAfter.count() == 0; }

    static ReconcileResult Immediately() { return ReconcileResult{true, std::chrono::seconds(0)}; }
    static ReconcileResult After(std::chrono::seconds delay) { return ReconcileResult{false, delay}; }

    bool operator==(const ReconcileResult& other) const {
        return requeue == other.requeue && requeueAfter == other.requeueAfter;
    }
};

/**
 * @struct ReconcileOutcome
 * @brief What a full pass hands back to the queue.
 */
struct ReconcileOutcome {
    ReconcileResult result;
    std::optional<std::string> error; ///< Set when the pass failed.

    bool failed() const { return error.has_value(); }
};

/**
 * @struct PhaseResult
 * @brief Output of one reconciliation phase.
 *
 * Phases never mutate their input; the orchestrator carries @ref status into
 * the next phase unless @ref stop is set.
 */
struct PhaseResult {
    domain::ResourceStatus status;
    ReconcileResult result;
    std::optional<std::string> error;
    bool stop = false;

    static PhaseResult Continue(domain::ResourceStatus status) {
        PhaseResult r;
        r.status = std::move(status);
        return r;
    }
};

} // namespace chartkeeper::application
