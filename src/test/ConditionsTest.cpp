#include <cassert>
#include <iostream>
#include "domain/Conditions.hpp"

using namespace chartkeeper::domain;

int main() {
    std::cout << "[Test] Starting Conditions Test..." << std::endl;

    ConditionSet set;
    set.markTrue(kFetchFailedCondition, kFailedReason, "boom");
    set.markFalse(kReadyCondition, kFailedReason, "boom");
    set.markTrue(kArtifactOutdatedCondition, kNewRevisionReason, "New index revision 'x'");
    assert(set.size() == 3);
    assert(set.items()[0].type == kFetchFailedCondition);
    assert(set.isTrue(kFetchFailedCondition));
    assert(set.isFalse(kReadyCondition));

    // Upsert keeps the position and, while the status holds, the transition time.
    auto before = set.get(kReadyCondition)->lastTransitionTime;
    set.markFalse(kReadyCondition, kAuthenticationFailedReason, "secret missing");
    assert(set.size() == 3);
    assert(set.items()[1].type == kReadyCondition);
    assert(set.items()[1].reason == kAuthenticationFailedReason);
    assert(set.items()[1].lastTransitionTime == before);
    std::cout << "[PASS] Upsert replaces in place." << std::endl;

    Condition flipped{kReadyCondition, ConditionStatus::True, kSucceededReason, "ok",
                      before + std::chrono::seconds(5)};
    set.set(flipped);
    assert(set.isTrue(kReadyCondition));
    assert(set.get(kReadyCondition)->lastTransitionTime == before + std::chrono::seconds(5));
    std::cout << "[PASS] Status change moves the transition time." << std::endl;

    assert(set.remove(kArtifactOutdatedCondition));
    assert(!set.has(kArtifactOutdatedCondition));
    assert(!set.remove(kArtifactOutdatedCondition));
    assert(set.size() == 2);
    std::cout << "[PASS] Remove drops the entry." << std::endl;

    assert(!set.get(kArtifactUnavailableCondition).has_value());
    assert(!set.isTrue(kArtifactUnavailableCondition));
    assert(!set.isFalse(kArtifactUnavailableCondition));

    ConditionSet copy = set;
    assert(copy == set);
    copy.markUnknown(kReadyCondition, "Progressing", "reconciling");
    assert(copy != set);
    assert(ConditionStatusFromString(ConditionStatusToString(ConditionStatus::Unknown)) == ConditionStatus::Unknown);
    assert(ConditionStatusFromString("bogus") == ConditionStatus::Unknown);
    std::cout << "[PASS] Equality and status strings." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
