/**
 * OnFalsePolicy — What happens to a due scheduled event whose condition fails.
 *
 *   CANCEL           drop it (tombstone Cancelled)
 *   RETRY_AFTER      re-insert under a new id, due `turns` later (turns >= 1)
 *   RETRY_NEXT_TURN  shorthand for RETRY_AFTER with turns = 1
 */

#ifndef STORY_RULES_ON_FALSE_POLICY_HPP
#define STORY_RULES_ON_FALSE_POLICY_HPP

#include <cstdint>
#include <string>

namespace story::rules {

enum class OnFalseKind {
    CANCEL,
    RETRY_AFTER,
    RETRY_NEXT_TURN
};

struct OnFalsePolicy {
    OnFalseKind kind = OnFalseKind::CANCEL;
    uint64_t turns = 1;

    static OnFalsePolicy cancel() { return {}; }
    static OnFalsePolicy retry_next_turn() { return {OnFalseKind::RETRY_NEXT_TURN, 1}; }

    /** Non-positive `turns` is clamped to 1 and logged. */
    static OnFalsePolicy retry_after(int64_t turns);

    bool retries() const { return kind != OnFalseKind::CANCEL; }

    /** Delay applied to a retry clone; never less than 1. */
    uint64_t retry_turns() const {
        if (kind == OnFalseKind::RETRY_NEXT_TURN) return 1;
        return turns < 1 ? 1 : turns;
    }

    /** "cancel", "retry+N" or "retry-next". */
    std::string summary() const;

    bool operator==(const OnFalsePolicy& o) const {
        return kind == o.kind && (kind != OnFalseKind::RETRY_AFTER || turns == o.turns);
    }
};

} // namespace story::rules

#endif // STORY_RULES_ON_FALSE_POLICY_HPP
