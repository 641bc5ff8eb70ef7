/**
 * RuleCodec — JSON encoding of conditions, actions, policies and matchers.
 *
 * Shared by the bundle loader and the snapshot so a scheduled event written
 * to a save file reads back exactly as it was authored. Every node is an
 * object tagged by "type":
 *
 *   {"type": "all", "conditions": [ {"type": "hasFlag", "flag": "lamp_lit"}, ... ]}
 *   {"type": "scheduleIn", "turns": 2, "condition": {...}, "actions": [...],
 *    "onFalse": {"type": "retryAfter", "turns": 3}, "note": "bell"}
 *
 * Readers throw LoadError on unknown types and missing fields.
 */

#ifndef STORY_IO_RULE_CODEC_HPP
#define STORY_IO_RULE_CODEC_HPP

#include "rules/action.hpp"
#include "rules/condition.hpp"
#include "rules/on_false_policy.hpp"
#include "rules/trigger_registry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace story {

class JsonValue;
class JsonWriter;

class RuleCodec {
public:
    // ── Conditions ──
    static rules::Condition read_condition(const JsonValue& json);
    static void write_condition(JsonWriter& w, const rules::Condition& cond);

    // ── Actions ──
    static rules::Action read_action(const JsonValue& json);
    static std::vector<rules::Action> read_actions(const JsonValue& json);
    static void write_action(JsonWriter& w, const rules::Action& action);
    static void write_actions(JsonWriter& w, const std::vector<rules::Action>& actions);

    /**
     * Policy: absent/null -> cancel, "cancel", "retryNextTurn",
     * or {"type": "retryAfter", "turns": N}.
     */
    static rules::OnFalsePolicy read_policy(const JsonValue& json);
    static void write_policy(JsonWriter& w, const rules::OnFalsePolicy& policy);

    /** {"type": "<eventKind>", "<param>": "<value>", ...} */
    static rules::EventMatcher read_matcher(const JsonValue& json);
    static void write_matcher(JsonWriter& w, const rules::EventMatcher& matcher);

    // Field helpers shared with the loaders (throw LoadError).
    static const std::string& require_string(const JsonValue& obj, const std::string& key,
                                             const std::string& context);
    static uint64_t require_u64(const JsonValue& obj, const std::string& key,
                                const std::string& context);
};

} // namespace story

#endif // STORY_IO_RULE_CODEC_HPP
