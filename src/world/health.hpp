/**
 * HealthState — Hit points plus queued instant and over-time effects.
 *
 * Effects accumulate between ambient passes and are applied in insertion
 * order by tick(). Over-time effects keep a remaining-ticks counter and stay
 * queued until it reaches zero. Reaching 0 hp stops the tick immediately and
 * reports the cause.
 */

#ifndef STORY_WORLD_HEALTH_HPP
#define STORY_WORLD_HEALTH_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace story {

enum class HealthEffectKind {
    INSTANT_DAMAGE,
    INSTANT_HEAL,
    DAMAGE_OVER_TIME,
    HEAL_OVER_TIME
};

struct HealthEffect {
    HealthEffectKind kind = HealthEffectKind::INSTANT_DAMAGE;
    std::string cause;
    uint32_t amount = 0;
    uint32_t times = 1;     // remaining ticks for over-time effects

    bool is_damage() const {
        return kind == HealthEffectKind::INSTANT_DAMAGE ||
               kind == HealthEffectKind::DAMAGE_OVER_TIME;
    }
};

struct HealthChange {
    std::string cause;
    uint32_t amount = 0;
    bool damage = true;
};

struct HealthTick {
    std::vector<HealthChange> changes;
    bool died = false;
    std::string death_cause;
};

class HealthState {
public:
    HealthState() = default;
    explicit HealthState(uint32_t max_hp) : max_hp_(max_hp), current_hp_(max_hp) {}

    uint32_t max_hp() const { return max_hp_; }
    uint32_t current_hp() const { return current_hp_; }
    bool alive() const { return current_hp_ > 0; }

    void damage(uint32_t amount);
    void heal(uint32_t amount);

    void add_effect(const HealthEffect& fx) { effects_.push_back(fx); }

    /** Remove the first effect with this cause. Returns false if none matched. */
    bool remove_effect(const std::string& cause);

    const std::vector<HealthEffect>& effects() const { return effects_; }

    HealthTick tick();

    // Snapshot restore
    void restore(uint32_t max_hp, uint32_t current_hp, std::vector<HealthEffect> effects) {
        max_hp_ = max_hp;
        current_hp_ = current_hp;
        effects_ = std::move(effects);
    }

    static const char* kind_name(HealthEffectKind kind);
    static bool parse_kind(const std::string& name, HealthEffectKind& out);

private:
    uint32_t max_hp_ = 0;
    uint32_t current_hp_ = 0;
    std::vector<HealthEffect> effects_;
};

} // namespace story

#endif // STORY_WORLD_HEALTH_HPP
