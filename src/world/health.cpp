#include "world/health.hpp"
#include <algorithm>

namespace story {

void HealthState::damage(uint32_t amount) {
    current_hp_ = amount >= current_hp_ ? 0 : current_hp_ - amount;
}

void HealthState::heal(uint32_t amount) {
    uint64_t hp = static_cast<uint64_t>(current_hp_) + amount;
    current_hp_ = static_cast<uint32_t>(std::min<uint64_t>(hp, max_hp_));
}

bool HealthState::remove_effect(const std::string& cause) {
    auto it = std::find_if(effects_.begin(), effects_.end(),
                           [&](const HealthEffect& fx) { return fx.cause == cause; });
    if (it == effects_.end()) return false;
    effects_.erase(it);
    return true;
}

HealthTick HealthState::tick() {
    HealthTick result;
    std::vector<HealthEffect> remaining;

    for (const auto& fx : effects_) {
        result.changes.push_back({fx.cause, fx.amount, fx.is_damage()});

        if (fx.is_damage()) {
            damage(fx.amount);
        } else {
            heal(fx.amount);
        }

        if (current_hp_ == 0) {
            result.died = true;
            result.death_cause = fx.cause;
            break;
        }

        bool over_time = fx.kind == HealthEffectKind::DAMAGE_OVER_TIME ||
                         fx.kind == HealthEffectKind::HEAL_OVER_TIME;
        if (over_time && fx.times > 1) {
            HealthEffect next = fx;
            next.times--;
            remaining.push_back(next);
        }
    }

    // Death clears the queue; effects after the fatal one never apply.
    effects_ = result.died ? std::vector<HealthEffect>{} : std::move(remaining);
    return result;
}

const char* HealthState::kind_name(HealthEffectKind kind) {
    switch (kind) {
        case HealthEffectKind::INSTANT_DAMAGE:   return "instantDamage";
        case HealthEffectKind::INSTANT_HEAL:     return "instantHeal";
        case HealthEffectKind::DAMAGE_OVER_TIME: return "damageOverTime";
        case HealthEffectKind::HEAL_OVER_TIME:   return "healOverTime";
    }
    return "instantDamage";
}

bool HealthState::parse_kind(const std::string& name, HealthEffectKind& out) {
    if (name == "instantDamage")  { out = HealthEffectKind::INSTANT_DAMAGE;   return true; }
    if (name == "instantHeal")    { out = HealthEffectKind::INSTANT_HEAL;     return true; }
    if (name == "damageOverTime") { out = HealthEffectKind::DAMAGE_OVER_TIME; return true; }
    if (name == "healOverTime")   { out = HealthEffectKind::HEAL_OVER_TIME;   return true; }
    return false;
}

} // namespace story
