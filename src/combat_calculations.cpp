/**
 * Descent Combat Engine - Damage/Block Calculator Implementation
 */

#include "combat_calculations.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace descent {
namespace calc {

namespace {

// Floor of value * multiplier for non-negative value.
int scale_floor(int value, double multiplier) {
    return static_cast<int>(std::floor(static_cast<double>(value) * multiplier));
}

} // namespace

int outgoing_damage(int base, int attacker_strength, int attacker_weak_stacks) {
    int damage = base + attacker_strength;
    if (damage <= 0) {
        return 0;
    }
    if (attacker_weak_stacks > 0) {
        damage = scale_floor(damage, constants::WEAK_DAMAGE_MULTIPLIER);
    }
    return std::max(0, damage);
}

int incoming_damage(int damage, int target_vulnerable_stacks, int target_intangible_stacks) {
    if (target_intangible_stacks > 0) {
        return constants::INTANGIBLE_DAMAGE;
    }
    if (damage <= 0) {
        return 0;
    }
    if (target_vulnerable_stacks > 0) {
        damage = scale_floor(damage, constants::VULNERABLE_DAMAGE_MULTIPLIER);
    }
    return std::max(0, damage);
}

DamageApplication apply_damage(int damage, int hp, int block) {
    damage = std::max(0, damage);
    block = std::max(0, block);

    DamageApplication result;
    result.blocked = std::min(damage, block);
    result.hp_lost = std::max(0, damage - block);
    result.remaining_block = std::max(0, block - damage);
    result.lethal = (hp - result.hp_lost) <= 0;
    return result;
}

BlockCalculation calculate_block(int base, int dexterity, int frail_stacks) {
    BlockCalculation result;
    int block = base + dexterity;
    if (frail_stacks > 0) {
        result.frail_applied = true;
        block = block > 0 ? scale_floor(block, constants::FRAIL_BLOCK_MULTIPLIER) : block;
    }
    result.block_gained = std::max(0, block);
    return result;
}

PoisonTick poison_tick(int stacks) {
    if (stacks <= 0) {
        return {0, 0};
    }
    return {stacks, std::max(0, stacks - 1)};
}

PlatedArmorTick plated_armor_tick(int stacks, bool took_unblocked_damage) {
    if (stacks <= 0) {
        return {0, 0};
    }
    PlatedArmorTick result;
    result.block_granted = stacks;
    result.remaining_stacks = took_unblocked_damage ? std::max(0, stacks - 1) : stacks;
    return result;
}

int thorns_damage(int stacks) {
    return std::max(0, stacks);
}

int intent_damage(int base, int strength, int weak_stacks) {
    return outgoing_damage(base, strength, weak_stacks);
}

bool would_be_lethal(int damage, int hp, int block) {
    return apply_damage(damage, hp, block).lethal;
}

int effective_hp(int hp, int block) {
    return hp + block;
}

int overkill(int damage, int hp, int block) {
    int hp_lost = std::max(0, damage - block);
    return std::max(0, hp_lost - hp);
}

} // namespace calc
} // namespace descent
