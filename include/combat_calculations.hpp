/**
 * Descent Combat Engine - Damage/Block Calculator
 *
 * Pure functions turning raw numbers plus modifiers into final numbers.
 * No function here mutates anything; identical inputs always give
 * identical outputs.
 *
 * Fractional multipliers are always floored (truncated toward zero on
 * the non-negative values produced here). Never round, never ceil.
 *
 * Pipeline order for an attack:
 *   outgoing_damage (attacker strength/weak)
 *     -> incoming_damage (target vulnerable/intangible)
 *       -> apply_damage (target block)
 */

#pragma once

namespace descent {
namespace calc {

/**
 * Result of applying final damage against HP and block.
 *
 * hp_lost is not capped by hp; clamping HP to 0 is the caller's job,
 * so blocked + hp_lost == damage always holds.
 */
struct DamageApplication {
    int blocked = 0;
    int hp_lost = 0;
    int remaining_block = 0;
    bool lethal = false;
};

struct BlockCalculation {
    int block_gained = 0;
    bool frail_applied = false;
};

struct PoisonTick {
    int damage = 0;
    int remaining_stacks = 0;
};

struct PlatedArmorTick {
    int block_granted = 0;
    int remaining_stacks = 0;
};

/**
 * base + strength, reduced by 25% if weak. Never negative.
 */
int outgoing_damage(int base, int attacker_strength, int attacker_weak_stacks);

/**
 * Intangible caps damage to exactly 1 (overrides vulnerable).
 * Otherwise vulnerable adds 50%. Never negative.
 */
int incoming_damage(int damage, int target_vulnerable_stacks, int target_intangible_stacks);

DamageApplication apply_damage(int damage, int hp, int block);

/**
 * base + dexterity, reduced by 25% if frail. Never negative.
 */
BlockCalculation calculate_block(int base, int dexterity, int frail_stacks);

/**
 * Poison deals its stack count, then loses one stack.
 */
PoisonTick poison_tick(int stacks);

/**
 * Plated armor grants its stack count as block; it erodes by one stack
 * only if the owner took unblocked damage since the last tick.
 */
PlatedArmorTick plated_armor_tick(int stacks, bool took_unblocked_damage);

int thorns_damage(int stacks);

/**
 * Displayed attack number of an enemy intent: base + strength, then weak.
 */
int intent_damage(int base, int strength, int weak_stacks);

// Convenience for AI and display.
bool would_be_lethal(int damage, int hp, int block);
int effective_hp(int hp, int block);
int overkill(int damage, int hp, int block);

} // namespace calc
} // namespace descent
