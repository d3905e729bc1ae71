/**
 * Descent Combat Engine - Combatant Model Implementation
 */

#include "combatant.hpp"
#include <algorithm>
#include <cmath>

namespace descent {

// ============================================================================
// DAMAGE
// ============================================================================

HitResult Combatant::take_damage(int raw_damage, int attacker_strength, int attacker_weak,
                                 bool ignore_block) {
    int damage = calc::outgoing_damage(raw_damage, attacker_strength, attacker_weak);
    damage = calc::incoming_damage(damage,
                                   status.get(StatusKey::VULNERABLE),
                                   status.get(StatusKey::INTANGIBLE));

    if (ignore_block) {
        HitResult result;
        result.damage = damage;
        result.hp_lost = lose_hp(damage);
        if (result.hp_lost > 0) {
            took_unblocked_damage = true;
        }
        result.killed = is_dead();
        return result;
    }

    return absorb_damage(damage);
}

HitResult Combatant::take_damage_direct(int damage) {
    int final_damage = calc::incoming_damage(std::max(0, damage), 0,
                                             status.get(StatusKey::INTANGIBLE));
    return absorb_damage(final_damage);
}

HitResult Combatant::absorb_damage(int damage) {
    HitResult result;
    result.damage = damage;

    int block_before = block;
    calc::DamageApplication applied = calc::apply_damage(damage, current_hp, block);
    block = applied.remaining_block;
    result.blocked = applied.blocked;
    result.block_broken = block_before > 0 && block == 0 && damage > 0;

    result.hp_lost = std::min(applied.hp_lost, current_hp);
    current_hp -= result.hp_lost;
    if (applied.hp_lost > 0) {
        took_unblocked_damage = true;
    }
    result.killed = is_dead();
    return result;
}

int Combatant::lose_hp(int amount) {
    if (amount <= 0) {
        return 0;
    }
    int lost = std::min(amount, current_hp);
    current_hp -= lost;
    return lost;
}

// ============================================================================
// BLOCK / HP
// ============================================================================

int Combatant::gain_block(int base) {
    calc::BlockCalculation calculated = calc::calculate_block(
        base, status.get(StatusKey::DEXTERITY), status.get(StatusKey::FRAIL));
    block += calculated.block_gained;
    return calculated.block_gained;
}

int Combatant::gain_block_raw(int amount) {
    if (amount <= 0) {
        return 0;
    }
    block += amount;
    return amount;
}

int Combatant::heal(int amount) {
    if (amount <= 0 || is_dead()) {
        return 0;
    }
    int healed = std::min(amount, max_hp - current_hp);
    current_hp += healed;
    return healed;
}

void Combatant::increase_max_hp(int amount) {
    if (amount <= 0) {
        return;
    }
    max_hp += amount;
    current_hp += amount;
}

// ============================================================================
// STATUS
// ============================================================================

bool Combatant::apply_status(StatusKey key, int amount) {
    if (amount == 0) {
        return true;
    }

    bool is_signed = key == StatusKey::STRENGTH || key == StatusKey::DEXTERITY;
    bool is_debuff = is_debuff_status(key) || (is_signed && amount < 0);

    if (is_debuff && try_consume_artifact()) {
        return false;
    }

    int current = status.get(key);
    if (is_signed) {
        status.set(key, current + amount);
    } else if (is_duration_status(key)) {
        status.set(key, std::max(current, amount));
    } else {
        status.set(key, std::max(0, current + amount));
    }
    return true;
}

bool Combatant::try_consume_artifact() {
    int artifact = status.get(StatusKey::ARTIFACT);
    if (artifact <= 0) {
        return false;
    }
    status.set(StatusKey::ARTIFACT, artifact - 1);
    return true;
}

// ============================================================================
// TURN TICKS
// ============================================================================

int Combatant::tick_start_of_turn() {
    block = 0;

    calc::PoisonTick poison = calc::poison_tick(status.get(StatusKey::POISON));
    int dealt = lose_hp(poison.damage);
    status.set(StatusKey::POISON, poison.remaining_stacks);

    int intangible = status.get(StatusKey::INTANGIBLE);
    if (intangible > 0) {
        status.set(StatusKey::INTANGIBLE, intangible - 1);
    }

    return dealt;
}

EndOfTurnTick Combatant::tick_end_of_turn() {
    EndOfTurnTick tick;

    for (StatusKey key : {StatusKey::WEAK, StatusKey::VULNERABLE, StatusKey::FRAIL}) {
        status.set(key, std::max(0, status.get(key) - 1));
    }

    calc::PlatedArmorTick plated = calc::plated_armor_tick(
        status.get(StatusKey::PLATED_ARMOR), took_unblocked_damage);
    tick.plated_block = gain_block_raw(plated.block_granted);
    status.set(StatusKey::PLATED_ARMOR, plated.remaining_stacks);
    took_unblocked_damage = false;

    int ritual = status.get(StatusKey::RITUAL);
    if (ritual > 0) {
        status.set(StatusKey::STRENGTH, status.get(StatusKey::STRENGTH) + ritual);
        tick.ritual_strength = ritual;
    }

    int regen = status.get(StatusKey::REGEN);
    if (regen > 0) {
        tick.regen_healed = heal(regen);
        status.set(StatusKey::REGEN, regen - 1);
    }

    return tick;
}

// ============================================================================
// ENEMY
// ============================================================================

Enemy Enemy::from_def(const EnemyDef& def, std::string instance_id,
                      const RandomDraw& draw, double hp_variance) {
    Enemy enemy;
    enemy.id = std::move(instance_id);
    enemy.name = def.name;
    enemy.def_id = def.enemy_id;
    enemy.type = def.type;
    enemy.moves = def.moves;

    int low = static_cast<int>(std::floor(def.max_hp * (1.0 - hp_variance)));
    int high = static_cast<int>(std::floor(def.max_hp * (1.0 + hp_variance)));
    low = std::max(1, low);
    high = std::max(low, high);
    int hp = low + random_index(draw, high - low + 1);

    enemy.max_hp = hp;
    enemy.current_hp = hp;

    for (const auto& [key, amount] : def.starting_status) {
        enemy.status.set(key, amount);
    }

    return enemy;
}

std::optional<size_t> Enemy::pick_weighted(const RandomDraw& draw,
                                           const std::string* excluded_name) const {
    int total = 0;
    std::optional<size_t> last_eligible;
    for (size_t i = 0; i < moves.size(); ++i) {
        if (excluded_name && moves[i].name == *excluded_name) continue;
        if (moves[i].weight <= 0) continue;
        total += moves[i].weight;
        last_eligible = i;
    }
    if (total <= 0) {
        return std::nullopt;
    }

    double r = draw() * total;
    for (size_t i = 0; i < moves.size(); ++i) {
        if (excluded_name && moves[i].name == *excluded_name) continue;
        if (moves[i].weight <= 0) continue;
        r -= moves[i].weight;
        if (r <= 0) {
            return i;
        }
    }
    return last_eligible;
}

const EnemyMoveDef* Enemy::roll_move(const RandomDraw& draw) {
    if (moves.empty()) {
        committed_move.reset();
        intent = Intent{};
        return nullptr;
    }

    std::optional<size_t> pick = pick_weighted(draw, nullptr);
    if (!pick) {
        // Every weight is zero: fall back to a uniform pick
        pick = static_cast<size_t>(random_index(draw, static_cast<int>(moves.size())));
    }

    // Anti-repeat: never pick the previous move while an alternative exists
    const std::string* previous = last_move();
    if (previous && moves[*pick].name == *previous) {
        std::optional<size_t> redraw = pick_weighted(draw, previous);
        if (redraw) {
            pick = redraw;
        }
    }

    committed_move = *pick;
    intent = moves[*pick].intent;

    move_history.push_back(moves[*pick].name);
    while (static_cast<int>(move_history.size()) > history_limit) {
        move_history.pop_front();
    }

    return &moves[*pick];
}

std::vector<EnemyActionDef> Enemy::execute_move(const RandomDraw& draw) {
    std::vector<EnemyActionDef> actions;
    if (const EnemyMoveDef* move = current_move()) {
        actions = move->actions;
    }
    roll_move(draw);
    return actions;
}

const EnemyMoveDef* Enemy::current_move() const {
    if (!committed_move || *committed_move >= moves.size()) {
        return nullptr;
    }
    return &moves[*committed_move];
}

std::optional<int> Enemy::get_intent_value() const {
    if (!intent.value) {
        return std::nullopt;
    }
    if (intent.type != IntentType::ATTACK) {
        return intent.value;
    }
    return calc::intent_damage(*intent.value,
                               status.get(StatusKey::STRENGTH),
                               status.get(StatusKey::WEAK));
}

} // namespace descent
