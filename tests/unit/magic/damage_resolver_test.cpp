#include <gtest/gtest.h>

#include "magic/magic_test_fixtures.hpp"

using namespace sre::magic;
using namespace sre::magic::testing;

class DamageResolverTest : public SpellEngineTest {
protected:
    const SpellDefinition& learnBolt(std::string dice = "2d6", std::string type = "") {
        auto spell = makeSpell("bolt", "Bolt", SpellFamily::Damage);
        spell.requiresTarget = true;
        spell.damageDice = std::move(dice);
        spell.damageType = std::move(type);
        return learn(spell);
    }

    const SpellDefinition& learnStorm(std::string dice = "1d6", std::string type = "fire") {
        auto spell = makeSpell("storm", "Storm", SpellFamily::Damage);
        spell.area = AreaOfEffect::Area;
        spell.damageDice = std::move(dice);
        spell.damageType = std::move(type);
        return learn(spell);
    }
};

// ---------------------------------------------------------------------------
// Single target
// ---------------------------------------------------------------------------

TEST_F(DamageResolverTest, HitDealsRolledDamage) {
    learnBolt();
    auto goblin = addMob("goblin", 30);
    random_.pushInts({4, 5});

    EXPECT_EQ(engine().CastSpell(*caster_, "bolt goblin"), CastOutcome::Resolved);

    EXPECT_EQ(goblin->vitals.health, 21);
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "You casts Bolt at goblin! It strikes for 9 magical damage!"));
    EXPECT_TRUE(messaging_.broadcastContains("Aldric casts Bolt at goblin!"));
    EXPECT_EQ(goblin->aggroTarget, caster_->playerId);
    EXPECT_EQ(goblin->aggroLastAttack, clock_.Now());
}

TEST_F(DamageResolverTest, AccuracyUsesCastingStatAndConfiguredBase) {
    config_.baseHitChance = 0.7;
    learnBolt();
    addMob("goblin");
    caster_->stats.Set(Stat::Intellect, 17);
    caster_->stats.Set(Stat::Dexterity, 8);

    engine().CastSpell(*caster_, "bolt goblin");

    EXPECT_EQ(oracle_.calls, 1);
    EXPECT_EQ(oracle_.lastAttacker.Get(Stat::Dexterity), 17);
    EXPECT_DOUBLE_EQ(oracle_.lastBaseHitChance, 0.7);
}

TEST_F(DamageResolverTest, MissDodgeDeflectLeaveTargetUnharmed) {
    learnBolt();
    auto goblin = addMob("goblin");

    oracle_.push(AttackOutcome::Miss);
    engine().CastSpell(*caster_, "bolt goblin");
    EXPECT_TRUE(messaging_.told(caster_->playerId, "You cast Bolt, but it misses goblin!"));

    clock_.advance(std::chrono::seconds(60));
    oracle_.push(AttackOutcome::Dodge);
    engine().CastSpell(*caster_, "bolt goblin");
    EXPECT_TRUE(messaging_.told(caster_->playerId, "You cast Bolt, but goblin dodges it!"));
    EXPECT_TRUE(messaging_.broadcastContains("goblin dodges Aldric's Bolt!"));

    clock_.advance(std::chrono::seconds(60));
    oracle_.push(AttackOutcome::Deflect);
    engine().CastSpell(*caster_, "bolt goblin");
    EXPECT_TRUE(messaging_.told(caster_->playerId, "goblin's defenses deflect it!"));

    EXPECT_EQ(goblin->vitals.health, goblin->vitals.maxHealth);
    EXPECT_FALSE(goblin->aggroTarget.has_value());
}

TEST_F(DamageResolverTest, LevelScaling) {
    auto spell = makeSpell("bolt", "Bolt", SpellFamily::Damage);
    spell.requiresTarget = true;
    spell.damageDice = "1d4";
    spell.scalesWithLevel = true;
    learn(spell);
    caster_->level = 3;
    auto ogre = addMob("ogre", 50);
    random_.pushInts({2});

    engine().CastSpell(*caster_, "bolt ogre");
    EXPECT_EQ(ogre->vitals.health, 44);
}

TEST_F(DamageResolverTest, KillingBlowDefeatsAndAwardsLoot) {
    learnBolt("10");
    auto rat = addMob("rat", 8);

    engine().CastSpell(*caster_, "bolt rat");

    EXPECT_TRUE(messaging_.told(caster_->playerId, "rat has been defeated!"));
    ASSERT_EQ(lifecycle_.loot.size(), 1u);
    EXPECT_EQ(lifecycle_.loot[0].killer, caster_->playerId);
    EXPECT_EQ(lifecycle_.deaths, std::vector<std::string>{"rat"});
    EXPECT_EQ(rooms_.MobCount(kRoom), 0u);
}

TEST_F(DamageResolverTest, ExistingAggroIsKept) {
    learnBolt();
    auto goblin = addMob("goblin");
    goblin->aggroTarget = sre::foundation::PlayerId(2);

    engine().CastSpell(*caster_, "bolt goblin");

    EXPECT_EQ(goblin->aggroTarget, sre::foundation::PlayerId(2));
    EXPECT_FALSE(goblin->aggroLastAttack.has_value());
}

TEST_F(DamageResolverTest, PoisonDamageAttachesPoison) {
    learnBolt("1d4", "poison");
    auto goblin = addMob("goblin");

    engine().CastSpell(*caster_, "bolt goblin");

    ASSERT_TRUE(goblin->effects.Has(StatusKind::Poison));
    const auto& poison = goblin->effects.Entries().front();
    EXPECT_EQ(poison.source, "Bolt");
    EXPECT_EQ(poison.remainingDuration, 5);
    EXPECT_EQ(poison.tickDamage, "1d2");
    EXPECT_EQ(poison.casterId, caster_->playerId);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "goblin is poisoned!"));
}

TEST_F(DamageResolverTest, CustomMessages) {
    auto spell = makeSpell("bolt", "Bolt", SpellFamily::Damage);
    spell.requiresTarget = true;
    spell.damageDice = "3";
    spell.castMessage = "{caster} point at {target}.";
    spell.hitMessage = "Zap for {damage}!";
    learn(spell);
    addMob("goblin");

    engine().CastSpell(*caster_, "bolt goblin");

    EXPECT_TRUE(messaging_.told(caster_->playerId, "You point at goblin. Zap for 3!"));
    EXPECT_TRUE(messaging_.broadcastContains("Aldric point at goblin."));
}

// ---------------------------------------------------------------------------
// Area
// ---------------------------------------------------------------------------

TEST_F(DamageResolverTest, AreaWithNoMobs) {
    learnStorm();
    EXPECT_EQ(engine().CastSpell(*caster_, "storm"), CastOutcome::Resolved);
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "You cast Storm, but there are no enemies to affect!"));
}

TEST_F(DamageResolverTest, AreaRollsOnceAndHitsEveryMob) {
    learnStorm("2d6");
    auto a = addMob("goblin", 30);
    auto b = addMob("orc", 40);
    random_.pushInts({3, 4});

    engine().CastSpell(*caster_, "storm");

    EXPECT_EQ(a->vitals.health, 23);
    EXPECT_EQ(b->vitals.health, 33);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "  goblin takes 7 fire damage!"));
    EXPECT_TRUE(messaging_.told(caster_->playerId, "  orc takes 7 fire damage!"));
    EXPECT_TRUE(messaging_.broadcastContains("A wave of fire energy fills the room!"));
    EXPECT_EQ(oracle_.calls, 0);
}

TEST_F(DamageResolverTest, AreaDeathsAreRemovedAfterTheSweep) {
    learnStorm("10");
    addMob("rat", 5);
    auto orc = addMob("orc", 40);
    addMob("bat", 3);

    engine().CastSpell(*caster_, "storm");

    EXPECT_EQ(lifecycle_.deaths, (std::vector<std::string>{"rat", "bat"}));
    EXPECT_EQ(rooms_.MobCount(kRoom), 1u);
    EXPECT_EQ(orc->vitals.health, 30);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "  rat has been defeated!"));

    // Every hit line comes before the first defeat line.
    auto lines = messaging_.to(caster_->playerId);
    std::size_t lastHit = 0;
    std::size_t firstDefeat = lines.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].find("takes") != std::string::npos) {
            lastHit = i;
        }
        if (lines[i].find("defeated") != std::string::npos && firstDefeat == lines.size()) {
            firstDefeat = i;
        }
    }
    EXPECT_LT(lastHit, firstDefeat);
}

TEST_F(DamageResolverTest, AreaPoisonMarksEachMob) {
    learnStorm("1", "poison");
    auto a = addMob("goblin");
    auto b = addMob("orc");

    engine().CastSpell(*caster_, "storm");

    EXPECT_TRUE(a->effects.Has(StatusKind::Poison));
    EXPECT_TRUE(b->effects.Has(StatusKind::Poison));
    EXPECT_TRUE(messaging_.told(caster_->playerId, "  orc takes 1 poison damage! (poisoned!)"));
}
