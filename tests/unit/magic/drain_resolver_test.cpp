#include <gtest/gtest.h>

#include "magic/magic_test_fixtures.hpp"

using namespace sre::magic;
using namespace sre::magic::testing;

class DrainResolverTest : public SpellEngineTest {
protected:
    SpellDefinition drainSpell(EffectKind kind, std::string damage, std::string amount = "",
                               int32_t duration = 10) {
        auto spell = makeSpell("leech", "Leech", SpellFamily::Drain, kind);
        spell.damageDice = std::move(damage);
        spell.effectAmountDice = std::move(amount);
        spell.effectDuration = duration;
        return spell;
    }

    void learnDrain(EffectKind kind, std::string damage, std::string amount = "",
                    int32_t duration = 10) {
        learn(drainSpell(kind, std::move(damage), std::move(amount), duration));
    }
};

// ---------------------------------------------------------------------------
// Mana
// ---------------------------------------------------------------------------

TEST_F(DrainResolverTest, ManaDrainIsLimitedByTargetMana) {
    learnDrain(EffectKind::DrainMana, "2", "1d3");
    auto imp = addMob("imp", 30, 1);
    random_.pushInts({3});

    engine().CastSpell(*caster_, "leech imp");

    EXPECT_EQ(imp->vitals.mana, 0);
    EXPECT_EQ(caster_->vitals.mana, 96);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "You drain 1 mana!"));
}

TEST_F(DrainResolverTest, ManaDrainIsClampedToCasterMax) {
    auto spell = drainSpell(EffectKind::DrainMana, "2", "-1d3");
    spell.manaCost = 0;
    learn(spell);
    auto imp = addMob("imp", 30, 10);
    random_.pushInts({3});

    engine().CastSpell(*caster_, "leech imp");

    EXPECT_EQ(imp->vitals.mana, 7);
    EXPECT_EQ(caster_->vitals.mana, 100);
}

TEST_F(DrainResolverTest, ManaDrainDefaultAmount) {
    learnDrain(EffectKind::DrainMana, "2");
    auto imp = addMob("imp", 30, 10);
    random_.pushInts({2});

    engine().CastSpell(*caster_, "leech imp");

    EXPECT_EQ(imp->vitals.mana, 8);
}

// ---------------------------------------------------------------------------
// Health
// ---------------------------------------------------------------------------

TEST_F(DrainResolverTest, HealthDrainHealsCasterByDamageDealt) {
    learnDrain(EffectKind::DrainHealth, "8");
    auto ogre = addMob("ogre", 30);
    caster_->vitals.health = 90;

    engine().CastSpell(*caster_, "leech ogre");

    EXPECT_EQ(ogre->vitals.health, 22);
    EXPECT_EQ(caster_->vitals.health, 98);
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "You casts Leech at ogre! It strikes for 8 force damage! "
                                "You absorb 8 HP!"));
}

TEST_F(DrainResolverTest, HealthDrainIsLimitedByTargetHealthAndCasterMissingHealth) {
    learnDrain(EffectKind::DrainHealth, "8");
    addMob("rat", 5);
    caster_->vitals.health = 50;

    engine().CastSpell(*caster_, "leech rat");

    EXPECT_EQ(caster_->vitals.health, 55);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "rat has been defeated!"));

    clock_.advance(std::chrono::seconds(60));
    addMob("ogre", 30);
    caster_->vitals.health = 97;
    engine().CastSpell(*caster_, "leech ogre");
    EXPECT_EQ(caster_->vitals.health, 100);
}

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

TEST_F(DrainResolverTest, StatDrainRecordsDeltasAndRestoresOnExpiry) {
    learnDrain(EffectKind::DrainBody, "1", "-2", 2);
    auto ogre = addMob("ogre", 30);
    auto before = ogre->stats;

    engine().CastSpell(*caster_, "leech ogre");

    EXPECT_EQ(ogre->stats.Get(Stat::Strength), 8);
    EXPECT_EQ(ogre->stats.Get(Stat::Dexterity), 8);
    EXPECT_EQ(ogre->stats.Get(Stat::Constitution), 8);
    ASSERT_TRUE(ogre->effects.Has(StatusKind::StatDrain));
    EXPECT_EQ(ogre->effects.Entries().front().statDeltas.size(), 3u);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "ogre's stats are drained by 2!"));

    engine().Tick(*ogre);
    EXPECT_EQ(ogre->stats.Get(Stat::Strength), 8);
    auto report = engine().Tick(*ogre);
    EXPECT_EQ(report.expired, 1u);
    EXPECT_EQ(ogre->stats, before);
}

TEST_F(DrainResolverTest, StatDrainIsFlooredAtMinimum) {
    learnDrain(EffectKind::DrainAgility, "1", "5");
    auto imp = addMob("imp", 30);
    imp->stats.Set(Stat::Dexterity, 3);

    engine().CastSpell(*caster_, "leech imp");

    EXPECT_EQ(imp->stats.Get(Stat::Dexterity), kMinStatValue);
    const auto& deltas = imp->effects.Entries().front().statDeltas;
    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_EQ(deltas[0].amount, -2);

    engine().Cure(*imp, StatusKind::StatDrain);
    EXPECT_EQ(imp->stats.Get(Stat::Dexterity), 3);
}

// ---------------------------------------------------------------------------
// Accuracy and targeting
// ---------------------------------------------------------------------------

TEST_F(DrainResolverTest, MissDrainsNothing) {
    learnDrain(EffectKind::DrainMana, "2", "1d3");
    auto imp = addMob("imp", 30, 5);
    oracle_.push(AttackOutcome::Miss);

    engine().CastSpell(*caster_, "leech imp");

    EXPECT_EQ(imp->vitals.mana, 5);
    EXPECT_EQ(imp->vitals.health, 30);
    EXPECT_EQ(caster_->vitals.mana, 95);
}

TEST_F(DrainResolverTest, RequiresTarget) {
    learnDrain(EffectKind::DrainMana, "2");
    EXPECT_EQ(engine().CastSpell(*caster_, "leech"), CastOutcome::MissingTarget);
}

TEST(DrainedStatsTest, Groups) {
    EXPECT_EQ(drainedStats(EffectKind::DrainPhysique), std::vector<Stat>{Stat::Constitution});
    EXPECT_EQ(drainedStats(EffectKind::DrainBody),
              (std::vector<Stat>{Stat::Strength, Stat::Dexterity, Stat::Constitution}));
    EXPECT_TRUE(drainedStats(EffectKind::DrainMana).empty());
}
