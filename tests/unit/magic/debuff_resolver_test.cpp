#include <gtest/gtest.h>

#include "magic/magic_test_fixtures.hpp"

using namespace sre::magic;
using namespace sre::magic::testing;

class DebuffResolverTest : public SpellEngineTest {
protected:
    const SpellDefinition& learnHold(bool area = false, std::string dice = "") {
        auto spell = makeSpell(area ? "mass_hold" : "hold", area ? "Mass Hold" : "Hold",
                               SpellFamily::Debuff, EffectKind::Paralyze);
        spell.area = area ? AreaOfEffect::Area : AreaOfEffect::Single;
        spell.effectDuration = 3;
        spell.damageDice = std::move(dice);
        return learn(spell);
    }
};

TEST_F(DebuffResolverTest, SingleTargetParalyzes) {
    learnHold();
    auto ogre = addMob("ogre");

    EXPECT_EQ(engine().CastSpell(*caster_, "hold og"), CastOutcome::Resolved);

    ASSERT_TRUE(ogre->effects.Has(StatusKind::Paralyze));
    const auto& entry = ogre->effects.Entries().front();
    EXPECT_EQ(entry.remainingDuration, 3);
    EXPECT_EQ(entry.casterId, caster_->playerId);
    EXPECT_EQ(ogre->aggroTarget, caster_->playerId);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "ogre is afflicted with Paralyze!"));
    EXPECT_TRUE(messaging_.broadcastContains("Aldric casts Hold at ogre!"));
    EXPECT_EQ(oracle_.calls, 0);
}

TEST_F(DebuffResolverTest, SingleTargetNeedsTarget) {
    learnHold();
    EXPECT_EQ(engine().CastSpell(*caster_, "hold"), CastOutcome::MissingTarget);
    EXPECT_EQ(caster_->vitals.mana, 100);
}

TEST_F(DebuffResolverTest, CharmKind) {
    auto spell = makeSpell("beguile", "Beguile", SpellFamily::Debuff, EffectKind::Charm);
    learn(spell);
    auto ogre = addMob("ogre");

    engine().CastSpell(*caster_, "beguile ogre");

    EXPECT_TRUE(ogre->effects.Has(StatusKind::Charm));
    EXPECT_EQ(ogre->effects.Entries().front().remainingDuration, 5);
}

TEST_F(DebuffResolverTest, DamageIsReported) {
    learnHold(false, "4");
    auto ogre = addMob("ogre", 30);

    engine().CastSpell(*caster_, "hold ogre");

    EXPECT_EQ(ogre->vitals.health, 26);
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "You casts Hold at ogre! It takes 4 damage! "
                                "ogre is afflicted with Paralyze!"));
}

TEST_F(DebuffResolverTest, LethalDamageSkipsAffliction) {
    learnHold(false, "10");
    auto rat = addMob("rat", 6);

    engine().CastSpell(*caster_, "hold rat");

    EXPECT_TRUE(rat->effects.Empty());
    EXPECT_FALSE(messaging_.told(caster_->playerId, "afflicted"));
    EXPECT_TRUE(messaging_.told(caster_->playerId, "rat has been defeated!"));
    EXPECT_EQ(rooms_.MobCount(kRoom), 0u);
}

TEST_F(DebuffResolverTest, AreaWithNoTargets) {
    learnHold(true);
    EXPECT_EQ(engine().CastSpell(*caster_, "mass hold"), CastOutcome::Resolved);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "There are no targets in range."));
}

TEST_F(DebuffResolverTest, AreaAfflictsEveryMobAndCollectsDeaths) {
    learnHold(true, "5");
    auto rat = addMob("rat", 4);
    auto ogre = addMob("ogre", 30);

    engine().CastSpell(*caster_, "mass hold");

    EXPECT_TRUE(messaging_.told(caster_->playerId, "Paralyze affects all enemies!"));
    EXPECT_TRUE(ogre->effects.Has(StatusKind::Paralyze));
    EXPECT_EQ(ogre->vitals.health, 25);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "  ogre takes 5 damage!"));
    EXPECT_TRUE(messaging_.told(caster_->playerId, "  rat has been defeated!"));
    EXPECT_EQ(lifecycle_.deaths, std::vector<std::string>{"rat"});
    EXPECT_TRUE(rat->effects.Empty());
}

// ---------------------------------------------------------------------------
// Stat drain
// ---------------------------------------------------------------------------

TEST_F(DebuffResolverTest, StatDrainLowersCoreStatsAndRecordsDeltas) {
    auto spell = makeSpell("wither", "Wither", SpellFamily::Debuff, EffectKind::StatDrain);
    spell.effectAmountDice = "-2";
    spell.effectDuration = 2;
    learn(spell);
    auto ogre = addMob("ogre");
    ogre->stats.Set(Stat::Wisdom, 2);
    auto before = ogre->stats;

    EXPECT_EQ(engine().CastSpell(*caster_, "wither og"), CastOutcome::Resolved);

    EXPECT_EQ(ogre->stats.Get(Stat::Strength), 8);
    EXPECT_EQ(ogre->stats.Get(Stat::Charisma), 8);
    EXPECT_EQ(ogre->stats.Get(Stat::Wisdom), kMinStatValue);
    EXPECT_EQ(ogre->stats.Get(Stat::Vitality), 10);
    ASSERT_TRUE(ogre->effects.Has(StatusKind::StatDrain));
    const auto& entry = ogre->effects.Entries().front();
    EXPECT_EQ(entry.magnitude, 2);
    EXPECT_EQ(entry.effectKey, "stat_drain");
    EXPECT_EQ(entry.statDeltas.size(), 6u);
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "ogre is afflicted with Stat Drain! ogre's stats are drained "
                                "by 2!"));

    engine().Tick(*ogre);
    auto report = engine().Tick(*ogre);
    EXPECT_EQ(report.expired, 1u);
    EXPECT_EQ(ogre->stats, before);
}

TEST_F(DebuffResolverTest, StatDrainIsReversedByCure) {
    auto spell = makeSpell("wither", "Wither", SpellFamily::Debuff, EffectKind::StatDrain);
    learn(spell);
    auto ogre = addMob("ogre");
    random_.pushInts({4});

    engine().CastSpell(*caster_, "wither ogre");
    EXPECT_EQ(ogre->stats.Get(Stat::Dexterity), 6);

    EXPECT_EQ(engine().Cure(*ogre, StatusKind::StatDrain), 1);
    EXPECT_EQ(ogre->stats.Get(Stat::Dexterity), 10);
}

TEST_F(DebuffResolverTest, AreaStatDrainUsesOneRoll) {
    auto spell = makeSpell("blight", "Blight", SpellFamily::Debuff, EffectKind::StatDrain);
    spell.area = AreaOfEffect::Area;
    spell.effectAmountDice = "1d5";
    learn(spell);
    auto rat = addMob("rat");
    auto bat = addMob("bat");
    random_.pushInts({3, 5});

    engine().CastSpell(*caster_, "blight");

    EXPECT_EQ(rat->stats.Get(Stat::Strength), 7);
    EXPECT_EQ(bat->stats.Get(Stat::Strength), 7);
    EXPECT_EQ(random_.pendingInts(), 1u);
}
