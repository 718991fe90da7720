#include <gtest/gtest.h>

#include <algorithm>

#include "magic/magic_test_fixtures.hpp"

using namespace sre::magic;
using namespace sre::magic::testing;

class SummonResolverTest : public SpellEngineTest {
protected:
    void SetUp() override {
        SpellEngineTest::SetUp();
        for (int level = 1; level <= 10; ++level) {
            creatures_.Add(makeTemplate("beast" + std::to_string(level), level));
        }
        creatures_.Add(makeTemplate("skeleton", 2, "undead"));
        creatures_.Add(makeTemplate("kusamuda", 2, "beast", true));
    }

    SpellDefinition summonSpell() {
        auto spell = makeSpell("call", "Call", SpellFamily::Summon);
        spell.description = "a call to the wild";
        spell.summon.minLevel = 2;
        spell.summon.maxLevel = 2;
        return spell;
    }
};

// ---------------------------------------------------------------------------
// Eligibility
// ---------------------------------------------------------------------------

TEST_F(SummonResolverTest, ScalingWindowAtLevelTwelve) {
    auto spell = summonSpell();
    spell.scalesSummonWithLevel = true;

    EXPECT_EQ(SummonResolver::LevelRange(spell, 12), std::make_pair(1, 6));

    auto eligible = SummonResolver::Eligible(creatures_.All(), spell, 12);
    ASSERT_FALSE(eligible.empty());
    for (const auto& tmpl : eligible) {
        EXPECT_GE(tmpl.level, 1);
        EXPECT_LE(tmpl.level, 6);
    }
}

TEST_F(SummonResolverTest, ScalingWindowIsNeverEmpty) {
    auto spell = summonSpell();
    spell.scalesSummonWithLevel = true;
    EXPECT_EQ(SummonResolver::LevelRange(spell, 1), std::make_pair(1, 1));
    EXPECT_EQ(SummonResolver::LevelRange(spell, 3), std::make_pair(1, 2));
}

TEST_F(SummonResolverTest, FixedRangeTypeAndTerrain) {
    auto spell = summonSpell();

    auto eligible = SummonResolver::Eligible(creatures_.All(), spell, 30);
    ASSERT_EQ(eligible.size(), 2u);  // beast2 and skeleton; kusamuda is terrain-bound

    spell.summon.summonType = "UNDEAD";
    eligible = SummonResolver::Eligible(creatures_.All(), spell, 30);
    ASSERT_EQ(eligible.size(), 1u);
    EXPECT_EQ(eligible[0].id, "skeleton");

    spell.summon.summonType.reset();
    spell.summon.allowSpecialTerrain = true;
    eligible = SummonResolver::Eligible(creatures_.All(), spell, 30);
    EXPECT_EQ(eligible.size(), 3u);
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

TEST_F(SummonResolverTest, SummonedCreatureIsFriendlyAndTracked) {
    auto spell = summonSpell();
    spell.summon.summonType = "undead";
    learn(spell);

    EXPECT_EQ(engine().CastSpell(*caster_, "call"), CastOutcome::Resolved);

    auto mobs = rooms_.ListMobs(kRoom);
    ASSERT_EQ(mobs.size(), 1u);
    const auto& summon = *mobs[0];
    EXPECT_EQ(summon.templateId, "skeleton");
    EXPECT_FALSE(summon.hostile);
    EXPECT_TRUE(summon.summoned);
    EXPECT_EQ(summon.summoner, caster_->playerId);
    EXPECT_EQ(summon.partyLeader, caster_->playerId);
    EXPECT_EQ(summon.vitals.health, 20);
    EXPECT_EQ(summon.instanceId, "skeleton_1_1");

    EXPECT_EQ(parties_.SummonsOf(caster_->playerId),
              std::vector<std::string>{"skeleton_1_1"});
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "You intone Call! A skeleton appears in a puff of reddish smoke!"));
    EXPECT_TRUE(messaging_.broadcastContains("Aldric intones a summoning spell!"));
}

TEST_F(SummonResolverTest, SummonsAreTrackedUnderThePartyLeader) {
    auto spell = summonSpell();
    spell.summon.summonType = "undead";
    learn(spell);
    caster_->partyLeader = sre::foundation::PlayerId(9);

    engine().CastSpell(*caster_, "call");

    EXPECT_EQ(parties_.SummonsOf(sre::foundation::PlayerId(9)).size(), 1u);
    EXPECT_TRUE(parties_.SummonsOf(caster_->playerId).empty());
    EXPECT_EQ(rooms_.ListMobs(kRoom)[0]->summoner, caster_->playerId);
}

TEST_F(SummonResolverTest, RandomPickAmongEligible) {
    auto spell = summonSpell();
    spell.scalesSummonWithLevel = true;
    learn(spell);
    caster_->level = 5;  // window [1, 3]
    random_.pushInts({1});

    engine().CastSpell(*caster_, "call");

    auto eligible = SummonResolver::Eligible(creatures_.All(), spell, 5);
    auto mobs = rooms_.ListMobs(kRoom);
    ASSERT_EQ(mobs.size(), 1u);
    EXPECT_EQ(mobs[0]->templateId, eligible[1].id);
    EXPECT_LE(mobs[0]->level, 3);
}

TEST_F(SummonResolverTest, NoEligibleTemplate) {
    auto spell = summonSpell();
    spell.summon.minLevel = 40;
    spell.summon.maxLevel = 50;
    learn(spell);

    EXPECT_EQ(engine().CastSpell(*caster_, "call"), CastOutcome::Resolved);
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "The summoning spell fails - no creatures answer your call!"));
    EXPECT_EQ(rooms_.MobCount(kRoom), 0u);
}

TEST_F(SummonResolverTest, CrowdedRoom) {
    config_.maxRoomMobs = 2;
    learn(summonSpell());
    addMob("rat");
    addMob("bat");

    EXPECT_EQ(engine().CastSpell(*caster_, "call"), CastOutcome::Resolved);

    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "The spell succeeds, but the room is too crowded for your summon "
                                "to appear!"));
    EXPECT_TRUE(messaging_.broadcastContains("Aldric just intoned a call to the wild!"));
    EXPECT_EQ(rooms_.MobCount(kRoom), 2u);
    EXPECT_EQ(caster_->vitals.mana, 95);
}

TEST_F(SummonResolverTest, InstanceIdsAreUnique) {
    auto spell = summonSpell();
    spell.summon.summonType = "undead";
    learn(spell);

    engine().CastSpell(*caster_, "call");
    clock_.advance(std::chrono::seconds(60));
    engine().CastSpell(*caster_, "call");

    auto mobs = rooms_.ListMobs(kRoom);
    ASSERT_EQ(mobs.size(), 2u);
    EXPECT_NE(mobs[0]->instanceId, mobs[1]->instanceId);
    EXPECT_NE(mobs[0]->id, mobs[1]->id);
}
