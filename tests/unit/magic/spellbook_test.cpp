#include <gtest/gtest.h>

#include "magic/magic_test_fixtures.hpp"

using namespace sre::magic;
using namespace sre::magic::testing;

class SpellbookTest : public SpellEngineTest {
protected:
    void learnBolts() {
        auto fire = makeSpell("fire_bolt", "Fire Bolt", SpellFamily::Damage);
        fire.damageDice = "2d4";
        learn(fire);
        auto frost = makeSpell("frost_bolt", "Frost Bolt", SpellFamily::Damage);
        frost.damageDice = "1d6";
        frost.damageType = "cold";
        learn(frost);
    }
};

// ---------------------------------------------------------------------------
// DescribeSpellbook
// ---------------------------------------------------------------------------

TEST_F(SpellbookTest, DescribeEmpty) {
    EXPECT_EQ(engine().DescribeSpellbook(*caster_),
              "Your spellbook is empty. You haven't learned any spells yet.");
}

TEST_F(SpellbookTest, DescribeListsEachSpell) {
    learnBolts();

    EXPECT_EQ(engine().DescribeSpellbook(*caster_),
              "=== Your Spellbook ===\n"
              "\n"
              "Fire Bolt (Level 1) - 5 mana\n"
              "  test spell\n"
              "  Damage: 2d4 (magical)\n"
              "\n"
              "Frost Bolt (Level 1) - 5 mana\n"
              "  test spell\n"
              "  Damage: 1d6 (cold)\n"
              "\n");
}

TEST_F(SpellbookTest, DescribeShowsCooldown) {
    learnBolts();
    caster_->resources.cooldowns["frost_bolt"] = 3;

    auto text = engine().DescribeSpellbook(*caster_);

    EXPECT_NE(text.find("Frost Bolt (Level 1) - 5 mana [COOLDOWN: 3 rounds]\n"),
              std::string::npos);
    EXPECT_NE(text.find("Fire Bolt (Level 1) - 5 mana\n"), std::string::npos);
}

TEST_F(SpellbookTest, DescribeToleratesMissingSpellData) {
    caster_->spellbook.push_back("ghost_ray");

    auto text = engine().DescribeSpellbook(*caster_);

    EXPECT_NE(text.find("ghost_ray (spell data not found)\n"), std::string::npos);
}

// ---------------------------------------------------------------------------
// ForgetSpell
// ---------------------------------------------------------------------------

TEST_F(SpellbookTest, ForgetWithEmptySpellbook) {
    EXPECT_FALSE(engine().ForgetSpell(*caster_, "bolt"));
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "Your spellbook is empty. You don't know any spells to unlearn."));
}

TEST_F(SpellbookTest, ForgetUnknownSpell) {
    learnBolts();

    EXPECT_FALSE(engine().ForgetSpell(*caster_, "zap"));
    EXPECT_TRUE(messaging_.told(caster_->playerId,
                                "You don't know a spell called 'zap'. Use 'spellbook' to see "
                                "your spells."));
    EXPECT_EQ(caster_->spellbook.size(), 2u);
}

TEST_F(SpellbookTest, ForgetBlankText) {
    learnBolts();
    EXPECT_FALSE(engine().ForgetSpell(*caster_, "   "));
    EXPECT_EQ(caster_->spellbook.size(), 2u);
}

TEST_F(SpellbookTest, ForgetAmbiguousFragmentListsMatches) {
    learnBolts();

    EXPECT_FALSE(engine().ForgetSpell(*caster_, "bolt"));

    ASSERT_EQ(messaging_.to(caster_->playerId).size(), 1u);
    EXPECT_EQ(messaging_.to(caster_->playerId)[0],
              "Multiple spells match 'bolt':\n"
              "  - Fire Bolt (fire_bolt)\n"
              "  - Frost Bolt (frost_bolt)\n"
              "Please be more specific.");
    EXPECT_EQ(caster_->spellbook.size(), 2u);
}

TEST_F(SpellbookTest, ForgetByExactIdClearsCooldown) {
    learnBolts();
    caster_->resources.cooldowns["fire_bolt"] = 2;

    EXPECT_TRUE(engine().ForgetSpell(*caster_, "fire_bolt"));

    EXPECT_EQ(caster_->spellbook, std::vector<std::string>{"frost_bolt"});
    EXPECT_EQ(caster_->resources.CooldownFor("fire_bolt"), 0);
    EXPECT_TRUE(messaging_.told(caster_->playerId, "You have forgotten the spell: Fire Bolt"));
    ASSERT_EQ(messaging_.broadcasts.size(), 1u);
    EXPECT_EQ(messaging_.broadcasts[0].except, caster_->playerId);
    EXPECT_EQ(messaging_.broadcasts[0].text,
              "Aldric concentrates deeply, erasing knowledge of a spell from their mind.");
}

TEST_F(SpellbookTest, ForgetByUniqueNameFragment) {
    learnBolts();

    EXPECT_TRUE(engine().ForgetSpell(*caster_, "FROST"));

    EXPECT_EQ(caster_->spellbook, std::vector<std::string>{"fire_bolt"});
    EXPECT_TRUE(messaging_.told(caster_->playerId, "You have forgotten the spell: Frost Bolt"));
}
