#include <gtest/gtest.h>

#include "sre/magic/message_template.hpp"

using namespace sre::magic;

TEST(MessageTemplateTest, SubstitutesEveryPlaceholder) {
    MessageBindings b;
    b.caster = "Aldric";
    b.target = "goblin";
    b.spell = "Fireball";
    b.damage = "12";
    b.damageType = "fire";

    EXPECT_EQ(renderMessage("{caster} hurls {spell} at {target} for {damage} {damage_type} damage!", b),
              "Aldric hurls Fireball at goblin for 12 fire damage!");
}

TEST(MessageTemplateTest, RepeatedPlaceholders) {
    MessageBindings b;
    b.target = "orc";
    EXPECT_EQ(renderMessage("{target}, {target}!", b), "orc, orc!");
}

TEST(MessageTemplateTest, EmptyBindingsAndUnknownBracesAreLeftAlone) {
    MessageBindings b;
    b.spell = "Bless";
    EXPECT_EQ(renderMessage("{caster} casts {spell} {weather}", b), "{caster} casts Bless {weather}");
}

TEST(MessageTemplateTest, MobPlaceholders) {
    MessageBindings b;
    b.mobPrefix = "An";
    b.mobName = "imp";
    b.effect = "Paralysis";
    EXPECT_EQ(renderMessage("{mob_prefix} {mob_name} resists {effect}.", b),
              "An imp resists Paralysis.");
}

TEST(MessageTemplateTest, ReplaceAllWithEmptyNeedle) {
    EXPECT_EQ(replaceAll("abc", "", "x"), "abc");
    EXPECT_EQ(replaceAll("aaa", "a", "aa"), "aaaaaa");
}

TEST(MessageTemplateTest, IndefiniteArticle) {
    EXPECT_EQ(indefiniteArticle("orc"), "An");
    EXPECT_EQ(indefiniteArticle("Elemental"), "An");
    EXPECT_EQ(indefiniteArticle("goblin"), "A");
    EXPECT_EQ(indefiniteArticle(""), "A");
}

TEST(TextHelpersTest, CaseInsensitiveMatching) {
    EXPECT_EQ(toLower("MiXeD"), "mixed");
    EXPECT_TRUE(iequals("Brenna", "bRENNA"));
    EXPECT_FALSE(iequals("Bren", "Brenna"));
    EXPECT_TRUE(icontains("Skeleton Warrior", "warr"));
    EXPECT_FALSE(icontains("Skeleton", "zombie"));
}

TEST(TextHelpersTest, Capitalization) {
    EXPECT_EQ(capitalize("poison"), "Poison");
    EXPECT_EQ(capitalize(""), "");
    EXPECT_EQ(titleCase("stat_drain"), "Stat Drain");
    EXPECT_EQ(titleCase("AC_BONUS"), "Ac Bonus");
}
