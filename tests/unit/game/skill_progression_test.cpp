#include <gtest/gtest.h>

#include "gec/game/derived_stats.hpp"
#include "gec/game/experience_table.hpp"
#include "gec/game/skill_types.hpp"

using namespace gec::game;

// =============================================================================
// Experience curve
// =============================================================================

TEST(ExperienceTableTest, KnownThresholds) {
    EXPECT_EQ(experienceForLevel(1), 0);
    EXPECT_EQ(experienceForLevel(2), 83);
    EXPECT_EQ(experienceForLevel(10), 1'154);
    EXPECT_EQ(experienceForLevel(50), 101'333);
    EXPECT_EQ(experienceForLevel(92), 6'517'253);
    EXPECT_EQ(experienceForLevel(99), 13'034'431);
}

TEST(ExperienceTableTest, LevelsOutsideRangeAreClamped) {
    EXPECT_EQ(experienceForLevel(0), 0);
    EXPECT_EQ(experienceForLevel(120), 13'034'431);
}

TEST(ExperienceTableTest, LevelForExperienceBoundaries) {
    EXPECT_EQ(levelForExperience(0), 1);
    EXPECT_EQ(levelForExperience(82), 1);
    EXPECT_EQ(levelForExperience(83), 2);
    EXPECT_EQ(levelForExperience(1'154), 10);
    EXPECT_EQ(levelForExperience(13'034'430), 98);
    EXPECT_EQ(levelForExperience(13'034'431), 99);
    EXPECT_EQ(levelForExperience(kMaxExperience), 99);
}

TEST(ExperienceTableTest, CurveIsStrictlyIncreasing) {
    for (int32_t level = 2; level <= kMaxSkillLevel; ++level) {
        EXPECT_GT(experienceForLevel(level), experienceForLevel(level - 1)) << "level " << level;
        EXPECT_EQ(levelForExperience(experienceForLevel(level)), level);
    }
}

// =============================================================================
// Skills
// =============================================================================

TEST(SkillTypesTest, TwentyThreeSkills) {
    EXPECT_EQ(kSkillCount, 23u);
    EXPECT_EQ(skillName(Skill::Runecrafting), "runecrafting");
}

TEST(SkillTypesTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseSkill("Attack").value_or(Skill::COUNT), Skill::Attack);
    EXPECT_EQ(parseSkill("HITPOINTS").value_or(Skill::COUNT), Skill::Hitpoints);
    EXPECT_EQ(parseSkill("defense").value_or(Skill::COUNT), Skill::Defence);
    EXPECT_FALSE(parseSkill("sailing").has_value());
}

TEST(SkillTypesTest, BaselineHasTrainedHitpoints) {
    auto skills = baselineSkills();
    EXPECT_EQ(skills[skillIndex(Skill::Hitpoints)].level, 10);
    EXPECT_EQ(skills[skillIndex(Skill::Hitpoints)].experience, 1'154);
    EXPECT_EQ(skills[skillIndex(Skill::Attack)].level, 1);
    EXPECT_EQ(skills[skillIndex(Skill::Attack)].experience, 0);
    EXPECT_FALSE(skills[skillIndex(Skill::Mining)].lastTrained.has_value());
}

TEST(SkillTypesTest, CombatSkillSet) {
    EXPECT_TRUE(isCombatSkill(Skill::Prayer));
    EXPECT_TRUE(isCombatSkill(Skill::Magic));
    EXPECT_FALSE(isCombatSkill(Skill::Slayer));
    EXPECT_FALSE(isCombatSkill(Skill::Cooking));
}

// =============================================================================
// Derived stats
// =============================================================================

TEST(DerivedStatsTest, FreshPlayer) {
    auto skills = baselineSkills();
    EXPECT_EQ(computeTotalLevel(skills), 32);
    EXPECT_EQ(computeCombatLevel(skills), 3);
}

TEST(DerivedStatsTest, AllFiftyCombatIsSixtyThree) {
    CombatSkills c;
    c.attack = c.strength = c.defence = c.hitpoints = c.prayer = c.ranged = c.magic = 50;
    EXPECT_EQ(computeCombatLevel(c), 63);
}

TEST(DerivedStatsTest, MaxedCombatIs126) {
    CombatSkills c;
    c.attack = c.strength = c.defence = c.hitpoints = c.prayer = c.ranged = c.magic = 99;
    EXPECT_EQ(computeCombatLevel(c), 126);
}

TEST(DerivedStatsTest, RangedDominatesWhenHigher) {
    CombatSkills c;
    c.defence = 1;
    c.hitpoints = 10;
    c.prayer = 1;
    c.ranged = 99;
    // 0.25 * 11 + 0.325 * 148 = 2.75 + 48.1
    EXPECT_EQ(computeCombatLevel(c), 50);
}

TEST(DerivedStatsTest, TotalLevelSumsEverySkill) {
    auto skills = baselineSkills();
    skills[skillIndex(Skill::Woodcutting)].level = 60;
    skills[skillIndex(Skill::Attack)].level = 40;
    EXPECT_EQ(computeTotalLevel(skills), 32 + 59 + 39);
    EXPECT_EQ(CombatSkills::From(skills).attack, 40);
}
