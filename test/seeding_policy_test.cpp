#include <catch2/catch.hpp>

#include "test_support.hpp"
#include "seeding_policy.hpp"

using std::chrono::seconds;

TEST_CASE("Seed ratio", "[seeding]")
{
  REQUIRE(seed_ratio(500, 1000) == Approx(0.5));
  REQUIRE(seed_ratio(2000, 1000) == Approx(2.0));
  REQUIRE(seed_ratio(100, 0) == 0.0);
}

TEST_CASE("No goal never stops seeding", "[seeding]")
{
  GoalConfig goal;
  const auto now = Clock::now();

  REQUIRE_FALSE(seeding_goal_met(goal, 1000000, 1000, now - seconds(100000), now));
}

TEST_CASE("Ratio goal", "[seeding]")
{
  GoalConfig goal;
  goal.target_ratio = 1.0;
  const auto now = Clock::now();

  REQUIRE_FALSE(seeding_goal_met(goal, 999, 1000, now, now));
  REQUIRE(seeding_goal_met(goal, 1000, 1000, now, now));
  REQUIRE(seeding_goal_met(goal, 1500, 1000, now, now));
}

TEST_CASE("Seed time goal", "[seeding]")
{
  GoalConfig goal;
  goal.target_seed_time = seconds(60);
  const auto now = Clock::now();

  REQUIRE_FALSE(seeding_goal_met(goal, 0, 1000, now - seconds(59), now));
  REQUIRE(seeding_goal_met(goal, 0, 1000, now - seconds(60), now));
  REQUIRE_FALSE(seeding_goal_met(goal, 0, 1000, std::nullopt, now));
}

TEST_CASE("Either goal stops seeding by default", "[seeding]")
{
  GoalConfig goal;
  goal.target_ratio = 2.0;
  goal.target_seed_time = seconds(60);
  const auto now = Clock::now();

  REQUIRE_FALSE(seeding_goal_met(goal, 1000, 1000, now - seconds(10), now));
  REQUIRE(seeding_goal_met(goal, 2000, 1000, now - seconds(10), now));
  REQUIRE(seeding_goal_met(goal, 1000, 1000, now - seconds(60), now));
}

TEST_CASE("All goals must be met", "[seeding]")
{
  GoalConfig goal;
  goal.target_ratio = 2.0;
  goal.target_seed_time = seconds(60);
  goal.policy = GoalPolicy::AllGoals;
  const auto now = Clock::now();

  REQUIRE_FALSE(seeding_goal_met(goal, 2000, 1000, now - seconds(10), now));
  REQUIRE_FALSE(seeding_goal_met(goal, 1000, 1000, now - seconds(60), now));
  REQUIRE(seeding_goal_met(goal, 2000, 1000, now - seconds(60), now));

  goal.target_seed_time.reset();
  REQUIRE(seeding_goal_met(goal, 2000, 1000, std::nullopt, now));
}

TEST_CASE("Enforcer finishes seeding when goal is met", "[seeding]")
{
  auto state = std::make_shared<FakeEngineState>();
  EngineSession session(std::make_unique<FakeEngine>(state));
  SeedingPolicyEnforcer enforcer(session);
  const auto now = Clock::now();

  TransferRecord record;
  record.fingerprint = "0123456789abcdef0123456789abcdef01234567";
  record.goal.target_ratio = 1.0;
  record.stats.uploaded_bytes = 1000;
  record.stats.upload_rate = 300;

  SECTION("not seeding")
  {
    record.state = TransferState::Downloading;
    REQUIRE_FALSE(enforcer.enforce(record, 3, 1000, now));
    REQUIRE(record.state == TransferState::Downloading);
    REQUIRE(state->paused.empty());
  }

  SECTION("goal not met")
  {
    record.state = TransferState::Seeding;
    record.seeding_started = now;
    record.stats.uploaded_bytes = 10;
    REQUIRE_FALSE(enforcer.enforce(record, 3, 1000, now));
    REQUIRE(record.state == TransferState::Seeding);
  }

  SECTION("goal met")
  {
    record.state = TransferState::Seeding;
    record.seeding_started = now - seconds(5);
    REQUIRE(enforcer.enforce(record, 3, 1000, now));
    REQUIRE(record.state == TransferState::Finished);
    REQUIRE(record.stats.upload_rate == 0);
    REQUIRE(state->paused == std::vector<EngineHandle>{3});

    // 已结束的记录不再处理
    REQUIRE_FALSE(enforcer.enforce(record, 3, 1000, now));
    REQUIRE(state->paused.size() == 1);
  }
}
