#include <sc-memory/test/sc_test.hpp>
#include <sc-memory/sc_memory.hpp>

#include <nlohmann/json.hpp>

#include "agents/buildGuardScheduleAgent.hpp"
#include "keynodes/guard-scheduling-keynodes.hpp"
#include "utils/TestUtils.hpp"

using BuildGuardScheduleAgentTest = ScMemoryTest;
using TestUtils::At;

namespace
{

ScAddr FindFirstOfClass(ScAgentContext & ctx, ScAddr const & conceptClass)
{
  ScIterator3Ptr it = ctx.CreateIterator3(conceptClass, ScType::ConstPermPosArc, ScType::ConstNode);
  if (it->Next())
    return it->Get(2);
  return ScAddr();
}

ScAddr GetRelationTarget(ScAgentContext & ctx, ScAddr const & node, ScAddr const & relation)
{
  ScIterator5Ptr it = ctx.CreateIterator5(
      node, ScType::ConstCommonArc, ScType::Unknown, ScType::ConstPermPosArc, relation);
  if (it->Next())
    return it->Get(2);
  return ScAddr();
}

// Запускает агента на запросе и возвращает действие после завершения
ScAction RunBuildAction(ScAgentContext & ctx, ScAddr const & requestNode)
{
  ScAddr action = TestUtils::CreateAction(ctx, GuardSchedulingKeynodes::action_build_guard_schedule, requestNode);
  ScAction scAction = ctx.ConvertToAction(action);
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  return scAction;
}

}  // namespace

// ====== БАЗОВЫЕ ТЕСТЫ ======

TEST_F(BuildGuardScheduleAgentTest, BuildSchedule_Success)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T08:00", {"G1", "G2"}, {"P1"}));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScStructure result = scAction.GetResult();
  EXPECT_TRUE(result.IsValid());

  ScAddr schedule = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule);
  ASSERT_TRUE(schedule.IsValid());
  EXPECT_TRUE(ctx.CheckConnector(result, schedule, ScType::ConstPermPosArc));

  EXPECT_EQ(TestUtils::GetAssignedGuards(ctx, schedule), (std::vector<std::string>{"G1", "G2", "G1"}));
  EXPECT_EQ(TestUtils::CountElementsOfClass(ctx, GuardSchedulingKeynodes::concept_guard_shift_assignment), 3);
  EXPECT_EQ(TestUtils::CountElementsOfClass(ctx, GuardSchedulingKeynodes::concept_night_shift), 1);

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, BuildSchedule_NoRequest)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr action = TestUtils::CreateAction(ctx, GuardSchedulingKeynodes::action_build_guard_schedule, ScAddr());

  ScAction scAction = ctx.ConvertToAction(action);
  EXPECT_TRUE(scAction.InitiateAndWait(5000));
  EXPECT_TRUE(scAction.IsFinishedWithError());

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, BuildSchedule_MalformedRequest)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  // Запрос без параметров
  ScAddr requestNode = ctx.GenerateNode(ScType::ConstNode);
  ctx.GenerateConnector(ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_guard_schedule_request, requestNode);

  ScAction scAction = RunBuildAction(ctx, requestNode);
  EXPECT_TRUE(scAction.IsFinishedWithError());
  EXPECT_FALSE(FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule).IsValid());

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, BuildSchedule_UnparsableTime)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T08:00", {"G1"}, {"P1"}));
  ScAddr startLink = GetRelationTarget(ctx, requestNode, GuardSchedulingKeynodes::nrel_schedule_start);
  ASSERT_TRUE(startLink.IsValid());
  ctx.SetLinkContent(startLink, "tomorrow morning");

  ScAction scAction = RunBuildAction(ctx, requestNode);
  EXPECT_TRUE(scAction.IsFinishedWithError());

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

// ====== СТРУКТУРА РЕЗУЛЬТАТА ======

TEST_F(BuildGuardScheduleAgentTest, Assignment_HasGuardPostAndTimes)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T08:00", {"G1", "G2"}, {"P1"}));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  ASSERT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule);
  ScAddr assignmentsSet = GetRelationTarget(ctx, schedule, GuardSchedulingKeynodes::nrel_schedule_assignments);
  ASSERT_TRUE(assignmentsSet.IsValid());

  // Первое назначение отмечено rrel_1
  ScIterator5Ptr it = ctx.CreateIterator5(
      assignmentsSet, ScType::ConstPermPosArc, ScType::ConstNode, ScType::ConstPermPosArc, ScKeynodes::rrel_1);
  ASSERT_TRUE(it->Next());
  ScAddr first = it->Get(2);

  ScAddr guard = GetRelationTarget(ctx, first, GuardSchedulingKeynodes::nrel_assigned_guard);
  ScAddr post = GetRelationTarget(ctx, first, GuardSchedulingKeynodes::nrel_assigned_post);
  EXPECT_EQ(guard, TestUtils::FindNodeByName(ctx, GuardSchedulingKeynodes::concept_guard, "G1"));
  EXPECT_EQ(post, TestUtils::FindNodeByName(ctx, GuardSchedulingKeynodes::concept_guard_post, "P1"));
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, first, GuardSchedulingKeynodes::nrel_shift_start), "2024-01-01T08:00:00");
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, first, GuardSchedulingKeynodes::nrel_shift_end), "2024-01-01T16:00:00");
  EXPECT_FALSE(ctx.CheckConnector(GuardSchedulingKeynodes::concept_night_shift, first, ScType::ConstPermPosArc));

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, Metadata_Recorded)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T08:00", {"G1", "G2"}, {"P1", "P2"}));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  ASSERT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule);
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, schedule, GuardSchedulingKeynodes::nrel_total_assignments), "6");
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, schedule, GuardSchedulingKeynodes::nrel_unique_guards), "2");
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, schedule, GuardSchedulingKeynodes::nrel_unique_posts), "2");
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, schedule, GuardSchedulingKeynodes::nrel_schedule_duration_hours), "24");

  nlohmann::json const document = nlohmann::json::parse(
      TestUtils::GetRelationContent(ctx, schedule, GuardSchedulingKeynodes::nrel_json_representation));
  EXPECT_TRUE(document.at("success").get<bool>());
  EXPECT_EQ(document.at("assignments").size(), 6u);

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, Workload_Calculated)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T08:00", {"G1", "G2"}, {"P1"}));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  ASSERT_TRUE(scAction.IsFinishedSuccessfully());

  EXPECT_EQ(TestUtils::GetGuardWorkloadByName(ctx, "G1"), 2);
  EXPECT_EQ(TestUtils::GetGuardWorkloadByName(ctx, "G2"), 1);

  ScAddr g1 = TestUtils::FindNodeByName(ctx, GuardSchedulingKeynodes::concept_guard, "G1");
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, g1, GuardSchedulingKeynodes::nrel_night_workload), "1");
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, g1, GuardSchedulingKeynodes::nrel_worked_hours), "16");

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, JsonRepresentation_InvalidUtf8Name)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-01T16:00", {"G\xff"}, {"P1"}));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  ASSERT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule);
  ASSERT_TRUE(schedule.IsValid());
  EXPECT_EQ(TestUtils::GetAssignedGuards(ctx, schedule), (std::vector<std::string>{"G\xff"}));

  // Некорректные байты имени заменяются символом U+FFFD
  nlohmann::json const document = nlohmann::json::parse(
      TestUtils::GetRelationContent(ctx, schedule, GuardSchedulingKeynodes::nrel_json_representation));
  EXPECT_EQ(document.at("assignments")[0].at("guard_id"), "G\xEF\xBF\xBD");

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

// ====== ОГРАНИЧЕНИЯ ======

TEST_F(BuildGuardScheduleAgentTest, Unavailability_SkipsGuard)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScheduleRequest request = TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T00:00", {"A", "B"}, {"P"});
  request.unavailability["A"] = {{At("2024-01-01T08:00"), At("2024-01-01T12:00")}};
  ScAddr requestNode = TestUtils::CreateRequestNode(ctx, request);

  ScAction scAction = RunBuildAction(ctx, requestNode);
  ASSERT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule);
  EXPECT_EQ(TestUtils::GetAssignedGuards(ctx, schedule), (std::vector<std::string>{"B", "A"}));

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, Unavailability_OutsideRosterIgnored)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScheduleRequest request = TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T00:00", {"A", "B"}, {"P"});
  request.unavailability["Z"] = {{At("2024-01-01T08:00"), At("2024-01-01T12:00")}};
  ScAddr requestNode = TestUtils::CreateRequestNode(ctx, request);

  ScAction scAction = RunBuildAction(ctx, requestNode);
  ASSERT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule);
  EXPECT_EQ(TestUtils::GetAssignedGuards(ctx, schedule), (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(TestUtils::GetGuardWorkloadByName(ctx, "Z"), 0);

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, NightStreak_SharedAcrossPosts)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScheduleRequest request = TestUtils::MakeRequest(
      "2024-01-01T06:00", "2024-01-03T06:00", {"A", "B", "C", "D"}, {"Gate", "Lobby"}, 8, 12);
  request.unavailability["A"] = {{At("2024-01-01T18:00"), At("2024-01-02T00:00")}};
  ScAddr requestNode = TestUtils::CreateRequestNode(ctx, request);

  ScAction scAction = RunBuildAction(ctx, requestNode);
  ASSERT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule);
  EXPECT_EQ(
      TestUtils::GetAssignedGuards(ctx, schedule),
      (std::vector<std::string>{"A", "B", "C", "D", "A", "B", "A", "B", "D", "C", "A", "B"}));
  EXPECT_EQ(TestUtils::CountElementsOfClass(ctx, GuardSchedulingKeynodes::concept_night_shift), 4);

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

// ====== НЕУДАЧНОЕ ПОСТРОЕНИЕ ======

TEST_F(BuildGuardScheduleAgentTest, UnfillableSlot_FailureRecorded)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx,
      TestUtils::MakeRequest("2024-01-01T22:00", "2024-01-02T06:00", {"G1"}, {"P1"}, 8, 4, "20:00", "08:00", 1));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  EXPECT_TRUE(scAction.IsFinishedUnsuccessfully());
  EXPECT_FALSE(FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule).IsValid());

  ScAddr failure = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule_failure);
  ASSERT_TRUE(failure.IsValid());
  EXPECT_TRUE(ctx.CheckConnector(scAction.GetResult(), failure, ScType::ConstPermPosArc));
  EXPECT_TRUE(ctx.CheckConnector(GuardSchedulingKeynodes::concept_unfillable_slot, failure, ScType::ConstPermPosArc));

  EXPECT_EQ(
      GetRelationTarget(ctx, failure, GuardSchedulingKeynodes::nrel_assigned_post),
      TestUtils::FindNodeByName(ctx, GuardSchedulingKeynodes::concept_guard_post, "P1"));
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, failure, GuardSchedulingKeynodes::nrel_shift_start), "2024-01-02T02:00:00");
  EXPECT_EQ(TestUtils::GetRelationContent(ctx, failure, GuardSchedulingKeynodes::nrel_shift_end), "2024-01-02T06:00:00");

  std::string const reason = TestUtils::GetRelationContent(ctx, failure, GuardSchedulingKeynodes::nrel_failure_reason);
  EXPECT_NE(reason.find("No eligible guard for post `P1`"), std::string::npos);

  nlohmann::json const document = nlohmann::json::parse(
      TestUtils::GetRelationContent(ctx, failure, GuardSchedulingKeynodes::nrel_json_representation));
  EXPECT_FALSE(document.at("success").get<bool>());
  EXPECT_EQ(document.at("error_kind"), "unfillable_slot");

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, InvalidHorizon_FailureRecorded)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-02T08:00", "2024-01-01T08:00", {"G1"}, {"P1"}));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  EXPECT_TRUE(scAction.IsFinishedUnsuccessfully());

  ScAddr failure = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule_failure);
  ASSERT_TRUE(failure.IsValid());
  EXPECT_TRUE(ctx.CheckConnector(GuardSchedulingKeynodes::concept_invalid_horizon, failure, ScType::ConstPermPosArc));
  EXPECT_FALSE(GetRelationTarget(ctx, failure, GuardSchedulingKeynodes::nrel_shift_start).IsValid());

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}

TEST_F(BuildGuardScheduleAgentTest, InvalidParameters_FailureRecorded)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<BuildGuardScheduleAgent>();

  ScAddr requestNode = TestUtils::CreateRequestNode(
      ctx, TestUtils::MakeRequest("2024-01-01T08:00", "2024-01-02T08:00", {"G1"}, {"P1"}, 8, 8, "22:00", "06:00", 0));

  ScAction scAction = RunBuildAction(ctx, requestNode);
  EXPECT_TRUE(scAction.IsFinishedUnsuccessfully());

  ScAddr failure = FindFirstOfClass(ctx, GuardSchedulingKeynodes::concept_guard_schedule_failure);
  ASSERT_TRUE(failure.IsValid());
  EXPECT_TRUE(
      ctx.CheckConnector(GuardSchedulingKeynodes::concept_invalid_schedule_request, failure, ScType::ConstPermPosArc));

  ctx.UnsubscribeAgent<BuildGuardScheduleAgent>();
}
