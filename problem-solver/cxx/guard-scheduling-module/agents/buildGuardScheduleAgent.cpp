#include "buildGuardScheduleAgent.hpp"
#include "keynodes/guard-scheduling-keynodes.hpp"
#include "engine/assignmentAssembler.hpp"
#include "utils/dateTimeFormatter.hpp"
#include "utils/orderedSetUtils.hpp"
#include "utils/scheduleJsonCodec.hpp"
#include "utils/stringFormatter.hpp"

#include <sc-memory/sc_memory_headers.hpp>
#include <sc-agents-common/utils/IteratorUtils.hpp>

#include <algorithm>

BuildGuardScheduleAgent::BuildGuardScheduleAgent()
{
  m_logger = utils::ScLogger(
      utils::ScLogger::ScLogType::File, "logs/BuildGuardScheduleAgent.log", utils::ScLogLevel::Debug);
}

ScAddr BuildGuardScheduleAgent::GetActionClass() const
{
  return GuardSchedulingKeynodes::action_build_guard_schedule;
}

// ===== Чтение запроса из базы знаний =====

ScAddr BuildGuardScheduleAgent::GetRelationTarget(
    ScAddr const & node, ScAddr const & relation, std::string const & fieldName)
{
  ScAddr target = utils::IteratorUtils::getAnyByOutRelation(&m_context, node, relation);
  if (!target.IsValid())
    SC_THROW_EXCEPTION(utils::ExceptionItemNotFound, "Schedule request has no `" << fieldName << "`");
  return target;
}

std::string BuildGuardScheduleAgent::GetRelationContent(
    ScAddr const & node, ScAddr const & relation, std::string const & fieldName)
{
  ScAddr link = GetRelationTarget(node, relation, fieldName);

  std::string content;
  if (!m_context.GetElementType(link).IsLink() || !m_context.GetLinkContent(link, content))
    SC_THROW_EXCEPTION(utils::ExceptionInvalidParams, "`" << fieldName << "` is not a link with content");
  return content;
}

std::string BuildGuardScheduleAgent::GetMainIdtf(ScAddr const & node)
{
  return GetRelationContent(node, ScKeynodes::nrel_main_idtf, "nrel_main_idtf");
}

std::vector<std::string> BuildGuardScheduleAgent::ReadNames(
    ScAddr const & request,
    ScAddr const & relation,
    std::string const & fieldName,
    std::unordered_map<std::string, ScAddr> & nodesByName)
{
  ScAddr set = GetRelationTarget(request, relation, fieldName);

  std::vector<std::string> names;
  for (ScAddr const & element : OrderedSetUtils::GetElements(m_context, set))
  {
    std::string name = StringFormatter::Trim(GetMainIdtf(element));
    nodesByName.emplace(name, element);
    names.push_back(std::move(name));
  }
  return names;
}

void BuildGuardScheduleAgent::ReadUnavailability(ScAddr const & request, ScheduleRequest & scheduleRequest)
{
  // Окна недоступности необязательны
  ScAddr windowsSet =
      utils::IteratorUtils::getAnyByOutRelation(&m_context, request, GuardSchedulingKeynodes::nrel_unavailability);
  if (!windowsSet.IsValid())
    return;

  ScIterator3Ptr it = m_context.CreateIterator3(windowsSet, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    ScAddr windowNode = it->Get(2);
    ScAddr guardNode =
        GetRelationTarget(windowNode, GuardSchedulingKeynodes::nrel_unavailable_guard, "nrel_unavailable_guard");

    std::string const guard = StringFormatter::Trim(GetMainIdtf(guardNode));
    if (std::find(scheduleRequest.guards.begin(), scheduleRequest.guards.end(), guard) == scheduleRequest.guards.end())
    {
      m_logger.Warning("BuildGuardScheduleAgent: Unavailability of guard ", guard, " outside the roster is ignored");
      continue;
    }

    TimeWindow window;
    window.start = DateTimeFormatter::ParseDateTime(
        GetRelationContent(windowNode, GuardSchedulingKeynodes::nrel_window_start, "nrel_window_start"));
    window.end = DateTimeFormatter::ParseDateTime(
        GetRelationContent(windowNode, GuardSchedulingKeynodes::nrel_window_end, "nrel_window_end"));
    scheduleRequest.unavailability[guard].push_back(window);
  }

  // Порядок итератора не определён, окна упорядочиваются по началу
  for (auto & [guard, windows] : scheduleRequest.unavailability)
  {
    std::sort(windows.begin(), windows.end(), [](TimeWindow const & a, TimeWindow const & b) {
      return a.start < b.start || (a.start == b.start && a.end < b.end);
    });
  }
}

ScheduleRequest BuildGuardScheduleAgent::ReadScheduleRequest(ScAddr const & request, RequestNodes & nodes)
{
  ScheduleRequest scheduleRequest;

  scheduleRequest.horizonStart = DateTimeFormatter::ParseDateTime(
      GetRelationContent(request, GuardSchedulingKeynodes::nrel_schedule_start, "nrel_schedule_start"));
  scheduleRequest.horizonEnd = DateTimeFormatter::ParseDateTime(
      GetRelationContent(request, GuardSchedulingKeynodes::nrel_schedule_end, "nrel_schedule_end"));

  scheduleRequest.guards =
      ReadNames(request, GuardSchedulingKeynodes::nrel_guard_roster, "nrel_guard_roster", nodes.guards);
  scheduleRequest.posts = ReadNames(request, GuardSchedulingKeynodes::nrel_guard_posts, "nrel_guard_posts", nodes.posts);

  scheduleRequest.dayShiftHours = StringFormatter::ParseDouble(
      GetRelationContent(request, GuardSchedulingKeynodes::nrel_day_shift_hours, "nrel_day_shift_hours"));
  scheduleRequest.nightShiftHours = StringFormatter::ParseDouble(
      GetRelationContent(request, GuardSchedulingKeynodes::nrel_night_shift_hours, "nrel_night_shift_hours"));

  scheduleRequest.nightWindow.start = DateTimeFormatter::ParseTimeOfDay(
      GetRelationContent(request, GuardSchedulingKeynodes::nrel_night_time_start, "nrel_night_time_start"));
  scheduleRequest.nightWindow.end = DateTimeFormatter::ParseTimeOfDay(
      GetRelationContent(request, GuardSchedulingKeynodes::nrel_night_time_end, "nrel_night_time_end"));

  scheduleRequest.maxConsecutiveNights = StringFormatter::ParseInt(GetRelationContent(
      request, GuardSchedulingKeynodes::nrel_max_consecutive_nights, "nrel_max_consecutive_nights"));

  ReadUnavailability(request, scheduleRequest);
  return scheduleRequest;
}

// ===== Создание результата =====

ScAddr BuildGuardScheduleAgent::CreateRelationLink(
    ScAddr const & node, ScAddr const & relation, std::string const & content, ScStructure & result)
{
  ScAddr link = m_context.GenerateLink(ScType::ConstNodeLink);
  m_context.SetLinkContent(link, content);
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, node, link);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
  result << link << arc;
  return link;
}

void BuildGuardScheduleAgent::CreateRelationArc(ScAddr const & node, ScAddr const & target, ScAddr const & relation)
{
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, node, target);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
}

ScAddr BuildGuardScheduleAgent::CreateAssignmentNode(Assignment const & assignment, RequestNodes const & nodes)
{
  ScAddr assignmentNode = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(
      ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_guard_shift_assignment, assignmentNode);
  if (assignment.isNight)
    m_context.GenerateConnector(ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_night_shift, assignmentNode);

  CreateRelationArc(assignmentNode, nodes.guards.at(assignment.guard), GuardSchedulingKeynodes::nrel_assigned_guard);
  CreateRelationArc(assignmentNode, nodes.posts.at(assignment.post), GuardSchedulingKeynodes::nrel_assigned_post);

  auto createTimeLink = [this, assignmentNode](ScheduleTime time, ScAddr const & relation) {
    ScAddr link = m_context.GenerateLink(ScType::ConstNodeLink);
    m_context.SetLinkContent(link, DateTimeFormatter::FormatDateTime(time));
    CreateRelationArc(assignmentNode, link, relation);
  };

  createTimeLink(assignment.shiftStart, GuardSchedulingKeynodes::nrel_shift_start);
  createTimeLink(assignment.shiftEnd, GuardSchedulingKeynodes::nrel_shift_end);

  return assignmentNode;
}

void BuildGuardScheduleAgent::AddMetadataToResult(
    ScStructure & result, ScAddr const & schedule, ScheduleMetadata const & metadata)
{
  CreateRelationLink(
      schedule, GuardSchedulingKeynodes::nrel_total_assignments, std::to_string(metadata.totalAssignments), result);
  CreateRelationLink(schedule, GuardSchedulingKeynodes::nrel_unique_guards, std::to_string(metadata.uniqueGuards), result);
  CreateRelationLink(schedule, GuardSchedulingKeynodes::nrel_unique_posts, std::to_string(metadata.uniquePosts), result);
  CreateRelationLink(
      schedule,
      GuardSchedulingKeynodes::nrel_schedule_duration_hours,
      StringFormatter::FormatNumber(metadata.durationHours),
      result);
}

void BuildGuardScheduleAgent::AddWorkloadsToResult(
    ScStructure & result, std::vector<GuardWorkload> const & workloads, RequestNodes const & nodes)
{
  for (auto const & workload : workloads)
  {
    ScAddr guardNode = nodes.guards.at(workload.guard);
    CreateRelationLink(guardNode, GuardSchedulingKeynodes::nrel_workload, std::to_string(workload.totalShifts), result);
    CreateRelationLink(
        guardNode, GuardSchedulingKeynodes::nrel_night_workload, std::to_string(workload.nightShifts), result);
    CreateRelationLink(
        guardNode,
        GuardSchedulingKeynodes::nrel_worked_hours,
        StringFormatter::FormatNumber(workload.totalHours),
        result);
  }
}

ScStructure BuildGuardScheduleAgent::CreateScheduleResult(
    ScheduleResult const & scheduleResult, RequestNodes const & nodes)
{
  ScStructure result = m_context.GenerateStructure();

  ScAddr schedule = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_guard_schedule, schedule);
  result << schedule;

  ScAddr assignmentsSet = m_context.GenerateNode(ScType::ConstNode);
  CreateRelationArc(schedule, assignmentsSet, GuardSchedulingKeynodes::nrel_schedule_assignments);
  result << assignmentsSet;

  OrderedSetBuilder assignmentsBuilder(m_context, assignmentsSet);
  for (auto const & assignment : scheduleResult.assignments)
  {
    ScAddr assignmentNode = CreateAssignmentNode(assignment, nodes);
    assignmentsBuilder.Append(assignmentNode);
    result << assignmentNode;
  }

  AddMetadataToResult(result, schedule, scheduleResult.metadata);
  AddWorkloadsToResult(result, scheduleResult.workloads, nodes);
  CreateRelationLink(
      schedule,
      GuardSchedulingKeynodes::nrel_json_representation,
      ScheduleJsonCodec::SerializeResult(scheduleResult),
      result);

  return result;
}

ScAddr BuildGuardScheduleAgent::GetFailureClass(ScheduleErrorKind kind) const
{
  switch (kind)
  {
  case ScheduleErrorKind::InvalidRequest:
    return GuardSchedulingKeynodes::concept_invalid_schedule_request;
  case ScheduleErrorKind::InvalidHorizon:
    return GuardSchedulingKeynodes::concept_invalid_horizon;
  case ScheduleErrorKind::EmptyRoster:
    return GuardSchedulingKeynodes::concept_empty_roster;
  case ScheduleErrorKind::UnfillableSlot:
    return GuardSchedulingKeynodes::concept_unfillable_slot;
  }
  return GuardSchedulingKeynodes::concept_invalid_schedule_request;
}

ScStructure BuildGuardScheduleAgent::CreateFailureResult(
    ScheduleResult const & scheduleResult, RequestNodes const & nodes)
{
  ScheduleError const & error = *scheduleResult.error;

  ScStructure result = m_context.GenerateStructure();

  ScAddr failure = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_guard_schedule_failure, failure);
  m_context.GenerateConnector(ScType::ConstPermPosArc, GetFailureClass(error.kind), failure);
  result << failure;

  CreateRelationLink(failure, GuardSchedulingKeynodes::nrel_failure_reason, error.message, result);

  if (error.kind == ScheduleErrorKind::UnfillableSlot)
  {
    CreateRelationArc(failure, nodes.posts.at(error.post), GuardSchedulingKeynodes::nrel_assigned_post);
    CreateRelationLink(
        failure, GuardSchedulingKeynodes::nrel_shift_start, DateTimeFormatter::FormatDateTime(error.slotStart), result);
    CreateRelationLink(
        failure, GuardSchedulingKeynodes::nrel_shift_end, DateTimeFormatter::FormatDateTime(error.slotEnd), result);
  }

  CreateRelationLink(
      failure,
      GuardSchedulingKeynodes::nrel_json_representation,
      ScheduleJsonCodec::SerializeResult(scheduleResult),
      result);

  return result;
}

// ===== Логирование =====

void BuildGuardScheduleAgent::LogRequest(ScheduleRequest const & request)
{
  m_logger.Info(
      "BuildGuardScheduleAgent: Horizon ", DateTimeFormatter::FormatDateTime(request.horizonStart), " - ",
      DateTimeFormatter::FormatDateTime(request.horizonEnd), ", guards: ", request.guards.size(),
      ", posts: ", request.posts.size());
  m_logger.Info(
      "BuildGuardScheduleAgent: Shifts - day: ", request.dayShiftHours, "h, night: ", request.nightShiftHours,
      "h, night time: ", DateTimeFormatter::FormatTimeOfDay(request.nightWindow.start), "-",
      DateTimeFormatter::FormatTimeOfDay(request.nightWindow.end), ", max consecutive nights: ",
      request.maxConsecutiveNights);
}

void BuildGuardScheduleAgent::LogAssignments(std::vector<Assignment> const & assignments)
{
  for (auto const & assignment : assignments)
  {
    m_logger.Debug(
        "BuildGuardScheduleAgent: ", assignment.post, " ", DateTimeFormatter::FormatDateTime(assignment.shiftStart),
        " - ", DateTimeFormatter::FormatDateTime(assignment.shiftEnd), (assignment.isNight ? " (night)" : ""),
        " -> ", assignment.guard);
  }
}

void BuildGuardScheduleAgent::LogGuardWorkloads(ScheduleResult const & scheduleResult)
{
  m_logger.Info("BuildGuardScheduleAgent: === Workload per guard ===");
  for (auto const & workload : scheduleResult.workloads)
  {
    m_logger.Info(
        workload.guard, ": ", workload.totalShifts, " shifts (", workload.nightShifts, " night), ",
        StringFormatter::FormatNumber(workload.totalHours), " hours");
  }
}

void BuildGuardScheduleAgent::LogQueueOrders(ScheduleResult const & scheduleResult)
{
  for (auto const & [post, order] : scheduleResult.queueOrders)
    m_logger.Debug("BuildGuardScheduleAgent: Queue of post ", post, ": ", StringFormatter::Join(order));
}

void BuildGuardScheduleAgent::LogOverlappingAssignments(std::vector<Assignment> const & assignments)
{
  for (auto const & [firstIdx, secondIdx] : FindOverlappingAssignments(assignments))
  {
    Assignment const & first = assignments[firstIdx];
    Assignment const & second = assignments[secondIdx];
    m_logger.Warning(
        "BuildGuardScheduleAgent: Guard ", first.guard, " is booked on posts ", first.post, " (",
        DateTimeFormatter::FormatDateTime(first.shiftStart), ") and ", second.post, " (",
        DateTimeFormatter::FormatDateTime(second.shiftStart), ") at overlapping times");
  }
}

ScResult BuildGuardScheduleAgent::DoProgram(ScActionInitiatedEvent const & event, ScAction & action)
{
  m_logger.Info("BuildGuardScheduleAgent: Starting queue-based guard scheduling");

  auto const & [requestAddr] = action.GetArguments<1>();
  if (!m_context.IsElement(requestAddr))
  {
    m_logger.Error("BuildGuardScheduleAgent: Schedule request is not specified");
    return action.FinishWithError();
  }

  RequestNodes nodes;
  ScheduleRequest request;
  try
  {
    request = ReadScheduleRequest(requestAddr, nodes);
  }
  catch (utils::ScException const & exception)
  {
    m_logger.Error("BuildGuardScheduleAgent: Schedule request is malformed: ", exception.Message());
    return action.FinishWithError();
  }

  LogRequest(request);

  ScheduleResult scheduleResult = AssignmentAssembler(request).Assemble();

  if (!scheduleResult.success)
  {
    ScheduleError const & error = *scheduleResult.error;
    m_logger.Error(
        "BuildGuardScheduleAgent: Schedule failed (", GetErrorKindName(error.kind), "): ", error.message);

    action.SetResult(CreateFailureResult(scheduleResult, nodes));
    return action.FinishUnsuccessfully();
  }

  m_logger.Info(
      "BuildGuardScheduleAgent: Filled ", scheduleResult.metadata.totalAssignments, " shifts on ",
      scheduleResult.metadata.uniquePosts, " posts with ", scheduleResult.metadata.uniqueGuards, " guards");

  LogAssignments(scheduleResult.assignments);
  LogGuardWorkloads(scheduleResult);
  LogQueueOrders(scheduleResult);
  LogOverlappingAssignments(scheduleResult.assignments);

  action.SetResult(CreateScheduleResult(scheduleResult, nodes));
  return action.FinishSuccessfully();
}
