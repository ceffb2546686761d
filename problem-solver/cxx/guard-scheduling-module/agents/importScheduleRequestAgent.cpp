#include "importScheduleRequestAgent.hpp"
#include "keynodes/guard-scheduling-keynodes.hpp"
#include "utils/dateTimeFormatter.hpp"
#include "utils/orderedSetUtils.hpp"
#include "utils/scheduleJsonCodec.hpp"
#include "utils/stringFormatter.hpp"

#include <sc-memory/sc_memory.hpp>

#include <algorithm>

ScAddr ImportScheduleRequestAgent::GetActionClass() const
{
  return GuardSchedulingKeynodes::action_import_schedule_request_from_json;
}

std::string ImportScheduleRequestAgent::GetJsonData(ScAction & action)
{
  ScIterator5Ptr it5 = m_context.CreateIterator5(
      action, ScType::ConstCommonArc, ScType::ConstNodeLink, ScType::ConstPermPosArc,
      GuardSchedulingKeynodes::nrel_file_content);
  if (!it5->Next())
  {
    m_logger.Error("JSON data not provided");
    return "";
  }

  std::string jsonData;
  if (!m_context.GetLinkContent(it5->Get(2), jsonData))
    return "";
  return jsonData;
}

ScAddr ImportScheduleRequestAgent::CreateNamedNode(std::string const & name, ScAddr const & conceptClass)
{
  ScAddr node = m_context.GenerateNode(ScType::ConstNode);

  ScAddr nameLink = m_context.GenerateLink(ScType::ConstNodeLink);
  m_context.SetLinkContent(nameLink, name);
  ScAddr nameArc = m_context.GenerateConnector(ScType::ConstCommonArc, node, nameLink);
  m_context.GenerateConnector(ScType::ConstPermPosArc, ScKeynodes::nrel_main_idtf, nameArc);

  m_context.GenerateConnector(ScType::ConstPermPosArc, conceptClass, node);
  return node;
}

void ImportScheduleRequestAgent::CreateRelationLink(
    ScAddr const & node, ScAddr const & relation, std::string const & content)
{
  ScAddr link = m_context.GenerateLink(ScType::ConstNodeLink);
  m_context.SetLinkContent(link, content);
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, node, link);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
}

ScAddr ImportScheduleRequestAgent::CreateRelationSet(ScAddr const & node, ScAddr const & relation)
{
  ScAddr set = m_context.GenerateNode(ScType::ConstNode);
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, node, set);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
  return set;
}

std::unordered_map<std::string, ScAddr> ImportScheduleRequestAgent::CreateGuards(
    ScAddr const & requestNode, ScheduleRequest const & request)
{
  std::unordered_map<std::string, ScAddr> guardNodes;

  ScAddr roster = CreateRelationSet(requestNode, GuardSchedulingKeynodes::nrel_guard_roster);
  OrderedSetBuilder rosterBuilder(m_context, roster);
  for (auto const & guard : request.guards)
  {
    ScAddr guardNode = CreateNamedNode(guard, GuardSchedulingKeynodes::concept_guard);
    rosterBuilder.Append(guardNode);
    guardNodes.emplace(guard, guardNode);
  }

  return guardNodes;
}

void ImportScheduleRequestAgent::CreatePosts(ScAddr const & requestNode, ScheduleRequest const & request)
{
  ScAddr postList = CreateRelationSet(requestNode, GuardSchedulingKeynodes::nrel_guard_posts);
  OrderedSetBuilder postsBuilder(m_context, postList);
  for (auto const & post : request.posts)
    postsBuilder.Append(CreateNamedNode(post, GuardSchedulingKeynodes::concept_guard_post));
}

void ImportScheduleRequestAgent::CreateUnavailabilityWindows(
    ScAddr const & requestNode,
    ScheduleRequest const & request,
    std::unordered_map<std::string, ScAddr> const & guardNodes)
{
  ScAddr windowsSet = CreateRelationSet(requestNode, GuardSchedulingKeynodes::nrel_unavailability);

  for (auto const & [guard, windows] : request.unavailability)
  {
    for (auto const & window : windows)
    {
      ScAddr windowNode = m_context.GenerateNode(ScType::ConstNode);
      m_context.GenerateConnector(
          ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_unavailability_window, windowNode);
      m_context.GenerateConnector(ScType::ConstPermPosArc, windowsSet, windowNode);

      ScAddr guardArc = m_context.GenerateConnector(ScType::ConstCommonArc, windowNode, guardNodes.at(guard));
      m_context.GenerateConnector(ScType::ConstPermPosArc, GuardSchedulingKeynodes::nrel_unavailable_guard, guardArc);

      CreateRelationLink(
          windowNode, GuardSchedulingKeynodes::nrel_window_start, DateTimeFormatter::FormatDateTime(window.start));
      CreateRelationLink(
          windowNode, GuardSchedulingKeynodes::nrel_window_end, DateTimeFormatter::FormatDateTime(window.end));
    }
  }
}

ScAddr ImportScheduleRequestAgent::CreateScheduleRequest(ScheduleRequest const & request)
{
  ScAddr requestNode = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(
      ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_guard_schedule_request, requestNode);

  CreateRelationLink(
      requestNode, GuardSchedulingKeynodes::nrel_schedule_start, DateTimeFormatter::FormatDateTime(request.horizonStart));
  CreateRelationLink(
      requestNode, GuardSchedulingKeynodes::nrel_schedule_end, DateTimeFormatter::FormatDateTime(request.horizonEnd));
  CreateRelationLink(
      requestNode, GuardSchedulingKeynodes::nrel_day_shift_hours, StringFormatter::FormatNumber(request.dayShiftHours));
  CreateRelationLink(
      requestNode,
      GuardSchedulingKeynodes::nrel_night_shift_hours,
      StringFormatter::FormatNumber(request.nightShiftHours));
  CreateRelationLink(
      requestNode,
      GuardSchedulingKeynodes::nrel_night_time_start,
      DateTimeFormatter::FormatTimeOfDay(request.nightWindow.start));
  CreateRelationLink(
      requestNode,
      GuardSchedulingKeynodes::nrel_night_time_end,
      DateTimeFormatter::FormatTimeOfDay(request.nightWindow.end));
  CreateRelationLink(
      requestNode,
      GuardSchedulingKeynodes::nrel_max_consecutive_nights,
      std::to_string(request.maxConsecutiveNights));

  auto guardNodes = CreateGuards(requestNode, request);
  CreatePosts(requestNode, request);
  CreateUnavailabilityWindows(requestNode, request, guardNodes);

  return requestNode;
}

ScResult ImportScheduleRequestAgent::DoProgram(ScAction & action)
{
  std::string jsonData = GetJsonData(action);
  if (jsonData.empty())
  {
    m_logger.Error("JSON data is empty");
    return action.FinishWithError();
  }

  ScheduleRequest request;
  try
  {
    request = ScheduleJsonCodec::ParseRequest(jsonData);
  }
  catch (utils::ScException const & exception)
  {
    m_logger.Error("Schedule request is malformed: ", exception.Message());
    return action.FinishWithError();
  }

  // Окно недоступности ссылается на узел охранника, окна охранников вне ростера отбрасываются
  for (auto it = request.unavailability.begin(); it != request.unavailability.end();)
  {
    if (std::find(request.guards.begin(), request.guards.end(), it->first) == request.guards.end())
    {
      m_logger.Warning("Unavailability of unknown guard `", it->first, "` is ignored");
      it = request.unavailability.erase(it);
    }
    else
      ++it;
  }

  ScAddr requestNode = CreateScheduleRequest(request);

  ScStructure result = m_context.GenerateStructure();
  result << requestNode;
  action.SetResult(result);

  m_logger.Info(
      "Schedule request imported successfully: ", request.guards.size(), " guards, ", request.posts.size(), " posts");
  return action.FinishSuccessfully();
}
