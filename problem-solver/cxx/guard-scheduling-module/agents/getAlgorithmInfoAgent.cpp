#include "getAlgorithmInfoAgent.hpp"
#include "keynodes/guard-scheduling-keynodes.hpp"
#include "utils/orderedSetUtils.hpp"

#include <sc-memory/sc_memory.hpp>

#include <nlohmann/json.hpp>

namespace
{

std::string const ALGORITHM_NAME = "Queue-based Fair Scheduling";
std::string const ALGORITHM_DESCRIPTION = "Ensures fair distribution of shifts using rotating queues";

std::vector<std::string> const ALGORITHM_FEATURES = {
    "Fair shift distribution",
    "Respects guard unavailability",
    "Limits consecutive night shifts",
    "Independent rotation queue for every post"};

std::vector<std::string> const ALGORITHM_CONSTRAINTS = {
    "Guard availability windows",
    "Maximum consecutive night shifts",
    "Post coverage requirements"};

}  // namespace

ScAddr GetAlgorithmInfoAgent::GetActionClass() const
{
  return GuardSchedulingKeynodes::action_get_scheduling_algorithm_info;
}

ScAddr GetAlgorithmInfoAgent::CreateRelationLink(
    ScAddr const & node, ScAddr const & relation, std::string const & content, ScStructure & result)
{
  ScAddr link = m_context.GenerateLink(ScType::ConstNodeLink);
  m_context.SetLinkContent(link, content);
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, node, link);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
  result << link << arc;
  return link;
}

void GetAlgorithmInfoAgent::CreateRelationList(
    ScAddr const & node, ScAddr const & relation, std::vector<std::string> const & items, ScStructure & result)
{
  ScAddr list = m_context.GenerateNode(ScType::ConstNode);
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, node, list);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
  result << list << arc;

  OrderedSetBuilder builder(m_context, list);
  for (auto const & item : items)
  {
    ScAddr link = m_context.GenerateLink(ScType::ConstNodeLink);
    m_context.SetLinkContent(link, item);
    builder.Append(link);
    result << link;
  }
}

ScResult GetAlgorithmInfoAgent::DoProgram(ScAction & action)
{
  ScStructure result = m_context.GenerateStructure();

  ScAddr info = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, GuardSchedulingKeynodes::concept_scheduling_algorithm_info, info);
  result << info;

  CreateRelationLink(info, GuardSchedulingKeynodes::nrel_algorithm_name, ALGORITHM_NAME, result);
  CreateRelationLink(info, GuardSchedulingKeynodes::nrel_algorithm_description, ALGORITHM_DESCRIPTION, result);
  CreateRelationList(info, GuardSchedulingKeynodes::nrel_algorithm_features, ALGORITHM_FEATURES, result);
  CreateRelationList(info, GuardSchedulingKeynodes::nrel_algorithm_constraints, ALGORITHM_CONSTRAINTS, result);

  nlohmann::json const document = {
      {"algorithm", ALGORITHM_NAME},
      {"description", ALGORITHM_DESCRIPTION},
      {"features", ALGORITHM_FEATURES},
      {"constraints", ALGORITHM_CONSTRAINTS}};
  CreateRelationLink(info, GuardSchedulingKeynodes::nrel_json_representation, document.dump(), result);

  action.SetResult(result);

  m_logger.Info("Scheduling algorithm info generated");
  return action.FinishSuccessfully();
}
