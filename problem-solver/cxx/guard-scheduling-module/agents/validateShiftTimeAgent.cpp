#include "validateShiftTimeAgent.hpp"
#include "keynodes/guard-scheduling-keynodes.hpp"
#include "utils/dateTimeFormatter.hpp"

#include <sc-memory/sc_memory.hpp>

ScAddr ValidateShiftTimeAgent::GetActionClass() const
{
  return GuardSchedulingKeynodes::action_validate_shift_time;
}

void ValidateShiftTimeAgent::CreateRelationLink(
    ScAddr const & node, ScAddr const & relation, std::string const & content, ScStructure & result)
{
  ScAddr link = m_context.GenerateLink(ScType::ConstNodeLink);
  m_context.SetLinkContent(link, content);
  ScAddr arc = m_context.GenerateConnector(ScType::ConstCommonArc, node, link);
  m_context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
  result << link << arc;
}

ScResult ValidateShiftTimeAgent::DoProgram(ScAction & action)
{
  auto const & [timeLink] = action.GetArguments<1>();
  if (!m_context.IsElement(timeLink))
  {
    m_logger.Error("Shift time is not specified");
    return action.FinishWithError();
  }

  if (!m_context.GetElementType(timeLink).IsLink())
  {
    m_logger.Error("Shift time argument is not a link");
    return action.FinishWithError();
  }

  std::string timeString;
  if (!m_context.GetLinkContent(timeLink, timeString))
    m_logger.Warning("Shift time link has no content");

  TimeValidation validation = DateTimeFormatter::ValidateHalfHourTime(timeString);

  ScStructure result = m_context.GenerateStructure();
  ScAddr validationNode = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(
      ScType::ConstPermPosArc,
      validation.valid ? GuardSchedulingKeynodes::concept_valid_shift_time
                       : GuardSchedulingKeynodes::concept_invalid_shift_time,
      validationNode);
  result << validationNode;

  if (!validation.closestTime.empty())
    CreateRelationLink(validationNode, GuardSchedulingKeynodes::nrel_closest_valid_time, validation.closestTime, result);
  if (!validation.message.empty())
    CreateRelationLink(validationNode, GuardSchedulingKeynodes::nrel_validation_message, validation.message, result);

  action.SetResult(result);

  m_logger.Info("Shift time ", timeString, validation.valid ? " is valid" : " is invalid");
  return action.FinishSuccessfully();
}
