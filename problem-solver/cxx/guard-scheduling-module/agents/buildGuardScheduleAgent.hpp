/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include <sc-memory/sc_agent.hpp>

#include <string>
#include <unordered_map>
#include <vector>

#include "engine/scheduleTypes.hpp"

// Узлы базы знаний, соответствующие именам охранников и постов запроса
struct RequestNodes
{
  std::unordered_map<std::string, ScAddr> guards;
  std::unordered_map<std::string, ScAddr> posts;
};

class BuildGuardScheduleAgent : public ScActionInitiatedAgent
{
public:
  BuildGuardScheduleAgent();

  ScAddr GetActionClass() const override;

  ScResult DoProgram(ScActionInitiatedEvent const & event, ScAction & action) override;

private:
  // ===== Чтение запроса из базы знаний =====

  std::string GetRelationContent(ScAddr const & node, ScAddr const & relation, std::string const & fieldName);
  ScAddr GetRelationTarget(ScAddr const & node, ScAddr const & relation, std::string const & fieldName);
  std::string GetMainIdtf(ScAddr const & node);

  std::vector<std::string> ReadNames(
      ScAddr const & request,
      ScAddr const & relation,
      std::string const & fieldName,
      std::unordered_map<std::string, ScAddr> & nodesByName);
  void ReadUnavailability(ScAddr const & request, ScheduleRequest & scheduleRequest);
  ScheduleRequest ReadScheduleRequest(ScAddr const & request, RequestNodes & nodes);

  // ===== Создание результата =====

  ScAddr CreateRelationLink(
      ScAddr const & node, ScAddr const & relation, std::string const & content, ScStructure & result);
  void CreateRelationArc(ScAddr const & node, ScAddr const & target, ScAddr const & relation);
  ScAddr CreateAssignmentNode(Assignment const & assignment, RequestNodes const & nodes);

  ScStructure CreateScheduleResult(ScheduleResult const & scheduleResult, RequestNodes const & nodes);
  void AddMetadataToResult(ScStructure & result, ScAddr const & schedule, ScheduleMetadata const & metadata);
  void AddWorkloadsToResult(
      ScStructure & result, std::vector<GuardWorkload> const & workloads, RequestNodes const & nodes);

  ScStructure CreateFailureResult(ScheduleResult const & scheduleResult, RequestNodes const & nodes);
  ScAddr GetFailureClass(ScheduleErrorKind kind) const;

  // ===== Логирование =====

  void LogRequest(ScheduleRequest const & request);
  void LogAssignments(std::vector<Assignment> const & assignments);
  void LogGuardWorkloads(ScheduleResult const & scheduleResult);
  void LogQueueOrders(ScheduleResult const & scheduleResult);
  void LogOverlappingAssignments(std::vector<Assignment> const & assignments);
};
