#pragma once

#include <sc-memory/sc_agent.hpp>

#include <string>
#include <unordered_map>

#include "engine/scheduleTypes.hpp"

class ImportScheduleRequestAgent : public ScActionInitiatedAgent
{
public:
  ScAddr GetActionClass() const override;
  ScResult DoProgram(ScAction & action) override;

private:
  std::string GetJsonData(ScAction & action);

  ScAddr CreateNamedNode(std::string const & name, ScAddr const & conceptClass);
  void CreateRelationLink(ScAddr const & node, ScAddr const & relation, std::string const & content);
  ScAddr CreateRelationSet(ScAddr const & node, ScAddr const & relation);

  ScAddr CreateScheduleRequest(ScheduleRequest const & request);
  std::unordered_map<std::string, ScAddr> CreateGuards(ScAddr const & requestNode, ScheduleRequest const & request);
  void CreatePosts(ScAddr const & requestNode, ScheduleRequest const & request);
  void CreateUnavailabilityWindows(
      ScAddr const & requestNode,
      ScheduleRequest const & request,
      std::unordered_map<std::string, ScAddr> const & guardNodes);
};
