#pragma once

#include <sc-memory/sc_agent.hpp>

#include <string>
#include <vector>

// Возвращает неизменное описание алгоритма составления расписания
class GetAlgorithmInfoAgent : public ScActionInitiatedAgent
{
public:
  ScAddr GetActionClass() const override;
  ScResult DoProgram(ScAction & action) override;

private:
  ScAddr CreateRelationLink(
      ScAddr const & node, ScAddr const & relation, std::string const & content, ScStructure & result);
  void CreateRelationList(
      ScAddr const & node, ScAddr const & relation, std::vector<std::string> const & items, ScStructure & result);
};
