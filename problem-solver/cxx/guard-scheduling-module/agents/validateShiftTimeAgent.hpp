#pragma once

#include <sc-memory/sc_agent.hpp>

#include <string>

// Проверяет, что время вида HH:MM лежит на сетке 30 минут, и подсказывает ближайшее
class ValidateShiftTimeAgent : public ScActionInitiatedAgent
{
public:
  ScAddr GetActionClass() const override;
  ScResult DoProgram(ScAction & action) override;

private:
  void CreateRelationLink(
      ScAddr const & node, ScAddr const & relation, std::string const & content, ScStructure & result);
};
