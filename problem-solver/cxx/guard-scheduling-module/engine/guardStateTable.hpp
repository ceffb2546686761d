#pragma once

#include "scheduleTypes.hpp"

#include <string>
#include <unordered_map>
#include <vector>

struct GuardState
{
  int consecutiveNights = 0;
  int totalShifts = 0;
  int nightShifts = 0;
  ScheduleTime workedSeconds = 0;
};

// Состояние охранников в рамках одного запроса, общее для всех постов
class GuardStateTable
{
public:
  explicit GuardStateTable(std::vector<std::string> const & guards);

  GuardState const & Get(std::string const & guard) const;
  void RecordAssignment(std::string const & guard, ShiftSlot const & slot);

  // В порядке ростера
  std::vector<GuardWorkload> GetWorkloads() const;

private:
  size_t GetIndex(std::string const & guard) const;

  std::vector<std::string> m_guards;
  std::vector<GuardState> m_states;
  std::unordered_map<std::string, size_t> m_indexByGuard;
};
