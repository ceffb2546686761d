#include "guardStateTable.hpp"

#include <sc-memory/sc_utils.hpp>

GuardStateTable::GuardStateTable(std::vector<std::string> const & guards)
  : m_guards(guards)
  , m_states(guards.size())
{
  for (size_t i = 0; i < m_guards.size(); ++i)
    m_indexByGuard.emplace(m_guards[i], i);
}

size_t GuardStateTable::GetIndex(std::string const & guard) const
{
  auto const it = m_indexByGuard.find(guard);
  if (it == m_indexByGuard.end())
    SC_THROW_EXCEPTION(utils::ExceptionItemNotFound, "Guard `" << guard << "` is not in roster");
  return it->second;
}

GuardState const & GuardStateTable::Get(std::string const & guard) const
{
  return m_states[GetIndex(guard)];
}

void GuardStateTable::RecordAssignment(std::string const & guard, ShiftSlot const & slot)
{
  GuardState & state = m_states[GetIndex(guard)];

  state.totalShifts++;
  state.workedSeconds += slot.slotEnd - slot.slotStart;

  if (slot.isNight)
  {
    state.consecutiveNights++;
    state.nightShifts++;
  }
  else
  {
    state.consecutiveNights = 0;
  }
}

std::vector<GuardWorkload> GuardStateTable::GetWorkloads() const
{
  std::vector<GuardWorkload> workloads;
  workloads.reserve(m_guards.size());
  for (size_t i = 0; i < m_guards.size(); ++i)
  {
    GuardState const & state = m_states[i];
    workloads.push_back(
        {m_guards[i],
         state.totalShifts,
         state.nightShifts,
         static_cast<double>(state.workedSeconds) / SECONDS_PER_HOUR});
  }
  return workloads;
}
