#pragma once

#include "guardStateTable.hpp"
#include "scheduleTypes.hpp"

#include <map>
#include <string>
#include <vector>

enum class SlotRejection
{
  None,
  Unavailable,
  NightCapReached
};

class ConstraintChecker
{
public:
  ConstraintChecker(std::map<std::string, std::vector<TimeWindow>> unavailability, int maxConsecutiveNights);

  bool IsEligible(std::string const & guard, ShiftSlot const & slot, GuardState const & state) const;
  SlotRejection GetRejectionReason(std::string const & guard, ShiftSlot const & slot, GuardState const & state) const;

private:
  bool IsUnavailable(std::string const & guard, ShiftSlot const & slot) const;

  std::map<std::string, std::vector<TimeWindow>> m_unavailability;
  int m_maxConsecutiveNights;
};
