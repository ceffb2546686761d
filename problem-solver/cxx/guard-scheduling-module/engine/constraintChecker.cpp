#include "constraintChecker.hpp"

#include <algorithm>
#include <utility>

ConstraintChecker::ConstraintChecker(
    std::map<std::string, std::vector<TimeWindow>> unavailability,
    int maxConsecutiveNights)
  : m_unavailability(std::move(unavailability))
  , m_maxConsecutiveNights(maxConsecutiveNights)
{
}

bool ConstraintChecker::IsUnavailable(std::string const & guard, ShiftSlot const & slot) const
{
  auto const it = m_unavailability.find(guard);
  if (it == m_unavailability.end())
    return false;

  return std::any_of(it->second.begin(), it->second.end(), [&slot](TimeWindow const & window) {
    return window.Overlaps(slot.slotStart, slot.slotEnd);
  });
}

SlotRejection ConstraintChecker::GetRejectionReason(
    std::string const & guard,
    ShiftSlot const & slot,
    GuardState const & state) const
{
  if (IsUnavailable(guard, slot))
    return SlotRejection::Unavailable;

  if (slot.isNight && state.consecutiveNights >= m_maxConsecutiveNights)
    return SlotRejection::NightCapReached;

  return SlotRejection::None;
}

bool ConstraintChecker::IsEligible(std::string const & guard, ShiftSlot const & slot, GuardState const & state) const
{
  return GetRejectionReason(guard, slot, state) == SlotRejection::None;
}
