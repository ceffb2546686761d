#include "assignmentAssembler.hpp"
#include "timeSlotGenerator.hpp"
#include "utils/dateTimeFormatter.hpp"

#include <sstream>
#include <unordered_set>

namespace
{

std::optional<ScheduleError> InvalidRequest(std::string const & message)
{
  ScheduleError error;
  error.kind = ScheduleErrorKind::InvalidRequest;
  error.message = message;
  return error;
}

std::optional<ScheduleError> CheckNamesUnique(std::vector<std::string> const & names, std::string const & what)
{
  std::unordered_set<std::string> seen;
  for (auto const & name : names)
  {
    if (name.empty())
      return InvalidRequest(what + " names must not be empty");
    if (!seen.insert(name).second)
      return InvalidRequest(what + " names must be unique, `" + name + "` is repeated");
  }
  return std::nullopt;
}

bool IsValidTimeOfDay(TimeOfDay const & time)
{
  return time.hour >= 0 && time.hour <= 23 && time.minute >= 0 && time.minute <= 59;
}

}  // namespace

AssignmentAssembler::AssignmentAssembler(ScheduleRequest request)
  : m_request(std::move(request))
{
}

std::optional<ScheduleError> AssignmentAssembler::ValidateRequest(ScheduleRequest const & request)
{
  if (request.horizonEnd <= request.horizonStart)
  {
    ScheduleError error;
    error.kind = ScheduleErrorKind::InvalidHorizon;
    error.message = "Schedule end time " + DateTimeFormatter::FormatDateTime(request.horizonEnd)
                    + " must be after start time " + DateTimeFormatter::FormatDateTime(request.horizonStart);
    return error;
  }

  if (request.guards.empty() || request.posts.empty())
  {
    ScheduleError error;
    error.kind = ScheduleErrorKind::EmptyRoster;
    error.message = request.guards.empty() ? "No guards supplied" : "No posts supplied";
    return error;
  }

  if (auto error = CheckNamesUnique(request.guards, "Guard"))
    return error;
  if (auto error = CheckNamesUnique(request.posts, "Post"))
    return error;

  auto const isValidShiftHours = [](double hours) {
    return hours > 0 && hours <= 24 && DateTimeFormatter::HoursToSeconds(hours) > 0;
  };
  if (!isValidShiftHours(request.dayShiftHours) || !isValidShiftHours(request.nightShiftHours))
    return InvalidRequest("Shift lengths must be positive and not longer than 24 hours");

  if (!IsValidTimeOfDay(request.nightWindow.start) || !IsValidTimeOfDay(request.nightWindow.end))
    return InvalidRequest("Night time range must consist of times between 00:00 and 23:59");

  if (request.maxConsecutiveNights < 1)
    return InvalidRequest("Maximum consecutive nights must be at least 1");

  std::unordered_set<std::string> const roster(request.guards.begin(), request.guards.end());
  for (auto const & [guard, windows] : request.unavailability)
  {
    // Окна охранников вне ростера не влияют на расписание
    if (roster.count(guard) == 0)
      continue;

    for (auto const & window : windows)
    {
      if (window.start >= window.end)
        return InvalidRequest(
            "Unavailability window of guard `" + guard + "` starting at "
            + DateTimeFormatter::FormatDateTime(window.start) + " does not end after its start");
    }
  }

  return std::nullopt;
}

ScheduleResult AssignmentAssembler::Fail(ScheduleError error)
{
  ScheduleResult result;
  result.success = false;
  result.error = std::move(error);
  return result;
}

ScheduleError AssignmentAssembler::MakeUnfillableSlotError(
    ShiftSlot const & slot,
    RotationQueue const & queue,
    GuardStateTable const & states,
    ConstraintChecker const & checker) const
{
  size_t unavailableCount = 0;
  size_t nightCapCount = 0;
  for (size_t offset = 0; offset < queue.Size(); ++offset)
  {
    std::string const & guard = queue.PeekFrom(offset);
    SlotRejection const rejection = checker.GetRejectionReason(guard, slot, states.Get(guard));
    if (rejection == SlotRejection::Unavailable)
      unavailableCount++;
    else if (rejection == SlotRejection::NightCapReached)
      nightCapCount++;
  }

  std::ostringstream message;
  message << "No eligible guard for post `" << slot.post << "` in " << (slot.isNight ? "night" : "day")
          << " shift " << DateTimeFormatter::FormatDateTime(slot.slotStart) << " - "
          << DateTimeFormatter::FormatDateTime(slot.slotEnd) << " (unavailable: " << unavailableCount
          << ", at consecutive night limit: " << nightCapCount
          << "). Try relaxing some constraints or adding more guards.";

  ScheduleError error;
  error.kind = ScheduleErrorKind::UnfillableSlot;
  error.message = message.str();
  error.post = slot.post;
  error.slotStart = slot.slotStart;
  error.slotEnd = slot.slotEnd;
  return error;
}

std::optional<ScheduleError> AssignmentAssembler::AssignPost(
    std::string const & post,
    RotationQueue & queue,
    GuardStateTable & states,
    ConstraintChecker const & checker,
    std::vector<Assignment> & assignments) const
{
  TimeSlotGenerator generator = TimeSlotGenerator::ForPost(m_request, post);

  ShiftSlot slot;
  while (generator.Next(slot))
  {
    std::string const * chosen = nullptr;
    for (size_t offset = 0; offset < queue.Size(); ++offset)
    {
      std::string const & candidate = queue.PeekFrom(offset);
      if (checker.IsEligible(candidate, slot, states.Get(candidate)))
      {
        chosen = &candidate;
        break;
      }
    }

    if (chosen == nullptr)
      return MakeUnfillableSlotError(slot, queue, states, checker);

    // Commit меняет очередь, поэтому имя копируется заранее
    std::string const guard = *chosen;
    assignments.push_back({guard, post, slot.slotStart, slot.slotEnd, slot.isNight});
    queue.Commit(guard);
    states.RecordAssignment(guard, slot);
  }

  return std::nullopt;
}

ScheduleMetadata AssignmentAssembler::BuildMetadata(std::vector<Assignment> const & assignments) const
{
  std::unordered_set<std::string> guards;
  std::unordered_set<std::string> posts;
  for (auto const & assignment : assignments)
  {
    guards.insert(assignment.guard);
    posts.insert(assignment.post);
  }

  ScheduleMetadata metadata;
  metadata.totalAssignments = assignments.size();
  metadata.uniqueGuards = guards.size();
  metadata.uniquePosts = posts.size();
  metadata.durationHours = static_cast<double>(m_request.horizonEnd - m_request.horizonStart) / SECONDS_PER_HOUR;
  return metadata;
}

ScheduleResult AssignmentAssembler::Assemble() const
{
  if (auto error = ValidateRequest(m_request))
    return Fail(*error);

  ConstraintChecker const checker(m_request.unavailability, m_request.maxConsecutiveNights);
  GuardStateTable states(m_request.guards);
  std::vector<RotationQueue> queues(m_request.posts.size(), RotationQueue(m_request.guards));

  std::vector<Assignment> assignments;
  for (size_t postIdx = 0; postIdx < m_request.posts.size(); ++postIdx)
  {
    if (auto error = AssignPost(m_request.posts[postIdx], queues[postIdx], states, checker, assignments))
      return Fail(*error);
  }

  ScheduleResult result;
  result.success = true;
  result.metadata = BuildMetadata(assignments);
  result.assignments = std::move(assignments);
  result.workloads = states.GetWorkloads();
  for (size_t postIdx = 0; postIdx < m_request.posts.size(); ++postIdx)
    result.queueOrders.emplace_back(m_request.posts[postIdx], queues[postIdx].GetOrder());

  return result;
}

std::string GetErrorKindName(ScheduleErrorKind kind)
{
  switch (kind)
  {
  case ScheduleErrorKind::InvalidRequest:
    return "invalid_request";
  case ScheduleErrorKind::InvalidHorizon:
    return "invalid_horizon";
  case ScheduleErrorKind::EmptyRoster:
    return "empty_roster";
  case ScheduleErrorKind::UnfillableSlot:
    return "unfillable_slot";
  }
  return "unknown";
}

std::vector<std::pair<size_t, size_t>> FindOverlappingAssignments(std::vector<Assignment> const & assignments)
{
  std::vector<std::pair<size_t, size_t>> overlaps;
  for (size_t i = 0; i < assignments.size(); ++i)
  {
    for (size_t j = i + 1; j < assignments.size(); ++j)
    {
      Assignment const & first = assignments[i];
      Assignment const & second = assignments[j];
      if (first.guard == second.guard && first.post != second.post
          && first.shiftStart < second.shiftEnd && first.shiftEnd > second.shiftStart)
        overlaps.emplace_back(i, j);
    }
  }
  return overlaps;
}
