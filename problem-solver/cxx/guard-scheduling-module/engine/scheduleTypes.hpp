#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Секунды от 1970-01-01T00:00:00 по настенным часам, без часового пояса
using ScheduleTime = std::int64_t;

std::int64_t const SECONDS_PER_MINUTE = 60;
std::int64_t const SECONDS_PER_HOUR = 3600;
std::int64_t const SECONDS_PER_DAY = 86400;

struct TimeOfDay
{
  int hour = 0;
  int minute = 0;

  std::int64_t ToSeconds() const
  {
    return hour * SECONDS_PER_HOUR + minute * SECONDS_PER_MINUTE;
  }
};

// Ночной интервал суток: начало включительно, конец исключительно.
// Если start > end, интервал переходит через полночь.
struct NightWindow
{
  TimeOfDay start;
  TimeOfDay end;
};

// Полуинтервал [start, end)
struct TimeWindow
{
  ScheduleTime start = 0;
  ScheduleTime end = 0;

  bool Overlaps(ScheduleTime otherStart, ScheduleTime otherEnd) const
  {
    return start < otherEnd && end > otherStart;
  }
};

struct ScheduleRequest
{
  ScheduleTime horizonStart = 0;
  ScheduleTime horizonEnd = 0;
  std::vector<std::string> guards;  // порядок задаёт начальную очередь
  std::vector<std::string> posts;
  std::map<std::string, std::vector<TimeWindow>> unavailability;
  double dayShiftHours = 0;
  double nightShiftHours = 0;
  NightWindow nightWindow;
  int maxConsecutiveNights = 0;
};

struct ShiftSlot
{
  std::string post;
  ScheduleTime slotStart = 0;
  ScheduleTime slotEnd = 0;
  bool isNight = false;
};

struct Assignment
{
  std::string guard;
  std::string post;
  ScheduleTime shiftStart = 0;
  ScheduleTime shiftEnd = 0;
  bool isNight = false;
};

struct GuardWorkload
{
  std::string guard;
  int totalShifts = 0;
  int nightShifts = 0;
  double totalHours = 0;
};

struct ScheduleMetadata
{
  size_t totalAssignments = 0;
  size_t uniqueGuards = 0;
  size_t uniquePosts = 0;
  double durationHours = 0;
};

enum class ScheduleErrorKind
{
  InvalidRequest,
  InvalidHorizon,
  EmptyRoster,
  UnfillableSlot
};

struct ScheduleError
{
  ScheduleErrorKind kind = ScheduleErrorKind::InvalidRequest;
  std::string message;
  // Заполняются только для UnfillableSlot
  std::string post;
  ScheduleTime slotStart = 0;
  ScheduleTime slotEnd = 0;
};

struct ScheduleResult
{
  bool success = false;
  std::vector<Assignment> assignments;
  ScheduleMetadata metadata;
  std::vector<GuardWorkload> workloads;
  // Порядок очереди каждого поста после распределения
  std::vector<std::pair<std::string, std::vector<std::string>>> queueOrders;
  std::optional<ScheduleError> error;
};
