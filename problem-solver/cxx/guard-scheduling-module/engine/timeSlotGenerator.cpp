#include "timeSlotGenerator.hpp"
#include "utils/dateTimeFormatter.hpp"

#include <sc-memory/sc_utils.hpp>

#include <algorithm>
#include <utility>

bool IsNightTime(NightWindow const & window, ScheduleTime time)
{
  std::int64_t const secondsOfDay = DateTimeFormatter::SecondsOfDay(time);
  std::int64_t const start = window.start.ToSeconds();
  std::int64_t const end = window.end.ToSeconds();

  if (start > end)
    return secondsOfDay >= start || secondsOfDay < end;

  // start == end даёт пустой интервал
  return secondsOfDay >= start && secondsOfDay < end;
}

TimeSlotGenerator::TimeSlotGenerator(
    ScheduleTime horizonStart,
    ScheduleTime horizonEnd,
    double dayShiftHours,
    double nightShiftHours,
    NightWindow const & nightWindow,
    std::string post)
  : m_horizonStart(horizonStart)
  , m_horizonEnd(horizonEnd)
  , m_dayShiftSeconds(DateTimeFormatter::HoursToSeconds(dayShiftHours))
  , m_nightShiftSeconds(DateTimeFormatter::HoursToSeconds(nightShiftHours))
  , m_nightWindow(nightWindow)
  , m_post(std::move(post))
  , m_cursor(horizonStart)
{
  if (m_horizonEnd <= m_horizonStart)
    SC_THROW_EXCEPTION(
        utils::ExceptionInvalidParams,
        "Horizon end " << DateTimeFormatter::FormatDateTime(m_horizonEnd) << " is not after start "
                       << DateTimeFormatter::FormatDateTime(m_horizonStart));

  if (m_dayShiftSeconds <= 0 || m_nightShiftSeconds <= 0)
    SC_THROW_EXCEPTION(utils::ExceptionInvalidParams, "Shift durations must be positive");
}

TimeSlotGenerator TimeSlotGenerator::ForPost(ScheduleRequest const & request, std::string const & post)
{
  return TimeSlotGenerator(
      request.horizonStart,
      request.horizonEnd,
      request.dayShiftHours,
      request.nightShiftHours,
      request.nightWindow,
      post);
}

bool TimeSlotGenerator::Next(ShiftSlot & slot)
{
  if (m_cursor >= m_horizonEnd)
    return false;

  slot.post = m_post;
  slot.slotStart = m_cursor;
  slot.isNight = IsNightTime(m_nightWindow, m_cursor);

  ScheduleTime const duration = slot.isNight ? m_nightShiftSeconds : m_dayShiftSeconds;
  slot.slotEnd = std::min(m_cursor + duration, m_horizonEnd);

  m_cursor = slot.slotEnd;
  return true;
}

void TimeSlotGenerator::Reset()
{
  m_cursor = m_horizonStart;
}

std::vector<ShiftSlot> TimeSlotGenerator::Collect() const
{
  TimeSlotGenerator generator = *this;
  generator.Reset();

  std::vector<ShiftSlot> slots;
  ShiftSlot slot;
  while (generator.Next(slot))
    slots.push_back(slot);
  return slots;
}
