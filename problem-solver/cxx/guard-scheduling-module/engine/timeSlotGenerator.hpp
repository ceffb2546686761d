#pragma once

#include "scheduleTypes.hpp"

#include <string>
#include <vector>

// Попадает ли время суток момента time в ночной интервал
bool IsNightTime(NightWindow const & window, ScheduleTime time);

// Ленивая перезапускаемая последовательность смен одного поста,
// покрывающая [horizonStart, horizonEnd) без разрывов и наложений.
class TimeSlotGenerator
{
public:
  TimeSlotGenerator(
      ScheduleTime horizonStart,
      ScheduleTime horizonEnd,
      double dayShiftHours,
      double nightShiftHours,
      NightWindow const & nightWindow,
      std::string post);

  static TimeSlotGenerator ForPost(ScheduleRequest const & request, std::string const & post);

  bool Next(ShiftSlot & slot);
  void Reset();
  std::vector<ShiftSlot> Collect() const;

private:
  ScheduleTime m_horizonStart;
  ScheduleTime m_horizonEnd;
  ScheduleTime m_dayShiftSeconds;
  ScheduleTime m_nightShiftSeconds;
  NightWindow m_nightWindow;
  std::string m_post;

  ScheduleTime m_cursor;
};
