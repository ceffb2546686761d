#pragma once

#include "engine/scheduleTypes.hpp"

#include <string>

// Результат проверки времени на сетку 30 минут
struct TimeValidation
{
  bool valid = false;
  std::string closestTime;  // пусто, если подсказки нет
  std::string message;
};

class DateTimeFormatter
{
public:
  // "YYYY-MM-DDTHH:MM" или "YYYY-MM-DDTHH:MM:SS", вместо 'T' допускается пробел
  static ScheduleTime ParseDateTime(std::string const & str);
  // Всегда "YYYY-MM-DDTHH:MM:SS"
  static std::string FormatDateTime(ScheduleTime time);

  static TimeOfDay ParseTimeOfDay(std::string const & str);
  static std::string FormatTimeOfDay(TimeOfDay const & time);

  static ScheduleTime FromCivil(int year, int month, int day, int hour, int minute, int second);
  static std::int64_t SecondsOfDay(ScheduleTime time);
  static ScheduleTime HoursToSeconds(double hours);

  static TimeValidation ValidateHalfHourTime(std::string const & str);

private:
  static bool ParseFixedNumber(std::string const & str, size_t pos, size_t length, int & value);
};
