#include "dateTimeFormatter.hpp"
#include "stringFormatter.hpp"

#include <sc-memory/sc_utils.hpp>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

bool DateTimeFormatter::ParseFixedNumber(std::string const & str, size_t pos, size_t length, int & value)
{
  if (pos + length > str.size())
    return false;

  value = 0;
  for (size_t i = pos; i < pos + length; ++i)
  {
    if (!std::isdigit(static_cast<unsigned char>(str[i])))
      return false;
    value = value * 10 + (str[i] - '0');
  }
  return true;
}

ScheduleTime DateTimeFormatter::FromCivil(int year, int month, int day, int hour, int minute, int second)
{
  std::tm civil{};
  civil.tm_year = year - 1900;
  civil.tm_mon = month - 1;
  civil.tm_mday = day;
  civil.tm_hour = hour;
  civil.tm_min = minute;
  civil.tm_sec = second;

  // timegm нормализует поля, поэтому 31 апреля превращается в 1 мая
  std::time_t const time = timegm(&civil);
  std::tm normalized{};
  if (gmtime_r(&time, &normalized) == nullptr || normalized.tm_year != year - 1900 || normalized.tm_mon != month - 1
      || normalized.tm_mday != day || normalized.tm_hour != hour || normalized.tm_min != minute
      || normalized.tm_sec != second)
    SC_THROW_EXCEPTION(
        utils::ExceptionInvalidParams,
        "Invalid date or time " << year << "-" << month << "-" << day << " " << hour << ":" << minute << ":" << second);

  return static_cast<ScheduleTime>(time);
}

ScheduleTime DateTimeFormatter::ParseDateTime(std::string const & str)
{
  std::string value = StringFormatter::Trim(str);
  if (value.size() != 16 && value.size() != 19)
    SC_THROW_EXCEPTION(
        utils::ExceptionParseError,
        "`" << str << "` is not a datetime of form YYYY-MM-DDTHH:MM[:SS] (time zones are not supported)");
  if (value[10] == ' ')
    value[10] = 'T';

  std::tm civil{};
  std::istringstream stream(value);
  stream >> std::get_time(&civil, value.size() == 19 ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H:%M");
  if (stream.fail() || stream.peek() != std::char_traits<char>::eof())
    SC_THROW_EXCEPTION(
        utils::ExceptionParseError, "`" << str << "` is not a datetime of form YYYY-MM-DDTHH:MM[:SS]");

  return FromCivil(
      civil.tm_year + 1900, civil.tm_mon + 1, civil.tm_mday, civil.tm_hour, civil.tm_min, civil.tm_sec);
}

std::int64_t DateTimeFormatter::SecondsOfDay(ScheduleTime time)
{
  std::int64_t const seconds = time % SECONDS_PER_DAY;
  return seconds < 0 ? seconds + SECONDS_PER_DAY : seconds;
}

std::string DateTimeFormatter::FormatDateTime(ScheduleTime time)
{
  std::time_t const value = static_cast<std::time_t>(time);
  std::tm civil{};
  gmtime_r(&value, &civil);

  char buffer[32];
  std::snprintf(
      buffer,
      sizeof(buffer),
      "%04d-%02d-%02dT%02d:%02d:%02d",
      civil.tm_year + 1900,
      civil.tm_mon + 1,
      civil.tm_mday,
      civil.tm_hour,
      civil.tm_min,
      civil.tm_sec);
  return buffer;
}

TimeOfDay DateTimeFormatter::ParseTimeOfDay(std::string const & str)
{
  std::string const value = StringFormatter::Trim(str);

  TimeOfDay time;
  size_t const colon = value.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2 || value.size() - colon - 1 != 2
      || !ParseFixedNumber(value, 0, colon, time.hour) || !ParseFixedNumber(value, colon + 1, 2, time.minute))
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "`" << str << "` is not a time of form HH:MM");

  if (time.hour > 23 || time.minute > 59)
    SC_THROW_EXCEPTION(utils::ExceptionInvalidParams, "`" << str << "` is out of range 00:00-23:59");

  return time;
}

std::string DateTimeFormatter::FormatTimeOfDay(TimeOfDay const & time)
{
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", time.hour, time.minute);
  return buffer;
}

ScheduleTime DateTimeFormatter::HoursToSeconds(double hours)
{
  return static_cast<ScheduleTime>(std::llround(hours * SECONDS_PER_HOUR));
}

TimeValidation DateTimeFormatter::ValidateHalfHourTime(std::string const & str)
{
  TimeValidation validation;

  std::string const value = StringFormatter::Trim(str);
  size_t const colon = value.find(':');
  if (colon == std::string::npos)
  {
    validation.message = "Invalid time format. Use HH:MM format";
    return validation;
  }

  int hour = 0;
  int minute = 0;
  try
  {
    hour = StringFormatter::ParseInt(value.substr(0, colon));
    minute = StringFormatter::ParseInt(value.substr(colon + 1));
  }
  catch (utils::ScException const &)
  {
    validation.message = "Invalid time format. Use HH:MM format with numbers";
    return validation;
  }

  if (hour < 0 || hour > 23)
  {
    validation.message = "Hour must be between 00 and 23";
    return validation;
  }

  if (minute < 0 || minute > 59)
  {
    validation.message = "Minute must be between 00 and 59";
    return validation;
  }

  if (minute != 0 && minute != 30)
  {
    TimeOfDay closest{hour, 0};
    if (minute >= 45)
      closest.hour = (hour + 1) % 24;
    else if (minute >= 15)
      closest.minute = 30;

    validation.closestTime = FormatTimeOfDay(closest);
    validation.message = "Minutes must be 00 or 30";
    return validation;
  }

  validation.valid = true;
  return validation;
}
