#include "scheduleJsonCodec.hpp"
#include "dateTimeFormatter.hpp"
#include "stringFormatter.hpp"
#include "engine/assignmentAssembler.hpp"

#include <sc-memory/sc_utils.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

using nlohmann::json;

void ScheduleJsonCodec::CheckFields(
    json const & object,
    std::vector<std::string> const & required,
    std::vector<std::string> const & optional,
    std::string const & context)
{
  if (!object.is_object())
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "`" << context << "` must be an object");

  for (auto const & field : required)
  {
    if (!object.contains(field))
      SC_THROW_EXCEPTION(utils::ExceptionInvalidParams, "Missing field `" << context << "." << field << "`");
  }

  for (auto const & [key, value] : object.items())
  {
    bool const known = std::find(required.begin(), required.end(), key) != required.end()
                       || std::find(optional.begin(), optional.end(), key) != optional.end();
    if (!known)
      SC_THROW_EXCEPTION(utils::ExceptionInvalidParams, "Unknown field `" << context << "." << key << "`");
  }
}

std::string ScheduleJsonCodec::GetString(json const & object, std::string const & key, std::string const & context)
{
  json const & value = object.at(key);
  if (!value.is_string())
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "Field `" << context << "." << key << "` must be a string");
  return value.get<std::string>();
}

double ScheduleJsonCodec::GetNumber(json const & object, std::string const & key, std::string const & context)
{
  json const & value = object.at(key);
  if (!value.is_number())
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "Field `" << context << "." << key << "` must be a number");
  return value.get<double>();
}

std::vector<std::string> ScheduleJsonCodec::GetNames(json const & object, std::string const & key)
{
  json const & value = object.at(key);
  if (!value.is_array())
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "Field `" << key << "` must be an array of strings");

  std::vector<std::string> names;
  for (auto const & item : value)
  {
    if (!item.is_string())
      SC_THROW_EXCEPTION(utils::ExceptionParseError, "Field `" << key << "` must be an array of strings");

    std::string name = StringFormatter::Trim(item.get<std::string>());
    if (name.empty())
      SC_THROW_EXCEPTION(utils::ExceptionInvalidParams, "Field `" << key << "` contains an empty name");
    names.push_back(std::move(name));
  }
  return names;
}

ScheduleRequest ScheduleJsonCodec::ParseRequest(std::string const & text)
{
  json document;
  try
  {
    document = json::parse(text);
  }
  catch (json::parse_error const & exception)
  {
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "Schedule request is not valid JSON: " << exception.what());
  }
  return ParseRequest(document);
}

ScheduleRequest ScheduleJsonCodec::ParseRequest(json const & document)
{
  CheckFields(
      document,
      {"schedule_start_datetime",
       "schedule_end_datetime",
       "guards",
       "posts",
       "shift_lengths",
       "night_time_range",
       "max_consecutive_nights"},
      {"unavailability"},
      "request");

  ScheduleRequest request;
  request.horizonStart =
      DateTimeFormatter::ParseDateTime(GetString(document, "schedule_start_datetime", "request"));
  request.horizonEnd = DateTimeFormatter::ParseDateTime(GetString(document, "schedule_end_datetime", "request"));
  request.guards = GetNames(document, "guards");
  request.posts = GetNames(document, "posts");

  json const & shiftLengths = document.at("shift_lengths");
  CheckFields(shiftLengths, {"day_shift_hours", "night_shift_hours"}, {}, "shift_lengths");
  request.dayShiftHours = GetNumber(shiftLengths, "day_shift_hours", "shift_lengths");
  request.nightShiftHours = GetNumber(shiftLengths, "night_shift_hours", "shift_lengths");

  json const & nightRange = document.at("night_time_range");
  CheckFields(nightRange, {"start", "end"}, {}, "night_time_range");
  request.nightWindow.start = DateTimeFormatter::ParseTimeOfDay(GetString(nightRange, "start", "night_time_range"));
  request.nightWindow.end = DateTimeFormatter::ParseTimeOfDay(GetString(nightRange, "end", "night_time_range"));

  json const & maxNights = document.at("max_consecutive_nights");
  if (!maxNights.is_number_integer())
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "Field `request.max_consecutive_nights` must be an integer");
  // Значения вне диапазона int не должны молча усекаться
  bool const fitsInt = maxNights.is_number_unsigned()
                           ? maxNights.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                           : maxNights.get<std::int64_t>() >= std::numeric_limits<int>::min()
                                 && maxNights.get<std::int64_t>() <= std::numeric_limits<int>::max();
  if (!fitsInt)
    SC_THROW_EXCEPTION(
        utils::ExceptionInvalidParams, "Field `request.max_consecutive_nights` is out of range: " << maxNights.dump());
  request.maxConsecutiveNights = maxNights.get<int>();

  if (document.contains("unavailability"))
  {
    json const & unavailability = document.at("unavailability");
    if (!unavailability.is_object())
      SC_THROW_EXCEPTION(utils::ExceptionParseError, "Field `request.unavailability` must be an object");

    for (auto const & [guard, windows] : unavailability.items())
    {
      if (!windows.is_array())
        SC_THROW_EXCEPTION(
            utils::ExceptionParseError, "Unavailability of guard `" << guard << "` must be an array");

      std::vector<TimeWindow> & parsed = request.unavailability[StringFormatter::Trim(guard)];
      for (auto const & window : windows)
      {
        CheckFields(window, {"start", "end"}, {}, "unavailability." + guard);
        parsed.push_back(
            {DateTimeFormatter::ParseDateTime(GetString(window, "start", "unavailability." + guard)),
             DateTimeFormatter::ParseDateTime(GetString(window, "end", "unavailability." + guard))});
      }
    }
  }

  return request;
}

json ScheduleJsonCodec::ResultToJson(ScheduleResult const & result)
{
  json document;
  document["success"] = result.success;

  if (!result.success)
  {
    if (result.error)
    {
      ScheduleError const & error = *result.error;
      document["error"] = error.message;
      document["error_kind"] = GetErrorKindName(error.kind);
      if (error.kind == ScheduleErrorKind::UnfillableSlot)
      {
        document["post_id"] = error.post;
        document["shift_start_time"] = DateTimeFormatter::FormatDateTime(error.slotStart);
        document["shift_end_time"] = DateTimeFormatter::FormatDateTime(error.slotEnd);
      }
    }
    return document;
  }

  json assignments = json::array();
  for (auto const & assignment : result.assignments)
  {
    assignments.push_back(
        {{"guard_id", assignment.guard},
         {"post_id", assignment.post},
         {"shift_start_time", DateTimeFormatter::FormatDateTime(assignment.shiftStart)},
         {"shift_end_time", DateTimeFormatter::FormatDateTime(assignment.shiftEnd)}});
  }
  document["assignments"] = assignments;

  document["metadata"] = {
      {"total_assignments", result.metadata.totalAssignments},
      {"unique_guards", result.metadata.uniqueGuards},
      {"unique_posts", result.metadata.uniquePosts},
      {"schedule_duration_hours", result.metadata.durationHours}};

  json workload = json::array();
  for (auto const & guardWorkload : result.workloads)
  {
    workload.push_back(
        {{"guard_id", guardWorkload.guard},
         {"total_shifts", guardWorkload.totalShifts},
         {"night_shifts", guardWorkload.nightShifts},
         {"total_hours", std::round(guardWorkload.totalHours * 10) / 10}});
  }
  document["workload"] = workload;

  return document;
}

std::string ScheduleJsonCodec::SerializeResult(ScheduleResult const & result, int indent)
{
  // Имена читаются из sc-ссылок и могут не быть корректным UTF-8
  return ResultToJson(result).dump(indent, ' ', false, json::error_handler_t::replace);
}
