#pragma once

#include "engine/scheduleTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>

// Формат запроса и ответа сервиса расписания. Неизвестные поля запроса
// и отсутствие обязательных полей считаются ошибкой.
class ScheduleJsonCodec
{
public:
  static ScheduleRequest ParseRequest(std::string const & text);
  static ScheduleRequest ParseRequest(nlohmann::json const & document);

  static nlohmann::json ResultToJson(ScheduleResult const & result);
  static std::string SerializeResult(ScheduleResult const & result, int indent = -1);

private:
  static void CheckFields(
      nlohmann::json const & object,
      std::vector<std::string> const & required,
      std::vector<std::string> const & optional,
      std::string const & context);

  static std::string GetString(nlohmann::json const & object, std::string const & key, std::string const & context);
  static double GetNumber(nlohmann::json const & object, std::string const & key, std::string const & context);
  static std::vector<std::string> GetNames(nlohmann::json const & object, std::string const & key);
};
