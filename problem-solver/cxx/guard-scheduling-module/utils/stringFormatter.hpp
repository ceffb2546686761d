#pragma once

#include <string>
#include <vector>

class StringFormatter
{
public:
  static void Ltrim(std::string & str);
  static void Rtrim(std::string & str);
  static std::string Trim(std::string str);
  static std::string Join(std::vector<std::string> const & parts, std::string const & separator = ", ");

  // Строгий разбор: вся строка (без пробелов по краям) должна быть числом
  static int ParseInt(std::string const & str);
  static double ParseDouble(std::string const & str);

  // 8 -> "8", 7.5 -> "7.5"
  static std::string FormatNumber(double value);
};
