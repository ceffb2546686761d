#include "stringFormatter.hpp"

#include <sc-memory/sc_utils.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

void StringFormatter::Ltrim(std::string & str)
{
  size_t startPos = 0;
  while (startPos < str.size() && std::isspace(static_cast<unsigned char>(str[startPos])))
  {
    startPos++;
  }
  str = str.substr(startPos);
}

void StringFormatter::Rtrim(std::string & str)
{
  size_t length = str.size();
  while (length > 0 && std::isspace(static_cast<unsigned char>(str[length - 1])))
  {
    length--;
  }
  str = str.substr(0, length);
}

std::string StringFormatter::Trim(std::string str)
{
  Ltrim(str);
  Rtrim(str);
  return str;
}

std::string StringFormatter::Join(std::vector<std::string> const & parts, std::string const & separator)
{
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i)
  {
    if (i > 0)
      result += separator;
    result += parts[i];
  }
  return result;
}

int StringFormatter::ParseInt(std::string const & str)
{
  std::string const trimmed = Trim(str);
  size_t parsedLength = 0;
  int value = 0;
  try
  {
    value = std::stoi(trimmed, &parsedLength);
  }
  catch (std::exception const &)
  {
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "`" << str << "` is not an integer");
  }

  if (parsedLength != trimmed.size())
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "`" << str << "` is not an integer");

  return value;
}

double StringFormatter::ParseDouble(std::string const & str)
{
  std::string const trimmed = Trim(str);
  size_t parsedLength = 0;
  double value = 0;
  try
  {
    value = std::stod(trimmed, &parsedLength);
  }
  catch (std::exception const &)
  {
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "`" << str << "` is not a number");
  }

  if (parsedLength != trimmed.size())
    SC_THROW_EXCEPTION(utils::ExceptionParseError, "`" << str << "` is not a number");

  return value;
}

std::string StringFormatter::FormatNumber(double value)
{
  std::ostringstream stream;
  stream << std::setprecision(15) << value;
  return stream.str();
}
