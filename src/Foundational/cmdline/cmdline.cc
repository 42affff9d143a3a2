#include <stdio.h>
#include <unistd.h>

#include <iostream>

#include "absl/strings/numbers.h"

#include "cmdline.h"

using std::cerr;

Option_and_Value::Option_and_Value (int o, const char * val) : _o(o)
{
  _has_value = (val != nullptr);
  if (_has_value)
    _value = val;

  return;
}

int
Option_and_Value::value (int & result) const
{
  if (! _has_value)
    return 0;

  return absl::SimpleAtoi(_value, &result);
}

int
Option_and_Value::value (unsigned int & result) const
{
  if (! _has_value)
    return 0;

  return absl::SimpleAtoi(_value, &result);
}

int
Option_and_Value::value (double & result) const
{
  if (! _has_value)
    return 0;

  return absl::SimpleAtod(_value, &result);
}

int
Option_and_Value::value (std::string & result) const
{
  if (! _has_value)
    return 0;

  result = _value;

  return 1;
}

std::ostream &
operator << (std::ostream & os, const Option_and_Value & ov)
{
  return os << "Option '" << ov.option() << "', value '" << ov.value() << "'";
}

Command_Line::Command_Line (int argc, char ** argv, const char * options)
{
  optarg = nullptr;
  optind = 1;   // reinitialise in case of multiple invocations
  opterr = 0;     // suppress error messages

  _some_options_start_with_dash = 0;
  _unrecognised_options_encountered = 0;

  int o;

  while ((o = getopt(argc, argv, options)) != EOF)
  {
    if ('?' == o)
    {
      cerr << "Command_Line: unrecognised option '" << argv[optind - 1] << "'\n";
      _unrecognised_options_encountered++;
    }
    else
      _options.push_back(std::make_unique<Option_and_Value>(o, optarg));
  }

  for (int i = optind; i < argc; i++)
  {
    if ('-' == *(argv[i]))
      _some_options_start_with_dash++;
    _values.emplace_back(argv[i]);
  }

  return;
}

int
Command_Line::debug_print (std::ostream & os) const
{
  os << "Command line object contains " << _options.size() << " options and " <<
        _values.size() << " values\n";

  for (const auto & oo : _options)
    os << *oo << '\n';

  for (const std::string & v : _values)
    os << "Value '" << v << "'\n";

  return os.good();
}

std::ostream &
operator << (std::ostream & os, const Command_Line & cl)
{
  cl.debug_print(os);

  return os;
}

int
Command_Line::option_present (const char c) const
{
  for (size_t i = 0; i < _options.size(); i++)
  {
    if (c == _options[i]->option())
      return i + 1;
  }

  return 0;
}

int
Command_Line::option_count (const char c) const
{
  int rc = 0;

  for (const auto & oo : _options)
  {
    if (c == oo->option())
      rc++;
  }

  return rc;
}

std::string
Command_Line::string_value (const char c, int occurrence) const
{
  std::string result;
  if (! value(c, result, occurrence))
    return std::string();

  return result;
}

int
Command_Line::all_values (const char c, std::vector<std::string> & values) const
{
  int rc = 0;

  for (const auto & oo : _options)
  {
    if (c != oo->option())
      continue;

    values.push_back(oo->value());
    rc++;
  }

  return rc;
}
