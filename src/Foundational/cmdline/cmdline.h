#ifndef FOUNDATIONAL_CMDLINE_CMDLINE_H
#define FOUNDATIONAL_CMDLINE_CMDLINE_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>

// getopt based command line parsing.
//   Command_Line cl(argc, argv, "vr:C:u");
// Options are single letters, a ':' following a letter means that
// option takes a value. Options may be repeated. Whatever follows the
// options is available via number_elements() and operator[].

class Option_and_Value
{
  friend
    std::ostream &
    operator << (std::ostream &, const Option_and_Value &);

  private:
    int _o;
    // Empty for options that take no value.
    std::string _value;
    bool _has_value;

  public:
    Option_and_Value (int, const char * = nullptr);

    char option () const { return _o;}
    bool has_value () const { return _has_value;}
    const std::string & value () const { return _value;}

    int value (int &) const;
    int value (unsigned int &) const;
    int value (double &) const;
    int value (std::string &) const;
};

class Command_Line
{
  friend
    std::ostream &
      operator << (std::ostream &, const Command_Line &);

  private:
    std::vector<std::unique_ptr<Option_and_Value>> _options;
    std::vector<std::string> _values;
    int _some_options_start_with_dash;    // perhaps indicative of an error
    int _unrecognised_options_encountered;

  public:
    Command_Line (int, char **, const char *);

    int debug_print (std::ostream &) const;

    int some_options_start_with_dash () const { return _some_options_start_with_dash;}
    int unrecognised_options_encountered () const { return _unrecognised_options_encountered;}

    int number_elements () const { return _values.size();}
    bool empty () const { return _values.empty();}
    const std::string & operator[] (int i) const { return _values[i];}

    int option_present (const char) const;
    int option_count (const char) const;

    template <typename T> int value (const char, T &, int = 0) const;

    // Empty if the option is absent.
    std::string string_value (const char, int = 0) const;

    int all_values (const char, std::vector<std::string> &) const;
};

template <typename T>
int
Command_Line::value (const char c, T & result, int occurrence) const
{
  int nfound = 0;
  for (const auto & oo : _options)
  {
    if (c != oo->option())
      continue;

    if (nfound == occurrence)
      return oo->value(result);

    nfound++;
  }

  return 0;
}

#endif  // FOUNDATIONAL_CMDLINE_CMDLINE_H
