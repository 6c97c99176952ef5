#ifndef UNITS_HPP
#define UNITS_HPP

#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/units/quantity.hpp>
#include <boost/optional.hpp>
#include <boost/units/systems/si.hpp>
#include <boost/units/base_units/imperial/inch.hpp>
#include <boost/units/base_units/imperial/thou.hpp>
#include <boost/units/io.hpp>
#include <boost/math/constants/constants.hpp>

struct units_parse_exception : public std::exception {
  units_parse_exception(const std::string& what) : what_string(what) {}

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

struct comparison_exception : public std::exception {
  comparison_exception(const std::string& what) : what_string(what) {}

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

// Splits an option value such as "2.5 mm" into its number and its unit
// word.
class Lexer {
 public:
  Lexer(const std::string& s) : pos(0), input(s) {}

  void skip_whitespace() {
    while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
      pos++;
    }
  }
  std::string get_word() {
    skip_whitespace();
    const size_t start = pos;
    while (pos < input.size() && std::isalpha(static_cast<unsigned char>(input[pos]))) {
      pos++;
    }
    return input.substr(start, pos - start);
  }
  double get_double() {
    skip_whitespace();
    const size_t start = pos;
    while (pos < input.size() && is_number_char(input[pos])) {
      pos++;
    }
    const std::string text = input.substr(start, pos - start);
    try {
      return boost::lexical_cast<double>(text);
    } catch (const boost::bad_lexical_cast&) {
      throw units_parse_exception("Can't get a number from: " + text);
    }
  }
  bool at_end() const {
    return pos == input.size();
  }

 private:
  static bool is_number_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '+' || c == 'e';
  }
  size_t pos;
  std::string input;
};

// Any non-SI units that shape files and options accept.
const boost::units::quantity<boost::units::si::length> millimeter(boost::units::si::meter/1000.0);
const boost::units::quantity<boost::units::si::length> inch(1*boost::units::imperial::inch_base_unit::unit_type());
const boost::units::quantity<boost::units::si::length> thou(1*boost::units::imperial::thou_base_unit::unit_type());
const boost::units::quantity<boost::units::si::plane_angle> degree(
    boost::math::constants::pi<double>() / 180.0 * boost::units::si::radian);

// The unit words accepted for each dimension.
template <typename dimension_t>
struct unit_words;

template <>
struct unit_words<boost::units::si::length> {
  typedef boost::units::quantity<boost::units::si::length> quantity;
  static std::vector<std::pair<std::vector<std::string>, quantity>> table() {
    return {
      {{"mm", "millimeter", "millimeters"}, millimeter},
      {{"cm", "centimeter", "centimeters"}, boost::units::si::meter/100.0},
      {{"m", "meter", "meters"}, 1.0 * boost::units::si::meter},
      {{"in", "inch", "inches"}, inch},
      {{"thou", "thous", "mil", "mils"}, thou},
    };
  }
  static const char* name() { return "length"; }
};

template <>
struct unit_words<boost::units::si::plane_angle> {
  typedef boost::units::quantity<boost::units::si::plane_angle> quantity;
  static std::vector<std::pair<std::vector<std::string>, quantity>> table() {
    return {
      {{"deg", "degree", "degrees"}, degree},
      {{"rad", "radian", "radians"}, 1.0 * boost::units::si::radian},
    };
  }
  static const char* name() { return "angle"; }
};

// A number with an optional unit.  Without a unit the caller's default
// factor applies when converting.
template <typename dimension_t>
class Unit {
 public:
  typedef boost::units::quantity<dimension_t> quantity;
  typedef dimension_t dimension;

  Unit(double value = 0, boost::optional<quantity> one = boost::none) : value(value), one(one) {}

  double as(double factor, quantity wanted_unit) const {
    if (!one) {
      return value * factor;
    }
    return value * (*one) / wanted_unit;
  }
  double asMillimeter(double factor) const {
    return as(factor, millimeter);
  }
  double asDegree(double factor) const {
    return as(factor, degree);
  }

  static quantity get_unit(Lexer& lex) {
    const std::string word = lex.get_word();
    for (const auto& entry : unit_words<dimension_t>::table()) {
      for (const auto& name : entry.first) {
        if (word == name) {
          return entry.second;
        }
      }
    }
    throw units_parse_exception(std::string("Can't get ") + unit_words<dimension_t>::name() +
                                " units from: " + word);
  }

  friend std::ostream& operator<<(std::ostream& s, const Unit& unit) {
    if (unit.one) {
      s << unit.value * *unit.one;
    } else {
      s << unit.value;
    }
    return s;
  }
  bool operator<(const Unit& other) const {
    // Zero and infinities don't depend on the unit.
    if (std::isinf(value) || value == 0 || std::isinf(other.value) || other.value == 0 ||
        (!one && !other.one)) {
      return value < other.value;
    }
    if (one && other.one) {
      return value * *one < other.value * *other.one;
    }
    throw comparison_exception("Can't compare with units and without.");
  }
  bool operator==(const Unit& other) const {
    return !(*this < other) && !(other < *this);
  }

 private:
  double value;
  boost::optional<quantity> one;
};

typedef Unit<boost::units::si::length> Length;
typedef Unit<boost::units::si::plane_angle> Angle;

template <typename unit_t>
unit_t parse_unit(const std::string& s) {
  Lexer lex(s);
  double value = 0;
  boost::optional<typename unit_t::quantity> one;
  try {
    value = lex.get_double();
    lex.skip_whitespace();
    if (!lex.at_end()) {
      one = unit_t::get_unit(lex);
    }
  } catch (const units_parse_exception& e) {
    throw boost::program_options::invalid_option_value("While parsing \"" + s + "\": " + e.what());
  }
  lex.skip_whitespace();
  if (!lex.at_end()) {
    throw boost::program_options::invalid_option_value("While parsing \"" + s + "\": Extra characters at end of option");
  }
  return unit_t(value, one);
}

template <typename dimension_t>
inline std::istream& operator>>(std::istream& in, Unit<dimension_t>& unit) {
  std::string s(std::istreambuf_iterator<char>(in), {});
  unit = parse_unit<Unit<dimension_t>>(s);
  return in;
}

#endif // UNITS_HPP
