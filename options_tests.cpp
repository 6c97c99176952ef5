#define BOOST_TEST_MODULE options tests
#include <boost/test/included/unit_test.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "options.hpp"
#include "units.hpp"
#include "coating_types.hpp"
#include "segment_exporter.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(options_tests)

void parse(const std::string& args) {
  std::vector<std::string> words;
  boost::split(words, args, boost::is_any_of(" "), boost::token_compress_on);
  std::vector<const char*> argv;
  for (const auto& word : words) {
    argv.push_back(word.c_str());
  }
  cerr << endl << "Parsing: " << args << endl;
  options::get_vm().clear();
  options::parse(argv.size(), argv.data());
}

ErrorCodes get_error_code(const std::string& args) {
  try {
    parse(args);
    options::check_parameters();
  } catch (const coatpath_parse_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  }
  return ERR_OK;
}

template<typename variable_t>
variable_t get_value(const std::string& args, const std::string& variable) {
  BOOST_CHECK_EQUAL(get_error_code(args), ERR_OK);
  BOOST_CHECK_NO_THROW(options::get_vm().at(variable).as<variable_t>());
  return options::get_vm().at(variable).as<variable_t>();
}

BOOST_AUTO_TEST_CASE(foo) {
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --foo"), 101);
}

BOOST_AUTO_TEST_CASE(bad_values) {
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --fill-pattern spiral"), 101);
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --line-spacing 1rpm"), 101);
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --mask-avoidance jump"), 101);
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --format svg"), 101);
}

BOOST_AUTO_TEST_CASE(no_shapes) {
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile"), ERR_NOSHAPES);
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt"), ERR_OK);
}

BOOST_AUTO_TEST_CASE(negative_parameters) {
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --line-spacing=-1mm"),
                    ERR_NEGATIVELINESPACING);
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --coating-width=-1mm"),
                    ERR_NEGATIVECOATINGWIDTH);
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --masking-clearance=-0.1in"),
                    ERR_NEGATIVECLEARANCE);
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --yield-interval 0"),
                    ERR_ZEROYIELDINTERVAL);
}

BOOST_AUTO_TEST_CASE(ignore_warnings) {
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --ignore-warnings --line-spacing=-1mm"), ERR_OK);
}

BOOST_AUTO_TEST_CASE(defaults) {
  BOOST_CHECK_EQUAL(get_value<Length>("coatpath --noconfigfile --shapes a.txt", "line-spacing"),
                    parse_unit<Length>("10mm"));
  BOOST_CHECK_EQUAL(get_value<string>("coatpath --noconfigfile --shapes a.txt", "output"), "toolpaths.txt");
  BOOST_CHECK_EQUAL(get_value<OutputFormat::OutputFormat>("coatpath --noconfigfile --shapes a.txt", "format"),
                    OutputFormat::SEGMENTS);
  BOOST_CHECK_EQUAL(get_value<bool>("coatpath --noconfigfile --shapes a.txt", "show-travel"), false);

  const CoatingSettings settings = options::coating_settings();
  BOOST_CHECK_EQUAL(settings.line_spacing, 10);
  BOOST_CHECK_EQUAL(settings.coating_width, 10);
  BOOST_CHECK_EQUAL(settings.fill_pattern, FillPattern::AUTO);
  BOOST_CHECK(settings.enable_masking);
  BOOST_CHECK_EQUAL(settings.masking_clearance, 0);
  BOOST_CHECK_EQUAL(settings.mask_avoidance, MaskAvoidance::ROUTE_AROUND);
  BOOST_CHECK_EQUAL(settings.yield_interval, 50);
}

BOOST_AUTO_TEST_CASE(coating_settings) {
  BOOST_CHECK_EQUAL(get_error_code("coatpath --noconfigfile --shapes a.txt --line-spacing 0.1in "
                                   "--coating-width 3mm --fill-pattern Vertical --enable-masking=false "
                                   "--masking-clearance 1cm --mask-avoidance lift --yield-interval 7"),
                    ERR_OK);
  const CoatingSettings settings = options::coating_settings();
  BOOST_CHECK_CLOSE(settings.line_spacing, 2.54, 1e-9);
  BOOST_CHECK_CLOSE(settings.coating_width, 3, 1e-9);
  BOOST_CHECK_EQUAL(settings.fill_pattern, FillPattern::VERTICAL);
  BOOST_CHECK(!settings.enable_masking);
  BOOST_CHECK_CLOSE(settings.masking_clearance, 10, 1e-9);
  BOOST_CHECK_EQUAL(settings.mask_avoidance, MaskAvoidance::LIFT);
  BOOST_CHECK_EQUAL(settings.yield_interval, 7);
}

BOOST_AUTO_TEST_SUITE_END()
