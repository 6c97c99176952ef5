/*
 * This file is part of coatpath.
 *
 * Copyright (C) 2025 The coatpath authors
 *
 * coatpath is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * coatpath is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with coatpath.  If not, see <http://www.gnu.org/licenses/>.
 */


#include "options.hpp"
#include "config.h"

#include <fstream>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include "units.hpp"
#include "coating_types.hpp"
#include "segment_exporter.hpp"

#include <iostream>
using std::cerr;
using std::endl;
using std::string;

/******************************************************************************/
/*
 */
/******************************************************************************/
options& options::instance() {
    static options singleton;
    return singleton;
}

void options::maybe_throw(const std::string& what, ErrorCodes error_code) {
  if (instance().vm["ignore-warnings"].as<bool>()) {
    cerr << "Ignoring error code " << error_code << ": " << what << endl;
  } else {
    throw coatpath_parse_exception(what, error_code);
  }
}

/* parse options, both command line and from the coatproject file if it exists.
 * Throws on error.
 */
void options::parse(int argc, const char** argv) {
    // guessing causes problems when one option is the start of another
    // (--line-spacing, --line-spacing-...)
    int style = po::command_line_style::default_style
                & ~po::command_line_style::allow_guessing;

    po::options_description generic;
    generic.add(instance().cli_options).add(instance().cfg_options);

    try {
      po::store(po::parse_command_line(argc, argv, generic, style),
                instance().vm);
    } catch (std::logic_error& e) {
      throw coatpath_parse_exception(std::string("Error: You've supplied an invalid parameter.\n"
                                                 "Details: ")
                                     + e.what(), ERR_UNKNOWNPARAMETER);
    }

    po::notify(instance().vm);

    if( !instance().vm["noconfigfile"].as<bool>() )
        parse_files();

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
string options::help()
{
    std::stringstream msg;
    msg << PACKAGE_STRING << "\n\n";
    msg << instance().cli_options << instance().cfg_options;
    return msg.str();
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::parse_files()
{

    std::string file("coatproject");

    try {
        std::ifstream stream(file.c_str());
        po::store(po::parse_config_file(stream, instance().cfg_options),
                  instance().vm);
    } catch (std::exception& e) {
      maybe_throw("Error parsing configuration file \"" + file + "\": " +
                  e.what(), ERR_INVALIDPARAMETER);
    }

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
options::options()
         : cli_options("command line only options"), cfg_options("generic options (CLI and config files)") {

   cli_options.add_options()
       ("noconfigfile", po::value<bool>()->default_value(false)->implicit_value(true), "ignore any configuration file")
       ("help,?", "produce help message")
       ("version,V", "show the current software version");
   cfg_options.add_options()
       ("ignore-warnings", po::value<bool>()->default_value(false)->implicit_value(true), "Ignore warnings")
       ("shapes", po::value<string>(), "shape file, one shape per line")
       ("output", po::value<string>()->default_value("toolpaths.txt"), "output file for the toolpaths")
       ("format", po::value<OutputFormat::OutputFormat>()->default_value(OutputFormat::SEGMENTS),
        "output format; valid choices are segments (default) or wkt")
       ("relative", po::value<bool>()->default_value(false)->implicit_value(true),
        "write coordinates relative to the position of each shape")
       ("include-transform", po::value<bool>()->default_value(false)->implicit_value(true),
        "write the position, rotation and scale of each shape")
       ("show-travel", po::value<bool>()->default_value(false)->implicit_value(true),
        "list the travel moves between segments that don't join up")
       ("line-spacing", po::value<Length>()->default_value(parse_unit<Length>("10mm")),
        "distance between the centers of neighbouring coating lines")
       ("coating-width", po::value<Length>()->default_value(parse_unit<Length>("10mm")),
        "width of the coated band laid down by one line")
       ("fill-pattern", po::value<FillPattern::FillPattern>()->default_value(FillPattern::AUTO),
        "fill pattern; valid choices are horizontal, vertical, concentric or auto (default)")
       ("enable-masking", po::value<bool>()->default_value(true)->implicit_value(true),
        "keep fills out of the masking shapes (enabled by default)")
       ("masking-clearance", po::value<Length>()->default_value(Length(0)),
        "extra distance to keep from the masking shapes")
       ("mask-avoidance", po::value<MaskAvoidance::MaskAvoidance>()->default_value(MaskAvoidance::ROUTE_AROUND),
        "how fills avoid masks; valid choices are lift or route-around (default)")
       ("yield-interval", po::value<unsigned int>()->default_value(50),
        "scan iterations between two progress checkpoints");
}

/******************************************************************************/
/*
 */
/******************************************************************************/
static void check_generic_parameters(po::variables_map const& vm)
{
    //---------------------------------------------------------------------------
    //Check for the shape file:

    if (!vm.count("shapes")) {
      options::maybe_throw("Error: No shape file specified.", ERR_NOSHAPES);
    }

    //---------------------------------------------------------------------------
    //Check line-spacing parameter:

    const double line_spacing = vm["line-spacing"].as<Length>().asMillimeter(1);
    if (line_spacing < 0) {
      options::maybe_throw("line-spacing can't be negative!", ERR_NEGATIVELINESPACING);
    } else if (line_spacing == 0) {
      cerr << "Warning: line-spacing is 0, fills will be empty." << endl;
    }

    //---------------------------------------------------------------------------
    //Check coating-width parameter:

    const double coating_width = vm["coating-width"].as<Length>().asMillimeter(1);
    if (coating_width < 0) {
      options::maybe_throw("coating-width can't be negative!", ERR_NEGATIVECOATINGWIDTH);
    } else if (coating_width > line_spacing * 2) {
      cerr << "Warning: coating-width is more than twice the line-spacing, lines will overlap." << endl;
    }

    //---------------------------------------------------------------------------
    //Check masking-clearance parameter:

    if (vm["masking-clearance"].as<Length>().asMillimeter(1) < 0) {
      options::maybe_throw("masking-clearance can't be negative!", ERR_NEGATIVECLEARANCE);
    }

    //---------------------------------------------------------------------------
    //Check yield-interval parameter:

    if (vm["yield-interval"].as<unsigned int>() == 0) {
      options::maybe_throw("yield-interval must be at least 1!", ERR_ZEROYIELDINTERVAL);
    }
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::check_parameters()
{
    po::variables_map const& vm = instance().vm;

    try {
        check_generic_parameters(vm);
    } catch (std::runtime_error& re) {
      maybe_throw(std::string("Error: Invalid parameter. ") + re.what(), ERR_INVALIDPARAMETER);
    }
}

/******************************************************************************/
/*
 */
/******************************************************************************/
CoatingSettings options::coating_settings()
{
    po::variables_map const& vm = instance().vm;

    CoatingSettings settings;
    settings.line_spacing = vm["line-spacing"].as<Length>().asMillimeter(1);
    settings.coating_width = vm["coating-width"].as<Length>().asMillimeter(1);
    settings.fill_pattern = vm["fill-pattern"].as<FillPattern::FillPattern>();
    settings.enable_masking = vm["enable-masking"].as<bool>();
    settings.masking_clearance = vm["masking-clearance"].as<Length>().asMillimeter(1);
    settings.mask_avoidance = vm["mask-avoidance"].as<MaskAvoidance::MaskAvoidance>();
    settings.yield_interval = vm["yield-interval"].as<unsigned int>();
    return settings;
}
