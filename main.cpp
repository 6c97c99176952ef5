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


#include <iostream>
#include <fstream>

#include <vector>
using std::vector;

using std::cout;
using std::cerr;
using std::endl;
using std::flush;

#include <string>
using std::string;

#include "config.h"
#include "errors.hpp"
#include "options.hpp"
#include "segment_exporter.hpp"
#include "shape_reader.hpp"
#include "toolpath_calculator.hpp"
#include "units.hpp"

#include <boost/version.hpp>

void do_coatpath(int argc, const char* argv[]) {
    options::parse(argc, argv);      //parse the command line parameters

    po::variables_map& vm = options::get_vm();      //get the cli parameters

    if (vm.count("version")) {       //return version and quit
      cout << PACKAGE_VERSION << endl;
      cout << "Boost: " << BOOST_VERSION << endl;
      return;
    }

    if (vm.count("help")) {       //return help and quit
      cout << options::help();
      return;
    }

    options::check_parameters();      //check the cli parameters

    //---------------------------------------------------------------------------
    //prepare environment:

    const CoatingSettings settings = options::coating_settings();
    const string shape_file = vm["shapes"].as<string>();

    cout << "Importing shapes from " << shape_file << "... " << flush;
    const vector<CoatingShape> shapes = shape_reader::read_shapes(shape_file);
    cout << "DONE. (" << shapes.size() << " shapes)" << endl;

    const ToolpathCalculator calculator(settings, shapes);
    if (calculator.mask_index().has_masks()) {
      cout << "Masking with " << calculator.mask_index().regions().size()
           << " shapes, avoidance " << settings.mask_avoidance << "." << endl;
    }

    calculation_options calculation;
    calculation.relative = vm["relative"].as<bool>();
    calculation.include_transform = vm["include-transform"].as<bool>();
    const vector<shape_toolpath> toolpaths = calculator.calculate_all(shapes, calculation);

    //---------------------------------------------------------------------------
    //export:

    const string output = vm["output"].as<string>();
    std::ofstream of(output.c_str());
    if (!of) {
      throw coatpath_parse_exception("Can't open output file \"" + output + "\"", ERR_OUTPUTFILE);
    }

    cout << "Exporting toolpaths to " << output << "... " << flush;
    SegmentExporter exporter(toolpaths);
    exporter.add_header(PACKAGE_STRING);
    exporter.add_header("shapes: " + shape_file);
    if (vm["show-travel"].as<bool>()) {
      exporter.set_travel(&calculator.mask_index(), settings.mask_avoidance);
    }
    exporter.export_all(of, vm["format"].as<OutputFormat::OutputFormat>());
    cout << "DONE." << endl;
}

int main(int argc, const char* argv[]) {
  try {
    do_coatpath(argc, argv);
  } catch (const coatpath_parse_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  } catch (const shape_parse_exception& e) {
    cerr << endl << "Error in shape file: " << e.what() << endl;
    return ERR_SHAPEFILE;
  } catch (const unsupported_shape_kind& e) {
    cerr << endl << e.what() << endl;
    return ERR_UNSUPPORTEDSHAPE;
  } catch (const unsupported_pattern& e) {
    cerr << endl << e.what() << endl;
    return ERR_UNSUPPORTEDPATTERN;
  } catch (const computation_cancelled& e) {
    cerr << endl << e.what() << endl;
    return ERR_CANCELLED;
  }
  return 0;
}
