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

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <exception>
#include <string>

// A shape kind that none of the planners know about.
class unsupported_shape_kind : public std::exception {
 public:
  unsupported_shape_kind(const std::string& kind) {
    what_string = "Unsupported shape kind: " + kind;
  }
  virtual const char* what() const throw() {
    return what_string.c_str();
  }

 private:
  std::string what_string;
};

// A fill pattern outside of horizontal, vertical, auto and concentric.
class unsupported_pattern : public std::exception {
 public:
  unsupported_pattern(const std::string& pattern) {
    what_string = "Unsupported fill pattern: " + pattern;
  }
  virtual const char* what() const throw() {
    return what_string.c_str();
  }

 private:
  std::string what_string;
};

// Thrown out of a checkpoint when the caller asked to stop.
class computation_cancelled : public std::exception {
 public:
  computation_cancelled(unsigned int iterations) : iterations(iterations) {
    what_string = "Computation cancelled after " + std::to_string(iterations) + " iterations";
  }
  virtual const char* what() const throw() {
    return what_string.c_str();
  }
  unsigned int iterations_done() const {
    return iterations;
  }

 private:
  std::string what_string;
  unsigned int iterations;
};

#endif // ERRORS_HPP
