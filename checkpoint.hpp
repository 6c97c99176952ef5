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


#ifndef CHECKPOINT_HPP
#define CHECKPOINT_HPP

#include <functional>

// Cooperative yield point for long scans.  Every interval iterations
// the callback is told how many iterations are done.  Returning false
// from the callback cancels the computation with computation_cancelled.
class Checkpoint {
 public:
  typedef std::function<bool(unsigned int)> callback_type;

  Checkpoint(callback_type callback = callback_type(), unsigned int interval = 50);

  // Count one iteration, maybe yielding to the callback.
  void tick();
  unsigned int iterations() const { return iterations_done; }

 private:
  callback_type callback;
  unsigned int interval;
  unsigned int iterations_done;
};

#endif // CHECKPOINT_HPP
