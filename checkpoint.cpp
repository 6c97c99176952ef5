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


#include "checkpoint.hpp"
#include "errors.hpp"

Checkpoint::Checkpoint(callback_type callback, unsigned int interval)
    : callback(callback), interval(interval), iterations_done(0) {}

void Checkpoint::tick() {
  iterations_done++;
  if (!callback || interval == 0 || iterations_done % interval != 0) {
    return;
  }
  if (!callback(iterations_done)) {
    throw computation_cancelled(iterations_done);
  }
}
