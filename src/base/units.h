/*
 * Nvidler
 * Copyright (c) The Nvidler Authors.
 * All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * THIS CODE IS PROVIDED ON AN *AS IS* BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT
 * LIMITATION ANY IMPLIED WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR
 * A PARTICULAR PURPOSE, MERCHANTABLITY OR NON-INFRINGEMENT.
 *
 * See the Apache Version 2.0 License for specific language governing
 * permissions and limitations under the License.
 */

// Common unit conversion constants.

#ifndef NVIDLER_BASE_UNITS_H
#define NVIDLER_BASE_UNITS_H

#include <stdint.h>

namespace nvidler {

// Capacity
const uint64_t MB_TO_BYTES = 1024 * 1024;

// Time
const uint64_t MILLISECONDS_TO_MICROSECONDS = 1000;
const uint64_t SECONDS_TO_MILLISECONDS = 1000;
const uint64_t SECONDS_TO_MICROSECONDS = 1000 * 1000;
const uint64_t SECONDS_IN_DAY = 24 * 3600;

}  // namespace nvidler

#endif  // NVIDLER_BASE_UNITS_H
