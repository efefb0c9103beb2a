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

// String tools.

#ifndef NVIDLER_MISC_STRING_UTILS_H
#define NVIDLER_MISC_STRING_UTILS_H

#include <string>
#include <vector>

using std::string;
using std::vector;

namespace nvidler {

// Splits a comma-separated flag value into its trimmed, non-empty entries.
vector<string> SplitCommaSeparatedList(const string& list);

// Returns true if any entry of needles occurs as a substring of haystack.
bool ContainsAnySubstring(const string& haystack,
                          const vector<string>& needles);

// Returns true if value is equal to one of the entries.
bool MatchesAnyExactly(const string& value, const vector<string>& entries);

// Removes a single leading '/' as used by Docker in container names.
string StripLeadingSlash(const string& name);

}  // namespace nvidler

#endif  // NVIDLER_MISC_STRING_UTILS_H
