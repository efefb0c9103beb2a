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

#include "misc/string_utils.h"

#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

namespace nvidler {

vector<string> SplitCommaSeparatedList(const string& list) {
  vector<string> pieces;
  vector<string> result;
  boost::split(pieces, list, boost::is_any_of(","));
  for (vector<string>::iterator it = pieces.begin();
       it != pieces.end();
       ++it) {
    boost::trim(*it);
    if (!it->empty())
      result.push_back(*it);
  }
  return result;
}

bool ContainsAnySubstring(const string& haystack,
                          const vector<string>& needles) {
  for (vector<string>::const_iterator it = needles.begin();
       it != needles.end();
       ++it) {
    if (!it->empty() && haystack.find(*it) != string::npos)
      return true;
  }
  return false;
}

bool MatchesAnyExactly(const string& value, const vector<string>& entries) {
  for (vector<string>::const_iterator it = entries.begin();
       it != entries.end();
       ++it) {
    if (*it == value)
      return true;
  }
  return false;
}

string StripLeadingSlash(const string& name) {
  if (!name.empty() && name[0] == '/')
    return name.substr(1);
  return name;
}

}  // namespace nvidler
