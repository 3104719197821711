// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <string>
#include <vector>

#include <stout/error.hpp>
#include <stout/strings.hpp>

#include <ocibridge/docker/spec.hpp>

using std::ostream;
using std::string;
using std::vector;

namespace ocibridge {
namespace docker {
namespace spec {

Try<ImageReference> parseImageReference(const string& _s)
{
  ImageReference reference;
  string s(_s);

  if (s.empty()) {
    return Error("Empty image reference");
  }

  // Extract the digest.
  if (strings::contains(s, "@")) {
    vector<string> split = strings::split(s, "@");
    if (split.size() != 2) {
      return Error("Multiple '@' symbols found");
    }

    if (split[1].empty()) {
      return Error("Empty digest");
    }

    s = split[0];
    reference.set_digest(split[1]);
  }

  // Remove the tag. We need to watch out for a
  // host:port registry, which also contains ':'.
  if (strings::contains(s, ":")) {
    vector<string> split = strings::split(s, ":");

    // The tag must be the last component. If a slash is
    // present there is a registry port and no tag.
    if (!strings::contains(split.back(), "/")) {
      if (split.back().empty()) {
        return Error("Empty tag");
      }

      reference.set_tag(split.back());
      split.pop_back();

      s = strings::join(":", split);
    }
  }

  // Extract the registry and repository. The first component can
  // either be the registry, or the first part of the repository!
  // We resolve this ambiguity using the same hacks used in the
  // docker code ('.', ':', 'localhost' indicate a registry).
  vector<string> split = strings::split(s, "/", 2);

  if (split.size() == 1) {
    reference.set_repository(s);
  } else if (strings::contains(split[0], ".") ||
             strings::contains(split[0], ":") ||
             split[0] == "localhost") {
    reference.set_registry(split[0]);
    reference.set_repository(split[1]);
  } else {
    reference.set_repository(s);
  }

  if (reference.repository().empty()) {
    return Error("Empty repository in '" + _s + "'");
  }

  return reference;
}


ostream& operator<<(ostream& stream, const ImageReference& reference)
{
  stream << getName(reference);

  if (reference.has_digest()) {
    stream << "@" << reference.digest();
  } else if (reference.has_tag()) {
    stream << ":" << reference.tag();
  }

  return stream;
}


string getName(const ImageReference& reference)
{
  if (reference.has_registry()) {
    return reference.registry() + "/" + reference.repository();
  }

  return reference.repository();
}

} // namespace spec {
} // namespace docker {
} // namespace ocibridge {
