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

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/strings.hpp>

#include "docker/fetcher.hpp"

using process::Failure;
using process::Future;

using std::string;

namespace ocibridge {

Try<PullPolicy> parsePullPolicy(const string& s)
{
  const string policy = strings::lower(s);

  if (policy == "always") {
    return PullPolicy::ALWAYS;
  } else if (policy == "never") {
    return PullPolicy::NEVER;
  } else if (policy == "if-not-present") {
    return PullPolicy::IF_NOT_PRESENT;
  }

  return Error(
      "Unknown pull policy '" + s + "'; expecting one of 'always', "
      "'never' or 'if-not-present'");
}


namespace internal {

Future<ImageFetcher::Image> DockerImageFetcher::fetch(
    const string& image,
    const FetchOptions& options) const
{
  Option<string> platform;
  if (options.has_platform()) {
    platform = options.platform();
  }

  VLOG(1) << "Fetching image '" << image << "' with pull policy "
          << PullPolicy_Name(options.pull_policy());

  Future<Docker::Image> fetched;

  switch (options.pull_policy()) {
    case PullPolicy::ALWAYS:
      fetched = docker->pull(image, platform, true);
      break;
    case PullPolicy::IF_NOT_PRESENT:
      fetched = docker->pull(image, platform, false);
      break;
    case PullPolicy::NEVER:
      fetched = docker->inspectImage(image)
        .repair([image](const Future<Docker::Image>& future) {
          return Failure(
              "Image '" + image + "' is not in the local store and "
              "pulling is disabled: " + future.failure());
        });
      break;
    case PullPolicy::UNKNOWN_PULL_POLICY:
      return Failure("Unknown pull policy for image '" + image + "'");
  }

  return fetched
    .then([image](const Docker::Image& _image) -> Future<Image> {
      return Image(image, _image.id);
    });
}

} // namespace internal {
} // namespace ocibridge {
