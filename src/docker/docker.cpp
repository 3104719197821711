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

#include <signal.h>
#include <string.h> // For strsignal().

#include <sys/wait.h>

#include <string>
#include <tuple>
#include <vector>

#include <glog/logging.h>

#include <process/collect.hpp>
#include <process/io.hpp>

#include <stout/duration.hpp>
#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/lambda.hpp>
#include <stout/numify.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/strings.hpp>
#include <stout/stringify.hpp>

#include <stout/os/constants.hpp>
#include <stout/os/kill.hpp>

#include "docker/docker.hpp"

using process::Failure;
using process::Future;
using process::Owned;
using process::Subprocess;
using process::subprocess;

using std::string;
using std::tuple;
using std::vector;

namespace ocibridge {
namespace internal {

// Docker 1.13 introduced 'docker image inspect'.
static const Version MINIMUM_DOCKER_VERSION(1, 13, 0);

constexpr Duration DOCKER_VERSION_WAIT_TIMEOUT = Seconds(5);


// Describes a wait(2) status of the docker CLI.
static string describe(int status)
{
  if (WIFEXITED(status)) {
    return "exited with status " + stringify(WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    return "terminated with signal " + string(strsignal(WTERMSIG(status)));
  }

  return "wait status " + stringify(status);
}


static void commandDiscarded(const Subprocess& s, const string& cmd)
{
  if (s.status().isPending()) {
    VLOG(1) << "'" << cmd << "' is being discarded";
    os::kill(s.pid(), SIGKILL);
  }
}


Try<Owned<Docker>> Docker::create(
    const string& path,
    const string& socket,
    bool validate)
{
  if (!path::is_absolute(socket)) {
    return Error("Invalid Docker socket path: " + socket);
  }

  Owned<Docker> docker(new Docker(path, socket));
  if (!validate) {
    return docker;
  }

  Try<Nothing> validateVersion =
    docker->validateVersion(MINIMUM_DOCKER_VERSION);

  if (validateVersion.isError()) {
    return Error(validateVersion.error());
  }

  return docker;
}


Future<string> Docker::execute(const vector<string>& arguments) const
{
  vector<string> argv;
  argv.push_back(path);
  argv.push_back("-H");
  argv.push_back(socket);
  argv.insert(argv.end(), arguments.begin(), arguments.end());

  const string cmd = strings::join(" ", argv);

  VLOG(1) << "Running " << cmd;

  Try<Subprocess> s = subprocess(
      path,
      argv,
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PIPE(),
      Subprocess::PIPE());

  if (s.isError()) {
    return Failure("Failed to create subprocess '" + cmd + "': " + s.error());
  }

  // Start reading from stdout and stderr so writing to the pipes
  // won't block when the output is larger than the pipe capacity.
  const Future<string> output = process::io::read(s->out().get());
  const Future<string> error = process::io::read(s->err().get());

  return await(s->status(), output, error)
    .then([cmd](const tuple<
        Future<Option<int>>,
        Future<string>,
        Future<string>>& t) -> Future<string> {
      const Future<Option<int>>& status = std::get<0>(t);
      if (!status.isReady()) {
        return Failure(
            "Failed to get the exit status of '" + cmd + "': " +
            (status.isFailed() ? status.failure() : "discarded"));
      }

      if (status->isNone()) {
        return Failure("No status found for '" + cmd + "'");
      }

      if (status->get() != 0) {
        const Future<string>& error = std::get<2>(t);
        return Failure(
            "Failed to run '" + cmd + "': " + describe(status->get()) +
            "; stderr='" +
            (error.isReady() ? strings::trim(error.get()) : "") + "'");
      }

      const Future<string>& output = std::get<1>(t);
      if (!output.isReady()) {
        return Failure(
            "Failed to read stdout from '" + cmd + "': " +
            (output.isFailed() ? output.failure() : "discarded"));
      }

      return output.get();
    })
    .onDiscard(lambda::bind(&commandDiscarded, s.get(), cmd));
}


Future<Version> Docker::version() const
{
  return execute({"--version"})
    .then(lambda::bind(&Docker::_version, lambda::_1));
}


Future<Version> Docker::_version(const string& output)
{
  vector<string> parts = strings::split(output, ",");

  if (!parts.empty()) {
    vector<string> subParts = strings::split(parts.front(), " ");

    if (!subParts.empty()) {
      // Some distributions append their own components to the
      // version (e.g., "x.x.x.fc22") which does not match the
      // Semantic Versioning specification. We remove the overflow
      // components here before parsing the version.
      string versionString = subParts.back();
      vector<string> components = strings::split(versionString, ".");
      if (components.size() > 3) {
        components.erase(components.begin() + 3, components.end());
      }
      versionString = strings::join(".", components);

      Try<Version> version = Version::parse(versionString);

      if (version.isError()) {
        return Failure("Failed to parse docker version: " + version.error());
      }

      return version.get();
    }
  }

  return Failure("Unable to find docker version in output");
}


Try<Nothing> Docker::validateVersion(const Version& minVersion) const
{
  // Validate the version (and that we can use Docker at all).
  Future<Version> version = this->version();

  if (!version.await(DOCKER_VERSION_WAIT_TIMEOUT)) {
    version.discard();
    return Error("Timed out getting docker version");
  }

  if (version.isFailed()) {
    return Error("Failed to get docker version: " + version.failure());
  }

  if (version.get() < minVersion) {
    return Error(
        "Insufficient version '" + stringify(version.get()) +
        "' of Docker. Please upgrade to >= '" + stringify(minVersion) + "'");
  }

  return Nothing();
}


Try<Docker::Image> Docker::Image::create(const JSON::Object& json)
{
  Result<JSON::String> id = json.find<JSON::String>("Id");
  if (id.isError()) {
    return Error("Failed to parse 'Id': " + id.error());
  } else if (id.isNone()) {
    return Error("Unable to find 'Id' in the image JSON");
  }

  vector<string> repoTags;

  // 'RepoTags' is null for images that are only known by ID.
  Result<JSON::Array> tags = json.find<JSON::Array>("RepoTags");
  if (tags.isError()) {
    return Error("Failed to parse 'RepoTags': " + tags.error());
  }

  if (tags.isSome()) {
    foreach (const JSON::Value& value, tags->values) {
      if (!value.is<JSON::String>()) {
        return Error("Expecting 'RepoTags' to be an array of strings");
      }

      repoTags.push_back(value.as<JSON::String>().value);
    }
  }

  return Docker::Image(id->value, repoTags);
}


Future<string> Docker::create(const CreateOptions& options) const
{
  vector<string> argv;
  argv.push_back("create");

  if (options.tty) {
    argv.push_back("--tty");
  }

  foreach (const string& volume, options.volumes) {
    argv.push_back("-v");
    argv.push_back(volume);
  }

  argv.push_back(options.image);

  foreach (const string& argument, options.arguments) {
    argv.push_back(argument);
  }

  return execute(argv)
    .then([](const string& output) -> Future<string> {
      // 'docker create' prints the ID of the container on stdout,
      // anything else (e.g., the pull progress) goes to stderr.
      const string id = strings::trim(output);
      if (id.empty()) {
        return Failure("Unable to find the ID of the created container");
      }

      return id;
    });
}


Future<Nothing> Docker::start(const string& containerName) const
{
  return execute({"start", containerName})
    .then([]() { return Nothing(); });
}


Future<Option<int>> Docker::wait(const string& containerName) const
{
  return execute({"wait", containerName})
    .then(lambda::bind(&Docker::_wait, containerName, lambda::_1));
}


Future<Option<int>> Docker::_wait(
    const string& containerName,
    const string& output)
{
  const string code = strings::trim(output);
  if (code.empty()) {
    return None();
  }

  Try<int> status = numify<int>(code);
  if (status.isError()) {
    return Failure(
        "Failed to parse the exit code of container '" + containerName +
        "': " + status.error());
  }

  return status.get();
}


Future<Nothing> Docker::rm(const string& containerName, bool force) const
{
  // The `-v` flag removes Docker volumes that may be present.
  vector<string> argv;
  argv.push_back("rm");

  if (force) {
    argv.push_back("-f");
  }

  argv.push_back("-v");
  argv.push_back(containerName);

  return execute(argv)
    .then([]() { return Nothing(); });
}


Future<Docker::Image> Docker::inspectImage(const string& image) const
{
  return execute({"image", "inspect", image})
    .then(lambda::bind(&Docker::_inspectImage, lambda::_1));
}


Future<Docker::Image> Docker::_inspectImage(const string& output)
{
  Try<JSON::Array> parse = JSON::parse<JSON::Array>(output);

  if (parse.isError()) {
    return Failure("Failed to parse JSON: " + parse.error());
  }

  const JSON::Array& array = parse.get();

  // Only return if only one image identified with name.
  if (array.values.size() == 1) {
    if (!array.values.front().is<JSON::Object>()) {
      return Failure("Expecting the image JSON to be an object");
    }

    Try<Docker::Image> image =
      Docker::Image::create(array.values.front().as<JSON::Object>());

    if (image.isError()) {
      return Failure("Unable to create image: " + image.error());
    }

    return image.get();
  }

  return Failure("Failed to find image");
}


Future<Docker::Image> Docker::pull(
    const string& image,
    const Option<string>& platform,
    bool force) const
{
  string dockerImage = image;

  // Check if the specified image has a tag. Also split on "/" in case
  // the user specified a registry server (ie: localhost:5000/image)
  // to get the actual image name. If no tag or digest was given we
  // add a 'latest' tag to avoid pulling down the repository.
  vector<string> parts = strings::split(image, "/");

  if (!strings::contains(parts.back(), ":") &&
      !strings::contains(parts.back(), "@")) {
    dockerImage += ":latest";
  }

  if (force) {
    // Skip inspect and docker pull the image.
    return Docker::_pull(*this, dockerImage, platform);
  }

  const Docker docker = *this;

  return inspectImage(dockerImage)
    .repair([=](const Future<Image>& future) {
      VLOG(1) << "Pulling image '" << dockerImage << "' which is not in the"
              << " local store: " << future.failure();

      return Docker::_pull(docker, dockerImage, platform);
    });
}


Future<Docker::Image> Docker::_pull(
    const Docker& docker,
    const string& image,
    const Option<string>& platform)
{
  vector<string> argv;
  argv.push_back("pull");

  if (platform.isSome()) {
    argv.push_back("--platform");
    argv.push_back(platform.get());
  }

  argv.push_back(image);

  // Docker pull can run for a long time due to large images, so
  // the future can be discarded and that kills the pull process.
  return docker.execute(argv)
    .then([docker, image]() {
      return docker.inspectImage(image);
    });
}

} // namespace internal {
} // namespace ocibridge {
