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

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include <ocibridge/executor.hpp>
#include <ocibridge/fetcher.hpp>

#include "executor/flags.hpp"

using std::string;

namespace ocibridge {
namespace internal {

Flags::Flags()
{
  add(&Flags::docker,
      "docker",
      "The absolute path to the docker executable, or its name to be\n"
      "looked up in the PATH.",
      "docker");

  add(&Flags::docker_socket,
      "docker_socket",
      "The UNIX socket path the docker daemon listens on. It is bind\n"
      "mounted at '" + stringify(TOOL_DOCKER_SOCKET) + "' in the transfer\n"
      "tool container so that the tool copies from and to the same daemon.",
      DEFAULT_DOCKER_SOCKET,
      [](const string& value) -> Option<Error> {
        if (!path::is_absolute(value)) {
          return Error("Expected '--docker_socket' to be an absolute path");
        }
        return None();
      });

  add(&Flags::tool_image,
      "tool_image",
      "The skopeo image used to copy images. It is fetched as\n"
      "'--pull_policy' dictates and its entrypoint must be 'skopeo'.",
      DEFAULT_TOOL_IMAGE);

  add(&Flags::remove_timeout,
      "remove_timeout",
      "How long to wait for the transfer tool container to be removed\n"
      "once the copy is over. Removal is attempted even if the copy\n"
      "failed.",
      DEFAULT_REMOVE_TIMEOUT,
      [](const Duration& value) -> Option<Error> {
        if (value <= Duration::zero()) {
          return Error("Expected '--remove_timeout' to be positive");
        }
        return None();
      });

  add(&Flags::pull_policy,
      "pull_policy",
      "When to pull the transfer tool image from its registry; one of\n"
      "'always', 'never' or 'if-not-present'.",
      "if-not-present",
      [](const string& value) -> Option<Error> {
        Try<PullPolicy> policy = parsePullPolicy(value);
        if (policy.isError()) {
          return Error(policy.error());
        }
        return None();
      });

  add(&Flags::platform,
      "platform",
      "Platform of the transfer tool image to pull, in the form\n"
      "'os[/arch[/variant]]' (e.g., 'linux/amd64').");

  add(&Flags::direction,
      "direction",
      "Which way to copy: 'to_oci' copies '--image' from the docker\n"
      "daemon into an OCI layout below '--path', 'to_daemon' copies the\n"
      "OCI layout of '--image' below '--path' into the docker daemon.",
      [](const Option<string>& value) -> Option<Error> {
        if (value.isSome() &&
            value.get() != "to_oci" &&
            value.get() != "to_daemon") {
          return Error(
              "Expected '--direction' to be 'to_oci' or 'to_daemon'");
        }
        return None();
      });

  add(&Flags::image,
      "image",
      "The image reference to copy, e.g., 'busybox:1.36'.");

  add(&Flags::path,
      "path",
      "The host directory holding the OCI layouts. It is mounted at\n"
      "'" + stringify(OCI_MOUNT_POINT) + "' in the transfer tool container.",
      [](const Option<string>& value) -> Option<Error> {
        if (value.isSome() && !path::is_absolute(value.get())) {
          return Error("Expected '--path' to be an absolute path");
        }
        return None();
      });
}

} // namespace internal {
} // namespace ocibridge {
