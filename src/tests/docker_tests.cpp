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

#include <sys/stat.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <process/future.hpp>
#include <process/gtest.hpp>
#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/check.hpp>
#include <stout/duration.hpp>
#include <stout/gtest.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>
#include <stout/version.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/read.hpp>
#include <stout/os/write.hpp>

#include <stout/tests/utils.hpp>

#include <ocibridge/executor.hpp>

#include <ocibridge/docker/spec.hpp>

#include "docker/docker.hpp"
#include "docker/engine.hpp"
#include "docker/fetcher.hpp"

#include "tests/flags.hpp"

using process::Future;
using process::Owned;
using process::Shared;

using std::string;
using std::vector;

namespace ocibridge {
namespace internal {
namespace tests {

class DockerTest : public TemporaryDirectoryTest
{
protected:
  // Writes a shell script that stands in for the docker CLI. It
  // records its arguments, one invocation per line, and answers the
  // commands the `Docker` abstraction runs. 'start missing' fails
  // like docker does for an unknown container, 'wait silent' prints
  // no exit code and images are only known after they were pulled
  // unless their name starts with 'local'.
  string writeFakeDocker(const string& version = "20.10.7")
  {
    const string script = path::join(sandbox.get(), "docker");
    const string invocations = path::join(sandbox.get(), "invocations");
    const string pulled = path::join(sandbox.get(), "pulled");

    const vector<string> lines = {
      "#!/bin/sh",
      "echo \"$*\" >> " + invocations,
      "shift 2",
      "case \"$1\" in",
      "  --version)",
      "    echo \"Docker version " + version + ", build f0df350\" ;;",
      "  create)",
      "    echo \"0123456789ab\" ;;",
      "  start)",
      "    if [ \"$2\" = missing ]; then",
      "      echo \"Error: No such container: missing\" >&2",
      "      exit 1",
      "    fi ;;",
      "  wait)",
      "    if [ \"$2\" != silent ]; then echo 3; fi ;;",
      "  rm)",
      "    ;;",
      "  image)",
      "    case \"$3\" in",
      "      local*) ;;",
      "      *) if [ ! -f " + pulled + " ]; then",
      "           echo \"Error: No such image: $3\" >&2",
      "           exit 1",
      "         fi ;;",
      "    esac",
      "    echo '[{\"Id\":\"sha256:1234\",\"RepoTags\":[\"'$3'\"]}]' ;;",
      "  pull)",
      "    touch " + pulled + " ;;",
      "  *)",
      "    echo \"unknown command $1\" >&2",
      "    exit 1 ;;",
      "esac",
      ""
    };

    CHECK_SOME(os::write(script, strings::join("\n", lines)));
    CHECK_SOME(os::chmod(script, S_IRWXU));

    return script;
  }

  // Returns the arguments of every docker invocation so far.
  vector<string> invocations()
  {
    Try<string> read = os::read(path::join(sandbox.get(), "invocations"));
    if (read.isError()) {
      return vector<string>();
    }

    return strings::tokenize(read.get(), "\n");
  }

  Owned<Docker> createDocker()
  {
    Try<Owned<Docker>> docker =
      Docker::create(writeFakeDocker(), DEFAULT_DOCKER_SOCKET);

    CHECK_SOME(docker);

    return docker.get();
  }
};


TEST_F(DockerTest, ValidateVersion)
{
  Try<Owned<Docker>> docker =
    Docker::create(writeFakeDocker(), DEFAULT_DOCKER_SOCKET);

  ASSERT_SOME(docker);

  EXPECT_EQ(
      vector<string>({"-H unix:///var/run/docker.sock --version"}),
      invocations());

  AWAIT_EXPECT_EQ(Version(20, 10, 7), docker.get()->version());
}


TEST_F(DockerTest, InsufficientVersion)
{
  EXPECT_ERROR(Docker::create(writeFakeDocker("1.12.6"), "/run/docker.sock"));

  // Distribution suffixes beyond the patch version are ignored.
  EXPECT_SOME(
      Docker::create(writeFakeDocker("1.13.1.fc25"), "/run/docker.sock"));
}


TEST_F(DockerTest, RelativeSocket)
{
  EXPECT_ERROR(Docker::create(writeFakeDocker(), "docker.sock", false));
}


TEST_F(DockerTest, Create)
{
  Owned<Docker> docker = createDocker();

  Docker::CreateOptions options;
  options.volumes = {
    "/tmp/layouts:/oci",
    "/var/run/docker.sock:/var/run/docker.sock"
  };
  options.image = DEFAULT_TOOL_IMAGE;
  options.arguments = {
    "copy",
    "docker-daemon:busybox:latest",
    "oci:/oci/busybox:latest"
  };

  // The ID is taken from stdout without surrounding whitespace.
  AWAIT_EXPECT_EQ(string("0123456789ab"), docker->create(options));

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock create"
      " -v /tmp/layouts:/oci"
      " -v /var/run/docker.sock:/var/run/docker.sock"
      " quay.io/skopeo/stable:latest"
      " copy docker-daemon:busybox:latest oci:/oci/busybox:latest",
      invocations().back());

  options.tty = true;
  options.volumes.clear();
  options.arguments.clear();

  AWAIT_READY(docker->create(options));

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock create --tty"
      " quay.io/skopeo/stable:latest",
      invocations().back());
}


TEST_F(DockerTest, StartFailure)
{
  Owned<Docker> docker = createDocker();

  AWAIT_READY(docker->start("0123456789ab"));

  Future<Nothing> start = docker->start("missing");

  AWAIT_FAILED(start);
  EXPECT_TRUE(strings::contains(start.failure(), "exited with status 1"));
  EXPECT_TRUE(strings::contains(start.failure(), "No such container"));
}


TEST_F(DockerTest, Wait)
{
  Owned<Docker> docker = createDocker();

  Future<Option<int>> wait = docker->wait("0123456789ab");

  AWAIT_READY(wait);
  EXPECT_SOME_EQ(3, wait.get());

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock wait 0123456789ab",
      invocations().back());

  // No exit code is reported when docker prints none.
  wait = docker->wait("silent");

  AWAIT_READY(wait);
  EXPECT_NONE(wait.get());
}


TEST_F(DockerTest, Remove)
{
  Owned<Docker> docker = createDocker();

  AWAIT_READY(docker->rm("0123456789ab", true));

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock rm -f -v 0123456789ab",
      invocations().back());

  AWAIT_READY(docker->rm("0123456789ab"));

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock rm -v 0123456789ab",
      invocations().back());
}


TEST_F(DockerTest, InspectImage)
{
  Owned<Docker> docker = createDocker();

  Future<Docker::Image> image = docker->inspectImage("local/busybox:1.36");

  AWAIT_READY(image);
  EXPECT_EQ("sha256:1234", image->id);
  EXPECT_EQ(vector<string>({"local/busybox:1.36"}), image->repoTags);

  AWAIT_FAILED(docker->inspectImage("busybox:1.36"));
}


TEST_F(DockerTest, Pull)
{
  Owned<Docker> docker = createDocker();

  // An image in the local store is not pulled again.
  AWAIT_READY(docker->pull("local/busybox:1.36"));

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock image inspect local/busybox:1.36",
      invocations().back());

  // The 'latest' tag is assumed when none is given.
  Future<Docker::Image> image = docker->pull("busybox", string("linux/amd64"));

  AWAIT_READY(image);
  EXPECT_EQ(vector<string>({"busybox:latest"}), image->repoTags);

  vector<string> commands = invocations();
  ASSERT_LE(3u, commands.size());
  EXPECT_EQ(
      "-H unix:///var/run/docker.sock pull --platform linux/amd64"
      " busybox:latest",
      commands[commands.size() - 2]);

  // Forced pulls skip the local store.
  AWAIT_READY(docker->pull("local/busybox:1.36", None(), true));

  commands = invocations();
  EXPECT_EQ(
      "-H unix:///var/run/docker.sock pull local/busybox:1.36",
      commands[commands.size() - 2]);
}


TEST_F(DockerTest, ContainerEngine)
{
  Shared<Docker> docker = createDocker().share();

  DockerContainerEngine engine(docker);

  ContainerEngine::Config config;
  config.image = DEFAULT_TOOL_IMAGE;
  config.command = {"--version"};
  config.binds = {"/tmp/layouts:/oci"};

  Future<string> containerId = engine.create(config);

  AWAIT_EXPECT_EQ(string("0123456789ab"), containerId);

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock create -v /tmp/layouts:/oci"
      " quay.io/skopeo/stable:latest --version",
      invocations().back());

  AWAIT_READY(engine.start(containerId.get()));

  Future<Option<int>> wait = engine.wait(containerId.get());

  AWAIT_READY(wait);
  EXPECT_SOME_EQ(3, wait.get());

  AWAIT_READY(engine.remove(containerId.get(), true));

  EXPECT_EQ(
      "-H unix:///var/run/docker.sock rm -f -v 0123456789ab",
      invocations().back());
}


// Copies an image out of the docker daemon into an OCI layout and
// loads it back, using the real transfer tool.
TEST_F(DockerTest, ROOT_DOCKER_INTERNET_CopyToOCIAndBack)
{
  Try<Owned<Docker>> create =
    Docker::create(tests::flags.docker, tests::flags.docker_socket);

  ASSERT_SOME(create);

  Shared<Docker> docker = create->share();

  ToolExecutor::Config config;
  config.image = tests::flags.tool_image;
  config.socket = tests::flags.docker_socket;

  ToolExecutor executor(
      Shared<ImageFetcher>(new DockerImageFetcher(docker)),
      Shared<ContainerEngine>(new DockerContainerEngine(docker)),
      config);

  Future<Try<Nothing, TransferError>> init = executor.init(FetchOptions());

  AWAIT_READY_FOR(init, Minutes(5));
  ASSERT_FALSE(init->isError()) << init->error().message;

  AWAIT_READY_FOR(docker->pull("busybox:latest"), Minutes(5));

  Future<Try<TransferInfo, TransferError>> copy =
    executor.copyToOCI("busybox:latest", sandbox.get());

  AWAIT_READY_FOR(copy, Minutes(5));
  ASSERT_FALSE(copy->isError()) << copy->error().message;
  EXPECT_FALSE(copy->get().has_cleanup_error());

  EXPECT_TRUE(os::exists(path::join(sandbox.get(), "busybox", "index.json")));

  Try<docker::spec::ImageReference> reference =
    docker::spec::parseImageReference("busybox:latest");

  ASSERT_SOME(reference);

  copy = executor.copyToDaemon(sandbox.get(), reference.get());

  AWAIT_READY_FOR(copy, Minutes(5));
  ASSERT_FALSE(copy->isError()) << copy->error().message;
  EXPECT_EQ(0, copy->get().exit_status());
}

} // namespace tests {
} // namespace internal {
} // namespace ocibridge {
