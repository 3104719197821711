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

#include "tests/mock_docker.hpp"

using std::string;

namespace ocibridge {
namespace internal {
namespace tests {

MockDocker::MockDocker(const string& path, const string& socket)
  : Docker(path, socket)
{
  EXPECT_CALL(*this, create(_))
    .WillRepeatedly(Invoke(this, &MockDocker::_create));

  EXPECT_CALL(*this, start(_))
    .WillRepeatedly(Invoke(this, &MockDocker::_start));

  EXPECT_CALL(*this, wait(_))
    .WillRepeatedly(Invoke(this, &MockDocker::_wait));

  EXPECT_CALL(*this, rm(_, _))
    .WillRepeatedly(Invoke(this, &MockDocker::_rm));

  EXPECT_CALL(*this, inspectImage(_))
    .WillRepeatedly(Invoke(this, &MockDocker::_inspectImage));

  EXPECT_CALL(*this, pull(_, _, _))
    .WillRepeatedly(Invoke(this, &MockDocker::_pull));
}


MockDocker::~MockDocker() {}

} // namespace tests {
} // namespace internal {
} // namespace ocibridge {
