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

#ifndef __OCIBRIDGE_DOCKER_SPEC_HPP__
#define __OCIBRIDGE_DOCKER_SPEC_HPP__

#include <iostream>
#include <string>

#include <stout/try.hpp>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ocibridge/docker/spec.pb.h>

namespace ocibridge {
namespace docker {
namespace spec {

// Parse the docker image reference. Docker expects the image
// reference to be in the following format:
//   [REGISTRY_HOST[:REGISTRY_PORT]/]REPOSITORY[:TAG|@TYPE:DIGEST]
//
// This format is inherently ambiguous when dealing with repository
// names that include forward slashes. To disambiguate, the docker
// code looks for '.', or ':', or 'localhost' to decide if the first
// component is a registry or a repository name.
Try<ImageReference> parseImageReference(const std::string& s);


// Writes the full form of the reference, including the tag or the
// digest when present.
std::ostream& operator<<(std::ostream& stream, const ImageReference& reference);


// Returns the name of the referenced repository, i.e., the reference
// without its tag or digest: '[REGISTRY_HOST[:REGISTRY_PORT]/]REPOSITORY'.
std::string getName(const ImageReference& reference);

} // namespace spec {
} // namespace docker {
} // namespace ocibridge {

#endif // __OCIBRIDGE_DOCKER_SPEC_HPP__
