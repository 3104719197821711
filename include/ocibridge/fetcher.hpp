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

#ifndef __OCIBRIDGE_FETCHER_HPP__
#define __OCIBRIDGE_FETCHER_HPP__

#include <string>

#include <process/future.hpp>

#include <stout/try.hpp>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ocibridge/ocibridge.pb.h>

namespace ocibridge {

/**
 * Provides an abstraction for making an image available in the local
 * store of a container engine, pulling it from its registry if needed.
 */
class ImageFetcher
{
public:
  /**
   * A handle to an image in the local store.
   */
  class Image
  {
  public:
    Image(const std::string& _name, const std::string& _id)
      : name(_name), id(_id) {}

    // The name the image was fetched by.
    const std::string name;

    // The ID the engine assigned to the image.
    const std::string id;
  };

  virtual ~ImageFetcher() {}

  /**
   * Fetches the image into the local store.
   *
   * @param image the reference of the image to fetch.
   * @param options controls when the image is pulled and for
   *     which platform.
   * @return the fetched image on success, a failure otherwise.
   */
  virtual process::Future<Image> fetch(
      const std::string& image,
      const FetchOptions& options) const = 0;
};


// Parses a pull policy: one of 'always', 'never' or 'if-not-present'.
Try<PullPolicy> parsePullPolicy(const std::string& s);

} // namespace ocibridge {

#endif // __OCIBRIDGE_FETCHER_HPP__
