// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef COVERTOOLS_BASE_FILE_H_
#define COVERTOOLS_BASE_FILE_H_

#include <cstdio>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

// Whole-file helpers on top of stdio.
namespace file {

using Options = int;

inline Options Defaults() { return 0xBABA; }

// Returns NotFoundError if the file cannot be opened for reading.
absl::StatusOr<std::string> GetContents(absl::string_view path,
                                        Options options);

absl::Status GetContents(absl::string_view file_name, std::string* output,
                         Options options);

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents, Options options);

// Writes `contents` to the already open `stream` and flushes it. Returns
// InternalError if the stream reports a failure. `stream_name` only appears
// in the error message.
absl::Status WriteToStream(std::FILE* stream, absl::string_view contents,
                           absl::string_view stream_name);

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto,
                          Options options);

absl::Status SetBinaryProto(absl::string_view file_name,
                            const google::protobuf::Message& proto,
                            Options options);

}  // namespace file

#endif  // COVERTOOLS_BASE_FILE_H_
