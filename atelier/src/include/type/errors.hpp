//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace atelier {
/**
 * @brief Base of every error that crosses a component boundary.
 */
class StudioError : public std::runtime_error {
 public:
  explicit StudioError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Every strategy of a fallback chain failed. Carries the attempted strategy names
 *        and the message of the last underlying error.
 */
class AllAdaptersFailed : public StudioError {
 private:
  std::vector<std::string> attempted_;
  std::string              last_error_;

 public:
  AllAdaptersFailed(std::vector<std::string> attempted, std::string last_error);

  auto Attempted() const -> const std::vector<std::string>& { return attempted_; }
  auto LastError() const -> const std::string& { return last_error_; }
};

class ValidationError : public StudioError {
 public:
  explicit ValidationError(const std::string& msg) : StudioError("Validation failed: " + msg) {}
};

class AssetNotFound : public StudioError {
 public:
  explicit AssetNotFound(const std::string& id) : StudioError("Asset not found: " + id) {}
};

class SourceFileMissing : public StudioError {
 public:
  explicit SourceFileMissing(const std::string& path)
      : StudioError("Source raster missing: " + path) {}
};

class NothingToUndo : public StudioError {
 public:
  explicit NothingToUndo(const std::string& id)
      : StudioError("Nothing to undo: " + id + " is an original") {}
};

class NothingToRedo : public StudioError {
 public:
  explicit NothingToRedo(const std::string& id)
      : StudioError("Nothing to redo: " + id + " has no derived assets") {}
};

/**
 * @brief Raised by a synchronous batch when not a single unit succeeded.
 */
class BatchFailed : public StudioError {
 private:
  std::vector<std::string> errors_;

 public:
  explicit BatchFailed(std::vector<std::string> errors);

  auto Errors() const -> const std::vector<std::string>& { return errors_; }
};
};  // namespace atelier
