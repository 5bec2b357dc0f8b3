#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace docstore::util {

/*
  Central error types.

  Store failures and upload failures wrap the exception that caused them;
  cause() returns it (may be null) and what() carries its message.
*/

class WrappedError : public std::runtime_error {
 public:
  WrappedError(const std::string& msg, std::exception_ptr cause) : std::runtime_error(Describe(msg, cause)), cause_(std::move(cause)) {
  }

  const std::exception_ptr& cause() const noexcept {
    return cause_;
  }

 private:
  static std::string Describe(const std::string& msg, const std::exception_ptr& cause);

  std::exception_ptr cause_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MetadataCorrupt : public std::runtime_error {
 public:
  explicit MetadataCorrupt(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport or backend fault inside the object store.
class StoreUnavailable : public WrappedError {
 public:
  explicit StoreUnavailable(const std::string& msg, std::exception_ptr cause = nullptr) : WrappedError(msg, std::move(cause)) {
  }
};

class StoreReadError : public StoreUnavailable {
 public:
  explicit StoreReadError(const std::string& msg, std::exception_ptr cause = nullptr) : StoreUnavailable(msg, std::move(cause)) {
  }
};

class StoreWriteError : public StoreUnavailable {
 public:
  explicit StoreWriteError(const std::string& msg, std::exception_ptr cause = nullptr) : StoreUnavailable(msg, std::move(cause)) {
  }
};

class UploadFailed : public WrappedError {
 public:
  UploadFailed(const std::string& msg, std::exception_ptr cause) : WrappedError(msg, std::move(cause)) {
  }
};

} // namespace docstore::util
