#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace mcache {

enum class StatusCode : uint8_t {
  // Not an error; returned on success.
  OK = 0,
  // Unknown error.
  UNKNOWN = 1,
  // The model path does not exist on storage.
  NOT_FOUND = 2,
  // The provider failed to materialize the model.
  LOAD_FAILED = 3,
  // Moving the model between storage and execution devices failed.
  TRANSFER_FAILED = 4,
};

class Status final {
 public:
  Status() = default;

  Status(StatusCode code) : code_(code) {}

  Status(StatusCode code, std::string msg)
      : code_(code), msg_(std::move(msg)) {}

  StatusCode code() const { return code_; }

  const std::string& message() const { return msg_; }

  bool ok() const { return code_ == StatusCode::OK; }

 private:
  StatusCode code_ = StatusCode::OK;
  std::string msg_;
};

inline const char* to_string(StatusCode code) {
  switch (code) {
    case StatusCode::OK:
      return "OK";
    case StatusCode::UNKNOWN:
      return "UNKNOWN";
    case StatusCode::NOT_FOUND:
      return "NOT_FOUND";
    case StatusCode::LOAD_FAILED:
      return "LOAD_FAILED";
    case StatusCode::TRANSFER_FAILED:
      return "TRANSFER_FAILED";
  }
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, const Status& status) {
  os << "Status, code: " << to_string(status.code())
     << ", message: " << status.message();
  return os;
}

}  // namespace mcache
