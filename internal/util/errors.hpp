#pragma once

#include <stdexcept>
#include <string>

#include "plancast/v1/types.pb.h"

namespace plancast::util {

/*
  Central error types.

  Stage errors (GeometryExtractionError, ScalingError, ModelBuildError) are
  caught by the state machine and recorded on the project. Everything else
  reaches the caller and is translated to a gRPC status.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QuotaExceeded : public std::runtime_error {
 public:
  QuotaExceeded(plancast::v1::DenyReason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  plancast::v1::DenyReason reason() const {
    return reason_;
  }

 private:
  plancast::v1::DenyReason reason_;
};

class AlreadyRunning : public std::runtime_error {
 public:
  explicit AlreadyRunning(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IllegalTransition : public std::runtime_error {
 public:
  explicit IllegalTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class GeometryExtractionError : public std::runtime_error {
 public:
  explicit GeometryExtractionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ScalingError : public std::runtime_error {
 public:
  explicit ScalingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ModelBuildError : public std::runtime_error {
 public:
  explicit ModelBuildError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Per-format; collected by ModelBuilder::Export, never thrown past it.
class ExportError : public std::runtime_error {
 public:
  ExportError(const std::string& format, const std::string& msg) : std::runtime_error(format + ": " + msg), format_(format) {
  }

  const std::string& format() const {
    return format_;
  }

 private:
  std::string format_;
};

// Work could not be accepted (e.g. the run queue is shut down).
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace plancast::util
