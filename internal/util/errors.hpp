#pragma once

#include <stdexcept>
#include <string>

namespace analysis::util {

/*
  Central error types.

  Stages translate these into TaskError kinds (see ClassifyException),
  gRPC adapters into status codes.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Payload failed schema validation for its task name. Never retried.
class InvalidPayload : public std::runtime_error {
 public:
  explicit InvalidPayload(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Broker/backend channel cannot accept reads or writes right now.
class BrokerUnavailable : public std::runtime_error {
 public:
  explicit BrokerUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransientInfraError : public std::runtime_error {
 public:
  explicit TransientInfraError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  An upstream dataset has not been produced yet.

  soft == true lets the worker requeue the envelope once after a delay
  before reporting a permanent failure.
*/
class DataUnavailable : public std::runtime_error {
 public:
  explicit DataUnavailable(const std::string& msg, bool soft = false) : std::runtime_error(msg), soft_(soft) {
  }

  bool Soft() const {
    return soft_;
  }

 private:
  bool soft_;
};

class DatasetNotReady : public DataUnavailable {
 public:
  explicit DatasetNotReady(const std::string& msg) : DataUnavailable(msg, true) {
  }
};

class InsufficientData : public std::runtime_error {
 public:
  explicit InsufficientData(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlgorithmError : public std::runtime_error {
 public:
  explicit AlgorithmError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace analysis::util
