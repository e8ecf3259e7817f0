#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace analysis::grpc {

namespace {

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace analysis::util;

  if (dynamic_cast<const InvalidPayload*>(&e) || dynamic_cast<const InsufficientData*>(&e)) {
    return ::grpc::StatusCode::INVALID_ARGUMENT;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return ::grpc::StatusCode::NOT_FOUND;
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return ::grpc::StatusCode::ALREADY_EXISTS;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return ::grpc::StatusCode::FAILED_PRECONDITION;
  }
  // retryable from the producer's side
  if (dynamic_cast<const BrokerUnavailable*>(&e) || dynamic_cast<const TransientInfraError*>(&e) ||
      dynamic_cast<const DataUnavailable*>(&e)) {
    return ::grpc::StatusCode::UNAVAILABLE;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  return {CodeFor(e), std::string(e.what())};
}

} // namespace analysis::grpc
