#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace analysis::grpc {

/*
  Producer-facing status for a failed broker call:

    util::InvalidPayload, InsufficientData        INVALID_ARGUMENT
    util::NotFound                                NOT_FOUND
    util::AlreadyExists                           ALREADY_EXISTS
    util::InvalidState                            FAILED_PRECONDITION
    util::BrokerUnavailable, TransientInfraError,
          DataUnavailable                         UNAVAILABLE
    anything else                                 INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace analysis::grpc
