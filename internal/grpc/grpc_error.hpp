#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace tracelens::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace tracelens::grpc
