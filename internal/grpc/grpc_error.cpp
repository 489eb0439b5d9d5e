#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace tracelens::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace tracelens::util;

  if (dynamic_cast<const EmptyTrace*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InsufficientData*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const InvalidConfig*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace tracelens::grpc
