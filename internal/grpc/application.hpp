#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/factory.hpp"

namespace tracelens::grpc {

/*
  Application

  Service adapters ready to register on the runtime server, plus the
  analysis services they forward to.
*/
struct Application {
  factory::Services                             services;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application BuildApplication(const tracelens::runtime::config::RuntimeConfig& config);

} // namespace tracelens::grpc
