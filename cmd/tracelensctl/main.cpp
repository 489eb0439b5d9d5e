#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "tracelens/v1.hpp"

using namespace tracelens::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tracelensctl compare <request.json> [--config <config.yaml>]\n"
            << "  tracelensctl analyze <request.json> [--config <config.yaml>]\n"
            << "  tracelensctl validate <request.json> [--config <config.yaml>]\n"
            << "  tracelensctl span-patterns <request.json> [--config <config.yaml>]\n"
            << "  tracelensctl stats <request.json> [--config <config.yaml>]\n"
            << "  tracelensctl log-patterns <request.json> [--config <config.yaml>]\n"
            << "  tracelensctl log-compare <request.json> [--config <config.yaml>]\n"
            << "\n"
            << "<request.json> is the JSON form of the matching request message; '-' reads stdin.\n";
}

static std::string ReadInput(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  std::ifstream in(path);
  if (!in) {
    throw tracelens::util::InvalidArgument("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

template <typename Request>
static Request ParseRequest(const std::string& json) {
  Request                                  req;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &req, options);
  if (!status.ok()) {
    throw tracelens::util::InvalidArgument("invalid " + req.GetDescriptor()->name() + ": " + std::string(status.message()));
  }
  return req;
}

static void PrintResponse(const google::protobuf::Message& resp) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot render response: " + std::string(status.message()));
  }
  std::cout << json;
}

int main(int argc, char** argv) {
  if (argc != 3 && !(argc == 5 && std::string(argv[3]) == "--config")) {
    Usage();
    return 1;
  }

  const std::string cmd   = argv[1];
  const std::string input = argv[2];

  try {
    tracelens::runtime::config::RuntimeConfig config;
    if (argc == 5) {
      config = tracelens::config::ConfigLoader::LoadFromYaml(argv[4]);
    }
    // stdout carries the response
    config.mutable_logging()->set_use_stderr(true);
    if (config.logging().level().empty()) {
      config.mutable_logging()->set_level("warn");
    }
    tracelens::observability::InitializeLogging(config);

    auto       services = tracelens::factory::BuildServices(config);
    const auto json     = ReadInput(input);

    if (cmd == "compare") {
      PrintResponse(services.traces->CompareTraces(ParseRequest<CompareTracesRequest>(json)));
    } else if (cmd == "analyze") {
      PrintResponse(services.traces->AnalyzeTrace(ParseRequest<AnalyzeTraceRequest>(json)));
    } else if (cmd == "validate") {
      PrintResponse(services.traces->ValidateTrace(ParseRequest<ValidateTraceRequest>(json)));
    } else if (cmd == "span-patterns") {
      PrintResponse(services.traces->AnalyzeSpanPatterns(ParseRequest<AnalyzeSpanPatternsRequest>(json)));
    } else if (cmd == "stats") {
      PrintResponse(services.statistics->ComputeStatistics(ParseRequest<ComputeStatisticsRequest>(json)));
    } else if (cmd == "log-patterns") {
      PrintResponse(services.logs->ExtractLogPatterns(ParseRequest<ExtractLogPatternsRequest>(json)));
    } else if (cmd == "log-compare") {
      PrintResponse(services.logs->CompareLogWindows(ParseRequest<CompareLogWindowsRequest>(json)));
    } else {
      Usage();
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  return 0;
}
