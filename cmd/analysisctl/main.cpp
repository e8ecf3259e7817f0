#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "analysis/engine/v1.hpp"
#include "internal/broker/task_schema.hpp"

using namespace analysis::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  analysisctl <addr> enqueue <task_name> [key[:type]=value ...]\n"
            << "      type: str | int | float | bool | file (blob read from path); inferred when omitted\n"
            << "  analysisctl <addr> result <task_id> [wait_ms]\n"
            << "  analysisctl <addr> stats\n";
}

static std::optional<PayloadValue> InferValue(const std::string& raw) {
  if (raw == "true" || raw == "false") {
    return analysis::broker::BoolValue(raw == "true");
  }

  char* end = nullptr;
  const long long as_int = std::strtoll(raw.c_str(), &end, 10);
  if (!raw.empty() && end && *end == '\0') {
    return analysis::broker::IntValue(as_int);
  }

  const double as_double = std::strtod(raw.c_str(), &end);
  if (!raw.empty() && end && *end == '\0') {
    return analysis::broker::DoubleValue(as_double);
  }

  return analysis::broker::StringValue(raw);
}

static std::optional<PayloadValue> ParseValue(const std::string& type, const std::string& raw) {
  try {
    if (type.empty()) return InferValue(raw);
    if (type == "str") return analysis::broker::StringValue(raw);
    if (type == "int") return analysis::broker::IntValue(std::stoll(raw));
    if (type == "float") return analysis::broker::DoubleValue(std::stod(raw));
    if (type == "bool") return analysis::broker::BoolValue(raw == "true" || raw == "1" || raw == "yes");
    if (type == "file") {
      std::ifstream in(raw, std::ios::binary);
      if (!in) return std::nullopt;
      std::ostringstream bytes;
      bytes << in.rdbuf();
      return analysis::broker::BlobValue(bytes.str());
    }
  } catch (const std::exception&) {
    return std::nullopt;
  }
  return std::nullopt;
}

static void PrintResult(const ResultRecord& record) {
  std::cout << "task_id=" << record.task_id() << "\n";
  std::cout << "task=" << analysis::broker::TaskNameToString(record.task_name()) << "\n";
  std::cout << "status=" << TaskStatus_Name(record.status()) << "\n";
  std::cout << "attempt=" << record.attempt() << "\n";
  if (record.has_result_ref()) {
    std::cout << "result_ref=" << record.result_ref().key().bucket() << "/" << record.result_ref().key().key() << "@"
              << record.result_ref().version() << "\n";
  }
  if (record.has_error()) {
    std::cout << "error_kind=" << ErrorKind_Name(record.error().kind()) << "\n";
    std::cout << "error=" << record.error().message() << "\n";
  }
  for (const auto& [key, value] : record.record()) {
    std::cout << "record." << key << "=" << value << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TaskBrokerService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    auto name = analysis::broker::ParseTaskName(argv[3]);
    if (!name) {
      std::cerr << "unknown task name: " << argv[3] << "\n";
      return 1;
    }

    EnqueueRequest req;
    req.mutable_envelope()->set_task_name(*name);

    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      const auto        eq  = arg.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "expected key=value, got: " << arg << "\n";
        return 1;
      }

      std::string key = arg.substr(0, eq);
      std::string type;
      if (const auto colon = key.find(':'); colon != std::string::npos) {
        type = key.substr(colon + 1);
        key  = key.substr(0, colon);
      }

      auto value = ParseValue(type, arg.substr(eq + 1));
      if (!value) {
        std::cerr << "invalid value for " << key << "\n";
        return 1;
      }
      (*req.mutable_envelope()->mutable_payload())[key] = *value;
    }

    grpc::ClientContext ctx;
    EnqueueResponse     resp;

    auto status = stub->Enqueue(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "task_id=" << resp.task_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "result") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetResultRequest req;
    req.set_task_id(argv[3]);

    const auto wait     = std::chrono::milliseconds(argc >= 5 ? std::stoull(argv[4]) : 0);
    const auto deadline = std::chrono::steady_clock::now() + wait;

    while (true) {
      grpc::ClientContext ctx;
      GetResultResponse   resp;

      auto status = stub->GetResult(&ctx, req, &resp);

      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }

      const bool terminal = resp.found() && resp.result().status() != TASK_STATUS_RETRYING;
      if (terminal || std::chrono::steady_clock::now() >= deadline) {
        if (!resp.found()) {
          std::cout << "status=PENDING\n";
          return 0;
        }
        PrintResult(resp.result());
        return 0;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    grpc::ClientContext ctx;
    GetStatsRequest     req;
    GetStatsResponse    resp;

    auto status = stub->GetStats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "ready=" << resp.ready() << "\n";
    std::cout << "in_flight=" << resp.in_flight() << "\n";
    std::cout << "results=" << resp.results() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
