#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/strings/str_format.h"

#include "echo.grpc.pb.h"
#include "spdlog/spdlog.h"
#include "calltrace/grpc_interceptor_bridge.h"
#include "calltrace/instrumentation_config.h"
#include "calltrace/trace_log_formatter.h"
#include "calltrace/tracer_provider.h"
#include "calltrace/tracing_server_interceptor.h"

ABSL_FLAG(uint16_t, port, 50051, "Server port for the service");
ABSL_FLAG(bool, experimental_span_attributes, false,
          "Record grpc.canceled on cancelled calls (also enabled by "
          "OTEL_INSTRUMENTATION_GRPC_EXPERIMENTAL_SPAN_ATTRIBUTES=true)");

using calltrace::example::Echo;
using calltrace::example::EchoReply;
using calltrace::example::EchoRequest;
using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::ServerReaderWriter;
using grpc::Status;

// Synchronous service: a requested delay holds one thread of the server pool
class EchoServiceImpl final : public Echo::Service {
 public:
  Status Say(ServerContext* context, const EchoRequest* request,
             EchoReply* reply) override {
    spdlog::info("Received request: {}", request->text());

    if (request->delay_ms() > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(request->delay_ms()));
    }
    if (context->IsCancelled()) {
      spdlog::warn("Request was cancelled by client before processing.");
      return Status(grpc::StatusCode::CANCELLED, "Request cancelled");
    }
    if (request->fail_with_code() != 0) {
      return Status(static_cast<grpc::StatusCode>(request->fail_with_code()),
                    "Failure requested by client");
    }

    reply->set_text(request->text());
    return Status::OK;
  }

  Status Chat(ServerContext* /*context*/,
              ServerReaderWriter<EchoReply, EchoRequest>* stream) override {
    EchoRequest request;
    while (stream->Read(&request)) {
      spdlog::info("Chat message: {}", request.text());
      EchoReply reply;
      reply.set_text(request.text());
      if (!stream->Write(reply)) {
        return Status(grpc::StatusCode::UNKNOWN, "Write failed");
      }
    }
    return Status::OK;
  }
};

void RunServer(uint16_t port, bool experimental_span_attributes) {
  std::string server_address = absl::StrFormat("0.0.0.0:%d", port);

  calltrace::InstrumentationConfig config = calltrace::GlobalInstrumentationConfig();
  config.capture_experimental_span_attributes |= experimental_span_attributes;
  auto tracing = calltrace::TracingServerInterceptor::Create(
      std::make_shared<calltrace::GrpcServerTracer>(), config);

  EchoServiceImpl service;

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();
  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  // Tracing runs first so the span covers every other interceptor
  std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> interceptors;
  interceptors.push_back(std::make_unique<calltrace::ServerTracingInterceptorFactory>(tracing));
  builder.experimental().SetInterceptorCreators(std::move(interceptors));

  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (!server) {
    spdlog::error("Failed to start server on {}", server_address);
    return;
  }
  spdlog::info("Server listening on {}", server_address);
  server->Wait();
}

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);

  calltrace::SetTraceLogging();
  calltrace::TracerProvider::Initialize();

  RunServer(absl::GetFlag(FLAGS_port), absl::GetFlag(FLAGS_experimental_span_attributes));

  calltrace::TracerProvider::Shutdown();
  return 0;
}
