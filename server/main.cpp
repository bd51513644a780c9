#include <map>
#include <memory>
#include <string>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "engine/engine_registry.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "manager/environment_manager.hpp"
#include "manager/event_queue.hpp"
#include "manager/event_stream.hpp"
#include "manager/limits.hpp"
#include "proto/service.grpc.pb.h"
#include "util/flags.hpp"
#include "validator/validator.hpp"

DEFINE_string(address, "127.0.0.1", "address to listen on");  // NOLINT
DEFINE_int32(port, 7072, "port to listen on");                 // NOLINT

class SnipboxImpl : public proto::Snipbox::Service {
 public:
  explicit SnipboxImpl(const engine::EngineRegistry* registry)
      : registry_(registry),
        manager_(registry, manager::ManagerOptions::FromFlags(), &events_) {
    router_ = std::thread(&SnipboxImpl::RouteEvents, this);
  }

  ~SnipboxImpl() override {
    events_.Stop();
    router_.join();
    absl::MutexLock lock(&mutex_);
    for (auto& kv : streams_) kv.second->Stop();
  }

  grpc::Status Execute(grpc::ServerContext* context,
                       const proto::CodeExecutionRequest* request,
                       grpc::ServerWriter<proto::Event>* writer) override {
    if (request->language() == proto::INVALID_LANGUAGE) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                          "The language of the code is missing");
    }
    std::string id = manager_.CreateEnvironment(request->limits());
    auto stream = std::make_shared<manager::EventQueue>();
    {
      absl::MutexLock lock(&mutex_);
      streams_[id] = stream;
    }
    try {
      manager_.Run(id, *request);
    } catch (const std::exception& e) {
      LOG(WARNING) << "Cannot run " << id << ": " << e.what();
      Forget(id);
      return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }

    manager::EventSink sink;
    sink.cancelled = [context]() { return context->IsCancelled(); };
    sink.write = [writer](const proto::Event& event) {
      return writer->Write(event);
    };
    sink.terminate = [this, &id]() { manager_.Terminate(id); };
    bool delivered = manager::ForwardEvents(stream.get(), sink);
    Forget(id);
    if (!delivered) {
      return grpc::Status(grpc::StatusCode::CANCELLED,
                          "The result was not delivered");
    }
    return grpc::Status::OK;
  }

  grpc::Status Validate(grpc::ServerContext* /*context*/,
                        const proto::ValidateRequest* request,
                        proto::ValidationResult* response) override {
    *response = validator::Validate(
        request->code(), request->language(),
        validator::ValidationOptions::FromLimits(
            manager::ApplyDefaults(request->limits())));
    return grpc::Status::OK;
  }

  grpc::Status Terminate(grpc::ServerContext* /*context*/,
                         const proto::TerminateRequest* request,
                         proto::TerminateResponse* response) override {
    try {
      LOG(WARNING) << "Requesting to terminate " << request->environment_id();
      manager_.Terminate(request->environment_id());
      response->set_status(manager_.Status(request->environment_id()));
    } catch (const std::out_of_range& e) {
      return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
    } catch (const manager::invalid_transition& e) {
      return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
    }
    return grpc::Status::OK;
  }

  grpc::Status EngineStatus(grpc::ServerContext* /*context*/,
                            const proto::EngineStatusRequest* /*request*/,
                            proto::EngineStatusResponse* response) override {
    for (const auto& status : registry_->Status()) {
      auto* entry = response->add_engine();
      entry->set_language(status.language);
      entry->set_name(status.name);
      entry->set_ready(status.ready);
      entry->set_error(status.error);
    }
    return grpc::Status::OK;
  }

 private:
  // Forwards the events of the manager to the stream of their environment.
  void RouteEvents() {
    absl::optional<proto::Event> event;
    while ((event = events_.Dequeue())) {
      std::shared_ptr<manager::EventQueue> stream;
      {
        absl::MutexLock lock(&mutex_);
        auto it = streams_.find(event->environment_id());
        if (it == streams_.end()) continue;
        stream = it->second;
      }
      stream->Push(std::move(*event));
    }
  }

  void Forget(const std::string& id) {
    {
      absl::MutexLock lock(&mutex_);
      streams_.erase(id);
    }
    manager_.Release(id);
  }

  const engine::EngineRegistry* registry_;
  manager::EventQueue events_;
  manager::EnvironmentManager manager_;
  std::thread router_;

  absl::Mutex mutex_;
  std::map<std::string, std::shared_ptr<manager::EventQueue>> streams_
      GUARDED_BY(mutex_);
};

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::unique_ptr<engine::EngineRegistry> registry =
      engine::EngineRegistry::WithDefaultEngines();
  registry->Init();

  std::string server_address =
      FLAGS_address + ":" + std::to_string(FLAGS_port);
  SnipboxImpl service(registry.get());
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Cannot listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
  registry->Shutdown();
}
