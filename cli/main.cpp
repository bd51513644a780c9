#include <iostream>
#include <iterator>
#include <string>
#include <thread>

#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "engine/engine_registry.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/environment_manager.hpp"
#include "manager/event_queue.hpp"
#include "manager/limits.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "validator/validator.hpp"

DEFINE_string(language, "python",
              "Language of the code: python, javascript or typescript");
DEFINE_string(inputs, "",
              "Comma separated inputs, fed to the code one per line");
DEFINE_int64(max_memory_mb, 0, "Memory limit, 0 for the default");
DEFINE_int64(max_execution_time_ms, 0, "Wall time limit, 0 for the default");
DEFINE_int64(max_cpu_time_ms, 0, "CPU time limit, 0 for the default");
DEFINE_int64(max_output_size, 0, "Output size limit, 0 for the default");
DEFINE_bool(allow_network, false, "Let the code access the network");
DEFINE_bool(allow_filesystem, false, "Let the code access the filesystem");
DEFINE_bool(validate_only, false, "Only print the validation result");
DEFINE_bool(watch, false, "Print usage samples and alerts on stderr");
DEFINE_int32(engine_startup_ms, 10000,
             "How long to wait for the engines to be ready");

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  CHECK(status.ok()) << status.ToString();
  return json;
}

std::string ReadCode(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::Read(path);
}

void Watch(manager::EventQueue* events) {
  absl::optional<proto::Event> event;
  while ((event = events->Dequeue())) {
    if (event->has_usage()) {
      const proto::ResourceUsage& usage = event->usage();
      std::cerr << absl::StrFormat(
                       "[%s] %.1fMB, %dms CPU (%.0f%%), %dms wall",
                       event->environment_id(), usage.memory_mb(),
                       usage.cpu_time_ms(), usage.cpu_percent(),
                       usage.execution_time_ms())
                << std::endl;
    } else if (event->has_alert()) {
      std::cerr << "[" << event->environment_id() << "] "
                << event->alert().message() << std::endl;
    } else if (event->has_status()) {
      std::cerr << "[" << event->environment_id() << "] "
                << proto::EnvironmentStatus_Name(event->status().status())
                << std::endl;
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs a code snippet in a sandbox.\n"
      "Usage: snipbox [flags] <source file, or - for stdin>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (argc != 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "cli/main");
    return 2;
  }

  proto::Language language;
  if (!proto::Language_Parse(absl::AsciiStrToUpper(FLAGS_language),
                             &language) ||
      language == proto::INVALID_LANGUAGE) {
    LOG(ERROR) << "Unknown language: " << FLAGS_language;
    return 2;
  }

  proto::CodeExecutionRequest request;
  request.set_language(language);
  try {
    request.set_code(ReadCode(argv[1]));
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Cannot read " << argv[1] << ": " << e.what();
    return 2;
  }
  if (!FLAGS_inputs.empty()) {
    for (absl::string_view input : absl::StrSplit(FLAGS_inputs, ',')) {
      request.add_inputs(std::string(input));
    }
  }
  proto::ResourceLimits* limits = request.mutable_limits();
  limits->set_max_memory_mb(FLAGS_max_memory_mb);
  limits->set_max_execution_time_ms(FLAGS_max_execution_time_ms);
  limits->set_max_cpu_time_ms(FLAGS_max_cpu_time_ms);
  limits->set_max_output_size(FLAGS_max_output_size);
  limits->set_enable_network_access(FLAGS_allow_network);
  limits->set_enable_file_system_access(FLAGS_allow_filesystem);

  if (FLAGS_validate_only) {
    proto::ValidationResult validation = validator::Validate(
        request.code(), language,
        validator::ValidationOptions::FromLimits(
            manager::ApplyDefaults(*limits)));
    std::cout << ToJson(validation) << std::endl;
    return validation.valid() ? 0 : 1;
  }

  std::unique_ptr<engine::EngineRegistry> registry =
      engine::EngineRegistry::WithDefaultEngines();
  registry->Init();
  if (!registry->WaitUntilReady(
          std::chrono::milliseconds(FLAGS_engine_startup_ms))) {
    LOG(WARNING) << "The engines are still starting after "
                 << FLAGS_engine_startup_ms << "ms";
  }

  manager::EventQueue events;
  std::thread watcher;
  proto::ExecutionResult result;
  {
    manager::EnvironmentManager manager(registry.get(),
                                        manager::ManagerOptions::FromFlags(),
                                        FLAGS_watch ? &events : nullptr);
    if (FLAGS_watch) watcher = std::thread(Watch, &events);
    result = manager.Submit(request).get();
  }
  events.Stop();
  if (watcher.joinable()) watcher.join();
  registry->Shutdown();

  std::cout << ToJson(result) << std::endl;
  return result.exit_code();
}
