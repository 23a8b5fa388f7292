#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "chartsync/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/grpc_remote_transport.hpp"
#include "internal/sync/download/channel_download_source.hpp"
#include "internal/sync/download/vector_download_source.hpp"
#include "internal/sync/upload/upload_request_result.hpp"
#include "internal/util/time.hpp"

using chartsync::factory::Runtime;

static void Usage() {
  std::cout << "Usage:\n"
            << "  chartsync --config <config.yaml> import <batch.json>\n"
            << "  chartsync --config <config.yaml> pending\n"
            << "  chartsync --config <config.yaml> sync\n"
            << "  chartsync --config <config.yaml> clear\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static int Import(Runtime& runtime, const std::string& path) {
  chartsync::v1::ResourceBatch batch;
  auto                         status = google::protobuf::util::JsonStringToMessage(ReadFile(path), &batch);
  if (!status.ok()) {
    std::cerr << "invalid batch file: " << status.message() << "\n";
    return 1;
  }

  chartsync::sync::VectorDownloadSource source(
      {std::vector<chartsync::v1::Resource>(batch.resources().begin(), batch.resources().end())});
  const auto summary = runtime.engine->SyncDownload(runtime.resolver, source);

  std::cout << "imported resources=" << summary.resources << " conflicts=" << summary.conflicts
            << " resolved=" << summary.resolved << " unresolved=" << summary.unresolved << "\n";
  return 0;
}

static int Pending(Runtime& runtime) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  for (const auto& change : runtime.engine->GetUnsyncedLocalChanges()) {
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(change, &json, options);
    if (!status.ok()) {
      std::cerr << "serialize failed: " << status.message() << "\n";
      return 1;
    }
    std::cout << json << "\n";
  }
  return 0;
}

// Reads the remote stream on a producer thread so the next batch downloads while the current one commits.
static chartsync::sync::DownloadSummary DownloadThroughChannel(Runtime& runtime, chartsync::sync::DownloadSource& remote,
                                                               uint32_t queue_depth) {
  chartsync::sync::ChannelDownloadSource channel(queue_depth);
  std::string                            producer_error;

  std::thread producer([&] {
    try {
      while (auto batch = remote.Next()) {
        if (!channel.Push(std::move(*batch))) {
          remote.Cancel();
          break;
        }
      }
    } catch (const std::exception& e) {
      producer_error = e.what();
    }
    channel.Close();
  });

  chartsync::sync::DownloadSummary summary;
  try {
    summary = runtime.engine->SyncDownload(runtime.resolver, channel);
  } catch (const std::exception&) {
    // the producer may be blocked in a read rather than in Push
    channel.Cancel();
    remote.Cancel();
    producer.join();
    throw;
  }
  producer.join();

  if (!producer_error.empty()) {
    throw std::runtime_error(producer_error);
  }
  return summary;
}

static int Sync(Runtime& runtime, const chartsync::runtime::config::RuntimeConfig& config) {
  if (config.remote().target().empty()) {
    std::cerr << "remote.target is not configured\n";
    return 1;
  }

  chartsync::remote::RemoteOptions options;
  options.deadline_ms         = config.remote().deadline_ms();
  options.download_batch_size = config.remote().download_batch_size();

  auto channel = grpc::CreateChannel(config.remote().target(), grpc::InsecureChannelCredentials());
  chartsync::remote::GrpcRemoteTransport transport(channel, options);

  const auto started = chartsync::util::Now();
  auto       source  = transport.OpenDownload(runtime.engine->GetLastSyncTimestamp());
  const auto summary = DownloadThroughChannel(runtime, *source, config.sync().download_queue_depth());
  runtime.engine->SetLastSyncTimestamp(started);
  std::cout << "downloaded resources=" << summary.resources << " batches=" << summary.batches << "\n";

  auto flow = runtime.engine->SyncUpload(runtime.fetch_mode, transport.MakeUploadFn());
  while (auto progress = flow->Next()) {
    std::cout << "upload remaining=" << progress->remaining << "/" << progress->initial_total << "\n";
    if (progress->upload_error) {
      std::cerr << "upload failed (" << chartsync::sync::upload::ToString(progress->upload_error->code)
                << "): " << progress->upload_error->message << "\n";
      return 3;
    }
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = chartsync::config::ConfigLoader::LoadFromYaml(config_path);
    chartsync::observability::InitializeLogging(config);

    auto runtime = chartsync::factory::Build(config);

    int rc = 1;
    if (cmd == "import" && argc == 5) {
      rc = Import(runtime, argv[4]);
    } else if (cmd == "pending" && argc == 4) {
      rc = Pending(runtime);
    } else if (cmd == "sync" && argc == 4) {
      rc = Sync(runtime, config);
    } else if (cmd == "clear" && argc == 4) {
      runtime.engine->ClearDatabase();
      rc = 0;
    } else {
      Usage();
    }

    chartsync::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    CHARTSYNC_LOG_ERROR("Fatal error", {chartsync::observability::StringField("error", e.what())});
    chartsync::observability::ShutdownLogging();
    return 2;
  }
}
