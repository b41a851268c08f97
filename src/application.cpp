#include "application.hpp"
#include "sync/sync_error.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <fstream>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace headerpipe {
namespace app {

std::atomic<Application *> Application::instance_{nullptr};

namespace {

bool ReadUInt64(const nlohmann::json &json, const char *key, uint64_t min,
                uint64_t max, uint64_t &out, std::string &error) {
  const auto &value = json.at(key);
  if (!value.is_number_unsigned()) {
    error = std::string("'") + key + "' must be a non-negative integer";
    return false;
  }
  uint64_t parsed = value.get<uint64_t>();
  if (parsed < min || parsed > max) {
    error = std::string("'") + key + "' out of range";
    return false;
  }
  out = parsed;
  return true;
}

bool ReadString(const nlohmann::json &json, const char *key, std::string &out,
                std::string &error) {
  const auto &value = json.at(key);
  if (!value.is_string()) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = value.get<std::string>();
  return true;
}

} // namespace

bool ApplyConfigJson(const nlohmann::json &json, AppConfig &config, std::string &error) {
  if (!json.is_object()) {
    error = "config root must be a JSON object";
    return false;
  }

  AppConfig updated = config;
  uint64_t number = 0;

  if (json.contains("start")) {
    if (!ReadUInt64(json, "start", 0, UINT64_MAX, number, error)) return false;
    updated.start_block = number;
  }
  if (json.contains("final")) {
    if (json.at("final").is_null()) {
      updated.final_block.reset();
    } else {
      if (!ReadUInt64(json, "final", 0, UINT64_MAX, number, error)) return false;
      updated.final_block = number;
    }
  }
  if (json.contains("slices")) {
    if (!ReadUInt64(json, "slices", 1, 1'000'000, number, error)) return false;
    updated.max_slices = static_cast<size_t>(number);
  }
  if (json.contains("queue")) {
    if (!ReadUInt64(json, "queue", 1, 1'000'000, number, error)) return false;
    updated.send_queue_capacity = static_cast<size_t>(number);
  }
  if (json.contains("loglevel")) {
    if (!ReadString(json, "loglevel", updated.log_level, error)) return false;
  }
  if (json.contains("logfile")) {
    if (!ReadString(json, "logfile", updated.log_file, error)) return false;
  }

  config = updated;
  return true;
}

bool LoadConfigFile(const std::string &path, AppConfig &config, std::string &error) {
  std::ifstream file(path);
  if (!file) {
    error = "cannot open config file " + path;
    return false;
  }

  nlohmann::json json = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded()) {
    error = "malformed JSON in " + path;
    return false;
  }
  return ApplyConfigJson(json, config, error);
}

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

bool Application::initialize() {
  LOG_APP_INFO("Initializing {}...", GetFullVersionString());

  try {
    io_context_ = std::make_unique<boost::asio::io_context>();
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        io_context_->get_executor());

    // Loopback transport: log what would go on the wire
    send_queue_ = network::SendQueueGateway::Create(
        *io_context_, config_.send_queue_capacity,
        [](const std::string &command, const std::vector<uint8_t> &payload,
           const network::PeerFilter &filter) {
          LOG_NET_DEBUG("-> {} ({} bytes) to {}", command, payload.size(),
                        filter.ToString());
          return true;
        });
    gateway_ = std::make_shared<network::SharedGateway>(send_queue_);

    header_slices_ = std::make_shared<sync::HeaderSlices>(
        config_.max_slices, config_.start_block, config_.final_block);
    request_issuer_ = std::make_unique<sync::RequestIssuer>(header_slices_, gateway_);
  } catch (const std::invalid_argument &e) {
    LOG_APP_ERROR("Invalid configuration: {}", e.what());
    return false;
  }

  LOG_APP_INFO("Slices {}..{} ({} slices), send queue capacity {}",
               header_slices_->MinBlockNum(), header_slices_->MaxBlockNum(),
               header_slices_->Size(), send_queue_->Capacity());
  return true;
}

bool Application::start() {
  if (running_ || !request_issuer_) {
    return false;
  }

  setup_signal_handlers();

  io_thread_ = std::thread([this]() { io_context_->run(); });
  stage_thread_ = std::thread(&Application::stage_loop, this);

  running_ = true;
  LOG_APP_INFO("Fetch request stage started");
  return true;
}

void Application::stage_loop() {
  try {
    while (!shutdown_requested_ &&
           header_slices_->CountSlicesInStatus(sync::HeaderSliceStatus::Empty) > 0) {
      request_issuer_->Execute();
    }
  } catch (const sync::SyncError &e) {
    if (shutdown_requested_) {
      LOG_SYNC_DEBUG("Fetch request stage interrupted by shutdown: {}", e.what());
    } else {
      LOG_SYNC_ERROR("Fetch request stage failed: {}", e.what());
      stage_failed_ = true;
    }
  } catch (const std::exception &e) {
    // Slice store inconsistency
    LOG_APP_ERROR("Fetch request stage aborted: {}", e.what());
    stage_failed_ = true;
  }
  stage_finished_ = true;
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_ && !stage_finished_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  shutdown();
}

void Application::stop() { shutdown(); }

void Application::shutdown() {
  if (!running_) {
    return;
  }
  LOG_APP_INFO("Shutting down...");
  shutdown_requested_ = true;

  // Unblock the stage: closed watches and a stopped gateway both surface as
  // SyncError inside Execute()
  header_slices_->Close();
  send_queue_->Stop();
  if (stage_thread_.joinable()) {
    stage_thread_.join();
  }

  work_guard_.reset();
  io_context_->stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  running_ = false;
  LOG_APP_INFO("Shutdown complete{}", stage_failed_ ? " (stage failed)" : "");
}

nlohmann::json Application::summary() const {
  nlohmann::json out;
  if (!header_slices_) {
    return out;
  }

  out["requests_issued"] = request_issuer_->IssuedRequestCount();
  out["delivered"] = send_queue_->DeliveredCount();
  out["dropped"] = send_queue_->DroppedCount();
  out["failed"] = stage_failed_.load();

  nlohmann::json slices = nlohmann::json::object();
  for (size_t i = 0; i < sync::kHeaderSliceStatusCount; ++i) {
    auto status = static_cast<sync::HeaderSliceStatus>(i);
    slices[sync::HeaderSliceStatusToString(status)] =
        header_slices_->CountSlicesInStatus(status);
  }
  out["slices"] = slices;
  return out;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int) {
  Application *app = instance_.load();
  if (app) {
    // Use write() for async-signal-safety (std::cout is NOT safe)
    const char msg[] = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    app->request_shutdown();
  }
}

} // namespace app
} // namespace headerpipe
