#pragma once

#include "network/protocol.hpp"
#include "network/send_queue_gateway.hpp"
#include "sync/header_slices.hpp"
#include "sync/request_issuer.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace headerpipe {
namespace app {

// Application configuration
struct AppConfig {
  // Headers range
  sync::BlockNum start_block = 0;
  std::optional<sync::BlockNum> final_block;

  // Slices held in memory at once
  size_t max_slices = 64;

  // Outbound queue depth in messages
  size_t send_queue_capacity = protocol::DEFAULT_SEND_QUEUE_CAPACITY;

  // Logging
  std::string log_level = "info";
  std::string log_file; // empty = console
};

/**
 * Load settings from a JSON object into `config`. Keys that are absent keep
 * their current value. Returns false (and leaves `error` set) on a missing
 * file, malformed JSON, or a value of the wrong type or range.
 *
 * Recognized keys: start, final, slices, queue, loglevel, logfile
 */
bool LoadConfigFile(const std::string &path, AppConfig &config, std::string &error);
bool ApplyConfigJson(const nlohmann::json &json, AppConfig &config, std::string &error);

/**
 * Application - wires the fetch request stage to a send queue and runs it
 *
 * The send queue drains into a loopback sink that only logs what a real
 * transport would put on the wire. The stage runs on its own thread until no
 * Empty slice is left or a shutdown is requested.
 */
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Shutdown request (signals)
  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }

  // Final counters as JSON (valid after initialize())
  nlohmann::json summary() const;

  // Signal handling
  static void signal_handler(int signal);

private:
  void stage_loop();
  void shutdown();
  void setup_signal_handlers();

  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> stage_finished_{false};
  std::atomic<bool> stage_failed_{false};

  // Components (initialized in order)
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::shared_ptr<network::SendQueueGateway> send_queue_;
  std::shared_ptr<network::SharedGateway> gateway_;
  std::shared_ptr<sync::HeaderSlices> header_slices_;
  std::unique_ptr<sync::RequestIssuer> request_issuer_;

  std::thread io_thread_;
  std::thread stage_thread_;

  static std::atomic<Application *> instance_;
};

} // namespace app
} // namespace headerpipe
