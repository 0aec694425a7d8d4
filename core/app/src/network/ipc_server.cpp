#include "execsim/network/ipc_server.hpp"
#include "execsim/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace execsim {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);

  cmd_socket->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket->set(zmq::sockopt::linger, 0);
  pub_socket->set(zmq::sockopt::linger, 0);
  cmd_socket->bind(cmd_endpoint_);
  pub_socket->bind(pub_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(cmd_socket);
  pub_socket_ = std::move(pub_socket);

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

// -----------------------------------------------------------------------------
// pushReport(): thread-safe enqueue from the report path
// -----------------------------------------------------------------------------
void IpcServer::pushReport(domain::ExecReport report) {
  report_queue_.push(std::move(report));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processReports();
    processCommands();
  }

  // Final drain: publish any remaining reports before shutdown.
  processReports();
}

// -----------------------------------------------------------------------------
// processReports(): drain queue and publish JSON on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processReports() {
  for (const domain::ExecReport& report : report_queue_.drain()) {
    const std::string json_str = formatReport(report);
    zmq::message_t msg(json_str.data(), json_str.size());
    // PUB never blocks on slow subscribers; a full HWM drops the message.
    (void)pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatReport()
// -----------------------------------------------------------------------------
std::string IpcServer::formatReport(const domain::ExecReport& report) {
  nlohmann::json j = report;
  j["type"] = "exec_report";
  return j.dump();
}

}  // namespace execsim
