#pragma once

#include "execsim/concurrent/thread_safe_queue.hpp"
#include "execsim/domain/exec_report.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace execsim {

// -----------------------------------------------------------------------------
// IpcServer: dual-socket ZeroMQ gateway for report telemetry and commands
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that broadcasts execution reports to
//         external subscribers (PUB socket) and accepts JSON command
//         requests from external clients (REP socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (port 5557, configurable):
//      Broadcasts every ExecReport as a JSON object with
//      "type": "exec_report". Reports arrive via a ThreadSafeQueue from
//      whatever thread emitted them (the TimerThread worker, or a submit()
//      caller for immediate rejects), so JSON serialization and ZMQ I/O
//      never run inside the gateway's report path.
//
//   2. REP socket (port 5556, configurable):
//      Accepts a JSON command per request. Each request is forwarded to a
//      callback (bound to BrokerEngine::executeCommand()) and the JSON
//      response is sent back. The REP socket uses ZMQ_RCVTIMEO so the
//      thread alternates between command polling and telemetry draining.
//
// Thread model:
//   Constructed and destroyed on the main thread (via BrokerEngine).
//   start() spawns a worker thread running the combined poll/drain loop.
//   stop() sets an atomic flag and joins the thread.
//
//   pushReport() may be called from any thread; ThreadSafeQueue handles
//   synchronization. The command_handler_ callback is invoked on the IPC
//   thread.
//
// Ownership:
//   Owned by BrokerEngine via std::unique_ptr.
//   Owns the ZMQ context, both sockets, the report queue, and the worker
//   thread. Holds a copy of the command_handler_ callback.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Stores parameters for deferred socket creation.
  //
  // @param  command_handler  Invoked for each request received on the REP
  //                          socket. Takes the raw request, returns a JSON
  //                          response string.
  // @param  cmd_endpoint     ZMQ endpoint for the REP command socket.
  // @param  pub_endpoint     ZMQ endpoint for the PUB report socket.
  //
  // Side-effects:  None. Call start() to bring the server online.
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: calls stop() if the thread is still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Opens the ZMQ sockets and spawns the IPC worker thread.
  //
  // Idempotent: calling start() when already running is a no-op.
  //
  // @throws zmq::error_t if an endpoint cannot be bound (address in use,
  //         malformed endpoint). No thread is started in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the worker to exit, joins it, closes the sockets.
  //
  // Reports still queued are published before the worker exits.
  // Idempotent: safe to call multiple times or if never started.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // pushReport(report)
  // -------------------------------------------------------------------------
  //
  // @brief  Enqueues an execution report for broadcasting on the PUB socket.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void pushReport(domain::ExecReport report);

  // -------------------------------------------------------------------------
  // formatReport(report)
  // -------------------------------------------------------------------------
  //
  // @brief  JSON text published for one report: the codec representation
  //         of ExecReport plus "type": "exec_report".
  // -------------------------------------------------------------------------
  static std::string formatReport(const domain::ExecReport& report);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker thread entry point: drain reports, poll commands, repeat.
  void run();

  // Drains the report queue and publishes each report on the PUB socket.
  void processReports();

  // Waits up to kPollTimeoutMs for one request on the REP socket and
  // answers it.
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<domain::ExecReport> report_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace execsim
