#include "CalibrationEngine.hpp"
#include "EngineConfig.hpp"
#include "JsonLinesSink.hpp"
#include "ProgramStore.hpp"
#include "SerialDataSource.hpp"
#include "SignalNormalizer.hpp"
#include "WorkoutSession.hpp"

#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <unistd.h>

namespace asio = boost::asio;

// Live session on the wearable bridge. Frames arrive on the serial port
// (one JSON object per line); coaching commands arrive on stdin:
//   begin <kg> | end | abort | yes | no | fb <feedback> | form | skip | quit
//
//   intensity_live <device> [--baud 115200] [--config engine.json]
//                  [--program store.json --exercise name --user id
//                   --wearable --headphones]

namespace {

class CommandQueue {
public:
  void push(const std::string& line) {
    std::lock_guard<std::mutex> lock(mu_);
    lines_.push_back(line);
  }
  bool pop(std::string& out) {
    std::lock_guard<std::mutex> lock(mu_);
    if (lines_.empty()) return false;
    out = lines_.front();
    lines_.pop_front();
    return true;
  }

private:
  std::mutex mu_;
  std::deque<std::string> lines_;
};

// Coaching commands from stdin, read on the io_context next to the serial
// port. EOF queues "quit".
class ConsoleReader {
public:
  ConsoleReader(asio::io_context& io, CommandQueue& commands)
    : input_(io, ::dup(STDIN_FILENO)), commands_(commands) {}

  void start() {
    asio::async_read_until(input_, buffer_, '\n',
      [this](const boost::system::error_code& ec, std::size_t) {
        std::istream is(&buffer_);
        std::string line;
        if (ec) {
          if (std::getline(is, line) && !line.empty()) commands_.push(line);
          if (ec != asio::error::operation_aborted) commands_.push("quit");
          return;
        }
        std::getline(is, line);
        commands_.push(line);
        start();
      });
  }

private:
  asio::posix::stream_descriptor input_;
  asio::streambuf buffer_;
  CommandQueue& commands_;
};

// Runs the io_context on its own thread; stops and joins on every exit path.
class IoThread {
public:
  explicit IoThread(asio::io_context& io) : io_(io), thread_([this]() { io_.run(); }) {}
  ~IoThread() {
    io_.stop();
    if (thread_.joinable()) thread_.join();
  }

  IoThread(const IoThread&) = delete;
  IoThread& operator=(const IoThread&) = delete;

private:
  asio::io_context& io_;
  std::thread thread_;
};

// false on "quit"
bool handle_command(const std::string& line, WorkoutSession& session, int64_t t_ms) {
  std::istringstream in(line);
  std::string cmd;
  in >> cmd;

  if (cmd == "begin") {
    double kg = 0.0;
    in >> kg;
    session.begin_set(t_ms, kg);
  } else if (cmd == "end") {
    session.complete_set(t_ms);
  } else if (cmd == "abort") {
    session.abort_set(t_ms);
  } else if (cmd == "yes") {
    session.respond_to_prompt(PromptResponse::Yes, t_ms);
  } else if (cmd == "no") {
    session.respond_to_prompt(PromptResponse::No, t_ms);
  } else if (cmd == "fb") {
    std::string rest;
    std::getline(in >> std::ws, rest);
    auto fb = feedback_from_string(rest);
    if (!fb) throw std::runtime_error("unknown feedback '" + rest + "'");
    session.submit_feedback(*fb, t_ms);
  } else if (cmd == "form") {
    session.report_form_instability();
  } else if (cmd == "skip") {
    session.finish_rest(t_ms);
  } else if (cmd == "quit") {
    return false;
  } else if (!cmd.empty()) {
    std::cerr << "[live] unknown command '" << cmd << "'\n";
  }
  return true;
}

void run(WorkoutSession& session, SampleMailbox& mailbox, CommandQueue& commands,
         const std::atomic<bool>& link_up) {
  SensorFrame f{};
  bool dropped = false;
  int64_t now_ms = 0;
  bool running = true;

  while (running) {
    if (mailbox.take(f, dropped)) {
      now_ms = f.t_ms;
      session.on_frame(f, dropped);
    } else if (!link_up) {
      std::cerr << "[live] serial link closed\n";
      break;
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::string line;
    while (running && commands.pop(line)) {
      try {
        running = handle_command(line, session, now_ms);
      } catch (const std::exception& e) {
        // a bad command (rating a locked set, ending no set) is not fatal
        std::cerr << "[live] " << e.what() << "\n";
      }
    }
  }

  session.end_session(now_ms);
  if (mailbox.total_dropped() > 0) {
    std::cerr << "[live] dropped " << mailbox.total_dropped() << " frames under load\n";
  }
  std::cout << nlohmann::json{{"event", "history"}, {"sets", session.history_payload()}}.dump()
            << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      std::cerr << "usage: intensity_live <device> [--baud n] [--config file] "
                   "[--program store.json --exercise name --user id --wearable --headphones]\n";
      return 1;
    }

    std::string device = argv[1];
    unsigned baud = 115200;
    std::string config_path, program_path;
    std::string exercise = "live";
    std::string user = "local";
    DeviceCapabilities caps;

    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) throw std::runtime_error("missing value for " + arg);
        return argv[++i];
      };
      if (arg == "--baud") baud = static_cast<unsigned>(std::atoi(value().c_str()));
      else if (arg == "--config") config_path = value();
      else if (arg == "--program") program_path = value();
      else if (arg == "--exercise") exercise = value();
      else if (arg == "--user") user = value();
      else if (arg == "--wearable") caps.wearable = true;
      else if (arg == "--headphones") caps.headphones = true;
      else throw std::runtime_error("unknown argument " + arg);
    }

    EngineConfig cfg = config_path.empty() ? EngineConfig{} : load_engine_config(config_path);

    // ---------- Program / calibration (optional) ----------
    std::unique_ptr<JsonFileProgramStore> store;
    std::unique_ptr<CalibrationEngine> engine;
    SessionMode mode = FreeMode{};
    if (!program_path.empty()) {
      store.reset(new JsonFileProgramStore(program_path));
      engine.reset(new CalibrationEngine(cfg.calibration, cfg.plateau, *store, user));
      if (!engine->snapshot(exercise)) engine->start_week(exercise, caps);
      mode = session_mode_for(*engine, exercise);
    }

    // ---------- Serial setup ----------
    asio::io_context io;
    SerialDataSource source(io, device, baud);

    SampleMailbox mailbox;
    CommandQueue commands;
    std::atomic<bool> link_up{true};
    ConsoleReader console(io, commands);

    // Serial timing is driven by the device; the io thread only hands off
    source.start_async([&](const SensorFrame& f) { mailbox.post(f); },
                       [&]() { link_up = false; });
    console.start();
    IoThread io_thread(io);

    JsonLinesSink sink(std::cout);
    WorkoutSession session(cfg, exercise, mode, sink);
    run(session, mailbox, commands, link_up);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error in main: " << e.what() << "\n";
    return 1;
  }
}
