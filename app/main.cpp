#include "EngineConfig.hpp"
#include "JsonDataSource.hpp"
#include "JsonLinesSink.hpp"
#include "WorkoutSession.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

// Replays a recorded set through a free-mode session and prints every
// coaching event as a JSON line.
//
//   intensity_replay <frames.json> [--config engine.json] [--exercise name]
//                    [--weight kg] [--feedback "easy killer"] [--realtime]
int main(int argc, char** argv) {
  try {
    std::string frames_path = "data/sample_frames.json";
    std::string config_path;
    std::string exercise = "replay";
    std::string feedback;
    double weight_kg = 0.0;
    bool realtime = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) throw std::runtime_error("missing value for " + arg);
        return argv[++i];
      };
      if (arg == "--config") config_path = value();
      else if (arg == "--exercise") exercise = value();
      else if (arg == "--weight") weight_kg = std::atof(value().c_str());
      else if (arg == "--feedback") feedback = value();
      else if (arg == "--realtime") realtime = true;
      else frames_path = arg;
    }

    EngineConfig cfg = config_path.empty() ? EngineConfig{} : load_engine_config(config_path);

    boost::optional<Feedback> fb;
    if (!feedback.empty()) {
      fb = feedback_from_string(feedback);
      if (!fb) throw std::runtime_error("unknown feedback '" + feedback + "'");
    }

    JsonDataSource source(frames_path);
    std::cerr << "Replaying " << source.size() << " frames from " << source.describe() << "\n";

    JsonLinesSink sink(std::cout);
    sink.set_live_every(5);
    WorkoutSession session(cfg, exercise, FreeMode{}, sink);

    SensorFrame f{};
    int64_t last_t = -1;

    while (source.next(f)) {
      // simulate real-time spacing based on t_ms in the JSON
      if (realtime && last_t >= 0) {
        int64_t dt = f.t_ms - last_t;
        if (dt > 0) std::this_thread::sleep_for(std::chrono::milliseconds(dt));
      }
      if (last_t < 0) session.begin_set(f.t_ms, weight_kg);
      last_t = f.t_ms;

      session.on_frame(f);
    }

    if (last_t < 0) throw std::runtime_error("no frames in " + frames_path);

    if (session.in_set()) session.complete_set(last_t);
    if (fb) session.submit_feedback(*fb, last_t);
    session.end_session(last_t);

    std::cout << nlohmann::json{{"event", "history"}, {"sets", session.history_payload()}}.dump()
              << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
