#pragma once

#include "EngineConfig.hpp"
#include "SignalNormalizer.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <vector>

enum class PhaseKind { Concentric, Eccentric };

struct RepPhase {
  PhaseKind kind = PhaseKind::Concentric;
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  bool pause_detected = false;  // preceded by a near-zero-velocity pause
  double rom_deg = 0.0;         // integrated |gyro| over the phase

  double duration_s() const { return (end_ms - start_ms) / 1000.0; }
};

struct PhaseEvent {
  bool phase_completed = false;
  RepPhase phase;
  bool rep_completed = false;
  int total_reps = 0;
};

// Trainer-only live split for one phase.
struct PhaseSplit {
  PhaseKind kind = PhaseKind::Concentric;
  double duration_s = 0.0;
  double target_s = 0.0;
  double score = 0.0;
};

// Score of one phase against its target: 100 inside +/-tolerance, then a
// linear penalty of penalty_per_pct points per % of excess deviation,
// floored at 0.
double tempo_phase_score(const RepPhase& p, const TempoConfig& cfg);

class TempoPhaseClassifier {
public:
  explicit TempoPhaseClassifier(const TempoConfig& cfg);

  PhaseEvent update(const SensorSample& s);

  // close an in-progress phase at set end
  PhaseEvent finish(int64_t t_ms);

  // drop everything that ended after `t_ms` (forgotten-set "yes")
  void truncate_after(int64_t t_ms);

  const std::vector<RepPhase>& phases() const { return phases_; }
  int total_reps() const { return total_reps_; }

  // athlete view: aggregate only; none until a phase completes
  boost::optional<double> tempo_score() const;
  // trainer view: per-phase split times
  std::vector<PhaseSplit> splits() const;

  void reset();

private:
  PhaseEvent close_phase(int64_t end_ms);
  void open_phase(int64_t t_ms, int dir, bool after_pause);
  PhaseKind kind_for(int dir) const;

  TempoConfig cfg_;

  std::vector<RepPhase> phases_;

  bool in_deadband_ = true;
  int64_t deadband_since_ = -1;
  bool moving_ = false;
  int dir_ = 0;               // +1 or -1 of the phase in progress
  int concentric_dir_ = 0;    // set by the first movement of the set
  RepPhase current_;
  int64_t last_t_ = -1;
  int phases_in_rep_ = 0;
  int total_reps_ = 0;
};
