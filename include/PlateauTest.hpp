#pragma once
#include "CalibrationState.hpp"
#include "EngineConfig.hpp"

#include <boost/optional.hpp>

#include <string>
#include <vector>

// Semantic cue for the voice/haptic service; the pulse count is the
// protocol (1 = down, 2 = up, 3 = hold), waveforms are not ours.
enum class CueKind { Down = 1, Up = 2, Hold = 3 };

struct HapticCue {
  CueKind kind = CueKind::Hold;
  int pulses = 3;
  double offset_s = 0.0;  // from set start
  int set_index = 0;
  int rep_index = 0;
};

const char* to_string(CueKind k);

struct PlateauGuardrails {
  double one_rm_kg = 0.0;
  double weight_kg = 0.0;
  int reps = 3;
  int sets = 2;
  double tempo_s = 0.0;       // per rep
  double eccentric_s = 0.0;
  double concentric_s = 0.0;
  double tut_s = 0.0;         // per set
};

struct PlateauTestSession {
  PlateauGuardrails guardrails;
  int sets_done = 0;
  bool completed = false;
  boost::optional<std::string> abort_reason;
};

// Epley estimate, used when no calibrated 1RM exists yet
double estimate_one_rm(double load_kg, int reps);

PlateauGuardrails make_plateau_guardrails(const PlateauConfig& cfg,
                                          const TrainingParameters& current,
                                          double one_rm_kg);

// Human-readable violations; empty when the snapshot is inside every band.
std::vector<std::string> guardrail_violations(const PlateauConfig& cfg, const PlateauGuardrails& g);

TrainingParameters plateau_parameters(const PlateauGuardrails& g);

// down / up per rep, then hold
std::vector<HapticCue> plateau_cue_schedule(const PlateauGuardrails& g, int set_index);
