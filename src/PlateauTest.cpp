#include "PlateauTest.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

double round_to_half_kg(double kg) {
  return std::round(kg * 2.0) / 2.0;
}

}  // namespace

const char* to_string(CueKind k) {
  switch (k) {
    case CueKind::Down: return "down";
    case CueKind::Up: return "up";
    case CueKind::Hold: return "hold";
  }
  return "hold";
}

double estimate_one_rm(double load_kg, int reps) {
  if (load_kg <= 0.0 || reps <= 0) return 0.0;
  return load_kg * (1.0 + reps / 30.0);
}

PlateauGuardrails make_plateau_guardrails(const PlateauConfig& cfg,
                                          const TrainingParameters& current,
                                          double one_rm_kg) {
  PlateauGuardrails g;
  g.one_rm_kg = one_rm_kg > 0.0 ? one_rm_kg : estimate_one_rm(current.volume_kg, current.reps);
  g.weight_kg = round_to_half_kg(cfg.weight_fraction * g.one_rm_kg);
  g.reps = std::max(cfg.min_reps, std::min(cfg.max_reps, current.reps));
  g.sets = std::max(cfg.min_sets, std::min(cfg.max_sets, current.sets));

  // aim for the middle of the time-under-tension band
  double tut = (cfg.min_tut_s + cfg.max_tut_s) / 2.0;
  g.tempo_s = tut / g.reps;
  g.eccentric_s = g.tempo_s * cfg.eccentric_share;
  g.concentric_s = g.tempo_s - g.eccentric_s;
  g.tut_s = g.tempo_s * g.reps;
  return g;
}

std::vector<std::string> guardrail_violations(const PlateauConfig& cfg, const PlateauGuardrails& g) {
  std::vector<std::string> out;
  constexpr double kEps = 1e-9;

  if (g.one_rm_kg <= 0.0) {
    out.push_back("no 1RM available");
  } else {
    double frac = g.weight_kg / g.one_rm_kg;
    // half-kg rounding may nudge the fraction; allow a hair over the band
    if (frac < cfg.min_weight_fraction - 0.01 || frac > cfg.max_weight_fraction + 0.01) {
      std::ostringstream os;
      os << "weight " << frac * 100.0 << "% of 1RM";
      out.push_back(os.str());
    }
  }
  if (g.reps < cfg.min_reps || g.reps > cfg.max_reps) out.push_back("reps out of range");
  if (g.sets < cfg.min_sets || g.sets > cfg.max_sets) out.push_back("sets out of range");
  if (g.tut_s < cfg.min_tut_s - kEps || g.tut_s > cfg.max_tut_s + kEps) out.push_back("time under tension out of range");
  if (g.tempo_s > 0.0 && std::fabs(g.eccentric_s / g.tempo_s - cfg.eccentric_share) > 1e-6) {
    out.push_back("eccentric/concentric split");
  }
  return out;
}

TrainingParameters plateau_parameters(const PlateauGuardrails& g) {
  TrainingParameters p;
  p.sets = g.sets;
  p.reps = g.reps;
  p.volume_kg = g.weight_kg;
  p.tempo_s = g.tempo_s;
  return p;
}

std::vector<HapticCue> plateau_cue_schedule(const PlateauGuardrails& g, int set_index) {
  std::vector<HapticCue> cues;
  cues.reserve(g.reps * 2 + 1);

  for (int r = 0; r < g.reps; ++r) {
    double rep_start = r * g.tempo_s;

    HapticCue down;
    down.kind = CueKind::Down;
    down.pulses = 1;
    down.offset_s = rep_start;
    down.set_index = set_index;
    down.rep_index = r;
    cues.push_back(down);

    HapticCue up;
    up.kind = CueKind::Up;
    up.pulses = 2;
    up.offset_s = rep_start + g.eccentric_s;
    up.set_index = set_index;
    up.rep_index = r;
    cues.push_back(up);
  }

  HapticCue hold;
  hold.kind = CueKind::Hold;
  hold.pulses = 3;
  hold.offset_s = g.reps * g.tempo_s;
  hold.set_index = set_index;
  hold.rep_index = g.reps;
  cues.push_back(hold);
  return cues;
}
