#pragma once
#include "CalibrationState.hpp"

#include <boost/optional.hpp>

#include <map>
#include <mutex>
#include <string>
#include <tuple>

struct ProgramKey {
  std::string user;
  std::string exercise;
  int week = 0;

  bool operator<(const ProgramKey& o) const {
    return std::tie(user, exercise, week) < std::tie(o.user, o.exercise, o.week);
  }
};

// Key-value access to calibration state keyed by (user, exercise, week).
// How it is actually stored is up to the implementation.
class IProgramStore {
public:
  virtual ~IProgramStore() = default;

  virtual boost::optional<CalibrationState> load(const ProgramKey& key) const = 0;
  virtual void save(const ProgramKey& key, const CalibrationState& state) = 0;

  // state for the highest stored week of this exercise
  virtual boost::optional<CalibrationState> latest(const std::string& user,
                                                   const std::string& exercise) const = 0;
};

class InMemoryProgramStore : public IProgramStore {
public:
  boost::optional<CalibrationState> load(const ProgramKey& key) const override;
  void save(const ProgramKey& key, const CalibrationState& state) override;
  boost::optional<CalibrationState> latest(const std::string& user,
                                           const std::string& exercise) const override;

  size_t size() const;

protected:
  mutable std::mutex mu_;
  std::map<ProgramKey, CalibrationState> entries_;
};

// In-memory store mirrored to a JSON file after every save.
class JsonFileProgramStore : public InMemoryProgramStore {
public:
  explicit JsonFileProgramStore(const std::string& path);

  void save(const ProgramKey& key, const CalibrationState& state) override;

private:
  void flush() const;

  std::string path_;
};
