#pragma once
#include "IDataSource.hpp"
#include <string>
#include <vector>

// Replays a recorded session: a JSON array of frame objects.
class JsonDataSource : public IDataSource {
public:
  explicit JsonDataSource(const std::string& path);
  bool next(SensorFrame& out) override;
  std::string describe() const override;

  size_t size() const { return frames_.size(); }

private:
  std::string path_;
  std::vector<SensorFrame> frames_;
  size_t idx_ = 0;
};
