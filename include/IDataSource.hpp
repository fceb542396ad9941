#pragma once
#include "SensorFrame.hpp"

#include <string>

class IDataSource {
public:
  virtual ~IDataSource() = default;

  // false once the source is exhausted (replay) or the link dropped
  virtual bool next(SensorFrame& out) = 0;

  // short label for log lines ("replay:session.json", "serial:/dev/ttyUSB0")
  virtual std::string describe() const = 0;
};
