#pragma once
#include "IDataSource.hpp"

#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>

#include <functional>
#include <string>

// Live frames from the wearable bridge: one JSON object per '\n'-terminated
// line on a serial port (see FrameJson.hpp for the shape).
class SerialDataSource : public IDataSource {
public:
  SerialDataSource(boost::asio::io_context& io, const std::string& device,
                   unsigned baud = 115200);

  // blocking read, one frame per call
  bool next(SensorFrame& out) override;
  std::string describe() const override;

  // Read frames on the io_context instead: `on_frame` per parsed line,
  // `on_closed` once when the port fails or is closed. Handlers run on
  // whichever thread runs the io_context.
  void start_async(std::function<void(const SensorFrame&)> on_frame,
                   std::function<void()> on_closed);

  // lines that failed to parse since the port was opened
  int rejected_lines() const { return rejected_; }

private:
  bool read_line(std::string& line);
  std::string take_line();
  bool parse(const std::string& line, SensorFrame& out);
  void read_next();

  std::string device_;
  boost::asio::serial_port port_;
  boost::asio::streambuf buffer_;
  int rejected_ = 0;

  std::function<void(const SensorFrame&)> on_frame_;
  std::function<void()> on_closed_;
};
