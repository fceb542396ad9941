#include "SerialDataSource.hpp"
#include "FrameJson.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <istream>
#include <utility>

namespace asio = boost::asio;
using json = nlohmann::json;

SerialDataSource::SerialDataSource(asio::io_context& io, const std::string& device,
                                   unsigned baud)
  : device_(device), port_(io, device) {
  port_.set_option(asio::serial_port_base::baud_rate(baud));
  port_.set_option(asio::serial_port_base::character_size(8));
  port_.set_option(
      asio::serial_port_base::flow_control(
          asio::serial_port_base::flow_control::none
      )
  );
  port_.set_option(
      asio::serial_port_base::parity(
          asio::serial_port_base::parity::none
      )
  );
  port_.set_option(
      asio::serial_port_base::stop_bits(
          asio::serial_port_base::stop_bits::one
      )
  );

  std::cerr << "[serial] opened " << device_ << " @ " << baud << "\n";
}

std::string SerialDataSource::take_line() {
  std::istream is(&buffer_);
  std::string line;
  std::getline(is, line);  // consume one line

  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

bool SerialDataSource::read_line(std::string& line) {
  boost::system::error_code ec;

  // Block until we see a '\n'
  std::size_t bytes_read = asio::read_until(port_, buffer_, '\n', ec);
  if (ec) {
    std::cerr << "[serial] read failed on " << device_ << ": " << ec.message() << "\n";
    return false;
  }
  if (bytes_read == 0) return false;

  line = take_line();
  return true;
}

bool SerialDataSource::parse(const std::string& line, SensorFrame& out) {
  try {
    out = frame_from_json(json::parse(line));
    return true;
  } catch (const json::exception& e) {
    // the bridge occasionally emits boot chatter; skip anything non-JSON
    ++rejected_;
    std::cerr << "[serial] skipped line (" << e.what() << ")\n";
    return false;
  }
}

bool SerialDataSource::next(SensorFrame& out) {
  std::string line;
  for (;;) {
    if (!read_line(line)) return false;
    if (!line.empty() && parse(line, out)) return true;
  }
}

void SerialDataSource::start_async(std::function<void(const SensorFrame&)> on_frame,
                                   std::function<void()> on_closed) {
  on_frame_ = std::move(on_frame);
  on_closed_ = std::move(on_closed);
  read_next();
}

void SerialDataSource::read_next() {
  asio::async_read_until(port_, buffer_, '\n',
    [this](const boost::system::error_code& ec, std::size_t) {
      if (ec) {
        if (ec != asio::error::operation_aborted) {
          std::cerr << "[serial] read failed on " << device_ << ": " << ec.message() << "\n";
        }
        if (on_closed_) on_closed_();
        return;
      }

      std::string line = take_line();
      SensorFrame f{};
      if (!line.empty() && parse(line, f) && on_frame_) on_frame_(f);
      read_next();
    });
}

std::string SerialDataSource::describe() const {
  return "serial:" + device_;
}
