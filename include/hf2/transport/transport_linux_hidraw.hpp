#pragma once
/**
 * @file transport_linux_hidraw.hpp
 * @brief Linux hidraw transport (header-only wrapper over hidraw_io; non-blocking).
 *
 * Depends on: hidraw_io.hpp (POSIX + linux/hidraw.h). STL only for std::string (Linux-only path).
 */

#if !defined(__linux__)
#  error "transport_linux_hidraw.hpp is Linux-only."
#endif

#include "hf2/transport/transport_base.hpp"
#include "hidraw_io.hpp"
#include <string>

namespace hf2::transport {

class LinuxHidraw : public ITransport {
public:
  explicit LinuxHidraw(const std::string& dev_path = {})
  : dev_path_(dev_path) {}

  ~LinuxHidraw() override { close(); }

  LinuxHidraw(const LinuxHidraw&) = delete;
  LinuxHidraw& operator=(const LinuxHidraw&) = delete;

  bool open(const std::string& dev_path = {}) {
    if (!dev_path.empty()) dev_path_ = dev_path;
    if (dev_path_.empty()) return false;
    close();
    fd_ = hf2::open_hidraw(dev_path_);
    return fd_ >= 0;
  }

  void close() {
    hf2::close_hidraw(fd_);
    fd_ = -1;
  }

  bool is_open() const { return fd_ >= 0; }
  int  fd() const      { return fd_; }

  /// Block up to timeout_ms for the next report; used by one-shot CLIs between polls.
  RxResult wait_report(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) {
    out_len = 0;
    if (fd_ < 0) return RxResult::Error;
    int n = hf2::read_report(fd_, out, cap, timeout_ms);
    if (n > 0) { out_len = static_cast<std::size_t>(n); return RxResult::Ok; }
    return n == 0 ? RxResult::None : RxResult::Error;
  }

  RxResult recv_report(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    return wait_report(out, cap, out_len, 0);
  }

  TxResult send_report(const uint8_t* report, std::size_t len) override {
    if (fd_ < 0 || !report || !len) return TxResult::Error;
    return hf2::write_report(fd_, report, len) ? TxResult::Ok : TxResult::Error;
  }

  const char* name() const override { return "linux-hidraw"; }

private:
  int fd_{-1};
  std::string dev_path_;
};

} // namespace hf2::transport
