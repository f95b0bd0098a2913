/**
 * @file loopback_transport.hpp
 * @brief In-memory ITransport for tests: what one side sends, the peer receives.
 *
 * Two Loopback endpoints are wired with connect(); each send_report() lands in
 * the peer's inbox. `fail_sends` makes every send return TxResult::Error, and
 * `fail_after` lets the first N sends through before failing.
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <deque>
#include <vector>

#include "hf2/transport/transport_base.hpp"

namespace hf2 {
namespace test {

class Loopback : public transport::ITransport {
public:
  using Report = std::vector<uint8_t>;

  static void connect(Loopback& a, Loopback& b) { a.peer_ = &b; b.peer_ = &a; }

  transport::TxResult send_report(const uint8_t* report, std::size_t len) override {
    if (fail_sends || (fail_after >= 0 && sent_ >= static_cast<size_t>(fail_after))) {
      return transport::TxResult::Error;
    }
    Report r(report, report + len);
    sent.push_back(r);
    ++sent_;
    if (peer_) peer_->inbox.push_back(r);
    return transport::TxResult::Ok;
  }

  transport::RxResult recv_report(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    if (fail_recv) return transport::RxResult::Error;
    if (inbox.empty()) return transport::RxResult::None;
    const Report& r = inbox.front();
    out_len = r.size() < cap ? r.size() : cap;
    std::memcpy(out, r.data(), out_len);
    inbox.pop_front();
    return transport::RxResult::Ok;
  }

  const char* name() const override { return "loopback"; }

  /// Queue a raw report as if the peer had sent it.
  void inject(const uint8_t* report, std::size_t len) { inbox.push_back(Report(report, report + len)); }

  std::deque<Report> inbox;    ///< Waiting to be received by this endpoint
  std::vector<Report> sent;    ///< Everything this endpoint sent
  bool fail_sends{false};
  bool fail_recv{false};
  long fail_after{-1};

private:
  Loopback* peer_{nullptr};
  size_t    sent_{0};
};

} // namespace test
} // namespace hf2
