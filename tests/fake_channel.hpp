#pragma once
// Scripted ISerialChannel for discovery/sequencer/session tests.
// Every open/close/line change/write/read is recorded so tests can assert on
// exact traffic. Replies come from `responder`, called with the current line
// state and the last packet written.

#include "ssplink/frame.hpp"
#include "ssplink/transport/transport_base.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ssplink::test {

struct WriteRecord {
  uint32_t baud{0};
  bool dtr{false};
  bool rts{false};
  std::vector<uint8_t> bytes;
};

class FakeChannel : public transport::ISerialChannel {
public:
  using Responder = std::function<std::vector<uint8_t>(const FakeChannel&,
                                                       const std::vector<uint8_t>&)>;
  using OpenPolicy = std::function<bool(const transport::SerialConfig&)>;

  Responder  responder;              // empty: device never answers
  OpenPolicy open_policy;            // empty: every open succeeds
  int        fail_read_at{0};        // 1-based read index that returns Error; 0 = never
  int        fail_write_at{0};       // 1-based write index that returns Error; 0 = never

  std::vector<transport::SerialConfig> opens;
  std::vector<WriteRecord> writes;
  int  closes{0};
  int  reads{0};
  int  flushes{0};
  bool open_while_open{false};       // set if open() ever raced an unclosed port

  bool open(const transport::SerialConfig& cfg) override {
    if (open_) { open_while_open = true; err_ = "already open"; return false; }
    opens.push_back(cfg);
    if (open_policy && !open_policy(cfg)) { err_ = "device busy"; return false; }
    open_ = true;
    baud_ = cfg.baud;
    dtr_ = rts_ = false;
    return true;
  }

  void close() override {
    if (open_) { open_ = false; ++closes; }
  }

  bool is_open() const override { return open_; }
  bool set_dtr(bool level) override { dtr_ = level; return open_; }
  bool set_rts(bool level) override { rts_ = level; return open_; }
  bool flush_input() override  { ++flushes; return open_; }
  bool flush_output() override { ++flushes; return open_; }

  transport::TxResult write(const uint8_t* data, std::size_t len) override {
    if (!open_) { err_ = "write on closed port"; return transport::TxResult::Error; }
    writes.push_back({baud_, dtr_, rts_, std::vector<uint8_t>(data, data + len)});
    if (fail_write_at && static_cast<int>(writes.size()) == fail_write_at) {
      err_ = "EIO";
      return transport::TxResult::Error;
    }
    return transport::TxResult::Ok;
  }

  transport::RxResult read(std::vector<uint8_t>& out, std::size_t max, int) override {
    out.clear();
    ++reads;
    if (!open_) { err_ = "read on closed port"; return transport::RxResult::Error; }
    if (fail_read_at && reads == fail_read_at) { err_ = "EIO"; return transport::RxResult::Error; }
    if (responder && !writes.empty()) out = responder(*this, writes.back().bytes);
    if (out.size() > max) out.resize(max);
    return out.empty() ? transport::RxResult::None : transport::RxResult::Ok;
  }

  std::string last_error() const override { return err_; }
  const char* name() const override { return "fake"; }

  uint32_t baud() const { return baud_; }
  bool dtr() const { return dtr_; }
  bool rts() const { return rts_; }

private:
  bool open_{false};
  uint32_t baud_{0};
  bool dtr_{false};
  bool rts_{false};
  std::string err_;
};

/// A well-formed OK (0xF0) reply echoing the request's sequence byte.
inline std::vector<uint8_t> ok_reply(const std::vector<uint8_t>& request) {
  const uint8_t seq = request.size() > 1 ? request[1] : SEQ_FLAG;
  auto p = build_packet(0xF0, seq);
  return std::vector<uint8_t>(p->begin(), p->end());
}

/// Opcode byte of a packet we wrote.
inline uint8_t opcode_of(const std::vector<uint8_t>& pkt) {
  return pkt.size() > 3 ? pkt[3] : 0;
}

} // namespace ssplink::test
