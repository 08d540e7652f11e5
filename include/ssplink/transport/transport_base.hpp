#pragma once
/**
 * @file transport_base.hpp
 * @brief Serial channel contract the discovery engine and sequencer drive.
 *
 * Header-only. The Linux termios implementation lives in
 * transport_linux_serial.hpp; tests substitute a scripted fake.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ssplink::transport {

enum class TxResult : uint8_t { Ok=0, Short=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

enum class Parity : uint8_t { None=0, Even=1, Odd=2 };

/// Link parameters for one open() call. Defaults are 8N1 with a 2 s read timeout.
struct SerialConfig {
  std::string path;          // e.g. /dev/ttyUSB0
  uint32_t baud{9600};
  uint8_t  data_bits{8};
  Parity   parity{Parity::None};
  uint8_t  stop_bits{1};
  int      read_timeout_ms{2000};
};

/**
 * @brief Abstract serial channel.
 *
 * Contract:
 *  - open(cfg) acquires the port; a second open() without close() is an error.
 *  - close() is idempotent.
 *  - set_dtr()/set_rts() drive the modem control lines; false on ioctl failure.
 *  - read(out, max, timeout_ms) clears out, then collects bytes until max
 *    bytes arrived or timeout_ms elapsed. None with an empty out is a clean
 *    timeout; Error means the port failed.
 *  - last_error() describes the most recent failure for logs.
 */
class ISerialChannel {
public:
  virtual ~ISerialChannel() = default;
  virtual bool        open(const SerialConfig& cfg) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual bool        set_dtr(bool level) = 0;
  virtual bool        set_rts(bool level) = 0;
  virtual bool        flush_input() = 0;
  virtual bool        flush_output() = 0;
  virtual TxResult    write(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    read(std::vector<uint8_t>& out, std::size_t max, int timeout_ms) = 0;
  virtual std::string last_error() const = 0;
  virtual const char* name() const = 0;
};

/// Closes the channel when the scope ends, whichever way it ends.
class ChannelGuard {
public:
  explicit ChannelGuard(ISerialChannel& ch) : ch_(ch) {}
  ~ChannelGuard() { ch_.close(); }
  ChannelGuard(const ChannelGuard&) = delete;
  ChannelGuard& operator=(const ChannelGuard&) = delete;

private:
  ISerialChannel& ch_;
};

} // namespace ssplink::transport
