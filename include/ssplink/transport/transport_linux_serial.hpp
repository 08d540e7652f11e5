#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty serial channel (header-only, termios + poll).
 *
 * Depends on: unistd.h, fcntl.h, termios.h, sys/ioctl.h, poll.h.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "ssplink/transport/transport_base.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace ssplink::transport {

class LinuxSerialChannel : public ISerialChannel {
public:
  LinuxSerialChannel() = default;
  ~LinuxSerialChannel() override { close(); }

  LinuxSerialChannel(const LinuxSerialChannel&) = delete;
  LinuxSerialChannel& operator=(const LinuxSerialChannel&) = delete;

  bool open(const SerialConfig& cfg) override {
    if (fd_ >= 0) return fail("already open");
    if (cfg.path.empty()) return fail("empty device path");

    speed_t sp = 0;
    if (!to_speed(cfg.baud, sp)) return fail("unsupported baud " + std::to_string(cfg.baud));

    fd_ = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) return fail_errno("open " + cfg.path);

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) return fail_close("tcgetattr");
    ::cfmakeraw(&tio);
    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);

    tio.c_cflag &= ~CSIZE;
    switch (cfg.data_bits) {
      case 5: tio.c_cflag |= CS5; break;
      case 6: tio.c_cflag |= CS6; break;
      case 7: tio.c_cflag |= CS7; break;
      default: tio.c_cflag |= CS8; break;
    }
    tio.c_cflag &= ~(PARENB | PARODD);
    if (cfg.parity == Parity::Even) tio.c_cflag |= PARENB;
    if (cfg.parity == Parity::Odd)  tio.c_cflag |= PARENB | PARODD;
    if (cfg.stop_bits == 2) tio.c_cflag |= CSTOPB;
    else                    tio.c_cflag &= ~CSTOPB;

    tio.c_cflag |= CLOCAL | CREAD;   // enable receiver, ignore modem status
    tio.c_cflag &= ~CRTSCTS;         // RTS is ours to drive
    tio.c_cc[VMIN]  = 0;             // poll() does the waiting
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) return fail_close("tcsetattr");
    return true;
  }

  void close() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  bool set_dtr(bool level) override { return set_line(TIOCM_DTR, level, "DTR"); }
  bool set_rts(bool level) override { return set_line(TIOCM_RTS, level, "RTS"); }

  bool flush_input() override  { return flush(TCIFLUSH, "tcflush(in)"); }
  bool flush_output() override { return flush(TCOFLUSH, "tcflush(out)"); }

  TxResult write(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0) { fail("write on closed port"); return TxResult::Error; }
    std::size_t done = 0;
    while (done < len) {
      ssize_t w = ::write(fd_, data + done, len - done);
      if (w > 0) { done += static_cast<std::size_t>(w); continue; }
      if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        pollfd pfd{fd_, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, kWriteStallMs);
        if (pr > 0) continue;
        if (pr == 0) { fail("write stalled"); return done ? TxResult::Short : TxResult::Error; }
      }
      fail_errno("write");
      return TxResult::Error;
    }
    if (::tcdrain(fd_) != 0) { fail_errno("tcdrain"); return TxResult::Error; }
    return TxResult::Ok;
  }

  // Same shape as a pyserial read(max) with a total timeout: returns once max
  // bytes have arrived or the deadline passes.
  RxResult read(std::vector<uint8_t>& out, std::size_t max, int timeout_ms) override {
    out.clear();
    if (fd_ < 0) { fail("read on closed port"); return RxResult::Error; }

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    uint8_t buf[256];

    while (out.size() < max) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
      if (left <= 0) break;

      pollfd pfd{fd_, POLLIN, 0};
      int pr = ::poll(&pfd, 1, static_cast<int>(left));
      if (pr == 0) break;                          // deadline reached
      if (pr < 0) {
        if (errno == EINTR) continue;
        fail_errno("poll");
        return RxResult::Error;
      }

      // Pending bytes are taken before a hangup reported alongside them.
      if (pfd.revents & POLLIN) {
        std::size_t want = max - out.size();
        if (want > sizeof(buf)) want = sizeof(buf);
        ssize_t n = ::read(fd_, buf, want);
        if (n > 0) { out.insert(out.end(), buf, buf + n); continue; }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        if (n < 0) { fail_errno("read"); return RxResult::Error; }
      }
      if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        fail("device error or hangup");
        return RxResult::Error;
      }
    }
    return out.empty() ? RxResult::None : RxResult::Ok;
  }

  std::string last_error() const override { return last_error_; }
  const char* name() const override { return "linux-serial"; }

private:
  static constexpr int kWriteStallMs = 1000;

  static bool to_speed(uint32_t baud, speed_t& sp) {
    switch (baud) {
      case 1200:   sp = B1200; return true;
      case 2400:   sp = B2400; return true;
      case 4800:   sp = B4800; return true;
      case 9600:   sp = B9600; return true;
      case 19200:  sp = B19200; return true;
      case 38400:  sp = B38400; return true;
      case 57600:  sp = B57600; return true;
      case 115200: sp = B115200; return true;
#ifdef B230400
      case 230400: sp = B230400; return true;
#endif
      default:     return false;
    }
  }

  bool set_line(int bit, bool level, const char* label) {
    if (fd_ < 0) return fail(std::string(label) + " on closed port");
    if (::ioctl(fd_, level ? TIOCMBIS : TIOCMBIC, &bit) != 0)
      return fail_errno(std::string("ioctl ") + label);
    return true;
  }

  bool flush(int which, const char* label) {
    if (fd_ < 0) return fail(std::string(label) + " on closed port");
    if (::tcflush(fd_, which) != 0) return fail_errno(label);
    return true;
  }

  bool fail(const std::string& what) {
    last_error_ = what;
    return false;
  }

  bool fail_errno(const std::string& what) {
    const int err = errno;
    last_error_ = what + ": " + std::strerror(err);
    return false;
  }

  bool fail_close(const std::string& what) {
    fail_errno(what);
    close();
    return false;
  }

  int fd_{-1};
  std::string last_error_;
};

} // namespace ssplink::transport
