#pragma once
/**
 * @file status.hpp
 * @brief Outcome codes and the Result<T> carrier shared by every ssplink layer.
 *
 * @details
 * Components never throw across their boundaries. Each operation hands back a
 * Status (or a Result<T> holding one) and the caller branches on it explicitly.
 * The snake_case tokens from to_string() are what ends up in log lines and in
 * the JSON summary, so treat them as part of the output contract.
 *
 * Exit codes are stable too: scripts wrapping ssplink-probe key off them.
 *
 * @author Leo
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace ssplink {

enum class Status : uint8_t {
    Ok                    = 0,
    DeviceNotFound        = 1,  ///< no enumerated port matched the target VID/PID
    AccessDenied          = 2,  ///< device path lacks read/write permission
    ConfigurationNotFound = 3,  ///< discovery exhausted every candidate without a reply
    TransportFault        = 4,  ///< open/ioctl/write/read failed on an open channel
    InvalidArgument       = 5   ///< caller input out of range (e.g. oversize payload)
};

/// Stable token for logs: "ok", "device_not_found", ...
const char* to_string(Status s);

/// Process exit status for a final Status (0 only for Ok).
int exit_code(Status s);

/**
 * @brief Status plus an optional value and a short human-readable detail.
 *
 * A Result is "ok" exactly when status == Status::Ok; in that case value is set.
 * A failure may still carry a value holding the work done before it stopped.
 */
template <typename T>
struct Result {
    Status           status{Status::Ok};
    std::optional<T> value;
    std::string      detail;

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(Status s, std::string why = {}) {
        Result r;
        r.status = s;
        r.detail = std::move(why);
        return r;
    }

    static Result failure(Status s, std::string why, T partial) {
        Result r = failure(s, std::move(why));
        r.value = std::move(partial);
        return r;
    }

    bool ok() const { return status == Status::Ok && value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& operator*() const { return *value; }
    T&       operator*()       { return *value; }
    const T* operator->() const { return &*value; }
    T*       operator->()       { return &*value; }
};

} // namespace ssplink
