// ============================================================================
// status.cpp - implementation for status.hpp
// ============================================================================

#include "ssplink/status.hpp"

namespace ssplink {

const char* to_string(Status s) {
    switch (s) {
        case Status::Ok:                    return "ok";
        case Status::DeviceNotFound:        return "device_not_found";
        case Status::AccessDenied:          return "access_denied";
        case Status::ConfigurationNotFound: return "configuration_not_found";
        case Status::TransportFault:        return "transport_fault";
        case Status::InvalidArgument:       return "invalid_argument";
    }
    return "unknown";
}

int exit_code(Status s) {
    switch (s) {
        case Status::Ok:                    return 0;
        case Status::InvalidArgument:       return 2;
        case Status::DeviceNotFound:        return 3;
        case Status::ConfigurationNotFound: return 4;
        case Status::TransportFault:        return 5;
        case Status::AccessDenied:          return 6;
    }
    return 1;
}

} // namespace ssplink
