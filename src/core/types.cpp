#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                         return "none";
        case ErrorKind::Authentication:               return "authentication";
        case ErrorKind::Unreachable:                  return "unreachable";
        case ErrorKind::Protocol:                     return "protocol";
        case ErrorKind::NotConnected:                 return "not-connected";
        case ErrorKind::RemoteIO:                     return "remote-io";
        case ErrorKind::SessionClosed:                return "session-closed";
        case ErrorKind::MissingDependency:            return "missing-dependency";
        case ErrorKind::UnsupportedOperation:         return "unsupported-operation";
        case ErrorKind::CrossSessionPasteUnsupported: return "cross-session-paste-unsupported";
        case ErrorKind::Cancelled:                    return "cancelled";
        case ErrorKind::Other:                        return "error";
    }
    return "error";
}
