#include "errors.hpp"

namespace opcualogger {

const char* severityName(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Transient: return "Transient";
        case ErrorSeverity::Fatal: return "Fatal";
        case ErrorSeverity::DepthExceeded: return "DepthExceeded";
        case ErrorSeverity::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

} // namespace opcualogger
