#pragma once

namespace memora {

// Outcome of a synchronous store operation.
// NotFound also covers "exists but owned by someone else".
enum class Status { Ok, NotFound, StorageFailure, ValidationFailure };

inline const char* status_to_string(Status s) {
    switch (s) {
        case Status::Ok:                return "ok";
        case Status::NotFound:          return "not found";
        case Status::StorageFailure:    return "storage failure";
        case Status::ValidationFailure: return "validation failure";
    }
    return "unknown";
}

} // namespace memora
