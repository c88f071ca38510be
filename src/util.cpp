#include "schem/util.hpp"

namespace schem::util {

const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::kOk: return "Ok";
        case StatusCode::kTransportError: return "TransportError";
        case StatusCode::kTruncatedInput: return "TruncatedInput";
        case StatusCode::kSchemaViolation: return "SchemaViolation";
        case StatusCode::kMalformedLength: return "MalformedLength";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (ok()) return "Ok";
    return std::string(StatusCodeName(code_)) + ": " + message_;
}

}  // namespace schem::util
