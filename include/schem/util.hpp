// ====================================================================================
// schem - Utility: Status, StatusOr and Span
//
// Every decode layer reports failure through these types. The code set is closed
// so callers can branch on the failure category instead of matching messages.
// ====================================================================================

#ifndef SCHEM_UTIL_H_
#define SCHEM_UTIL_H_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace schem::util {

enum class StatusCode {
    kOk = 0,
    kTransportError = 1,   // byte source or compression envelope unusable
    kTruncatedInput = 2,   // stream ended before a value did
    kSchemaViolation = 3,  // well-framed data that breaks the schematic schema
    kMalformedLength = 4,  // negative or oversized length prefix
};

const char* StatusCodeName(StatusCode code);

class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}
    static Status Ok() { return Status(); }
    static Status TransportError(std::string message) { return Status(StatusCode::kTransportError, std::move(message)); }
    static Status TruncatedInput(std::string message) { return Status(StatusCode::kTruncatedInput, std::move(message)); }
    static Status SchemaViolation(std::string message) { return Status(StatusCode::kSchemaViolation, std::move(message)); }
    static Status MalformedLength(std::string message) { return Status(StatusCode::kMalformedLength, std::move(message)); }
    bool ok() const { return code_ == StatusCode::kOk; }
    const std::string& message() const { return message_; }
    StatusCode code() const { return code_; }
    std::string ToString() const;
private:
    StatusCode code_;
    std::string message_;
};

template <typename T>
class StatusOr {
public:
    StatusOr(Status status) : data_(std::move(status)) {}
    StatusOr(T value) : data_(std::move(value)) {}
    bool ok() const { return std::holds_alternative<T>(data_); }
    Status status() const { return ok() ? Status::Ok() : std::get<Status>(data_); }
    const T& value() const {
        if (!ok()) throw std::runtime_error("Accessing value on error StatusOr: " + std::get<Status>(data_).message());
        return std::get<T>(data_);
    }
    T& value() {
        if (!ok()) throw std::runtime_error("Accessing value on error StatusOr: " + std::get<Status>(data_).message());
        return std::get<T>(data_);
    }
private:
    std::variant<T, Status> data_;
};

template <typename T>
class Span {
 public:
  Span() : data_(nullptr), size_(0) {}
  Span(const std::vector<std::remove_const_t<T>>& vec) : data_(vec.data()), size_(vec.size()) {}
  Span(const T* data, size_t size) : data_(data), size_(size) {}
  const T* data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  const T& operator[](size_t index) const { return data_[index]; }
  const T* begin() const { return data_; }
  const T* end() const { return data_ + size_; }
  Span first(size_t count) const { return Span(data_, count < size_ ? count : size_); }
 private:
  const T* data_;
  size_t size_;
};

using byte_vec = std::vector<uint8_t>;
using ByteSpan = Span<const uint8_t>;

#define SCHEM_CONCAT_IMPL(a, b) a##b
#define SCHEM_CONCAT(a, b) SCHEM_CONCAT_IMPL(a, b)

#define SCHEM_RETURN_IF_ERROR(expr) \
    do { const ::schem::util::Status _schem_status = (expr); if (!_schem_status.ok()) return _schem_status; } while (false)

#define SCHEM_ASSIGN_OR_RETURN_IMPL(tmp, lhs, rexpr) \
    auto tmp = (rexpr); \
    if (!tmp.ok()) return tmp.status(); \
    lhs = std::move(tmp.value())

#define SCHEM_ASSIGN_OR_RETURN(lhs, rexpr) \
    SCHEM_ASSIGN_OR_RETURN_IMPL(SCHEM_CONCAT(_schem_status_or_, __LINE__), lhs, rexpr)

}  // namespace schem::util

#endif  // SCHEM_UTIL_H_
