#pragma once

#include <string>
#include <variant>
#include <optional>
#include <utility>

namespace skipdex {

enum class StatusCode {
    kOk, kNotFound, kInvalidArgument
};

class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    
    [[nodiscard]] bool ok() const { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool IsNotFound() const { return code_ == StatusCode::kNotFound; }
    [[nodiscard]] bool IsInvalidArgument() const { return code_ == StatusCode::kInvalidArgument; }
    [[nodiscard]] StatusCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    
    [[nodiscard]] std::string ToString() const {
        const char* names[] = {"OK", "NotFound", "InvalidArgument"};
        std::string result = names[static_cast<int>(code_)];
        if (!message_.empty()) result += ": " + message_;
        return result;
    }
    
    explicit operator bool() const { return ok(); }
    
private:
    Status(StatusCode code, std::string msg) : code_(code), message_(std::move(msg)) {}
    StatusCode code_;
    std::string message_;
};

// Result<T> - value or error Status, like std::expected
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Status status) : data_(std::move(status)) {
        if (std::get<Status>(data_).ok()) 
            data_ = Status::InvalidArgument("Result with Ok but no value");
    }
    
    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }
    
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }
    [[nodiscard]] const T* operator->() const { return &std::get<T>(data_); }
    [[nodiscard]] T* operator->() { return &std::get<T>(data_); }
    [[nodiscard]] const T& operator*() const& { return std::get<T>(data_); }
    [[nodiscard]] T& operator*() & { return std::get<T>(data_); }
    
    [[nodiscard]] Status status() const {
        return ok() ? Status::Ok() : std::get<Status>(data_);
    }
    
private:
    std::variant<T, Status> data_;
};

#define SKIPDEX_RETURN_IF_ERROR(expr) \
    do { auto _s = (expr); if (!_s.ok()) return _s; } while (0)

// Declares var from a Result<T>, or returns its error Status
#define SKIPDEX_ASSIGN_OR_RETURN(var, expr) \
    auto _r_##var = (expr); \
    if (!_r_##var.ok()) return _r_##var.status(); \
    auto var = std::move(_r_##var).value()

} // namespace skipdex
