#pragma once

#include <nodule/error.hpp>
#include <variant>

namespace nodule {

template<typename T>
class Result {
    std::variant<T, NoduleError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from NoduleError so NODULE_TRY can return errors across Result<T> types
    Result(NoduleError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(NoduleError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<NoduleError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    NoduleError& error() & { return std::get<NoduleError>(data_); }
    const NoduleError& error() const& { return std::get<NoduleError>(data_); }
    NoduleError&& error() && { return std::get<NoduleError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define NODULE_TRY(expr) \
    do { \
        auto _nodule_result = (expr); \
        if (_nodule_result.is_err()) return std::move(_nodule_result).error(); \
    } while(0)

} // namespace nodule
