#pragma once

#include <knit/error.hpp>
#include <variant>
#include <utility>

namespace knit {

template<typename T>
class Result {
    std::variant<T, KnitError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from KnitError so KNIT_TRY can forward errors across Result<T> types
    Result(KnitError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(KnitError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<KnitError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    KnitError& error() & { return std::get<KnitError>(data_); }
    const KnitError& error() const& { return std::get<KnitError>(data_); }
    KnitError&& error() && { return std::get<KnitError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define KNIT_TRY(expr) \
    do { \
        auto _knit_result = (expr); \
        if (_knit_result.is_err()) return std::move(_knit_result).error(); \
    } while(0)

} // namespace knit
