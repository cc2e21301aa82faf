#pragma once

#include <cratebox/error.hpp>
#include <variant>
#include <functional>

namespace cratebox {

template<typename T>
class Result {
    std::variant<T, CrateboxError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CrateboxError so CRATEBOX_TRY can cross Result<T> types
    Result(CrateboxError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CrateboxError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CrateboxError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CrateboxError& error() & { return std::get<CrateboxError>(data_); }
    const CrateboxError& error() const& { return std::get<CrateboxError>(data_); }
    CrateboxError&& error() && { return std::get<CrateboxError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Attach context to an error, pass a value through untouched
    Result context(const std::string& prefix) && {
        if (is_err()) {
            return Result::err(error().context(prefix));
        }
        return std::move(*this);
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CRATEBOX_TRY(expr) \
    do { \
        auto _cratebox_result = (expr); \
        if (_cratebox_result.is_err()) return std::move(_cratebox_result).error(); \
    } while(0)

} // namespace cratebox
