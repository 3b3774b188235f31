#pragma once

#include <guid/error.hpp>
#include <variant>
#include <functional>

namespace guid {

template<typename T>
class Result {
    std::variant<T, GuidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from GuidError so GUID_TRY can return errors across Result<T> types
    Result(GuidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(GuidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<GuidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    GuidError& error() & { return std::get<GuidError>(data_); }
    const GuidError& error() const& { return std::get<GuidError>(data_); }
    GuidError&& error() && { return std::get<GuidError>(std::move(data_)); }

    // Value on success, `fallback` otherwise
    T value_or(T fallback) const {
        if (is_ok()) return std::get<T>(data_);
        return fallback;
    }

    explicit operator bool() const { return is_ok(); }

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

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define GUID_TRY(expr) \
    do { \
        auto _guid_result = (expr); \
        if (_guid_result.is_err()) return std::move(_guid_result).error(); \
    } while(0)

} // namespace guid
