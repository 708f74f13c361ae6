#pragma once

#include <hiecore/error.hpp>
#include <variant>
#include <utility>

namespace hiecore {

// Value-or-error return type used across the public API.
template<typename T>
class Result {
    std::variant<T, HieError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from HieError so HIECORE_TRY can forward errors between Result types
    Result(HieError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(HieError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<HieError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    HieError& error() & { return std::get<HieError>(data_); }
    const HieError& error() const& { return std::get<HieError>(data_); }
    HieError&& error() && { return std::get<HieError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) return Result<U>::ok(f(value()));
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        using R = decltype(f(std::declval<T&>()));
        if (is_ok()) return f(value());
        return R::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define HIECORE_TRY(expr) \
    do { \
        auto _hiecore_result = (expr); \
        if (_hiecore_result.is_err()) return std::move(_hiecore_result).error(); \
    } while(0)

} // namespace hiecore
