#pragma once

#include <crock/error.hpp>
#include <variant>
#include <utility>

namespace crock {

template<typename T>
class Result {
    std::variant<T, CrockError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CrockError so CROCK_TRY can return errors across Result<T> types
    Result(CrockError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CrockError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CrockError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CrockError& error() & { return std::get<CrockError>(data_); }
    const CrockError& error() const& { return std::get<CrockError>(data_); }
    CrockError&& error() && { return std::get<CrockError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const {
        if (is_ok()) return value();
        return fallback;
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    // Prefix the error message with where the value came from, e.g. a TOML key
    Result with_context(const std::string& where) && {
        if (is_err()) {
            auto& e = std::get<CrockError>(data_);
            e.message = where + ": " + e.message;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CROCK_TRY(expr) \
    do { \
        auto _crock_result = (expr); \
        if (_crock_result.is_err()) return std::move(_crock_result).error(); \
    } while(0)

} // namespace crock
