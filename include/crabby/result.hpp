#pragma once

#include <crabby/error.hpp>
#include <string>
#include <utility>
#include <variant>

namespace crabby {

// Value of an operation or the CrabbyError that stopped it.
template<typename T>
class Result {
    std::variant<T, CrabbyError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CrabbyError so CRABBY_TRY can return errors across Result<T> types
    Result(CrabbyError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CrabbyError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CrabbyError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CrabbyError& error() & { return std::get<CrabbyError>(data_); }
    const CrabbyError& error() const& { return std::get<CrabbyError>(data_); }
    CrabbyError&& error() && { return std::get<CrabbyError>(std::move(data_)); }

    // Prefixes an error message with "<what>: " naming the package or input
    // it concerns. A value passes through untouched.
    Result context(const std::string& what) && {
        if (auto* e = std::get_if<CrabbyError>(&data_)) {
            e->message = what + ": " + e->message;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CRABBY_TRY(expr) \
    do { \
        auto _crabby_result = (expr); \
        if (_crabby_result.is_err()) return std::move(_crabby_result).error(); \
    } while(0)

} // namespace crabby
