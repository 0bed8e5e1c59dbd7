#pragma once

#include <bibfmt/error.hpp>
#include <utility>
#include <variant>

namespace bibfmt {

template<typename T>
class Result {
    std::variant<T, BibError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from BibError so BIBFMT_TRY can return errors across Result<T> types
    Result(BibError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(BibError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<BibError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    BibError& error() & { return std::get<BibError>(data_); }
    const BibError& error() const& { return std::get<BibError>(data_); }
    BibError&& error() && { return std::get<BibError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define BIBFMT_TRY(expr) \
    do { \
        auto _bibfmt_result = (expr); \
        if (_bibfmt_result.is_err()) return std::move(_bibfmt_result).error(); \
    } while(0)

} // namespace bibfmt
