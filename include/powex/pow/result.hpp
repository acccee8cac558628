/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <variant>

namespace powex::pow {

enum class Error {
    InvalidDifficulty,   // difficulty outside [0, 64]
    InvalidThreadCount,  // thread_count outside [1, 64]
    Exhausted,           // ceiling reached without a satisfying nonce
    Internal,            // digest backend or thread start failure
};

// Stable, human readable reason for an error
std::string_view describe(Error error);

/**
 * Either a value or a typed Error. Returned by every engine operation that
 * can fail; nothing is thrown across the engine boundary.
 */
template <typename T>
class Result {
public:
    static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result failure(Error error) { return Result(std::in_place_index<1>, error); }

    bool ok() const { return state_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("Result::value() called on a failure");
        }
        return std::get<0>(state_);
    }

    Error error() const {
        if (ok()) {
            throw std::logic_error("Result::error() called on a success");
        }
        return std::get<1>(state_);
    }

    std::string_view reason() const { return ok() ? std::string_view{} : describe(error()); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : state_(tag, std::forward<U>(v)) {}

    std::variant<T, Error> state_;
};

} // namespace powex::pow
