#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace tuid {

/**
 * ErrorKind - The failure modes of the library.
 *
 * Only the validating conversion from an untyped Uuid can fail, and it can
 * only fail one way.
 */
enum class ErrorKind : std::uint8_t {
    WrongVersion,
};

/**
 * Error - A rejected conversion, carrying the version the target Scheme
 * declares and the version nibble actually found in the bits.
 */
struct Error {
    ErrorKind kind{ErrorKind::WrongVersion};
    std::uint8_t expected{0};
    std::uint8_t actual{0};

    [[nodiscard]] static constexpr Error wrong_version(std::uint8_t expected,
                                                       std::uint8_t actual) noexcept {
        return Error{ErrorKind::WrongVersion, expected, actual};
    }

    [[nodiscard]] std::string message() const {
        return "wrong UUID version: expected " + std::to_string(expected) +
               ", found " + std::to_string(actual);
    }

    bool operator==(const Error&) const = default;
};

/**
 * Result<T, E> - Either a value (Ok) or an error (Err).
 *
 * Usage:
 *   auto id = UserId::from_untyped(raw);
 *   if (id.is_err()) {
 *       log(id.unwrap_err().message());
 *   }
 *
 *   auto text = UserId::from_untyped(raw)
 *       .map([](const UserId& u) { return u.to_string(); })
 *       .value_or("invalid");
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing std::runtime_error if this is an error.
     */
    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) {
            throw_on_error();
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) {
            throw_on_error();
        }
        return std::get<0>(std::move(data_));
    }

    /**
     * Get the error, throwing if this is a success.
     */
    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * map_err : Result<T, E> -> (E -> G) -> Result<T, G>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, G>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, G>::ok(std::get<0>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    [[noreturn]] void throw_on_error() const {
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Indexed access keeps Result<T, T> usable (e.g. Result<QString, QString>).
    std::variant<T, E> data_;
};

} // namespace tuid
