#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace dropline {

/**
 * ErrorKind - Classification of engine failures.
 *
 * The first six kinds are the ones a session can end with; the rest
 * describe failures outside a session (discovery, configuration, caller
 * mistakes).
 */
enum class ErrorKind {
    Other = 0,
    Malformed,
    HandshakeFailed,
    SessionConflict,
    IntegrityFailure,
    Timeout,
    IOFailure,
    Rejected,
    Cancelled,
    DiscoveryFailed,
    InvalidArgument
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Other: return "Other";
        case ErrorKind::Malformed: return "Malformed";
        case ErrorKind::HandshakeFailed: return "HandshakeFailed";
        case ErrorKind::SessionConflict: return "SessionConflict";
        case ErrorKind::IntegrityFailure: return "IntegrityFailure";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::Rejected: return "Rejected";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::DiscoveryFailed: return "DiscoveryFailed";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Other";
}

/**
 * Error type for Result - a kind plus a human-readable message.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Other};

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Other)
        : message(std::move(msg)), kind(k) {}
    Error(ErrorKind k, std::string msg) : message(std::move(msg)), kind(k) {}

    bool operator==(const Error& other) const {
        return message == other.message && kind == other.kind;
    }

    /**
     * "Kind: message", for logs and CLI output.
     */
    [[nodiscard]] std::string describe() const {
        std::string out(to_string(kind));
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        return out;
    }
};

/**
 * Result<T, E> - A functional error handling type.
 *
 * Represents either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<Frame> parse(std::span<const uint8_t> bytes) {
 *       if (bytes.empty()) return Result<Frame>::err(Error{ErrorKind::Malformed, "empty"});
 *       ...
 *   }
 *
 *   auto sealed = parse(bytes).and_then([&](Frame f) { return channel.seal(f); });
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
     * Get the success value, throwing if this is an error.
     * Use sparingly - prefer is_ok() checks or and_then.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

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
     * Transform the success value; errors pass through unchanged.
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * Chain an operation that itself returns a Result.
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (!is_err()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).describe());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T == E still works.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.describe());
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

using Status = Result<void, Error>;

} // namespace dropline
