#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace slate {

/**
 * Categories of failure a site build can run into.
 *
 * The first four are "reportable": the run-wide strict flag decides whether
 * they are logged as warnings or abort the build. The rest are always fatal.
 */
enum class ErrorKind {
    MissingIndex,
    PathNotUnderRoot,
    TraversalEntry,
    DanglingLink,
    Io,
    Usage,
    Template,
};

[[nodiscard]] constexpr bool is_reportable(ErrorKind kind) noexcept {
    return kind == ErrorKind::MissingIndex || kind == ErrorKind::PathNotUnderRoot ||
           kind == ErrorKind::TraversalEntry || kind == ErrorKind::DanglingLink;
}

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MissingIndex: return "missing-index";
        case ErrorKind::PathNotUnderRoot: return "path-not-under-root";
        case ErrorKind::TraversalEntry: return "traversal-entry";
        case ErrorKind::DanglingLink: return "dangling-link";
        case ErrorKind::Io: return "io";
        case ErrorKind::Usage: return "usage";
        case ErrorKind::Template: return "template";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure kind, a human readable message and the
 * filesystem path involved (empty when there is none).
 */
struct Error {
    ErrorKind kind{ErrorKind::Io};
    std::string message;
    std::string path;

    Error() = default;
    Error(ErrorKind k, std::string msg, std::string p = {})
        : kind(k), message(std::move(msg)), path(std::move(p)) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message && path == other.path;
    }
};

/**
 * Result<T, E> - either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<std::string> read(const std::string& path) {
 *       if (path.empty()) return Result<std::string>::err(Error{ErrorKind::Io, "no path"});
 *       return Result<std::string>::ok(load(path));
 *   }
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
     * Use sparingly - prefer map/and_then for safe access.
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

    /**
     * Transform the success value; errors propagate unchanged.
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
     * Chain an operation that itself may fail.
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    std::variant<T, E> data_;
};

/**
 * Specialization for operations that either succeed with no value or fail.
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
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
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

using Status = Result<void, Error>;

} // namespace slate
