#pragma once

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Scribe {

class BadExpectedAccess : public std::logic_error {
public:
    explicit BadExpectedAccess(const char* what) : std::logic_error(what) {}
};

template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }

private:
    E error_;
};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

template<typename T, typename E>
class Expected;

namespace detail {

template<typename U>
struct IsUnexpected : std::false_type {};

template<typename G>
struct IsUnexpected<Unexpected<G>> : std::true_type {};

template<typename U>
struct IsExpected : std::false_type {};

template<typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

} // namespace detail

/**
 * @brief Value-or-error result used for every recoverable failure.
 *
 * Holds either a T or an E. Errors are built with makeUnexpected() so
 * that a value and an error of convertible types can never be confused.
 */
template<typename T, typename E>
class Expected {
public:
    using value_type = T;
    using error_type = E;

    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() : hasValue_(true) {
        new (&value_) T();
    }

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !detail::IsUnexpected<std::decay_t<U>>::value &&
        std::is_constructible_v<T, U&&>>>
    Expected(U&& value) : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                        std::is_nothrow_move_constructible_v<E>)
        : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            destroy();
            moveFrom(std::move(copy));
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                   std::is_nothrow_move_constructible_v<E>) {
        if (this != &other) {
            destroy();
            moveFrom(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    const T& value() const& {
        requireValue();
        return value_;
    }

    T& value() & {
        requireValue();
        return value_;
    }

    T&& value() && {
        requireValue();
        return std::move(value_);
    }

    const E& error() const& {
        requireError();
        return error_;
    }

    E& error() & {
        requireError();
        return error_;
    }

    E&& error() && {
        requireError();
        return std::move(error_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue_ ? value_ : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename U>
    T valueOr(U&& fallback) && {
        return hasValue_ ? std::move(value_) : static_cast<T>(std::forward<U>(fallback));
    }

    // f: const T& -> Expected<U, E>
    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using Result = std::invoke_result_t<F, const T&>;
        static_assert(detail::IsExpected<Result>::value, "andThen callable must return an Expected");
        if (hasValue_) {
            return std::forward<F>(f)(value_);
        }
        return Result(makeUnexpected(error_));
    }

    // f: const T& -> U
    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (!hasValue_) {
            return makeUnexpected(error_);
        }
        if constexpr (std::is_void_v<U>) {
            std::forward<F>(f)(value_);
            return Expected<void, E>();
        } else {
            return Expected<U, E>(std::forward<F>(f)(value_));
        }
    }

    // f: const E& -> G
    template<typename F>
    auto transformError(F&& f) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (hasValue_) {
            return Expected<T, G>(value_);
        }
        return makeUnexpected(std::forward<F>(f)(error_));
    }

private:
    void destroy() noexcept {
        if (hasValue_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    void moveFrom(Expected&& other) {
        hasValue_ = other.hasValue_;
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    void requireValue() const {
        if (!hasValue_) {
            throw BadExpectedAccess("Expected holds an error, not a value");
        }
    }

    void requireError() const {
        if (hasValue_) {
            throw BadExpectedAccess("Expected holds a value, not an error");
        }
    }

    bool hasValue_;
    union {
        T value_;
        E error_;
    };
};

// Success carries no payload.
template<typename E>
class Expected<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Expected() noexcept : hasValue_(true) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
        : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            destroy();
            moveFrom(std::move(copy));
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>) {
        if (this != &other) {
            destroy();
            moveFrom(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    void value() const {
        if (!hasValue_) {
            throw BadExpectedAccess("Expected holds an error, not a value");
        }
    }

    const E& error() const& {
        requireError();
        return error_;
    }

    E& error() & {
        requireError();
        return error_;
    }

    E&& error() && {
        requireError();
        return std::move(error_);
    }

private:
    void destroy() noexcept {
        if (!hasValue_) {
            error_.~E();
        }
    }

    void moveFrom(Expected&& other) {
        hasValue_ = other.hasValue_;
        if (!hasValue_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    void requireError() const {
        if (hasValue_) {
            throw BadExpectedAccess("Expected holds a value, not an error");
        }
    }

    bool hasValue_;
    union {
        E error_;
    };
};

} // namespace Scribe
