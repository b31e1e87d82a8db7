/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared across crucible modules.
 *
 * - expected<V, E>: value-or-error return type (no exceptions)
 * - optional<T>: nullable value wrapper
 * - NewType<T, Tag>: strong typedef for identifiers
 * - Common error enums (ConfigError, TimerError)
 *
 * Header-only, C++17.
 */

#ifndef CRUCIBLE_VOCABULARY_HPP_
#define CRUCIBLE_VOCABULARY_HPP_

#include "crucible/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace crucible {

// ============================================================================
// Common Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

enum class TimerError : uint8_t {
  kSlotsFull = 0,
  kInvalidPeriod,
  kNotRunning,
  kAlreadyRunning,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the static factories success() / error(). Accessing
 * value() on an error (or get_error() on a value) is a programming error
 * and is caught by CRUCIBLE_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(kValueTag, v); }
  static expected success(V&& v) { return expected(kValueTag, std::move(v)); }
  static expected error(E e) noexcept { return expected(kErrorTag, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    CRUCIBLE_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& noexcept {
    CRUCIBLE_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && noexcept {
    CRUCIBLE_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    CRUCIBLE_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    ::new (&storage_.value) V(std::forward<U>(v));
  }
  expected(ErrorTag, E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/** @brief Specialization for operations that return no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    CRUCIBLE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_.value) T(v);
  }
  optional(T&& v) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (&storage_.value) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) ::new (&storage_.value) T(std::move(other.storage_.value));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) ::new (&storage_.value) T(other.storage_.value);
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) T(std::move(other.storage_.value));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    CRUCIBLE_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const noexcept {
    CRUCIBLE_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept : dummy(0) {}
    ~Storage() {}
    char dummy;
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: distinct types for otherwise identical identifiers.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr explicit NewType(T v) noexcept : value_(v) {}
  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& o) const noexcept {
    return value_ == o.value_;
  }
  constexpr bool operator!=(const NewType& o) const noexcept {
    return value_ != o.value_;
  }
  constexpr bool operator<(const NewType& o) const noexcept {
    return value_ < o.value_;
  }

 private:
  T value_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

}  // namespace crucible

#endif  // CRUCIBLE_VOCABULARY_HPP_
