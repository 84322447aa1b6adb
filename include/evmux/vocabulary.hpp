/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types for evmux: ErrorCode, expected, FixedFunction,
 *        ScopeGuard.
 *
 * All types are stack-allocated; nothing here touches the heap.
 */

#ifndef EVMUX_VOCABULARY_HPP_
#define EVMUX_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define EVMUX_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define EVMUX_THROW(ex)           \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

// Assertion macro (no-op unless the build provides one)
#ifndef EVMUX_ASSERT
#define EVMUX_ASSERT(cond) ((void)(cond))
#endif

namespace evmux {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kWouldBlock = 1,              // Non-blocking call found nothing to do
  kConnectionClosed = 2,        // Peer performed an orderly shutdown
  kConnectionReset = 3,         // Reset / broken pipe class failure
  kSocketError = 4,             // Any other socket failure
  kDuplicateRegistration = 5,
  kNotRegistered = 6,
  kPollError = 7,               // Readiness primitive failed
  kInvalidState = 8,
  kMaxConnectionsExceeded = 9,
  kInternalError = 255
};

inline const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kWouldBlock:
      return "would_block";
    case ErrorCode::kConnectionClosed:
      return "connection_closed";
    case ErrorCode::kConnectionReset:
      return "connection_reset";
    case ErrorCode::kSocketError:
      return "socket_error";
    case ErrorCode::kDuplicateRegistration:
      return "duplicate_registration";
    case ErrorCode::kNotRegistered:
      return "not_registered";
    case ErrorCode::kPollError:
      return "poll_error";
    case ErrorCode::kInvalidState:
      return "invalid_state";
    case ErrorCode::kMaxConnectionsExceeded:
      return "max_connections_exceeded";
    case ErrorCode::kInternalError:
      return "internal_error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Construct through success() and error(). Move-only value types are
 * supported as long as the copying members are not used.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected e;
    e.emplace(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.emplace(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept : err_(other.err_) {
    if (other.has_value_) {
      emplace(other.value());
    }
  }

  expected(expected&& other) noexcept : err_(other.err_) {
    if (other.has_value_) {
      emplace(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      destroy();
      err_ = other.err_;
      if (other.has_value_) {
        emplace(other.value());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      destroy();
      err_ = other.err_;
      if (other.has_value_) {
        emplace(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    EVMUX_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    EVMUX_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    EVMUX_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const noexcept { return has_value_ ? value() : fallback; }

 private:
  expected() noexcept = default;

  template <typename U>
  void emplace(U&& val) noexcept {
    ::new (&storage_) V(static_cast<U&&>(val));
    has_value_ = true;
  }

  void destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    EVMUX_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept = default;

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// FixedFunction<Sig, BufferSize> - SBO callback
// ============================================================================

template <typename Signature, size_t BufferSize = 2 * sizeof(void*)>
class FixedFunction;

/**
 * @brief Fixed-size callable wrapper; the callable lives in an inline buffer.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  FixedFunction(std::nullptr_t) noexcept {}

  template <typename F, typename = typename std::enable_if<
                            !std::is_same<typename std::decay<F>::type, FixedFunction>::value &&
                            !std::is_same<typename std::decay<F>::type, std::nullptr_t>::value>::type>
  FixedFunction(F&& f) noexcept {  // NOLINT
    using Decay = typename std::decay<F>::type;
    static_assert(sizeof(Decay) <= BufferSize, "Callable too large for FixedFunction buffer");
    static_assert(alignof(Decay) <= alignof(Storage), "Callable alignment exceeds buffer alignment");
    ::new (&storage_) Decay(static_cast<F&&>(f));
    invoker_ = [](const Storage& s, Args... args) -> Ret {
      return (*reinterpret_cast<const Decay*>(&s))(static_cast<Args&&>(args)...);
    };
    destroyer_ = [](Storage& s) { reinterpret_cast<Decay*>(&s)->~Decay(); };
  }

  FixedFunction(FixedFunction&& other) noexcept { take(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      reset();
      take(other);
    }
    return *this;
  }

  FixedFunction& operator=(std::nullptr_t) noexcept {
    reset();
    return *this;
  }

  ~FixedFunction() { reset(); }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  Ret operator()(Args... args) const {
    EVMUX_ASSERT(invoker_);
    return invoker_(storage_, static_cast<Args&&>(args)...);
  }

  explicit operator bool() const noexcept { return invoker_ != nullptr; }

 private:
  using Storage = typename std::aligned_storage<BufferSize, alignof(void*)>::type;
  using Invoker = Ret (*)(const Storage&, Args...);
  using Destroyer = void (*)(Storage&);

  // Only trivially relocatable callables are stored (captured pointers and references).
  void take(FixedFunction& other) noexcept {
    invoker_ = other.invoker_;
    destroyer_ = other.destroyer_;
    if (other.invoker_) {
      std::memcpy(&storage_, &other.storage_, BufferSize);
      other.invoker_ = nullptr;
      other.destroyer_ = nullptr;
    }
  }

  void reset() noexcept {
    if (destroyer_) {
      destroyer_(storage_);
    }
    invoker_ = nullptr;
    destroyer_ = nullptr;
  }

  Storage storage_{};
  Invoker invoker_ = nullptr;
  Destroyer destroyer_ = nullptr;
};

// ============================================================================
// ScopeGuard - RAII cleanup guard
// ============================================================================

/**
 * @brief Runs a cleanup callback on scope exit unless released.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(FixedFunction<void()> cleanup) noexcept
      : cleanup_(static_cast<FixedFunction<void()>&&>(cleanup)) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  FixedFunction<void()> cleanup_;
  bool active_{true};
};

}  // namespace evmux

#endif  // EVMUX_VOCABULARY_HPP_
