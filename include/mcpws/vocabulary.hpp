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
 * @brief Vocabulary types for mcpws: ErrorCode, expected, FixedVector,
 *        FixedFunction, ScopeGuard and the MCPWS_THROW macro.
 *
 * Containers on the hot path are stack-allocated with fixed capacity; the
 * JSON payloads themselves live in Json::Value and std::string.
 */

#ifndef MCPWS_VOCABULARY_HPP_
#define MCPWS_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

#ifndef MCPWS_ASSERT
#define MCPWS_ASSERT(cond) ((void)(cond))
#endif

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define MCPWS_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define MCPWS_THROW(ex)           \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace mcpws {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kBufferFull = 1,
  kHandshakeFailed = 2,
  kAuthFailed = 3,
  kProtocolError = 4,
  kMessageTooLarge = 5,
  kConnectionClosed = 6,
  kInvalidState = 7,
  kSocketError = 8,
  kTimeout = 9,
  kMaxConnectionsExceeded = 10,
  kConfigError = 11,
  kIoError = 12,
  kInternalError = 255
};

inline const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kBufferFull: return "buffer full";
    case ErrorCode::kHandshakeFailed: return "handshake failed";
    case ErrorCode::kAuthFailed: return "authentication failed";
    case ErrorCode::kProtocolError: return "protocol error";
    case ErrorCode::kMessageTooLarge: return "message too large";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kSocketError: return "socket error";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kMaxConnectionsExceeded: return "max connections exceeded";
    case ErrorCode::kConfigError: return "configuration error";
    case ErrorCode::kIoError: return "I/O error";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - error-or-value result
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Constructed only through success() and error(). E may be a plain code
 * or a richer struct such as RpcError.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) {
    expected e;
    e.err_ = static_cast<E&&>(err);
    return e;
  }

  expected(const expected& other) : err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected(expected&& other) noexcept
      : err_(static_cast<E&&>(other.err_)), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected other) noexcept {
    destroy();
    has_value_ = other.has_value_;
    err_ = static_cast<E&&>(other.err_);
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    MCPWS_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    MCPWS_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  const E& get_error() const noexcept {
    MCPWS_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? value() : fallback; }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  void destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E err_;
  bool has_value_;
};

/**
 * @brief Void specialization - success or an error, no payload.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) {
    expected e;
    e.err_ = static_cast<E&&>(err);
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    MCPWS_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// FixedVector<T, Capacity> - fixed-capacity vector, no heap
// ============================================================================

template <typename T, uint32_t Capacity>
class FixedVector final {
  static_assert(Capacity > 0U, "FixedVector capacity must be > 0");

 public:
  using value_type = T;
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept {}  // NOLINT
  ~FixedVector() noexcept { clear(); }

  FixedVector(const FixedVector&) = delete;
  FixedVector& operator=(const FixedVector&) = delete;

  T& operator[](uint32_t index) noexcept { return data()[index]; }
  const T& operator[](uint32_t index) const noexcept { return data()[index]; }

  T& back() noexcept { return data()[size_ - 1U]; }

  T* data() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* data() const noexcept { return reinterpret_cast<const T*>(storage_); }

  iterator begin() noexcept { return data(); }
  const_iterator begin() const noexcept { return data(); }
  iterator end() noexcept { return data() + size_; }
  const_iterator end() const noexcept { return data() + size_; }

  [[nodiscard]] bool empty() const noexcept { return size_ == 0U; }
  [[nodiscard]] uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  [[nodiscard]] bool full() const noexcept { return size_ >= Capacity; }

  bool push_back(T&& value) noexcept {
    if (full()) {
      return false;
    }
    ::new (storage_ + size_ * sizeof(T)) T(static_cast<T&&>(value));
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0U) {
      return false;
    }
    --size_;
    data()[size_].~T();
    return true;
  }

  // Order is not preserved: the last element takes the erased slot.
  void swap_remove(uint32_t index) noexcept {
    if (index + 1U < size_) {
      data()[index] = static_cast<T&&>(back());
    }
    pop_back();
  }

  void clear() noexcept {
    while (pop_back()) {
    }
  }

 private:
  alignas(T) uint8_t storage_[sizeof(T) * Capacity];
  uint32_t size_{0U};
};

// ============================================================================
// FixedFunction<Sig, BufferSize> - SBO callback
// ============================================================================

template <typename Signature, size_t BufferSize = 4 * sizeof(void*)>
class FixedFunction;

template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;

  template <typename F, typename = typename std::enable_if<
                            !std::is_same<typename std::decay<F>::type, FixedFunction>::value>::type>
  FixedFunction(F&& f) noexcept {  // NOLINT
    using Decay = typename std::decay<F>::type;
    static_assert(sizeof(Decay) <= BufferSize, "Callable too large for FixedFunction buffer");
    static_assert(alignof(Decay) <= alignof(Storage), "Callable alignment exceeds buffer alignment");
    ::new (&storage_) Decay(static_cast<F&&>(f));
    invoker_ = [](Storage& s, Args... args) -> Ret {
      return (*reinterpret_cast<Decay*>(&s))(static_cast<Args&&>(args)...);
    };
    destroyer_ = [](Storage& s) { reinterpret_cast<Decay*>(&s)->~Decay(); };
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() {
    if (destroyer_) {
      destroyer_(storage_);
    }
  }

  Ret operator()(Args... args) {
    MCPWS_ASSERT(invoker_);
    return invoker_(storage_, static_cast<Args&&>(args)...);
  }

  explicit operator bool() const noexcept { return invoker_ != nullptr; }

 private:
  using Storage = typename std::aligned_storage<BufferSize, alignof(void*)>::type;
  using Invoker = Ret (*)(Storage&, Args...);
  using Destroyer = void (*)(Storage&);

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
  template <typename F>
  explicit ScopeGuard(F&& cleanup) noexcept : cleanup_(static_cast<F&&>(cleanup)) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

 private:
  FixedFunction<void()> cleanup_;
  bool active_{true};
};

}  // namespace mcpws

#endif  // MCPWS_VOCABULARY_HPP_
