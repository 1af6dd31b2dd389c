#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace ps {

// Per-sync cancellation signal. Handlers run once, on the cancelling thread,
// and must not call back into the token.
class CancelToken {
public:
  using Handler = std::function<void()>;

  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void cancel();
  bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

  // Throws CancelledError when cancelled.
  void throw_if_cancelled() const;

  // Registers a handler; runs it immediately if already cancelled.
  // Returns 0 in that case, otherwise an id for unsubscribe().
  std::uint64_t subscribe(Handler h) const;
  void unsubscribe(std::uint64_t id) const;

private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mu_;
  mutable std::uint64_t next_id_{1};
  mutable std::map<std::uint64_t, Handler> handlers_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

// Scoped subscribe/unsubscribe.
class CancelSubscription {
public:
  CancelSubscription(const CancelToken& token, CancelToken::Handler h);
  ~CancelSubscription();
  CancelSubscription(const CancelSubscription&) = delete;
  CancelSubscription& operator=(const CancelSubscription&) = delete;

private:
  const CancelToken& token_;
  std::uint64_t id_;
};

}
