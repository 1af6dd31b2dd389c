#include "playsync/cancel_token.hpp"
#include "playsync/errors.hpp"
#include <utility>

namespace ps {

void CancelToken::cancel() {
  // Handlers run under mu_ so unsubscribe() cannot return while one is running.
  std::lock_guard<std::mutex> lk(mu_);
  if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
  for (auto& kv : handlers_) kv.second();
  handlers_.clear();
}

void CancelToken::throw_if_cancelled() const {
  if (cancelled()) throw CancelledError();
}

std::uint64_t CancelToken::subscribe(Handler h) const {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!cancelled()) {
      const auto id = next_id_++;
      handlers_.emplace(id, std::move(h));
      return id;
    }
  }
  h();
  return 0;
}

void CancelToken::unsubscribe(std::uint64_t id) const {
  if (id == 0) return;
  std::lock_guard<std::mutex> lk(mu_);
  handlers_.erase(id);
}

CancelSubscription::CancelSubscription(const CancelToken& token, CancelToken::Handler h)
  : token_(token), id_(token_.subscribe(std::move(h))) {}

CancelSubscription::~CancelSubscription() { token_.unsubscribe(id_); }

}
