#include "playsync/sync_orchestrator.hpp"
#include "playsync/bounded_queue.hpp"
#include "playsync/errors.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace ps {

namespace {

// Parser -> writer hand-off. Reset discards everything staged so far.
struct PipelineMessage {
  enum class Kind { Batch, Reset };
  Kind kind = Kind::Batch;
  ItemBatch items;
};

// Stops and joins the producer when the writer side unwinds early.
struct ProducerGuard {
  std::thread& thread;
  CancelToken& stop;
  ~ProducerGuard() {
    if (!thread.joinable()) return;
    stop.cancel();
    thread.join();
  }
};

struct ScopeExit {
  std::function<void()> fn;
  ~ScopeExit() { fn(); }
};

void notify_render(const SyncOrchestrator::Observer& obs) {
  if (obs.on_render) obs.on_render();
}

}

SyncOrchestrator::SyncOrchestrator(ChunkStore& store) : SyncOrchestrator(store, Config{}) {}

SyncOrchestrator::SyncOrchestrator(ChunkStore& store, Config cfg)
  : store_(store), cfg_(std::move(cfg)) {
  fetcher_ = std::make_shared<HttpFetcher>(cfg_.http);
  provider_fetcher_ = std::make_shared<HttpFetcher>(cfg_.provider_http);
  auto f = provider_fetcher_;
  providers_ = [f](const ProviderCredentials& creds) -> std::unique_ptr<ProviderSource> {
    return std::make_unique<XtreamClient>(creds, *f);
  };
}

SyncOrchestrator::SyncOrchestrator(ChunkStore& store, Config cfg,
                                   std::shared_ptr<Fetcher> fetcher, ProviderFactory providers)
  : store_(store), cfg_(std::move(cfg)), fetcher_(std::move(fetcher)),
    providers_(std::move(providers)) {}

SyncOrchestrator::~SyncOrchestrator() {
  cancel_all();
  std::unique_lock<std::mutex> lk(mu_);
  settled_.wait(lk, [this] {
    return std::none_of(slots_.begin(), slots_.end(),
                        [](const auto& kv) { return kv.second.active; });
  });
}

SyncStatus SyncOrchestrator::sync(Resource& res, const Observer& obs) {
  auto token = std::make_shared<CancelToken>();
  {
    std::unique_lock<std::mutex> lk(mu_);
    Slot& slot = slots_[res.id];
    if (slot.token) {
      slot.token->cancel();
      settled_.notify_all();   // wake a request still waiting for its turn
    }
    slot.token = token;
    settled_.wait(lk, [&] { return !slot.active || token->cancelled(); });
    if (token->cancelled()) {
      if (slot.token == token) slot.token.reset();
      return SyncStatus::Cancelled;
    }
    slot.active = true;
  }
  // Last step on every path: the next request for this resource may start.
  ScopeExit release_slot{[this, id = res.id, token] { release(id, token); }};

  const auto t0 = std::chrono::steady_clock::now();
  const std::string temp = temp_owner_id(res.id);
  MetricsRegistry metrics;

  res.cancel_token = token;
  res.loading = true;
  res.status = SyncStatus::Syncing;
  res.progress = Stats{};
  if (obs.on_status_update) obs.on_status_update(res.id, Stats{});
  notify_render(obs);

  SyncStatus outcome = SyncStatus::Error;
  try {
    token->throw_if_cancelled();
    if (!store_.delete_all(temp)) throw StorageError(store_.last_error());

    Stats stats = (res.type == ResourceType::Provider)
                    ? run_provider(res, temp, *token, obs, metrics)
                    : run_playlist(res, temp, *token, obs, metrics);
    token->throw_if_cancelled();

    metrics.start_stage("commit");
    if (!store_.replace(temp, res.id)) throw StorageError(store_.last_error());
    metrics.end_stage("commit");

    metrics.start_stage("reload");
    auto data = store_.get_all(res.id);
    metrics.end_stage("reload");
    if (!data && stats.total() > 0)
      std::cerr << "[sync] " << res.id << ": committed data could not be re-read\n";

    res.data = data ? std::move(*data) : Dataset{};
    res.stats = stats;
    res.last_synced_ms = now_epoch_ms();
    outcome = SyncStatus::Synced;
  } catch (const CancelledError&) {
    outcome = SyncStatus::Cancelled;
  } catch (const std::exception& e) {
    std::cerr << "[sync] " << res.id << " failed: " << e.what() << "\n";
    outcome = SyncStatus::Error;
  }

  if (outcome != SyncStatus::Synced && !store_.delete_all(temp))
    std::cerr << "[sync] " << res.id << ": temp cleanup failed: " << store_.last_error() << "\n";

  res.status = outcome;
  res.loading = false;
  res.cancel_token.reset();
  res.progress.reset();

  double wall_ms = std::chrono::duration<double, std::milli>(
                     std::chrono::steady_clock::now() - t0).count();
  SyncReport report = metrics.snapshot(res.id, std::string(status_name(outcome)), wall_ms);
  std::cout << format_report(report) << "\n";

  {
    std::lock_guard<std::mutex> lk(mu_);
    reports_[res.id] = std::move(report);
  }

  if (obs.on_status_update) obs.on_status_update(res.id, res.stats);
  notify_render(obs);
  return outcome;
}

Stats SyncOrchestrator::run_playlist(Resource& res, const std::string& temp,
                                     const CancelToken& token, const Observer& obs,
                                     MetricsRegistry& metrics) {
  // `stop` ends the producer on outer cancellation or on a writer failure.
  CancelToken stop;
  BoundedQueue<PipelineMessage> queue(cfg_.queue_depth);
  CancelSubscription link(token, [&stop] { stop.cancel(); });
  CancelSubscription unblock(stop, [&queue] { queue.abort(); });

  StreamParser parser(cfg_.parser);
  Stats stats;
  std::exception_ptr producer_error;

  StreamParser::Callbacks cb;
  cb.on_batch = [&queue](ItemBatch&& batch) {
    if (!queue.push(PipelineMessage{PipelineMessage::Kind::Batch, std::move(batch)}))
      throw CancelledError();
  };
  cb.on_reset = [&queue] {
    if (!queue.push(PipelineMessage{PipelineMessage::Kind::Reset, {}}))
      throw CancelledError();
  };
  cb.on_progress = [&res, &obs](const Stats& s) {
    res.progress = s;
    if (obs.on_status_update) obs.on_status_update(res.id, s);
  };

  metrics.start_stage("fetch+parse");
  std::thread producer([&] {
    try {
      stats = parser.parse_from_url(res.url, *fetcher_, cb, stop);
    } catch (...) {
      producer_error = std::current_exception();
    }
    queue.close();
  });
  ProducerGuard guard{producer, stop};

  std::int64_t chunk_id = 0;
  std::string write_error;
  while (auto msg = queue.pop()) {
    if (msg->kind == PipelineMessage::Kind::Reset) {
      if (!store_.delete_all(temp)) { write_error = store_.last_error(); break; }
      chunk_id = 0;
      metrics.reset();
      metrics.start_stage("fetch+parse");
      continue;
    }
    if (token.cancelled()) break;
    if (!store_.put(temp, chunk_id, msg->items)) { write_error = store_.last_error(); break; }
    ++chunk_id;
    metrics.add_chunk();
    metrics.add_items(msg->items.size());
  }
  if (!write_error.empty()) stop.cancel();

  producer.join();
  metrics.end_stage("fetch+parse");
  metrics.set_bytes(parser.bytes_fed());

  if (!write_error.empty()) throw StorageError(write_error);
  token.throw_if_cancelled();
  if (producer_error) std::rethrow_exception(producer_error);
  return stats;
}

Stats SyncOrchestrator::run_provider(Resource& res, const std::string& temp,
                                     const CancelToken& token, const Observer& obs,
                                     MetricsRegistry& metrics) {
  if (!res.credentials) throw NetworkError("provider resource without credentials");
  if (!providers_) throw NetworkError("no provider source configured");

  metrics.start_stage("fetch+parse");
  auto source = providers_(*res.credentials);
  ProviderResult result = source->fetch_all(token);
  metrics.end_stage("fetch+parse");

  res.progress = result.stats;
  if (obs.on_status_update) obs.on_status_update(res.id, result.stats);

  ItemBatch items = result.data.flatten();
  const std::size_t step = std::max<std::size_t>(1, cfg_.provider_chunk_size);
  std::int64_t chunk_id = 0;
  for (std::size_t i = 0; i < items.size(); i += step) {
    token.throw_if_cancelled();
    auto end = items.begin() + static_cast<std::ptrdiff_t>(std::min(items.size(), i + step));
    ItemBatch batch(std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(i)),
                    std::make_move_iterator(end));
    if (!store_.put(temp, chunk_id++, batch)) throw StorageError(store_.last_error());
    metrics.add_chunk();
    metrics.add_items(batch.size());
  }
  return result.stats;
}

void SyncOrchestrator::release(const std::string& resource_id, const CancelTokenPtr& token) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(resource_id);
  if (it == slots_.end()) return;
  it->second.active = false;
  if (it->second.token == token) it->second.token.reset();
  settled_.notify_all();
}

bool SyncOrchestrator::cancel_sync(const std::string& resource_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(resource_id);
  if (it == slots_.end() || !it->second.token) return false;
  it->second.token->cancel();
  settled_.notify_all();
  return true;
}

void SyncOrchestrator::cancel_all() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& kv : slots_)
    if (kv.second.token) kv.second.token->cancel();
  settled_.notify_all();
}

bool SyncOrchestrator::is_syncing(const std::string& resource_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(resource_id);
  return it != slots_.end() && it->second.active;
}

std::optional<SyncReport> SyncOrchestrator::last_report(const std::string& resource_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = reports_.find(resource_id);
  if (it == reports_.end()) return std::nullopt;
  return it->second;
}

}
