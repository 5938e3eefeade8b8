#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace toolrt {

class CancellationToken;

// Owner side of a cancellation signal. One source is created per conversation turn and its token
// is handed to every request made on behalf of that turn.
class CancellationSource {
 public:
  CancellationSource();

  CancellationToken Token() const;
  void Cancel();
  bool IsCancelled() const;

 private:
  friend class CancellationToken;
  struct State {
    std::mutex mu;
    bool cancelled = false;
    int next_id = 1;
    std::unordered_map<int, std::function<void()>> callbacks;
  };
  std::shared_ptr<State> state_;
};

class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancelled() const;
  bool CanBeCancelled() const { return state_ != nullptr; }

  // Runs `cb` once when cancellation fires (immediately, on this thread, if it already has).
  // Returns a registration id for Unregister, or 0 when the callback ran inline or cannot fire.
  int Register(std::function<void()> cb) const;
  void Unregister(int id) const;

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state) : state_(std::move(state)) {}
  std::shared_ptr<CancellationSource::State> state_;
};

}  // namespace toolrt
