#include "cancellation.hpp"

#include <utility>
#include <vector>

namespace toolrt {

CancellationSource::CancellationSource() : state_(std::make_shared<State>()) {}

CancellationToken CancellationSource::Token() const {
  return CancellationToken(state_);
}

void CancellationSource::Cancel() {
  std::vector<std::function<void()>> to_run;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->cancelled) return;
    state_->cancelled = true;
    to_run.reserve(state_->callbacks.size());
    for (auto& [_, cb] : state_->callbacks) to_run.push_back(std::move(cb));
    state_->callbacks.clear();
  }
  for (auto& cb : to_run) {
    if (cb) cb();
  }
}

bool CancellationSource::IsCancelled() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->cancelled;
}

bool CancellationToken::IsCancelled() const {
  if (!state_) return false;
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->cancelled;
}

int CancellationToken::Register(std::function<void()> cb) const {
  if (!state_ || !cb) return 0;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (!state_->cancelled) {
      const int id = state_->next_id++;
      state_->callbacks.emplace(id, std::move(cb));
      return id;
    }
  }
  cb();
  return 0;
}

void CancellationToken::Unregister(int id) const {
  if (!state_ || id == 0) return;
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->callbacks.erase(id);
}

}  // namespace toolrt
