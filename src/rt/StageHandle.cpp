#include "conduit/rt/StageHandle.hpp"

namespace conduit::rt {

StageHandle::~StageHandle() {
  if (thr_.joinable()) thr_.join();
}

StageHandle::StageHandle(StageHandle&& o) noexcept
  : name_(std::move(o.name_)), thr_(std::move(o.thr_)), done_(std::move(o.done_)) {}

StageHandle& StageHandle::operator=(StageHandle&& o) noexcept {
  if (this != &o) {
    if (thr_.joinable()) thr_.join();
    name_ = std::move(o.name_);
    thr_  = std::move(o.thr_);
    done_ = std::move(o.done_);
  }
  return *this;
}

bool StageHandle::finished() const {
  return waitFor(std::chrono::milliseconds(0));
}

bool StageHandle::waitFor(std::chrono::milliseconds timeout) const {
  if (!done_.valid()) return true;
  return done_.wait_for(timeout) == std::future_status::ready;
}

void StageHandle::join() {
  if (thr_.joinable()) thr_.join();
  if (done_.valid()) done_.get();
}

} // namespace conduit::rt
