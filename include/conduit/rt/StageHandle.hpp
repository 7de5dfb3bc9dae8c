#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <thread>
#include <utility>

#include "conduit/util/Logger.hpp"

namespace conduit::rt {

// Owns the thread running one stage. The destructor joins, so a stage can
// never outlive the scope holding its handle.
//
// Channel endpoints should be moved into the body's captures and from there
// into the stage's run() parameters, so they are released the moment run()
// returns, not when the thread object is torn down.
class StageHandle {
public:
  StageHandle() = default;

  template <typename Fn>
  StageHandle(std::string name, Fn body) : name_(std::move(name)) {
    std::promise<void> p;
    done_ = p.get_future();
    thr_ = std::thread([n = name_, fn = std::move(body), p = std::move(p)]() mutable {
      util::Logger::Scoped ctx({{"stage", n}});
      util::logger().log(util::LogLevel::Debug, "stage started");
      try {
        auto local = std::move(fn);
        local();
      } catch (const std::exception& ex) {
        util::logger().log(util::LogLevel::Error, "stage failed", {{"what", ex.what()}});
        p.set_exception(std::current_exception());
        return;
      }
      util::logger().log(util::LogLevel::Debug, "stage stopped");
      p.set_value();
    });
  }

  ~StageHandle();

  StageHandle(const StageHandle&)            = delete;
  StageHandle& operator=(const StageHandle&) = delete;
  StageHandle(StageHandle&&) noexcept;
  StageHandle& operator=(StageHandle&&) noexcept;

  const std::string& name() const noexcept { return name_; }

  // True once the body has returned (or thrown).
  bool finished() const;
  bool waitFor(std::chrono::milliseconds timeout) const;

  // Joins; rethrows whatever the body threw.
  void join();

private:
  std::string       name_;
  std::thread       thr_;
  std::future<void> done_;
};

} // namespace conduit::rt
