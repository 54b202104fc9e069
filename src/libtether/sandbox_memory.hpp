#pragma once

#include <fmt/format.h>

#include <atomic>
#include <boost/json.hpp>
#include <cstddef>

#include "sandbox_value.hpp"
#include "tether/sandbox.hpp"

namespace tether::sandbox {

/// Memory resource behind every value one execution stores.  Counts live
/// bytes and raises MemoryError once @c limit would be exceeded.  Also
/// allocated from on the event loop thread when host calls copy arguments.
class counting_resource : public json::memory_resource {
 public:
  explicit counting_resource(std::size_t limit) : limit_{limit} {}

 private:
  void* do_allocate(std::size_t bytes, std::size_t align) override {
    auto before = used_.fetch_add(bytes, std::memory_order_relaxed);
    if (before + bytes > limit_) {
      used_.fetch_sub(bytes, std::memory_order_relaxed);
      value::raise(
          "MemoryError",
          fmt::format("memory limit of {} bytes exceeded", limit_));
    }
    try {
      return upstream_->allocate(bytes, align);
    } catch (...) {
      used_.fetch_sub(bytes, std::memory_order_relaxed);
      throw;
    }
  }

  void do_deallocate(void* p, std::size_t bytes, std::size_t align) override {
    upstream_->deallocate(p, bytes, align);
    used_.fetch_sub(bytes, std::memory_order_relaxed);
  }

  [[nodiscard]] bool do_is_equal(
      const json::memory_resource& other) const noexcept override {
    return this == &other;
  }

  std::size_t limit_;
  std::atomic<std::size_t> used_{0};
  json::storage_ptr upstream_{};
};

}  // namespace tether::sandbox
