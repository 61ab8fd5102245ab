#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <utility>

namespace ydecode {

// A remote endpoint from which an article may be fetched.
// Sources are configured once, in priority order; only the active flag may change while decoders run.
class Source {
 public:
  Source(std::string name, int priority, bool active = true)
      : _name(std::move(name)), _priority(priority), _active(active) {}

  Source(const Source&) = delete;
  Source& operator=(const Source&) = delete;

  // Explicit move so that the atomic flag is copied by value.
  Source(Source&& other) noexcept
      : _name(std::move(other._name)),
        _priority(other._priority),
        _active(other._active.load(std::memory_order_relaxed)) {}

  Source& operator=(Source&& other) noexcept {
    if (this != &other) {
      _name = std::move(other._name);
      _priority = other._priority;
      _active.store(other._active.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }
    return *this;
  }

  ~Source() = default;

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  // Higher values are tried later. A retry never goes back to a source of a lower priority value.
  [[nodiscard]] int priority() const noexcept { return _priority; }

  [[nodiscard]] bool isActive() const noexcept { return _active.load(std::memory_order_relaxed); }

  void setActive(bool active) noexcept { _active.store(active, std::memory_order_relaxed); }

 private:
  std::string _name;
  int _priority;
  std::atomic<bool> _active;
};

}  // namespace ydecode
