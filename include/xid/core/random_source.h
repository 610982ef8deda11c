#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <span>
#include <stdexcept>

namespace xid::core {

// RandomSourceError signals that no randomness could be obtained.
// It is NOT a recoverable condition: generators propagate it instead of emitting an
// identifier with a weakened or zeroed random suffix. Callers should treat it as fatal.
class RandomSourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Abstract random byte source, injected into generators the same way as IClock.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Fill every byte of out. Throws RandomSourceError on failure.
  virtual void fill(std::span<std::uint8_t> out) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source backed by the OS entropy device via std::random_device.
// Thread-safe: the device is opened lazily on first use and guarded by a mutex.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource() = default;
  ~SystemRandomSource() override = default;

  // Not copyable or movable (owns the device and its mutex)
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = delete;
  SystemRandomSource& operator=(SystemRandomSource&&) = delete;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::mutex mutex_;
  std::unique_ptr<std::random_device> device_;
};

// Deterministic source: emits next, next + 1, next + 2, ... (mod 256).
// For tests and demos where reproducible output is required.
class SequenceRandomSource final : public IRandomSource {
 public:
  explicit SequenceRandomSource(std::uint8_t first = 0) : next_(first) {}
  ~SequenceRandomSource() override = default;

  SequenceRandomSource(const SequenceRandomSource&) = default;
  SequenceRandomSource& operator=(const SequenceRandomSource&) = default;
  SequenceRandomSource(SequenceRandomSource&&) = default;
  SequenceRandomSource& operator=(SequenceRandomSource&&) = default;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::uint8_t next_;
};

}  // namespace xid::core
