#include "xid/core/random_source.h"

#include <exception>
#include <string>

namespace xid::core {

void SystemRandomSource::fill(std::span<std::uint8_t> out) {
  const std::lock_guard<std::mutex> lock{mutex_};

  try {
    if (!device_) {
      device_ = std::make_unique<std::random_device>();
    }

    std::size_t i = 0;
    while (i < out.size()) {
      auto word = (*device_)();
      for (std::size_t k = 0; k < sizeof(word) && i < out.size(); ++k, ++i) {
        out[i] = static_cast<std::uint8_t>(word);
        word >>= 8;
      }
    }
  } catch (const std::exception& e) {
    throw RandomSourceError("xid: cannot generate random number: " + std::string(e.what()));
  }
}

void SequenceRandomSource::fill(std::span<std::uint8_t> out) {
  for (auto& byte : out) {
    byte = next_++;
  }
}

}  // namespace xid::core
