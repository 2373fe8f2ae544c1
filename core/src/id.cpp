#include "core/id.h"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace runq::core {

std::string make_id(const std::string &prefix) {
  static std::mutex mutex;
  static std::mt19937_64 gen{std::random_device{}()};
  static std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t bits = 0;
  {
    std::lock_guard<std::mutex> lock(mutex);
    bits = dis(gen);
  }

  std::ostringstream ss;
  ss << prefix << std::hex << std::setfill('0') << std::setw(12)
     << (bits & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

} // namespace runq::core
