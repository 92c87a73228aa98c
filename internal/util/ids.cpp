#include "ids.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace sitepull::util {
namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string GenerateJobId(std::size_t length) {
  static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

  std::string id;
  id.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    id.push_back(kAlphabet[pick(Rng())]);
  }
  return id;
}

std::string GenerateSessionId() {
  std::ostringstream oss;
  oss << "exp_" << std::hex << std::setw(16) << std::setfill('0') << Rng()();
  return oss.str();
}

} // namespace sitepull::util
