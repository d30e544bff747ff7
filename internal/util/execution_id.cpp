#include "execution_id.hpp"

#include <cstdint>

namespace docflow::util {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime       = 1099511628211ULL;

} // namespace

uint64_t Fnv1a64(const std::string& data) {
  uint64_t hash = kFnvOffsetBasis;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string ExecutionIdFor(const docflow::v1::DocumentRef& ref) {
  // NUL separator keeps ("ab","c") and ("a","bc") apart.
  std::string material;
  material.reserve(ref.container().size() + ref.key().size() + 1);
  material.append(ref.container());
  material.push_back('\0');
  material.append(ref.key());

  static constexpr char kHex[] = "0123456789abcdef";

  const uint64_t hash = Fnv1a64(material);
  std::string    id   = "exec-";
  for (int shift = 60; shift >= 0; shift -= 4) {
    id.push_back(kHex[(hash >> shift) & 0x0F]);
  }
  return id;
}

} // namespace docflow::util
