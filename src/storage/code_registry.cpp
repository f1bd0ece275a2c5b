#include "shortmint/storage/code_registry.h"

namespace shortmint::storage {

bool InMemoryCodeRegistry::reserve(const std::string& code, const std::string& /*reserved_at*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  return codes_.insert(code).second;
}

bool InMemoryCodeRegistry::contains(const std::string& code) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return codes_.contains(code);
}

std::size_t InMemoryCodeRegistry::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return codes_.size();
}

}  // namespace shortmint::storage
