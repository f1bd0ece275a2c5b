#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>

namespace shortmint::storage {

// Registry of short codes already handed out by this deployment.
// The generator itself keeps no history; callers consult a registry to re-check
// uniqueness before publishing a code.
class ICodeRegistry {
 public:
  virtual ~ICodeRegistry() = default;

  // Atomically record `code` if absent. Returns false when it was already present.
  [[nodiscard]] virtual bool reserve(const std::string& code, const std::string& reserved_at) = 0;
  [[nodiscard]] virtual bool contains(const std::string& code) const = 0;
  [[nodiscard]] virtual std::size_t count() const = 0;
};

// InMemoryCodeRegistry keeps codes in a std::set guarded by a mutex.
// Suitable for tests and ephemeral CLI runs.
class InMemoryCodeRegistry final : public ICodeRegistry {
 public:
  [[nodiscard]] bool reserve(const std::string& code, const std::string& reserved_at) override;
  [[nodiscard]] bool contains(const std::string& code) const override;
  [[nodiscard]] std::size_t count() const override;

 private:
  mutable std::mutex mutex_;
  std::set<std::string> codes_;
};

}  // namespace shortmint::storage
