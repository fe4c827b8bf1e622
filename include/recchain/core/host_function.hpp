#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/record.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace recchain::core {

/// Caller-supplied closure usable wherever a stage expects a snippet.
using HostCallable = std::function<Json(const Record&)>;

struct HostFunction {
  HostCallable fn;
  /// Optional human-readable source, emitted as a comment when bridged.
  std::string description;
};

/// Identity of a host function is the address this handle points to.
using HostFunctionHandle = std::shared_ptr<const HostFunction>;

[[nodiscard]] HostFunctionHandle make_host_function(HostCallable fn,
                                                    std::string description = {});

/// Token -> closure map consulted by snippets at evaluation time.
///
/// Append-only: tokens are never reclaimed while the registry lives, so it
/// grows with every distinct closure registered. Owned by one runner; not
/// synchronized, concurrent registration needs external locking.
class HostFunctionRegistry {
 public:
  /// \p capacity 0 = unbounded.
  explicit HostFunctionRegistry(std::size_t capacity = 0) : capacity_(capacity) {}

  /// Returns the token for \p fn, registering it on first sight.
  /// Fails with RegistrationFailed for a null handle or when full.
  [[nodiscard]] Result<std::string> register_function(const HostFunctionHandle& fn);

  /// nullptr when \p token is not registered.
  [[nodiscard]] const HostFunction* lookup(std::string_view token) const;

  /// Calls the closure behind \p token. InvalidArgument for an unknown token,
  /// HostFunctionFailed when the closure throws.
  [[nodiscard]] Result<Json> invoke(std::string_view token,
                                    const Record& record) const;

  [[nodiscard]] std::size_t size() const noexcept { return functions_.size(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

 private:
  std::size_t capacity_;
  std::uint64_t next_id_{1};
  std::unordered_map<const HostFunction*, std::string> tokens_;
  std::map<std::string, HostFunctionHandle, std::less<>> functions_;
};

}  // namespace recchain::core
