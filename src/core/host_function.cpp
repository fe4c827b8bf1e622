#include <recchain/core/host_function.hpp>
#include <exception>
#include <string>

namespace recchain::core {

HostFunctionHandle make_host_function(HostCallable fn, std::string description) {
  return std::make_shared<const HostFunction>(
      HostFunction{std::move(fn), std::move(description)});
}

Result<std::string> HostFunctionRegistry::register_function(
    const HostFunctionHandle& fn) {
  if (!fn || !fn->fn) {
    return fail(PipelineError::RegistrationFailed,
                "cannot register an empty host function");
  }
  if (auto it = tokens_.find(fn.get()); it != tokens_.end()) {
    return it->second;
  }
  if (capacity_ != 0 && functions_.size() >= capacity_) {
    return fail(PipelineError::RegistrationFailed,
                "host function registry is full (" + std::to_string(capacity_) +
                    " entries)");
  }

  std::string token = "hf" + std::to_string(next_id_++);
  tokens_.emplace(fn.get(), token);
  functions_.emplace(token, fn);
  return token;
}

const HostFunction* HostFunctionRegistry::lookup(std::string_view token) const {
  auto it = functions_.find(token);
  return it == functions_.end() ? nullptr : it->second.get();
}

Result<Json> HostFunctionRegistry::invoke(std::string_view token,
                                          const Record& record) const {
  const HostFunction* fn = lookup(token);
  if (!fn) {
    return fail(PipelineError::InvalidArgument,
                "no host function registered as " + std::string(token));
  }
  // Exceptions thrown by the closure end the run as an error value.
  try {
    return fn->fn(record);
  } catch (const std::exception& e) {
    return fail(PipelineError::HostFunctionFailed,
                "host function " + std::string(token) + " failed: " + e.what());
  }
}

}  // namespace recchain::core
