#pragma once

#include <recchain/core/error.hpp>
#include <recchain/core/host_function_bridge.hpp>
#include <recchain/core/run_context.hpp>
#include <recchain/core/stage.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace recchain::core {

/// Builds a stage pushing to \p next. Arguments are already bridged.
/// Fails (typically InvalidArgument) when the arguments are unusable.
using StageFactory = std::function<Result<std::unique_ptr<IStage>>(
    const RunContext& context, const StageArgs& args, IRecordConsumer& next)>;

/// Name -> factory lookup populated by whoever knows the available stages.
class StageCatalog {
 public:
  /// Replaces any factory already registered under \p name.
  void register_stage(std::string name, StageFactory factory);

  [[nodiscard]] bool contains(std::string_view name) const;

  /// nullptr when \p name is unknown.
  [[nodiscard]] const StageFactory* resolve(std::string_view name) const;

  [[nodiscard]] std::vector<std::string> names() const;

 private:
  std::map<std::string, StageFactory, std::less<>> factories_;
};

}  // namespace recchain::core
