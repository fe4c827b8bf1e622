#include <recchain/core/stage_catalog.hpp>

namespace recchain::core {

void StageCatalog::register_stage(std::string name, StageFactory factory) {
  if (factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
  }
}

bool StageCatalog::contains(std::string_view name) const {
  return factories_.find(name) != factories_.end();
}

const StageFactory* StageCatalog::resolve(std::string_view name) const {
  auto it = factories_.find(name);
  return it == factories_.end() ? nullptr : &it->second;
}

std::vector<std::string> StageCatalog::names() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& [name, factory] : factories_) {
    out.push_back(name);
  }
  return out;
}

}  // namespace recchain::core
