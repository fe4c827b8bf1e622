#pragma once

#include <recchain/core/stage_catalog.hpp>

namespace recchain::stages {

/// Registers fromjson, fromrange, grep, xform, head, sort, topn, tojson
/// and totable.
void register_builtin_stages(core::StageCatalog& catalog);

/// Catalog holding only the built-in stages.
[[nodiscard]] core::StageCatalog make_builtin_catalog();

}  // namespace recchain::stages
