#include <recchain/stages/builtin_stages.hpp>
#include <recchain/stages/from_json_stage.hpp>
#include <recchain/stages/from_range_stage.hpp>
#include <recchain/stages/grep_stage.hpp>
#include <recchain/stages/head_stage.hpp>
#include <recchain/stages/sort_stage.hpp>
#include <recchain/stages/to_json_stage.hpp>
#include <recchain/stages/to_table_stage.hpp>
#include <recchain/stages/top_n_stage.hpp>
#include <recchain/stages/xform_stage.hpp>

namespace recchain::stages {

void register_builtin_stages(core::StageCatalog& catalog) {
  catalog.register_stage("fromjson", &FromJsonStage::create);
  catalog.register_stage("fromrange", &FromRangeStage::create);
  catalog.register_stage("grep", &GrepStage::create);
  catalog.register_stage("xform", &XformStage::create);
  catalog.register_stage("head", &HeadStage::create);
  catalog.register_stage("sort", &SortStage::create);
  catalog.register_stage("topn", &TopNStage::create);
  catalog.register_stage("tojson", &ToJsonStage::create);
  catalog.register_stage("totable", &ToTableStage::create);
}

core::StageCatalog make_builtin_catalog() {
  core::StageCatalog catalog;
  register_builtin_stages(catalog);
  return catalog;
}

}  // namespace recchain::stages
