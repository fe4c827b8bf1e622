#pragma once

#include <recchain/core/chain.hpp>
#include <recchain/core/error.hpp>
#include <recchain/core/input.hpp>
#include <recchain/core/run_context.hpp>

namespace recchain::core {

/// Pushes \p input through \p chain, then finishes the head exactly once.
///
/// Lines go through accept_line, records through accept_record; a false
/// return stops reading (remaining stream lines are left unread) but
/// finish() still runs. Input given to a head that does not want input is
/// ignored.
///
/// Errors: InputRequired when the head wants input and none is given;
/// UnsupportedInput when a record element is not a JSON object; IoError on
/// a stream read failure; any error a stage returns. finish() is not called
/// after an error.
[[nodiscard]] Result<void> drive(Chain& chain, const Input& input, RunContext& context);

}  // namespace recchain::core
