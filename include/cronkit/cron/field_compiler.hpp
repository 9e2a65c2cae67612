#pragma once

#include "cronkit/cron/constraint.hpp"
#include "cronkit/cron/parse_failure.hpp"
#include "cronkit/cron/tokenizer.hpp"

namespace cronkit {

// Compiles one tokenized field into its constraint. List elements are
// unioned into a ValueSet; the markers `? L LW L-n dW d#n dL` must stand
// alone in their field.
[[nodiscard]] auto compile_field(const FieldToken& token)
    -> ParseResult<FieldConstraint>;

}  // namespace cronkit
