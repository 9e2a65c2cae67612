#pragma once

#include "cronkit/cron/field.hpp"
#include "cronkit/cron/parse_failure.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace cronkit {

// One comma-separated element of a field, e.g. "10-20/5" in "0,10-20/5".
struct Term {
  std::string_view text;
  std::size_t offset{0};
};

struct FieldToken {
  FieldKind kind{FieldKind::Second};
  std::string_view text;
  std::size_t offset{0};
  std::vector<Term> terms;
};

// Expands "@daily" style shorthands to their six-field form. Returns the
// input unchanged when it is not a macro, nullopt for an unknown macro.
[[nodiscard]] auto expand_macro(std::string_view expr)
    -> std::optional<std::string_view>;

// Splits a schedule into 6 or 7 positional field tokens and each token into
// its list terms. Views point into `expr`, which must outlive the result.
[[nodiscard]] auto tokenize(std::string_view expr)
    -> ParseResult<std::vector<FieldToken>>;

}  // namespace cronkit
