#pragma once

#include "cronkit/core/error.hpp"
#include "cronkit/cron/field.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace cronkit {

// Diagnostic for a schedule string that failed to compile. Points at the
// offending field and the byte offset inside the original text.
struct ParseFailure {
  std::error_code code{make_error_code(Error::MalformedExpression)};
  std::optional<FieldKind> field;
  std::size_t offset{0};
  std::string detail;

  [[nodiscard]] auto message() const -> std::string;
};

template <typename T>
using ParseResult = std::expected<T, ParseFailure>;

[[nodiscard]] inline auto malformed(std::optional<FieldKind> field,
                                    std::size_t offset, std::string detail)
    -> std::unexpected<ParseFailure> {
  return std::unexpected{ParseFailure{make_error_code(Error::MalformedExpression),
                                      field, offset, std::move(detail)}};
}

}  // namespace cronkit
