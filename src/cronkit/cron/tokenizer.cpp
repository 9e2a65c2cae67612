#include "cronkit/cron/tokenizer.hpp"

#include "cronkit/util/strings.hpp"

#include <array>
#include <string>
#include <utility>

namespace cronkit {
namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kMacros{{
    {"@yearly", "0 0 0 1 1 ?"},
    {"@annually", "0 0 0 1 1 ?"},
    {"@monthly", "0 0 0 1 * ?"},
    {"@weekly", "0 0 0 ? * 1"},
    {"@daily", "0 0 0 * * ?"},
    {"@hourly", "0 0 * * * ?"},
}};

auto split_terms(FieldToken& token) -> ParseResult<void> {
  std::size_t start = 0;
  const auto text = token.text;
  while (true) {
    std::size_t end = text.find(',', start);
    if (end == std::string_view::npos)
      end = text.size();
    if (end == start) {
      return malformed(token.kind, token.offset + start,
                       "empty list element in '" + std::string(text) + "'");
    }
    token.terms.push_back(Term{text.substr(start, end - start),
                               token.offset + start});
    if (end == text.size())
      break;
    start = end + 1;
  }
  return {};
}

}  // namespace

auto expand_macro(std::string_view expr) -> std::optional<std::string_view> {
  if (expr.empty() || expr.front() != '@')
    return expr;
  for (const auto& [macro, expansion] : kMacros) {
    if (strings::iequals(expr, macro))
      return expansion;
  }
  return std::nullopt;
}

auto tokenize(std::string_view expr) -> ParseResult<std::vector<FieldToken>> {
  std::vector<FieldToken> tokens;
  tokens.reserve(kFieldCount);

  std::size_t pos = 0;
  std::size_t count = 0;
  while (pos < expr.size()) {
    while (pos < expr.size() && strings::is_space(expr[pos]))
      ++pos;
    if (pos == expr.size())
      break;
    std::size_t end = pos;
    while (end < expr.size() && !strings::is_space(expr[end]))
      ++end;

    if (count < kFieldCount) {
      FieldToken token;
      token.kind = static_cast<FieldKind>(count);
      token.text = expr.substr(pos, end - pos);
      token.offset = pos;
      if (auto r = split_terms(token); !r)
        return std::unexpected{std::move(r.error())};
      tokens.push_back(std::move(token));
    }
    ++count;
    pos = end;
  }

  if (count < 6 || count > kFieldCount) {
    return malformed(std::nullopt, 0,
                     "expected 6 or 7 fields, found " + std::to_string(count));
  }
  return tokens;
}

}  // namespace cronkit
