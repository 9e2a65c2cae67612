#include "cronkit/cron/field_compiler.hpp"

#include "cronkit/util/strings.hpp"

#include <cctype>
#include <string>

namespace cronkit {
namespace {

auto quoted(std::string_view s) -> std::string {
  return "'" + std::string(s) + "'";
}

auto check_characters(const FieldSpec& spec, const Term& term)
    -> ParseResult<void> {
  const bool named =
      spec.kind == FieldKind::Month || spec.kind == FieldKind::DayOfWeek;
  for (std::size_t i = 0; i < term.text.size(); ++i) {
    char c = static_cast<char>(
        std::toupper(static_cast<unsigned char>(term.text[i])));
    bool allowed = false;
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '*' || c == '-' ||
        c == '/') {
      allowed = true;
    } else if (c == '?') {
      allowed = spec.allows_no_specific;
    } else if (c == '#') {
      allowed = spec.allows_nth;
    } else if (std::isalpha(static_cast<unsigned char>(c))) {
      allowed = named || (c == 'L' && spec.allows_last) ||
                (c == 'W' && spec.allows_weekday);
    }
    if (!allowed) {
      return malformed(spec.kind, term.offset + i,
                       "character '" + std::string(1, term.text[i]) +
                           "' is not allowed in the " +
                           std::string(spec.name) + " field");
    }
  }
  return {};
}

// Single numeric or named value, range checked.
auto parse_value(const FieldSpec& spec, std::string_view s, std::size_t offset)
    -> ParseResult<int> {
  if (s.empty())
    return malformed(spec.kind, offset, "missing value");
  if (auto v = strings::parse_int(s)) {
    if (!spec.contains(*v)) {
      return malformed(spec.kind, offset,
                       "value " + std::string(s) + " out of range (" +
                           std::to_string(spec.min) + "-" +
                           std::to_string(spec.max) + ")");
    }
    return *v;
  }
  if (std::isdigit(static_cast<unsigned char>(s.front()))) {
    return malformed(spec.kind, offset, "invalid number " + quoted(s));
  }
  if (auto v = lookup_name(spec.kind, s))
    return *v;
  return malformed(spec.kind, offset, "unknown name " + quoted(s));
}

auto require_alone(const FieldToken& token, const Term& term)
    -> ParseResult<void> {
  if (token.terms.size() != 1) {
    return malformed(token.kind, term.offset,
                     quoted(term.text) +
                         " cannot be combined with other list elements");
  }
  return {};
}

auto compile_day_of_month_marker(const FieldToken& token, const Term& term,
                                 std::string_view t)
    -> std::optional<ParseResult<FieldConstraint>> {
  if (t.find('L') == std::string_view::npos &&
      t.find('W') == std::string_view::npos) {
    return std::nullopt;
  }
  if (auto r = require_alone(token, term); !r)
    return std::unexpected{std::move(r.error())};

  if (t == "L")
    return FieldConstraint{LastDayOfMonth{0}};
  if (t == "LW")
    return FieldConstraint{LastWeekdayOfMonth{}};
  if (t.starts_with("L-")) {
    auto offset = strings::parse_int(t.substr(2));
    if (!offset || *offset < 0 || *offset > 30) {
      return malformed(token.kind, term.offset + 2,
                       "offset from last day must be 0-30 in " +
                           quoted(term.text));
    }
    return FieldConstraint{LastDayOfMonth{*offset}};
  }
  if (t.size() > 1 && t.back() == 'W' &&
      t.find('L') == std::string_view::npos) {
    auto day = parse_value(field_spec(token.kind), t.substr(0, t.size() - 1),
                           term.offset);
    if (!day)
      return std::unexpected{std::move(day.error())};
    return FieldConstraint{NearestWeekday{*day}};
  }
  return malformed(token.kind, term.offset,
                   "misplaced 'L' or 'W' in " + quoted(term.text));
}

auto compile_day_of_week_marker(const FieldToken& token, const Term& term,
                                std::string_view t)
    -> std::optional<ParseResult<FieldConstraint>> {
  const auto& spec = field_spec(token.kind);
  if (auto hash = t.find('#'); hash != std::string_view::npos) {
    if (auto r = require_alone(token, term); !r)
      return std::unexpected{std::move(r.error())};
    auto dow = parse_value(spec, t.substr(0, hash), term.offset);
    if (!dow)
      return std::unexpected{std::move(dow.error())};
    auto nth = strings::parse_int(t.substr(hash + 1));
    if (!nth || *nth < 1 || *nth > 5) {
      return malformed(token.kind, term.offset + hash + 1,
                       "occurrence after '#' must be 1-5 in " +
                           quoted(term.text));
    }
    return FieldConstraint{NthDayOfWeek{*dow, *nth}};
  }
  if (t.empty() || t.back() != 'L')
    return std::nullopt;

  if (auto r = require_alone(token, term); !r)
    return std::unexpected{std::move(r.error())};
  if (t == "L") {
    ValueSet set(token.kind);
    set.add(kSaturday);
    return FieldConstraint{set};
  }
  auto dow = parse_value(spec, t.substr(0, t.size() - 1), term.offset);
  if (!dow)
    return std::unexpected{std::move(dow.error())};
  return FieldConstraint{LastDayOfWeek{*dow}};
}

// `*`, `a`, `a-b`, each optionally followed by `/step`.
auto add_set_term(const FieldSpec& spec, const Term& term, std::string_view t,
                  ValueSet& set) -> ParseResult<void> {
  std::string_view base = t;
  int step = 1;
  bool stepped = false;

  if (auto slash = t.find('/'); slash != std::string_view::npos) {
    auto s = strings::parse_int(t.substr(slash + 1));
    if (!s || *s < 1 || *s > spec.span()) {
      return malformed(spec.kind, term.offset + slash + 1,
                       "step must be 1-" + std::to_string(spec.span()) +
                           " in " + quoted(term.text));
    }
    step = *s;
    stepped = true;
    base = t.substr(0, slash);
  }

  int first = spec.min;
  int last = spec.max;
  if (base == "*") {
    // full range
  } else if (auto dash = base.find('-');
             dash != std::string_view::npos && dash > 0) {
    auto a = parse_value(spec, base.substr(0, dash), term.offset);
    if (!a)
      return std::unexpected{std::move(a.error())};
    auto b = parse_value(spec, base.substr(dash + 1), term.offset + dash + 1);
    if (!b)
      return std::unexpected{std::move(b.error())};
    if (*a > *b) {
      return malformed(spec.kind, term.offset,
                       "range start is greater than range end in " +
                           quoted(term.text));
    }
    first = *a;
    last = *b;
  } else {
    auto a = parse_value(spec, base, term.offset);
    if (!a)
      return std::unexpected{std::move(a.error())};
    first = *a;
    last = stepped ? spec.max : *a;
  }

  set.add_range(first, last, step);
  return {};
}

}  // namespace

auto compile_field(const FieldToken& token) -> ParseResult<FieldConstraint> {
  const auto& spec = field_spec(token.kind);
  ValueSet set(token.kind);

  for (const auto& term : token.terms) {
    if (auto r = check_characters(spec, term); !r)
      return std::unexpected{std::move(r.error())};

    const std::string upper = strings::to_upper(term.text);
    const std::string_view t = upper;

    if (t == "?") {
      if (auto r = require_alone(token, term); !r)
        return std::unexpected{std::move(r.error())};
      return NoSpecificValue{};
    }

    if (token.kind == FieldKind::DayOfMonth) {
      if (auto marker = compile_day_of_month_marker(token, term, t))
        return std::move(*marker);
    } else if (token.kind == FieldKind::DayOfWeek) {
      if (auto marker = compile_day_of_week_marker(token, term, t))
        return std::move(*marker);
    }

    if (auto r = add_set_term(spec, term, t, set); !r)
      return std::unexpected{std::move(r.error())};
  }

  return set;
}

}  // namespace cronkit
