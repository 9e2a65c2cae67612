#include "cronkit/cron/constraint.hpp"

#include <algorithm>

namespace cronkit {

auto ValueSet::full(FieldKind kind) -> ValueSet {
  ValueSet set(kind);
  const auto& spec = field_spec(kind);
  set.add_range(spec.min, spec.max);
  return set;
}

auto ValueSet::add(int value) -> void {
  const auto& spec = field_spec(kind_);
  if (!spec.contains(value))
    return;
  bits_.set(static_cast<std::size_t>(value - spec.min));
}

auto ValueSet::add_range(int first, int last, int step) -> void {
  if (step <= 0)
    return;
  for (int v = first; v <= last; v += step) {
    add(v);
  }
}

auto ValueSet::test(int value) const noexcept -> bool {
  const auto& spec = field_spec(kind_);
  if (!spec.contains(value))
    return false;
  return bits_.test(static_cast<std::size_t>(value - spec.min));
}

auto ValueSet::is_full() const noexcept -> bool {
  return bits_.count() == static_cast<std::size_t>(field_spec(kind_).span());
}

auto ValueSet::next_at_or_after(int value) const -> std::optional<int> {
  const auto& spec = field_spec(kind_);
  for (int v = std::max(value, spec.min); v <= spec.max; ++v) {
    if (bits_.test(static_cast<std::size_t>(v - spec.min)))
      return v;
  }
  return std::nullopt;
}

auto ValueSet::prev_at_or_before(int value) const -> std::optional<int> {
  const auto& spec = field_spec(kind_);
  for (int v = std::min(value, spec.max); v >= spec.min; --v) {
    if (bits_.test(static_cast<std::size_t>(v - spec.min)))
      return v;
  }
  return std::nullopt;
}

auto ValueSet::values() const -> std::vector<int> {
  const auto& spec = field_spec(kind_);
  std::vector<int> out;
  out.reserve(bits_.count());
  for (int v = spec.min; v <= spec.max; ++v) {
    if (bits_.test(static_cast<std::size_t>(v - spec.min)))
      out.push_back(v);
  }
  return out;
}

auto is_restricted(const FieldConstraint& c) noexcept -> bool {
  return std::visit(overloaded{
                        [](const ValueSet& set) { return !set.is_full(); },
                        [](const NoSpecificValue&) { return false; },
                        [](const auto&) { return true; },
                    },
                    c);
}

}  // namespace cronkit
