/**
 * @file
 * @brief Strongly typed arena indices for classes, methods and fields.
 */
#pragma once

#include <compare>
#include <cstdint>
#include <functional>

namespace pullup::model {

struct ClassId {
  std::uint32_t index{0};
  auto operator<=>(const ClassId&) const = default;
};

struct MethodId {
  std::uint32_t index{0};
  auto operator<=>(const MethodId&) const = default;
};

struct FieldId {
  std::uint32_t index{0};
  auto operator<=>(const FieldId&) const = default;
};

} // namespace pullup::model

template <>
struct std::hash<pullup::model::ClassId> {
  std::size_t operator()(const pullup::model::ClassId& id) const noexcept { return std::hash<std::uint32_t>{}(id.index); }
};

template <>
struct std::hash<pullup::model::MethodId> {
  std::size_t operator()(const pullup::model::MethodId& id) const noexcept { return std::hash<std::uint32_t>{}(id.index); }
};

template <>
struct std::hash<pullup::model::FieldId> {
  std::size_t operator()(const pullup::model::FieldId& id) const noexcept { return std::hash<std::uint32_t>{}(id.index); }
};
