#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <concepts>
#include <type_traits>
#include <utility>

namespace cadastre {

template<class E>
concept Enum = std::is_enum_v<E>;

template<class E> struct EnumValues; // specialize per enum

template<Enum E, E... Vs>
struct EnumList {
  using enum_type = E;
  static constexpr std::size_t size = sizeof...(Vs);
};

template<Enum E, E... Vs, class F>
constexpr void ForEachEnum(EnumList<E, Vs...>, F&& f) {
  (static_cast<void>(f(std::integral_constant<E, Vs>{})), ...);
}

template<class E>
concept EnumWithName = Enum<E> && requires(E e) {
  { Name(e) } -> std::same_as<const char*>;
};

/// Parses the spelling returned by Name(e).
template<EnumWithName E>
  requires requires { typename EnumValues<E>; }
constexpr std::optional<E> FromChars(std::string_view s) {
  std::optional<E> out;
  ForEachEnum(EnumValues<E>{}, [&](auto V) {
    if (out) return;
    constexpr E e = V();
    if (const char* n = Name(e); n && s == n)
      out = e;
  });
  return out;
} // FromChars

/// All spellings joined by `sep`, e.g. "parcels|blocks" for usage text.
template<EnumWithName E>
  requires requires { typename EnumValues<E>; }
std::string Spellings(std::string_view sep = "|") {
  auto out = std::string{};
  ForEachEnum(EnumValues<E>{}, [&](auto V) {
    if (!out.empty()) out += sep;
    out += Name(E{V()});
  });
  return out;
} // Spellings

} // cadastre
