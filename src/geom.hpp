/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once

#include <mp-units/systems/isq/space_and_time.h>
#include <mp-units/systems/si/units.h>
#include <mp-units/systems/si/unit_symbols.h>
#include <mp-units/math.h>

#include <array>
#include <type_traits>
#include <cmath>

namespace geom {

using Distance =
      mp_units::quantity<mp_units::isq::distance[mp_units::si::metre]>;

template<typename U> struct SquaredType {
  using type = decltype(std::declval<U>() * std::declval<U>());
};

template<typename U>
using SquaredTypeT = SquaredType<U>::type;

/// Planar area, in square metres.
using Area = SquaredTypeT<Distance>;

constexpr auto SquareMetre = mp_units::si::metre * mp_units::si::metre;

[[nodiscard]] constexpr double Metres(Distance d) noexcept
  { return d.numerical_value_in(mp_units::si::metre); }

[[nodiscard]] constexpr double SquareMetres(Area a) noexcept
  { return a.numerical_value_in(SquareMetre); }

[[nodiscard]] constexpr Distance FromMetres(double v) noexcept
  { return v * mp_units::si::metre; }

[[nodiscard]] constexpr Area FromSquareMetres(double v) noexcept
  { return v * SquareMetre; }

class Vec {
  static constexpr std::size_t Dim = 2;
  using value_type   = Distance;
  using squared_type = Area;

private:
  std::array<value_type, Dim> a;

public:
  template<std::size_t I> requires (I < Dim)
  [[nodiscard]] constexpr value_type& get() noexcept
    { return std::get<I>(a); }
  template<std::size_t I> requires (I < Dim)
  [[nodiscard]] constexpr const value_type& get() const noexcept
    { return std::get<I>(a); }
  [[nodiscard]] constexpr const value_type& dx() const noexcept
    { return get<0>(); }
  [[nodiscard]] constexpr const value_type& dy() const noexcept
    { return get<1>(); }

  constexpr Vec() noexcept = default;
  constexpr Vec(const Vec&) noexcept = default;
  constexpr Vec& operator=(const Vec&) noexcept = default;
  constexpr bool operator==(const Vec&) const noexcept = default;
  constexpr Vec(value_type dx_, value_type dy_) noexcept : a{dx_, dy_} { }

  [[nodiscard]] constexpr Vec operator+(const Vec& rhs) const noexcept
    { return Vec{a[0]+rhs.a[0], a[1]+rhs.a[1]}; }
  [[nodiscard]] constexpr Vec operator-(const Vec& rhs) const noexcept
    { return Vec{a[0]-rhs.a[0], a[1]-rhs.a[1]}; }
  [[nodiscard]] constexpr squared_type norm2() const noexcept
    { return a[0]*a[0] + a[1]*a[1]; }
  [[nodiscard]] constexpr value_type norm() const noexcept
    { return mp_units::hypot(a[0], a[1]); }
  [[nodiscard]] constexpr value_type& operator[](int idx) noexcept
    { return a[idx]; }
  [[nodiscard]] constexpr const value_type& operator[](int idx) const noexcept
    { return a[idx]; }
}; // Vec

class Pt {
  static constexpr std::size_t Dim = 2;
  using value_type = Distance;
  Vec v; // displacement from origin

public:
  [[nodiscard]] constexpr const value_type& x() const noexcept
    { return v.template get<0>(); }
  [[nodiscard]] constexpr const value_type& y() const noexcept
    { return v.template get<1>(); }

  constexpr Pt() = default;
  constexpr Pt(const Pt&) = default;
  constexpr Pt& operator=(const Pt&) = default;
  constexpr bool operator==(const Pt&) const = default;
  constexpr Pt(Distance x_, Distance y_) : v{x_, y_} { }

  [[nodiscard]] constexpr value_type& operator[](int idx) noexcept
    { return v[idx]; }
  [[nodiscard]] constexpr const value_type& operator[](int idx) const
    { return v[idx]; }
}; // Pt

constexpr Vec operator-(const Pt& lhs, const Pt& rhs) noexcept
  { return Vec{lhs.x()-rhs.x(), lhs.y()-rhs.y()}; }

constexpr Pt operator+(const Pt& p, const Vec& v) noexcept
  { return Pt{p.x() + v.dx(), p.y() + v.dy()}; }

constexpr Distance Dist(const Pt& a, const Pt& b) noexcept
  { return (b - a).norm(); }

constexpr Area Dist2(const Pt& a, const Pt& b) noexcept
  { return (b - a).norm2(); }

} // geom

namespace geom::test {

using namespace mp_units::si::unit_symbols;

constexpr auto p0 = Pt{0 * m, 0 * m};
constexpr auto p1 = Pt{30 * m, 0 * m};
constexpr auto p2 = Pt{30 * m, 40 * m};
static_assert(p0 + (p2 - p0) == p2);
static_assert(Dist2(p0, p2) == 2500.0 * m * m);
static_assert(SquareMetres(Dist2(p1, p2)) == 1600.0);

} // geom::test
