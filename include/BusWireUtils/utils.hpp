// Copyright 2020-2024 Kevin Backhouse.
//
// This file is part of BusWire.
//
// BusWire is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// BusWire is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with BusWire.  If not, see <https://www.gnu.org/licenses/>.


#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// `_s("a") + b` concatenates a literal with anything a std::string
// accepts on the right.
inline std::string _s(const char* s) {
  return std::string(s);
}

// Build a vector from move-only values, such as the children of a
// `DBusObject`, which an initializer list can't hold. All arguments must
// convert to their common type.
template <class... Ts>
std::vector<typename std::common_type<Ts...>::type> _vec(Ts&&... args) {
  std::vector<typename std::common_type<Ts...>::type> result;
  result.reserve(sizeof...(args));
  (result.emplace_back(std::forward<Ts>(args)), ...);
  return result;
}
