/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace histsync::util {

  /// Case-insensitive comparison of two string views
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  namespace detail {
    struct Unit {
      std::string_view suffix;
      uint64_t multiplier;
    };

    /**
     * Parses "<number>[ ]<suffix>" where suffix is one of {@param units}.
     * Number without suffix is multiplied by {@param bare_multiplier}.
     */
    inline std::optional<uint64_t> parseQuantity(std::string_view input,
                                                 std::span<const Unit> units,
                                                 uint64_t bare_multiplier) {
      auto first = input.find_first_not_of(" \t\n\r");
      if (first == std::string_view::npos) {
        return std::nullopt;
      }
      auto last = input.find_last_not_of(" \t\n\r");
      input = input.substr(first, last - first + 1);

      size_t i = 0;
      while (i < input.size()
             && std::isdigit(static_cast<unsigned char>(input[i]))) {
        ++i;
      }
      if (i == 0) {
        return std::nullopt;
      }
      auto number_part = input.substr(0, i);
      while (i < input.size()
             && std::isspace(static_cast<unsigned char>(input[i]))) {
        ++i;
      }
      auto suffix = input.substr(i);

      uint64_t number = 0;
      auto [ptr, ec] = std::from_chars(
          number_part.data(), number_part.data() + number_part.size(), number);
      if (ec != std::errc()) {
        return std::nullopt;
      }

      auto multiply = [&](uint64_t multiplier) -> std::optional<uint64_t> {
        if (number > UINT64_MAX / multiplier) {
          return std::nullopt;
        }
        return number * multiplier;
      };

      if (suffix.empty()) {
        return multiply(bare_multiplier);
      }
      for (const auto &[unit_suffix, multiplier] : units) {
        if (iequals(unit_suffix, suffix)) {
          return multiply(multiplier);
        }
      }
      return std::nullopt;
    }
  }  // namespace detail

  /**
   * Parses a byte size (e.g. "10MB", "4 KiB", "512M").
   * K, M, G, T are IEC (1024-based); KB, MB, GB, TB are SI.
   * @return size in bytes, or std::nullopt if the input is malformed
   */
  inline std::optional<uint64_t> parseByteQuantity(std::string_view input) {
    static constexpr detail::Unit units[] = {
        {"b", 1},
        {"k", 1ull << 10},
        {"kib", 1ull << 10},
        {"kb", 1000ull},
        {"m", 1ull << 20},
        {"mib", 1ull << 20},
        {"mb", 1000ull * 1000ull},
        {"g", 1ull << 30},
        {"gib", 1ull << 30},
        {"gb", 1000ull * 1000ull * 1000ull},
        {"t", 1ull << 40},
        {"tib", 1ull << 40},
        {"tb", 1000ull * 1000ull * 1000ull * 1000ull},
    };
    return detail::parseQuantity(input, units, 1);
  }

  /**
   * Parses a timeout (e.g. "500ms", "10s", "2 min").
   * Number without suffix means seconds.
   * @return duration, or std::nullopt if the input is malformed
   */
  inline std::optional<std::chrono::milliseconds> parseTimeout(
      std::string_view input) {
    static constexpr detail::Unit units[] = {
        {"ms", 1},
        {"msec", 1},
        {"s", 1000},
        {"sec", 1000},
        {"second", 1000},
        {"seconds", 1000},
        {"m", 60'000},
        {"min", 60'000},
        {"minute", 60'000},
        {"minutes", 60'000},
    };
    auto ms = detail::parseQuantity(input, units, 1000);
    if (not ms.has_value()) {
      return std::nullopt;
    }
    return std::chrono::milliseconds(ms.value());
  }

}  // namespace histsync::util
