//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/string_interner.hpp
// Purpose: Declares the interner that maps item names to Symbol handles.
// Key invariants: Symbol id 0 is never produced; ids are 1-based storage slots.
// Ownership/Lifetime: Interner owns stored strings; returned views live as
//                     long as the interner.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/symbol.hpp"

#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kiln::support
{

/// @brief Interns strings to provide stable Symbol identifiers.
class StringInterner
{
  public:
    StringInterner() = default;
    StringInterner(const StringInterner &) = delete;
    StringInterner &operator=(const StringInterner &) = delete;

    /// @brief Intern @p str, returning the existing symbol when already seen.
    Symbol intern(std::string_view str);

    /// @brief Retrieve the text for @p sym; empty for invalid symbols.
    std::string_view lookup(Symbol sym) const;

  private:
    /// Keys view into storage_, which never relocates its strings.
    std::unordered_map<std::string_view, Symbol> map_;
    std::deque<std::string> storage_;
};
} // namespace kiln::support
