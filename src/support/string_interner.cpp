//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the string interner backing item names in the item table.
//
//===----------------------------------------------------------------------===//

#include "support/string_interner.hpp"

namespace kiln::support
{

/// @brief Intern the given string and return its Symbol handle.
///
/// @details A string seen for the first time is copied into `storage_` and
///          receives the 1-based index of its slot, so id zero stays free as
///          the invalid sentinel.  `storage_` is a deque, which keeps element
///          addresses stable across growth; the map can therefore key on views
///          into the stored strings.
Symbol StringInterner::intern(std::string_view str)
{
    auto it = map_.find(str);
    if (it != map_.end())
        return it->second;
    storage_.emplace_back(str);
    Symbol sym{static_cast<uint32_t>(storage_.size())};
    map_.emplace(std::string_view{storage_.back()}, sym);
    return sym;
}

std::string_view StringInterner::lookup(Symbol sym) const
{
    if (sym.id == 0 || sym.id > storage_.size())
        return {};
    return storage_[sym.id - 1];
}
} // namespace kiln::support
