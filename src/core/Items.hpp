//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Items.hpp
// Purpose: The item table: definitions, associated items, trait ownership,
//          defaultness and supertraits, as the evaluator reads them.
// Key invariants: Associated items of a trait or impl are kept in declaration
//                 order; an associated item has exactly one container.
// Ownership/Lifetime: The table owns all item records and the name interner.
//                     The evaluator only holds a const reference; the front end
//                     (or a test) populates it before evaluation starts.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/TraitRef.hpp"
#include "core/Type.hpp"
#include "support/string_interner.hpp"

#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kiln::core
{

/// @brief Kind of a definition, as reported by @ref ItemTable::describeDef.
enum class DefKind : uint8_t
{
    Const,
    Fn,
    Struct,
    Trait,
    Impl,
    AssociatedConst,
    AssociatedFn,
};

/// @brief Kind of an associated item.
enum class AssocKind : uint8_t
{
    Const,
    Method,
};

/// @brief Whether an associated item lives in a trait or in an impl block.
enum class ContainerKind : uint8_t
{
    Trait,
    Impl,
};

/// @brief Extra properties of a trait method that decide vtable eligibility.
struct MethodFlags
{
    uint32_t ownGenerics = 0;       ///< Generic parameters declared on the method itself.
    bool requiresSelfSized = false; ///< Method carries `where Self: Sized`.
    bool hasDefault = false;        ///< Trait provides a body.
};

/// @brief One associated constant or method.
struct AssociatedItem
{
    DefId def{};
    support::Symbol name{};
    AssocKind kind = AssocKind::Const;
    ContainerKind containerKind = ContainerKind::Trait;
    DefId container{};
    /// True when the item carries a value/body, not only a signature.  Impl
    /// items always have one; trait items only when they provide a default.
    bool hasValue = false;
    MethodFlags method{};
};

/// @brief Read-only compiler tables for items, populated by the front end.
class ItemTable
{
  public:
    ItemTable() = default;
    ItemTable(const ItemTable &) = delete;
    ItemTable &operator=(const ItemTable &) = delete;

    //===------------------------------------------------------------------===//
    // Population
    //===------------------------------------------------------------------===//

    /// @brief Declare a trait with @p generics parameters, Self included.
    DefId addTrait(std::string_view name, uint32_t generics = 1, uint32_t krate = kLocalCrate);

    /// @brief Record @p super as a supertrait of @p trait.
    /// @details @p super is expressed in terms of @p trait's own parameters,
    ///          e.g. `[Param(0)]` for `trait Sub: Super`.
    void addSupertrait(DefId trait, TraitRef super);

    /// @brief Declare `const NAME` in @p trait, with or without a default value.
    DefId addTraitConst(DefId trait, std::string_view name, bool hasDefault);

    /// @brief Declare a method in @p trait.
    DefId addTraitMethod(DefId trait, std::string_view name, MethodFlags flags = {});

    /// @brief Declare `impl Trait for Self` with @p generics impl parameters.
    DefId addTraitImpl(TraitRef traitRef, uint32_t generics = 0, uint32_t krate = kLocalCrate);

    /// @brief Declare an inherent `impl Self` block.
    DefId addInherentImpl(Ty selfTy, uint32_t generics = 0, uint32_t krate = kLocalCrate);

    /// @brief Add `const NAME = ...` to impl @p impl.
    DefId addImplConst(DefId impl, std::string_view name);

    /// @brief Add a method body to impl @p impl.
    DefId addImplMethod(DefId impl, std::string_view name);

    /// @brief Declare a free-standing constant.
    DefId addConst(std::string_view name, uint32_t krate = kLocalCrate);

    /// @brief Declare a free function with @p generics parameters.
    DefId addFn(std::string_view name, uint32_t generics = 0, uint32_t krate = kLocalCrate);

    /// @brief Declare a struct with @p generics parameters.
    DefId addStruct(std::string_view name, uint32_t generics = 0, uint32_t krate = kLocalCrate);

    //===------------------------------------------------------------------===//
    // Queries
    //===------------------------------------------------------------------===//

    /// @brief Kind of @p def, or nullopt for unknown ids.
    [[nodiscard]] std::optional<DefKind> describeDef(DefId def) const;

    /// @brief True for a local item declared inside a trait body.
    [[nodiscard]] bool isLocalTraitItem(DefId def) const;

    /// @brief Owning trait when @p def is declared inside a trait.
    [[nodiscard]] std::optional<DefId> traitOfItem(DefId def) const;

    /// @brief Associated item record for @p def, or nullptr.
    [[nodiscard]] const AssociatedItem *associatedItem(DefId def) const;

    /// @brief Associated items of a trait or impl in declaration order.
    [[nodiscard]] std::vector<const AssociatedItem *> associatedItems(DefId container) const;

    /// @brief Number of generic parameters in scope for @p def, parents included.
    [[nodiscard]] uint32_t genericsCount(DefId def) const;

    /// @brief Declared supertraits of @p trait.
    [[nodiscard]] const std::vector<TraitRef> &supertraits(DefId trait) const;

    /// @brief Trait reference implemented by impl @p impl, if it is a trait impl.
    [[nodiscard]] std::optional<TraitRef> implTraitRef(DefId impl) const;

    /// @brief Self type of impl @p impl.
    [[nodiscard]] Ty implSelfTy(DefId impl) const;

    /// @brief Every trait impl of @p trait in declaration order.
    [[nodiscard]] std::vector<DefId> implsOfTrait(DefId trait) const;

    /// @brief Item name; empty for unknown ids.
    [[nodiscard]] std::string_view name(DefId def) const;

    [[nodiscard]] support::Symbol nameSymbol(DefId def) const;

    /// @brief Intern @p name, for callers that match items by name.
    support::Symbol intern(std::string_view name);

  private:
    struct ItemRecord
    {
        DefKind kind = DefKind::Const;
        support::Symbol name{};
        DefId parent{};
        uint32_t generics = 0;
        std::vector<DefId> children;
        std::vector<TraitRef> supertraits;
        std::optional<TraitRef> implTrait;
        Ty implSelf{};
        std::optional<AssociatedItem> assoc;
    };

    DefId addItem(uint32_t krate, ItemRecord record);
    DefId addAssociated(DefId container, std::string_view name, AssociatedItem item);
    const ItemRecord *find(DefId def) const;

    support::StringInterner names_;
    std::unordered_map<DefId, ItemRecord> items_;
    std::vector<DefId> order_;
    std::unordered_map<uint32_t, uint32_t> nextIndex_;
};

} // namespace kiln::core
