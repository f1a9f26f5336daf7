//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Type.hpp
// Purpose: Interned semantic types and substitution lists as seen by the
//          constant evaluator.
// Key invariants: Structurally equal types intern to the same Ty handle, so
//                 handle equality is type equality.  Ty id 0 is invalid.
// Ownership/Lifetime: TypeTable owns every TyData; Ty handles are only
//                     meaningful together with the table that produced them.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace kiln::core
{

/// @brief Handle to an interned type.
struct Ty
{
    uint32_t id = 0;

    [[nodiscard]] bool isValid() const noexcept
    {
        return id != 0;
    }
};

inline bool operator==(Ty a, Ty b) noexcept
{
    return a.id == b.id;
}

inline bool operator!=(Ty a, Ty b) noexcept
{
    return a.id != b.id;
}

/// @brief Ordered type arguments applied to a generic item.
/// @details Index i substitutes generic parameter i; for traits index 0 is Self.
using Substs = std::vector<Ty>;

/// @brief Structural categories of types.
enum class TyKind : uint8_t
{
    Bool,
    Int,     ///< Signed integer of `bits` width.
    Uint,    ///< Unsigned integer of `bits` width.
    Char,
    Str,     ///< Unsized string slice.
    Tuple,   ///< Element types in `args`; the empty tuple is unit.
    Adt,     ///< Struct or enum `def` applied to `args`.
    RawPtr,  ///< Pointer to `args[0]`.
    Slice,   ///< Unsized slice of `args[0]`.
    Dynamic, ///< Trait object of trait `def`.
    FnDef,   ///< Zero-sized function item `def` applied to `args`.
    Param,   ///< Generic parameter number `index`.
    Infer,   ///< Inference variable number `index`.
    Never,
};

/// @brief Payload of an interned type; unused fields stay zero.
struct TyData
{
    TyKind kind = TyKind::Never;
    uint32_t bits = 0;  ///< Width for Int/Uint.
    uint32_t index = 0; ///< Param or Infer number.
    DefId def{};        ///< Adt, Dynamic or FnDef definition.
    Substs args;        ///< Component types.
};

/// @brief Interner and substitution engine for types.
class TypeTable
{
  public:
    TypeTable();
    TypeTable(const TypeTable &) = delete;
    TypeTable &operator=(const TypeTable &) = delete;

    Ty boolTy();
    Ty intTy(uint32_t bits);
    Ty uintTy(uint32_t bits);
    Ty charTy();
    Ty strTy();
    Ty unitTy();
    Ty tupleTy(Substs elems);
    Ty adtTy(DefId def, Substs args);
    Ty rawPtrTy(Ty pointee);
    Ty sliceTy(Ty elem);
    Ty dynamicTy(DefId traitId);
    Ty fnDefTy(DefId def, Substs args);
    Ty paramTy(uint32_t index);
    Ty inferTy(uint32_t var);
    Ty neverTy();

    /// @brief Access the payload behind @p ty; @p ty must come from this table.
    [[nodiscard]] const TyData &get(Ty ty) const;

    [[nodiscard]] TyKind kind(Ty ty) const
    {
        return get(ty).kind;
    }

    /// @brief True when @p ty mentions a generic parameter anywhere.
    [[nodiscard]] bool hasParams(Ty ty) const;

    /// @brief True when @p ty mentions an inference variable anywhere.
    [[nodiscard]] bool hasInfer(Ty ty) const;

    /// @brief True when any element of @p substs has params or inference vars.
    [[nodiscard]] bool needsSubst(const Substs &substs) const;

    /// @brief Replace every Param(i) in @p ty with @p substs[i].
    /// @details Parameters beyond the end of @p substs are left in place.
    Ty subst(Ty ty, const Substs &substs);

    /// @brief Apply @ref subst to each element of @p list.
    Substs substAll(const Substs &list, const Substs &substs);

    /// @brief Identity substitution [Param(0), ..., Param(count-1)].
    Substs identity(uint32_t count);

    /// @brief Render @p ty for logs and diagnostics.
    [[nodiscard]] std::string toString(Ty ty) const;

    /// @brief Render @p substs as "[T0, T1, ...]".
    [[nodiscard]] std::string toString(const Substs &substs) const;

  private:
    using Key = std::tuple<uint8_t, uint32_t, uint32_t, uint32_t, uint32_t, std::vector<uint32_t>>;

    Ty intern(TyData data);

    std::vector<TyData> types_; ///< Slot 0 is a placeholder for the invalid handle.
    std::map<Key, Ty> index_;
};

} // namespace kiln::core
