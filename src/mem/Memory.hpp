//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: mem/Memory.hpp
// Purpose: Synthetic memory arena of the constant evaluator.
// Key invariants: Every access is bounds-, alignment- and mutability-checked.
//                 Stored pointers are tracked as relocations, never encoded as
//                 host addresses.  An allocation marked static and immutable
//                 rejects all further writes.
// Ownership/Lifetime: Memory owns all allocations; they live until the Memory
//                     is destroyed at the end of the compilation session.
//                     Each Memory is used by one evaluation thread at a time.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Instance.hpp"
#include "eval/EvalError.hpp"
#include "mem/Pointer.hpp"
#include "mem/PrimVal.hpp"
#include "mem/TargetDataLayout.hpp"

#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace kiln::mem
{

/// @brief Origin of an allocation.
enum class MemoryKind : uint8_t
{
    Heap,   ///< Scratch memory created during evaluation.
    Static, ///< Backing memory of a constant or static item.
    Vtable, ///< Trait-object vtable.
};

/// @brief Whether an allocation may be written after static initialisation.
enum class Mutability : uint8_t
{
    Mutable,
    Immutable
};

/// @brief One region of synthetic memory.
struct Allocation
{
    std::vector<uint8_t> bytes;              ///< Raw contents.
    std::vector<bool> defined;               ///< Per-byte initialisation mask.
    std::map<uint64_t, AllocId> relocations; ///< Offset of each stored pointer -> target.
    uint64_t align = 1;
    MemoryKind kind = MemoryKind::Heap;
    Mutability mutability = Mutability::Mutable;
    bool staticInitialized = false;

    [[nodiscard]] uint64_t size() const noexcept
    {
        return bytes.size();
    }
};

/// @brief The evaluator's private address space.
class Memory
{
  public:
    /// @param layout Target pointer width and byte order.
    /// @param limit  Maximum total allocated bytes; 0 disables the limit.
    explicit Memory(TargetDataLayout layout, uint64_t limit = 0);

    Memory(const Memory &) = delete;
    Memory &operator=(const Memory &) = delete;

    [[nodiscard]] const TargetDataLayout &layout() const noexcept
    {
        return layout_;
    }

    [[nodiscard]] uint64_t pointerSize() const noexcept
    {
        return layout_.pointerSize;
    }

    /// @brief Create a fresh zero-filled, undefined allocation.
    /// @return Pointer to offset 0; AlignmentCheckFailed for a non power-of-two
    ///         @p align, MemoryExhausted when the limit would be exceeded.
    eval::EvalResult<MemoryPointer> allocate(uint64_t size, uint64_t align, MemoryKind kind);

    /// @brief Pointer to the function allocation designating @p instance.
    /// @details The same instance always maps to the same allocation.
    MemoryPointer createFnAlloc(const core::Instance &instance);

    /// @brief Instance designated by a function pointer.
    eval::EvalResult<core::Instance> getFn(MemoryPointer ptr) const;

    /// @brief Look up a data allocation.
    eval::EvalResult<const Allocation *> get(AllocId id) const;

    /// @brief Freeze @p id as static data with @p mutability.
    /// @details Heap allocations reachable through its relocations are frozen
    ///          with it, since the static now owns them.
    eval::EvalResult<void> markStaticInitialized(AllocId id, Mutability mutability);

    /// @brief Store @p value in @p size bytes at @p dest.
    /// @details Pointers require @p size == pointer size and record a
    ///          relocation; Undef clears the destination's definedness.
    eval::EvalResult<void> writePrimVal(MemoryPointer dest, PrimVal value, uint64_t size);

    /// @brief Load @p size bytes at @p src.
    /// @return Undef when any byte is uninitialised, Ptr when a relocation
    ///         starts exactly at @p src and covers the access, Bytes otherwise.
    ///         ReadPointerAsBytes when the range cuts through a stored pointer.
    eval::EvalResult<PrimVal> readPrimVal(MemoryPointer src, uint64_t size) const;

    eval::EvalResult<void> writePtrSizedUnsigned(MemoryPointer dest, PrimVal value);
    eval::EvalResult<PrimVal> readPtrSizedUnsigned(MemoryPointer src) const;

    /// @brief Whether all @p size bytes at @p src are initialised.
    eval::EvalResult<bool> isDefined(MemoryPointer src, uint64_t size) const;

    /// @brief Total bytes held by data allocations.
    [[nodiscard]] uint64_t totalBytes() const noexcept
    {
        return used_;
    }

    /// @brief Number of data allocations.
    [[nodiscard]] size_t allocationCount() const noexcept
    {
        return allocs_.size();
    }

  private:
    eval::EvalResult<Allocation *> getMut(AllocId id);
    eval::EvalResult<void> checkBounds(const Allocation &alloc, MemoryPointer ptr, uint64_t size) const;
    eval::EvalResult<void> checkAlignment(const Allocation &alloc, MemoryPointer ptr, uint64_t size) const;
    eval::EvalError danglingOrFunction(AllocId id) const;
    void clearRelocations(Allocation &alloc, uint64_t offset, uint64_t size);
    void markInner(AllocId id, Mutability mutability);
    uint64_t decode(const Allocation &alloc, uint64_t offset, uint64_t size) const;
    void encode(Allocation &alloc, uint64_t offset, uint64_t size, uint64_t bits) const;

    TargetDataLayout layout_;
    uint64_t limit_ = 0;
    uint64_t used_ = 0;
    uint64_t nextId_ = 1;
    std::unordered_map<AllocId, Allocation> allocs_;
    std::unordered_map<AllocId, core::Instance> functions_;
    std::unordered_map<core::Instance, AllocId> functionIds_;
};

} // namespace kiln::mem
