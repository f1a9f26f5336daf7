//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the synthetic memory arena.  Allocations are plain byte vectors
// with a definedness mask and a relocation table; a pointer stored into memory
// writes its offset into the bytes and records the target allocation id in
// the relocation table at the pointer's offset.  Reading the same range back
// reassembles the pointer, so pointer provenance survives a round trip through
// memory while the raw bytes stay target-accurate.
//
// Function pointers refer to dedicated function allocations that carry no
// bytes; they only map an allocation id to the instance it designates.
//
//===----------------------------------------------------------------------===//

#include "mem/Memory.hpp"

#include "support/alignment.hpp"
#include "support/debug_log.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>

using kiln::eval::EvalError;
using kiln::eval::EvalErrorKind;
using kiln::eval::EvalResult;
using kiln::eval::internalError;
using kiln::eval::makeEvalError;

namespace kiln::mem
{

namespace
{
/// @brief Largest primitive the arena reads or writes in one access.
constexpr uint64_t kMaxPrimSize = 8;

std::string describeAccess(MemoryPointer ptr, uint64_t size)
{
    return "access of " + std::to_string(size) + " bytes at " + toString(ptr);
}
} // namespace

Memory::Memory(TargetDataLayout layout, uint64_t limit) : layout_(layout), limit_(limit) {}

EvalResult<MemoryPointer> Memory::allocate(uint64_t size, uint64_t align, MemoryKind kind)
{
    if (!support::isPowerOfTwo(align))
    {
        return makeEvalError(EvalErrorKind::AlignmentCheckFailed,
                             "allocation alignment " + std::to_string(align) +
                                 " is not a power of two");
    }
    if (size > layout_.maxPointerValue())
    {
        return makeEvalError(EvalErrorKind::Overflow,
                             "allocation of " + std::to_string(size) +
                                 " bytes exceeds the target address space");
    }
    if (limit_ != 0 && size > limit_ - used_)
    {
        return makeEvalError(EvalErrorKind::MemoryExhausted,
                             "allocation of " + std::to_string(size) + " bytes exceeds the " +
                                 std::to_string(limit_) + " byte evaluation memory limit");
    }

    AllocId id{nextId_++};
    Allocation alloc;
    alloc.bytes.assign(size, 0);
    alloc.defined.assign(size, false);
    alloc.align = align;
    alloc.kind = kind;
    allocs_.emplace(id, std::move(alloc));
    used_ += size;

    support::debugLog("MEM",
                      "allocate alloc%llu size=%llu align=%llu",
                      static_cast<unsigned long long>(id.id),
                      static_cast<unsigned long long>(size),
                      static_cast<unsigned long long>(align));
    return MemoryPointer{id, 0};
}

MemoryPointer Memory::createFnAlloc(const core::Instance &instance)
{
    auto it = functionIds_.find(instance);
    if (it != functionIds_.end())
        return MemoryPointer{it->second, 0};
    AllocId id{nextId_++};
    functions_.emplace(id, instance);
    functionIds_.emplace(instance, id);
    return MemoryPointer{id, 0};
}

EvalResult<core::Instance> Memory::getFn(MemoryPointer ptr) const
{
    if (ptr.offset != 0)
    {
        return makeEvalError(EvalErrorKind::InvalidFunctionPointer,
                             "function pointer " + toString(ptr) + " has a non-zero offset");
    }
    auto it = functions_.find(ptr.alloc);
    if (it != functions_.end())
        return it->second;
    if (allocs_.count(ptr.alloc))
    {
        return makeEvalError(EvalErrorKind::InvalidFunctionPointer,
                             toString(ptr) + " points at data, not at a function");
    }
    return makeEvalError(EvalErrorKind::DanglingPointerDeref,
                         "alloc" + std::to_string(ptr.alloc.id) + " does not exist");
}

EvalError Memory::danglingOrFunction(AllocId id) const
{
    if (functions_.count(id))
    {
        return makeEvalError(EvalErrorKind::DanglingPointerDeref,
                             "alloc" + std::to_string(id.id) + " is a function, not data");
    }
    return makeEvalError(EvalErrorKind::DanglingPointerDeref,
                         "alloc" + std::to_string(id.id) + " does not exist");
}

EvalResult<const Allocation *> Memory::get(AllocId id) const
{
    auto it = allocs_.find(id);
    if (it == allocs_.end())
        return danglingOrFunction(id);
    return &it->second;
}

EvalResult<Allocation *> Memory::getMut(AllocId id)
{
    auto it = allocs_.find(id);
    if (it == allocs_.end())
        return danglingOrFunction(id);
    return &it->second;
}

EvalResult<void> Memory::checkBounds(const Allocation &alloc, MemoryPointer ptr, uint64_t size) const
{
    if (ptr.offset > alloc.size() || size > alloc.size() - ptr.offset)
    {
        return makeEvalError(EvalErrorKind::PointerOutOfBounds,
                             describeAccess(ptr, size) + " is out of bounds (allocation has " +
                                 std::to_string(alloc.size()) + " bytes)");
    }
    return {};
}

/// @brief Require natural alignment for primitive accesses.
///
/// @details A primitive of @p size bytes is aligned to its size, capped at the
///          pointer alignment.  Both the allocation's base alignment and the
///          offset within it must satisfy the requirement.
EvalResult<void> Memory::checkAlignment(const Allocation &alloc, MemoryPointer ptr, uint64_t size) const
{
    if (size == 0 || !support::isPowerOfTwo(size))
        return {};
    const uint64_t required = std::min(size, layout_.pointerAlign());
    if (alloc.align < required || !support::isAligned(ptr.offset, required))
    {
        return makeEvalError(EvalErrorKind::AlignmentCheckFailed,
                             describeAccess(ptr, size) + " requires alignment " +
                                 std::to_string(required));
    }
    return {};
}

uint64_t Memory::decode(const Allocation &alloc, uint64_t offset, uint64_t size) const
{
    uint64_t bits = 0;
    for (uint64_t i = 0; i < size; ++i)
    {
        const uint64_t byteIndex = layout_.endian == Endian::Little ? size - 1 - i : i;
        bits = (bits << 8) | alloc.bytes[offset + byteIndex];
    }
    return bits;
}

void Memory::encode(Allocation &alloc, uint64_t offset, uint64_t size, uint64_t bits) const
{
    for (uint64_t i = 0; i < size; ++i)
    {
        const uint64_t byteIndex = layout_.endian == Endian::Little ? i : size - 1 - i;
        alloc.bytes[offset + byteIndex] = static_cast<uint8_t>(bits & 0xff);
        bits >>= 8;
    }
}

/// @brief Drop relocations overlapping [offset, offset + size).
///
/// @details A stored pointer that is only partially overwritten no longer
///          denotes anything, so the bytes of it that survive outside the
///          written range become undefined.
void Memory::clearRelocations(Allocation &alloc, uint64_t offset, uint64_t size)
{
    const uint64_t ptrSize = layout_.pointerSize;
    const uint64_t lower = offset >= ptrSize - 1 ? offset - (ptrSize - 1) : 0;
    const uint64_t end = offset + size;
    auto it = alloc.relocations.lower_bound(lower);
    while (it != alloc.relocations.end() && it->first < end)
    {
        const uint64_t relocStart = it->first;
        const uint64_t relocEnd = relocStart + ptrSize;
        if (relocEnd <= offset)
        {
            ++it;
            continue;
        }
        for (uint64_t i = relocStart; i < offset; ++i)
            alloc.defined[i] = false;
        for (uint64_t i = end; i < relocEnd && i < alloc.size(); ++i)
            alloc.defined[i] = false;
        it = alloc.relocations.erase(it);
    }
}

EvalResult<void> Memory::writePrimVal(MemoryPointer dest, PrimVal value, uint64_t size)
{
    auto target = getMut(dest.alloc);
    if (!target)
        return target.error();
    Allocation &alloc = *target.value();

    if (alloc.staticInitialized && alloc.mutability == Mutability::Immutable)
    {
        return makeEvalError(EvalErrorKind::ModifiedConstantMemory,
                             "tried to modify constant memory at " + toString(dest));
    }
    if (size > kMaxPrimSize)
        return internalError("primitive write of " + std::to_string(size) + " bytes");
    if (auto ok = checkBounds(alloc, dest, size); !ok)
        return ok;
    if (auto ok = checkAlignment(alloc, dest, size); !ok)
        return ok;

    switch (value.kind())
    {
        case PrimVal::Kind::Undef:
            break;
        case PrimVal::Kind::Bytes:
        {
            const uint64_t bits = value.toBytes().value();
            if (size < kMaxPrimSize && (bits >> (size * 8)) != 0)
            {
                return internalError("integer " + std::to_string(bits) + " does not fit in " +
                                     std::to_string(size) + " bytes");
            }
            break;
        }
        case PrimVal::Kind::Ptr:
            if (size != layout_.pointerSize)
            {
                return internalError("pointer written with size " + std::to_string(size) +
                                     ", target pointers have " +
                                     std::to_string(layout_.pointerSize) + " bytes");
            }
            break;
    }

    // Nothing below can fail; the allocation is only touched from here on.
    clearRelocations(alloc, dest.offset, size);
    const auto first = alloc.defined.begin() + static_cast<std::ptrdiff_t>(dest.offset);
    switch (value.kind())
    {
        case PrimVal::Kind::Undef:
            std::fill_n(first, size, false);
            return {};
        case PrimVal::Kind::Bytes:
            encode(alloc, dest.offset, size, value.toBytes().value());
            break;
        case PrimVal::Kind::Ptr:
        {
            const MemoryPointer ptr = value.toPtr().value();
            encode(alloc, dest.offset, size, ptr.offset);
            alloc.relocations[dest.offset] = ptr.alloc;
            break;
        }
    }
    std::fill_n(first, size, true);
    return {};
}

EvalResult<PrimVal> Memory::readPrimVal(MemoryPointer src, uint64_t size) const
{
    auto source = get(src.alloc);
    if (!source)
        return source.error();
    const Allocation &alloc = *source.value();

    if (size > kMaxPrimSize)
        return internalError("primitive read of " + std::to_string(size) + " bytes");
    if (auto ok = checkBounds(alloc, src, size); !ok)
        return ok.error();
    if (auto ok = checkAlignment(alloc, src, size); !ok)
        return ok.error();

    const uint64_t ptrSize = layout_.pointerSize;
    const uint64_t lower = src.offset >= ptrSize - 1 ? src.offset - (ptrSize - 1) : 0;
    const uint64_t end = src.offset + size;
    std::optional<AllocId> pointee;
    for (auto it = alloc.relocations.lower_bound(lower); it != alloc.relocations.end() && it->first < end;
         ++it)
    {
        if (it->first + ptrSize <= src.offset)
            continue;
        if (it->first != src.offset || size != ptrSize)
        {
            return makeEvalError(EvalErrorKind::ReadPointerAsBytes,
                                 describeAccess(src, size) + " reads part of a stored pointer");
        }
        pointee = it->second;
    }

    auto defined = isDefined(src, size);
    if (!defined)
        return defined.error();
    if (!defined.value())
        return PrimVal::undef();

    const uint64_t bits = decode(alloc, src.offset, size);
    if (pointee)
        return PrimVal::fromPtr(MemoryPointer{*pointee, bits});
    return PrimVal::fromBytes(bits);
}

EvalResult<void> Memory::writePtrSizedUnsigned(MemoryPointer dest, PrimVal value)
{
    return writePrimVal(dest, value, layout_.pointerSize);
}

EvalResult<PrimVal> Memory::readPtrSizedUnsigned(MemoryPointer src) const
{
    return readPrimVal(src, layout_.pointerSize);
}

EvalResult<bool> Memory::isDefined(MemoryPointer src, uint64_t size) const
{
    auto source = get(src.alloc);
    if (!source)
        return source.error();
    const Allocation &alloc = *source.value();
    if (auto ok = checkBounds(alloc, src, size); !ok)
        return ok.error();
    const auto first = alloc.defined.begin() + static_cast<std::ptrdiff_t>(src.offset);
    return std::all_of(first, first + static_cast<std::ptrdiff_t>(size), [](bool b) { return b; });
}

void Memory::markInner(AllocId id, Mutability mutability)
{
    auto it = allocs_.find(id);
    if (it == allocs_.end() || it->second.staticInitialized)
        return;
    Allocation &alloc = it->second;
    alloc.staticInitialized = true;
    alloc.mutability = mutability;
    if (alloc.kind == MemoryKind::Heap)
        alloc.kind = MemoryKind::Static;
    std::vector<AllocId> inner;
    inner.reserve(alloc.relocations.size());
    for (const auto &entry : alloc.relocations)
        inner.push_back(entry.second);
    for (AllocId target : inner)
        markInner(target, mutability);
}

EvalResult<void> Memory::markStaticInitialized(AllocId id, Mutability mutability)
{
    if (functions_.count(id))
        return internalError("cannot mark function alloc" + std::to_string(id.id) + " as static");
    auto target = getMut(id);
    if (!target)
        return target.error();
    Allocation &alloc = *target.value();
    if (alloc.staticInitialized)
    {
        if (alloc.mutability == mutability)
            return {};
        return internalError("alloc" + std::to_string(id.id) +
                             " is already static with a different mutability");
    }
    markInner(id, mutability);
    support::debugLog("MEM",
                      "alloc%llu marked static (%s)",
                      static_cast<unsigned long long>(id.id),
                      mutability == Mutability::Immutable ? "immutable" : "mutable");
    return {};
}

} // namespace kiln::mem
