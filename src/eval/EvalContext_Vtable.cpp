//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Vtable synthesis and the accessors used by trait-object method calls and
// drops.  A vtable for pointer width P is laid out as
//
//   0        drop glue fn pointer, or integer zero when dropping is a no-op
//   P        size of the concrete type
//   2P       alignment of the concrete type
//   3P + iP  method i, or undefined bytes when method i is not object safe
//
// Every pointer-sized field is written through the synthetic memory arena, so
// function pointers are relocations to function allocations and never host
// addresses.
//
//===----------------------------------------------------------------------===//

#include "eval/EvalContext.hpp"

#include "support/debug_log.hpp"

#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace kiln::eval
{

namespace
{
constexpr uint64_t kDropSlot = 0;
constexpr uint64_t kSizeSlot = 1;
constexpr uint64_t kAlignSlot = 2;
constexpr uint64_t kFirstMethodSlot = 3;
} // namespace

EvalResult<mem::MemoryPointer> EvalContext::vtableSlot(mem::MemoryPointer vtable, uint64_t slot) const
{
    const uint64_t ptrSize = memory_.pointerSize();
    if (slot > std::numeric_limits<uint64_t>::max() / ptrSize)
    {
        return makeEvalError(EvalErrorKind::PointerOutOfBounds,
                             "vtable slot " + std::to_string(slot) + " is out of bounds");
    }
    return vtable.offsetBy(slot * ptrSize, memory_.layout());
}

/// @brief Write one pointer-sized field of a vtable under construction.
/// @details The allocation was sized for every slot, so an out-of-bounds or
///          overflowing offset here is a bug in the synthesiser itself.
EvalResult<void> EvalContext::writeVtableSlot(mem::MemoryPointer vtable, uint64_t slot, mem::PrimVal value)
{
    auto dest = vtableSlot(vtable, slot);
    if (!dest)
        return internalError("vtable slot " + std::to_string(slot) + ": " + dest.error().message);
    auto written = memory_.writePtrSizedUnsigned(dest.value(), value);
    if (!written && written.error().kind == EvalErrorKind::PointerOutOfBounds)
        return internalError("vtable slot " + std::to_string(slot) + ": " + written.error().message);
    return written;
}

EvalResult<mem::MemoryPointer> EvalContext::getVtable(core::Ty ty, const core::TraitRef &traitRef)
{
    auto layout = services_.layouts.layoutOf(ty);
    if (!layout)
    {
        if (layout.error().kind == EvalErrorKind::Unsized)
            return internalError("can't create a vtable for an unsized type " + services_.types.toString(ty));
        return layout.error();
    }

    // Everything fallible is resolved before the allocation exists.
    auto drop = services_.instances.resolveDropGlue(ty);
    if (!drop)
        return drop.error();
    const auto methods = services_.methods.vtableMethods(traitRef);
    std::vector<std::optional<core::Instance>> slots;
    slots.reserve(methods.size());
    for (const auto &method : methods)
    {
        if (!method)
        {
            slots.emplace_back();
            continue;
        }
        auto instance = services_.instances.resolveInstance(method->def, method->substs);
        if (!instance)
            return instance.error();
        slots.emplace_back(instance.value());
    }

    const uint64_t ptrSize = memory_.pointerSize();
    const uint64_t slotCount = kFirstMethodSlot + slots.size();
    auto vtable = memory_.allocate(ptrSize * slotCount, memory_.layout().pointerAlign(), mem::MemoryKind::Vtable);
    if (!vtable)
        return vtable.error();
    const mem::MemoryPointer base = vtable.value();

    const mem::PrimVal dropFn = drop.value() ? mem::PrimVal::fromPtr(memory_.createFnAlloc(*drop.value()))
                                             : mem::PrimVal::fromBytes(0);
    if (auto ok = writeVtableSlot(base, kDropSlot, dropFn); !ok)
        return ok.error();
    if (auto ok = writeVtableSlot(base, kSizeSlot, mem::PrimVal::fromBytes(layout->size)); !ok)
        return ok.error();
    if (auto ok = writeVtableSlot(base, kAlignSlot, mem::PrimVal::fromBytes(layout->align)); !ok)
        return ok.error();

    for (size_t i = 0; i < slots.size(); ++i)
    {
        if (!slots[i])
            continue;
        const mem::MemoryPointer fn = memory_.createFnAlloc(*slots[i]);
        if (auto ok = writeVtableSlot(base, kFirstMethodSlot + i, mem::PrimVal::fromPtr(fn)); !ok)
            return ok.error();
    }

    if (auto ok = memory_.markStaticInitialized(base.alloc, mem::Mutability::Immutable); !ok)
        return ok.error();

    support::debugLog("EVAL",
                      "vtable for %s as %s: %s, %zu method slots",
                      services_.types.toString(ty).c_str(),
                      core::toString(traitRef.traitId).c_str(),
                      mem::toString(base).c_str(),
                      methods.size());
    return base;
}

EvalResult<std::optional<core::Instance>> EvalContext::readDropTypeFromVtable(mem::MemoryPointer vtable) const
{
    auto slot = readPtr(vtable);
    if (!slot)
        return slot.error();
    auto scalar = slot->toScalar();
    if (!scalar)
        return scalar.error();
    const mem::PrimVal &value = scalar.value();
    if (value.isBytes() && value.isNull())
        return std::optional<core::Instance>();
    if (!value.isPtr())
    {
        return makeEvalError(EvalErrorKind::ReadBytesAsPointer,
                             "vtable drop slot at " + mem::toString(vtable) + " holds no function pointer");
    }
    auto fn = memory_.getFn(value.toPtr().value());
    if (!fn)
        return fn.error();
    return std::optional<core::Instance>(fn.value());
}

EvalResult<std::pair<uint64_t, uint64_t>> EvalContext::readSizeAndAlignFromVtable(mem::MemoryPointer vtable) const
{
    auto sizePtr = vtableSlot(vtable, kSizeSlot);
    if (!sizePtr)
        return sizePtr.error();
    auto alignPtr = vtableSlot(vtable, kAlignSlot);
    if (!alignPtr)
        return alignPtr.error();

    auto size = readPtr(sizePtr.value());
    if (!size)
        return size.error();
    auto align = readPtr(alignPtr.value());
    if (!align)
        return align.error();

    auto sizeBits = size->first.toBytes();
    if (!sizeBits)
        return sizeBits.error();
    auto alignBits = align->first.toBytes();
    if (!alignBits)
        return alignBits.error();
    return std::make_pair(sizeBits.value(), alignBits.value());
}

EvalResult<std::optional<core::Instance>> EvalContext::readMethodFromVtable(mem::MemoryPointer vtable,
                                                                            size_t index) const
{
    const uint64_t slotIndex = kFirstMethodSlot + static_cast<uint64_t>(index);
    if (slotIndex < index)
    {
        return makeEvalError(EvalErrorKind::PointerOutOfBounds,
                             "vtable method index " + std::to_string(index) + " is out of bounds");
    }
    auto slotPtr = vtableSlot(vtable, slotIndex);
    if (!slotPtr)
    {
        if (slotPtr.error().kind == EvalErrorKind::Overflow)
            return makeEvalError(EvalErrorKind::PointerOutOfBounds, slotPtr.error().message);
        return slotPtr.error();
    }

    auto slot = readPtr(slotPtr.value());
    if (!slot)
        return slot.error();
    auto scalar = slot->toScalar();
    if (!scalar)
        return scalar.error();
    const mem::PrimVal &value = scalar.value();
    if (value.isUndef())
        return std::optional<core::Instance>();
    if (!value.isPtr())
    {
        return makeEvalError(EvalErrorKind::ReadBytesAsPointer,
                             "vtable method slot " + std::to_string(index) + " holds no function pointer");
    }
    auto fn = memory_.getFn(value.toPtr().value());
    if (!fn)
        return fn.error();
    return std::optional<core::Instance>(fn.value());
}

} // namespace kiln::eval
