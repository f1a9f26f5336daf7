//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/MemoryTests.cpp
// Purpose: Validate the synthetic memory arena: checked accesses, pointer
//          relocations, function allocations, static freezing and the
//          allocation limit.
// Key invariants: Pointers survive a store/load round trip only when read
//                 back whole; every fault surfaces as a typed EvalError.
// Ownership/Lifetime: Each test owns its Memory instance.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "core/DefId.hpp"
#include "core/Instance.hpp"
#include "mem/Memory.hpp"

#include <cstdint>

using namespace kiln;
using kiln::eval::EvalErrorKind;
using kiln::mem::MemoryKind;
using kiln::mem::MemoryPointer;
using kiln::mem::Mutability;
using kiln::mem::PrimVal;

namespace
{
mem::TargetDataLayout target(uint64_t pointerSize, mem::Endian endian = mem::Endian::Little)
{
    return mem::TargetDataLayout{pointerSize, endian};
}

MemoryPointer at(MemoryPointer base, uint64_t offset)
{
    return MemoryPointer{base.alloc, base.offset + offset};
}

core::Instance fnInstance(uint32_t index)
{
    return core::Instance::item(core::DefId{core::kLocalCrate, index}, {});
}
} // namespace

TEST(MemoryTest, FreshAllocationIsUndefined)
{
    mem::Memory memory(target(8));
    auto ptr = memory.allocate(16, 8, MemoryKind::Heap);
    ASSERT_TRUE(ptr);
    EXPECT_EQ(ptr->offset, 0u);
    EXPECT_EQ(memory.totalBytes(), 16u);
    EXPECT_EQ(memory.allocationCount(), 1u);

    auto defined = memory.isDefined(ptr.value(), 16);
    ASSERT_TRUE(defined);
    EXPECT_FALSE(defined.value());

    auto read = memory.readPrimVal(ptr.value(), 8);
    ASSERT_TRUE(read);
    EXPECT_TRUE(read->isUndef());
}

TEST(MemoryTest, IntegersUseTargetByteOrder)
{
    mem::Memory little(target(8));
    auto a = little.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(a);
    ASSERT_TRUE(little.writePrimVal(a.value(), PrimVal::fromBytes(0x0102030405060708ull), 8));
    auto read = little.readPrimVal(a.value(), 8);
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value(), PrimVal::fromBytes(0x0102030405060708ull));
    auto alloc = little.get(a->alloc);
    ASSERT_TRUE(alloc);
    EXPECT_EQ(alloc.value()->bytes[0], 0x08);
    EXPECT_EQ(alloc.value()->bytes[7], 0x01);

    mem::Memory big(target(4, mem::Endian::Big));
    auto b = big.allocate(4, 4, MemoryKind::Heap);
    ASSERT_TRUE(b);
    ASSERT_TRUE(big.writePrimVal(b.value(), PrimVal::fromBytes(0x0102), 2));
    auto bigAlloc = big.get(b->alloc);
    ASSERT_TRUE(bigAlloc);
    EXPECT_EQ(bigAlloc.value()->bytes[0], 0x01);
    EXPECT_EQ(bigAlloc.value()->bytes[1], 0x02);
    auto bigRead = big.readPrimVal(b.value(), 2);
    ASSERT_TRUE(bigRead);
    EXPECT_EQ(bigRead.value(), PrimVal::fromBytes(0x0102));
}

TEST(MemoryTest, StoredPointerReadsBackAsPointer)
{
    mem::Memory memory(target(8));
    auto holder = memory.allocate(8, 8, MemoryKind::Heap);
    auto pointee = memory.allocate(16, 8, MemoryKind::Heap);
    ASSERT_TRUE(holder);
    ASSERT_TRUE(pointee);

    const MemoryPointer target4 = at(pointee.value(), 4);
    ASSERT_TRUE(memory.writePtrSizedUnsigned(holder.value(), PrimVal::fromPtr(target4)));

    auto read = memory.readPtrSizedUnsigned(holder.value());
    ASSERT_TRUE(read);
    ASSERT_TRUE(read->isPtr());
    EXPECT_EQ(read->toPtr().value(), target4);

    auto alloc = memory.get(holder->alloc);
    ASSERT_TRUE(alloc);
    EXPECT_EQ(alloc.value()->relocations.size(), 1u);
    EXPECT_EQ(alloc.value()->bytes[0], 4);
}

TEST(MemoryTest, PartialPointerReadFails)
{
    mem::Memory memory(target(8));
    auto holder = memory.allocate(8, 8, MemoryKind::Heap);
    auto pointee = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(holder);
    ASSERT_TRUE(pointee);
    ASSERT_TRUE(memory.writePtrSizedUnsigned(holder.value(), PrimVal::fromPtr(pointee.value())));

    auto low = memory.readPrimVal(holder.value(), 4);
    ASSERT_FALSE(low);
    EXPECT_EQ(low.error().kind, EvalErrorKind::ReadPointerAsBytes);

    auto high = memory.readPrimVal(at(holder.value(), 4), 4);
    ASSERT_FALSE(high);
    EXPECT_EQ(high.error().kind, EvalErrorKind::ReadPointerAsBytes);
}

TEST(MemoryTest, OverwritingHalfAPointerInvalidatesTheRest)
{
    mem::Memory memory(target(8));
    auto holder = memory.allocate(8, 8, MemoryKind::Heap);
    auto pointee = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(holder);
    ASSERT_TRUE(pointee);
    ASSERT_TRUE(memory.writePtrSizedUnsigned(holder.value(), PrimVal::fromPtr(pointee.value())));
    ASSERT_TRUE(memory.writePrimVal(holder.value(), PrimVal::fromBytes(0), 4));

    auto alloc = memory.get(holder->alloc);
    ASSERT_TRUE(alloc);
    EXPECT_TRUE(alloc.value()->relocations.empty());

    auto low = memory.readPrimVal(holder.value(), 4);
    ASSERT_TRUE(low);
    EXPECT_EQ(low.value(), PrimVal::fromBytes(0));

    auto high = memory.readPrimVal(at(holder.value(), 4), 4);
    ASSERT_TRUE(high);
    EXPECT_TRUE(high->isUndef());
}

TEST(MemoryTest, UndefWriteClearsDefinedness)
{
    mem::Memory memory(target(8));
    auto a = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(a);
    ASSERT_TRUE(memory.writePrimVal(a.value(), PrimVal::fromBytes(7), 8));
    ASSERT_TRUE(memory.writePrimVal(a.value(), PrimVal::undef(), 8));
    auto read = memory.readPrimVal(a.value(), 8);
    ASSERT_TRUE(read);
    EXPECT_TRUE(read->isUndef());
}

TEST(MemoryTest, AccessPastTheEndIsOutOfBounds)
{
    mem::Memory memory(target(8));
    auto a = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(a);

    auto read = memory.readPrimVal(at(a.value(), 8), 8);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().kind, EvalErrorKind::PointerOutOfBounds);

    auto write = memory.writePrimVal(at(a.value(), 6), PrimVal::fromBytes(1), 4);
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().kind, EvalErrorKind::PointerOutOfBounds);
}

TEST(MemoryTest, MisalignedAccessIsRejected)
{
    mem::Memory memory(target(8));
    auto a = memory.allocate(16, 8, MemoryKind::Heap);
    ASSERT_TRUE(a);
    auto write = memory.writePrimVal(at(a.value(), 2), PrimVal::fromBytes(1), 4);
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().kind, EvalErrorKind::AlignmentCheckFailed);

    auto byteAligned = memory.allocate(16, 1, MemoryKind::Heap);
    ASSERT_TRUE(byteAligned);
    auto wide = memory.readPrimVal(byteAligned.value(), 8);
    ASSERT_FALSE(wide);
    EXPECT_EQ(wide.error().kind, EvalErrorKind::AlignmentCheckFailed);

    auto bad = memory.allocate(8, 3, MemoryKind::Heap);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().kind, EvalErrorKind::AlignmentCheckFailed);
}

TEST(MemoryTest, MisSizedWritesAreInternalErrors)
{
    mem::Memory memory(target(8));
    auto a = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(a);

    auto wide = memory.writePrimVal(a.value(), PrimVal::fromBytes(0x1ff), 1);
    ASSERT_FALSE(wide);
    EXPECT_EQ(wide.error().kind, EvalErrorKind::Internal);

    auto shortPtr = memory.writePrimVal(a.value(), PrimVal::fromPtr(a.value()), 4);
    ASSERT_FALSE(shortPtr);
    EXPECT_EQ(shortPtr.error().kind, EvalErrorKind::Internal);
}

TEST(MemoryTest, RejectedWriteLeavesStoredPointerIntact)
{
    mem::Memory memory(target(8));
    auto holder = memory.allocate(8, 8, MemoryKind::Heap);
    auto pointee = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(holder);
    ASSERT_TRUE(pointee);
    ASSERT_TRUE(memory.writePtrSizedUnsigned(holder.value(), PrimVal::fromPtr(pointee.value())));

    auto wide = memory.writePrimVal(holder.value(), PrimVal::fromBytes(uint64_t{1} << 40), 4);
    ASSERT_FALSE(wide);
    EXPECT_EQ(wide.error().kind, EvalErrorKind::Internal);

    auto shortPtr = memory.writePrimVal(at(holder.value(), 4), PrimVal::fromPtr(pointee.value()), 4);
    ASSERT_FALSE(shortPtr);
    EXPECT_EQ(shortPtr.error().kind, EvalErrorKind::Internal);

    auto read = memory.readPtrSizedUnsigned(holder.value());
    ASSERT_TRUE(read);
    ASSERT_TRUE(read->isPtr());
    EXPECT_EQ(read->toPtr().value(), pointee.value());
}

TEST(MemoryTest, UnknownAllocationIsDangling)
{
    mem::Memory memory(target(8));
    auto read = memory.readPrimVal(MemoryPointer{mem::AllocId{999}, 0}, 8);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().kind, EvalErrorKind::DanglingPointerDeref);
}

TEST(MemoryTest, FunctionAllocationsAreDeduplicated)
{
    mem::Memory memory(target(8));
    const MemoryPointer f = memory.createFnAlloc(fnInstance(1));
    const MemoryPointer again = memory.createFnAlloc(fnInstance(1));
    const MemoryPointer g = memory.createFnAlloc(fnInstance(2));
    EXPECT_EQ(f, again);
    EXPECT_NE(f.alloc, g.alloc);
    EXPECT_EQ(memory.allocationCount(), 0u);

    auto instance = memory.getFn(f);
    ASSERT_TRUE(instance);
    EXPECT_EQ(instance.value(), fnInstance(1));
}

TEST(MemoryTest, FunctionPointersAreCheckedOnUse)
{
    mem::Memory memory(target(8));
    const MemoryPointer f = memory.createFnAlloc(fnInstance(1));
    auto data = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(data);

    auto offset = memory.getFn(at(f, 1));
    ASSERT_FALSE(offset);
    EXPECT_EQ(offset.error().kind, EvalErrorKind::InvalidFunctionPointer);

    auto notFn = memory.getFn(data.value());
    ASSERT_FALSE(notFn);
    EXPECT_EQ(notFn.error().kind, EvalErrorKind::InvalidFunctionPointer);

    auto asData = memory.get(f.alloc);
    ASSERT_FALSE(asData);
    EXPECT_EQ(asData.error().kind, EvalErrorKind::DanglingPointerDeref);
}

TEST(MemoryTest, ImmutableStaticRejectsWrites)
{
    mem::Memory memory(target(8));
    auto frozen = memory.allocate(8, 8, MemoryKind::Heap);
    auto open = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(frozen);
    ASSERT_TRUE(open);
    ASSERT_TRUE(memory.markStaticInitialized(frozen->alloc, Mutability::Immutable));
    ASSERT_TRUE(memory.markStaticInitialized(open->alloc, Mutability::Mutable));

    auto write = memory.writePrimVal(frozen.value(), PrimVal::fromBytes(1), 8);
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().kind, EvalErrorKind::ModifiedConstantMemory);
    EXPECT_TRUE(memory.writePrimVal(open.value(), PrimVal::fromBytes(1), 8));

    auto alloc = memory.get(frozen->alloc);
    ASSERT_TRUE(alloc);
    EXPECT_TRUE(alloc.value()->staticInitialized);
    EXPECT_EQ(alloc.value()->kind, MemoryKind::Static);
}

TEST(MemoryTest, FreezingFollowsStoredPointers)
{
    mem::Memory memory(target(8));
    auto outer = memory.allocate(8, 8, MemoryKind::Heap);
    auto inner = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(outer);
    ASSERT_TRUE(inner);
    const MemoryPointer fn = memory.createFnAlloc(fnInstance(3));
    ASSERT_TRUE(memory.writePtrSizedUnsigned(outer.value(), PrimVal::fromPtr(inner.value())));
    ASSERT_TRUE(memory.writePtrSizedUnsigned(inner.value(), PrimVal::fromPtr(fn)));

    ASSERT_TRUE(memory.markStaticInitialized(outer->alloc, Mutability::Immutable));

    auto write = memory.writePrimVal(inner.value(), PrimVal::fromBytes(0), 8);
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().kind, EvalErrorKind::ModifiedConstantMemory);
}

TEST(MemoryTest, RefreezingWithOtherMutabilityIsInternal)
{
    mem::Memory memory(target(8));
    auto a = memory.allocate(8, 8, MemoryKind::Heap);
    ASSERT_TRUE(a);
    ASSERT_TRUE(memory.markStaticInitialized(a->alloc, Mutability::Immutable));
    EXPECT_TRUE(memory.markStaticInitialized(a->alloc, Mutability::Immutable));

    auto again = memory.markStaticInitialized(a->alloc, Mutability::Mutable);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().kind, EvalErrorKind::Internal);

    const MemoryPointer fn = memory.createFnAlloc(fnInstance(4));
    auto fnFreeze = memory.markStaticInitialized(fn.alloc, Mutability::Immutable);
    ASSERT_FALSE(fnFreeze);
    EXPECT_EQ(fnFreeze.error().kind, EvalErrorKind::Internal);
}

TEST(MemoryTest, LimitCapsTotalAllocation)
{
    mem::Memory memory(target(8), 32);
    ASSERT_TRUE(memory.allocate(24, 8, MemoryKind::Heap));
    auto over = memory.allocate(16, 8, MemoryKind::Heap);
    ASSERT_FALSE(over);
    EXPECT_EQ(over.error().kind, EvalErrorKind::MemoryExhausted);
    EXPECT_EQ(memory.totalBytes(), 24u);
    EXPECT_TRUE(memory.allocate(8, 8, MemoryKind::Heap));
}

TEST(MemoryTest, AllocationBeyondAddressSpaceOverflows)
{
    mem::Memory memory(target(2));
    auto huge = memory.allocate(70000, 2, MemoryKind::Heap);
    ASSERT_FALSE(huge);
    EXPECT_EQ(huge.error().kind, EvalErrorKind::Overflow);
}

TEST(MemoryTest, PointerSizedAccessFollowsTarget)
{
    mem::Memory memory(target(4));
    EXPECT_EQ(memory.pointerSize(), 4u);
    auto a = memory.allocate(8, 4, MemoryKind::Heap);
    ASSERT_TRUE(a);
    ASSERT_TRUE(memory.writePtrSizedUnsigned(at(a.value(), 4), PrimVal::fromBytes(0xdeadbeef)));
    auto read = memory.readPtrSizedUnsigned(at(a.value(), 4));
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value(), PrimVal::fromBytes(0xdeadbeef));

    auto tooWide = memory.writePtrSizedUnsigned(a.value(), PrimVal::fromBytes(0x100000000ull));
    ASSERT_FALSE(tooWide);
    EXPECT_EQ(tooWide.error().kind, EvalErrorKind::Internal);
}
