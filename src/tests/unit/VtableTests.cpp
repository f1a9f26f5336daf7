//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/VtableTests.cpp
// Purpose: Validate vtable synthesis and the vtable readers.
// Key invariants: A vtable holds P * (3 + N) bytes: drop glue, size, align
//                 and the method slots; it is immutable once built.
// Ownership/Lifetime: EvalFixture owns memory, tables and fakes.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "common/EvalFixture.hpp"
#include "mem/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

using namespace kiln;
using kiln::eval::EvalErrorKind;
using kiln::mem::MemoryPointer;
using kiln::mem::PrimVal;

namespace
{
/// trait Shape { fn area(&self); fn scale<T>(&self); fn name(&self); }
/// struct Circle; impl Shape for Circle { ... }
struct ShapeWorld
{
    explicit ShapeWorld(tests::EvalFixture &fx)
    {
        shape = fx.items.addTrait("Shape");
        area = fx.items.addTraitMethod(shape, "area");
        scale = fx.items.addTraitMethod(shape, "scale", core::MethodFlags{1, false, false});
        name = fx.items.addTraitMethod(shape, "name");
        const core::DefId circleDef = fx.items.addStruct("Circle");
        circle = fx.types.adtTy(circleDef, {});
        const core::DefId impl = fx.items.addTraitImpl(core::TraitRef{shape, {circle}});
        // Impl bodies deliberately listed out of trait order.
        fx.items.addImplMethod(impl, "name");
        fx.items.addImplMethod(impl, "scale");
        fx.items.addImplMethod(impl, "area");
        fx.layouts.setLayout(circle, 24, 8);
    }

    core::TraitRef ref() const
    {
        return core::TraitRef{shape, {circle}};
    }

    core::DefId shape{};
    core::DefId area{};
    core::DefId scale{};
    core::DefId name{};
    core::Ty circle{};
};

MemoryPointer slot(const tests::EvalFixture &fx, MemoryPointer vtable, uint64_t index)
{
    return MemoryPointer{vtable.alloc, vtable.offset + index * fx.memory.pointerSize()};
}
} // namespace

TEST(VtableTest, HeaderHoldsSizeAndAlign)
{
    for (uint64_t width : {2u, 4u, 8u})
    {
        tests::EvalFixture fx(width);
        ShapeWorld world(fx);
        auto vtable = fx.context().getVtable(world.circle, world.ref());
        ASSERT_TRUE(vtable) << "pointer width " << width;

        auto alloc = fx.memory.get(vtable->alloc);
        ASSERT_TRUE(alloc);
        EXPECT_EQ(alloc.value()->size(), width * (3 + 3));
        EXPECT_EQ(alloc.value()->kind, mem::MemoryKind::Vtable);
        EXPECT_EQ(alloc.value()->align, width);

        auto sizeAlign = fx.context().readSizeAndAlignFromVtable(vtable.value());
        ASSERT_TRUE(sizeAlign);
        EXPECT_EQ(sizeAlign->first, 24u);
        EXPECT_EQ(sizeAlign->second, 8u);
    }
}

TEST(VtableTest, DropGlueRoundTrips)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    fx.instances.setNeedsDrop(world.circle);

    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(vtable);
    auto drop = fx.context().readDropTypeFromVtable(vtable.value());
    ASSERT_TRUE(drop);
    ASSERT_TRUE(drop->has_value());
    EXPECT_EQ(drop.value().value(), core::Instance::dropGlue(fx.instances.dropInPlace(), world.circle));
}

TEST(VtableTest, TrivialDropIsNullPointer)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);

    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(vtable);
    auto raw = fx.memory.readPtrSizedUnsigned(vtable.value());
    ASSERT_TRUE(raw);
    EXPECT_EQ(raw.value(), PrimVal::fromBytes(0));

    auto drop = fx.context().readDropTypeFromVtable(vtable.value());
    ASSERT_TRUE(drop);
    EXPECT_FALSE(drop->has_value());
}

TEST(VtableTest, MethodSlotsFollowTraitOrder)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);

    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(vtable);

    auto first = fx.context().readMethodFromVtable(vtable.value(), 0);
    ASSERT_TRUE(first);
    ASSERT_TRUE(first->has_value());
    EXPECT_EQ(first.value().value(), core::Instance::item(world.area, {world.circle}));

    auto vacant = fx.context().readMethodFromVtable(vtable.value(), 1);
    ASSERT_TRUE(vacant);
    EXPECT_FALSE(vacant->has_value());

    auto third = fx.context().readMethodFromVtable(vtable.value(), 2);
    ASSERT_TRUE(third);
    ASSERT_TRUE(third->has_value());
    EXPECT_EQ(third.value().value(), core::Instance::item(world.name, {world.circle}));

    auto defined = fx.memory.isDefined(slot(fx, vtable.value(), 4), fx.memory.pointerSize());
    ASSERT_TRUE(defined);
    EXPECT_FALSE(defined.value());
}

TEST(VtableTest, MethodIndexPastTheEndIsOutOfBounds)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(vtable);

    auto past = fx.context().readMethodFromVtable(vtable.value(), 3);
    ASSERT_FALSE(past);
    EXPECT_EQ(past.error().kind, EvalErrorKind::PointerOutOfBounds);

    auto huge = fx.context().readMethodFromVtable(vtable.value(), std::numeric_limits<size_t>::max());
    ASSERT_FALSE(huge);
    EXPECT_EQ(huge.error().kind, EvalErrorKind::PointerOutOfBounds);
}

TEST(VtableTest, VtableIsImmutable)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(vtable);

    auto write = fx.memory.writePtrSizedUnsigned(slot(fx, vtable.value(), 1), PrimVal::fromBytes(1));
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().kind, EvalErrorKind::ModifiedConstantMemory);

    auto alloc = fx.memory.get(vtable->alloc);
    ASSERT_TRUE(alloc);
    EXPECT_TRUE(alloc.value()->staticInitialized);
    EXPECT_EQ(alloc.value()->mutability, mem::Mutability::Immutable);
}

TEST(VtableTest, RequestsAllocateFreshVtablesSharingFunctions)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    auto a = fx.context().getVtable(world.circle, world.ref());
    auto b = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a->alloc, b->alloc);

    auto methodA = fx.memory.readPtrSizedUnsigned(slot(fx, a.value(), 3));
    auto methodB = fx.memory.readPtrSizedUnsigned(slot(fx, b.value(), 3));
    ASSERT_TRUE(methodA);
    ASSERT_TRUE(methodB);
    EXPECT_TRUE(methodA->isPtr());
    EXPECT_EQ(methodA.value(), methodB.value());
}

TEST(VtableTest, UnsizedTypeIsInternalError)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    const core::Ty str = fx.types.strTy();
    fx.layouts.markUnsized(str);

    auto vtable = fx.context().getVtable(str, core::TraitRef{world.shape, {str}});
    ASSERT_FALSE(vtable);
    EXPECT_EQ(vtable.error().kind, EvalErrorKind::Internal);
    EXPECT_NE(vtable.error().message.find("unsized"), std::string::npos);
}

TEST(VtableTest, CollaboratorErrorsPropagate)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    const core::Ty unknown = fx.types.intTy(128);
    auto noLayout = fx.context().getVtable(unknown, core::TraitRef{world.shape, {unknown}});
    ASSERT_FALSE(noLayout);
    EXPECT_EQ(noLayout.error().kind, EvalErrorKind::Layout);

    fx.instances.failOn(world.name);
    auto noInstance = fx.context().getVtable(world.circle, world.ref());
    ASSERT_FALSE(noInstance);
    EXPECT_EQ(noInstance.error().kind, EvalErrorKind::TooGeneric);
}

TEST(VtableTest, FailedResolutionAllocatesNothing)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    fx.instances.failOn(world.name);

    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_FALSE(vtable);
    EXPECT_EQ(fx.memory.allocationCount(), 0u);
    EXPECT_EQ(fx.memory.totalBytes(), 0u);
}

TEST(VtableTest, MemoryLimitApplies)
{
    tests::EvalFixture fx(8, 16);
    ShapeWorld world(fx);
    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_FALSE(vtable);
    EXPECT_EQ(vtable.error().kind, EvalErrorKind::MemoryExhausted);
}

TEST(VtableTest, ReadersRejectMalformedVtables)
{
    tests::EvalFixture fx;
    auto fake = fx.memory.allocate(24, 8, mem::MemoryKind::Heap);
    auto data = fx.memory.allocate(8, 8, mem::MemoryKind::Heap);
    ASSERT_TRUE(fake);
    ASSERT_TRUE(data);

    ASSERT_TRUE(fx.memory.writePtrSizedUnsigned(fake.value(), PrimVal::fromBytes(5)));
    auto bytes = fx.context().readDropTypeFromVtable(fake.value());
    ASSERT_FALSE(bytes);
    EXPECT_EQ(bytes.error().kind, EvalErrorKind::ReadBytesAsPointer);

    ASSERT_TRUE(fx.memory.writePtrSizedUnsigned(fake.value(), PrimVal::fromPtr(data.value())));
    auto notFn = fx.context().readDropTypeFromVtable(fake.value());
    ASSERT_FALSE(notFn);
    EXPECT_EQ(notFn.error().kind, EvalErrorKind::InvalidFunctionPointer);

    ASSERT_TRUE(fx.memory.writePtrSizedUnsigned(slot(fx, fake.value(), 1), PrimVal::fromPtr(data.value())));
    ASSERT_TRUE(fx.memory.writePtrSizedUnsigned(slot(fx, fake.value(), 2), PrimVal::fromBytes(8)));
    auto sizeAlign = fx.context().readSizeAndAlignFromVtable(fake.value());
    ASSERT_FALSE(sizeAlign);
    EXPECT_EQ(sizeAlign.error().kind, EvalErrorKind::ReadPointerAsBytes);
}

TEST(VtableTest, TraitObjectReachesItsVtable)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    auto object = fx.memory.allocate(24, 8, mem::MemoryKind::Heap);
    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(object);
    ASSERT_TRUE(vtable);

    const mem::Value fat = mem::Value::byValPair(PrimVal::fromPtr(object.value()), PrimVal::fromPtr(vtable.value()));
    auto parts = fx.context().traitObjectParts(fat);
    ASSERT_TRUE(parts);
    EXPECT_EQ(parts->first, object.value());
    auto sizeAlign = fx.context().readSizeAndAlignFromVtable(parts->second);
    ASSERT_TRUE(sizeAlign);
    EXPECT_EQ(sizeAlign->first, 24u);

    // The same fat pointer stored in memory and passed by reference.
    auto stored = fx.memory.allocate(16, 8, mem::MemoryKind::Heap);
    ASSERT_TRUE(stored);
    ASSERT_TRUE(fx.memory.writePtrSizedUnsigned(stored.value(), fat.first));
    ASSERT_TRUE(fx.memory.writePtrSizedUnsigned(slot(fx, stored.value(), 1), fat.second));
    auto loaded = fx.context().traitObjectParts(mem::Value::byRef(stored.value(), 8));
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), parts.value());

    auto misaligned = fx.context().traitObjectParts(mem::Value::byRef(slot(fx, stored.value(), 1), 16));
    ASSERT_FALSE(misaligned);
    EXPECT_EQ(misaligned.error().kind, EvalErrorKind::AlignmentCheckFailed);
}

TEST(VtableTest, SlotsReadAsScalarValues)
{
    tests::EvalFixture fx;
    ShapeWorld world(fx);
    auto vtable = fx.context().getVtable(world.circle, world.ref());
    ASSERT_TRUE(vtable);

    auto size = fx.context().readPtr(slot(fx, vtable.value(), 1));
    ASSERT_TRUE(size);
    EXPECT_EQ(size->kind, mem::Value::Kind::ByVal);
    EXPECT_EQ(size->first, PrimVal::fromBytes(24));

    auto area = fx.context().readPtr(slot(fx, vtable.value(), 3));
    ASSERT_TRUE(area);
    EXPECT_TRUE(area->first.isPtr());

    auto vacant = fx.context().readPtr(slot(fx, vtable.value(), 4));
    ASSERT_TRUE(vacant);
    EXPECT_TRUE(vacant->first.isUndef());
}
