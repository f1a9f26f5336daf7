//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the item table.  Ids are handed out per crate starting at 1 so
// that DefId index 0 stays invalid; associated items inherit the crate of the
// trait or impl that contains them.
//
//===----------------------------------------------------------------------===//

#include "core/Items.hpp"

#include <utility>

namespace kiln::core
{

DefId ItemTable::addItem(uint32_t krate, ItemRecord record)
{
    uint32_t &next = nextIndex_[krate];
    DefId id{krate, ++next};
    items_.emplace(id, std::move(record));
    order_.push_back(id);
    return id;
}

const ItemTable::ItemRecord *ItemTable::find(DefId def) const
{
    auto it = items_.find(def);
    return it == items_.end() ? nullptr : &it->second;
}

DefId ItemTable::addAssociated(DefId container, std::string_view name, AssociatedItem item)
{
    const ItemRecord *parent = find(container);
    ItemRecord record;
    record.kind = item.kind == AssocKind::Const ? DefKind::AssociatedConst : DefKind::AssociatedFn;
    record.name = names_.intern(name);
    record.parent = container;
    record.generics = (parent ? parent->generics : 0) + item.method.ownGenerics;

    item.name = record.name;
    item.container = container;
    record.assoc = item;

    DefId id = addItem(container.krate, std::move(record));
    ItemRecord &stored = items_.at(id);
    stored.assoc->def = id;
    items_.at(container).children.push_back(id);
    return id;
}

DefId ItemTable::addTrait(std::string_view name, uint32_t generics, uint32_t krate)
{
    ItemRecord record;
    record.kind = DefKind::Trait;
    record.name = names_.intern(name);
    record.generics = generics;
    return addItem(krate, std::move(record));
}

void ItemTable::addSupertrait(DefId trait, TraitRef super)
{
    items_.at(trait).supertraits.push_back(std::move(super));
}

DefId ItemTable::addTraitConst(DefId trait, std::string_view name, bool hasDefault)
{
    AssociatedItem item;
    item.kind = AssocKind::Const;
    item.containerKind = ContainerKind::Trait;
    item.hasValue = hasDefault;
    return addAssociated(trait, name, item);
}

DefId ItemTable::addTraitMethod(DefId trait, std::string_view name, MethodFlags flags)
{
    AssociatedItem item;
    item.kind = AssocKind::Method;
    item.containerKind = ContainerKind::Trait;
    item.hasValue = flags.hasDefault;
    item.method = flags;
    return addAssociated(trait, name, item);
}

DefId ItemTable::addTraitImpl(TraitRef traitRef, uint32_t generics, uint32_t krate)
{
    ItemRecord record;
    record.kind = DefKind::Impl;
    record.generics = generics;
    record.implSelf = traitRef.selfTy();
    record.implTrait = std::move(traitRef);
    return addItem(krate, std::move(record));
}

DefId ItemTable::addInherentImpl(Ty selfTy, uint32_t generics, uint32_t krate)
{
    ItemRecord record;
    record.kind = DefKind::Impl;
    record.generics = generics;
    record.implSelf = selfTy;
    return addItem(krate, std::move(record));
}

DefId ItemTable::addImplConst(DefId impl, std::string_view name)
{
    AssociatedItem item;
    item.kind = AssocKind::Const;
    item.containerKind = ContainerKind::Impl;
    item.hasValue = true;
    return addAssociated(impl, name, item);
}

DefId ItemTable::addImplMethod(DefId impl, std::string_view name)
{
    AssociatedItem item;
    item.kind = AssocKind::Method;
    item.containerKind = ContainerKind::Impl;
    item.hasValue = true;
    return addAssociated(impl, name, item);
}

DefId ItemTable::addConst(std::string_view name, uint32_t krate)
{
    ItemRecord record;
    record.kind = DefKind::Const;
    record.name = names_.intern(name);
    return addItem(krate, std::move(record));
}

DefId ItemTable::addFn(std::string_view name, uint32_t generics, uint32_t krate)
{
    ItemRecord record;
    record.kind = DefKind::Fn;
    record.name = names_.intern(name);
    record.generics = generics;
    return addItem(krate, std::move(record));
}

DefId ItemTable::addStruct(std::string_view name, uint32_t generics, uint32_t krate)
{
    ItemRecord record;
    record.kind = DefKind::Struct;
    record.name = names_.intern(name);
    record.generics = generics;
    return addItem(krate, std::move(record));
}

std::optional<DefKind> ItemTable::describeDef(DefId def) const
{
    if (const ItemRecord *record = find(def))
        return record->kind;
    return std::nullopt;
}

bool ItemTable::isLocalTraitItem(DefId def) const
{
    if (!def.isLocal())
        return false;
    const ItemRecord *record = find(def);
    return record && record->assoc && record->assoc->containerKind == ContainerKind::Trait;
}

std::optional<DefId> ItemTable::traitOfItem(DefId def) const
{
    const ItemRecord *record = find(def);
    if (!record || !record->assoc || record->assoc->containerKind != ContainerKind::Trait)
        return std::nullopt;
    return record->assoc->container;
}

const AssociatedItem *ItemTable::associatedItem(DefId def) const
{
    const ItemRecord *record = find(def);
    if (!record || !record->assoc)
        return nullptr;
    return &*record->assoc;
}

std::vector<const AssociatedItem *> ItemTable::associatedItems(DefId container) const
{
    std::vector<const AssociatedItem *> out;
    const ItemRecord *record = find(container);
    if (!record)
        return out;
    out.reserve(record->children.size());
    for (DefId child : record->children)
    {
        if (const AssociatedItem *item = associatedItem(child))
            out.push_back(item);
    }
    return out;
}

uint32_t ItemTable::genericsCount(DefId def) const
{
    const ItemRecord *record = find(def);
    return record ? record->generics : 0;
}

const std::vector<TraitRef> &ItemTable::supertraits(DefId trait) const
{
    static const std::vector<TraitRef> kNone;
    const ItemRecord *record = find(trait);
    return record ? record->supertraits : kNone;
}

std::optional<TraitRef> ItemTable::implTraitRef(DefId impl) const
{
    const ItemRecord *record = find(impl);
    if (!record)
        return std::nullopt;
    return record->implTrait;
}

Ty ItemTable::implSelfTy(DefId impl) const
{
    const ItemRecord *record = find(impl);
    return record ? record->implSelf : Ty{};
}

std::vector<DefId> ItemTable::implsOfTrait(DefId trait) const
{
    std::vector<DefId> out;
    for (DefId id : order_)
    {
        const ItemRecord &record = items_.at(id);
        if (record.kind == DefKind::Impl && record.implTrait && record.implTrait->traitId == trait)
            out.push_back(id);
    }
    return out;
}

std::string_view ItemTable::name(DefId def) const
{
    const ItemRecord *record = find(def);
    return record ? names_.lookup(record->name) : std::string_view{};
}

support::Symbol ItemTable::nameSymbol(DefId def) const
{
    const ItemRecord *record = find(def);
    return record ? record->name : support::Symbol{};
}

support::Symbol ItemTable::intern(std::string_view name)
{
    return names_.intern(name);
}

} // namespace kiln::core
