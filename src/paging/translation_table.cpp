// ARMv7-A Translation Tables Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/translation_table.h"
#include "armv7/address_translation.h"

namespace armv7 {

namespace {

// Repeated second-level entries that make up one large page
const size_t LARGE_PAGE_ENTRY_COUNT = LARGE_PAGE_SIZE / SMALL_PAGE_SIZE;

// NOPs after a TTBR0 write before the new table may be relied upon
const int TTBR0_SYNC_NOPS = 3;

bool isHostAligned(const void* pointer, uint32_t mask) {
    return (reinterpret_cast<uintptr_t>(pointer) & mask) == 0;
}

} // namespace

// TranslationTable implementation

Result<TranslationTable> TranslationTable::create(TranslationTableMemory& memory, VirtualAddress va) {
    if (!va.isAligned(TRANSLATION_TABLE_ALIGN_MASK) || !isHostAligned(&memory, TRANSLATION_TABLE_ALIGN_MASK)) {
        return makeError<TranslationTable>(PageError::AlignError);
    }
    return makeSuccess(TranslationTable(&memory, va));
}

Result<TranslationTableDescriptor> TranslationTable::get(size_t index) const {
    if (index >= TRANSLATION_TABLE_SIZE) {
        return makeError<TranslationTableDescriptor>(PageError::IndexError);
    }
    return makeSuccess<TranslationTableDescriptor>(storage->entries[index]);
}

VoidResult TranslationTable::set(size_t index, const TranslationTableDescriptor& descriptor,
                                 const TableMutationGrant& grant) {
    (void)grant;
    if (index >= TRANSLATION_TABLE_SIZE) {
        return makeVoidError(PageError::IndexError);
    }
    storage->entries[index] = descriptor;
    return makeVoidSuccess();
}

void TranslationTable::clear(const TableMutationGrant& grant) {
    (void)grant;
    for (size_t i = 0; i < TRANSLATION_TABLE_SIZE; ++i) {
        storage->entries[i] = TranslationTableDescriptor();
    }
}

VoidResult TranslationTable::mapSupersection(size_t index, PhysicalAddress address,
                                             const MemoryAttributes& memoryAttributes,
                                             const TableMutationGrant& grant) {
    if (index % SUPERSECTION_ENTRY_COUNT != 0) {
        return makeVoidError(PageError::AlignError);
    }
    if (index >= TRANSLATION_TABLE_SIZE) {
        return makeVoidError(PageError::IndexError);
    }

    Result<TranslationTableDescriptor> descriptor =
        TranslationTableDescriptor::create(TranslationTableType::Supersection, address, memoryAttributes);
    if (descriptor.isError()) {
        return makeVoidError(descriptor.getError());
    }

    for (size_t i = 0; i < SUPERSECTION_ENTRY_COUNT; ++i) {
        VoidResult written = set(index + i, descriptor.getValue(), grant);
        if (written.isError()) {
            return written;
        }
    }
    return makeVoidSuccess();
}

VoidResult TranslationTable::setAsTtbr0(Processor& processor) const {
    Result<PhysicalAddress> tableBase = getPhysAddr(processor, virtualAddress);
    if (tableBase.isError()) {
        return makeVoidError(tableBase.getError());
    }
    return installTtbr0(processor, tableBase.getValue());
}

VoidResult TranslationTable::installTtbr0(Processor& processor, PhysicalAddress tableBase) {
    VoidResult aligned = tableBase.checkAlign(TRANSLATION_TABLE_ALIGN_MASK);
    if (aligned.isError()) {
        return aligned;
    }

    processor.setTtbr0(tableBase);
    for (int i = 0; i < TTBR0_SYNC_NOPS; ++i) {
        processor.nop();
    }
    return makeVoidSuccess();
}

PhysicalAddress TranslationTable::currentTtbr0Address(const Processor& processor) {
    return PhysicalAddress(processor.readTtbr0() & ~TRANSLATION_TABLE_ALIGN_MASK);
}

// PageTable implementation

Result<PageTable> PageTable::create(Processor& processor, PageTableMemory& memory, VirtualAddress va,
                                    const MemoryAttributes& memoryAttributes, TranslationTable& baseTable,
                                    size_t index, const TableMutationGrant& grant) {
    if (!va.isAligned(PAGE_TABLE_ALIGN_MASK) || !isHostAligned(&memory, PAGE_TABLE_ALIGN_MASK)) {
        return makeError<PageTable>(PageError::AlignError);
    }
    if (index >= baseTable.size()) {
        return makeError<PageTable>(PageError::IndexError);
    }

    Result<PhysicalAddress> tableBase = getPhysAddr(processor, va);
    if (tableBase.isError()) {
        return makeError<PageTable>(tableBase.getError());
    }

    Result<TranslationTableDescriptor> descriptor =
        TranslationTableDescriptor::create(TranslationTableType::Page, tableBase.getValue(), memoryAttributes);
    if (descriptor.isError()) {
        return makeError<PageTable>(descriptor.getError());
    }

    VoidResult installed = baseTable.set(index, descriptor.getValue(), grant);
    if (installed.isError()) {
        return makeError<PageTable>(installed.getError());
    }

    return makeSuccess(PageTable(&memory, va, descriptor.getValue()));
}

Result<PageTableDescriptor> PageTable::get(size_t index) const {
    if (index >= PAGE_TABLE_SIZE) {
        return makeError<PageTableDescriptor>(PageError::IndexError);
    }
    return makeSuccess<PageTableDescriptor>(storage->entries[index]);
}

VoidResult PageTable::set(size_t index, const PageTableDescriptor& pageDescriptor,
                          const TableMutationGrant& grant) {
    (void)grant;
    if (index >= PAGE_TABLE_SIZE) {
        return makeVoidError(PageError::IndexError);
    }
    storage->entries[index] = pageDescriptor;
    return makeVoidSuccess();
}

void PageTable::clear(const TableMutationGrant& grant) {
    (void)grant;
    for (size_t i = 0; i < PAGE_TABLE_SIZE; ++i) {
        storage->entries[i] = PageTableDescriptor();
    }
}

VoidResult PageTable::mapLargePage(size_t index, PhysicalAddress address,
                                   const MemoryAttributes& memoryAttributes,
                                   const TableMutationGrant& grant) {
    if (index % LARGE_PAGE_ENTRY_COUNT != 0) {
        return makeVoidError(PageError::AlignError);
    }
    if (index >= PAGE_TABLE_SIZE) {
        return makeVoidError(PageError::IndexError);
    }

    Result<PageTableDescriptor> pageDescriptor =
        PageTableDescriptor::create(PageTableType::LargePage, address, memoryAttributes);
    if (pageDescriptor.isError()) {
        return makeVoidError(pageDescriptor.getError());
    }

    for (size_t i = 0; i < LARGE_PAGE_ENTRY_COUNT; ++i) {
        VoidResult written = set(index + i, pageDescriptor.getValue(), grant);
        if (written.isError()) {
            return written;
        }
    }
    return makeVoidSuccess();
}

} // namespace armv7
