// ARMv7-A Translation Tables
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_TRANSLATION_TABLE_H
#define ARMV7_TRANSLATION_TABLE_H

#include "armv7/types.h"
#include "armv7/address.h"
#include "armv7/descriptors.h"
#include "armv7/memory_attributes.h"
#include "armv7/processor.h"
#include <cstddef>
#include <cstdint>

namespace armv7 {

/**
 * @struct TranslationTableMemory
 * @brief Backing storage of a first-level table, 4096 entries, 16KB aligned
 * @warning Dynamic allocation is not guaranteed to honour the alignment,
 *          prefer static storage.
 */
struct alignas(TRANSLATION_TABLE_ALIGNMENT) TranslationTableMemory {
    TranslationTableDescriptor entries[TRANSLATION_TABLE_SIZE];
};

/**
 * @struct PageTableMemory
 * @brief Backing storage of a second-level table, 256 entries, 1KB aligned
 */
struct alignas(PAGE_TABLE_ALIGNMENT) PageTableMemory {
    PageTableDescriptor entries[PAGE_TABLE_SIZE];
};

static_assert(sizeof(TranslationTableMemory) == TRANSLATION_TABLE_ALIGNMENT,
              "first-level table must be exactly 16KB");
static_assert(sizeof(PageTableMemory) == PAGE_TABLE_ALIGNMENT,
              "second-level table must be exactly 1KB");

/**
 * @class TableMutationGrant
 * @brief Proof of the caller's promise required for every table write
 * @details Obtaining one through attest() states that the entries written
 *          will be well-formed for the CPU and that no other view writes
 *          the same storage at the same time.
 */
class TableMutationGrant {
public:
    static TableMutationGrant attest() {
        return TableMutationGrant();
    }

private:
    TableMutationGrant() {}
};

/**
 * @class TranslationTable
 * @brief First-level translation table view (1MB per entry)
 * @details Does not own its storage. The virtual address is where the CPU
 *          sees the storage and is used to resolve the physical address
 *          programmed into TTBR0.
 */
class TranslationTable {
public:
    /**
     * @brief Wrap @p memory mapped at @p va
     * @return AlignError unless @p va and the storage are 16KB aligned
     */
    static Result<TranslationTable> create(TranslationTableMemory& memory, VirtualAddress va);

    /// @brief Unchecked entry access, @p index must be below size()
    const TranslationTableDescriptor& operator[](size_t index) const {
        return storage->entries[index];
    }

    /// @brief Checked entry access, IndexError past the end
    Result<TranslationTableDescriptor> get(size_t index) const;

    /// @brief Entry covering @p va
    const TranslationTableDescriptor& lookup(VirtualAddress va) const {
        return storage->entries[translationTableIndex(va)];
    }

    VoidResult set(size_t index, const TranslationTableDescriptor& descriptor, const TableMutationGrant& grant);

    /// @brief Reset every entry to Invalid
    void clear(const TableMutationGrant& grant);

    /**
     * @brief Map a 16MB supersection at @p index
     * @details A supersection occupies 16 consecutive entries with the same
     *          descriptor, starting at a 16-entry boundary.
     * @return AlignError if @p index is not a multiple of 16 or @p address
     *         is not 16MB aligned, IndexError if the run does not fit
     */
    VoidResult mapSupersection(size_t index, PhysicalAddress address,
                               const MemoryAttributes& memoryAttributes,
                               const TableMutationGrant& grant);

    VirtualAddress getVirtualAddress() const {
        return virtualAddress;
    }

    size_t size() const {
        return TRANSLATION_TABLE_SIZE;
    }

    /**
     * @brief Make this the active table
     * @details Resolves the table's virtual address through @p processor and
     *          programs TTBR0 with the result.
     * @return TranslationError if the table is not mapped
     */
    VoidResult setAsTtbr0(Processor& processor) const;

    /**
     * @brief Program TTBR0 with @p tableBase
     * @details The write is followed by three NOPs so that no subsequent
     *          instruction executes against the previous table.
     * @return AlignError unless @p tableBase is 16KB aligned
     */
    static VoidResult installTtbr0(Processor& processor, PhysicalAddress tableBase);

    /// @brief Physical base of the active table, TTBR0 without its attribute bits
    static PhysicalAddress currentTtbr0Address(const Processor& processor);

private:
    friend class Result<TranslationTable>;

    TranslationTable() : storage(nullptr), virtualAddress() {}
    TranslationTable(TranslationTableMemory* memory, VirtualAddress va)
        : storage(memory), virtualAddress(va) {}

    TranslationTableMemory* storage;
    VirtualAddress virtualAddress;
};

/**
 * @class PageTable
 * @brief Second-level page table view (4KB per entry)
 * @details Created together with the first-level Page descriptor that
 *          references it.
 */
class PageTable {
public:
    /**
     * @brief Wrap @p memory mapped at @p va and hook it into @p baseTable
     * @param processor Used to resolve @p va to the physical table base
     * @param memory Table storage
     * @param va Virtual address of @p memory
     * @param memoryAttributes Attributes of the Page descriptor (PXN, DOMAIN, NS)
     * @param baseTable First-level table receiving the Page descriptor
     * @param index First-level index of the 1MB region covered by this table
     * @param grant Write permission for @p baseTable
     * @return AlignError unless @p va and the storage are 1KB aligned,
     *         IndexError if @p index is out of range, TranslationError if
     *         @p va is not mapped
     */
    static Result<PageTable> create(Processor& processor, PageTableMemory& memory, VirtualAddress va,
                                    const MemoryAttributes& memoryAttributes, TranslationTable& baseTable,
                                    size_t index, const TableMutationGrant& grant);

    const PageTableDescriptor& operator[](size_t index) const {
        return storage->entries[index];
    }

    Result<PageTableDescriptor> get(size_t index) const;

    const PageTableDescriptor& lookup(VirtualAddress va) const {
        return storage->entries[pageTableIndex(va)];
    }

    VoidResult set(size_t index, const PageTableDescriptor& descriptor, const TableMutationGrant& grant);

    void clear(const TableMutationGrant& grant);

    /**
     * @brief Map a 64KB large page at @p index
     * @return AlignError if @p index is not a multiple of 16 or @p address
     *         is not 64KB aligned, IndexError if the run does not fit
     */
    VoidResult mapLargePage(size_t index, PhysicalAddress address,
                            const MemoryAttributes& memoryAttributes,
                            const TableMutationGrant& grant);

    VirtualAddress getVirtualAddress() const {
        return virtualAddress;
    }

    /// @brief The first-level Page descriptor pointing at this table
    const TranslationTableDescriptor& getDescriptor() const {
        return descriptor;
    }

    size_t size() const {
        return PAGE_TABLE_SIZE;
    }

private:
    friend class Result<PageTable>;

    PageTable() : storage(nullptr), virtualAddress(), descriptor() {}
    PageTable(PageTableMemory* memory, VirtualAddress va, const TranslationTableDescriptor& pageDescriptor)
        : storage(memory), virtualAddress(va), descriptor(pageDescriptor) {}

    PageTableMemory* storage;
    VirtualAddress virtualAddress;
    TranslationTableDescriptor descriptor;
};

} // namespace armv7

#endif // ARMV7_TRANSLATION_TABLE_H
