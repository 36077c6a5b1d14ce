// ARMv7-A Integration Test Base Helper
// Copyright (c) 2024 John Greninger
// Common utilities for integration tests

#ifndef ARMV7_TEST_INTEGRATION_BASE_H
#define ARMV7_TEST_INTEGRATION_BASE_H

#include <gtest/gtest.h>
#include "armv7/mmu.h"
#include "armv7/simulated_processor.h"
#include "armv7/translation_table.h"
#include "armv7/memory_attributes.h"
#include "armv7/types.h"
#include <memory>

namespace armv7 {
namespace integration {

// Table memory lives in the first megabyte, where physical and virtual
// addresses are equal while the MMU is off.
constexpr uint32_t TABLE_BASE = 0x00004000;
constexpr uint32_t FIRST_PAGE_TABLE_BASE = 0x00008000;
constexpr uint32_t SECOND_PAGE_TABLE_BASE = 0x00008400;

struct IntegrationMemory {
    TranslationTableMemory table;
    PageTableMemory firstPageTable;
    PageTableMemory secondPageTable;
};

// Helper class for common integration test functionality
class IntegrationTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        memory = &integrationMemory();
        *memory = IntegrationMemory();
        processor = std::make_unique<SimulatedProcessor>();

        ASSERT_TRUE(processor->attachMemory(PhysicalAddress(TABLE_BASE), &memory->table,
                                            sizeof(memory->table)).isOk());
        ASSERT_TRUE(processor->attachMemory(PhysicalAddress(FIRST_PAGE_TABLE_BASE), &memory->firstPageTable,
                                            sizeof(memory->firstPageTable)).isOk());
        ASSERT_TRUE(processor->attachMemory(PhysicalAddress(SECOND_PAGE_TABLE_BASE), &memory->secondPageTable,
                                            sizeof(memory->secondPageTable)).isOk());

        mmu = std::make_unique<Mmu>(*processor);

        Result<TranslationTable> created = TranslationTable::create(memory->table, VirtualAddress(TABLE_BASE));
        ASSERT_TRUE(created.isOk());
        table = std::unique_ptr<TranslationTable>(new TranslationTable(created.getValue()));
    }

    void TearDown() override {
        mmu.reset();
        table.reset();
        processor.reset();
        memory = nullptr;
    }

    // Static storage keeps the 16KB table alignment
    static IntegrationMemory& integrationMemory() {
        static IntegrationMemory storage;
        return storage;
    }

    // Keep the first megabyte identity mapped so the tables stay reachable
    // by their virtual addresses once translation is on.
    void mapLowMemory() {
        mapSection(0, 0x00000000, MemoryAttributes::from(attributes::AP::PrivAccess));
    }

    void mapSection(size_t index, uint32_t pa, const MemoryAttributes& attrs) {
        Result<TranslationTableDescriptor> descriptor =
            TranslationTableDescriptor::create(TranslationTableType::Section, PhysicalAddress(pa), attrs);
        ASSERT_TRUE(descriptor.isOk());
        ASSERT_TRUE(table->set(index, descriptor.getValue(), TableMutationGrant::attest()).isOk());
    }

    void mapSmallPage(PageTable& pageTable, size_t index, uint32_t pa, const MemoryAttributes& attrs) {
        Result<PageTableDescriptor> descriptor =
            PageTableDescriptor::create(PageTableType::SmallPage, PhysicalAddress(pa), attrs);
        ASSERT_TRUE(descriptor.isOk());
        ASSERT_TRUE(pageTable.set(index, descriptor.getValue(), TableMutationGrant::attest()).isOk());
    }

    void installAndEnable() {
        ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());
        mmu->enable();
        ASSERT_TRUE(mmu->isEnabled());
    }

    IntegrationMemory* memory;
    std::unique_ptr<SimulatedProcessor> processor;
    std::unique_ptr<Mmu> mmu;
    std::unique_ptr<TranslationTable> table;
};

} // namespace integration
} // namespace armv7

#endif // ARMV7_TEST_INTEGRATION_BASE_H
