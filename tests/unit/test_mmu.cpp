// ARMv7-A MMU Controller Unit Tests
// Copyright (c) 2024 John Greninger

#include <gtest/gtest.h>
#include "armv7/mmu.h"
#include "armv7/simulated_processor.h"
#include "armv7/memory_attributes.h"
#include <memory>
#include <vector>

namespace armv7 {
namespace test {

using namespace attributes;

namespace {

TranslationTableMemory mmuTable;
PageTableMemory mmuPageTable;

} // namespace

class MmuTest : public ::testing::Test {
protected:
    void SetUp() override {
        mmuTable = TranslationTableMemory();
        mmuPageTable = PageTableMemory();

        processor = std::make_unique<SimulatedProcessor>();
        ASSERT_TRUE(processor->attachMemory(PhysicalAddress(0x00004000), &mmuTable, sizeof(mmuTable)).isOk());
        ASSERT_TRUE(processor->attachMemory(PhysicalAddress(0x00008000), &mmuPageTable,
                                            sizeof(mmuPageTable)).isOk());

        mmu = std::make_unique<Mmu>(*processor);

        Result<TranslationTable> created = TranslationTable::create(mmuTable, VirtualAddress(0x00004000));
        ASSERT_TRUE(created.isOk());
        table = std::unique_ptr<TranslationTable>(new TranslationTable(created.getValue()));
    }

    void TearDown() override {
        mmu.reset();
        table.reset();
        processor.reset();
    }

    void mapSection(size_t index, uint32_t pa, const MemoryAttributes& attrs) {
        Result<TranslationTableDescriptor> descriptor =
            TranslationTableDescriptor::create(TranslationTableType::Section, PhysicalAddress(pa), attrs);
        ASSERT_TRUE(descriptor.isOk());
        ASSERT_TRUE(table->set(index, descriptor.getValue(), TableMutationGrant::attest()).isOk());
    }

    std::unique_ptr<SimulatedProcessor> processor;
    std::unique_ptr<Mmu> mmu;
    std::unique_ptr<TranslationTable> table;
};

TEST_F(MmuTest, DefaultState) {
    EXPECT_FALSE(mmu->isEnabled());
    EXPECT_EQ(mmu->installedTable(), nullptr);
    EXPECT_EQ(mmu->getConfiguration(), MmuConfiguration::createDefault());
    EXPECT_EQ(mmu->getTranslationCount(), 0u);
    EXPECT_EQ(mmu->getTotalFaults(), 0u);
    EXPECT_EQ(mmu->getFaultHandler().getMaxQueueSize(), FaultConfiguration::DEFAULT_RECORDS);
}

TEST_F(MmuTest, InvalidConfigurationFallsBackToDefault) {
    MmuConfiguration invalid(DeviceMappingConfiguration(0), TranslationConfiguration(), FaultConfiguration());
    Mmu fallback(*processor, invalid);
    EXPECT_EQ(fallback.getConfiguration(), MmuConfiguration::createDefault());
}

TEST_F(MmuTest, TranslationIsFlatWhileDisabled) {
    Result<PhysicalAddress> pa = mmu->translate(VirtualAddress(0x12345678));
    ASSERT_TRUE(pa.isOk());
    EXPECT_EQ(pa.getValue(), PhysicalAddress(0x12345678));
    EXPECT_EQ(mmu->getTranslationCount(), 1u);
}

TEST_F(MmuTest, InstallTranslationTable) {
    processor->clearTrace();
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());

    ASSERT_NE(mmu->installedTable(), nullptr);
    EXPECT_EQ(mmu->installedTable()->getVirtualAddress(), VirtualAddress(0x00004000));
    EXPECT_EQ(mmu->installedTableAddress(), PhysicalAddress(0x00004000));

    // Three NOPs follow the TTBR0 write
    const std::vector<ProcessorEvent>& trace = processor->getTrace();
    ASSERT_EQ(trace.size(), 5u);
    EXPECT_EQ(trace[0], ProcessorEvent::AddressTranslation);
    EXPECT_EQ(trace[1], ProcessorEvent::WriteTtbr0);
    EXPECT_EQ(trace[2], ProcessorEvent::Nop);
    EXPECT_EQ(trace[3], ProcessorEvent::Nop);
    EXPECT_EQ(trace[4], ProcessorEvent::Nop);
}

TEST_F(MmuTest, EnableIsFencedByBarriers) {
    processor->clearTrace();
    mmu->enable();
    EXPECT_TRUE(mmu->isEnabled());

    const std::vector<ProcessorEvent>& trace = processor->getTrace();
    ASSERT_EQ(trace.size(), 3u);
    EXPECT_EQ(trace[0], ProcessorEvent::Dsb);
    EXPECT_EQ(trace[1], ProcessorEvent::WriteSctlr);
    EXPECT_EQ(trace[2], ProcessorEvent::Isb);

    mmu->disable();
    EXPECT_FALSE(mmu->isEnabled());
}

TEST_F(MmuTest, TranslateThroughSection) {
    mapSection(0x802, 0x80200000, MemoryAttributes::from(AP::PrivAccess));
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());
    mmu->enable();

    Result<PhysicalAddress> pa = mmu->translate(VirtualAddress(0x80212345));
    ASSERT_TRUE(pa.isOk());
    EXPECT_EQ(pa.getValue(), PhysicalAddress(0x80212345));

    pa = mmu->translate(VirtualAddress(0x80200000), AddressTranslationOperation::PrivilegedWrite);
    ASSERT_TRUE(pa.isOk());
    EXPECT_FALSE(mmu->getFaultHandler().hasFaults());
}

TEST_F(MmuTest, UnmappedAddressIsRecorded) {
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());
    mmu->enable();

    Result<PhysicalAddress> pa = mmu->translate(VirtualAddress(0x40000000));
    ASSERT_TRUE(pa.isError());
    EXPECT_EQ(pa.getError(), PageError::TranslationError);

    std::vector<FaultRecord> faults = mmu->getFaultHandler().getFaults();
    ASSERT_EQ(faults.size(), 1u);
    EXPECT_EQ(faults[0].address, VirtualAddress(0x40000000));
    EXPECT_EQ(faults[0].operation, AddressTranslationOperation::PrivilegedRead);
    EXPECT_EQ(faults[0].faultType, FaultType::TranslationFaultSection);
    EXPECT_EQ(mmu->getTotalFaults(), 1u);
}

TEST_F(MmuTest, PermissionFaultForUnprivilegedAccess) {
    mapSection(0x802, 0x80200000, MemoryAttributes::from(AP::PrivAccess));
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());
    mmu->enable();

    Result<PhysicalAddress> pa =
        mmu->translate(VirtualAddress(0x80200000), AddressTranslationOperation::UnprivilegedRead);
    ASSERT_TRUE(pa.isError());
    EXPECT_EQ(mmu->getFaultHandler().getPermissionFaultCount(), 1u);
    EXPECT_EQ(mmu->getFaultHandler().getFaultsByOperation(AddressTranslationOperation::UnprivilegedRead).size(), 1u);
}

TEST_F(MmuTest, DefaultOperationComesFromConfiguration) {
    mapSection(0x802, 0x80200000, MemoryAttributes::from(AP::FullAccess + AP2::ReadOnly));
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());
    mmu->enable();

    EXPECT_TRUE(mmu->translate(VirtualAddress(0x80200000)).isOk());

    MmuConfiguration config;
    ASSERT_TRUE(config.setTranslationConfiguration(
        TranslationConfiguration(AddressTranslationOperation::UnprivilegedWrite, true)).isOk());
    ASSERT_TRUE(mmu->updateConfiguration(config).isOk());

    EXPECT_TRUE(mmu->translate(VirtualAddress(0x80200000)).isError());
    EXPECT_EQ(mmu->getFaultHandler().getFaultCountByType(FaultType::PermissionFaultSection), 1u);
}

TEST_F(MmuTest, QuietConfigurationRecordsNothing) {
    Mmu quiet(*processor, MmuConfiguration::createQuiet());
    ASSERT_TRUE(quiet.installTranslationTable(*table).isOk());
    quiet.enable();

    EXPECT_TRUE(quiet.translate(VirtualAddress(0x40000000)).isError());
    EXPECT_FALSE(quiet.getFaultHandler().hasFaults());
    EXPECT_EQ(quiet.getTranslationCount(), 1u);
}

TEST_F(MmuTest, TableOperationsNeedInstalledTable) {
    Result<PageTable> pageTable = mmu->createPageTable(mmuPageTable, VirtualAddress(0x00008000),
                                                       MemoryAttributes(), 1, TableMutationGrant::attest());
    ASSERT_TRUE(pageTable.isError());
    EXPECT_EQ(pageTable.getError(), PageError::InvalidMemory);

    Result<DeviceVmemMapper> mapper = mmu->createDeviceMapper(VirtualAddress(0x90000000), {0x3F});
    ASSERT_TRUE(mapper.isOk());
    EXPECT_EQ(mmu->mapDevices(mapper.getValue(), TableMutationGrant::attest()).getError(), PageError::InvalidMemory);
}

TEST_F(MmuTest, MapDevices) {
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());

    Result<DeviceVmemMapper> mapper = mmu->createDeviceMapper(VirtualAddress(0x90000000), {0x3F});
    ASSERT_TRUE(mapper.isOk());
    EXPECT_EQ(mapper.getValue().getSectionsPerSlot(), DEFAULT_SECTIONS_PER_SLOT);

    processor->clearTrace();
    ASSERT_TRUE(mmu->mapDevices(mapper.getValue(), TableMutationGrant::attest()).isOk());

    const std::vector<ProcessorEvent>& trace = processor->getTrace();
    ASSERT_EQ(trace.size(), 2u);
    EXPECT_EQ(trace[0], ProcessorEvent::Dsb);
    EXPECT_EQ(trace[1], ProcessorEvent::Isb);

    // Written through to the caller's table memory
    EXPECT_EQ((*table)[0x902].getType(), TranslationTableType::Section);

    mmu->enable();
    Result<PhysicalAddress> pa = mmu->translate(VirtualAddress(0x90200000));
    ASSERT_TRUE(pa.isOk());
    EXPECT_EQ(pa.getValue(), PhysicalAddress(0x3F200000));
    EXPECT_EQ(mapper.getValue().lookup(pa.getValue()).getValue(), VirtualAddress(0x90200000));

    EXPECT_TRUE(mmu->translate(VirtualAddress(0x90F00000)).isError());
}

TEST_F(MmuTest, DeviceMapperFollowsConfiguration) {
    ASSERT_TRUE(mmu->updateConfiguration(MmuConfiguration::createFullSlotMapping()).isOk());

    Result<DeviceVmemMapper> mapper = mmu->createDeviceMapper(VirtualAddress(0x90000000), {0x3F});
    ASSERT_TRUE(mapper.isOk());
    EXPECT_EQ(mapper.getValue().getSectionsPerSlot(), 16u);
}

TEST_F(MmuTest, CreatePageTable) {
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());

    Result<PageTable> created = mmu->createPageTable(mmuPageTable, VirtualAddress(0x00008000),
                                                     MemoryAttributes(), 0x001, TableMutationGrant::attest());
    ASSERT_TRUE(created.isOk());
    PageTable pageTable = created.getValue();

    Result<PageTableDescriptor> page = PageTableDescriptor::create(
        PageTableType::SmallPage, PhysicalAddress(0x00345000), MemoryAttributes::from(AP::FullAccess));
    ASSERT_TRUE(page.isOk());
    ASSERT_TRUE(pageTable.set(0x23, page.getValue(), TableMutationGrant::attest()).isOk());

    EXPECT_EQ((*table)[0x001].getType(), TranslationTableType::Page);

    mmu->enable();
    Result<PhysicalAddress> pa =
        mmu->translate(VirtualAddress(0x00123456), AddressTranslationOperation::UnprivilegedWrite);
    ASSERT_TRUE(pa.isOk());
    EXPECT_EQ(pa.getValue(), PhysicalAddress(0x00345456));

    EXPECT_TRUE(mmu->translate(VirtualAddress(0x00124000)).isError());
    EXPECT_EQ(mmu->getFaultHandler().getFaultCountByType(FaultType::TranslationFaultPage), 1u);
}

TEST_F(MmuTest, UpdateConfiguration) {
    MmuConfiguration invalid(DeviceMappingConfiguration(), TranslationConfiguration(), FaultConfiguration(2));
    EXPECT_EQ(mmu->updateConfiguration(invalid).getError(), PageError::InvalidConfiguration);
    EXPECT_EQ(mmu->getConfiguration(), MmuConfiguration::createDefault());

    ASSERT_TRUE(mmu->updateConfiguration(MmuConfiguration::createQuiet()).isOk());
    EXPECT_EQ(mmu->getFaultHandler().getMaxQueueSize(), FaultConfiguration::MIN_RECORDS);
}

TEST_F(MmuTest, StatisticsAndReset) {
    ASSERT_TRUE(mmu->installTranslationTable(*table).isOk());
    mmu->enable();

    EXPECT_TRUE(mmu->translate(VirtualAddress(0x40000000)).isError());
    EXPECT_TRUE(mmu->translate(VirtualAddress(0x50000000)).isError());
    EXPECT_EQ(mmu->getTranslationCount(), 2u);
    EXPECT_EQ(mmu->getTotalFaults(), 2u);

    mmu->resetStatistics();
    EXPECT_EQ(mmu->getTranslationCount(), 0u);
    EXPECT_EQ(mmu->getTotalFaults(), 0u);
    EXPECT_EQ(mmu->getFaultHandler().getFaultCount(), 2u);

    mmu->reset();
    EXPECT_EQ(mmu->installedTable(), nullptr);
    EXPECT_FALSE(mmu->getFaultHandler().hasFaults());
}

} // namespace test
} // namespace armv7
