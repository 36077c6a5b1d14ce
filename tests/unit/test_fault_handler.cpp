// ARMv7-A FaultHandler Unit Tests
// Copyright (c) 2024 John Greninger

#include <gtest/gtest.h>
#include "armv7/fault_handler.h"
#include "armv7/types.h"
#include <memory>

namespace armv7 {
namespace test {

namespace {

// PAR values left by a failed ATS1Cxx operation
constexpr uint32_t PAR_TRANSLATION_SECTION = 0x0B;
constexpr uint32_t PAR_TRANSLATION_PAGE = 0x0F;
constexpr uint32_t PAR_PERMISSION_SECTION = 0x1B;
constexpr uint32_t PAR_PERMISSION_PAGE = 0x1F;
constexpr uint32_t PAR_EXTERNAL_ABORT = 0x19;

} // namespace

class FaultHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        faultHandler = std::make_unique<FaultHandler>();
    }

    void TearDown() override {
        faultHandler.reset();
    }

    std::unique_ptr<FaultHandler> faultHandler;

    FaultRecord createTestFault(uint32_t va, AddressTranslationOperation operation, uint32_t par,
                                uint64_t timestamp = 12345) {
        FaultRecord fault(VirtualAddress(va), operation, par);
        fault.timestamp = timestamp;
        return fault;
    }
};

TEST_F(FaultHandlerTest, DefaultConstruction) {
    ASSERT_NE(faultHandler, nullptr);

    EXPECT_EQ(faultHandler->getFaultCount(), 0u);
    EXPECT_FALSE(faultHandler->hasFaults());
    EXPECT_TRUE(faultHandler->getFaults().empty());
    EXPECT_EQ(faultHandler->getMaxQueueSize(), DEFAULT_MAX_FAULT_RECORDS);
}

TEST_F(FaultHandlerTest, FaultRecordDecodesPar) {
    EXPECT_EQ(FaultRecord(VirtualAddress(0), AddressTranslationOperation::PrivilegedRead,
                          PAR_TRANSLATION_SECTION).faultType, FaultType::TranslationFaultSection);
    EXPECT_EQ(FaultRecord(VirtualAddress(0), AddressTranslationOperation::PrivilegedRead,
                          PAR_TRANSLATION_PAGE).faultType, FaultType::TranslationFaultPage);
    EXPECT_EQ(FaultRecord(VirtualAddress(0), AddressTranslationOperation::PrivilegedRead,
                          PAR_PERMISSION_SECTION).faultType, FaultType::PermissionFaultSection);
    EXPECT_EQ(FaultRecord(VirtualAddress(0), AddressTranslationOperation::PrivilegedRead,
                          PAR_PERMISSION_PAGE).faultType, FaultType::PermissionFaultPage);
    EXPECT_EQ(FaultRecord(VirtualAddress(0), AddressTranslationOperation::PrivilegedRead,
                          PAR_EXTERNAL_ABORT).faultType, FaultType::ExternalAbortOnWalk);

    FaultRecord empty;
    EXPECT_EQ(empty.faultType, FaultType::Unknown);
    EXPECT_EQ(empty.parValue, 0u);
}

TEST_F(FaultHandlerTest, SingleFaultRecording) {
    faultHandler->recordFault(createTestFault(0x90000000, AddressTranslationOperation::PrivilegedWrite,
                                              PAR_PERMISSION_SECTION));

    EXPECT_TRUE(faultHandler->hasFaults());
    std::vector<FaultRecord> faults = faultHandler->getFaults();
    ASSERT_EQ(faults.size(), 1u);

    const FaultRecord& recorded = faults[0];
    EXPECT_EQ(recorded.address, VirtualAddress(0x90000000));
    EXPECT_EQ(recorded.operation, AddressTranslationOperation::PrivilegedWrite);
    EXPECT_EQ(recorded.parValue, PAR_PERMISSION_SECTION);
    EXPECT_EQ(recorded.faultType, FaultType::PermissionFaultSection);
    EXPECT_EQ(recorded.timestamp, 12345u);
}

TEST_F(FaultHandlerTest, RecordTranslationFaultStampsTime) {
    faultHandler->recordTranslationFault(VirtualAddress(0x1000), AddressTranslationOperation::UnprivilegedRead,
                                         PAR_TRANSLATION_PAGE);
    faultHandler->recordTranslationFault(VirtualAddress(0x2000), AddressTranslationOperation::UnprivilegedRead,
                                         PAR_TRANSLATION_PAGE);

    std::vector<FaultRecord> faults = faultHandler->getFaults();
    ASSERT_EQ(faults.size(), 2u);
    EXPECT_EQ(faults[0].faultType, FaultType::TranslationFaultPage);
    EXPECT_GE(faults[1].timestamp, faults[0].timestamp);
}

TEST_F(FaultHandlerTest, FaultsKeepRecordingOrder) {
    faultHandler->recordFault(createTestFault(0x100, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION, 1));
    faultHandler->recordFault(createTestFault(0x200, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION, 2));
    faultHandler->recordFault(createTestFault(0x300, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION, 3));

    std::vector<FaultRecord> faults = faultHandler->getFaults();
    ASSERT_EQ(faults.size(), 3u);
    EXPECT_EQ(faults[0].address, VirtualAddress(0x100));
    EXPECT_EQ(faults[1].address, VirtualAddress(0x200));
    EXPECT_EQ(faults[2].address, VirtualAddress(0x300));
}

TEST_F(FaultHandlerTest, FilterByType) {
    faultHandler->recordFault(createTestFault(0x100, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));
    faultHandler->recordFault(createTestFault(0x200, AddressTranslationOperation::PrivilegedWrite, PAR_PERMISSION_SECTION));
    faultHandler->recordFault(createTestFault(0x300, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));

    std::vector<FaultRecord> translation = faultHandler->getFaultsByType(FaultType::TranslationFaultSection);
    ASSERT_EQ(translation.size(), 2u);
    EXPECT_EQ(translation[0].address, VirtualAddress(0x100));
    EXPECT_EQ(translation[1].address, VirtualAddress(0x300));

    EXPECT_EQ(faultHandler->getFaultsByType(FaultType::PermissionFaultSection).size(), 1u);
    EXPECT_TRUE(faultHandler->getFaultsByType(FaultType::DomainFaultPage).empty());
    EXPECT_EQ(faultHandler->getFaultCountByType(FaultType::TranslationFaultSection), 2u);
}

TEST_F(FaultHandlerTest, FilterByOperation) {
    faultHandler->recordFault(createTestFault(0x100, AddressTranslationOperation::UnprivilegedWrite, PAR_PERMISSION_PAGE));
    faultHandler->recordFault(createTestFault(0x200, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_PAGE));

    std::vector<FaultRecord> writes = faultHandler->getFaultsByOperation(AddressTranslationOperation::UnprivilegedWrite);
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].address, VirtualAddress(0x100));
    EXPECT_TRUE(faultHandler->getFaultsByOperation(AddressTranslationOperation::PrivilegedWrite).empty());
}

TEST_F(FaultHandlerTest, FilterByAddressRange) {
    faultHandler->recordFault(createTestFault(0x00001000, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));
    faultHandler->recordFault(createTestFault(0x80000000, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));
    faultHandler->recordFault(createTestFault(0xFFFFFFFF, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));

    EXPECT_EQ(faultHandler->getFaultsInRange(VirtualAddress(0x80000000), VirtualAddress(0xFFFFFFFF)).size(), 2u);
    EXPECT_EQ(faultHandler->getFaultsInRange(VirtualAddress(0x00001000), VirtualAddress(0x00001000)).size(), 1u);
    EXPECT_TRUE(faultHandler->getFaultsInRange(VirtualAddress(0x00002000), VirtualAddress(0x7FFFFFFF)).empty());
}

TEST_F(FaultHandlerTest, QueueDropsOldestRecords) {
    faultHandler->setMaxQueueSize(2);
    EXPECT_EQ(faultHandler->getMaxQueueSize(), 2u);

    faultHandler->recordFault(createTestFault(0x100, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));
    faultHandler->recordFault(createTestFault(0x200, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));
    faultHandler->recordFault(createTestFault(0x300, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));

    std::vector<FaultRecord> faults = faultHandler->getFaults();
    ASSERT_EQ(faults.size(), 2u);
    EXPECT_EQ(faults[0].address, VirtualAddress(0x200));
    EXPECT_EQ(faults[1].address, VirtualAddress(0x300));

    // Dropped records still count
    EXPECT_EQ(faultHandler->getTotalFaultCount(), 3u);
}

TEST_F(FaultHandlerTest, ShrinkingQueueTrimsExistingRecords) {
    for (uint32_t i = 0; i < 10; ++i) {
        faultHandler->recordFault(createTestFault(i * 0x1000, AddressTranslationOperation::PrivilegedRead,
                                                  PAR_TRANSLATION_SECTION));
    }
    faultHandler->setMaxQueueSize(4);

    std::vector<FaultRecord> faults = faultHandler->getFaults();
    ASSERT_EQ(faults.size(), 4u);
    EXPECT_EQ(faults.front().address, VirtualAddress(0x6000));
}

TEST_F(FaultHandlerTest, ConstructWithQueueBound) {
    FaultHandler bounded(16);
    EXPECT_EQ(bounded.getMaxQueueSize(), 16u);
}

TEST_F(FaultHandlerTest, Statistics) {
    faultHandler->recordFault(createTestFault(0x100, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));
    faultHandler->recordFault(createTestFault(0x200, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_PAGE));
    faultHandler->recordFault(createTestFault(0x300, AddressTranslationOperation::PrivilegedWrite, PAR_PERMISSION_PAGE));
    faultHandler->recordFault(createTestFault(0x400, AddressTranslationOperation::PrivilegedRead, PAR_EXTERNAL_ABORT));

    EXPECT_EQ(faultHandler->getTotalFaultCount(), 4u);
    EXPECT_EQ(faultHandler->getTranslationFaultCount(), 2u);
    EXPECT_EQ(faultHandler->getPermissionFaultCount(), 1u);
}

TEST_F(FaultHandlerTest, ClearKeepsStatistics) {
    faultHandler->recordFault(createTestFault(0x100, AddressTranslationOperation::PrivilegedRead, PAR_TRANSLATION_SECTION));
    faultHandler->clearFaults();

    EXPECT_FALSE(faultHandler->hasFaults());
    EXPECT_EQ(faultHandler->getTotalFaultCount(), 1u);

    faultHandler->resetStatistics();
    EXPECT_EQ(faultHandler->getTotalFaultCount(), 0u);
    EXPECT_EQ(faultHandler->getTranslationFaultCount(), 0u);
}

TEST_F(FaultHandlerTest, ResetClearsEverything) {
    faultHandler->recordFault(createTestFault(0x100, AddressTranslationOperation::PrivilegedRead, PAR_PERMISSION_SECTION));
    faultHandler->reset();

    EXPECT_EQ(faultHandler->getFaultCount(), 0u);
    EXPECT_EQ(faultHandler->getTotalFaultCount(), 0u);
    EXPECT_EQ(faultHandler->getPermissionFaultCount(), 0u);
}

} // namespace test
} // namespace armv7
