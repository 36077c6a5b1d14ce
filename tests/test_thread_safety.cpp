// ARMv7-A Thread Safety Tests
// Copyright (c) 2024 John Greninger
//
// Multi-threaded scenarios for FaultHandler, which may be fed from an abort
// handler while another thread inspects the recorded faults.

#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <atomic>
#include <memory>

#include "armv7/fault_handler.h"
#include "armv7/types.h"

namespace armv7 {
namespace test {

class ThreadSafetyTest : public ::testing::Test {
protected:
    void SetUp() override {
        faultHandler = std::unique_ptr<FaultHandler>(new FaultHandler(QUEUE_LIMIT));
        errorCount.store(0);
    }

    void TearDown() override {
        faultHandler.reset();
    }

    static const size_t QUEUE_LIMIT = 65536;
    static const int NUM_THREADS = 8;
    static const int FAULTS_PER_THREAD = 2000;

    std::unique_ptr<FaultHandler> faultHandler;
    std::atomic<int> errorCount;
};

const size_t ThreadSafetyTest::QUEUE_LIMIT;
const int ThreadSafetyTest::NUM_THREADS;
const int ThreadSafetyTest::FAULTS_PER_THREAD;

TEST_F(ThreadSafetyTest, FaultHandler_ConcurrentRecording) {
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < FAULTS_PER_THREAD; ++i) {
                uint32_t va = (static_cast<uint32_t>(t) << 24) | (static_cast<uint32_t>(i) << 12);
                // Alternate translation and permission faults
                uint32_t par = (i % 2 == 0) ? 0x0B : 0x1F;
                faultHandler->recordTranslationFault(VirtualAddress(va),
                                                     AddressTranslationOperation::PrivilegedRead, par);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    const uint64_t expected = static_cast<uint64_t>(NUM_THREADS) * FAULTS_PER_THREAD;
    EXPECT_EQ(faultHandler->getTotalFaultCount(), expected);
    EXPECT_EQ(faultHandler->getFaultCount(), expected);
    EXPECT_EQ(faultHandler->getTranslationFaultCount(), expected / 2);
    EXPECT_EQ(faultHandler->getPermissionFaultCount(), expected / 2);

    // Every thread owns one 16MB range
    for (int t = 0; t < NUM_THREADS; ++t) {
        uint32_t start = static_cast<uint32_t>(t) << 24;
        EXPECT_EQ(faultHandler->getFaultsInRange(VirtualAddress(start), VirtualAddress(start + 0x00FFFFFF)).size(),
                  static_cast<size_t>(FAULTS_PER_THREAD));
    }
}

TEST_F(ThreadSafetyTest, FaultHandler_ReadersDuringRecording) {
    faultHandler->setMaxQueueSize(256);
    std::atomic<bool> done(false);

    std::thread writer([this, &done]() {
        for (int i = 0; i < FAULTS_PER_THREAD * NUM_THREADS; ++i) {
            faultHandler->recordTranslationFault(VirtualAddress(static_cast<uint32_t>(i) << 12),
                                                 AddressTranslationOperation::UnprivilegedWrite, 0x1B);
        }
        done.store(true);
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([this, &done]() {
            while (!done.load()) {
                std::vector<FaultRecord> snapshot = faultHandler->getFaults();
                if (snapshot.size() > 256) {
                    errorCount.fetch_add(1);
                }
                for (const FaultRecord& fault : snapshot) {
                    if (fault.faultType != FaultType::PermissionFaultSection) {
                        errorCount.fetch_add(1);
                        break;
                    }
                }
                faultHandler->getFaultsByOperation(AddressTranslationOperation::UnprivilegedWrite);
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(errorCount.load(), 0);
    EXPECT_EQ(faultHandler->getFaultCount(), 256u);
    EXPECT_EQ(faultHandler->getPermissionFaultCount(),
              static_cast<uint64_t>(FAULTS_PER_THREAD) * NUM_THREADS);
}

TEST_F(ThreadSafetyTest, FaultHandler_ConcurrentClearAndReset) {
    std::atomic<bool> done(false);

    std::thread writer([this, &done]() {
        for (int i = 0; i < FAULTS_PER_THREAD; ++i) {
            faultHandler->recordTranslationFault(VirtualAddress(0x1000), AddressTranslationOperation::PrivilegedRead,
                                                 0x0F);
        }
        done.store(true);
    });

    std::thread clearer([this, &done]() {
        while (!done.load()) {
            faultHandler->clearFaults();
            if (faultHandler->getFaultCount() > static_cast<size_t>(FAULTS_PER_THREAD)) {
                errorCount.fetch_add(1);
            }
        }
    });

    writer.join();
    clearer.join();

    EXPECT_EQ(errorCount.load(), 0);
    EXPECT_EQ(faultHandler->getTotalFaultCount(), static_cast<uint64_t>(FAULTS_PER_THREAD));

    faultHandler->reset();
    EXPECT_FALSE(faultHandler->hasFaults());
    EXPECT_EQ(faultHandler->getTotalFaultCount(), 0u);
}

} // namespace test
} // namespace armv7
