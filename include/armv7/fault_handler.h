// ARMv7-A Address Translation Fault Handler
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_FAULT_HANDLER_H
#define ARMV7_FAULT_HANDLER_H

#include "armv7/types.h"
#include "armv7/address.h"
#include <vector>
#include <deque>
#include <mutex>
#include <cstddef>
#include <cstdint>

namespace armv7 {

/// @brief Default bound of the fault queue
constexpr size_t DEFAULT_MAX_FAULT_RECORDS = 1000;

/**
 * @struct FaultRecord
 * @brief One failed address translation
 */
struct FaultRecord {
    VirtualAddress address;                   // Faulting virtual address
    AddressTranslationOperation operation;    // ATS1Cxx operation that faulted
    uint32_t parValue;                        // Raw PAR after the operation
    FaultType faultType;                      // Decoded from PAR.FS
    uint64_t timestamp;                       // Microseconds, steady clock

    FaultRecord() : address(), operation(AddressTranslationOperation::PrivilegedRead),
                    parValue(0), faultType(FaultType::Unknown), timestamp(0) {
    }

    FaultRecord(VirtualAddress va, AddressTranslationOperation op, uint32_t par)
        : address(va), operation(op), parValue(par), faultType(faultTypeFromPar(par)), timestamp(0) {
    }
};

class FaultHandler {
public:
    FaultHandler();
    explicit FaultHandler(size_t maxRecords);
    ~FaultHandler();

    // Fault recording
    void recordFault(const FaultRecord& fault);
    void recordTranslationFault(VirtualAddress va, AddressTranslationOperation operation, uint32_t par);

    // Queue access
    std::vector<FaultRecord> getFaults() const;
    void clearFaults();
    bool hasFaults() const;
    size_t getFaultCount() const;

    // Filtering operations
    std::vector<FaultRecord> getFaultsByType(FaultType faultType) const;
    std::vector<FaultRecord> getFaultsByOperation(AddressTranslationOperation operation) const;
    std::vector<FaultRecord> getFaultsInRange(VirtualAddress start, VirtualAddress end) const;

    // Configuration
    void setMaxQueueSize(size_t maxSize);
    size_t getMaxQueueSize() const;

    // Statistics
    uint64_t getTotalFaultCount() const;
    uint64_t getTranslationFaultCount() const;
    uint64_t getPermissionFaultCount() const;
    size_t getFaultCountByType(FaultType faultType) const;
    void resetStatistics();
    void reset();  // Queue and statistics

private:
    std::deque<FaultRecord> faultQueue;
    mutable std::mutex queueMutex;

    size_t maxQueueSize;

    uint64_t totalFaults;
    uint64_t translationFaults;
    uint64_t permissionFaults;

    uint64_t getCurrentTimestamp() const;
    void enforceQueueLimit();
};

} // namespace armv7

#endif // ARMV7_FAULT_HANDLER_H
