// ARMv7-A Address Translation Fault Handler Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/fault_handler.h"
#include <chrono>

namespace armv7 {

namespace {

bool isTranslationFault(FaultType faultType) {
    return faultType == FaultType::TranslationFaultSection || faultType == FaultType::TranslationFaultPage;
}

bool isPermissionFault(FaultType faultType) {
    return faultType == FaultType::PermissionFaultSection || faultType == FaultType::PermissionFaultPage;
}

} // namespace

FaultHandler::FaultHandler()
    : maxQueueSize(DEFAULT_MAX_FAULT_RECORDS), totalFaults(0), translationFaults(0), permissionFaults(0) {
}

FaultHandler::FaultHandler(size_t maxRecords)
    : maxQueueSize(maxRecords), totalFaults(0), translationFaults(0), permissionFaults(0) {
}

FaultHandler::~FaultHandler() {
}

void FaultHandler::recordFault(const FaultRecord& fault) {
    std::lock_guard<std::mutex> lock(queueMutex);
    faultQueue.push_back(fault);

    totalFaults++;
    if (isTranslationFault(fault.faultType)) {
        translationFaults++;
    } else if (isPermissionFault(fault.faultType)) {
        permissionFaults++;
    }

    enforceQueueLimit();
}

void FaultHandler::recordTranslationFault(VirtualAddress va, AddressTranslationOperation operation, uint32_t par) {
    FaultRecord fault(va, operation, par);
    fault.timestamp = getCurrentTimestamp();
    recordFault(fault);
}

std::vector<FaultRecord> FaultHandler::getFaults() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return std::vector<FaultRecord>(faultQueue.begin(), faultQueue.end());
}

void FaultHandler::clearFaults() {
    std::lock_guard<std::mutex> lock(queueMutex);
    faultQueue.clear();
}

bool FaultHandler::hasFaults() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return !faultQueue.empty();
}

size_t FaultHandler::getFaultCount() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return faultQueue.size();
}

std::vector<FaultRecord> FaultHandler::getFaultsByType(FaultType faultType) const {
    std::lock_guard<std::mutex> lock(queueMutex);
    std::vector<FaultRecord> result;
    for (const auto& fault : faultQueue) {
        if (fault.faultType == faultType) {
            result.push_back(fault);
        }
    }
    return result;
}

std::vector<FaultRecord> FaultHandler::getFaultsByOperation(AddressTranslationOperation operation) const {
    std::lock_guard<std::mutex> lock(queueMutex);
    std::vector<FaultRecord> result;
    for (const auto& fault : faultQueue) {
        if (fault.operation == operation) {
            result.push_back(fault);
        }
    }
    return result;
}

// Inclusive of both ends so that the top of the address space can be queried
std::vector<FaultRecord> FaultHandler::getFaultsInRange(VirtualAddress start, VirtualAddress end) const {
    std::lock_guard<std::mutex> lock(queueMutex);
    std::vector<FaultRecord> result;
    for (const auto& fault : faultQueue) {
        if (fault.address >= start && fault.address <= end) {
            result.push_back(fault);
        }
    }
    return result;
}

void FaultHandler::setMaxQueueSize(size_t maxSize) {
    std::lock_guard<std::mutex> lock(queueMutex);
    maxQueueSize = maxSize;
    enforceQueueLimit();
}

size_t FaultHandler::getMaxQueueSize() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return maxQueueSize;
}

uint64_t FaultHandler::getTotalFaultCount() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return totalFaults;
}

uint64_t FaultHandler::getTranslationFaultCount() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return translationFaults;
}

uint64_t FaultHandler::getPermissionFaultCount() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return permissionFaults;
}

size_t FaultHandler::getFaultCountByType(FaultType faultType) const {
    std::lock_guard<std::mutex> lock(queueMutex);
    size_t count = 0;
    for (const auto& fault : faultQueue) {
        if (fault.faultType == faultType) {
            count++;
        }
    }
    return count;
}

void FaultHandler::resetStatistics() {
    std::lock_guard<std::mutex> lock(queueMutex);
    totalFaults = 0;
    translationFaults = 0;
    permissionFaults = 0;
}

void FaultHandler::reset() {
    clearFaults();
    resetStatistics();
}

uint64_t FaultHandler::getCurrentTimestamp() const {
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count());
}

// Caller holds queueMutex
void FaultHandler::enforceQueueLimit() {
    while (faultQueue.size() > maxQueueSize) {
        faultQueue.pop_front();
    }
}

} // namespace armv7
