// ARMv7-A Simulated Processor Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/simulated_processor.h"
#include "armv7/descriptors.h"
#include <algorithm>
#include <cstring>

namespace armv7 {

// Reset state: MMU off, low vectors, IRQs masked, SVC mode
SimulatedProcessor::SimulatedProcessor()
    : ttbr0(0), ttbr1(0), sctlr(0), vbar(0), par(0), cpsr(CPSR_IRQ_MASK | 0x13),
      isr(0), dfsr(0), dfar(0), ifsr(0), ifar(0) {
}

SimulatedProcessor::~SimulatedProcessor() {
}

uint32_t SimulatedProcessor::readTtbr0() const {
    return ttbr0;
}

void SimulatedProcessor::writeTtbr0(uint32_t value) {
    trace.push_back(ProcessorEvent::WriteTtbr0);
    ttbr0 = value;
}

uint32_t SimulatedProcessor::readTtbr1() const {
    return ttbr1;
}

void SimulatedProcessor::writeTtbr1(uint32_t value) {
    trace.push_back(ProcessorEvent::WriteTtbr1);
    ttbr1 = value;
}

uint32_t SimulatedProcessor::readSctlr() const {
    return sctlr;
}

void SimulatedProcessor::writeSctlr(uint32_t value) {
    trace.push_back(ProcessorEvent::WriteSctlr);
    sctlr = value;
}

uint32_t SimulatedProcessor::readVbar() const {
    return vbar;
}

void SimulatedProcessor::writeVbar(uint32_t value) {
    vbar = value;
}

uint32_t SimulatedProcessor::readIsr() const {
    return isr;
}

uint32_t SimulatedProcessor::readDfsr() const {
    return dfsr;
}

uint32_t SimulatedProcessor::readDfar() const {
    return dfar;
}

uint32_t SimulatedProcessor::readIfsr() const {
    return ifsr;
}

uint32_t SimulatedProcessor::readIfar() const {
    return ifar;
}

void SimulatedProcessor::setInterruptStatus(uint32_t value) {
    isr = value;
}

void SimulatedProcessor::setDataFault(uint32_t status, uint32_t address) {
    dfsr = status;
    dfar = address;
}

void SimulatedProcessor::setInstructionFault(uint32_t status, uint32_t address) {
    ifsr = status;
    ifar = address;
}

void SimulatedProcessor::requestAddressTranslation(AddressTranslationOperation operation, uint32_t va) {
    trace.push_back(ProcessorEvent::AddressTranslation);
    par = translateAddress(operation, va);
}

bool SimulatedProcessor::dataAccess(AddressTranslationOperation operation, uint32_t va) {
    uint32_t result = translateAddress(operation, va);
    if ((result & PAR_FAULT) == 0) {
        return true;
    }

    // FS[4] moves to bit 10 in the FSR layout
    uint32_t faultStatus = (result >> PAR_FS_SHIFT) & 0x1F;
    uint32_t status = (faultStatus & FSR_FS_LOW_MASK) | ((faultStatus & 0x10) != 0 ? FSR_FS4 : 0);
    if (operation == AddressTranslationOperation::PrivilegedWrite ||
        operation == AddressTranslationOperation::UnprivilegedWrite) {
        status |= DFSR_WNR;
    }

    trace.push_back(ProcessorEvent::DataAbort);
    setDataFault(status, va);
    return false;
}

uint32_t SimulatedProcessor::readPar() const {
    return par;
}

void SimulatedProcessor::nop() {
    trace.push_back(ProcessorEvent::Nop);
}

void SimulatedProcessor::dsb() {
    trace.push_back(ProcessorEvent::Dsb);
}

void SimulatedProcessor::isb() {
    trace.push_back(ProcessorEvent::Isb);
}

uint32_t SimulatedProcessor::disableInterrupts() {
    trace.push_back(ProcessorEvent::DisableInterrupts);
    uint32_t previous = cpsr;
    cpsr |= CPSR_IRQ_MASK;
    return previous;
}

void SimulatedProcessor::restoreInterrupts(uint32_t previousCpsr) {
    if ((previousCpsr & CPSR_IRQ_MASK) == 0) {
        trace.push_back(ProcessorEvent::EnableInterrupts);
        cpsr &= ~CPSR_IRQ_MASK;
    }
}

uint32_t SimulatedProcessor::readCpsr() const {
    return cpsr;
}

void SimulatedProcessor::writeCpsr(uint32_t value) {
    cpsr = value;
}

bool SimulatedProcessor::interruptsEnabled() const {
    return (cpsr & CPSR_IRQ_MASK) == 0;
}

VoidResult SimulatedProcessor::attachMemory(PhysicalAddress base, void* hostMemory, uint32_t size) {
    if (hostMemory == nullptr || size == 0) {
        return makeVoidError(PageError::InvalidMemory);
    }
    if (!base.isAligned(0x3) || (size & 0x3) != 0) {
        return makeVoidError(PageError::AlignError);
    }
    if (base.checkedAdd(size - 1).isError()) {
        return makeVoidError(PageError::NotInRange);
    }

    uint64_t newEnd = static_cast<uint64_t>(base.asU32()) + size;
    for (const auto& region : regions) {
        uint64_t regionEnd = static_cast<uint64_t>(region.base) + region.size;
        if (base.asU32() < regionEnd && region.base < newEnd) {
            return makeVoidError(PageError::InvalidMemory);
        }
    }

    regions.push_back(MemoryRegion(base.asU32(), size, static_cast<uint8_t*>(hostMemory)));
    return makeVoidSuccess();
}

void SimulatedProcessor::detachAllMemory() {
    regions.clear();
}

Result<uint32_t> SimulatedProcessor::readWord(PhysicalAddress address) const {
    const MemoryRegion* region = findRegion(address.asU32(), sizeof(uint32_t));
    if (region == nullptr) {
        return makeError<uint32_t>(PageError::InvalidMemory);
    }
    uint32_t word = 0;
    std::memcpy(&word, region->host + (address.asU32() - region->base), sizeof(word));
    return makeSuccess<uint32_t>(word);
}

VoidResult SimulatedProcessor::writeWord(PhysicalAddress address, uint32_t value) {
    const MemoryRegion* region = findRegion(address.asU32(), sizeof(uint32_t));
    if (region == nullptr) {
        return makeVoidError(PageError::InvalidMemory);
    }
    std::memcpy(region->host + (address.asU32() - region->base), &value, sizeof(value));
    return makeVoidSuccess();
}

const std::vector<ProcessorEvent>& SimulatedProcessor::getTrace() const {
    return trace;
}

void SimulatedProcessor::clearTrace() {
    trace.clear();
}

size_t SimulatedProcessor::countEvents(ProcessorEvent event) const {
    return static_cast<size_t>(std::count(trace.begin(), trace.end(), event));
}

void SimulatedProcessor::reset() {
    ttbr0 = 0;
    ttbr1 = 0;
    sctlr = 0;
    vbar = 0;
    par = 0;
    cpsr = CPSR_IRQ_MASK | 0x13;
    isr = 0;
    dfsr = 0;
    dfar = 0;
    ifsr = 0;
    ifar = 0;
    regions.clear();
    trace.clear();
}

const SimulatedProcessor::MemoryRegion* SimulatedProcessor::findRegion(uint32_t address, uint32_t length) const {
    for (const auto& region : regions) {
        if (region.contains(address, length)) {
            return &region;
        }
    }
    return nullptr;
}

uint32_t SimulatedProcessor::translateAddress(AddressTranslationOperation operation, uint32_t va) const {
    if ((sctlr & SCTLR_MMU) == 0) {
        // Flat mapping while the MMU is off
        return va & ~SMALL_PAGE_MASK;
    }
    return walk(operation, va);
}

// Short-descriptor stage-1 walk, returns the PAR value
uint32_t SimulatedProcessor::walk(AddressTranslationOperation operation, uint32_t va) const {
    uint32_t tableBase = ttbr0 & ~TRANSLATION_TABLE_ALIGN_MASK;
    uint32_t firstLevelAddress = tableBase + ((va >> 20) << 2);

    Result<uint32_t> firstLevel = readWord(PhysicalAddress(firstLevelAddress));
    if (firstLevel.isError()) {
        return faultPar(FS_EXTERNAL_ABORT_WALK);
    }

    TranslationTableDescriptor descriptor = TranslationTableDescriptor::fromBits(firstLevel.getValue());
    uint32_t pa = 0;
    bool nonSecure = false;

    switch (descriptor.getType()) {
        case TranslationTableType::Invalid:
            return faultPar(FS_TRANSLATION_SECTION);

        case TranslationTableType::Section:
        case TranslationTableType::Supersection: {
            MemoryAttributes memoryAttributes = descriptor.getAttributes().getValue();
            if (!accessPermitted(operation, memoryAttributes.getAccessPermission(), memoryAttributes.isReadOnly())) {
                return faultPar(FS_PERMISSION_SECTION);
            }
            uint32_t mask = alignMask(descriptor.getType());
            pa = (descriptor.bits() & ~mask) | (va & mask);
            nonSecure = memoryAttributes.isNonSecure();
            break;
        }

        case TranslationTableType::Page: {
            uint32_t pageTableBase = descriptor.bits() & ~PAGE_TABLE_ALIGN_MASK;
            uint32_t secondLevelAddress = pageTableBase + (((va >> 12) & 0xFF) << 2);

            Result<uint32_t> secondLevel = readWord(PhysicalAddress(secondLevelAddress));
            if (secondLevel.isError()) {
                return faultPar(FS_EXTERNAL_ABORT_WALK);
            }

            PageTableDescriptor page = PageTableDescriptor::fromBits(secondLevel.getValue());
            if (page.getType() == PageTableType::Invalid) {
                return faultPar(FS_TRANSLATION_PAGE);
            }

            MemoryAttributes memoryAttributes = page.getAttributes().getValue();
            if (!accessPermitted(operation, memoryAttributes.getAccessPermission(), memoryAttributes.isReadOnly())) {
                return faultPar(FS_PERMISSION_PAGE);
            }
            uint32_t mask = alignMask(page.getType());
            pa = (page.bits() & ~mask) | (va & mask);
            // NS comes from the first-level descriptor for pages
            nonSecure = descriptor.getAttributes().getValue().isNonSecure();
            break;
        }
    }

    return (pa & ~SMALL_PAGE_MASK) | (nonSecure ? PAR_NS : 0);
}

// AP[2:0] check with the access flag disabled
bool SimulatedProcessor::accessPermitted(AddressTranslationOperation operation, uint32_t ap, bool readOnly) const {
    bool privileged = operation == AddressTranslationOperation::PrivilegedRead ||
                      operation == AddressTranslationOperation::PrivilegedWrite;
    bool write = operation == AddressTranslationOperation::PrivilegedWrite ||
                 operation == AddressTranslationOperation::UnprivilegedWrite;

    if (ap == 0) {
        return false;
    }
    if (write && readOnly) {
        return false;
    }
    if (!privileged) {
        if (ap == 1) {
            return false;
        }
        if (ap == 2 && write) {
            return false;
        }
    }
    return true;
}

uint32_t SimulatedProcessor::faultPar(uint32_t faultStatus) {
    return PAR_FAULT | ((faultStatus & PAR_FS_MASK) << PAR_FS_SHIFT);
}

} // namespace armv7
