// ARMv7-A MMU Controller Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/mmu.h"
#include "armv7/address_translation.h"

namespace armv7 {

Mmu::Mmu(Processor& cpu)
    : processor(cpu),
      configuration(MmuConfiguration::createDefault()),
      faultHandler(std::make_shared<FaultHandler>(configuration.getFaultConfiguration().maxFaultRecords)),
      installed(),
      translationCount(0) {
}

Mmu::Mmu(Processor& cpu, const MmuConfiguration& config)
    : processor(cpu),
      configuration(config.isValid() ? config : MmuConfiguration::createDefault()),
      faultHandler(std::make_shared<FaultHandler>(configuration.getFaultConfiguration().maxFaultRecords)),
      installed(),
      translationCount(0) {
}

Mmu::~Mmu() {
}

Result<PhysicalAddress> Mmu::translate(VirtualAddress va) {
    return translate(va, configuration.getTranslationConfiguration().defaultOperation);
}

Result<PhysicalAddress> Mmu::translate(VirtualAddress va, AddressTranslationOperation operation) {
    translationCount.fetch_add(1);

    uint32_t par = getPhysFrame(processor, va, operation);
    if (isParFault(par)) {
        if (configuration.getTranslationConfiguration().recordFaults) {
            faultHandler->recordTranslationFault(va, operation, par);
        }
        return makeError<PhysicalAddress>(PageError::TranslationError);
    }
    return makeSuccess(physAddrFromPar(par, va));
}

VoidResult Mmu::installTranslationTable(const TranslationTable& table) {
    VoidResult result = table.setAsTtbr0(processor);
    if (result.isError()) {
        return result;
    }
    installed.reset(new TranslationTable(table));
    return makeVoidSuccess();
}

const TranslationTable* Mmu::installedTable() const {
    return installed.get();
}

PhysicalAddress Mmu::installedTableAddress() const {
    return TranslationTable::currentTtbr0Address(processor);
}

void Mmu::enable() {
    processor.dsb();
    processor.writeSctlr(processor.readSctlr() | SCTLR_MMU);
    processor.isb();
}

void Mmu::disable() {
    processor.writeSctlr(processor.readSctlr() & ~SCTLR_MMU);
    processor.isb();
}

bool Mmu::isEnabled() const {
    return processor.isMmuEnabled();
}

Result<PageTable> Mmu::createPageTable(PageTableMemory& memory, VirtualAddress va,
                                       const MemoryAttributes& memoryAttributes, size_t index,
                                       const TableMutationGrant& grant) {
    if (!installed) {
        return makeError<PageTable>(PageError::InvalidMemory);
    }
    return PageTable::create(processor, memory, va, memoryAttributes, *installed, index, grant);
}

Result<DeviceVmemMapper> Mmu::createDeviceMapper(VirtualAddress base, const std::vector<uint8_t>& frames) const {
    return DeviceVmemMapper::create(base, frames, configuration.getDeviceMappingConfiguration().sectionsPerSlot);
}

VoidResult Mmu::mapDevices(const DeviceVmemMapper& mapper, const TableMutationGrant& grant) {
    if (!installed) {
        return makeVoidError(PageError::InvalidMemory);
    }

    VoidResult result = mapper.doMapping(*installed, grant);
    if (result.isError()) {
        return result;
    }

    processor.dsb();
    processor.isb();
    return makeVoidSuccess();
}

FaultHandler& Mmu::getFaultHandler() {
    return *faultHandler;
}

const FaultHandler& Mmu::getFaultHandler() const {
    return *faultHandler;
}

const MmuConfiguration& Mmu::getConfiguration() const {
    return configuration;
}

VoidResult Mmu::updateConfiguration(const MmuConfiguration& config) {
    if (!config.isValid()) {
        return makeVoidError(PageError::InvalidConfiguration);
    }
    configuration = config;
    faultHandler->setMaxQueueSize(configuration.getFaultConfiguration().maxFaultRecords);
    return makeVoidSuccess();
}

uint64_t Mmu::getTranslationCount() const {
    return translationCount.load();
}

uint64_t Mmu::getTotalFaults() const {
    return faultHandler->getTotalFaultCount();
}

void Mmu::resetStatistics() {
    translationCount.store(0);
    faultHandler->resetStatistics();
}

void Mmu::reset() {
    installed.reset();
    faultHandler->reset();
    translationCount.store(0);
}

} // namespace armv7
