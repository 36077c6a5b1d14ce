// ARMv7-A MMU Controller
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_MMU_H
#define ARMV7_MMU_H

#include "armv7/types.h"
#include "armv7/address.h"
#include "armv7/processor.h"
#include "armv7/translation_table.h"
#include "armv7/device_mapper.h"
#include "armv7/fault_handler.h"
#include "armv7/configuration.h"
#include <atomic>
#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace armv7 {

/**
 * @class Mmu
 * @brief Stage-1 MMU of one core
 * @details Tracks the translation table installed in TTBR0, resolves
 *          addresses through the processor and records failed lookups.
 *          The processor must outlive the Mmu.
 */
class Mmu {
public:
    explicit Mmu(Processor& processor);

    // An invalid configuration is replaced by the default one
    Mmu(Processor& processor, const MmuConfiguration& config);

    ~Mmu();

    Mmu(const Mmu&) = delete;
    Mmu& operator=(const Mmu&) = delete;

    // Translation with the configured default operation
    Result<PhysicalAddress> translate(VirtualAddress va);
    Result<PhysicalAddress> translate(VirtualAddress va, AddressTranslationOperation operation);

    // Translation table management
    VoidResult installTranslationTable(const TranslationTable& table);
    const TranslationTable* installedTable() const;
    PhysicalAddress installedTableAddress() const;

    // SCTLR.M
    void enable();
    void disable();
    bool isEnabled() const;

    /**
     * @brief Create a page table hooked into the installed table
     * @return InvalidMemory if no table is installed, otherwise as
     *         PageTable::create()
     */
    Result<PageTable> createPageTable(PageTableMemory& memory, VirtualAddress va,
                                      const MemoryAttributes& memoryAttributes, size_t index,
                                      const TableMutationGrant& grant);

    // Device mapper using the configured sections per slot
    Result<DeviceVmemMapper> createDeviceMapper(VirtualAddress base, const std::vector<uint8_t>& frames) const;

    /// @brief Write @p mapper into the installed table followed by DSB and ISB
    VoidResult mapDevices(const DeviceVmemMapper& mapper, const TableMutationGrant& grant);

    FaultHandler& getFaultHandler();
    const FaultHandler& getFaultHandler() const;

    const MmuConfiguration& getConfiguration() const;
    VoidResult updateConfiguration(const MmuConfiguration& config);

    // Statistics
    uint64_t getTranslationCount() const;
    uint64_t getTotalFaults() const;
    void resetStatistics();

    // Forget the installed table and clear faults and statistics
    void reset();

private:
    Processor& processor;
    MmuConfiguration configuration;
    std::shared_ptr<FaultHandler> faultHandler;
    std::unique_ptr<TranslationTable> installed;

    std::atomic<uint64_t> translationCount;
};

} // namespace armv7

#endif // ARMV7_MMU_H
