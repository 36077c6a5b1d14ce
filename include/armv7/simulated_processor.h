// ARMv7-A Simulated Processor
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_SIMULATED_PROCESSOR_H
#define ARMV7_SIMULATED_PROCESSOR_H

#include "armv7/processor.h"
#include "armv7/types.h"
#include "armv7/address.h"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace armv7 {

/**
 * @enum ProcessorEvent
 * @brief Instructions recorded by SimulatedProcessor, in program order
 */
enum class ProcessorEvent {
    WriteTtbr0,
    WriteSctlr,
    AddressTranslation,
    Nop,
    Dsb,
    Isb,
    DisableInterrupts,
    EnableInterrupts,
    WriteTtbr1,
    DataAbort
};

/**
 * @class SimulatedProcessor
 * @brief Host model of the registers and the stage-1 table walk
 * @details Physical memory is a set of host buffers attached at physical
 *          addresses. With SCTLR.M clear an address translation is flat,
 *          otherwise it walks the short-descriptor tables found through
 *          TTBR0 in attached memory and checks AP/AP2 for the requested
 *          operation. Domains are treated as Client; access flags and TEX
 *          remap are not modelled.
 *
 *          The result follows the PAR format: PA[31:12] and NS on success,
 *          bit 0 and FS in bits [6:1] on a fault. dataAccess() runs the same
 *          walk for a load or store and latches DFSR/DFAR when it aborts.
 */
class SimulatedProcessor : public Processor {
public:
    SimulatedProcessor();
    ~SimulatedProcessor() override;

    uint32_t readTtbr0() const override;
    void writeTtbr0(uint32_t value) override;
    uint32_t readTtbr1() const override;
    void writeTtbr1(uint32_t value) override;
    uint32_t readSctlr() const override;
    void writeSctlr(uint32_t value) override;
    uint32_t readVbar() const override;
    uint32_t readIsr() const override;
    uint32_t readDfsr() const override;
    uint32_t readDfar() const override;
    uint32_t readIfsr() const override;
    uint32_t readIfar() const override;
    void requestAddressTranslation(AddressTranslationOperation operation, uint32_t va) override;
    uint32_t readPar() const override;
    void nop() override;
    void dsb() override;
    void isb() override;
    uint32_t disableInterrupts() override;
    void restoreInterrupts(uint32_t previousCpsr) override;

    void writeVbar(uint32_t value);
    uint32_t readCpsr() const;
    void writeCpsr(uint32_t value);
    bool interruptsEnabled() const;

    void setInterruptStatus(uint32_t value);
    void setDataFault(uint32_t status, uint32_t address);
    void setInstructionFault(uint32_t status, uint32_t address);

    /**
     * @brief Perform a load or store at @p va
     * @return false on a data abort, with DFSR holding the fault status and
     *         WnR and DFAR holding @p va; PAR is left untouched
     */
    bool dataAccess(AddressTranslationOperation operation, uint32_t va);

    /**
     * @brief Back the physical range [base, base + size) with host memory
     * @return AlignError unless base and size are word aligned, NotInRange if
     *         the range wraps, InvalidMemory if it overlaps another region
     */
    VoidResult attachMemory(PhysicalAddress base, void* hostMemory, uint32_t size);
    void detachAllMemory();

    // Word access to attached physical memory, InvalidMemory if unbacked
    Result<uint32_t> readWord(PhysicalAddress address) const;
    VoidResult writeWord(PhysicalAddress address, uint32_t value);

    // Instruction trace
    const std::vector<ProcessorEvent>& getTrace() const;
    void clearTrace();
    size_t countEvents(ProcessorEvent event) const;

    void reset();

private:
    struct MemoryRegion {
        uint32_t base;
        uint32_t size;
        uint8_t* host;

        MemoryRegion(uint32_t regionBase, uint32_t regionSize, uint8_t* hostMemory)
            : base(regionBase), size(regionSize), host(hostMemory) {
        }

        bool contains(uint32_t address, uint32_t length) const {
            return address >= base && static_cast<uint64_t>(address) + length <=
                                          static_cast<uint64_t>(base) + size;
        }
    };

    uint32_t ttbr0;
    uint32_t ttbr1;
    uint32_t sctlr;
    uint32_t vbar;
    uint32_t par;
    uint32_t cpsr;
    uint32_t isr;
    uint32_t dfsr;
    uint32_t dfar;
    uint32_t ifsr;
    uint32_t ifar;

    std::vector<MemoryRegion> regions;
    std::vector<ProcessorEvent> trace;

    const MemoryRegion* findRegion(uint32_t address, uint32_t length) const;
    uint32_t translateAddress(AddressTranslationOperation operation, uint32_t va) const;
    uint32_t walk(AddressTranslationOperation operation, uint32_t va) const;
    bool accessPermitted(AddressTranslationOperation operation, uint32_t ap, bool readOnly) const;
    static uint32_t faultPar(uint32_t faultStatus);
};

} // namespace armv7

#endif // ARMV7_SIMULATED_PROCESSOR_H
