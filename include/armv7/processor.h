// ARMv7-A Processor Register Interface
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_PROCESSOR_H
#define ARMV7_PROCESSOR_H

#include "armv7/types.h"
#include "armv7/address.h"
#include <cstdint>

namespace armv7 {

/**
 * @class Processor
 * @brief CP15 and core register access consumed by the paging code
 * @details Each method corresponds to one fixed instruction (MRC/MCR on a
 *          CP15 register, MRS/CPS on the CPSR, NOP, DSB, ISB). The paging
 *          code never issues instructions itself, so it runs unchanged on the
 *          target (HardwareProcessor) and on the host (SimulatedProcessor).
 */
class Processor {
public:
    virtual ~Processor() {}

    // Translation table base register 0 (CP15 c2, c0, 0)
    virtual uint32_t readTtbr0() const = 0;
    virtual void writeTtbr0(uint32_t value) = 0;

    // Translation table base register 1 (CP15 c2, c0, 1)
    virtual uint32_t readTtbr1() const = 0;
    virtual void writeTtbr1(uint32_t value) = 0;

    // System control register (CP15 c1, c0, 0)
    virtual uint32_t readSctlr() const = 0;
    virtual void writeSctlr(uint32_t value) = 0;

    // Vector base address register (CP15 c12, c0, 0)
    virtual uint32_t readVbar() const = 0;

    // Interrupt status register (CP15 c12, c1, 0), pending A/I/F bits
    virtual uint32_t readIsr() const = 0;

    // Data fault status and address (CP15 c5, c0, 0 and c6, c0, 0)
    virtual uint32_t readDfsr() const = 0;
    virtual uint32_t readDfar() const = 0;

    // Instruction fault status and address (CP15 c5, c0, 1 and c6, c0, 2)
    virtual uint32_t readIfsr() const = 0;
    virtual uint32_t readIfar() const = 0;

    /**
     * @brief Write @p va to the ATS1Cxx register selected by @p operation
     * @details The result becomes visible in PAR.
     */
    virtual void requestAddressTranslation(AddressTranslationOperation operation, uint32_t va) = 0;

    // Physical address register (CP15 c7, c4, 0)
    virtual uint32_t readPar() const = 0;

    virtual void nop() = 0;
    virtual void dsb() = 0;
    virtual void isb() = 0;

    /**
     * @brief Mask IRQs
     * @return The CPSR value before masking, to be passed to restoreInterrupts()
     */
    virtual uint32_t disableInterrupts() = 0;

    /// @brief Unmask IRQs if they were unmasked in @p previousCpsr
    virtual void restoreInterrupts(uint32_t previousCpsr) = 0;

    void setTtbr0(PhysicalAddress base) {
        writeTtbr0(base.asU32());
    }

    bool isSctlrVectorHigh() const {
        return (readSctlr() & SCTLR_VECTOR) != 0;
    }

    /// @brief Fault type of the last data abort
    FaultType lastDataFault() const {
        return faultTypeFromFsr(readDfsr());
    }

    bool isMmuEnabled() const {
        return (readSctlr() & SCTLR_MMU) != 0;
    }

    /// @brief Base of the exception vectors, 0xffff0000 or VBAR
    VirtualAddress vectorTableAddress() const {
        if (isSctlrVectorHigh()) {
            return VirtualAddress(HIGH_VECTOR_BASE);
        }
        return VirtualAddress(readVbar());
    }
};

/**
 * @class CriticalSection
 * @brief Masks IRQs for the lifetime of the object
 * @details Single-core only and not reentrant: it saves and restores one
 *          flag. Nested sections restore correctly because the inner one
 *          sees IRQs already masked.
 */
class CriticalSection {
public:
    explicit CriticalSection(Processor& cpu)
        : processor(cpu), savedCpsr(cpu.disableInterrupts()) {
    }

    ~CriticalSection() {
        processor.restoreInterrupts(savedCpsr);
    }

    CriticalSection(const CriticalSection&) = delete;
    CriticalSection& operator=(const CriticalSection&) = delete;

private:
    Processor& processor;
    uint32_t savedCpsr;
};

} // namespace armv7

#endif // ARMV7_PROCESSOR_H
