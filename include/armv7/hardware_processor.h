// ARMv7-A Hardware Processor
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_HARDWARE_PROCESSOR_H
#define ARMV7_HARDWARE_PROCESSOR_H

#include "armv7/processor.h"

namespace armv7 {

/**
 * @class HardwareProcessor
 * @brief Processor backed by the real CP15 and core register instructions
 * @details Only built for 32-bit ARM targets running at PL1.
 */
class HardwareProcessor : public Processor {
public:
    HardwareProcessor() {}
    ~HardwareProcessor() override {}

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
};

} // namespace armv7

#endif // ARMV7_HARDWARE_PROCESSOR_H
