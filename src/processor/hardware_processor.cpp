// ARMv7-A Hardware Processor Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/hardware_processor.h"

namespace armv7 {

uint32_t HardwareProcessor::readTtbr0() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c2, c0, 0" : "=r"(value));
    return value;
}

void HardwareProcessor::writeTtbr0(uint32_t value) {
    __asm__ volatile("mcr p15, 0, %0, c2, c0, 0" : : "r"(value) : "memory");
}

uint32_t HardwareProcessor::readTtbr1() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c2, c0, 1" : "=r"(value));
    return value;
}

void HardwareProcessor::writeTtbr1(uint32_t value) {
    __asm__ volatile("mcr p15, 0, %0, c2, c0, 1" : : "r"(value) : "memory");
}

uint32_t HardwareProcessor::readSctlr() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c1, c0, 0" : "=r"(value));
    return value;
}

void HardwareProcessor::writeSctlr(uint32_t value) {
    __asm__ volatile("mcr p15, 0, %0, c1, c0, 0" : : "r"(value) : "memory");
}

uint32_t HardwareProcessor::readVbar() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c12, c0, 0" : "=r"(value));
    return value;
}

uint32_t HardwareProcessor::readIsr() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c12, c1, 0" : "=r"(value));
    return value;
}

uint32_t HardwareProcessor::readDfsr() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c5, c0, 0" : "=r"(value));
    return value;
}

uint32_t HardwareProcessor::readDfar() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c6, c0, 0" : "=r"(value));
    return value;
}

uint32_t HardwareProcessor::readIfsr() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c5, c0, 1" : "=r"(value));
    return value;
}

uint32_t HardwareProcessor::readIfar() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c6, c0, 2" : "=r"(value));
    return value;
}

void HardwareProcessor::requestAddressTranslation(AddressTranslationOperation operation, uint32_t va) {
    switch (operation) {
        case AddressTranslationOperation::PrivilegedRead:
            __asm__ volatile("mcr p15, 0, %0, c7, c8, 0" : : "r"(va) : "memory");
            break;
        case AddressTranslationOperation::PrivilegedWrite:
            __asm__ volatile("mcr p15, 0, %0, c7, c8, 1" : : "r"(va) : "memory");
            break;
        case AddressTranslationOperation::UnprivilegedRead:
            __asm__ volatile("mcr p15, 0, %0, c7, c8, 2" : : "r"(va) : "memory");
            break;
        case AddressTranslationOperation::UnprivilegedWrite:
            __asm__ volatile("mcr p15, 0, %0, c7, c8, 3" : : "r"(va) : "memory");
            break;
    }
    // PAR is only valid after the translation completes
    isb();
}

uint32_t HardwareProcessor::readPar() const {
    uint32_t value;
    __asm__ volatile("mrc p15, 0, %0, c7, c4, 0" : "=r"(value));
    return value;
}

void HardwareProcessor::nop() {
    __asm__ volatile("nop");
}

void HardwareProcessor::dsb() {
    __asm__ volatile("dsb" : : : "memory");
}

void HardwareProcessor::isb() {
    __asm__ volatile("isb" : : : "memory");
}

uint32_t HardwareProcessor::disableInterrupts() {
    uint32_t cpsr;
    __asm__ volatile("mrs %0, cpsr\n\t"
                     "cpsid i"
                     : "=r"(cpsr)
                     :
                     : "memory");
    return cpsr;
}

void HardwareProcessor::restoreInterrupts(uint32_t previousCpsr) {
    if ((previousCpsr & CPSR_IRQ_MASK) == 0) {
        __asm__ volatile("cpsie i" : : : "memory");
    }
}

} // namespace armv7
