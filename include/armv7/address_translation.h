// ARMv7-A Hardware-Assisted Address Translation
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_ADDRESS_TRANSLATION_H
#define ARMV7_ADDRESS_TRANSLATION_H

#include "armv7/types.h"
#include "armv7/address.h"
#include "armv7/processor.h"
#include <cstdint>

namespace armv7 {

/// @brief Operation selected by the privilege level and access kind
AddressTranslationOperation translationOperation(bool privileged, bool writable);

/**
 * @brief Run one stage-1 address translation and return the raw PAR
 * @details Selects ATS1CPR, ATS1CPW, ATS1CUR or ATS1CUW from @p privileged and
 *          @p writable. Bit 0 of the result is set if the translation faulted.
 */
uint32_t getPhysFrame(Processor& processor, VirtualAddress va, bool privileged, bool writable);

/// @brief Run the translation for @p operation and return the raw PAR
uint32_t getPhysFrame(Processor& processor, VirtualAddress va, AddressTranslationOperation operation);

/**
 * @brief Resolve @p va to a physical address with a privileged read lookup
 * @return The frame from PAR combined with the page offset of @p va, or
 *         TranslationError if the lookup faulted
 */
Result<PhysicalAddress> getPhysAddr(Processor& processor, VirtualAddress va);

/// @brief As getPhysAddr(), for an explicit translation operation
Result<PhysicalAddress> getPhysAddr(Processor& processor, VirtualAddress va,
                                    AddressTranslationOperation operation);

/// @brief Combine a successful PAR value with the page offset of @p va
inline PhysicalAddress physAddrFromPar(uint32_t par, VirtualAddress va) {
    return PhysicalAddress((par & ~SMALL_PAGE_MASK) | pageOffset(va));
}

inline bool isParFault(uint32_t par) {
    return (par & PAR_FAULT) != 0;
}

} // namespace armv7

#endif // ARMV7_ADDRESS_TRANSLATION_H
