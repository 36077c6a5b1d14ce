// ARMv7-A Linear Offset Mapping
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_OFFSET_MAPPING_H
#define ARMV7_OFFSET_MAPPING_H

#include "armv7/types.h"
#include "armv7/address.h"
#include <cstdint>

namespace armv7 {

/**
 * @class OffsetMapping
 * @brief Constant-offset translation between a virtual and a physical window
 * @details Both windows are half-open: [start, start + size).
 */
class OffsetMapping {
public:
    OffsetMapping() : virtStart(), physStart(), windowSize(0) {}

    /**
     * @brief Create a mapping of @p size bytes
     * @return NotInRange if @p size is zero or either window wraps past 4GB
     */
    static Result<OffsetMapping> create(VirtualAddress virtStart, PhysicalAddress physStart, uint32_t size);

    bool virtAddrInRange(VirtualAddress va) const;
    bool physAddrInRange(PhysicalAddress pa) const;

    /// @brief NotInRange outside the virtual window
    Result<PhysicalAddress> convertVirtAddr(VirtualAddress va) const;

    /// @brief NotInRange outside the physical window
    Result<VirtualAddress> convertPhysAddr(PhysicalAddress pa) const;

    VirtualAddress getVirtualStart() const { return virtStart; }
    PhysicalAddress getPhysicalStart() const { return physStart; }
    uint32_t getSize() const { return windowSize; }

private:
    OffsetMapping(VirtualAddress virtualBase, PhysicalAddress physicalBase, uint32_t size)
        : virtStart(virtualBase), physStart(physicalBase), windowSize(size) {}

    VirtualAddress virtStart;
    PhysicalAddress physStart;
    uint32_t windowSize;
};

} // namespace armv7

#endif // ARMV7_OFFSET_MAPPING_H
