// ARMv7-A Linear Offset Mapping Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/offset_mapping.h"

namespace armv7 {

Result<OffsetMapping> OffsetMapping::create(VirtualAddress virtStart, PhysicalAddress physStart, uint32_t size) {
    if (size == 0) {
        return makeError<OffsetMapping>(PageError::NotInRange);
    }
    // The last byte of each window must be addressable
    if (virtStart.checkedAdd(size - 1).isError() || physStart.checkedAdd(size - 1).isError()) {
        return makeError<OffsetMapping>(PageError::NotInRange);
    }
    return makeSuccess(OffsetMapping(virtStart, physStart, size));
}

bool OffsetMapping::virtAddrInRange(VirtualAddress va) const {
    return va >= virtStart && (va - virtStart) < windowSize;
}

bool OffsetMapping::physAddrInRange(PhysicalAddress pa) const {
    return pa >= physStart && (pa - physStart) < windowSize;
}

Result<PhysicalAddress> OffsetMapping::convertVirtAddr(VirtualAddress va) const {
    if (!virtAddrInRange(va)) {
        return makeError<PhysicalAddress>(PageError::NotInRange);
    }
    return makeSuccess(physStart + (va - virtStart));
}

Result<VirtualAddress> OffsetMapping::convertPhysAddr(PhysicalAddress pa) const {
    if (!physAddrInRange(pa)) {
        return makeError<VirtualAddress>(PageError::NotInRange);
    }
    return makeSuccess(virtStart + (pa - physStart));
}

} // namespace armv7
