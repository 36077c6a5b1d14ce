// ARMv7-A Typed Addresses Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/address.h"
#include <iomanip>

namespace armv7 {

namespace {

std::ostream& writeHex(std::ostream& os, uint32_t value) {
    std::ios_base::fmtflags flags = os.flags();
    char fill = os.fill();
    os << "0x" << std::hex << std::setw(8) << std::setfill('0') << value;
    os.flags(flags);
    os.fill(fill);
    return os;
}

} // namespace

std::ostream& operator<<(std::ostream& os, VirtualAddress address) {
    return writeHex(os, address.asU32());
}

std::ostream& operator<<(std::ostream& os, PhysicalAddress address) {
    return writeHex(os, address.asU32());
}

Result<VirtualAddress> virtualAddressFromIndices(size_t tableIndex, size_t pageIndex, uint32_t offset) {
    if (tableIndex >= TRANSLATION_TABLE_SIZE || pageIndex >= PAGE_TABLE_SIZE || offset > SMALL_PAGE_MASK) {
        return makeError<VirtualAddress>(PageError::IndexError);
    }

    uint32_t address = static_cast<uint32_t>(tableIndex) << 20;
    address |= static_cast<uint32_t>(pageIndex) << 12;
    address |= offset;
    return makeSuccess(VirtualAddress(address));
}

} // namespace armv7
