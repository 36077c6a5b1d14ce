// ARMv7-A Typed Addresses
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_ADDRESS_H
#define ARMV7_ADDRESS_H

#include "armv7/types.h"
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <stdexcept>

namespace armv7 {

/// @brief Tag for virtual addresses
struct VirtualTag {};
/// @brief Tag for physical addresses
struct PhysicalTag {};

/**
 * @class Address
 * @brief Opaque, strongly-typed 32-bit address
 * @tparam Tag Empty tag type distinguishing the address space
 * @details Layout is identical to uint32_t. Mixing virtual and physical
 *          addresses is a compile-time error. Arithmetic is checked: the
 *          operators throw on 32-bit wraparound because a wrapping address
 *          is a programming error, while checkedAdd() reports NotInRange
 *          for callers that expect to approach the 4GB boundary.
 */
template<typename Tag>
class Address {
public:
    Address() : addr(0) {
    }

    explicit Address(uint32_t value) : addr(value) {
    }

    /**
     * @brief Create an address from a pointer
     * @details Only meaningful on a 32-bit target, the value is truncated
     *          to 32 bits on wider hosts.
     */
    template<typename U>
    static Address fromPointer(const U* pointer) {
        return Address(static_cast<uint32_t>(reinterpret_cast<uintptr_t>(pointer)));
    }

    /**
     * @brief View the address as a pointer to U
     * @warning This does not validate mapping or alignment.
     */
    template<typename U>
    U* asPointer() const {
        return reinterpret_cast<U*>(static_cast<uintptr_t>(addr));
    }

    uint32_t asU32() const {
        return addr;
    }

    bool isAligned(uint32_t mask) const {
        return (addr & mask) == 0;
    }

    /// @brief AlignError unless every bit of @p mask is clear in the address
    VoidResult checkAlign(uint32_t mask) const {
        if (!isAligned(mask)) {
            return makeVoidError(PageError::AlignError);
        }
        return makeVoidSuccess();
    }

    Address alignDown(uint32_t mask) const {
        return Address(addr & ~mask);
    }

    /// @brief Round up to the next boundary, NotInRange if that wraps
    Result<Address> alignUp(uint32_t mask) const {
        uint64_t rounded = (static_cast<uint64_t>(addr) + mask) & ~static_cast<uint64_t>(mask);
        if (rounded > UINT32_MAX) {
            return makeError<Address>(PageError::NotInRange);
        }
        return makeSuccess(Address(static_cast<uint32_t>(rounded)));
    }

    Result<Address> checkedAdd(uint32_t offset) const {
        if (offset > UINT32_MAX - addr) {
            return makeError<Address>(PageError::NotInRange);
        }
        return makeSuccess(Address(addr + offset));
    }

    Result<Address> checkedSub(uint32_t offset) const {
        if (offset > addr) {
            return makeError<Address>(PageError::NotInRange);
        }
        return makeSuccess(Address(addr - offset));
    }

    Address& operator+=(uint32_t offset) {
        if (offset > UINT32_MAX - addr) {
            throw std::overflow_error("address addition wraps past 4GB");
        }
        addr += offset;
        return *this;
    }

    Address& operator-=(uint32_t offset) {
        if (offset > addr) {
            throw std::underflow_error("address subtraction below zero");
        }
        addr -= offset;
        return *this;
    }

    friend Address operator+(Address a, uint32_t offset) {
        a += offset;
        return a;
    }

    friend Address operator-(Address a, uint32_t offset) {
        a -= offset;
        return a;
    }

    /// @brief Distance in bytes, throws if @p rhs lies above @p lhs
    friend uint32_t operator-(Address lhs, Address rhs) {
        if (rhs.addr > lhs.addr) {
            throw std::underflow_error("address distance is negative");
        }
        return lhs.addr - rhs.addr;
    }

    friend Address operator|(Address a, uint32_t bits) {
        return Address(a.addr | bits);
    }

    Address& operator|=(uint32_t bits) {
        addr |= bits;
        return *this;
    }

    friend bool operator==(Address lhs, Address rhs) { return lhs.addr == rhs.addr; }
    friend bool operator!=(Address lhs, Address rhs) { return lhs.addr != rhs.addr; }
    friend bool operator<(Address lhs, Address rhs) { return lhs.addr < rhs.addr; }
    friend bool operator<=(Address lhs, Address rhs) { return lhs.addr <= rhs.addr; }
    friend bool operator>(Address lhs, Address rhs) { return lhs.addr > rhs.addr; }
    friend bool operator>=(Address lhs, Address rhs) { return lhs.addr >= rhs.addr; }

private:
    uint32_t addr;
};

using VirtualAddress = Address<VirtualTag>;
using PhysicalAddress = Address<PhysicalTag>;

static_assert(sizeof(VirtualAddress) == sizeof(uint32_t), "VirtualAddress must be 32 bits");
static_assert(sizeof(PhysicalAddress) == sizeof(uint32_t), "PhysicalAddress must be 32 bits");

/// @brief Writes the address as 0x%08x
std::ostream& operator<<(std::ostream& os, VirtualAddress address);
std::ostream& operator<<(std::ostream& os, PhysicalAddress address);

// Virtual address decomposition: 0xXXXY_YZZZ with X the first-level index,
// Y the second-level index and Z the page offset.

/// @brief Index into the first-level translation table (1MB granule)
inline size_t translationTableIndex(VirtualAddress va) {
    return static_cast<size_t>(va.asU32() >> 20);
}

/// @brief Index into a second-level page table (4KB granule)
inline size_t pageTableIndex(VirtualAddress va) {
    return static_cast<size_t>((va.asU32() >> 12) & 0xFF);
}

/// @brief Offset within a small page
inline uint32_t pageOffset(VirtualAddress va) {
    return va.asU32() & SMALL_PAGE_MASK;
}

/**
 * @brief Build a virtual address from its table indices and page offset
 * @return IndexError if any component does not fit its field
 */
Result<VirtualAddress> virtualAddressFromIndices(size_t tableIndex, size_t pageIndex, uint32_t offset);

} // namespace armv7

#endif // ARMV7_ADDRESS_H
