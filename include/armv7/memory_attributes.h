// ARMv7-A Memory Attributes
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_MEMORY_ATTRIBUTES_H
#define ARMV7_MEMORY_ATTRIBUTES_H

#include "armv7/types.h"
#include <cstdint>
#include <ostream>

namespace armv7 {

class TranslationTableDescriptor;
class PageTableDescriptor;
enum class TranslationTableType;
enum class PageTableType;

/**
 * @struct AttributeField
 * @brief A named assignment to one or more attribute fields
 * @details Fields combine with operator+; a later assignment to the same
 *          field replaces the earlier one.
 */
struct AttributeField {
    uint32_t mask;
    uint32_t value;

    constexpr AttributeField(uint32_t fieldMask, uint32_t fieldValue)
        : mask(fieldMask), value(fieldValue & fieldMask) {
    }
};

constexpr AttributeField operator+(AttributeField lhs, AttributeField rhs) {
    return AttributeField(lhs.mask | rhs.mask, (lhs.value & ~rhs.mask) | rhs.value);
}

/**
 * Canonical attribute layout. It matches the section descriptor, with
 * bits 1, 9 and 18 and everything above 19 reserved as zero.
 *
 *  0    PXN          10-11 AP[1:0]
 *  2    B            12-14 TEX[2:0]
 *  3    C            15    AP[2]
 *  4    XN           16    S
 *  5-8  DOMAIN       17    nG
 *                    19    NS
 */
namespace attributes {

constexpr uint32_t PXN_SHIFT = 0;
constexpr uint32_t B_SHIFT = 2;
constexpr uint32_t C_SHIFT = 3;
constexpr uint32_t XN_SHIFT = 4;
constexpr uint32_t DOMAIN_SHIFT = 5;
constexpr uint32_t AP_SHIFT = 10;
constexpr uint32_t TEX_SHIFT = 12;
constexpr uint32_t AP2_SHIFT = 15;
constexpr uint32_t S_SHIFT = 16;
constexpr uint32_t NG_SHIFT = 17;
constexpr uint32_t NS_SHIFT = 19;

constexpr uint32_t PXN_MASK = 0x1u << PXN_SHIFT;
constexpr uint32_t B_MASK = 0x1u << B_SHIFT;
constexpr uint32_t C_MASK = 0x1u << C_SHIFT;
constexpr uint32_t XN_MASK = 0x1u << XN_SHIFT;
constexpr uint32_t DOMAIN_MASK = 0xFu << DOMAIN_SHIFT;
constexpr uint32_t AP_MASK = 0x3u << AP_SHIFT;
constexpr uint32_t TEX_MASK = 0x7u << TEX_SHIFT;
constexpr uint32_t AP2_MASK = 0x1u << AP2_SHIFT;
constexpr uint32_t S_MASK = 0x1u << S_SHIFT;
constexpr uint32_t NG_MASK = 0x1u << NG_SHIFT;
constexpr uint32_t NS_MASK = 0x1u << NS_SHIFT;

/// @brief Every bit with a defined meaning
constexpr uint32_t DEFINED_MASK = PXN_MASK | B_MASK | C_MASK | XN_MASK | DOMAIN_MASK |
                                  AP_MASK | TEX_MASK | AP2_MASK | S_MASK | NG_MASK | NS_MASK;

namespace PXN {
constexpr AttributeField Enable(PXN_MASK, 1u << PXN_SHIFT);
}
namespace B {
constexpr AttributeField Enable(B_MASK, 1u << B_SHIFT);
}
namespace C {
constexpr AttributeField Enable(C_MASK, 1u << C_SHIFT);
}
namespace XN {
constexpr AttributeField Enable(XN_MASK, 1u << XN_SHIFT);
}
namespace AP {
constexpr AttributeField NoAccess(AP_MASK, 0x0u << AP_SHIFT);
constexpr AttributeField PrivAccess(AP_MASK, 0x1u << AP_SHIFT);
constexpr AttributeField UnprivReadOnly(AP_MASK, 0x2u << AP_SHIFT);
constexpr AttributeField FullAccess(AP_MASK, 0x3u << AP_SHIFT);
}
namespace AP2 {
constexpr AttributeField ReadOnly(AP2_MASK, 1u << AP2_SHIFT);
}
namespace S {
constexpr AttributeField Enable(S_MASK, 1u << S_SHIFT);
}
namespace NG {
constexpr AttributeField Enable(NG_MASK, 1u << NG_SHIFT);
}
namespace NS {
constexpr AttributeField Enable(NS_MASK, 1u << NS_SHIFT);
}

/// @brief Domain number, only the low four bits are used
constexpr AttributeField DOMAIN(uint32_t domain) {
    return AttributeField(DOMAIN_MASK, domain << DOMAIN_SHIFT);
}

/// @brief TEX[2:0] memory type extension, only the low three bits are used
constexpr AttributeField TEX(uint32_t tex) {
    return AttributeField(TEX_MASK, tex << TEX_SHIFT);
}

} // namespace attributes

/**
 * @class MemoryAttributes
 * @brief Descriptor-independent memory attributes
 * @details Holds the attribute bits in the canonical layout above. The
 *          descriptor constructors encode it into the layout of the
 *          requested descriptor type; the decode functions extract it back.
 *          Each descriptor type can only represent a subset of the fields:
 *
 *          - Page (second-level pointer): PXN, DOMAIN, NS
 *          - Section: all fields
 *          - Supersection: all fields except DOMAIN (decodes as 0)
 *          - Large/Small page: B, C, XN, AP, TEX, AP2, S, nG
 */
class MemoryAttributes {
public:
    MemoryAttributes() : bitset(0) {
    }

    static MemoryAttributes from(AttributeField field) {
        return MemoryAttributes(field.value & attributes::DEFINED_MASK);
    }

    /**
     * @brief Extract the attributes of a first-level descriptor
     * @return InvalidMemory for an Invalid descriptor
     */
    static Result<MemoryAttributes> fromTableDescriptor(const TranslationTableDescriptor& descriptor);

    /**
     * @brief Extract the attributes of a second-level descriptor
     * @return InvalidMemory for an Invalid descriptor
     */
    static Result<MemoryAttributes> fromPageDescriptor(const PageTableDescriptor& descriptor);

    /// @brief Encoded attribute and tag bits of a first-level descriptor, without address
    uint32_t toTableDescriptorBits(TranslationTableType type) const;

    /// @brief Encoded attribute and tag bits of a second-level descriptor, without address
    uint32_t toPageDescriptorBits(PageTableType type) const;

    /// @brief Replace the fields named by @p field
    MemoryAttributes with(AttributeField field) const {
        return MemoryAttributes(((bitset & ~field.mask) | field.value) & attributes::DEFINED_MASK);
    }

    uint32_t bits() const { return bitset; }

    bool isPrivilegedExecuteNever() const { return (bitset & attributes::PXN_MASK) != 0; }
    bool isBufferable() const { return (bitset & attributes::B_MASK) != 0; }
    bool isCacheable() const { return (bitset & attributes::C_MASK) != 0; }
    bool isExecuteNever() const { return (bitset & attributes::XN_MASK) != 0; }
    uint32_t getDomain() const { return (bitset & attributes::DOMAIN_MASK) >> attributes::DOMAIN_SHIFT; }
    uint32_t getAccessPermission() const { return (bitset & attributes::AP_MASK) >> attributes::AP_SHIFT; }
    uint32_t getTex() const { return (bitset & attributes::TEX_MASK) >> attributes::TEX_SHIFT; }
    bool isReadOnly() const { return (bitset & attributes::AP2_MASK) != 0; }
    bool isShareable() const { return (bitset & attributes::S_MASK) != 0; }
    bool isNotGlobal() const { return (bitset & attributes::NG_MASK) != 0; }
    bool isNonSecure() const { return (bitset & attributes::NS_MASK) != 0; }

    bool operator==(const MemoryAttributes& other) const { return bitset == other.bitset; }
    bool operator!=(const MemoryAttributes& other) const { return bitset != other.bitset; }

private:
    explicit MemoryAttributes(uint32_t value) : bitset(value) {
    }

    uint32_t bitset;
};

std::ostream& operator<<(std::ostream& os, const MemoryAttributes& memoryAttributes);

} // namespace armv7

#endif // ARMV7_MEMORY_ATTRIBUTES_H
