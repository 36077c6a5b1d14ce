// ARMv7-A Short-Descriptor Translation Table Entries
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_DESCRIPTORS_H
#define ARMV7_DESCRIPTORS_H

#include "armv7/types.h"
#include "armv7/address.h"
#include "armv7/memory_attributes.h"
#include <cstdint>
#include <ostream>

namespace armv7 {

/**
 * @enum TranslationTableType
 * @brief First-level descriptor type
 * @details Encoded in bits [1:0] and bit 18:
 *          0b00 Invalid, 0b01 Page, 0b1x Section (bit 18 clear) or
 *          Supersection (bit 18 set).
 */
enum class TranslationTableType {
    Invalid,
    Page,
    Section,
    Supersection
};

/**
 * @enum PageTableType
 * @brief Second-level descriptor type
 * @details Encoded in bits [1:0]: 0b00 Invalid, 0b01 LargePage,
 *          0b1x SmallPage. The architecture defines this independently of
 *          the first-level tags, so the order is mirrored.
 */
enum class PageTableType {
    Invalid,
    SmallPage,
    LargePage
};

/**
 * @brief Alignment mask a physical base address must satisfy for @p type
 * @details 0 for Invalid, 1KB for Page (second-level table), 1MB for
 *          Section and 16MB for Supersection.
 */
uint32_t alignMask(TranslationTableType type);

/// @brief Alignment mask: 0, 4KB for SmallPage, 64KB for LargePage
uint32_t alignMask(PageTableType type);

const char* toString(TranslationTableType type);
const char* toString(PageTableType type);

std::ostream& operator<<(std::ostream& os, TranslationTableType type);
std::ostream& operator<<(std::ostream& os, PageTableType type);

/**
 * @class TranslationTableDescriptor
 * @brief One 32-bit entry of the first-level translation table
 * @details The word is the hardware format: physical base address, attribute
 *          bits in the layout of the descriptor type, and the type tag. The
 *          default-constructed descriptor is the all-zero Invalid entry.
 */
class TranslationTableDescriptor {
public:
    TranslationTableDescriptor() : value(0) {
    }

    /**
     * @brief Create a descriptor
     * @param type Descriptor type, Invalid ignores the address and attributes
     * @param address Physical base address of the section, supersection or
     *                second-level table
     * @param memoryAttributes Attributes to encode
     * @return AlignError if @p address is not aligned for @p type
     */
    static Result<TranslationTableDescriptor> create(TranslationTableType type,
                                                     PhysicalAddress address,
                                                     const MemoryAttributes& memoryAttributes);

    /// @brief Wrap a raw word, e.g. one read back from table memory
    static TranslationTableDescriptor fromBits(uint32_t bits) {
        return TranslationTableDescriptor(bits);
    }

    TranslationTableType getType() const;

    /// @brief Physical base address, InvalidMemory for an Invalid descriptor
    Result<PhysicalAddress> getAddr() const;

    /// @brief Shortcut for MemoryAttributes::fromTableDescriptor
    Result<MemoryAttributes> getAttributes() const;

    bool isValid() const { return getType() != TranslationTableType::Invalid; }

    uint32_t bits() const { return value; }

    bool operator==(const TranslationTableDescriptor& other) const { return value == other.value; }
    bool operator!=(const TranslationTableDescriptor& other) const { return value != other.value; }

private:
    explicit TranslationTableDescriptor(uint32_t bits) : value(bits) {
    }

    uint32_t value;
};

/**
 * @class PageTableDescriptor
 * @brief One 32-bit entry of a second-level page table
 */
class PageTableDescriptor {
public:
    PageTableDescriptor() : value(0) {
    }

    /**
     * @brief Create a descriptor
     * @return AlignError if @p address is not aligned for @p type
     */
    static Result<PageTableDescriptor> create(PageTableType type,
                                              PhysicalAddress address,
                                              const MemoryAttributes& memoryAttributes);

    static PageTableDescriptor fromBits(uint32_t bits) {
        return PageTableDescriptor(bits);
    }

    PageTableType getType() const;

    /// @brief Physical base address, InvalidMemory for an Invalid descriptor
    Result<PhysicalAddress> getAddr() const;

    Result<MemoryAttributes> getAttributes() const;

    bool isValid() const { return getType() != PageTableType::Invalid; }

    uint32_t bits() const { return value; }

    bool operator==(const PageTableDescriptor& other) const { return value == other.value; }
    bool operator!=(const PageTableDescriptor& other) const { return value != other.value; }

private:
    explicit PageTableDescriptor(uint32_t bits) : value(bits) {
    }

    uint32_t value;
};

static_assert(sizeof(TranslationTableDescriptor) == 4, "first-level descriptors are 32-bit words");
static_assert(sizeof(PageTableDescriptor) == 4, "second-level descriptors are 32-bit words");

std::ostream& operator<<(std::ostream& os, const TranslationTableDescriptor& descriptor);
std::ostream& operator<<(std::ostream& os, const PageTableDescriptor& descriptor);

} // namespace armv7

#endif // ARMV7_DESCRIPTORS_H
