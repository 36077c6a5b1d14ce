// ARMv7-A Memory Attributes Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/memory_attributes.h"
#include "armv7/descriptors.h"
#include <iomanip>

namespace armv7 {

namespace {

// First-level tag bits
const uint32_t TABLE_TAG_PAGE = 0x1;
const uint32_t TABLE_TAG_SECTION = 0x2;
const uint32_t TABLE_TAG_SUPERSECTION = 0x40002;

// Second-level tag bits
const uint32_t PAGE_TAG_LARGE = 0x1;
const uint32_t PAGE_TAG_SMALL = 0x2;

// The canonical layout is the section layout
const uint32_t SECTION_ATTRIBUTE_MASK = 0x000BFDFD;
// Supersections use bits [8:5] for PA[39:36], there is no domain field
const uint32_t SUPERSECTION_ATTRIBUTE_MASK = 0x000BFC1D;

const uint32_t PAGE_DESCRIPTOR_PXN = 1u << 2;
const uint32_t PAGE_DESCRIPTOR_NS = 1u << 3;

// Large page: TEX at [14:12], C and B at [3:2] are in canonical position
const uint32_t LARGE_PAGE_VERBATIM_MASK = 0x700C;
const uint32_t LARGE_PAGE_AP_MASK = 0x0030;
const uint32_t LARGE_PAGE_AP2_S_NG_MASK = 0x0E00;
const uint32_t LARGE_PAGE_XN = 0x8000;

// Small page: C and B in canonical position, XN at bit 0
const uint32_t SMALL_PAGE_VERBATIM_MASK = 0x000C;
const uint32_t SMALL_PAGE_XN = 0x1;
// AP, TEX, AP2, S and nG as one contiguous block at [11:4]
const uint32_t SMALL_PAGE_BLOCK_MASK = 0x0FF0;
const uint32_t CANONICAL_BLOCK_MASK = 0x3FC00;

} // namespace

Result<MemoryAttributes> MemoryAttributes::fromTableDescriptor(const TranslationTableDescriptor& descriptor) {
    uint32_t val = descriptor.bits();
    uint32_t out = 0;

    switch (descriptor.getType()) {
        case TranslationTableType::Invalid:
            return makeError<MemoryAttributes>(PageError::InvalidMemory);

        case TranslationTableType::Page:
            out = val & attributes::DOMAIN_MASK;
            out |= (val & PAGE_DESCRIPTOR_PXN) >> 2;
            out |= (val & PAGE_DESCRIPTOR_NS) << (attributes::NS_SHIFT - 3);
            break;

        case TranslationTableType::Section:
            out = val & SECTION_ATTRIBUTE_MASK;
            break;

        case TranslationTableType::Supersection:
            out = val & SUPERSECTION_ATTRIBUTE_MASK;
            break;
    }

    return makeSuccess(MemoryAttributes(out));
}

Result<MemoryAttributes> MemoryAttributes::fromPageDescriptor(const PageTableDescriptor& descriptor) {
    uint32_t val = descriptor.bits();
    uint32_t out = 0;

    switch (descriptor.getType()) {
        case PageTableType::Invalid:
            return makeError<MemoryAttributes>(PageError::InvalidMemory);

        case PageTableType::LargePage:
            out = val & LARGE_PAGE_VERBATIM_MASK;
            // AP [5:4] -> [11:10]
            out |= (val & LARGE_PAGE_AP_MASK) << (10 - 4);
            // AP2, S, nG [11:9] -> [17:15]
            out |= (val & LARGE_PAGE_AP2_S_NG_MASK) << (15 - 9);
            // XN 15 -> 4
            out |= (val & LARGE_PAGE_XN) >> (15 - 4);
            break;

        case PageTableType::SmallPage:
            out = val & SMALL_PAGE_VERBATIM_MASK;
            out |= (val & SMALL_PAGE_XN) << 4;
            out |= (val & SMALL_PAGE_BLOCK_MASK) << (10 - 4);
            break;
    }

    return makeSuccess(MemoryAttributes(out));
}

uint32_t MemoryAttributes::toTableDescriptorBits(TranslationTableType type) const {
    switch (type) {
        case TranslationTableType::Invalid:
            return 0;

        case TranslationTableType::Page: {
            uint32_t val = TABLE_TAG_PAGE | (bitset & attributes::DOMAIN_MASK);
            val |= (bitset & attributes::PXN_MASK) << 2;
            val |= (bitset & attributes::NS_MASK) >> (attributes::NS_SHIFT - 3);
            return val;
        }

        case TranslationTableType::Section:
            return TABLE_TAG_SECTION | (bitset & SECTION_ATTRIBUTE_MASK);

        case TranslationTableType::Supersection:
            return TABLE_TAG_SUPERSECTION | (bitset & SUPERSECTION_ATTRIBUTE_MASK);
    }
    return 0;
}

uint32_t MemoryAttributes::toPageDescriptorBits(PageTableType type) const {
    switch (type) {
        case PageTableType::Invalid:
            return 0;

        case PageTableType::SmallPage: {
            uint32_t val = PAGE_TAG_SMALL | (bitset & SMALL_PAGE_VERBATIM_MASK);
            val |= (bitset & attributes::XN_MASK) >> 4;
            val |= (bitset & CANONICAL_BLOCK_MASK) >> (10 - 4);
            return val;
        }

        case PageTableType::LargePage: {
            uint32_t val = PAGE_TAG_LARGE | (bitset & LARGE_PAGE_VERBATIM_MASK);
            val |= (bitset & attributes::AP_MASK) >> (10 - 4);
            val |= (bitset & (attributes::AP2_MASK | attributes::S_MASK | attributes::NG_MASK)) >> (15 - 9);
            val |= (bitset & attributes::XN_MASK) << (15 - 4);
            return val;
        }
    }
    return 0;
}

std::ostream& operator<<(std::ostream& os, const MemoryAttributes& memoryAttributes) {
    std::ios_base::fmtflags flags = os.flags();
    char fill = os.fill();
    os << "MemoryAttributes(0x" << std::hex << std::setw(8) << std::setfill('0')
       << memoryAttributes.bits() << ")";
    os.flags(flags);
    os.fill(fill);
    return os;
}

} // namespace armv7
