// ARMv7-A Short-Descriptor Translation Table Entries Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/descriptors.h"
#include <iomanip>

namespace armv7 {

namespace {

const uint32_t TYPE_MASK = 0x3;
const uint32_t SUPERSECTION_BIT = 1u << 18;

std::ostream& writeDescriptor(std::ostream& os, const char* name, uint32_t bits) {
    std::ios_base::fmtflags flags = os.flags();
    char fill = os.fill();
    os << name << "(0x" << std::hex << std::setw(8) << std::setfill('0') << bits << ")";
    os.flags(flags);
    os.fill(fill);
    return os;
}

} // namespace

uint32_t alignMask(TranslationTableType type) {
    switch (type) {
        case TranslationTableType::Invalid:
            return 0;
        case TranslationTableType::Page:
            return PAGE_TABLE_ALIGN_MASK;
        case TranslationTableType::Section:
            return SECTION_MASK;
        case TranslationTableType::Supersection:
            return SUPERSECTION_MASK;
    }
    return 0;
}

uint32_t alignMask(PageTableType type) {
    switch (type) {
        case PageTableType::Invalid:
            return 0;
        case PageTableType::SmallPage:
            return SMALL_PAGE_MASK;
        case PageTableType::LargePage:
            return LARGE_PAGE_MASK;
    }
    return 0;
}

const char* toString(TranslationTableType type) {
    switch (type) {
        case TranslationTableType::Invalid:
            return "Invalid";
        case TranslationTableType::Page:
            return "Page";
        case TranslationTableType::Section:
            return "Section";
        case TranslationTableType::Supersection:
            return "Supersection";
    }
    return "Unknown";
}

const char* toString(PageTableType type) {
    switch (type) {
        case PageTableType::Invalid:
            return "Invalid";
        case PageTableType::SmallPage:
            return "SmallPage";
        case PageTableType::LargePage:
            return "LargePage";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, TranslationTableType type) {
    return os << toString(type);
}

std::ostream& operator<<(std::ostream& os, PageTableType type) {
    return os << toString(type);
}

// TranslationTableDescriptor implementation

Result<TranslationTableDescriptor> TranslationTableDescriptor::create(TranslationTableType type,
                                                                      PhysicalAddress address,
                                                                      const MemoryAttributes& memoryAttributes) {
    if (type == TranslationTableType::Invalid) {
        return makeSuccess(TranslationTableDescriptor());
    }

    VoidResult aligned = address.checkAlign(alignMask(type));
    if (aligned.isError()) {
        return makeError<TranslationTableDescriptor>(aligned.getError());
    }

    uint32_t bits = memoryAttributes.toTableDescriptorBits(type) | address.asU32();
    return makeSuccess(TranslationTableDescriptor(bits));
}

TranslationTableType TranslationTableDescriptor::getType() const {
    switch (value & TYPE_MASK) {
        case 0x0:
            return TranslationTableType::Invalid;
        case 0x1:
            return TranslationTableType::Page;
        default:
            if ((value & SUPERSECTION_BIT) == 0) {
                return TranslationTableType::Section;
            }
            return TranslationTableType::Supersection;
    }
}

Result<PhysicalAddress> TranslationTableDescriptor::getAddr() const {
    TranslationTableType type = getType();
    if (type == TranslationTableType::Invalid) {
        return makeError<PhysicalAddress>(PageError::InvalidMemory);
    }
    return makeSuccess(PhysicalAddress(value & ~alignMask(type)));
}

Result<MemoryAttributes> TranslationTableDescriptor::getAttributes() const {
    return MemoryAttributes::fromTableDescriptor(*this);
}

// PageTableDescriptor implementation

Result<PageTableDescriptor> PageTableDescriptor::create(PageTableType type,
                                                        PhysicalAddress address,
                                                        const MemoryAttributes& memoryAttributes) {
    if (type == PageTableType::Invalid) {
        return makeSuccess(PageTableDescriptor());
    }

    VoidResult aligned = address.checkAlign(alignMask(type));
    if (aligned.isError()) {
        return makeError<PageTableDescriptor>(aligned.getError());
    }

    uint32_t bits = memoryAttributes.toPageDescriptorBits(type) | address.asU32();
    return makeSuccess(PageTableDescriptor(bits));
}

PageTableType PageTableDescriptor::getType() const {
    switch (value & TYPE_MASK) {
        case 0x0:
            return PageTableType::Invalid;
        case 0x1:
            return PageTableType::LargePage;
        default:
            return PageTableType::SmallPage;
    }
}

Result<PhysicalAddress> PageTableDescriptor::getAddr() const {
    PageTableType type = getType();
    if (type == PageTableType::Invalid) {
        return makeError<PhysicalAddress>(PageError::InvalidMemory);
    }
    return makeSuccess(PhysicalAddress(value & ~alignMask(type)));
}

Result<MemoryAttributes> PageTableDescriptor::getAttributes() const {
    return MemoryAttributes::fromPageDescriptor(*this);
}

std::ostream& operator<<(std::ostream& os, const TranslationTableDescriptor& descriptor) {
    return writeDescriptor(os, toString(descriptor.getType()), descriptor.bits());
}

std::ostream& operator<<(std::ostream& os, const PageTableDescriptor& descriptor) {
    return writeDescriptor(os, toString(descriptor.getType()), descriptor.bits());
}

} // namespace armv7
