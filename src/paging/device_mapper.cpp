// ARMv7-A Device Memory Mapper Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/device_mapper.h"
#include "armv7/descriptors.h"
#include "armv7/memory_attributes.h"
#include <algorithm>

namespace armv7 {

namespace {

const uint32_t FRAME_SHIFT = 24;
const uint64_t ADDRESS_SPACE_END = 0x100000000ULL;

} // namespace

Result<DeviceVmemMapper> DeviceVmemMapper::create(VirtualAddress base, const std::vector<uint8_t>& frames,
                                                  uint32_t sectionsPerSlot) {
    if (!base.isAligned(SUPERSECTION_MASK)) {
        return makeError<DeviceVmemMapper>(PageError::AlignError);
    }
    if (sectionsPerSlot == 0 || sectionsPerSlot > SUPERSECTION_ENTRY_COUNT) {
        return makeError<DeviceVmemMapper>(PageError::InvalidConfiguration);
    }

    uint64_t end = static_cast<uint64_t>(base.asU32()) +
                   static_cast<uint64_t>(frames.size()) * SUPERSECTION_SIZE;
    if (end > ADDRESS_SPACE_END) {
        return makeError<DeviceVmemMapper>(PageError::NotInRange);
    }

    return makeSuccess(DeviceVmemMapper(base, frames, sectionsPerSlot));
}

VoidResult DeviceVmemMapper::doMapping(TranslationTable& table, const TableMutationGrant& grant) const {
    const MemoryAttributes deviceAttributes =
        MemoryAttributes::from(attributes::AP::PrivAccess + attributes::XN::Enable);

    for (size_t slot = 0; slot < frames.size(); ++slot) {
        VirtualAddress slotBase = base + static_cast<uint32_t>(slot) * SUPERSECTION_SIZE;
        size_t firstIndex = translationTableIndex(slotBase);
        PhysicalAddress frameBase(static_cast<uint32_t>(frames[slot]) << FRAME_SHIFT);

        for (uint32_t section = 0; section < sectionsPerSlot; ++section) {
            Result<TranslationTableDescriptor> descriptor = TranslationTableDescriptor::create(
                TranslationTableType::Section, frameBase + section * SECTION_SIZE, deviceAttributes);
            if (descriptor.isError()) {
                return makeVoidError(descriptor.getError());
            }

            VoidResult written = table.set(firstIndex + section, descriptor.getValue(), grant);
            if (written.isError()) {
                return written;
            }
        }
    }
    return makeVoidSuccess();
}

Result<VirtualAddress> DeviceVmemMapper::lookup(PhysicalAddress pa) const {
    uint8_t frame = static_cast<uint8_t>(pa.asU32() >> FRAME_SHIFT);
    std::vector<uint8_t>::const_iterator it = std::find(frames.begin(), frames.end(), frame);
    if (it == frames.end()) {
        return makeError<VirtualAddress>(PageError::NotInRange);
    }

    // Offsets past the last written section have no entry in the table
    uint32_t offset = pa.asU32() & SUPERSECTION_MASK;
    if (offset >= sectionsPerSlot * SECTION_SIZE) {
        return makeError<VirtualAddress>(PageError::NotInRange);
    }

    uint32_t slot = static_cast<uint32_t>(it - frames.begin());
    return makeSuccess(base + (slot * SUPERSECTION_SIZE + offset));
}

} // namespace armv7
