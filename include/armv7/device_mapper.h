// ARMv7-A Device Memory Mapper
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_DEVICE_MAPPER_H
#define ARMV7_DEVICE_MAPPER_H

#include "armv7/types.h"
#include "armv7/address.h"
#include "armv7/translation_table.h"
#include <cstdint>
#include <vector>

namespace armv7 {

/// @brief Sections written per 16MB slot unless configured otherwise
constexpr uint32_t DEFAULT_SECTIONS_PER_SLOT = 15;

/**
 * @class DeviceVmemMapper
 * @brief Maps a list of 16MB physical device frames into consecutive
 *        16MB virtual slots
 * @details Frame i of the list is mapped at base + i * 16MB with privileged,
 *          execute-never sections. Frames are given as PA[31:24].
 */
class DeviceVmemMapper {
public:
    DeviceVmemMapper() : base(), frames(), sectionsPerSlot(DEFAULT_SECTIONS_PER_SLOT) {}

    /**
     * @brief Create a mapper
     * @param base Virtual base of the first slot, 16MB aligned
     * @param frames Physical frame numbers (PA >> 24), one per slot
     * @param sectionsPerSlot 1MB sections written per slot, 1 to 16
     * @return AlignError if @p base is misaligned, NotInRange if the slots
     *         do not fit below 4GB, InvalidConfiguration for a bad
     *         @p sectionsPerSlot
     */
    static Result<DeviceVmemMapper> create(VirtualAddress base, const std::vector<uint8_t>& frames,
                                           uint32_t sectionsPerSlot = DEFAULT_SECTIONS_PER_SLOT);

    /// @brief Write the section entries of every slot into @p table
    VoidResult doMapping(TranslationTable& table, const TableMutationGrant& grant) const;

    /**
     * @brief Virtual address of @p pa
     * @return NotInRange if the frame of @p pa is not listed or @p pa lies in
     *         the part of its frame that doMapping() leaves unmapped
     */
    Result<VirtualAddress> lookup(PhysicalAddress pa) const;

    VirtualAddress getBase() const { return base; }
    const std::vector<uint8_t>& getFrames() const { return frames; }
    uint32_t getSectionsPerSlot() const { return sectionsPerSlot; }

private:
    DeviceVmemMapper(VirtualAddress virtualBase, const std::vector<uint8_t>& frameList, uint32_t sections)
        : base(virtualBase), frames(frameList), sectionsPerSlot(sections) {}

    VirtualAddress base;
    std::vector<uint8_t> frames;
    uint32_t sectionsPerSlot;
};

} // namespace armv7

#endif // ARMV7_DEVICE_MAPPER_H
