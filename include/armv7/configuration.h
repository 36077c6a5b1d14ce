// ARMv7-A MMU Configuration System
// Copyright (c) 2024 John Greninger

#ifndef ARMV7_CONFIGURATION_H
#define ARMV7_CONFIGURATION_H

#include "armv7/types.h"
#include "armv7/device_mapper.h"
#include <string>
#include <unordered_map>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace armv7 {

// Device mapper configuration structure
struct DeviceMappingConfiguration {
    uint32_t sectionsPerSlot;   // 1MB sections written per 16MB device slot (default: 15)

    DeviceMappingConfiguration()
        : sectionsPerSlot(DEFAULT_SECTIONS) {
    }

    explicit DeviceMappingConfiguration(uint32_t sections)
        : sectionsPerSlot(sections) {
    }

    bool isValid() const {
        return sectionsPerSlot >= MIN_SECTIONS && sectionsPerSlot <= MAX_SECTIONS;
    }

    static const uint32_t MIN_SECTIONS = 1;
    static const uint32_t MAX_SECTIONS = static_cast<uint32_t>(SUPERSECTION_ENTRY_COUNT);
    static const uint32_t DEFAULT_SECTIONS = DEFAULT_SECTIONS_PER_SLOT;
};

// Address translation configuration structure
struct TranslationConfiguration {
    AddressTranslationOperation defaultOperation;  // Used by Mmu::translate(va) (default: privileged read)
    bool recordFaults;                             // Record failed lookups (default: true)

    TranslationConfiguration()
        : defaultOperation(AddressTranslationOperation::PrivilegedRead),
          recordFaults(true) {
    }

    TranslationConfiguration(AddressTranslationOperation operation, bool record)
        : defaultOperation(operation),
          recordFaults(record) {
    }

    bool isValid() const {
        return true;
    }
};

// Fault queue configuration structure
struct FaultConfiguration {
    size_t maxFaultRecords;     // Bound of the fault queue (default: 1000)

    FaultConfiguration()
        : maxFaultRecords(DEFAULT_RECORDS) {
    }

    explicit FaultConfiguration(size_t maxRecords)
        : maxFaultRecords(maxRecords) {
    }

    bool isValid() const {
        return maxFaultRecords >= MIN_RECORDS && maxFaultRecords <= MAX_RECORDS;
    }

    static const size_t MIN_RECORDS = 16;
    static const size_t MAX_RECORDS = 65536;
    static const size_t DEFAULT_RECORDS = 1000;
};

/// @brief Configuration name of an operation, e.g. "privileged_read"
const char* toString(AddressTranslationOperation operation);

/// @brief Inverse of toString(AddressTranslationOperation), ParseError if unknown
Result<AddressTranslationOperation> parseTranslationOperation(const std::string& name);

// Main MMU configuration class
class MmuConfiguration {
public:
    MmuConfiguration();

    MmuConfiguration(const DeviceMappingConfiguration& deviceConfig,
                     const TranslationConfiguration& translationConfig,
                     const FaultConfiguration& faultConfig);

    MmuConfiguration(const MmuConfiguration& other);
    MmuConfiguration& operator=(const MmuConfiguration& other);

    ~MmuConfiguration();

    const DeviceMappingConfiguration& getDeviceMappingConfiguration() const;
    const TranslationConfiguration& getTranslationConfiguration() const;
    const FaultConfiguration& getFaultConfiguration() const;

    // Rejected with InvalidConfiguration, leaving the current value in place
    VoidResult setDeviceMappingConfiguration(const DeviceMappingConfiguration& deviceConfig);
    VoidResult setTranslationConfiguration(const TranslationConfiguration& translationConfig);
    VoidResult setFaultConfiguration(const FaultConfiguration& faultConfig);

    VoidResult updateSectionsPerSlot(uint32_t sectionsPerSlot);
    VoidResult updateFaultRecording(bool recordFaults, size_t maxFaultRecords);

    bool isValid() const;
    std::vector<std::string> validateConfiguration() const;

    /**
     * @brief Parse key=value lines
     * @details Blank lines and lines starting with '#' are skipped, keys and
     *          values are trimmed, unknown keys are ignored.
     * @return ParseError for malformed values, InvalidConfiguration if the
     *         parsed configuration does not validate
     */
    static Result<MmuConfiguration> fromString(const std::string& configString);
    std::string toString() const;

    // Factory methods
    static MmuConfiguration createDefault();
    static MmuConfiguration createFullSlotMapping();  // All 16 sections of every device slot
    static MmuConfiguration createQuiet();            // No fault recording, minimal queue

    bool operator==(const MmuConfiguration& other) const;
    bool operator!=(const MmuConfiguration& other) const;

    void reset();

    struct ValidationResult {
        bool isValid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        ValidationResult() : isValid(false) {}
    };
    ValidationResult validate() const;

private:
    DeviceMappingConfiguration deviceConfig;
    TranslationConfiguration translationConfig;
    FaultConfiguration faultConfig;

    static std::unordered_map<std::string, std::string> parseKeyValuePairs(const std::string& configString);
    static bool parseBoolean(const std::string& value);
    static uint32_t parseUInt32(const std::string& value);
    static size_t parseSize(const std::string& value);
};

} // namespace armv7

#endif // ARMV7_CONFIGURATION_H
