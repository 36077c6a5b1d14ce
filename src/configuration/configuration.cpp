// ARMv7-A MMU Configuration System Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/configuration.h"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace armv7 {

const uint32_t DeviceMappingConfiguration::MIN_SECTIONS;
const uint32_t DeviceMappingConfiguration::MAX_SECTIONS;
const uint32_t DeviceMappingConfiguration::DEFAULT_SECTIONS;
const size_t FaultConfiguration::MIN_RECORDS;
const size_t FaultConfiguration::MAX_RECORDS;
const size_t FaultConfiguration::DEFAULT_RECORDS;

const char* toString(AddressTranslationOperation operation) {
    switch (operation) {
        case AddressTranslationOperation::PrivilegedRead:
            return "privileged_read";
        case AddressTranslationOperation::PrivilegedWrite:
            return "privileged_write";
        case AddressTranslationOperation::UnprivilegedRead:
            return "unprivileged_read";
        case AddressTranslationOperation::UnprivilegedWrite:
            return "unprivileged_write";
    }
    return "unknown";
}

Result<AddressTranslationOperation> parseTranslationOperation(const std::string& name) {
    static const AddressTranslationOperation operations[] = {
        AddressTranslationOperation::PrivilegedRead,
        AddressTranslationOperation::PrivilegedWrite,
        AddressTranslationOperation::UnprivilegedRead,
        AddressTranslationOperation::UnprivilegedWrite
    };
    for (AddressTranslationOperation operation : operations) {
        if (name == toString(operation)) {
            return makeSuccess<AddressTranslationOperation>(operation);
        }
    }
    return makeError<AddressTranslationOperation>(PageError::ParseError);
}

// MmuConfiguration implementation

MmuConfiguration::MmuConfiguration()
    : deviceConfig(),
      translationConfig(),
      faultConfig() {
}

MmuConfiguration::MmuConfiguration(const DeviceMappingConfiguration& dConfig,
                                   const TranslationConfiguration& tConfig,
                                   const FaultConfiguration& fConfig)
    : deviceConfig(dConfig),
      translationConfig(tConfig),
      faultConfig(fConfig) {
}

MmuConfiguration::MmuConfiguration(const MmuConfiguration& other)
    : deviceConfig(other.deviceConfig),
      translationConfig(other.translationConfig),
      faultConfig(other.faultConfig) {
}

MmuConfiguration& MmuConfiguration::operator=(const MmuConfiguration& other) {
    if (this != &other) {
        deviceConfig = other.deviceConfig;
        translationConfig = other.translationConfig;
        faultConfig = other.faultConfig;
    }
    return *this;
}

MmuConfiguration::~MmuConfiguration() {
}

const DeviceMappingConfiguration& MmuConfiguration::getDeviceMappingConfiguration() const {
    return deviceConfig;
}

const TranslationConfiguration& MmuConfiguration::getTranslationConfiguration() const {
    return translationConfig;
}

const FaultConfiguration& MmuConfiguration::getFaultConfiguration() const {
    return faultConfig;
}

VoidResult MmuConfiguration::setDeviceMappingConfiguration(const DeviceMappingConfiguration& dConfig) {
    if (!dConfig.isValid()) {
        return makeVoidError(PageError::InvalidConfiguration);
    }
    deviceConfig = dConfig;
    return makeVoidSuccess();
}

VoidResult MmuConfiguration::setTranslationConfiguration(const TranslationConfiguration& tConfig) {
    if (!tConfig.isValid()) {
        return makeVoidError(PageError::InvalidConfiguration);
    }
    translationConfig = tConfig;
    return makeVoidSuccess();
}

VoidResult MmuConfiguration::setFaultConfiguration(const FaultConfiguration& fConfig) {
    if (!fConfig.isValid()) {
        return makeVoidError(PageError::InvalidConfiguration);
    }
    faultConfig = fConfig;
    return makeVoidSuccess();
}

VoidResult MmuConfiguration::updateSectionsPerSlot(uint32_t sectionsPerSlot) {
    return setDeviceMappingConfiguration(DeviceMappingConfiguration(sectionsPerSlot));
}

VoidResult MmuConfiguration::updateFaultRecording(bool recordFaults, size_t maxFaultRecords) {
    VoidResult result = setFaultConfiguration(FaultConfiguration(maxFaultRecords));
    if (result.isError()) {
        return result;
    }
    translationConfig.recordFaults = recordFaults;
    return makeVoidSuccess();
}

bool MmuConfiguration::isValid() const {
    return deviceConfig.isValid() && translationConfig.isValid() && faultConfig.isValid();
}

std::vector<std::string> MmuConfiguration::validateConfiguration() const {
    std::vector<std::string> errors;

    if (!deviceConfig.isValid()) {
        errors.push_back("Invalid device mapping configuration");
    }
    if (!translationConfig.isValid()) {
        errors.push_back("Invalid translation configuration");
    }
    if (!faultConfig.isValid()) {
        errors.push_back("Invalid fault configuration");
    }

    return errors;
}

Result<MmuConfiguration> MmuConfiguration::fromString(const std::string& configString) {
    MmuConfiguration config;

    try {
        std::unordered_map<std::string, std::string> keyValuePairs = parseKeyValuePairs(configString);

        if (keyValuePairs.find("sections_per_slot") != keyValuePairs.end()) {
            config.deviceConfig.sectionsPerSlot = parseUInt32(keyValuePairs["sections_per_slot"]);
        }

        if (keyValuePairs.find("default_operation") != keyValuePairs.end()) {
            Result<AddressTranslationOperation> operation =
                parseTranslationOperation(keyValuePairs["default_operation"]);
            if (operation.isError()) {
                return makeError<MmuConfiguration>(operation.getError());
            }
            config.translationConfig.defaultOperation = operation.getValue();
        }
        if (keyValuePairs.find("record_faults") != keyValuePairs.end()) {
            config.translationConfig.recordFaults = parseBoolean(keyValuePairs["record_faults"]);
        }

        if (keyValuePairs.find("max_fault_records") != keyValuePairs.end()) {
            config.faultConfig.maxFaultRecords = parseSize(keyValuePairs["max_fault_records"]);
        }
    } catch (const std::exception&) {
        return makeError<MmuConfiguration>(PageError::ParseError);
    }

    if (!config.isValid()) {
        return makeError<MmuConfiguration>(PageError::InvalidConfiguration);
    }

    return makeSuccess<MmuConfiguration>(config);
}

std::string MmuConfiguration::toString() const {
    std::ostringstream oss;

    oss << "sections_per_slot=" << deviceConfig.sectionsPerSlot << "\n";
    oss << "default_operation=" << armv7::toString(translationConfig.defaultOperation) << "\n";
    oss << "record_faults=" << (translationConfig.recordFaults ? "true" : "false") << "\n";
    oss << "max_fault_records=" << faultConfig.maxFaultRecords << "\n";

    return oss.str();
}

// Factory methods
MmuConfiguration MmuConfiguration::createDefault() {
    return MmuConfiguration();
}

MmuConfiguration MmuConfiguration::createFullSlotMapping() {
    DeviceMappingConfiguration dConfig(DeviceMappingConfiguration::MAX_SECTIONS);
    return MmuConfiguration(dConfig, TranslationConfiguration(), FaultConfiguration());
}

MmuConfiguration MmuConfiguration::createQuiet() {
    TranslationConfiguration tConfig(AddressTranslationOperation::PrivilegedRead, false);
    FaultConfiguration fConfig(FaultConfiguration::MIN_RECORDS);
    return MmuConfiguration(DeviceMappingConfiguration(), tConfig, fConfig);
}

bool MmuConfiguration::operator==(const MmuConfiguration& other) const {
    return deviceConfig.sectionsPerSlot == other.deviceConfig.sectionsPerSlot &&
           translationConfig.defaultOperation == other.translationConfig.defaultOperation &&
           translationConfig.recordFaults == other.translationConfig.recordFaults &&
           faultConfig.maxFaultRecords == other.faultConfig.maxFaultRecords;
}

bool MmuConfiguration::operator!=(const MmuConfiguration& other) const {
    return !(*this == other);
}

void MmuConfiguration::reset() {
    *this = MmuConfiguration();
}

MmuConfiguration::ValidationResult MmuConfiguration::validate() const {
    ValidationResult result;
    result.isValid = true;

    if (!deviceConfig.isValid()) {
        result.isValid = false;
        result.errors.push_back("Device mapping configuration validation failed");
        result.errors.push_back("Sections per slot out of range [1, 16]");
    }

    if (!faultConfig.isValid()) {
        result.isValid = false;
        result.errors.push_back("Fault configuration validation failed");
        result.errors.push_back("Max fault records out of range [16, 65536]");
    }

    if (deviceConfig.sectionsPerSlot == DeviceMappingConfiguration::MAX_SECTIONS) {
        result.warnings.push_back("Device slots are mapped back to back without an unmapped section");
    }
    if (!translationConfig.recordFaults) {
        result.warnings.push_back("Translation faults are not recorded");
    }
    if (faultConfig.maxFaultRecords > 10000) {
        result.warnings.push_back("Large fault queue may consume significant memory");
    }

    return result;
}

std::unordered_map<std::string, std::string> MmuConfiguration::parseKeyValuePairs(const std::string& configString) {
    std::unordered_map<std::string, std::string> result;
    std::istringstream stream(configString);
    std::string line;

    while (std::getline(stream, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos) {
            throw std::invalid_argument("missing '=' in configuration line");
        }

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);

        result[key] = value;
    }

    return result;
}

bool MmuConfiguration::parseBoolean(const std::string& value) {
    std::string lowercaseValue = value;
    std::transform(lowercaseValue.begin(), lowercaseValue.end(), lowercaseValue.begin(), ::tolower);
    if (lowercaseValue == "true" || lowercaseValue == "1" || lowercaseValue == "yes" || lowercaseValue == "on") {
        return true;
    }
    if (lowercaseValue == "false" || lowercaseValue == "0" || lowercaseValue == "no" || lowercaseValue == "off") {
        return false;
    }
    throw std::invalid_argument("not a boolean: " + value);
}

// std::stoul accepts a leading minus sign, so digits are checked first
uint32_t MmuConfiguration::parseUInt32(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not an unsigned integer: " + value);
    }
    unsigned long long parsed = std::stoull(value);
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw std::out_of_range("value exceeds 32 bits: " + value);
    }
    return static_cast<uint32_t>(parsed);
}

size_t MmuConfiguration::parseSize(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not an unsigned integer: " + value);
    }
    return static_cast<size_t>(std::stoull(value));
}

} // namespace armv7
