// ARMv7-A MMU Configuration System Example
// Copyright (c) 2024 John Greninger

#include <iostream>
#include <string>
#include <vector>
#include "armv7/mmu.h"
#include "armv7/configuration.h"
#include "armv7/simulated_processor.h"
#include "armv7/memory_attributes.h"

using namespace armv7;

namespace {

TranslationTableMemory exampleTable;

} // namespace

void printConfiguration(const MmuConfiguration& config) {
    const DeviceMappingConfiguration& deviceConfig = config.getDeviceMappingConfiguration();
    const TranslationConfiguration& translationConfig = config.getTranslationConfiguration();
    const FaultConfiguration& faultConfig = config.getFaultConfiguration();

    std::cout << "MMU Configuration:\n";
    std::cout << "  Device Mapping:\n";
    std::cout << "    Sections Per Slot: " << deviceConfig.sectionsPerSlot << "\n";

    std::cout << "  Translation:\n";
    std::cout << "    Default Operation: " << toString(translationConfig.defaultOperation) << "\n";
    std::cout << "    Record Faults: " << (translationConfig.recordFaults ? "Yes" : "No") << "\n";

    std::cout << "  Faults:\n";
    std::cout << "    Max Fault Records: " << faultConfig.maxFaultRecords << "\n";
    std::cout << std::endl;
}

int main() {
    std::cout << "ARMv7-A MMU Configuration System Example\n";
    std::cout << "========================================\n\n";

    // 1. Default Configuration
    std::cout << "1. Default Configuration\n";
    std::cout << "------------------------\n";
    MmuConfiguration defaultConfig = MmuConfiguration::createDefault();
    printConfiguration(defaultConfig);

    // 2. Full Slot Mapping Configuration
    std::cout << "2. Full Slot Mapping Configuration\n";
    std::cout << "----------------------------------\n";
    MmuConfiguration fullSlotConfig = MmuConfiguration::createFullSlotMapping();
    printConfiguration(fullSlotConfig);

    // 3. Quiet Configuration
    std::cout << "3. Quiet Configuration\n";
    std::cout << "----------------------\n";
    MmuConfiguration quietConfig = MmuConfiguration::createQuiet();
    printConfiguration(quietConfig);

    // 4. Configuration String Serialization
    std::cout << "4. Configuration Serialization\n";
    std::cout << "------------------------------\n";
    std::string configString =
        "sections_per_slot=12\n"
        "default_operation=unprivileged_read\n"
        "record_faults=true\n"
        "max_fault_records=512\n";

    Result<MmuConfiguration> parseResult = MmuConfiguration::fromString(configString);
    if (parseResult.isOk()) {
        std::cout << "Successfully parsed configuration from string!\n\n";
        printConfiguration(parseResult.getValue());
        std::cout << "Configuration as string:\n" << parseResult.getValue().toString() << "\n";
    } else {
        std::cout << "Failed to parse configuration: Error code " << static_cast<int>(parseResult.getError()) << "\n\n";
    }

    // 5. MMU with Configuration
    std::cout << "5. MMU with Full Slot Mapping\n";
    std::cout << "-----------------------------\n";
    SimulatedProcessor processor;
    VoidResult attached = processor.attachMemory(PhysicalAddress(0x00004000), &exampleTable, sizeof(exampleTable));
    if (attached.isError()) {
        std::cout << "Failed to attach table memory: Error code " << static_cast<int>(attached.getError()) << "\n";
        return 1;
    }

    Mmu mmu(processor, fullSlotConfig);
    Result<TranslationTable> table = TranslationTable::create(exampleTable, VirtualAddress(0x00004000));
    if (table.isError() || mmu.installTranslationTable(table.getValue()).isError()) {
        std::cout << "Failed to install translation table\n";
        return 1;
    }
    std::cout << "Translation table installed at " << mmu.installedTableAddress() << "\n";

    Result<DeviceVmemMapper> mapper = mmu.createDeviceMapper(VirtualAddress(0x90000000), {0x3F});
    if (mapper.isError() || mmu.mapDevices(mapper.getValue(), TableMutationGrant::attest()).isError()) {
        std::cout << "Failed to map devices\n";
        return 1;
    }
    mmu.enable();

    const uint32_t probes[] = { 0x90200000, 0x90F00000, 0xA0000000 };
    for (uint32_t probe : probes) {
        Result<PhysicalAddress> pa = mmu.translate(VirtualAddress(probe));
        std::cout << "  " << VirtualAddress(probe) << " -> ";
        if (pa.isOk()) {
            std::cout << pa.getValue() << "\n";
        } else {
            std::cout << "fault\n";
        }
    }
    std::cout << "Total translations: " << mmu.getTranslationCount() << "\n";
    std::cout << "Recorded faults: " << mmu.getFaultHandler().getFaultCount() << "\n";

    // Update configuration at runtime
    VoidResult updateResult = mmu.updateConfiguration(quietConfig);
    if (updateResult.isOk()) {
        std::cout << "Successfully updated configuration at runtime\n";
        std::cout << "New fault queue bound: " << mmu.getFaultHandler().getMaxQueueSize() << "\n";
    } else {
        std::cout << "Failed to update configuration: Error code " << static_cast<int>(updateResult.getError()) << "\n";
    }

    // 6. Configuration Validation
    std::cout << "\n6. Configuration Validation\n";
    std::cout << "---------------------------\n";

    MmuConfiguration::ValidationResult validation = fullSlotConfig.validate();

    std::cout << "Configuration validation result:\n";
    std::cout << "  Valid: " << (validation.isValid ? "Yes" : "No") << "\n";
    std::cout << "  Errors: " << validation.errors.size() << "\n";
    std::cout << "  Warnings: " << validation.warnings.size() << "\n";

    for (const std::string& error : validation.errors) {
        std::cout << "    Error: " << error << "\n";
    }
    for (const std::string& warning : validation.warnings) {
        std::cout << "    Warning: " << warning << "\n";
    }

    std::cout << "\nConfiguration system example completed successfully!\n";

    return 0;
}
