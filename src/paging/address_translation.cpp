// ARMv7-A Hardware-Assisted Address Translation Implementation
// Copyright (c) 2024 John Greninger

#include "armv7/address_translation.h"

namespace armv7 {

AddressTranslationOperation translationOperation(bool privileged, bool writable) {
    if (privileged) {
        return writable ? AddressTranslationOperation::PrivilegedWrite
                        : AddressTranslationOperation::PrivilegedRead;
    }
    return writable ? AddressTranslationOperation::UnprivilegedWrite
                    : AddressTranslationOperation::UnprivilegedRead;
}

uint32_t getPhysFrame(Processor& processor, VirtualAddress va, bool privileged, bool writable) {
    return getPhysFrame(processor, va, translationOperation(privileged, writable));
}

uint32_t getPhysFrame(Processor& processor, VirtualAddress va, AddressTranslationOperation operation) {
    processor.requestAddressTranslation(operation, va.asU32());
    return processor.readPar();
}

Result<PhysicalAddress> getPhysAddr(Processor& processor, VirtualAddress va) {
    return getPhysAddr(processor, va, AddressTranslationOperation::PrivilegedRead);
}

Result<PhysicalAddress> getPhysAddr(Processor& processor, VirtualAddress va,
                                    AddressTranslationOperation operation) {
    // The fault flag is tested on the raw PAR, before the frame is masked out
    uint32_t par = getPhysFrame(processor, va, operation);
    if (isParFault(par)) {
        return makeError<PhysicalAddress>(PageError::TranslationError);
    }
    return makeSuccess(physAddrFromPar(par, va));
}

} // namespace armv7
