/**
 * @file types.h
 * @brief ARMv7-A MMU Core Types and Error Handling
 * @details This file contains the fundamental types, enums and constants
 *          used throughout the ARMv7-A short-descriptor paging library. It
 *          follows the VMSAv7 chapter of the ARM Architecture Reference
 *          Manual (ARM DDI 0406C) and provides C++11-compliant error handling
 *          through the Result<T> template.
 *
 * Copyright (c) 2024 John Greninger
 */

#ifndef ARMV7_TYPES_H
#define ARMV7_TYPES_H

#include <cstdint>
#include <cstddef>
#include <utility>

namespace armv7 {

/**
 * @enum PageError
 * @brief Error enumeration for paging operations
 * @details Used with Result<T> for error handling without exceptions.
 */
enum class PageError {
    /// @brief Success state (used internally by Result<T>)
    Success,
    /// @brief Address or index violates the alignment of the requested structure
    AlignError,
    /// @brief Hardware address translation reported a fault
    TranslationError,
    /// @brief Domain fault (reserved)
    DomainError,
    /// @brief Permission fault (reserved)
    PermissionError,
    /// @brief Operation attempted on an Invalid descriptor or on unbacked memory
    InvalidMemory,
    /// @brief Address outside of a mapping window
    NotInRange,
    /// @brief Table index or address component out of bounds
    IndexError,
    /// @brief Configuration values out of their valid range
    InvalidConfiguration,
    /// @brief Configuration string could not be parsed
    ParseError,
    /// @brief Default state of a Result that was never assigned
    InternalError
};

/**
 * @class Result
 * @brief Type-safe error handling template
 * @tparam T The type of value returned on success
 * @details Provides consistent success/error handling without exceptions,
 *          compatible with C++11. Inspired by Rust's Result<T, E> type.
 *
 * Usage patterns:
 * @code
 * Result<PhysicalAddress> result = getPhysAddr(processor, va);
 * if (result.isOk()) {
 *     PhysicalAddress pa = result.getValue();
 * } else {
 *     PageError error = result.getError();
 * }
 * @endcode
 */
template<typename T>
class Result {
private:
    bool isSuccess;
    PageError errorCode;
    T value;  // Only valid when isSuccess == true

public:
    /**
     * @brief Default constructor creates an error result
     * @details Prefer explicit error construction.
     */
    Result() : isSuccess(false), errorCode(PageError::InternalError), value() {
    }

    /**
     * @brief Constructor for success case with value copy
     * @param val The success value to store
     */
    explicit Result(const T& val)
        : isSuccess(true), errorCode(PageError::Success), value(val) {
    }

    /**
     * @brief Constructor for success case with move semantics
     * @param val The success value to move
     */
    explicit Result(T&& val)
        : isSuccess(true), errorCode(PageError::Success), value(std::move(val)) {
    }

    /**
     * @brief Constructor for error case
     * @param error The error code to store
     * @details Value remains in default-constructed state.
     */
    explicit Result(PageError error)
        : isSuccess(false), errorCode(error), value() {
    }

    Result(const Result& other)
        : isSuccess(other.isSuccess), errorCode(other.errorCode), value(other.value) {
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            isSuccess = other.isSuccess;
            errorCode = other.errorCode;
            if (other.isSuccess) {
                value = other.value;
            }
        }
        return *this;
    }

    Result(Result&& other)
        : isSuccess(other.isSuccess), errorCode(other.errorCode), value(std::move(other.value)) {
        other.isSuccess = false;
        other.errorCode = PageError::InternalError;
    }

    Result& operator=(Result&& other) {
        if (this != &other) {
            isSuccess = other.isSuccess;
            errorCode = other.errorCode;
            if (other.isSuccess) {
                value = std::move(other.value);
            }
            other.isSuccess = false;
            other.errorCode = PageError::InternalError;
        }
        return *this;
    }

    /**
     * @brief Check if result represents success
     * @return true if the operation succeeded
     */
    bool isOk() const {
        return isSuccess;
    }

    /**
     * @brief Check if result represents error
     * @return true if the operation failed
     */
    bool isError() const {
        return !isSuccess;
    }

    /**
     * @brief Get the error code
     * @pre isError() must return true
     */
    PageError getError() const {
        return errorCode;
    }

    /**
     * @brief Get the success value by const reference
     * @pre isOk() must return true
     */
    const T& getValue() const {
        return value;
    }

    /**
     * @brief Get the success value by mutable reference
     * @pre isOk() must return true
     */
    T& getValue() {
        return value;
    }

    /**
     * @brief Get the success value with move semantics
     * @pre isOk() must return true
     * @details Value becomes unspecified after this call.
     */
    T&& moveValue() {
        return std::move(value);
    }

    /**
     * @brief Safe value extraction with default fallback
     * @param defaultValue Value to return if result is error
     */
    T getValueOr(const T& defaultValue) const {
        return isSuccess ? value : defaultValue;
    }

    explicit operator bool() const {
        return isSuccess;
    }
};

/**
 * @struct Unit
 * @brief Unit type for Result<void> operations
 */
struct Unit {
    Unit() {}
};

template<typename T>
Result<T> makeSuccess(const T& value) {
    return Result<T>(value);
}

template<typename T>
Result<T> makeSuccess(T&& value) {
    return Result<T>(std::move(value));
}

template<typename T>
Result<T> makeError(PageError error) {
    return Result<T>(error);
}

inline Result<Unit> makeVoidSuccess() {
    return Result<Unit>(Unit());
}

inline Result<Unit> makeVoidError(PageError error) {
    return Result<Unit>(error);
}

/**
 * @typedef VoidResult
 * @brief Type alias for operations that only report success or failure
 */
using VoidResult = Result<Unit>;

/**
 * @enum AddressTranslationOperation
 * @brief The four stage-1 current-state address translation operations
 * @details Each value writes the virtual address to one of the ATS1Cxx
 *          CP15 c7 registers. The result is read back from PAR.
 */
enum class AddressTranslationOperation {
    /// @brief ATS1CPR: PL1 read
    PrivilegedRead,
    /// @brief ATS1CPW: PL1 write
    PrivilegedWrite,
    /// @brief ATS1CUR: PL0 read
    UnprivilegedRead,
    /// @brief ATS1CUW: PL0 write
    UnprivilegedWrite
};

/**
 * @enum FaultType
 * @brief Short-descriptor fault status classification
 * @details Decoded from the FS field that a failed address translation
 *          leaves in PAR (same encoding as DFSR.FS).
 */
enum class FaultType {
    AlignmentFault,
    TranslationFaultSection,
    TranslationFaultPage,
    AccessFlagFaultSection,
    AccessFlagFaultPage,
    DomainFaultSection,
    DomainFaultPage,
    PermissionFaultSection,
    PermissionFaultPage,
    ExternalAbortOnWalk,
    Unknown
};

///@{
/// @name Short-descriptor fault status encodings (FS[4:0])
constexpr uint32_t FS_ALIGNMENT = 0x01;
constexpr uint32_t FS_ACCESS_FLAG_SECTION = 0x03;
constexpr uint32_t FS_TRANSLATION_SECTION = 0x05;
constexpr uint32_t FS_ACCESS_FLAG_PAGE = 0x06;
constexpr uint32_t FS_TRANSLATION_PAGE = 0x07;
constexpr uint32_t FS_DOMAIN_SECTION = 0x09;
constexpr uint32_t FS_DOMAIN_PAGE = 0x0B;
constexpr uint32_t FS_EXTERNAL_ABORT_WALK = 0x0C;
constexpr uint32_t FS_PERMISSION_SECTION = 0x0D;
constexpr uint32_t FS_PERMISSION_PAGE = 0x0F;
///@}

/// @brief PAR bit 0: translation aborted
constexpr uint32_t PAR_FAULT = 0x1;
/// @brief PAR bit 9: NS attribute of the translated address
constexpr uint32_t PAR_NS = 0x200;
/// @brief Shift of the FS field within a faulting PAR value
constexpr uint32_t PAR_FS_SHIFT = 1;
/// @brief Width mask of the FS field within a faulting PAR value
constexpr uint32_t PAR_FS_MASK = 0x3F;

///@{
/// @name Short-descriptor DFSR/IFSR fields

/// @brief FSR bits [3:0]: FS[3:0]
constexpr uint32_t FSR_FS_LOW_MASK = 0xF;
/// @brief FSR bit 10: FS[4]
constexpr uint32_t FSR_FS4 = 1u << 10;
/// @brief DFSR bit 11: the abort was caused by a write
constexpr uint32_t DFSR_WNR = 1u << 11;

///@}

/// @brief Decode a short-descriptor fault status FS[4:0]
inline FaultType faultTypeFromStatus(uint32_t faultStatus) {
    switch (faultStatus & 0x1F) {
        case FS_ALIGNMENT:
            return FaultType::AlignmentFault;
        case FS_ACCESS_FLAG_SECTION:
            return FaultType::AccessFlagFaultSection;
        case FS_TRANSLATION_SECTION:
            return FaultType::TranslationFaultSection;
        case FS_ACCESS_FLAG_PAGE:
            return FaultType::AccessFlagFaultPage;
        case FS_TRANSLATION_PAGE:
            return FaultType::TranslationFaultPage;
        case FS_DOMAIN_SECTION:
            return FaultType::DomainFaultSection;
        case FS_DOMAIN_PAGE:
            return FaultType::DomainFaultPage;
        case FS_EXTERNAL_ABORT_WALK:
            return FaultType::ExternalAbortOnWalk;
        case FS_PERMISSION_SECTION:
            return FaultType::PermissionFaultSection;
        case FS_PERMISSION_PAGE:
            return FaultType::PermissionFaultPage;
        default:
            return FaultType::Unknown;
    }
}

/**
 * @brief Decode the fault status field of a faulting PAR value
 * @param par Raw PAR value with bit 0 set
 * @return Fault type, Unknown for encodings not produced by a stage-1 walk
 */
inline FaultType faultTypeFromPar(uint32_t par) {
    return faultTypeFromStatus(par >> PAR_FS_SHIFT);
}

/// @brief Reassemble FS[4:0] from its split DFSR/IFSR encoding
inline uint32_t faultStatusFromFsr(uint32_t fsr) {
    return (fsr & FSR_FS_LOW_MASK) | ((fsr & FSR_FS4) != 0 ? 0x10 : 0);
}

/// @brief Decode the fault status of a DFSR or IFSR value
inline FaultType faultTypeFromFsr(uint32_t fsr) {
    return faultTypeFromStatus(faultStatusFromFsr(fsr));
}

///@{
/// @name VMSAv7 short-descriptor geometry

/// @brief Entries in a first-level translation table (4GB / 1MB)
constexpr size_t TRANSLATION_TABLE_SIZE = 4096;

/// @brief Entries in a second-level page table (1MB / 4KB)
constexpr size_t PAGE_TABLE_SIZE = 256;

/// @brief Required alignment of a first-level table in bytes
constexpr uint32_t TRANSLATION_TABLE_ALIGNMENT = 0x4000;

/// @brief Required alignment of a second-level table in bytes
constexpr uint32_t PAGE_TABLE_ALIGNMENT = 0x400;

constexpr uint32_t SMALL_PAGE_SIZE = 0x1000;
constexpr uint32_t LARGE_PAGE_SIZE = 0x10000;
constexpr uint32_t SECTION_SIZE = 0x100000;
constexpr uint32_t SUPERSECTION_SIZE = 0x1000000;

/// @brief Consecutive first-level entries that make up one supersection
constexpr size_t SUPERSECTION_ENTRY_COUNT = SUPERSECTION_SIZE / SECTION_SIZE;

constexpr uint32_t TRANSLATION_TABLE_ALIGN_MASK = TRANSLATION_TABLE_ALIGNMENT - 1;
constexpr uint32_t PAGE_TABLE_ALIGN_MASK = PAGE_TABLE_ALIGNMENT - 1;
constexpr uint32_t SMALL_PAGE_MASK = SMALL_PAGE_SIZE - 1;
constexpr uint32_t LARGE_PAGE_MASK = LARGE_PAGE_SIZE - 1;
constexpr uint32_t SECTION_MASK = SECTION_SIZE - 1;
constexpr uint32_t SUPERSECTION_MASK = SUPERSECTION_SIZE - 1;

///@}

///@{
/// @name System control register bits

/// @brief SCTLR.M: MMU enable
constexpr uint32_t SCTLR_MMU = 1u << 0;
/// @brief SCTLR.C: data cache enable
constexpr uint32_t SCTLR_CACHE = 1u << 2;
/// @brief SCTLR.I: instruction cache enable
constexpr uint32_t SCTLR_INSTRUCTION_CACHE = 1u << 12;
/// @brief SCTLR.V: high exception vectors
constexpr uint32_t SCTLR_VECTOR = 1u << 13;
/// @brief SCTLR.AFE: access flag enable
constexpr uint32_t SCTLR_ACCESS_FLAG = 1u << 29;

/// @brief CPSR.I: IRQ mask
constexpr uint32_t CPSR_IRQ_MASK = 1u << 7;

/// @brief Exception vector base when SCTLR.V is set
constexpr uint32_t HIGH_VECTOR_BASE = 0xFFFF0000;

///@}

} // namespace armv7

#endif // ARMV7_TYPES_H
