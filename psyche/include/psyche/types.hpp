#pragma once
// Core types: the atoms of a character
//
// Every record is keyed by a CharacterId. Time is block time.
// Failure is a reverted call, never a partial one.

#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace psyche {

// Opaque identifier naming one simulated actor
using CharacterId = uint64_t;

// Caller identity supplied by the execution environment
using Address = uint64_t;

// Block time in seconds
using Timestamp = uint64_t;

// 256-bit digest (SHA-256 output, block hashes, prevrandao)
using Digest = std::array<uint8_t, 32>;

// Precondition violations. Each one reverts the whole operation.
enum class ErrorCode {
    AlreadyInitialized,
    NotInitialized,
    AlreadyEntangled,
    AlreadyCollapsed,
    InvalidAwarenessLevel,
    InvalidPriority,
    InvalidMutationRate,
    CooldownNotElapsed,
    SelfEntanglement,
    ArithmeticOverflow,
};

inline const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::AlreadyInitialized: return "AlreadyInitialized";
        case ErrorCode::NotInitialized: return "NotInitialized";
        case ErrorCode::AlreadyEntangled: return "AlreadyEntangled";
        case ErrorCode::AlreadyCollapsed: return "AlreadyCollapsed";
        case ErrorCode::InvalidAwarenessLevel: return "InvalidAwarenessLevel";
        case ErrorCode::InvalidPriority: return "InvalidPriority";
        case ErrorCode::InvalidMutationRate: return "InvalidMutationRate";
        case ErrorCode::CooldownNotElapsed: return "CooldownNotElapsed";
        case ErrorCode::SelfEntanglement: return "SelfEntanglement";
        case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
    }
    return "Unknown";
}

// Raised by every public mutating operation whose preconditions fail
class ContractError : public std::runtime_error {
public:
    ContractError(ErrorCode code, CharacterId character)
        : std::runtime_error(std::string(error_name(code)) +
                             " (character " + std::to_string(character) + ")")
        , code_(code)
        , character_(character) {}

    ErrorCode code() const { return code_; }
    CharacterId character() const { return character_; }

private:
    ErrorCode code_;
    CharacterId character_;
};

// Checked unsigned addition: reverts instead of wrapping
inline uint64_t checked_add(uint64_t a, uint64_t b, CharacterId character) {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
        throw ContractError(ErrorCode::ArithmeticOverflow, character);
    }
    return a + b;
}

} // namespace psyche
