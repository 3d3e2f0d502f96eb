#pragma once

#include <turnstile/schema/primitives.hpp>

#include <cstdint>

namespace turnstile::svm {

// TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA
inline constexpr auto kTokenProgram = schema::address_t{
    0x06, 0xdd, 0xf6, 0xe1, 0xd7, 0x65, 0xa1, 0x93,
    0xd9, 0xcb, 0xe1, 0x46, 0xce, 0xeb, 0x79, 0xac,
    0x1c, 0xb4, 0x85, 0xed, 0x5f, 0x5b, 0x37, 0x91,
    0x3a, 0x8c, 0xf5, 0x85, 0x7e, 0xff, 0x00, 0xa9,
};

// TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb
inline constexpr auto kToken2022Program = schema::address_t{
    0x06, 0xdd, 0xf6, 0xe1, 0xee, 0x75, 0x8f, 0xde,
    0x18, 0x42, 0x5d, 0xbc, 0xe4, 0x6c, 0xcd, 0xda,
    0xb6, 0x1a, 0xfc, 0x4d, 0x83, 0xb9, 0x0d, 0x27,
    0xfe, 0xbd, 0xf9, 0x28, 0xd8, 0xa1, 0x8b, 0xfc,
};

// ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL
inline constexpr auto kAssociatedTokenProgram = schema::address_t{
    0x8c, 0x97, 0x25, 0x8f, 0x4e, 0x24, 0x89, 0xf1,
    0xbb, 0x3d, 0x10, 0x29, 0x14, 0x8e, 0x0d, 0x83,
    0x0b, 0x5a, 0x13, 0x99, 0xda, 0xff, 0x10, 0x84,
    0x04, 0x8e, 0x7b, 0xd8, 0xdb, 0xe9, 0xf8, 0x59,
};

// ComputeBudget111111111111111111111111111111
inline constexpr auto kComputeBudgetProgram = schema::address_t{
    0x03, 0x06, 0x46, 0x6f, 0xe5, 0x21, 0x17, 0x32,
    0xff, 0xec, 0xad, 0xba, 0x72, 0xc3, 0x9b, 0xe7,
    0xbc, 0x8c, 0xe5, 0xbb, 0xc5, 0xf7, 0x12, 0x6b,
    0x2c, 0x43, 0x9b, 0x3a, 0x40, 0x00, 0x00, 0x00,
};

// Compute budget instruction discriminators.
inline constexpr uint8_t kSetComputeUnitLimit = 2;
inline constexpr uint8_t kSetComputeUnitPrice = 3;

// Token program instruction discriminator.
inline constexpr uint8_t kTransferChecked = 12;

// Associated token account program: create (0) and create-idempotent (1).
inline constexpr uint8_t kCreateAssociatedAccount = 0;
inline constexpr uint8_t kCreateAssociatedAccountIdempotent = 1;

inline constexpr bool is_token_program(const schema::address_t& program) {
  return program == kTokenProgram || program == kToken2022Program;
}

}  // namespace turnstile::svm
