#pragma once

#include "crypto/pda.h"
#include "runtime/program.h"

namespace keel {
namespace examples {
namespace counter {

/**
 * @brief Counter stored in a program derived account
 *
 * The counter lives at PDA ["counter", authority] and only its authority
 * may change or close it.
 *
 * Instructions:
 *   initialize { bump: u8 }        payer, authority, counter (init), system_program
 *   increment                      authority, counter
 *   set_count  { value: u64 }      authority, counter
 *   action     { action: enum }    authority, counter
 *   close                          authority, counter, destination
 */
enum class CounterError : uint32_t {
  COUNTER_OVERFLOW = 1,
  COUNTER_UNDERFLOW = 2,
  MAX_COUNT_EXCEEDED = 3
};

/// Largest value set_count and action::set accept
constexpr uint64_t MAX_COUNT = 1000000;

const common::PublicKey &program_id();
const runtime::Program &program();

/// Account layout "Counter": { count: u64, authority: pubkey, bump: u8 }
const runtime::DataLayout &counter_layout();

/// Argument layouts, for building instruction data
const runtime::DataLayout &initialize_args();
const runtime::DataLayout &set_count_args();
const runtime::DataLayout &action_args();

/// Tags of the action union, in declaration order
enum class Action : uint8_t { INCREMENT = 0, DECREMENT = 1, SET = 2, RESET = 3 };

/// Counter address of an authority, with its bump
std::optional<crypto::ProgramAddress> counter_address(const common::PublicKey &authority);

uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host);

} // namespace counter
} // namespace examples
} // namespace keel
