#pragma once

#include "common/config.h"
#include "cpi/call.h"
#include "runtime/context.h"
#include "runtime/schema.h"
#include "runtime/validator.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace keel {
namespace runtime {

/// Instruction handler; a failed Result becomes the call's status
using Handler = std::function<Result<bool>(Context &)>;

/**
 * @brief A program: its spec, its handlers and the invocation pipeline
 *
 * Per call: decode, dispatch, bind, decode arguments, validate, create init
 * accounts, run the handler, close accounts marked for closing. The first
 * failure stops the pipeline and becomes the returned status.
 *
 * Example:
 * @code
 * static runtime::Program &instance() {
 *   static runtime::Program program(build_spec());
 *   return program;
 * }
 * uint64_t status = instance().entrypoint(input, length, host);
 * @endcode
 */
class Program {
public:
  explicit Program(ProgramSpec spec,
                   RuntimeConfig config = RuntimeConfigManager::create_default());

  /// Register the handler of a declared instruction
  /// @throws std::invalid_argument for an undeclared instruction name
  Program &on(const std::string &instruction, Handler handler);

  /// Observe every constraint check (tests use this to see short-circuiting)
  void set_check_observer(CheckObserver observer) { observer_ = std::move(observer); }

  /// Run one call; returns 0 or the status of the first failure
  uint64_t entrypoint(uint8_t *input, uint64_t length, cpi::CallHost *host = nullptr) const;

  /// Same pipeline with the structured error kept
  Result<bool> process(uint8_t *input, uint64_t length, cpi::CallHost *host) const;

  /// Entrypoint bound to this program, for registration with a host
  cpi::Entrypoint as_entrypoint() const;

  const ProgramSpec &spec() const { return spec_; }
  const RuntimeConfig &config() const { return config_; }

private:
  struct Located {
    const InstructionSpec *instruction = nullptr;
    BoundAccounts accounts;
    std::vector<AccountView> remaining;
    const uint8_t *data = nullptr;
    uint64_t data_len = 0;
    const uint8_t *program_id = nullptr;
  };

  Result<Located> locate_fast(uint8_t *input) const;
  Result<Located> locate_generic(uint8_t *input, uint64_t length) const;
  Result<bool> create_init_accounts(const InstructionSpec &instruction, Context &ctx) const;
  Result<bool> close_accounts(const InstructionSpec &instruction, Context &ctx) const;

  ProgramSpec spec_;
  RuntimeConfig config_;
  std::unordered_map<std::string, Handler> handlers_;
  CheckObserver observer_;
};

} // namespace runtime
} // namespace keel
