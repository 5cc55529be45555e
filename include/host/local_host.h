#pragma once

#include "common/config.h"
#include "cpi/call.h"
#include "host/buffer_builder.h"
#include <optional>
#include <unordered_map>
#include <vector>

namespace keel {
namespace host {

/**
 * @brief One active program on the host's call stack
 *
 * `original` is the account set as serialized for the program and is used
 * for lamport conservation. `baseline` moves forward whenever account state
 * crosses a nested call boundary, so ownership rules are always judged
 * against the last state the program itself was handed.
 */
struct CallFrame {
  PublicKey program_id{};
  std::vector<PublicKey> keys;
  std::vector<bool> writable;
  std::vector<AccountState> original;
  std::vector<AccountState> baseline;

  int index_of(const PublicKey &key) const;
};

/**
 * @brief Bounded stack of active program invocations
 */
class CallStack {
public:
  explicit CallStack(size_t max_depth) : max_depth_(max_depth) {}

  /// Push a frame; false when the stack is already at its limit
  bool push_frame(CallFrame frame);
  void pop_frame();

  CallFrame &top() { return frames_.back(); }
  bool empty() const { return frames_.empty(); }

  size_t depth() const { return frames_.size(); }
  size_t max_depth() const { return max_depth_; }
  bool is_max_depth_exceeded() const { return frames_.size() >= max_depth_; }

  /// True if the program already has a frame (reentrancy)
  bool contains(const PublicKey &program_id) const;

private:
  std::vector<CallFrame> frames_;
  size_t max_depth_;
};

/**
 * @brief In-process execution environment for programs
 *
 * Holds accounts and registered programs, serializes the loader input for
 * each call and commits the results back. A top-level instruction is
 * atomic: when it fails every account is restored. Nested calls are checked
 * the way the runtime checks them: privileges may not escalate, derived
 * signers must be proven by seeds of the calling program, lamports are
 * conserved, only an account's owner may debit it or change its data or
 * owner, and read-only accounts stay untouched.
 */
class LocalHost : public cpi::CallHost {
public:
  explicit LocalHost(RuntimeConfig config = RuntimeConfigManager::create_default());

  void set_account(const PublicKey &key, AccountState state);
  const AccountState *get_account(const PublicKey &key) const;
  Lamports lamports(const PublicKey &key) const;

  /// Register a program; it also becomes an executable account
  void register_program(const PublicKey &program_id, cpi::Entrypoint entrypoint);

  /**
   * @brief Run a top-level instruction
   *
   * The account metas carry the transaction's signer and writable flags.
   * @return 0 on success, otherwise the failing status
   */
  uint64_t process_instruction(const cpi::CallDescriptor &instruction);

  Result<bool> invoke_signed(const PublicKey &caller, const cpi::CallDescriptor &call,
                             const std::vector<runtime::AccountView> &views,
                             const std::vector<crypto::SeedList> &signer_seeds) override;

  size_t depth() const { return stack_.depth(); }

  /// Non-zero status of the last top-level program that failed
  uint64_t last_program_status() const { return last_program_status_; }

  /// Loader that owns registered program accounts
  static const PublicKey &loader_id();

private:
  Result<bool> execute(const cpi::CallDescriptor &call);
  AccountState load(const PublicKey &key) const;

  RuntimeConfig config_;
  std::unordered_map<PublicKey, AccountState, PublicKeyHash> accounts_;
  std::unordered_map<PublicKey, cpi::Entrypoint, PublicKeyHash> programs_;
  CallStack stack_;
  uint64_t last_program_status_ = 0;
};

} // namespace host
} // namespace keel
