#pragma once

#include "cpi/call.h"
#include "runtime/args.h"
#include "runtime/binder.h"
#include "runtime/schema.h"
#include <string>
#include <vector>

namespace keel {
namespace runtime {

/**
 * @brief Everything a handler sees for one invocation
 *
 * Views are addressable by descriptor name or position. The context lives
 * only for the duration of the handler call.
 */
class Context {
public:
  Context(const PublicKey &program_id, const InstructionSpec &instruction,
          BoundAccounts accounts, ArgValues args, std::vector<AccountView> remaining,
          cpi::CallHost *host);

  const PublicKey &program_id() const { return program_id_; }
  const InstructionSpec &instruction() const { return instruction_; }

  /// View of a declared account
  /// @throws std::out_of_range for a name the instruction does not declare
  AccountView &account(const std::string &name);
  AccountView &account(size_t index) { return accounts_[index]; }
  size_t account_count() const { return accounts_.size(); }
  const BoundAccounts &accounts() const { return accounts_; }

  /// Accounts passed beyond the declared ones
  const std::vector<AccountView> &remaining_accounts() const { return remaining_; }

  const ArgValues &args() const { return args_; }

  /// Typed field access through the account's declared layout
  /// @throws std::out_of_range when the account declares no layout
  LayoutAccessor fields(const std::string &name);

  template <typename T>
  T *data_as(const std::string &name) {
    return account(name).data_as<T>();
  }

  /// Seed list (bump included) proving authority over a derived account
  Result<crypto::SeedList> signer_seeds(const std::string &name) const;

  cpi::CallHost *host() const { return host_; }

  Result<bool> invoke(const cpi::CallDescriptor &call, const std::vector<AccountView> &views);
  Result<bool> invoke_signed(const cpi::CallDescriptor &call,
                             const std::vector<AccountView> &views,
                             const std::vector<crypto::SeedList> &signer_seeds);

private:
  const PublicKey &program_id_;
  const InstructionSpec &instruction_;
  BoundAccounts accounts_;
  ArgValues args_;
  std::vector<AccountView> remaining_;
  cpi::CallHost *host_;
};

} // namespace runtime
} // namespace keel
