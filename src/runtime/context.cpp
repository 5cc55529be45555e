#include "runtime/context.h"
#include "runtime/validator.h"

#include <stdexcept>

namespace keel {
namespace runtime {

Context::Context(const PublicKey &program_id, const InstructionSpec &instruction,
                 BoundAccounts accounts, ArgValues args, std::vector<AccountView> remaining,
                 cpi::CallHost *host)
    : program_id_(program_id), instruction_(instruction), accounts_(accounts),
      args_(std::move(args)), remaining_(std::move(remaining)), host_(host) {}

AccountView &Context::account(const std::string &name) {
  int index = instruction_.account_index(name);
  if (index < 0) {
    throw std::out_of_range("instruction " + instruction_.name + " has no account " + name);
  }
  return accounts_[static_cast<size_t>(index)];
}

LayoutAccessor Context::fields(const std::string &name) {
  const AccountDescriptor *descriptor = instruction_.find_account(name);
  if (descriptor == nullptr || !descriptor->layout) {
    throw std::out_of_range("account " + name + " declares no data layout");
  }
  AccountView &view = account(name);
  return LayoutAccessor(*descriptor->layout, view.data(), static_cast<size_t>(view.data_len()));
}

Result<crypto::SeedList> Context::signer_seeds(const std::string &name) const {
  int index = instruction_.account_index(name);
  if (index < 0 || !instruction_.accounts[static_cast<size_t>(index)].constraints.seeds) {
    return Result<crypto::SeedList>(
        Error::invalid_input("account " + name + " is not a derived account"));
  }
  return resolve_seeds(instruction_.accounts[static_cast<size_t>(index)],
                       accounts_[static_cast<size_t>(index)], instruction_.accounts, accounts_,
                       args_);
}

Result<bool> Context::invoke(const cpi::CallDescriptor &call,
                             const std::vector<AccountView> &views) {
  return cpi::invoke(host_, program_id_, call, views);
}

Result<bool> Context::invoke_signed(const cpi::CallDescriptor &call,
                                    const std::vector<AccountView> &views,
                                    const std::vector<crypto::SeedList> &signer_seeds) {
  return cpi::invoke_signed(host_, program_id_, call, views, signer_seeds);
}

} // namespace runtime
} // namespace keel
