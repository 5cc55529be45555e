#pragma once

#include "crypto/pda.h"
#include "runtime/args.h"
#include "runtime/binder.h"
#include "runtime/schema.h"
#include <functional>
#include <string>
#include <vector>

namespace keel {
namespace runtime {

/// Called with the account name and check kind just before each check runs
using CheckObserver = std::function<void(const std::string &account, ConstraintKind kind)>;

/**
 * @brief Evaluates the declared constraints of bound accounts
 *
 * Accounts are checked in declaration order. Per account the order is fixed
 * and stops at the first failure:
 *   signer, writable, owner, address, discriminator, has_one, seeds
 *
 * Accounts created by init skip owner, discriminator and has_one since
 * their data does not exist yet.
 */
class Validator {
public:
  Validator(const PublicKey &program_id, const ArgValues &args)
      : program_id_(program_id), args_(args) {}

  void set_observer(CheckObserver observer) { observer_ = std::move(observer); }

  /// Validate every bound account; ok() only when all checks pass
  Result<bool> validate(const std::vector<AccountDescriptor> &descriptors,
                        const BoundAccounts &accounts) const;

  /**
   * @brief Validate one position
   *
   * Positions before `position` count as already bound for has_one.
   */
  Result<bool> validate_account(size_t position, const std::vector<AccountDescriptor> &descriptors,
                                const BoundAccounts &accounts) const;

private:
  void observe(const std::string &account, ConstraintKind kind) const {
    if (observer_) {
      observer_(account, kind);
    }
  }

  const PublicKey &program_id_;
  const ArgValues &args_;
  CheckObserver observer_;
};

/**
 * @brief Materialize a descriptor's seed list, bump appended
 *
 * Fails with ConstraintViolation{seeds} when a referenced account, field or
 * bump argument cannot be read.
 */
Result<crypto::SeedList> resolve_seeds(const AccountDescriptor &descriptor,
                                       const AccountView &view,
                                       const std::vector<AccountDescriptor> &descriptors,
                                       const BoundAccounts &accounts, const ArgValues &args);

} // namespace runtime
} // namespace keel
