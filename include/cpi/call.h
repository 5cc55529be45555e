#pragma once

#include "common/types.h"
#include "crypto/pda.h"
#include "runtime/account_view.h"
#include <functional>
#include <vector>

namespace keel {
namespace cpi {

using namespace keel::common;
using runtime::AccountView;

/// One account of an outbound call, in the callee's positional order
struct AccountMeta {
  PublicKey key{};
  bool is_signer = false;
  bool is_writable = false;

  static AccountMeta writable(const PublicKey &key, bool is_signer = false) {
    return AccountMeta{key, is_signer, true};
  }
  static AccountMeta readonly(const PublicKey &key, bool is_signer = false) {
    return AccountMeta{key, is_signer, false};
  }
};

/// Target program, ordered accounts and raw instruction payload
struct CallDescriptor {
  PublicKey program_id{};
  std::vector<AccountMeta> accounts;
  std::vector<uint8_t> data;
};

/// Build a call; account order is kept exactly as given
CallDescriptor build_call(const PublicKey &program_id, std::vector<AccountMeta> accounts,
                          std::vector<uint8_t> data);

/**
 * @brief Execution environment that runs nested program calls
 *
 * Implementations run the callee synchronously on the caller's stack, check
 * that every signer/writable privilege requested by the call is held by the
 * caller (or, for derived addresses, proven by a seed list), and write the
 * callee's account changes back through the caller's views.
 */
class CallHost {
public:
  virtual ~CallHost() = default;

  /**
   * @param caller Program issuing the call (seed lists derive under it)
   * @param call What to run
   * @param views Caller's views of every account the call names
   * @param signer_seeds Seed lists (bump included) of derived signers
   */
  virtual Result<bool> invoke_signed(const PublicKey &caller, const CallDescriptor &call,
                                     const std::vector<AccountView> &views,
                                     const std::vector<crypto::SeedList> &signer_seeds) = 0;
};

/// Program entry: serialized input in, status out (0 on success)
using Entrypoint = std::function<uint64_t(uint8_t *input, uint64_t length, CallHost *host)>;

/**
 * @brief Run a call through the host
 *
 * Errors other than CallDepthExceeded come back as InvokeFailed.
 */
Result<bool> invoke(CallHost *host, const PublicKey &caller, const CallDescriptor &call,
                    const std::vector<AccountView> &views);

Result<bool> invoke_signed(CallHost *host, const PublicKey &caller, const CallDescriptor &call,
                           const std::vector<AccountView> &views,
                           const std::vector<crypto::SeedList> &signer_seeds);

} // namespace cpi
} // namespace keel
