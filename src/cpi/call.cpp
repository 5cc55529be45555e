#include "cpi/call.h"
#include "common/logging.h"

namespace keel {
namespace cpi {

CallDescriptor build_call(const PublicKey &program_id, std::vector<AccountMeta> accounts,
                          std::vector<uint8_t> data) {
  CallDescriptor call;
  call.program_id = program_id;
  call.accounts = std::move(accounts);
  call.data = std::move(data);
  return call;
}

Result<bool> invoke(CallHost *host, const PublicKey &caller, const CallDescriptor &call,
                    const std::vector<AccountView> &views) {
  return invoke_signed(host, caller, call, views, {});
}

Result<bool> invoke_signed(CallHost *host, const PublicKey &caller, const CallDescriptor &call,
                           const std::vector<AccountView> &views,
                           const std::vector<crypto::SeedList> &signer_seeds) {
  if (host == nullptr) {
    LOG_ERROR("cpi", "Cross-program call to ", to_hex(call.program_id), " without a host");
    return Result<bool>(Error::invoke_failed("no call host available"));
  }

  LOG_DEBUG("cpi", "Invoking ", to_hex(call.program_id), " with ", call.accounts.size(),
            " accounts, ", call.data.size(), " data bytes, ", signer_seeds.size(),
            " signer seed lists");

  auto result = host->invoke_signed(caller, call, views, signer_seeds);
  if (result.is_ok()) {
    return result;
  }

  const Error &error = result.error();
  if (error.code == ErrorCode::CALL_DEPTH_EXCEEDED || error.code == ErrorCode::INVOKE_FAILED) {
    return result;
  }
  return Result<bool>(Error::invoke_failed("call to " + to_hex(call.program_id) +
                                           " failed: " + error.to_string()));
}

} // namespace cpi
} // namespace keel
