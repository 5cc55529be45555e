#include "host/local_host.h"
#include "common/base58.h"
#include "common/logging.h"
#include "cpi/system_program.h"
#include "host/system_builtin.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace keel {
namespace host {

using runtime::AccountView;

int CallFrame::index_of(const PublicKey &key) const {
  for (size_t i = 0; i < keys.size(); ++i) {
    if (keys[i] == key) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool CallStack::push_frame(CallFrame frame) {
  if (is_max_depth_exceeded()) {
    return false;
  }
  frames_.push_back(std::move(frame));
  return true;
}

void CallStack::pop_frame() {
  if (!frames_.empty()) {
    frames_.pop_back();
  }
}

bool CallStack::contains(const PublicKey &program_id) const {
  return std::any_of(frames_.begin(), frames_.end(),
                     [&](const CallFrame &frame) { return frame.program_id == program_id; });
}

namespace {

/// Pops the frame pushed for a program call on every exit path
class FrameGuard {
public:
  explicit FrameGuard(CallStack &stack) : stack_(stack) {}
  ~FrameGuard() { stack_.pop_frame(); }
  FrameGuard(const FrameGuard &) = delete;
  FrameGuard &operator=(const FrameGuard &) = delete;

private:
  CallStack &stack_;
};

Result<bool> violation(const PublicKey &program, const PublicKey &account, const char *what) {
  LOG_WARN("host", "Program ", to_hex(program), " ", what, " on account ", to_hex(account));
  return Result<bool>(Error::invoke_failed(std::string(what) + " on account " + to_hex(account)));
}

/// Ownership rules for one account across one stretch of a program's execution
Result<bool> check_account(const PublicKey &program, const PublicKey &key, bool writable,
                           const AccountState &before, const AccountState &after) {
  if (!writable && after != before) {
    return violation(program, key, "modified a read-only account");
  }
  if (after.executable != before.executable) {
    return violation(program, key, "changed the executable flag");
  }
  const bool owns = before.owner == program;
  if (after.lamports < before.lamports && !owns) {
    return violation(program, key, "debited an account it does not own");
  }
  if (after.data != before.data && !owns) {
    return violation(program, key, "modified data of an account it does not own");
  }
  if (after.owner != before.owner && !owns) {
    return violation(program, key, "reassigned an account it does not own");
  }
  return ok();
}

AccountState state_of(const AccountView &view, const AccountState &previous) {
  AccountState state;
  state.lamports = view.lamports();
  state.owner = view.owner_copy();
  state.executable = view.is_executable();
  state.data.assign(view.data(), view.data() + view.data_len());
  state.rent_epoch = previous.rent_epoch;
  return state;
}

/// Sum of lamports; nullopt when the sum does not fit in 64 bits
std::optional<Lamports> total_lamports(const std::vector<AccountState> &states) {
  Lamports total = 0;
  for (const auto &state : states) {
    if (state.lamports > std::numeric_limits<Lamports>::max() - total) {
      return std::nullopt;
    }
    total += state.lamports;
  }
  return total;
}

} // namespace

const PublicKey &LocalHost::loader_id() {
  static const PublicKey id = [] {
    auto key = pubkey_from_base58("BPFLoaderUpgradeab1e11111111111111111111111");
    if (key.is_err()) {
      throw std::logic_error("loader id does not decode: " + key.error().message);
    }
    return key.value();
  }();
  return id;
}

LocalHost::LocalHost(RuntimeConfig config)
    : config_(std::move(config)), stack_(1 + config_.max_cpi_depth) {
  register_program(cpi::system_program::id(), system_program_entrypoint);
}

void LocalHost::set_account(const PublicKey &key, AccountState state) {
  accounts_[key] = std::move(state);
}

const AccountState *LocalHost::get_account(const PublicKey &key) const {
  auto it = accounts_.find(key);
  return it == accounts_.end() ? nullptr : &it->second;
}

Lamports LocalHost::lamports(const PublicKey &key) const {
  const AccountState *state = get_account(key);
  return state ? state->lamports : 0;
}

void LocalHost::register_program(const PublicKey &program_id, cpi::Entrypoint entrypoint) {
  programs_[program_id] = std::move(entrypoint);

  AccountState account;
  account.executable = true;
  account.owner = loader_id();
  account.lamports = 1;
  accounts_[program_id] = std::move(account);
}

AccountState LocalHost::load(const PublicKey &key) const {
  auto it = accounts_.find(key);
  if (it != accounts_.end()) {
    return it->second;
  }
  // Unknown keys look like empty system accounts
  AccountState empty;
  empty.owner = cpi::system_program::id();
  return empty;
}

uint64_t LocalHost::process_instruction(const cpi::CallDescriptor &instruction) {
  if (!stack_.empty()) {
    throw std::logic_error("process_instruction called while a program is running");
  }

  auto snapshot = accounts_;
  last_program_status_ = 0;

  auto result = execute(instruction);
  if (result.is_ok()) {
    return 0;
  }

  accounts_ = std::move(snapshot);
  const Error &error = result.error();
  if (error.code == ErrorCode::INVOKE_FAILED && last_program_status_ != 0) {
    LOG_INFO("host", "Instruction failed: ", error.message);
    return last_program_status_;
  }
  LOG_INFO("host", "Instruction rejected: ", error.to_string());
  return to_status(error);
}

Result<bool> LocalHost::execute(const cpi::CallDescriptor &call) {
  auto program = programs_.find(call.program_id);
  if (program == programs_.end()) {
    LOG_WARN("host", "Call to unknown program ", to_hex(call.program_id));
    return Result<bool>(Error::invoke_failed("unknown program " + to_hex(call.program_id)));
  }

  InputBuilder builder;
  CallFrame frame;
  frame.program_id = call.program_id;
  for (const auto &meta : call.accounts) {
    AccountState state = load(meta.key);
    builder.add_account(meta.key, state, meta.is_signer, meta.is_writable);

    int index = frame.index_of(meta.key);
    if (index < 0) {
      frame.keys.push_back(meta.key);
      frame.writable.push_back(meta.is_writable);
      frame.original.push_back(state);
    } else if (meta.is_writable) {
      frame.writable[static_cast<size_t>(index)] = true;
    }
  }
  frame.baseline = frame.original;
  builder.set_instruction_data(call.data).set_program_id(call.program_id);
  SerializedInput input = builder.build();

  if (!stack_.push_frame(std::move(frame))) {
    LOG_WARN("host", "Call depth limit of ", stack_.max_depth(), " reached calling ",
             to_hex(call.program_id));
    return Result<bool>(Error::call_depth_exceeded("call depth limit reached"));
  }
  FrameGuard guard(stack_);

  LOG_DEBUG("host", "Executing ", to_hex(call.program_id), " at depth ", stack_.depth());
  uint64_t status = program->second(input.bytes.data(), input.bytes.size(), this);
  if (status != 0) {
    if (stack_.depth() == 1) {
      last_program_status_ = status;
    }
    if (status == to_status(Error::call_depth_exceeded(""))) {
      return Result<bool>(Error::call_depth_exceeded("nested call exceeded the depth limit"));
    }
    return Result<bool>(Error::invoke_failed("program " + to_hex(call.program_id) +
                                             " returned status " + std::to_string(status)));
  }

  const CallFrame &done = stack_.top();
  std::vector<AccountState> after;
  after.reserve(done.keys.size());
  for (size_t i = 0; i < done.keys.size(); ++i) {
    auto state = input.read_account(i);
    if (state.is_err()) {
      return Result<bool>(Error::invoke_failed(state.error().message));
    }
    auto checked = check_account(call.program_id, done.keys[i], done.writable[i], done.baseline[i],
                                 state.value());
    if (checked.is_err()) {
      return checked;
    }
    after.push_back(std::move(state).value());
  }

  auto total_after = total_lamports(after);
  auto total_before = total_lamports(done.original);
  if (!total_after || !total_before || *total_after != *total_before) {
    LOG_WARN("host", "Program ", to_hex(call.program_id), " did not conserve lamports");
    return Result<bool>(Error::invoke_failed("sum of lamports changed"));
  }

  for (size_t i = 0; i < done.keys.size(); ++i) {
    accounts_[done.keys[i]] = std::move(after[i]);
  }
  return ok();
}

Result<bool> LocalHost::invoke_signed(const PublicKey &caller, const cpi::CallDescriptor &call,
                                      const std::vector<AccountView> &views,
                                      const std::vector<crypto::SeedList> &signer_seeds) {
  if (stack_.empty() || stack_.top().program_id != caller) {
    return Result<bool>(Error::invoke_failed("caller is not the running program"));
  }
  if (stack_.contains(call.program_id) && call.program_id != caller) {
    LOG_WARN("host", "Reentrant call into ", to_hex(call.program_id));
    return Result<bool>(Error::invoke_failed("reentrancy is not allowed"));
  }

  std::unordered_set<PublicKey, PublicKeyHash> derived_signers;
  for (const auto &seeds : signer_seeds) {
    auto address = crypto::create_program_address(seeds, caller);
    if (!address) {
      return Result<bool>(Error::invoke_failed("signer seeds do not derive an address"));
    }
    derived_signers.insert(*address);
  }

  // Privileges requested by the call must be held by the caller
  std::vector<const AccountView *> passed;
  for (const auto &meta : call.accounts) {
    const AccountView *view = nullptr;
    for (const auto &candidate : views) {
      if (candidate.key_is(meta.key)) {
        view = &candidate;
        break;
      }
    }
    if (view == nullptr) {
      return Result<bool>(
          Error::invoke_failed("account " + to_hex(meta.key) + " was not passed to the call"));
    }
    if (meta.is_writable && !view->is_writable()) {
      return violation(caller, meta.key, "escalated writable privilege");
    }
    if (meta.is_signer && !view->is_signer() && derived_signers.count(meta.key) == 0) {
      return violation(caller, meta.key, "escalated signer privilege");
    }
    passed.push_back(view);
  }

  // Caller's changes so far become visible to the callee
  CallFrame &frame = stack_.top();
  for (const AccountView *view : passed) {
    int index = frame.index_of(view->key_copy());
    if (index < 0) {
      return Result<bool>(Error::invoke_failed("account is not part of the caller's input"));
    }
    size_t i = static_cast<size_t>(index);
    AccountState current = state_of(*view, frame.baseline[i]);
    auto checked = check_account(caller, frame.keys[i], frame.writable[i], frame.baseline[i],
                                 current);
    if (checked.is_err()) {
      return checked;
    }
    accounts_[frame.keys[i]] = current;
    frame.baseline[i] = std::move(current);
  }

  auto result = execute(call);
  if (result.is_err()) {
    return result;
  }

  // Callee's changes flow back into the caller's buffer
  CallFrame &caller_frame = stack_.top();
  for (const AccountView *view : passed) {
    size_t i = static_cast<size_t>(caller_frame.index_of(view->key_copy()));
    const AccountState &updated = accounts_[caller_frame.keys[i]];
    AccountView target = *view;
    if (updated.data.size() != target.data_len()) {
      auto resized = target.resize(updated.data.size());
      if (resized.is_err()) {
        return Result<bool>(Error::invoke_failed("callee grew an account past the caller's region"));
      }
    }
    if (!updated.data.empty()) {
      std::memcpy(target.data(), updated.data.data(), updated.data.size());
    }
    target.set_lamports(updated.lamports);
    target.assign(updated.owner);
    caller_frame.baseline[i] = updated;
  }
  return ok();
}

} // namespace host
} // namespace keel
