#include "counter/counter.h"
#include "cpi/account_ops.h"
#include "cpi/system_program.h"
#include "cpi/token_program.h"
#include "host/local_host.h"
#include "lamport_transfer/lamport_transfer.h"
#include "pubkey_check/pubkey_check.h"
#include "test_framework.h"
#include "test_helpers.h"
#include "token_ledger/token_ledger.h"
#include "token_relay/token_relay.h"

using namespace keel;
using namespace keel::runtime;
using namespace test_helpers;
using cpi::AccountMeta;
using host::InputBuilder;
using host::LocalHost;
using host::SerializedInput;

namespace ex = keel::examples;

namespace {

const Lamports ONE_SOL = 1000000000;

uint64_t run_direct(uint64_t (*entrypoint)(uint8_t *, uint64_t, cpi::CallHost *),
                    SerializedInput &input) {
  return entrypoint(input.bytes.data(), input.bytes.size(), nullptr);
}

std::vector<uint8_t> instruction(const std::string &name, const DataLayout &layout,
                                 const ArgValues &values) {
  auto data = encode_instruction(name, layout, values);
  if (data.is_err()) {
    throw std::runtime_error(data.error().to_string());
  }
  return data.value();
}

uint64_t stored_count(const LocalHost &host, const PublicKey &counter) {
  const host::AccountState *state = host.get_account(counter);
  if (state == nullptr) {
    throw std::runtime_error("counter account missing");
  }
  std::vector<uint8_t> data = state->data;
  LayoutAccessor fields(ex::counter::counter_layout(), data.data(), data.size());
  return fields.get_unsigned("count").value();
}

uint64_t token_amount(const LocalHost &host, const PublicKey &account) {
  std::vector<uint8_t> data = host.get_account(account)->data;
  LayoutAccessor fields(ex::token_ledger::token_account_layout(), data.data(), data.size());
  return fields.get_unsigned("amount").value();
}

/// Host with the counter program and a funded payer and authority
struct CounterFixture {
  LocalHost host;
  PublicKey payer = wallet_key();
  PublicKey authority = wallet_key();
  crypto::ProgramAddress counter{};

  CounterFixture() {
    host.register_program(ex::counter::program_id(), ex::counter::entrypoint);
    host.set_account(payer, system_account(10 * ONE_SOL));
    host.set_account(authority, system_account(ONE_SOL));
    counter = *ex::counter::counter_address(authority);
  }

  uint64_t initialize() {
    ArgValues args;
    args.set_unsigned("bump", counter.bump);
    return host.process_instruction(cpi::build_call(
        ex::counter::program_id(),
        {AccountMeta::writable(payer, true), AccountMeta::readonly(authority, true),
         AccountMeta::writable(counter.address), AccountMeta::readonly(cpi::system_program::id())},
        instruction("initialize", ex::counter::initialize_args(), args)));
  }

  uint64_t call(const std::string &name, const DataLayout &layout, const ArgValues &args,
                const PublicKey &signer) {
    return host.process_instruction(cpi::build_call(
        ex::counter::program_id(),
        {AccountMeta::readonly(signer, true), AccountMeta::writable(counter.address)},
        instruction(name, layout, args)));
  }

  uint64_t action(ex::counter::Action tag, const ArgValues &body = ArgValues()) {
    ArgValues args;
    args.set_variant("action", static_cast<uint8_t>(tag), body);
    return call("action", ex::counter::action_args(), args, authority);
  }
};

} // namespace

void test_pubkey_check_accepts_self_owned() {
  PublicKey key = filled_key(0x11);
  SerializedInput input = InputBuilder()
                              .add_account(key, owned_account(key, 1), false, false)
                              .set_program_id(ex::pubkey_check::program_id())
                              .build();
  ASSERT_STATUS(0, run_direct(ex::pubkey_check::entrypoint, input));
}

void test_pubkey_check_rejects_other_owner() {
  PublicKey key = filled_key(0x11);
  SerializedInput input = InputBuilder()
                              .add_account(key, owned_account(filled_key(0x12), 1), false, false)
                              .set_program_id(ex::pubkey_check::program_id())
                              .build();
  ASSERT_STATUS(6000, run_direct(ex::pubkey_check::entrypoint, input));

  SerializedInput with_data =
      InputBuilder()
          .add_account(key, owned_account(key, 1, {1, 2, 3}), false, false)
          .set_program_id(ex::pubkey_check::program_id())
          .build();
  ASSERT_STATUS(3003, run_direct(ex::pubkey_check::entrypoint, with_data));
}

void test_lamport_transfer_moves_funds() {
  LocalHost host;
  host.register_program(ex::lamport_transfer::program_id(), ex::lamport_transfer::entrypoint);
  PublicKey source = filled_key(0x21);
  PublicKey destination = filled_key(0x22);
  host.set_account(source, owned_account(ex::lamport_transfer::program_id(), 1000000));

  auto transfer = [&](uint64_t amount) {
    return host.process_instruction(cpi::build_call(
        ex::lamport_transfer::program_id(),
        {AccountMeta::writable(source), AccountMeta::writable(destination)}, u64_bytes(amount)));
  };

  ASSERT_STATUS(0, transfer(500000));
  ASSERT_EQ(500000u, host.lamports(source));
  ASSERT_EQ(500000u, host.lamports(destination));

  ASSERT_STATUS(6000, transfer(2000000));
  ASSERT_EQ(500000u, host.lamports(source));
  ASSERT_EQ(500000u, host.lamports(destination));
}

void test_lamport_transfer_checks_accounts() {
  const PublicKey program_id = ex::lamport_transfer::program_id();
  PublicKey source = filled_key(0x21);
  PublicKey destination = filled_key(0x22);

  // Source owned by someone else
  SerializedInput foreign = InputBuilder()
                                .add_account(source, owned_account(filled_key(0x99), 100), false, true)
                                .add_account(destination, system_account(0), false, true)
                                .set_instruction_data(u64_bytes(10))
                                .set_program_id(program_id)
                                .build();
  ASSERT_STATUS(2004, run_direct(ex::lamport_transfer::entrypoint, foreign));

  // Destination carrying data takes the generic path and fails the size check
  SerializedInput sized = InputBuilder()
                              .add_account(source, owned_account(program_id, 100), false, true)
                              .add_account(destination, owned_account(filled_key(0x99), 0, {0, 0, 0, 0}),
                                           false, true)
                              .set_instruction_data(u64_bytes(10))
                              .set_program_id(program_id)
                              .build();
  ASSERT_STATUS(3003, run_direct(ex::lamport_transfer::entrypoint, sized));

  // Read-only destination
  SerializedInput readonly_dest = InputBuilder()
                                      .add_account(source, owned_account(program_id, 100), false, true)
                                      .add_account(destination, system_account(0), false, false)
                                      .set_instruction_data(u64_bytes(10))
                                      .set_program_id(program_id)
                                      .build();
  ASSERT_STATUS(2000, run_direct(ex::lamport_transfer::entrypoint, readonly_dest));

  // Missing destination
  SerializedInput missing = InputBuilder()
                                .add_account(source, owned_account(program_id, 100), false, true)
                                .set_instruction_data(u64_bytes(10))
                                .set_program_id(program_id)
                                .build();
  ASSERT_STATUS(3005, run_direct(ex::lamport_transfer::entrypoint, missing));
}

void test_lamport_transfer_writes_through_buffer() {
  const PublicKey program_id = ex::lamport_transfer::program_id();
  SerializedInput input = InputBuilder()
                              .add_account(filled_key(0x21), owned_account(program_id, 100), false, true)
                              .add_account(filled_key(0x22), system_account(5), false, true)
                              .set_instruction_data(u64_bytes(60))
                              .set_program_id(program_id)
                              .build();
  ASSERT_STATUS(0, run_direct(ex::lamport_transfer::entrypoint, input));
  ASSERT_EQ(40u, input.read_account(0).value().lamports);
  ASSERT_EQ(65u, input.read_account(1).value().lamports);
}

void test_counter_lifecycle() {
  CounterFixture f;
  const Lamports payer_before = f.host.lamports(f.payer);

  ASSERT_STATUS(0, f.initialize());
  const host::AccountState *created = f.host.get_account(f.counter.address);
  ASSERT_TRUE(created != nullptr);
  ASSERT_EQ(ex::counter::program_id(), created->owner);
  ASSERT_EQ(ex::counter::counter_layout().size(), created->data.size());
  const Lamports rent = cpi::rent_exempt_minimum(ex::counter::counter_layout().size());
  ASSERT_EQ(rent, created->lamports);
  ASSERT_EQ(payer_before - rent, f.host.lamports(f.payer));
  ASSERT_EQ(0u, stored_count(f.host, f.counter.address));

  ASSERT_STATUS(0, f.call("increment", DataLayout(), ArgValues(), f.authority));
  ASSERT_STATUS(0, f.call("increment", DataLayout(), ArgValues(), f.authority));
  ASSERT_EQ(2u, stored_count(f.host, f.counter.address));

  ArgValues value;
  value.set_unsigned("value", 77);
  ASSERT_STATUS(0, f.call("set_count", ex::counter::set_count_args(), value, f.authority));
  ASSERT_EQ(77u, stored_count(f.host, f.counter.address));

  // A second initialize finds the account already created
  ASSERT_NE(0u, f.initialize());
  ASSERT_EQ(77u, stored_count(f.host, f.counter.address));
}

void test_counter_limits() {
  CounterFixture f;
  ASSERT_STATUS(0, f.initialize());

  ArgValues too_big;
  too_big.set_unsigned("value", ex::counter::MAX_COUNT + 1);
  ASSERT_STATUS(6003, f.call("set_count", ex::counter::set_count_args(), too_big, f.authority));

  ArgValues at_max;
  at_max.set_unsigned("value", ex::counter::MAX_COUNT);
  ASSERT_STATUS(0, f.call("set_count", ex::counter::set_count_args(), at_max, f.authority));
  ASSERT_EQ(ex::counter::MAX_COUNT, stored_count(f.host, f.counter.address));
}

void test_counter_actions() {
  CounterFixture f;
  ASSERT_STATUS(0, f.initialize());

  ASSERT_STATUS(6002, f.action(ex::counter::Action::DECREMENT));
  ASSERT_STATUS(0, f.action(ex::counter::Action::INCREMENT));
  ASSERT_STATUS(0, f.action(ex::counter::Action::INCREMENT));
  ASSERT_STATUS(0, f.action(ex::counter::Action::DECREMENT));
  ASSERT_EQ(1u, stored_count(f.host, f.counter.address));

  ArgValues body;
  body.set_unsigned("value", 500);
  ASSERT_STATUS(0, f.action(ex::counter::Action::SET, body));
  ASSERT_EQ(500u, stored_count(f.host, f.counter.address));

  ArgValues too_big;
  too_big.set_unsigned("value", ex::counter::MAX_COUNT + 1);
  ASSERT_STATUS(6003, f.action(ex::counter::Action::SET, too_big));

  ASSERT_STATUS(0, f.action(ex::counter::Action::RESET));
  ASSERT_EQ(0u, stored_count(f.host, f.counter.address));

  // Tag past the last variant
  std::vector<uint8_t> data = tagged("action", {4});
  ASSERT_STATUS(102, f.host.process_instruction(cpi::build_call(
                         ex::counter::program_id(),
                         {AccountMeta::readonly(f.authority, true),
                          AccountMeta::writable(f.counter.address)},
                         data)));
}

void test_counter_rejects_wrong_authority() {
  CounterFixture f;
  ASSERT_STATUS(0, f.initialize());

  PublicKey intruder = wallet_key();
  ASSERT_STATUS(2001, f.call("increment", DataLayout(), ArgValues(), intruder));
  ASSERT_EQ(0u, stored_count(f.host, f.counter.address));

  // Right authority without its signature
  ASSERT_STATUS(2002, f.host.process_instruction(cpi::build_call(
                          ex::counter::program_id(),
                          {AccountMeta::readonly(f.authority, false),
                           AccountMeta::writable(f.counter.address)},
                          tagged("increment"))));

  // Counter passed read-only
  ASSERT_STATUS(2000, f.host.process_instruction(cpi::build_call(
                          ex::counter::program_id(),
                          {AccountMeta::readonly(f.authority, true),
                           AccountMeta::readonly(f.counter.address)},
                          tagged("increment"))));

  ASSERT_STATUS(101, f.host.process_instruction(cpi::build_call(
                         ex::counter::program_id(),
                         {AccountMeta::readonly(f.authority, true),
                          AccountMeta::writable(f.counter.address)},
                         tagged("decrement"))));
}

void test_counter_initialize_with_wrong_bump() {
  CounterFixture f;
  ArgValues args;
  args.set_unsigned("bump", static_cast<uint8_t>(f.counter.bump - 1));
  uint64_t status = f.host.process_instruction(cpi::build_call(
      ex::counter::program_id(),
      {AccountMeta::writable(f.payer, true), AccountMeta::readonly(f.authority, true),
       AccountMeta::writable(f.counter.address), AccountMeta::readonly(cpi::system_program::id())},
      instruction("initialize", ex::counter::initialize_args(), args)));
  ASSERT_STATUS(2006, status);
  ASSERT_TRUE(f.host.get_account(f.counter.address) == nullptr);
}

void test_counter_close() {
  CounterFixture f;
  ASSERT_STATUS(0, f.initialize());
  PublicKey destination = filled_key(0x33);
  const Lamports held = f.host.lamports(f.counter.address);

  ASSERT_STATUS(0, f.host.process_instruction(cpi::build_call(
                       ex::counter::program_id(),
                       {AccountMeta::readonly(f.authority, true),
                        AccountMeta::writable(f.counter.address), AccountMeta::writable(destination)},
                       tagged("close"))));
  ASSERT_EQ(held, f.host.lamports(destination));
  const host::AccountState *closed = f.host.get_account(f.counter.address);
  ASSERT_TRUE(closed != nullptr);
  ASSERT_EQ(0u, closed->lamports);
  ASSERT_TRUE(closed->data.empty());
  ASSERT_EQ(cpi::system_program::id(), closed->owner);
}

void test_counter_checks_stop_at_first_failure() {
  Program observed = ex::counter::program();
  std::vector<std::pair<std::string, ConstraintKind>> checks;
  observed.set_check_observer([&checks](const std::string &account, ConstraintKind kind) {
    checks.emplace_back(account, kind);
  });

  CounterFixture f;
  f.host.register_program(ex::counter::program_id(), observed.as_entrypoint());
  ASSERT_STATUS(0, f.initialize());
  checks.clear();

  ASSERT_STATUS(2001, f.call("increment", DataLayout(), ArgValues(), wallet_key()));
  ASSERT_NOT_EMPTY(checks);
  ASSERT_EQ(std::string("counter"), checks.back().first);
  ASSERT_TRUE(checks.back().second == ConstraintKind::HAS_ONE);
  for (const auto &check : checks) {
    ASSERT_TRUE(check.second != ConstraintKind::SEEDS);
  }
}

/// Host with the token ledger and relay, a mint and a vault-held source account
struct TokenFixture {
  LocalHost host;
  PublicKey mint = filled_key(0x41);
  PublicKey source = filled_key(0x42);
  PublicKey destination = filled_key(0x43);
  crypto::ProgramAddress vault{};

  TokenFixture() {
    host.register_program(cpi::token_program::id(), ex::token_ledger::entrypoint);
    host.register_program(ex::token_relay::program_id(), ex::token_relay::entrypoint);
    vault = *ex::token_relay::vault_authority();
    host.set_account(source, owned_account(cpi::token_program::id(), ONE_SOL,
                                           ex::token_ledger::token_account_data(mint, vault.address, 100)));
    host.set_account(destination,
                     owned_account(cpi::token_program::id(), ONE_SOL,
                                   ex::token_ledger::token_account_data(mint, filled_key(0x44), 0)));
  }

  uint64_t forward(uint64_t amount, uint8_t bump) {
    ArgValues args;
    args.set_unsigned("amount", amount).set_unsigned("bump", bump);
    return host.process_instruction(cpi::build_call(
        ex::token_relay::program_id(),
        {AccountMeta::readonly(vault.address), AccountMeta::writable(source),
         AccountMeta::writable(destination), AccountMeta::readonly(cpi::token_program::id())},
        instruction("forward", ex::token_relay::forward_args(), args)));
  }

  uint64_t recurse(uint8_t remaining) {
    ArgValues args;
    args.set_unsigned("remaining", remaining);
    return host.process_instruction(cpi::build_call(
        ex::token_relay::program_id(), {},
        instruction("recurse", ex::token_relay::recurse_args(), args)));
  }
};

void test_token_ledger_direct_transfer() {
  TokenFixture f;
  PublicKey holder = wallet_key();
  PublicKey held = filled_key(0x45);
  f.host.set_account(held, owned_account(cpi::token_program::id(), ONE_SOL,
                                         ex::token_ledger::token_account_data(f.mint, holder, 50)));

  ASSERT_STATUS(0, f.host.process_instruction(
                       cpi::token_program::transfer(held, f.destination, holder, 20)));
  ASSERT_EQ(30u, token_amount(f.host, held));
  ASSERT_EQ(20u, token_amount(f.host, f.destination));

  ASSERT_STATUS(6001, f.host.process_instruction(
                          cpi::token_program::transfer(held, f.destination, holder, 31)));
  ASSERT_STATUS(6004, f.host.process_instruction(
                          cpi::token_program::transfer(held, f.destination, wallet_key(), 1)));

  PublicKey other_mint = filled_key(0x46);
  f.host.set_account(other_mint, owned_account(cpi::token_program::id(), ONE_SOL,
                                               ex::token_ledger::token_account_data(
                                                   filled_key(0x47), holder, 0)));
  ASSERT_STATUS(6003, f.host.process_instruction(
                          cpi::token_program::transfer(held, other_mint, holder, 1)));
  ASSERT_EQ(30u, token_amount(f.host, held));
}

void test_token_relay_forwards_with_vault_signature() {
  TokenFixture f;
  ASSERT_STATUS(0, f.forward(40, f.vault.bump));
  ASSERT_EQ(60u, token_amount(f.host, f.source));
  ASSERT_EQ(40u, token_amount(f.host, f.destination));

  // Token program rejects the overdraft; the relay reports the failed call
  // and the whole instruction is undone
  ASSERT_STATUS(4100, f.forward(61, f.vault.bump));
  ASSERT_EQ(60u, token_amount(f.host, f.source));
}

void test_token_relay_rejects_wrong_bump() {
  TokenFixture f;
  ASSERT_STATUS(2006, f.forward(1, static_cast<uint8_t>(f.vault.bump - 1)));
  ASSERT_EQ(100u, token_amount(f.host, f.source));
}

void test_token_relay_call_depth() {
  TokenFixture f;
  ASSERT_STATUS(0, f.recurse(0));
  ASSERT_STATUS(0, f.recurse(4));
  ASSERT_STATUS(4101, f.recurse(5));
  ASSERT_EQ(0u, f.host.depth());
}

int main() {
  std::cout << "=== Example Programs Test Suite ===" << std::endl;
  TestRunner runner;
  runner.run_test("Pubkey Check Accepts Self Owned", test_pubkey_check_accepts_self_owned);
  runner.run_test("Pubkey Check Rejects Other Owner", test_pubkey_check_rejects_other_owner);
  runner.run_test("Lamport Transfer Moves Funds", test_lamport_transfer_moves_funds);
  runner.run_test("Lamport Transfer Checks Accounts", test_lamport_transfer_checks_accounts);
  runner.run_test("Lamport Transfer Writes Through Buffer",
                  test_lamport_transfer_writes_through_buffer);
  runner.run_test("Counter Lifecycle", test_counter_lifecycle);
  runner.run_test("Counter Limits", test_counter_limits);
  runner.run_test("Counter Actions", test_counter_actions);
  runner.run_test("Counter Rejects Wrong Authority", test_counter_rejects_wrong_authority);
  runner.run_test("Counter Initialize With Wrong Bump", test_counter_initialize_with_wrong_bump);
  runner.run_test("Counter Close", test_counter_close);
  runner.run_test("Counter Checks Stop At First Failure",
                  test_counter_checks_stop_at_first_failure);
  runner.run_test("Token Ledger Direct Transfer", test_token_ledger_direct_transfer);
  runner.run_test("Token Relay Forwards With Vault Signature",
                  test_token_relay_forwards_with_vault_signature);
  runner.run_test("Token Relay Rejects Wrong Bump", test_token_relay_rejects_wrong_bump);
  runner.run_test("Token Relay Call Depth", test_token_relay_call_depth);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
