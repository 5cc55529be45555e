#include "crypto/pda.h"
#include "host/buffer_builder.h"
#include "runtime/binder.h"
#include "runtime/buffer_decoder.h"
#include "runtime/validator.h"
#include "test_framework.h"
#include "test_helpers.h"

#include <utility>

using namespace keel;
using namespace keel::runtime;
using namespace test_helpers;

namespace {

const PublicKey PROGRAM = filled_key(0x50);

DataLayout vault_layout() {
  return DataLayout("Vault").pubkey("authority").u64("balance").u8("bump");
}

std::vector<uint8_t> vault_data(const PublicKey &authority, uint8_t bump) {
  DataLayout layout = vault_layout();
  std::vector<uint8_t> data(layout.size(), 0);
  auto tag = discriminator_bytes(layout.discriminator());
  std::copy(tag.begin(), tag.end(), data.begin());
  LayoutAccessor fields(layout, data.data(), data.size());
  fields.set_pubkey("authority", authority);
  fields.set_unsigned("balance", 100);
  fields.set_unsigned("bump", bump);
  return data;
}

// Owns the serialized input so bound views stay valid
struct Bound {
  host::SerializedInput input;
  DecodedInput decoded;
  BoundAccounts accounts;
};

Bound bind_input(host::InputBuilder builder, const std::vector<AccountDescriptor> &descriptors) {
  Bound out;
  out.input = builder.set_program_id(PROGRAM).build();
  auto decoded = decode(out.input.bytes.data(), out.input.bytes.size());
  if (decoded.is_err()) {
    throw std::runtime_error("decode failed: " + decoded.error().to_string());
  }
  out.decoded = decoded.value();
  auto bound = runtime::bind(out.decoded, descriptors);
  if (bound.is_err()) {
    throw std::runtime_error("bind failed: " + bound.error().to_string());
  }
  out.accounts = bound.value();
  return out;
}

using Observed = std::vector<std::pair<std::string, ConstraintKind>>;

} // namespace

void test_signer_and_writable() {
  std::vector<AccountDescriptor> descriptors = {signer("user"), mut("vault")};
  ArgValues args;
  Validator validator(PROGRAM, args);

  Bound ok_input = bind_input(host::InputBuilder()
                                  .add_account(filled_key(1), system_account(1), true, false)
                                  .add_account(filled_key(2), system_account(1), false, true),
                              descriptors);
  ASSERT_OK(validator.validate(descriptors, ok_input.accounts));

  Bound unsigned_input = bind_input(host::InputBuilder()
                                        .add_account(filled_key(1), system_account(1), false, true)
                                        .add_account(filled_key(2), system_account(1), false, true),
                                    descriptors);
  auto missing_signer = validator.validate(descriptors, unsigned_input.accounts);
  ASSERT_TRUE(missing_signer.is_err());
  ASSERT_STATUS(2002, to_status(missing_signer.error()));

  Bound readonly_input = bind_input(host::InputBuilder()
                                        .add_account(filled_key(1), system_account(1), true, false)
                                        .add_account(filled_key(2), system_account(1), false, false),
                                    descriptors);
  auto not_writable = validator.validate(descriptors, readonly_input.accounts);
  ASSERT_TRUE(not_writable.is_err());
  ASSERT_STATUS(2000, to_status(not_writable.error()));
}

void test_owner_and_discriminator() {
  std::vector<AccountDescriptor> descriptors = {account("vault", vault_layout())};
  ArgValues args;
  Validator validator(PROGRAM, args);
  auto data = vault_data(filled_key(1), 0);

  Bound good = bind_input(
      host::InputBuilder().add_account(filled_key(2), owned_account(PROGRAM, 1, data), false, false),
      descriptors);
  ASSERT_OK(validator.validate(descriptors, good.accounts));

  Bound foreign = bind_input(host::InputBuilder().add_account(
                                 filled_key(2), owned_account(filled_key(9), 1, data), false, false),
                             descriptors);
  auto wrong_owner = validator.validate(descriptors, foreign.accounts);
  ASSERT_TRUE(wrong_owner.is_err());
  ASSERT_STATUS(2004, to_status(wrong_owner.error()));

  data[0] ^= 0xFF;
  Bound retagged = bind_input(
      host::InputBuilder().add_account(filled_key(2), owned_account(PROGRAM, 1, data), false, false),
      descriptors);
  auto wrong_tag = validator.validate(descriptors, retagged.accounts);
  ASSERT_TRUE(wrong_tag.is_err());
  ASSERT_STATUS(3002, to_status(wrong_tag.error()));
}

void test_address_constraint() {
  std::vector<AccountDescriptor> descriptors = {program("system", filled_key(0))};
  ArgValues args;
  Validator validator(PROGRAM, args);

  Bound good = bind_input(
      host::InputBuilder().add_account(filled_key(0), system_account(1), false, false), descriptors);
  ASSERT_OK(validator.validate(descriptors, good.accounts));

  Bound bad = bind_input(
      host::InputBuilder().add_account(filled_key(3), system_account(1), false, false), descriptors);
  auto result = validator.validate(descriptors, bad.accounts);
  ASSERT_TRUE(result.is_err());
  ASSERT_STATUS(2012, to_status(result.error()));
}

void test_has_one() {
  std::vector<AccountDescriptor> descriptors = {
      signer("authority"), account("vault", vault_layout()).has_one("authority")};
  ArgValues args;
  Validator validator(PROGRAM, args);
  PublicKey authority = filled_key(1);

  Bound good = bind_input(host::InputBuilder()
                              .add_account(authority, system_account(1), true, false)
                              .add_account(filled_key(2),
                                           owned_account(PROGRAM, 1, vault_data(authority, 0)),
                                           false, false),
                          descriptors);
  ASSERT_OK(validator.validate(descriptors, good.accounts));

  Bound imposter = bind_input(host::InputBuilder()
                                  .add_account(filled_key(7), system_account(1), true, false)
                                  .add_account(filled_key(2),
                                               owned_account(PROGRAM, 1, vault_data(authority, 0)),
                                               false, false),
                              descriptors);
  auto result = validator.validate(descriptors, imposter.accounts);
  ASSERT_TRUE(result.is_err());
  ASSERT_STATUS(2001, to_status(result.error()));
}

void test_has_one_target_declared_later() {
  std::vector<AccountDescriptor> descriptors = {
      account("vault", vault_layout()).has_one("authority"), signer("authority")};
  ArgValues args;
  Validator validator(PROGRAM, args);
  PublicKey authority = filled_key(1);

  Bound input = bind_input(host::InputBuilder()
                               .add_account(filled_key(2),
                                            owned_account(PROGRAM, 1, vault_data(authority, 0)),
                                            false, false)
                               .add_account(authority, system_account(1), true, false),
                           descriptors);
  auto result = validator.validate(descriptors, input.accounts);
  ASSERT_TRUE(result.is_err());
  ASSERT_STATUS(2001, to_status(result.error()));
}

void test_checks_stop_at_first_failure() {
  std::vector<AccountDescriptor> descriptors = {
      signer("authority"), account("vault", vault_layout()).require_writable().has_one("authority")};
  ArgValues args;
  Validator validator(PROGRAM, args);
  Observed observed;
  validator.set_observer([&observed](const std::string &account, ConstraintKind kind) {
    observed.emplace_back(account, kind);
  });

  PublicKey authority = filled_key(1);
  Bound foreign = bind_input(
      host::InputBuilder()
          .add_account(authority, system_account(1), true, false)
          .add_account(filled_key(2), owned_account(filled_key(9), 1, vault_data(authority, 0)),
                       false, true),
      descriptors);
  auto result = validator.validate(descriptors, foreign.accounts);
  ASSERT_TRUE(result.is_err());
  ASSERT_STATUS(2004, to_status(result.error()));

  Observed expected = {{"authority", ConstraintKind::SIGNER},
                       {"vault", ConstraintKind::WRITABLE},
                       {"vault", ConstraintKind::OWNER}};
  ASSERT_TRUE(observed == expected);
  for (const auto &entry : observed) {
    ASSERT_TRUE(entry.second != ConstraintKind::HAS_ONE);
    ASSERT_TRUE(entry.second != ConstraintKind::DISCRIMINATOR);
  }
}

void test_full_check_order() {
  DataLayout layout = vault_layout();
  auto found = crypto::find_program_address({{'v', 'a', 'u', 'l', 't'}}, PROGRAM);
  ASSERT_TRUE(found.has_value());

  std::vector<AccountDescriptor> descriptors = {
      signer("authority"),
      account("vault", layout)
          .require_signer()
          .require_writable()
          .has_one("authority")
          .with_seeds({Seed::literal("vault")}, BumpSpec::data("bump"))};
  descriptors[1].constraints.address = found->address;

  ArgValues args;
  Validator validator(PROGRAM, args);
  Observed observed;
  validator.set_observer([&observed](const std::string &account, ConstraintKind kind) {
    if (account == "vault") {
      observed.emplace_back(account, kind);
    }
  });

  PublicKey authority = filled_key(1);
  Bound input = bind_input(
      host::InputBuilder()
          .add_account(authority, system_account(1), true, false)
          .add_account(found->address,
                       owned_account(PROGRAM, 1, vault_data(authority, found->bump)), true, true),
      descriptors);
  ASSERT_OK(validator.validate(descriptors, input.accounts));

  Observed expected = {{"vault", ConstraintKind::SIGNER},       {"vault", ConstraintKind::WRITABLE},
                       {"vault", ConstraintKind::OWNER},        {"vault", ConstraintKind::ADDRESS},
                       {"vault", ConstraintKind::DISCRIMINATOR}, {"vault", ConstraintKind::HAS_ONE},
                       {"vault", ConstraintKind::SEEDS}};
  ASSERT_TRUE(observed == expected);
}

void test_seeds_with_arg_bump() {
  PublicKey user = filled_key(3);
  crypto::SeedList base = {{'p', 'o', 'o', 'l'}, std::vector<uint8_t>(user.begin(), user.end())};
  auto found = crypto::find_program_address(base, PROGRAM);
  ASSERT_TRUE(found.has_value());

  DataLayout args_layout;
  args_layout.u8("bump");
  InstructionSpec ix("open",
                     {signer("user"), unchecked("pool").with_seeds(
                                          {Seed::literal("pool"), Seed::account_key("user")},
                                          BumpSpec::arg("bump"))},
                     args_layout);

  host::InputBuilder builder;
  builder.add_account(user, system_account(1), true, false)
      .add_account(found->address, system_account(0), false, false);
  Bound input = bind_input(builder, ix.accounts);

  ArgValues good_args;
  good_args.add("bump", ArgValue{FieldType::U8, found->bump});
  Validator validator(PROGRAM, good_args);
  ASSERT_OK(validator.validate(ix.accounts, input.accounts));

  auto seeds = resolve_seeds(ix.accounts[1], input.accounts[1], ix.accounts, input.accounts,
                             good_args);
  ASSERT_OK(seeds);
  ASSERT_EQ(3u, seeds.value().size());
  ASSERT_EQ(found->bump, seeds.value().back()[0]);

  ArgValues wrong_args;
  wrong_args.add("bump", ArgValue{FieldType::U8, static_cast<uint64_t>(found->bump ^ 1)});
  Validator wrong(PROGRAM, wrong_args);
  auto result = wrong.validate(ix.accounts, input.accounts);
  ASSERT_TRUE(result.is_err());
  ASSERT_STATUS(2006, to_status(result.error()));
}

void test_init_skips_data_checks() {
  DataLayout layout = vault_layout();
  std::vector<AccountDescriptor> descriptors = {signer("payer").require_writable(),
                                                account("vault", layout).init("payer")};
  ArgValues args;
  Validator validator(PROGRAM, args);
  Observed observed;
  validator.set_observer([&observed](const std::string &account, ConstraintKind kind) {
    observed.emplace_back(account, kind);
  });

  PublicKey fresh = wallet_key();
  Bound input = bind_input(host::InputBuilder()
                               .add_account(filled_key(1), system_account(1000), true, true)
                               .add_account(fresh, system_account(0), true, true),
                           descriptors);
  ASSERT_OK(validator.validate(descriptors, input.accounts));

  Observed expected = {{"payer", ConstraintKind::SIGNER},
                       {"payer", ConstraintKind::WRITABLE},
                       {"vault", ConstraintKind::SIGNER},
                       {"vault", ConstraintKind::WRITABLE}};
  ASSERT_TRUE(observed == expected);
}

int main() {
  std::cout << "=== Constraint Validator Test Suite ===" << std::endl;
  TestRunner runner;
  runner.run_test("Signer And Writable", test_signer_and_writable);
  runner.run_test("Owner And Discriminator", test_owner_and_discriminator);
  runner.run_test("Address Constraint", test_address_constraint);
  runner.run_test("Has One", test_has_one);
  runner.run_test("Has One Target Declared Later", test_has_one_target_declared_later);
  runner.run_test("Checks Stop At First Failure", test_checks_stop_at_first_failure);
  runner.run_test("Full Check Order", test_full_check_order);
  runner.run_test("Seeds With Arg Bump", test_seeds_with_arg_bump);
  runner.run_test("Init Skips Data Checks", test_init_skips_data_checks);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
