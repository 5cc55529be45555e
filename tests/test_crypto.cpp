#include "common/base58.h"
#include "crypto/hashing.h"
#include "crypto/keypair.h"
#include "crypto/pda.h"
#include "test_framework.h"
#include "test_helpers.h"

using namespace keel;
using namespace keel::crypto;
using namespace test_helpers;

namespace {

SeedList text_seeds(const std::vector<std::string> &texts) {
  SeedList seeds;
  for (const auto &text : texts) {
    seeds.emplace_back(text.begin(), text.end());
  }
  return seeds;
}

PublicKey base58_key(const std::string &text) {
  auto key = common::pubkey_from_base58(text);
  if (key.is_err()) {
    throw std::runtime_error("bad base58 key " + text);
  }
  return key.value();
}

} // namespace

void test_sha256_known_digest() {
  Hash32 digest = sha256("abc");
  ASSERT_EQ(std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
            common::to_hex(digest));

  const std::string left = "ab";
  const std::string right = "c";
  Hash32 parts = sha256(std::vector<ByteSlice>{
      {reinterpret_cast<const uint8_t *>(left.data()), left.size()},
      {reinterpret_cast<const uint8_t *>(right.data()), right.size()}});
  ASSERT_TRUE(parts == digest);
}

void test_base58_round_trip() {
  PublicKey zero{};
  ASSERT_EQ(std::string(32, '1'), common::encode_base58(zero));

  PublicKey key = filled_key(0xA7);
  std::string text = common::encode_base58(key);
  ASSERT_EQ(key, base58_key(text));

  ASSERT_TRUE(common::decode_base58("0OIl").is_err());
  ASSERT_TRUE(common::pubkey_from_base58("2g").is_err());
}

void test_known_program_address() {
  PublicKey loader = base58_key("BPFLoaderUpgradeab1e11111111111111111111111");
  auto address = create_program_address(text_seeds({"Talking", "Squirrels"}), loader);
  ASSERT_TRUE(address.has_value());
  ASSERT_EQ(base58_key("2fnQrngrQT4SeLcdToJAD96phoEjNL2man2kfRLCASVk"), *address);
}

void test_find_program_address_deterministic() {
  PublicKey program = filled_key(0x42);
  SeedList seeds = text_seeds({"counter", "alice"});
  auto first = find_program_address(seeds, program);
  auto second = find_program_address(seeds, program);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(first->address, second->address);
  ASSERT_EQ(static_cast<int>(first->bump), static_cast<int>(second->bump));
  ASSERT_FALSE(is_on_curve(first->address));

  // The bump found is the one create_program_address accepts
  SeedList with_bump = seeds;
  with_bump.push_back({first->bump});
  auto direct = create_program_address(with_bump, program);
  ASSERT_TRUE(direct.has_value());
  ASSERT_EQ(first->address, *direct);

  // Any larger bump derives an on-curve point
  for (int bump = 255; bump > first->bump; --bump) {
    SeedList other = seeds;
    other.push_back({static_cast<uint8_t>(bump)});
    ASSERT_FALSE(create_program_address(other, program).has_value());
  }
}

void test_seed_changes_alter_address() {
  PublicKey program = filled_key(0x42);
  auto a = find_program_address(text_seeds({"counter", "alice"}), program);
  auto b = find_program_address(text_seeds({"counter", "alicf"}), program);
  auto c = find_program_address(text_seeds({"counter", "alice"}), filled_key(0x43));
  ASSERT_TRUE(a && b && c);
  ASSERT_NE(a->address, b->address);
  ASSERT_NE(a->address, c->address);
}

void test_curve_membership() {
  PublicKey identity{};
  identity[0] = 1;
  ASSERT_TRUE(is_on_curve(identity));

  PublicKey zero_y{};
  ASSERT_TRUE(is_on_curve(zero_y));

  // Sign bit of x does not affect membership
  PublicKey negated = identity;
  negated[31] |= 0x80;
  ASSERT_TRUE(is_on_curve(negated));

  for (int i = 0; i < 8; ++i) {
    ASSERT_TRUE(is_on_curve(Keypair::generate().public_key));
  }
}

void test_seed_limits() {
  PublicKey program = filled_key(1);
  SeedList too_long = {std::vector<uint8_t>(MAX_SEED_LEN + 1, 7)};
  ASSERT_FALSE(create_program_address(too_long, program).has_value());
  ASSERT_FALSE(find_program_address(too_long, program).has_value());

  SeedList too_many(MAX_SEEDS + 1, std::vector<uint8_t>{1});
  ASSERT_FALSE(create_program_address(too_many, program).has_value());

  // Fifteen seeds leave room for the bump
  SeedList fifteen(MAX_SEEDS - 1, std::vector<uint8_t>(MAX_SEED_LEN, 3));
  ASSERT_TRUE(find_program_address(fifteen, program).has_value());
  SeedList sixteen(MAX_SEEDS, std::vector<uint8_t>{3});
  ASSERT_FALSE(find_program_address(sixteen, program).has_value());
}

void test_keypair_from_seed_known_vector() {
  // RFC 8032 test 1
  std::array<uint8_t, 32> seed = {0x9d, 0x61, 0xb1, 0x9d, 0xef, 0xfd, 0x5a, 0x60, 0xba, 0x84, 0x4a,
                                  0xf4, 0x92, 0xec, 0x2c, 0xc4, 0x44, 0x49, 0xc5, 0x69, 0x7b, 0x32,
                                  0x69, 0x19, 0x70, 0x3b, 0xac, 0x03, 0x1c, 0xae, 0x7f, 0x60};
  Keypair keypair = Keypair::from_seed(seed);
  ASSERT_EQ(std::string("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"),
            common::to_hex(keypair.public_key));
  ASSERT_TRUE(Keypair::from_seed(seed).public_key == keypair.public_key);
}

int main() {
  std::cout << "=== Crypto Test Suite ===" << std::endl;
  TestRunner runner;
  runner.run_test("SHA-256 Known Digest", test_sha256_known_digest);
  runner.run_test("Base58 Round Trip", test_base58_round_trip);
  runner.run_test("Known Program Address", test_known_program_address);
  runner.run_test("Find Program Address Deterministic", test_find_program_address_deterministic);
  runner.run_test("Seed Changes Alter Address", test_seed_changes_alter_address);
  runner.run_test("Curve Membership", test_curve_membership);
  runner.run_test("Seed Limits", test_seed_limits);
  runner.run_test("Keypair From Seed Known Vector", test_keypair_from_seed_known_vector);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
