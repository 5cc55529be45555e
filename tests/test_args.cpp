#include "runtime/args.h"
#include "runtime/data_layout.h"
#include "runtime/discriminator.h"
#include "test_framework.h"
#include "test_helpers.h"

using namespace keel;
using namespace keel::runtime;
using namespace test_helpers;

void test_instruction_discriminator_known_value() {
  // sha256("global:initialize")[0..8]
  auto bytes = discriminator_bytes(instruction_discriminator("initialize"));
  std::vector<uint8_t> expected = {175, 175, 109, 31, 13, 152, 155, 237};
  ASSERT_EQ(expected, std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

void test_discriminator_namespaces_differ() {
  ASSERT_NE(instruction_discriminator("Counter"), account_discriminator("Counter"));
  ASSERT_EQ(account_discriminator("Counter"), discriminator("account", "Counter"));
  ASSERT_NE(instruction_discriminator("increment"), instruction_discriminator("decrement"));
}

void test_layout_offsets() {
  DataLayout layout("Vault");
  layout.u64("balance").pubkey("owner").u8("bump").i16("delta");
  ASSERT_EQ(8u + 32u + 1u + 2u, layout.body_size());
  ASSERT_EQ(layout.body_size() + 8, layout.size());
  ASSERT_TRUE(layout.has_discriminator());
  ASSERT_EQ(8u, layout.find("owner")->offset);
  ASSERT_EQ(40u, layout.find("bump")->offset);
  ASSERT_TRUE(layout.find("missing") == nullptr);
}

void test_duplicate_field_rejected() {
  DataLayout layout;
  layout.u64("amount");
  ASSERT_THROWS(layout.u8("amount"), std::invalid_argument);
}

void test_tagged_union_size() {
  DataLayout layout;
  layout.tagged_union("action", {{"reset", DataLayout()}, {"set", DataLayout().u64("value")}});
  ASSERT_EQ(9u, layout.body_size());
  ASSERT_EQ(2u, layout.find("action")->variants.size());
}

void test_accessor_reads_and_writes() {
  DataLayout layout("Counter");
  layout.u64("count").pubkey("authority").u8("bump").i32("offset").boolean("paused");
  std::vector<uint8_t> data(layout.size(), 0);
  LayoutAccessor fields(layout, data.data(), data.size());

  ASSERT_OK(fields.set_unsigned("count", 41));
  ASSERT_OK(fields.set_pubkey("authority", filled_key(7)));
  ASSERT_OK(fields.set_unsigned("bump", 254));
  ASSERT_OK(fields.set_signed("offset", -5));
  ASSERT_OK(fields.set_bool("paused", true));

  ASSERT_EQ(41u, fields.get_unsigned("count").value());
  ASSERT_EQ(filled_key(7), fields.get_pubkey("authority").value());
  ASSERT_EQ(254u, fields.get_unsigned("bump").value());
  ASSERT_EQ(-5, fields.get_signed("offset").value());
  ASSERT_TRUE(fields.get_bool("paused").value());
  // Fields start after the eight-byte account discriminator
  ASSERT_EQ(41, data[8]);
}

void test_accessor_errors() {
  DataLayout layout("Counter");
  layout.u64("count").pubkey("authority");
  std::vector<uint8_t> short_data(20, 0);
  LayoutAccessor fields(layout, short_data.data(), short_data.size());

  auto unknown = fields.get_unsigned("nope");
  ASSERT_TRUE(unknown.is_err());
  ASSERT_STATUS(100, to_status(unknown.error()));

  auto truncated = fields.get_pubkey("authority");
  ASSERT_TRUE(truncated.is_err());
  ASSERT_STATUS(3003, to_status(truncated.error()));

  auto wrong = fields.get_signed("count");
  ASSERT_TRUE(wrong.is_err());
}

void test_args_round_trip() {
  DataLayout layout;
  layout.u64("amount").u8("bump");
  ArgValues values;
  values.set_unsigned("amount", 500000).set_unsigned("bump", 7);

  auto encoded = encode_args(layout, values);
  ASSERT_OK(encoded);
  ASSERT_EQ(9u, encoded.value().size());
  std::vector<uint8_t> expected = {0x20, 0xA1, 0x07, 0, 0, 0, 0, 0, 7};
  ASSERT_EQ(expected, encoded.value());

  auto decoded = decode_args(layout, encoded.value().data(), encoded.value().size());
  ASSERT_OK(decoded);
  ASSERT_EQ(500000u, decoded.value().get_u64("amount").value());
  ASSERT_EQ(7, decoded.value().get_u8("bump").value());
}

void test_trailing_bytes_rejected() {
  DataLayout layout;
  layout.u64("amount");
  std::vector<uint8_t> data = u64_bytes(10);
  data.push_back(0);
  auto decoded = decode_args(layout, data.data(), data.size());
  ASSERT_TRUE(decoded.is_err());
  ASSERT_STATUS(102, to_status(decoded.error()));
}

void test_short_payload_rejected() {
  DataLayout layout;
  layout.u64("amount");
  std::vector<uint8_t> data = {1, 2, 3};
  ASSERT_TRUE(decode_args(layout, data.data(), data.size()).is_err());
}

void test_union_variants() {
  DataLayout layout;
  layout.tagged_union("action", {{"increment", DataLayout()},
                                 {"decrement", DataLayout()},
                                 {"set", DataLayout().u64("value")},
                                 {"reset", DataLayout()}});

  std::vector<uint8_t> set = {2};
  std::vector<uint8_t> value = u64_bytes(77);
  set.insert(set.end(), value.begin(), value.end());
  auto decoded = decode_args(layout, set.data(), set.size());
  ASSERT_OK(decoded);
  auto variant = decoded.value().get_variant("action");
  ASSERT_OK(variant);
  ASSERT_EQ(std::string("set"), variant.value().first);
  ASSERT_EQ(77u, variant.value().second.get_u64("value").value());

  // Variants without fields take only the tag byte
  std::vector<uint8_t> reset = {3};
  auto plain = decode_args(layout, reset.data(), reset.size());
  ASSERT_OK(plain);
  ASSERT_EQ(std::string("reset"), plain.value().get_variant("action").value().first);

  std::vector<uint8_t> unknown = {4};
  auto bad = decode_args(layout, unknown.data(), unknown.size());
  ASSERT_TRUE(bad.is_err());
  ASSERT_STATUS(102, to_status(bad.error()));

  ArgValues encoded_values;
  encoded_values.set_variant("action", 2, ArgValues().set_unsigned("value", 77));
  auto encoded = encode_args(layout, encoded_values);
  ASSERT_OK(encoded);
  ASSERT_EQ(set, encoded.value());
}

void test_bool_and_signed_decoding() {
  DataLayout layout;
  layout.boolean("flag").i8("small").i64("big");
  std::vector<uint8_t> data = {1, 0xFF};
  std::vector<uint8_t> big = u64_bytes(static_cast<uint64_t>(-3));
  data.insert(data.end(), big.begin(), big.end());

  auto decoded = decode_args(layout, data.data(), data.size());
  ASSERT_OK(decoded);
  ASSERT_TRUE(decoded.value().get_bool("flag").value());
  ASSERT_EQ(-1, decoded.value().get_signed("small").value());
  ASSERT_EQ(-3, decoded.value().get_signed("big").value());

  data[0] = 2;
  ASSERT_TRUE(decode_args(layout, data.data(), data.size()).is_err());
}

void test_nested_struct() {
  DataLayout point;
  point.i32("x").i32("y");
  DataLayout layout;
  layout.nested("origin", point).u8("zoom");
  ASSERT_EQ(9u, layout.body_size());

  ArgValues values;
  values.set_struct("origin", ArgValues().set_signed("x", -2).set_signed("y", 3))
      .set_unsigned("zoom", 4);
  auto encoded = encode_args(layout, values);
  ASSERT_OK(encoded);
  auto decoded = decode_args(layout, encoded.value().data(), encoded.value().size());
  ASSERT_OK(decoded);
  auto origin = decoded.value().get_struct("origin");
  ASSERT_OK(origin);
  ASSERT_EQ(-2, origin.value().get_signed("x").value());
  ASSERT_EQ(3, origin.value().get_signed("y").value());
}

void test_missing_argument_on_encode() {
  DataLayout layout;
  layout.u64("amount").u8("bump");
  ArgValues values;
  values.set_unsigned("amount", 1);
  auto encoded = encode_args(layout, values);
  ASSERT_TRUE(encoded.is_err());
  ASSERT_STATUS(102, to_status(encoded.error()));
}

void test_encode_instruction_prefixes_tag() {
  DataLayout layout;
  layout.u64("value");
  auto data = encode_instruction("set_count", layout, ArgValues().set_unsigned("value", 5));
  ASSERT_OK(data);
  ASSERT_EQ(tagged("set_count", u64_bytes(5)), data.value());
}

void test_encode_rejects_values_wider_than_field() {
  DataLayout layout;
  layout.u64("amount").u8("bump");
  ArgValues values;
  values.set_unsigned("amount", 500000).set_unsigned("bump", 300);
  auto encoded = encode_args(layout, values);
  ASSERT_TRUE(encoded.is_err());
  ASSERT_STATUS(102, to_status(encoded.error()));

  values.set_unsigned("bump", 255);
  ASSERT_OK(encode_args(layout, values));

  DataLayout narrow;
  narrow.i8("delta").u16("count");
  ArgValues in_range;
  in_range.set_signed("delta", -128).set_unsigned("count", 65535);
  ASSERT_OK(encode_args(narrow, in_range));

  ArgValues too_negative;
  too_negative.set_signed("delta", -129).set_unsigned("count", 1);
  ASSERT_TRUE(encode_args(narrow, too_negative).is_err());

  ArgValues too_positive;
  too_positive.set_signed("delta", 128).set_unsigned("count", 1);
  ASSERT_TRUE(encode_args(narrow, too_positive).is_err());

  ArgValues negative_count;
  negative_count.set_signed("delta", 0).set_signed("count", -1);
  ASSERT_TRUE(encode_args(narrow, negative_count).is_err());
}

int main() {
  std::cout << "=== Layout And Argument Codec Test Suite ===" << std::endl;
  TestRunner runner;
  runner.run_test("Instruction Discriminator Known Value",
                  test_instruction_discriminator_known_value);
  runner.run_test("Discriminator Namespaces Differ", test_discriminator_namespaces_differ);
  runner.run_test("Layout Offsets", test_layout_offsets);
  runner.run_test("Duplicate Field Rejected", test_duplicate_field_rejected);
  runner.run_test("Tagged Union Size", test_tagged_union_size);
  runner.run_test("Accessor Reads And Writes", test_accessor_reads_and_writes);
  runner.run_test("Accessor Errors", test_accessor_errors);
  runner.run_test("Args Round Trip", test_args_round_trip);
  runner.run_test("Trailing Bytes Rejected", test_trailing_bytes_rejected);
  runner.run_test("Short Payload Rejected", test_short_payload_rejected);
  runner.run_test("Union Variants", test_union_variants);
  runner.run_test("Bool And Signed Decoding", test_bool_and_signed_decoding);
  runner.run_test("Nested Struct", test_nested_struct);
  runner.run_test("Missing Argument On Encode", test_missing_argument_on_encode);
  runner.run_test("Encode Instruction Prefixes Tag", test_encode_instruction_prefixes_tag);
  runner.run_test("Encode Rejects Values Wider Than Field",
                  test_encode_rejects_values_wider_than_field);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
