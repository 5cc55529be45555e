#pragma once

#include "common/types.h"
#include "runtime/data_layout.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace keel {
namespace runtime {

using namespace keel::common;

class OffsetTable;

/// Most account positions one instruction may declare
constexpr size_t MAX_INSTRUCTION_ACCOUNTS = 64;

/**
 * @brief What an account position is for
 *
 * SIGNER implies the signer check and MUT the writable check. ACCOUNT is
 * program-owned typed data: its owner defaults to the executing program.
 * PROGRAM pins the address to a program id. UNCHECKED carries no implicit
 * checks at all.
 */
enum class AccountRole { SIGNER, MUT, READONLY, ACCOUNT, PROGRAM, UNCHECKED };

const char *account_role_name(AccountRole role);

enum class SeedKind {
  LITERAL,      ///< Fixed bytes
  ACCOUNT_KEY,  ///< Key of another declared account
  DATA_FIELD    ///< Bytes of a field of this account's data
};

struct Seed {
  SeedKind kind = SeedKind::LITERAL;
  std::vector<uint8_t> bytes;  ///< LITERAL
  std::string reference;       ///< Account or field name

  static Seed literal(const std::string &text);
  static Seed literal(std::vector<uint8_t> raw);
  static Seed account_key(std::string account);
  static Seed data_field(std::string field);
};

enum class BumpSource {
  LITERAL,    ///< Fixed bump byte
  ARG_FIELD,  ///< u8 instruction argument
  DATA_FIELD  ///< u8 field of this account's data
};

struct BumpSpec {
  BumpSource source = BumpSource::LITERAL;
  uint8_t value = 0;
  std::string field;

  static BumpSpec literal(uint8_t bump);
  static BumpSpec arg(std::string name);
  static BumpSpec data(std::string name);
};

struct SeedsConstraint {
  std::vector<Seed> seeds;
  BumpSpec bump;
};

/// Create the account before the handler runs
struct InitSpec {
  std::string payer;
  std::optional<size_t> space;  ///< Defaults to the declared data size
};

/**
 * @brief Declared checks for one account position
 *
 * Every option maps onto exactly one validator check; see Validator for the
 * evaluation order.
 */
struct ConstraintSet {
  std::optional<PublicKey> owner;
  std::optional<PublicKey> address;
  std::optional<SeedsConstraint> seeds;
  std::vector<std::string> has_one;
  bool signer = false;
  bool writable = false;
  std::optional<InitSpec> init;
  std::optional<std::string> close;  ///< Destination account name
};

/**
 * @brief One declared account position of an instruction
 *
 * Built with the role factories below and refined with the chained
 * constraint setters, e.g.
 * @code
 * account("counter", counter_layout).require_writable().has_one("authority")
 * @endcode
 */
struct AccountDescriptor {
  std::string name;
  AccountRole role = AccountRole::UNCHECKED;
  std::optional<size_t> data_size;
  LayoutPtr layout;
  ConstraintSet constraints;

  AccountDescriptor &sized(size_t bytes);
  AccountDescriptor &owned_by(const PublicKey &owner);
  AccountDescriptor &at_address(const PublicKey &address);
  AccountDescriptor &with_seeds(std::vector<Seed> seeds, BumpSpec bump);
  AccountDescriptor &has_one(const std::string &target);
  AccountDescriptor &require_signer();
  AccountDescriptor &require_writable();
  AccountDescriptor &init(const std::string &payer, std::optional<size_t> space = std::nullopt);
  AccountDescriptor &close_to(const std::string &destination);

  bool requires_signer() const;
  bool requires_writable() const;
  bool is_init() const { return constraints.init.has_value(); }

  /// Owner enforced by the validator, if any (defaults for ACCOUNT)
  std::optional<PublicKey> expected_owner(const PublicKey &program_id) const;

  /// Space to allocate when the account is created by init
  size_t init_space() const;
};

AccountDescriptor signer(const std::string &name);
AccountDescriptor mut(const std::string &name);
AccountDescriptor readonly(const std::string &name);
AccountDescriptor account(const std::string &name, const DataLayout &layout);
AccountDescriptor program(const std::string &name, const PublicKey &program_id);
AccountDescriptor unchecked(const std::string &name);

/**
 * @brief One instruction: name, ordered accounts and argument layout
 */
struct InstructionSpec {
  std::string name;
  std::vector<AccountDescriptor> accounts;
  DataLayout args;
  uint64_t discriminator = 0;  ///< Filled in by ProgramSpec

  /// Offset table when every account has a fixed size, else null
  std::shared_ptr<const OffsetTable> offsets;

  InstructionSpec() = default;
  InstructionSpec(std::string name, std::vector<AccountDescriptor> accounts,
                  DataLayout args = DataLayout());

  const AccountDescriptor *find_account(const std::string &name) const;
  int account_index(const std::string &name) const;
};

/**
 * @brief How the payload selects an instruction
 *
 * SINGLE: one instruction, the payload is its arguments and carries no tag.
 * SHARED_LAYOUT: every instruction declares the same accounts; the tag only
 * picks the handler.
 * PER_INSTRUCTION: the tag picks the instruction and its account list.
 */
enum class DispatchShape { SINGLE, SHARED_LAYOUT, PER_INSTRUCTION };

/**
 * @brief Complete, immutable description of a program
 *
 * The constructor derives discriminators, precomputes offset tables and
 * rejects inconsistent declarations (duplicate names, colliding
 * discriminators, dangling account references) with std::invalid_argument.
 */
class ProgramSpec {
public:
  ProgramSpec(const PublicKey &program_id, DispatchShape shape,
              std::vector<InstructionSpec> instructions);

  const PublicKey &program_id() const { return program_id_; }
  DispatchShape shape() const { return shape_; }
  const std::vector<InstructionSpec> &instructions() const { return instructions_; }

  const InstructionSpec *find(const std::string &name) const;

  /// Instruction whose discriminator equals the tag, or null
  const InstructionSpec *find_by_discriminator(uint64_t tag) const;

private:
  void check_instruction(const InstructionSpec &ix) const;

  PublicKey program_id_;
  DispatchShape shape_;
  std::vector<InstructionSpec> instructions_;
  std::unordered_map<uint64_t, size_t> routes_;
};

} // namespace runtime
} // namespace keel
