#include "runtime/schema.h"
#include "common/logging.h"
#include "crypto/pda.h"
#include "runtime/binder.h"
#include "runtime/discriminator.h"

#include <stdexcept>
#include <unordered_set>

namespace keel {
namespace runtime {

const char *account_role_name(AccountRole role) {
  switch (role) {
  case AccountRole::SIGNER: return "signer";
  case AccountRole::MUT: return "mut";
  case AccountRole::READONLY: return "readonly";
  case AccountRole::ACCOUNT: return "account";
  case AccountRole::PROGRAM: return "program";
  case AccountRole::UNCHECKED: return "unchecked";
  }
  return "unknown";
}

Seed Seed::literal(const std::string &text) {
  return literal(std::vector<uint8_t>(text.begin(), text.end()));
}

Seed Seed::literal(std::vector<uint8_t> raw) {
  Seed seed;
  seed.kind = SeedKind::LITERAL;
  seed.bytes = std::move(raw);
  return seed;
}

Seed Seed::account_key(std::string account) {
  Seed seed;
  seed.kind = SeedKind::ACCOUNT_KEY;
  seed.reference = std::move(account);
  return seed;
}

Seed Seed::data_field(std::string field) {
  Seed seed;
  seed.kind = SeedKind::DATA_FIELD;
  seed.reference = std::move(field);
  return seed;
}

BumpSpec BumpSpec::literal(uint8_t bump) {
  BumpSpec spec;
  spec.source = BumpSource::LITERAL;
  spec.value = bump;
  return spec;
}

BumpSpec BumpSpec::arg(std::string name) {
  BumpSpec spec;
  spec.source = BumpSource::ARG_FIELD;
  spec.field = std::move(name);
  return spec;
}

BumpSpec BumpSpec::data(std::string name) {
  BumpSpec spec;
  spec.source = BumpSource::DATA_FIELD;
  spec.field = std::move(name);
  return spec;
}

// AccountDescriptor

AccountDescriptor &AccountDescriptor::sized(size_t bytes) {
  data_size = bytes;
  return *this;
}

AccountDescriptor &AccountDescriptor::owned_by(const PublicKey &owner) {
  constraints.owner = owner;
  return *this;
}

AccountDescriptor &AccountDescriptor::at_address(const PublicKey &address) {
  constraints.address = address;
  return *this;
}

AccountDescriptor &AccountDescriptor::with_seeds(std::vector<Seed> seeds, BumpSpec bump) {
  constraints.seeds = SeedsConstraint{std::move(seeds), std::move(bump)};
  return *this;
}

AccountDescriptor &AccountDescriptor::has_one(const std::string &target) {
  constraints.has_one.push_back(target);
  return *this;
}

AccountDescriptor &AccountDescriptor::require_signer() {
  constraints.signer = true;
  return *this;
}

AccountDescriptor &AccountDescriptor::require_writable() {
  constraints.writable = true;
  return *this;
}

AccountDescriptor &AccountDescriptor::init(const std::string &payer, std::optional<size_t> space) {
  constraints.init = InitSpec{payer, space};
  return *this;
}

AccountDescriptor &AccountDescriptor::close_to(const std::string &destination) {
  constraints.close = destination;
  return *this;
}

bool AccountDescriptor::requires_signer() const {
  if (constraints.signer || role == AccountRole::SIGNER) {
    return true;
  }
  // A fresh keypair account must sign its own creation
  return is_init() && !constraints.seeds;
}

bool AccountDescriptor::requires_writable() const {
  return constraints.writable || role == AccountRole::MUT || is_init() ||
         constraints.close.has_value();
}

std::optional<PublicKey> AccountDescriptor::expected_owner(const PublicKey &program_id) const {
  if (constraints.owner) {
    return constraints.owner;
  }
  if (role == AccountRole::ACCOUNT) {
    return program_id;
  }
  return std::nullopt;
}

size_t AccountDescriptor::init_space() const {
  if (constraints.init && constraints.init->space) {
    return *constraints.init->space;
  }
  if (data_size) {
    return *data_size;
  }
  return layout ? layout->size() : 0;
}

AccountDescriptor signer(const std::string &name) {
  AccountDescriptor d;
  d.name = name;
  d.role = AccountRole::SIGNER;
  return d;
}

AccountDescriptor mut(const std::string &name) {
  AccountDescriptor d;
  d.name = name;
  d.role = AccountRole::MUT;
  return d;
}

AccountDescriptor readonly(const std::string &name) {
  AccountDescriptor d;
  d.name = name;
  d.role = AccountRole::READONLY;
  return d;
}

AccountDescriptor account(const std::string &name, const DataLayout &layout) {
  AccountDescriptor d;
  d.name = name;
  d.role = AccountRole::ACCOUNT;
  d.layout = std::make_shared<const DataLayout>(layout);
  return d;
}

AccountDescriptor program(const std::string &name, const PublicKey &program_id) {
  AccountDescriptor d;
  d.name = name;
  d.role = AccountRole::PROGRAM;
  d.constraints.address = program_id;
  return d;
}

AccountDescriptor unchecked(const std::string &name) {
  AccountDescriptor d;
  d.name = name;
  d.role = AccountRole::UNCHECKED;
  return d;
}

// InstructionSpec

InstructionSpec::InstructionSpec(std::string name, std::vector<AccountDescriptor> accounts,
                                 DataLayout args)
    : name(std::move(name)), accounts(std::move(accounts)), args(std::move(args)) {}

const AccountDescriptor *InstructionSpec::find_account(const std::string &account_name) const {
  int index = account_index(account_name);
  return index < 0 ? nullptr : &accounts[static_cast<size_t>(index)];
}

int InstructionSpec::account_index(const std::string &account_name) const {
  for (size_t i = 0; i < accounts.size(); ++i) {
    if (accounts[i].name == account_name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

// ProgramSpec

namespace {

bool same_accounts(const InstructionSpec &a, const InstructionSpec &b) {
  if (a.accounts.size() != b.accounts.size()) {
    return false;
  }
  for (size_t i = 0; i < a.accounts.size(); ++i) {
    if (a.accounts[i].name != b.accounts[i].name ||
        a.accounts[i].role != b.accounts[i].role ||
        fixed_data_size(a.accounts[i]) != fixed_data_size(b.accounts[i])) {
      return false;
    }
  }
  return true;
}

[[noreturn]] void reject(const std::string &message) {
  LOG_ERROR("schema", message);
  throw std::invalid_argument(message);
}

} // namespace

ProgramSpec::ProgramSpec(const PublicKey &program_id, DispatchShape shape,
                         std::vector<InstructionSpec> instructions)
    : program_id_(program_id), shape_(shape), instructions_(std::move(instructions)) {
  if (instructions_.empty()) {
    reject("program declares no instructions");
  }
  if (shape_ == DispatchShape::SINGLE && instructions_.size() != 1) {
    reject("single-instruction program declares " + std::to_string(instructions_.size()) +
           " instructions");
  }

  std::unordered_set<std::string> names;
  for (size_t i = 0; i < instructions_.size(); ++i) {
    InstructionSpec &ix = instructions_[i];
    check_instruction(ix);

    if (!names.insert(ix.name).second) {
      reject("duplicate instruction name: " + ix.name);
    }

    ix.discriminator = instruction_discriminator(ix.name);
    if (shape_ != DispatchShape::SINGLE) {
      auto inserted = routes_.emplace(ix.discriminator, i);
      if (!inserted.second) {
        reject("discriminator of " + ix.name + " collides with " +
               instructions_[inserted.first->second].name);
      }
    }

    if (shape_ == DispatchShape::SHARED_LAYOUT && !same_accounts(ix, instructions_.front())) {
      reject("instruction " + ix.name + " does not share the program's account layout");
    }

    auto table = OffsetTable::build(ix.accounts);
    if (table) {
      ix.offsets = std::make_shared<const OffsetTable>(std::move(*table));
    }
  }

  LOG_DEBUG("schema", "Program ", to_hex(program_id_), " declares ", instructions_.size(),
            " instructions");
}

void ProgramSpec::check_instruction(const InstructionSpec &ix) const {
  if (ix.accounts.size() > MAX_INSTRUCTION_ACCOUNTS) {
    reject("instruction " + ix.name + " declares too many accounts");
  }

  std::unordered_set<std::string> account_names;
  for (const auto &descriptor : ix.accounts) {
    if (!account_names.insert(descriptor.name).second) {
      reject("instruction " + ix.name + " declares account " + descriptor.name + " twice");
    }
  }

  for (const auto &descriptor : ix.accounts) {
    const std::string where = ix.name + "." + descriptor.name;
    const ConstraintSet &c = descriptor.constraints;

    for (const auto &target : c.has_one) {
      if (!descriptor.layout) {
        reject(where + " uses has_one without a data layout");
      }
      const Field *field = descriptor.layout->find(target);
      if (field == nullptr || field->type != FieldType::PUBKEY) {
        reject(where + " has_one " + target + " needs a pubkey field of that name");
      }
      if (ix.find_account(target) == nullptr) {
        reject(where + " has_one references unknown account " + target);
      }
    }

    if (c.seeds) {
      if (c.seeds->seeds.size() + 1 > crypto::MAX_SEEDS) {
        reject(where + " declares too many seeds");
      }
      for (const auto &seed : c.seeds->seeds) {
        if (seed.kind == SeedKind::ACCOUNT_KEY && ix.find_account(seed.reference) == nullptr) {
          reject(where + " seed references unknown account " + seed.reference);
        }
        if (seed.kind == SeedKind::DATA_FIELD &&
            (!descriptor.layout || descriptor.layout->find(seed.reference) == nullptr)) {
          reject(where + " seed references unknown field " + seed.reference);
        }
        if (seed.kind == SeedKind::DATA_FIELD && descriptor.is_init()) {
          reject(where + " cannot seed from data it has not written yet");
        }
        if (seed.kind == SeedKind::LITERAL && seed.bytes.size() > crypto::MAX_SEED_LEN) {
          reject(where + " literal seed is too long");
        }
      }
      const BumpSpec &bump = c.seeds->bump;
      if (bump.source == BumpSource::ARG_FIELD) {
        const Field *field = ix.args.find(bump.field);
        if (field == nullptr || field->type != FieldType::U8) {
          reject(where + " bump argument " + bump.field + " must be a u8 argument");
        }
      }
      if (bump.source == BumpSource::DATA_FIELD) {
        const Field *field = descriptor.layout ? descriptor.layout->find(bump.field) : nullptr;
        if (field == nullptr || field->type != FieldType::U8) {
          reject(where + " bump field " + bump.field + " must be a u8 data field");
        }
        if (descriptor.is_init()) {
          reject(where + " cannot read its bump from data it has not written yet");
        }
      }
    }

    if (c.init) {
      int payer = ix.account_index(c.init->payer);
      if (payer < 0) {
        reject(where + " init payer " + c.init->payer + " is not declared");
      }
      if (!ix.accounts[static_cast<size_t>(payer)].requires_signer() ||
          !ix.accounts[static_cast<size_t>(payer)].requires_writable()) {
        reject(where + " init payer must be a writable signer");
      }
    }

    if (c.close && ix.find_account(*c.close) == nullptr) {
      reject(where + " close destination " + *c.close + " is not declared");
    }
  }
}

const InstructionSpec *ProgramSpec::find(const std::string &name) const {
  for (const auto &ix : instructions_) {
    if (ix.name == name) {
      return &ix;
    }
  }
  return nullptr;
}

const InstructionSpec *ProgramSpec::find_by_discriminator(uint64_t tag) const {
  auto it = routes_.find(tag);
  return it == routes_.end() ? nullptr : &instructions_[it->second];
}

} // namespace runtime
} // namespace keel
