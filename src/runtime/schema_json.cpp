#include "runtime/schema_json.h"
#include "common/base58.h"
#include "common/logging.h"

#include <set>

namespace keel {
namespace runtime {

using json = nlohmann::json;

namespace {

const std::set<std::string> CONSTRAINT_KEYS = {"owner", "address", "signer", "writable",
                                               "has_one", "seeds", "bump", "init", "close"};

const std::set<std::string> DESCRIPTOR_KEYS = {"name", "role", "size", "layout", "program"};

Result<std::vector<uint8_t>> parse_hex(const std::string &text) {
  if (text.size() % 2 != 0) {
    return Result<std::vector<uint8_t>>(Error::invalid_input("odd-length hex seed"));
  }
  std::vector<uint8_t> out;
  out.reserve(text.size() / 2);
  for (size_t i = 0; i < text.size(); i += 2) {
    auto nibble = [](char c) -> int {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    };
    int hi = nibble(text[i]);
    int lo = nibble(text[i + 1]);
    if (hi < 0 || lo < 0) {
      return Result<std::vector<uint8_t>>(Error::invalid_input("invalid hex seed " + text));
    }
    out.push_back(static_cast<uint8_t>(hi << 4 | lo));
  }
  return Result<std::vector<uint8_t>>(std::move(out));
}

Result<Seed> parse_seed(const json &j) {
  if (!j.is_object() || j.size() != 1) {
    return Result<Seed>(Error::invalid_input("a seed is an object with one key"));
  }
  if (j.contains("literal")) {
    return Result<Seed>(Seed::literal(j.at("literal").get<std::string>()));
  }
  if (j.contains("hex")) {
    auto bytes = parse_hex(j.at("hex").get<std::string>());
    if (bytes.is_err()) {
      return Result<Seed>(bytes.error());
    }
    return Result<Seed>(Seed::literal(std::move(bytes).value()));
  }
  if (j.contains("account")) {
    return Result<Seed>(Seed::account_key(j.at("account").get<std::string>()));
  }
  if (j.contains("field")) {
    return Result<Seed>(Seed::data_field(j.at("field").get<std::string>()));
  }
  return Result<Seed>(Error::invalid_input("unknown seed kind " + j.begin().key()));
}

Result<BumpSpec> parse_bump(const json &j) {
  if (!j.is_object() || j.size() != 1) {
    return Result<BumpSpec>(Error::invalid_input("a bump is an object with one key"));
  }
  if (j.contains("literal")) {
    int value = j.at("literal").get<int>();
    if (value < 0 || value > 255) {
      return Result<BumpSpec>(Error::invalid_input("bump out of range"));
    }
    return Result<BumpSpec>(BumpSpec::literal(static_cast<uint8_t>(value)));
  }
  if (j.contains("arg")) {
    return Result<BumpSpec>(BumpSpec::arg(j.at("arg").get<std::string>()));
  }
  if (j.contains("field")) {
    return Result<BumpSpec>(BumpSpec::data(j.at("field").get<std::string>()));
  }
  return Result<BumpSpec>(Error::invalid_input("unknown bump source " + j.begin().key()));
}

Result<PublicKey> parse_key(const json &j, const char *what) {
  auto key = pubkey_from_base58(j.get<std::string>());
  if (key.is_err()) {
    return Result<PublicKey>(Error::invalid_input(std::string(what) + ": " + key.error().message));
  }
  return key;
}

Result<ConstraintSet> parse_constraints(const json &j) {
  ConstraintSet set;

  if (j.contains("owner")) {
    auto key = parse_key(j.at("owner"), "owner");
    if (key.is_err()) {
      return Result<ConstraintSet>(key.error());
    }
    set.owner = key.value();
  }
  if (j.contains("address")) {
    auto key = parse_key(j.at("address"), "address");
    if (key.is_err()) {
      return Result<ConstraintSet>(key.error());
    }
    set.address = key.value();
  }
  set.signer = j.value("signer", false);
  set.writable = j.value("writable", false);
  if (j.contains("has_one")) {
    set.has_one = j.at("has_one").get<std::vector<std::string>>();
  }

  if (j.contains("seeds")) {
    SeedsConstraint seeds;
    for (const auto &entry : j.at("seeds")) {
      auto seed = parse_seed(entry);
      if (seed.is_err()) {
        return Result<ConstraintSet>(seed.error());
      }
      seeds.seeds.push_back(std::move(seed).value());
    }
    if (!j.contains("bump")) {
      return Result<ConstraintSet>(Error::invalid_input("seeds need a bump"));
    }
    auto bump = parse_bump(j.at("bump"));
    if (bump.is_err()) {
      return Result<ConstraintSet>(bump.error());
    }
    seeds.bump = bump.value();
    set.seeds = std::move(seeds);
  } else if (j.contains("bump")) {
    return Result<ConstraintSet>(Error::invalid_input("bump without seeds"));
  }

  if (j.contains("init")) {
    const json &init = j.at("init");
    InitSpec spec;
    spec.payer = init.at("payer").get<std::string>();
    if (init.contains("space")) {
      spec.space = init.at("space").get<size_t>();
    }
    set.init = spec;
  }
  if (j.contains("close")) {
    set.close = j.at("close").get<std::string>();
  }
  return Result<ConstraintSet>(std::move(set));
}

Result<AccountRole> parse_role(const std::string &name) {
  static const std::map<std::string, AccountRole> roles = {
      {"signer", AccountRole::SIGNER},   {"mut", AccountRole::MUT},
      {"readonly", AccountRole::READONLY}, {"account", AccountRole::ACCOUNT},
      {"program", AccountRole::PROGRAM}, {"unchecked", AccountRole::UNCHECKED}};
  auto it = roles.find(name);
  if (it == roles.end()) {
    return Result<AccountRole>(Error::invalid_input("unknown role " + name));
  }
  return Result<AccountRole>(it->second);
}

} // namespace

Result<ConstraintSet> constraints_from_json(const json &j) {
  if (!j.is_object()) {
    return Result<ConstraintSet>(Error::invalid_input("constraints must be an object"));
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (CONSTRAINT_KEYS.count(it.key()) == 0) {
      return Result<ConstraintSet>(Error::invalid_input("unknown constraint " + it.key()));
    }
  }

  try {
    return parse_constraints(j);
  } catch (const json::exception &e) {
    LOG_WARN("schema", "Rejecting constraint declaration: ", e.what());
    return Result<ConstraintSet>(Error::invalid_input(e.what()));
  }
}

Result<AccountDescriptor> descriptor_from_json(const json &j,
                                               const std::map<std::string, DataLayout> &layouts) {
  if (!j.is_object() || !j.contains("name") || !j.contains("role")) {
    return Result<AccountDescriptor>(Error::invalid_input("descriptor needs name and role"));
  }

  json constraint_part = json::object();
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (DESCRIPTOR_KEYS.count(it.key()) == 0) {
      constraint_part[it.key()] = it.value();
    }
  }
  auto constraints = constraints_from_json(constraint_part);
  if (constraints.is_err()) {
    return Result<AccountDescriptor>(constraints.error());
  }

  try {
    auto role = parse_role(j.at("role").get<std::string>());
    if (role.is_err()) {
      return Result<AccountDescriptor>(role.error());
    }

    const std::string name = j.at("name").get<std::string>();
    AccountDescriptor descriptor;
    switch (role.value()) {
    case AccountRole::ACCOUNT: {
      if (!j.contains("layout")) {
        return Result<AccountDescriptor>(Error::invalid_input(name + ": account role needs a layout"));
      }
      auto layout = layouts.find(j.at("layout").get<std::string>());
      if (layout == layouts.end()) {
        return Result<AccountDescriptor>(Error::invalid_input(name + ": unknown layout"));
      }
      descriptor = account(name, layout->second);
      break;
    }
    case AccountRole::PROGRAM: {
      if (!j.contains("program")) {
        return Result<AccountDescriptor>(Error::invalid_input(name + ": program role needs an id"));
      }
      auto id = parse_key(j.at("program"), "program");
      if (id.is_err()) {
        return Result<AccountDescriptor>(id.error());
      }
      descriptor = program(name, id.value());
      break;
    }
    case AccountRole::SIGNER:
      descriptor = signer(name);
      break;
    case AccountRole::MUT:
      descriptor = mut(name);
      break;
    case AccountRole::READONLY:
      descriptor = readonly(name);
      break;
    case AccountRole::UNCHECKED:
      descriptor = unchecked(name);
      break;
    }

    // Explicit constraints add to what the role implies
    ConstraintSet &c = descriptor.constraints;
    const ConstraintSet &declared = constraints.value();
    if (declared.owner) c.owner = declared.owner;
    if (declared.address) c.address = declared.address;
    if (declared.seeds) c.seeds = declared.seeds;
    if (declared.init) c.init = declared.init;
    if (declared.close) c.close = declared.close;
    c.signer = c.signer || declared.signer;
    c.writable = c.writable || declared.writable;
    c.has_one.insert(c.has_one.end(), declared.has_one.begin(), declared.has_one.end());

    if (j.contains("size")) {
      descriptor.sized(j.at("size").get<size_t>());
    }
    return Result<AccountDescriptor>(std::move(descriptor));
  } catch (const json::exception &e) {
    LOG_WARN("schema", "Rejecting account declaration: ", e.what());
    return Result<AccountDescriptor>(Error::invalid_input(e.what()));
  }
}

} // namespace runtime
} // namespace keel
