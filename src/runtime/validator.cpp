#include "runtime/validator.h"
#include "common/logging.h"
#include "runtime/discriminator.h"

#include <cstring>

namespace keel {
namespace runtime {

namespace {

Result<bool> violation(ConstraintKind kind, const std::string &account, const std::string &detail) {
  LOG_WARN("validator", constraint_kind_name(kind), " check failed for account '", account,
           "': ", detail);
  return Result<bool>(Error::constraint_violation(kind, account + ": " + detail));
}

Result<crypto::SeedList> seeds_error(const std::string &account, const std::string &detail) {
  LOG_WARN("validator", "seeds check failed for account '", account, "': ", detail);
  return Result<crypto::SeedList>(
      Error::constraint_violation(ConstraintKind::SEEDS, account + ": " + detail));
}

} // namespace

Result<crypto::SeedList> resolve_seeds(const AccountDescriptor &descriptor,
                                       const AccountView &view,
                                       const std::vector<AccountDescriptor> &descriptors,
                                       const BoundAccounts &accounts, const ArgValues &args) {
  const SeedsConstraint &constraint = *descriptor.constraints.seeds;
  crypto::SeedList seeds;
  seeds.reserve(constraint.seeds.size() + 1);

  for (const auto &seed : constraint.seeds) {
    switch (seed.kind) {
    case SeedKind::LITERAL:
      seeds.push_back(seed.bytes);
      break;

    case SeedKind::ACCOUNT_KEY: {
      size_t index = descriptors.size();
      for (size_t i = 0; i < descriptors.size(); ++i) {
        if (descriptors[i].name == seed.reference) {
          index = i;
          break;
        }
      }
      if (index >= accounts.size()) {
        return seeds_error(descriptor.name, "seed account " + seed.reference + " is not bound");
      }
      const uint8_t *key = accounts[index].key();
      seeds.emplace_back(key, key + PUBKEY_BYTES);
      break;
    }

    case SeedKind::DATA_FIELD: {
      LayoutAccessor fields(*descriptor.layout, view.data(), view.data_len());
      auto bytes = fields.field_bytes(seed.reference);
      if (bytes.is_err()) {
        return seeds_error(descriptor.name, bytes.error().message);
      }
      const uint8_t *p = bytes.value().first;
      seeds.emplace_back(p, p + bytes.value().second);
      break;
    }
    }
  }

  uint8_t bump = 0;
  switch (constraint.bump.source) {
  case BumpSource::LITERAL:
    bump = constraint.bump.value;
    break;
  case BumpSource::ARG_FIELD: {
    auto value = args.get_u8(constraint.bump.field);
    if (value.is_err()) {
      return seeds_error(descriptor.name, value.error().message);
    }
    bump = value.value();
    break;
  }
  case BumpSource::DATA_FIELD: {
    LayoutAccessor fields(*descriptor.layout, view.data(), view.data_len());
    auto value = fields.get_unsigned(constraint.bump.field);
    if (value.is_err()) {
      return seeds_error(descriptor.name, value.error().message);
    }
    bump = static_cast<uint8_t>(value.value());
    break;
  }
  }

  seeds.push_back({bump});
  return Result<crypto::SeedList>(std::move(seeds));
}

Result<bool> Validator::validate(const std::vector<AccountDescriptor> &descriptors,
                                 const BoundAccounts &accounts) const {
  for (size_t i = 0; i < descriptors.size(); ++i) {
    auto result = validate_account(i, descriptors, accounts);
    if (result.is_err()) {
      return result;
    }
  }
  return ok();
}

Result<bool> Validator::validate_account(size_t position,
                                         const std::vector<AccountDescriptor> &descriptors,
                                         const BoundAccounts &accounts) const {
  const AccountDescriptor &descriptor = descriptors[position];
  const AccountView &view = accounts[position];
  const std::string &name = descriptor.name;
  const bool creating = descriptor.is_init();

  if (descriptor.requires_signer()) {
    observe(name, ConstraintKind::SIGNER);
    if (!view.is_signer()) {
      return violation(ConstraintKind::SIGNER, name, "account is not a signer");
    }
  }

  if (descriptor.requires_writable()) {
    observe(name, ConstraintKind::WRITABLE);
    if (!view.is_writable()) {
      return violation(ConstraintKind::WRITABLE, name, "account is not writable");
    }
  }

  auto owner = descriptor.expected_owner(program_id_);
  if (owner && !creating) {
    observe(name, ConstraintKind::OWNER);
    if (!view.owned_by(*owner)) {
      return violation(ConstraintKind::OWNER, name,
                       "owned by " + to_hex(view.owner_copy()) + ", expected " + to_hex(*owner));
    }
  }

  if (descriptor.constraints.address) {
    observe(name, ConstraintKind::ADDRESS);
    if (!view.key_is(*descriptor.constraints.address)) {
      return violation(ConstraintKind::ADDRESS, name,
                       "key " + to_hex(view.key_copy()) + " is not the declared address");
    }
  }

  if (descriptor.layout && descriptor.layout->has_discriminator() && !creating) {
    observe(name, ConstraintKind::DISCRIMINATOR);
    if (view.data_len() < DISCRIMINATOR_SIZE ||
        wire::load_u64(view.data()) != descriptor.layout->discriminator()) {
      return violation(ConstraintKind::DISCRIMINATOR, name,
                       "data is not a " + descriptor.layout->account_name() + " account");
    }
  }

  if (!creating) {
    for (const auto &target : descriptor.constraints.has_one) {
      observe(name, ConstraintKind::HAS_ONE);

      size_t target_index = position;
      for (size_t i = 0; i < position; ++i) {
        if (descriptors[i].name == target) {
          target_index = i;
          break;
        }
      }
      if (target_index == position) {
        return violation(ConstraintKind::HAS_ONE, name,
                         "target " + target + " must be declared before this account");
      }

      LayoutAccessor fields(*descriptor.layout, view.data(), view.data_len());
      auto stored = fields.get_pubkey(target);
      if (stored.is_err()) {
        return violation(ConstraintKind::HAS_ONE, name, stored.error().message);
      }
      if (!accounts[target_index].key_is(stored.value())) {
        return violation(ConstraintKind::HAS_ONE, name,
                         "stored " + target + " " + to_hex(stored.value()) +
                             " does not match account " + to_hex(accounts[target_index].key_copy()));
      }
    }
  }

  if (descriptor.constraints.seeds) {
    observe(name, ConstraintKind::SEEDS);
    auto seeds = resolve_seeds(descriptor, view, descriptors, accounts, args_);
    if (seeds.is_err()) {
      return Result<bool>(seeds.error());
    }
    auto derived = crypto::create_program_address(seeds.value(), program_id_);
    if (!derived) {
      return violation(ConstraintKind::SEEDS, name, "seeds do not derive an off-curve address");
    }
    if (!view.key_is(*derived)) {
      return violation(ConstraintKind::SEEDS, name,
                       "key " + to_hex(view.key_copy()) + " is not derived address " +
                           to_hex(*derived));
    }
  }

  return ok();
}

} // namespace runtime
} // namespace keel
