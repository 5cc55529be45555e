#include "crypto/pda.h"
#include "common/logging.h"

#include <cstring>
#include <memory>
#include <openssl/bn.h>
#include <stdexcept>

namespace keel {
namespace crypto {

namespace {

const char PDA_MARKER[] = "ProgramDerivedAddress";

struct BnDeleter {
  void operator()(BIGNUM *bn) const { BN_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX *ctx) const { BN_CTX_free(ctx); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

BnPtr new_bn() {
  BnPtr bn(BN_new());
  if (!bn) {
    throw std::runtime_error("BN_new failed");
  }
  return bn;
}

void check(int rc, const char *what) {
  if (rc != 1) {
    throw std::runtime_error(std::string(what) + " failed");
  }
}

// Field constants of edwards25519: p = 2^255 - 19, d = -121665/121666,
// and the Euler exponent (p - 1) / 2.
struct CurveConstants {
  BnPtr p;
  BnPtr d;
  BnPtr euler_exp;

  CurveConstants() : p(new_bn()), d(new_bn()), euler_exp(new_bn()) {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
      throw std::runtime_error("BN_CTX_new failed");
    }

    BN_zero(p.get());
    check(BN_set_bit(p.get(), 255), "BN_set_bit");
    check(BN_sub_word(p.get(), 19), "BN_sub_word");

    BnPtr denom = new_bn();
    check(BN_set_word(denom.get(), 121666), "BN_set_word");
    if (!BN_mod_inverse(denom.get(), denom.get(), p.get(), ctx.get())) {
      throw std::runtime_error("BN_mod_inverse failed");
    }
    BnPtr numer = new_bn();
    check(BN_set_word(numer.get(), 121665), "BN_set_word");
    check(BN_mod_mul(d.get(), numer.get(), denom.get(), p.get(), ctx.get()), "BN_mod_mul");
    check(BN_sub(d.get(), p.get(), d.get()), "BN_sub");

    check(BN_copy(euler_exp.get(), p.get()) != nullptr, "BN_copy");
    check(BN_sub_word(euler_exp.get(), 1), "BN_sub_word");
    check(BN_rshift1(euler_exp.get(), euler_exp.get()), "BN_rshift1");
  }
};

const CurveConstants &curve() {
  static const CurveConstants constants;
  return constants;
}

} // namespace

bool is_on_curve(const PublicKey &key) {
  const CurveConstants &c = curve();

  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    throw std::runtime_error("BN_CTX_new failed");
  }

  uint8_t y_bytes[32];
  std::memcpy(y_bytes, key.data(), sizeof(y_bytes));
  y_bytes[31] &= 0x7F;  // sign of x

  BnPtr y = new_bn();
  if (!BN_lebin2bn(y_bytes, sizeof(y_bytes), y.get())) {
    throw std::runtime_error("BN_lebin2bn failed");
  }
  check(BN_nnmod(y.get(), y.get(), c.p.get(), ctx.get()), "BN_nnmod");

  BnPtr y2 = new_bn();
  check(BN_mod_sqr(y2.get(), y.get(), c.p.get(), ctx.get()), "BN_mod_sqr");

  BnPtr one = new_bn();
  check(BN_one(one.get()), "BN_one");

  // u = y^2 - 1, v = d*y^2 + 1
  BnPtr u = new_bn();
  check(BN_mod_sub(u.get(), y2.get(), one.get(), c.p.get(), ctx.get()), "BN_mod_sub");
  BnPtr v = new_bn();
  check(BN_mod_mul(v.get(), c.d.get(), y2.get(), c.p.get(), ctx.get()), "BN_mod_mul");
  check(BN_mod_add(v.get(), v.get(), one.get(), c.p.get(), ctx.get()), "BN_mod_add");

  // u/v is a square iff u*v is (v is never zero since -1/d is a non-square)
  BnPtr uv = new_bn();
  check(BN_mod_mul(uv.get(), u.get(), v.get(), c.p.get(), ctx.get()), "BN_mod_mul");

  BnPtr legendre = new_bn();
  check(BN_mod_exp(legendre.get(), uv.get(), c.euler_exp.get(), c.p.get(), ctx.get()),
        "BN_mod_exp");

  return BN_is_zero(legendre.get()) || BN_is_one(legendre.get());
}

std::optional<PublicKey> create_program_address(const std::vector<ByteSlice> &seeds,
                                                const PublicKey &program_id) {
  if (seeds.size() > MAX_SEEDS) {
    LOG_DEBUG("pda", "Too many seeds: ", seeds.size());
    return std::nullopt;
  }
  for (const auto &seed : seeds) {
    if (seed.len > MAX_SEED_LEN) {
      LOG_DEBUG("pda", "Seed exceeds ", MAX_SEED_LEN, " bytes: ", seed.len);
      return std::nullopt;
    }
  }

  std::vector<ByteSlice> parts(seeds);
  parts.push_back({program_id.data(), program_id.size()});
  parts.push_back({reinterpret_cast<const uint8_t *>(PDA_MARKER), sizeof(PDA_MARKER) - 1});

  Hash32 hash = sha256(parts);
  if (is_on_curve(hash)) {
    return std::nullopt;
  }
  return hash;
}

std::optional<PublicKey> create_program_address(const SeedList &seeds,
                                                const PublicKey &program_id) {
  std::vector<ByteSlice> slices;
  slices.reserve(seeds.size());
  for (const auto &seed : seeds) {
    slices.push_back({seed.data(), seed.size()});
  }
  return create_program_address(slices, program_id);
}

std::optional<ProgramAddress> find_program_address(const SeedList &seeds,
                                                   const PublicKey &program_id) {
  std::vector<ByteSlice> slices;
  slices.reserve(seeds.size() + 1);
  for (const auto &seed : seeds) {
    slices.push_back({seed.data(), seed.size()});
  }

  uint8_t bump = 255;
  slices.push_back({&bump, 1});

  for (int candidate = 255; candidate >= 0; --candidate) {
    bump = static_cast<uint8_t>(candidate);
    auto address = create_program_address(slices, program_id);
    if (address) {
      return ProgramAddress{*address, bump};
    }
  }
  return std::nullopt;
}

} // namespace crypto
} // namespace keel
