#include "openssl_utils.h"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace makoto::internal {

namespace {
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using EcKeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

EvpPkeyPtr NullKey() {
  return EvpPkeyPtr(nullptr, &EVP_PKEY_free);
}

EvpPkeyPtr WrapEcKey(EC_KEY* ec) {
  EvpPkeyPtr pkey(EVP_PKEY_new(), &EVP_PKEY_free);
  if (!pkey) {
    return NullKey();
  }
  if (EVP_PKEY_set1_EC_KEY(pkey.get(), ec) != 1) {
    return NullKey();
  }
  return pkey;
}

const EC_KEY* GetEcKey(EVP_PKEY* key) {
  if (!key || EVP_PKEY_base_id(key) != EVP_PKEY_EC) {
    return nullptr;
  }
  return EVP_PKEY_get0_EC_KEY(key);
}

} // namespace

EvpPkeyPtr GenerateEcP256Key() {
  PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);
  if (!pctx) return NullKey();
  if (EVP_PKEY_keygen_init(pctx.get()) != 1) return NullKey();
  if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(), NID_X9_62_prime256v1) != 1) return NullKey();

  EVP_PKEY* key = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &key) != 1) return NullKey();
  return EvpPkeyPtr(key, &EVP_PKEY_free);
}

EvpPkeyPtr EcP256KeyFromPrivateScalar(std::span<const std::uint8_t> scalar) {
  if (scalar.size() != kP256ScalarSize) {
    return NullKey();
  }

  EcKeyPtr ec(EC_KEY_new_by_curve_name(NID_X9_62_prime256v1), &EC_KEY_free);
  if (!ec) {
    return NullKey();
  }
  const EC_GROUP* group = EC_KEY_get0_group(ec.get());

  BnPtr d(BN_bin2bn(scalar.data(), static_cast<int>(scalar.size()), nullptr), &BN_free);
  if (!d) {
    return NullKey();
  }

  // The scalar must be in [1, n-1].
  const BIGNUM* order = EC_GROUP_get0_order(group);
  if (BN_is_zero(d.get()) || BN_cmp(d.get(), order) >= 0) {
    return NullKey();
  }

  EcPointPtr pub(EC_POINT_new(group), &EC_POINT_free);
  if (!pub) {
    return NullKey();
  }
  if (EC_POINT_mul(group, pub.get(), d.get(), nullptr, nullptr, nullptr) != 1) {
    return NullKey();
  }

  if (EC_KEY_set_private_key(ec.get(), d.get()) != 1 || EC_KEY_set_public_key(ec.get(), pub.get()) != 1) {
    return NullKey();
  }

  return WrapEcKey(ec.get());
}

EvpPkeyPtr EcP256KeyFromPublicPoint(std::span<const std::uint8_t> sec1) {
  if (sec1.empty()) {
    return NullKey();
  }

  EcKeyPtr ec(EC_KEY_new_by_curve_name(NID_X9_62_prime256v1), &EC_KEY_free);
  if (!ec) {
    return NullKey();
  }
  const EC_GROUP* group = EC_KEY_get0_group(ec.get());

  EcPointPtr point(EC_POINT_new(group), &EC_POINT_free);
  if (!point) {
    return NullKey();
  }

  // Rejects points that are not on the curve.
  if (EC_POINT_oct2point(group, point.get(), sec1.data(), sec1.size(), nullptr) != 1) {
    return NullKey();
  }

  if (EC_KEY_set_public_key(ec.get(), point.get()) != 1) {
    return NullKey();
  }

  // Rejects the point at infinity.
  if (EC_KEY_check_key(ec.get()) != 1) {
    return NullKey();
  }

  return WrapEcKey(ec.get());
}

EvpPkeyPtr LoadEcP256PublicKeyFromPem(const std::string& pem) {
  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
  if (!bio) {
    return NullKey();
  }

  EvpPkeyPtr pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
  if (!pkey) {
    return NullKey();
  }

  const EC_KEY* ec = GetEcKey(pkey.get());
  if (!ec || EC_GROUP_get_curve_name(EC_KEY_get0_group(ec)) != NID_X9_62_prime256v1) {
    return NullKey();
  }

  return pkey;
}

std::optional<std::vector<std::uint8_t>> ExportUncompressedPublicPoint(EVP_PKEY* key) {
  const EC_KEY* ec = GetEcKey(key);
  if (!ec) {
    return std::nullopt;
  }

  const EC_GROUP* group = EC_KEY_get0_group(ec);
  const EC_POINT* pub = EC_KEY_get0_public_key(ec);
  if (!group || !pub) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out(kP256UncompressedPointSize);
  const std::size_t len = EC_POINT_point2oct(group, pub, POINT_CONVERSION_UNCOMPRESSED, out.data(), out.size(), nullptr);
  if (len != kP256UncompressedPointSize) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<std::uint8_t>> ExportPrivateScalar(EVP_PKEY* key) {
  const EC_KEY* ec = GetEcKey(key);
  if (!ec) {
    return std::nullopt;
  }

  const BIGNUM* d = EC_KEY_get0_private_key(ec);
  if (!d) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out(kP256ScalarSize);
  if (BN_bn2binpad(d, out.data(), static_cast<int>(out.size())) != static_cast<int>(kP256ScalarSize)) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<std::uint8_t>> EcdsaRawToDer(std::span<const std::uint8_t> raw_sig) {
  if (raw_sig.size() % 2 != 0 || raw_sig.empty()) {
    return std::nullopt;
  }

  const std::size_t n = raw_sig.size() / 2;
  BnPtr r(BN_bin2bn(raw_sig.data(), static_cast<int>(n), nullptr), &BN_free);
  BnPtr s(BN_bin2bn(raw_sig.data() + n, static_cast<int>(n), nullptr), &BN_free);
  if (!r || !s) {
    return std::nullopt;
  }

  EcdsaSigPtr sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
  if (!sig) {
    return std::nullopt;
  }

  // On success the signature owns r and s.
  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  r.release();
  s.release();

  const int len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (len <= 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* out = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &out) != len) {
    return std::nullopt;
  }
  return der;
}

std::optional<std::vector<std::uint8_t>> EcdsaDerToRaw(std::span<const std::uint8_t> der_sig, std::size_t component_size) {
  const unsigned char* p = der_sig.data();
  EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_sig.size())), &ECDSA_SIG_free);
  if (!sig) {
    return std::nullopt;
  }

  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  std::vector<std::uint8_t> raw(component_size * 2);
  if (BN_bn2binpad(r, raw.data(), static_cast<int>(component_size)) != static_cast<int>(component_size) ||
      BN_bn2binpad(s, raw.data() + component_size, static_cast<int>(component_size)) != static_cast<int>(component_size)) {
    return std::nullopt;
  }
  return raw;
}

std::optional<std::vector<std::uint8_t>> SignEs256(EVP_PKEY* key, std::span<const std::uint8_t> data) {
  if (!key) {
    return std::nullopt;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return std::nullopt;

  if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) return std::nullopt;
  if (EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1) return std::nullopt;

  std::size_t sig_len = 0;
  if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) return std::nullopt;
  std::vector<std::uint8_t> der(sig_len);
  if (EVP_DigestSignFinal(ctx.get(), der.data(), &sig_len) != 1) return std::nullopt;
  der.resize(sig_len);

  return EcdsaDerToRaw(der, kP256RawSignatureSize / 2);
}

bool VerifyEs256(EVP_PKEY* key, std::span<const std::uint8_t> data, std::span<const std::uint8_t> raw_sig) {
  if (!key) {
    return false;
  }

  auto der = EcdsaRawToDer(raw_sig);
  if (!der) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) return false;
  if (EVP_DigestVerifyUpdate(ctx.get(), data.data(), data.size()) != 1) return false;
  return EVP_DigestVerifyFinal(ctx.get(), der->data(), der->size()) == 1;
}

} // namespace makoto::internal
