#include "nostrfs/crypto/schnorr.hpp"
#include "nostrfs/utils/tools.hpp"
#include <initializer_list>
#include <memory>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace nostrfs {
namespace crypto {

namespace {

using BNPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BNCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

const std::string TAG_CHALLENGE = "BIP0340/challenge";
const std::string TAG_AUX = "BIP0340/aux";
const std::string TAG_NONCE = "BIP0340/nonce";

BNPtr newBN() {
    return BNPtr(BN_new(), &BN_free);
}

BNPtr bytesToBN(const uint8_t* data, size_t len) {
    return BNPtr(BN_bin2bn(data, static_cast<int>(len), nullptr), &BN_free);
}

std::vector<uint8_t> bnToBytes(const BIGNUM* bn) {
    std::vector<uint8_t> out(32);
    BN_bn2binpad(bn, out.data(), static_cast<int>(out.size()));
    return out;
}

std::vector<uint8_t> concat(std::initializer_list<const std::vector<uint8_t>*> parts) {
    std::vector<uint8_t> out;
    for (const auto* part : parts) {
        out.insert(out.end(), part->begin(), part->end());
    }
    return out;
}

// secp256k1曲线参数
struct Curve {
    GroupPtr group{nullptr, &EC_GROUP_free};
    BNPtr p{nullptr, &BN_free};
    const BIGNUM* n = nullptr;
};

Error loadCurve(Curve& curve, BN_CTX* ctx) {
    curve.group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!curve.group) {
        return Error("Failed to load secp256k1 group");
    }
    curve.p = newBN();
    if (!curve.p || EC_GROUP_get_curve(curve.group.get(), curve.p.get(), nullptr, nullptr, ctx) != 1) {
        return Error("Failed to read secp256k1 field prime");
    }
    curve.n = EC_GROUP_get0_order(curve.group.get());
    if (!curve.n) {
        return Error("Failed to read secp256k1 group order");
    }
    return Error();
}

// 计算 out = int(hash) mod n
Error hashToScalar(const std::string& tag, const std::vector<uint8_t>& data,
                   const BIGNUM* n, BN_CTX* ctx, BIGNUM* out) {
    auto hash = TaggedHash(tag, data);
    if (!hash.ok()) {
        return hash.error();
    }
    if (!BN_bin2bn(hash.value().data(), static_cast<int>(hash.value().size()), out) ||
        BN_nnmod(out, out, n, ctx) != 1) {
        return Error("Failed to reduce hash modulo group order");
    }
    return Error();
}

// 返回 k 或 n-k，使对应点的y坐标为偶数
Error negateIfOddY(BIGNUM* k, const BIGNUM* y, const BIGNUM* n) {
    if (BN_is_odd(y)) {
        if (BN_sub(k, n, k) != 1) {
            return Error("Failed to negate scalar");
        }
    }
    return Error();
}

} // namespace

Result<std::vector<uint8_t>> TaggedHash(const std::string& tag, const std::vector<uint8_t>& data) {
    auto tagHash = utils::CalculateSHA256Hash(std::vector<uint8_t>(tag.begin(), tag.end()));
    if (!tagHash.ok()) {
        return tagHash.error();
    }
    return utils::CalculateSHA256Hash(concat({&tagHash.value(), &tagHash.value(), &data}));
}

Error SchnorrVerifier::Verify(const std::vector<uint8_t>& publicKey,
                              const std::vector<uint8_t>& signature,
                              const std::vector<uint8_t>& message) {
    if (publicKey.size() != PUBLIC_KEY_SIZE) {
        return Error("public key is incorrect size, must be " + std::to_string(PUBLIC_KEY_SIZE) +
                     ", was " + std::to_string(publicKey.size()));
    }
    if (signature.size() != SIGNATURE_SIZE) {
        return Error("signature length is incorrect, must be " + std::to_string(SIGNATURE_SIZE) +
                     ", was " + std::to_string(signature.size()));
    }

    BNCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) {
        return Error("Failed to create BN context");
    }
    Curve curve;
    Error err = loadCurve(curve, ctx.get());
    if (err.hasError()) {
        return err;
    }
    EC_GROUP* group = curve.group.get();

    // P = lift_x(px)，px >= p 或不在曲线上都会失败
    BNPtr px = bytesToBN(publicKey.data(), PUBLIC_KEY_SIZE);
    if (!px || BN_cmp(px.get(), curve.p.get()) >= 0) {
        return Error("public key is not a valid field element");
    }
    PointPtr P(EC_POINT_new(group), &EC_POINT_free);
    if (!P || EC_POINT_set_compressed_coordinates(group, P.get(), px.get(), 0, ctx.get()) != 1) {
        return Error("public key is not on secp256k1");
    }

    BNPtr r = bytesToBN(signature.data(), 32);
    BNPtr s = bytesToBN(signature.data() + 32, 32);
    if (!r || !s) {
        return Error("Failed to convert signature components to BIGNUM");
    }
    if (BN_cmp(r.get(), curve.p.get()) >= 0 || BN_cmp(s.get(), curve.n) >= 0) {
        return Error("signature components out of range");
    }

    std::vector<uint8_t> rBytes(signature.begin(), signature.begin() + 32);
    BNPtr e = newBN();
    BNPtr negE = newBN();
    BNPtr zero = newBN();
    if (!e || !negE || !zero) {
        return Error("Failed to allocate BIGNUM");
    }
    err = hashToScalar(TAG_CHALLENGE, concat({&rBytes, &publicKey, &message}), curve.n, ctx.get(), e.get());
    if (err.hasError()) {
        return err;
    }

    // R = s*G - e*P
    BN_zero(zero.get());
    if (BN_mod_sub(negE.get(), zero.get(), e.get(), curve.n, ctx.get()) != 1) {
        return Error("Failed to negate challenge");
    }

    PointPtr R(EC_POINT_new(group), &EC_POINT_free);
    if (!R || EC_POINT_mul(group, R.get(), s.get(), P.get(), negE.get(), ctx.get()) != 1) {
        return Error("Failed to compute R");
    }
    if (EC_POINT_is_at_infinity(group, R.get())) {
        return Error("schnorr verification failed: R is infinity");
    }

    BNPtr rx = newBN();
    BNPtr ry = newBN();
    if (!rx || !ry || EC_POINT_get_affine_coordinates(group, R.get(), rx.get(), ry.get(), ctx.get()) != 1) {
        return Error("Failed to read coordinates of R");
    }
    if (BN_is_odd(ry.get()) || BN_cmp(rx.get(), r.get()) != 0) {
        return Error("failed schnorr verification");
    }

    return Error();
}

Result<std::vector<uint8_t>> SchnorrPublicKey(const std::vector<uint8_t>& secretKey) {
    if (secretKey.size() != 32) {
        return Error("secret key must be 32 bytes");
    }

    BNCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) {
        return Error("Failed to create BN context");
    }
    Curve curve;
    Error err = loadCurve(curve, ctx.get());
    if (err.hasError()) {
        return err;
    }

    BNPtr d = bytesToBN(secretKey.data(), secretKey.size());
    if (!d || BN_is_zero(d.get()) || BN_cmp(d.get(), curve.n) >= 0) {
        return Error("secret key out of range");
    }

    PointPtr P(EC_POINT_new(curve.group.get()), &EC_POINT_free);
    BNPtr px = newBN();
    if (!P || !px ||
        EC_POINT_mul(curve.group.get(), P.get(), d.get(), nullptr, nullptr, ctx.get()) != 1 ||
        EC_POINT_get_affine_coordinates(curve.group.get(), P.get(), px.get(), nullptr, ctx.get()) != 1) {
        return Error("Failed to compute public key");
    }
    return bnToBytes(px.get());
}

Result<std::vector<uint8_t>> SchnorrSign(const std::vector<uint8_t>& secretKey,
                                         const std::vector<uint8_t>& message,
                                         const std::vector<uint8_t>& auxRand) {
    if (secretKey.size() != 32) {
        return Error("secret key must be 32 bytes");
    }
    if (auxRand.size() != 32) {
        return Error("auxiliary randomness must be 32 bytes");
    }

    BNCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) {
        return Error("Failed to create BN context");
    }
    Curve curve;
    Error err = loadCurve(curve, ctx.get());
    if (err.hasError()) {
        return err;
    }
    EC_GROUP* group = curve.group.get();

    BNPtr d = bytesToBN(secretKey.data(), secretKey.size());
    if (!d || BN_is_zero(d.get()) || BN_cmp(d.get(), curve.n) >= 0) {
        return Error("secret key out of range");
    }

    // P = d'*G，y为奇数时取 d = n - d'
    PointPtr P(EC_POINT_new(group), &EC_POINT_free);
    BNPtr px = newBN();
    BNPtr py = newBN();
    if (!P || !px || !py ||
        EC_POINT_mul(group, P.get(), d.get(), nullptr, nullptr, ctx.get()) != 1 ||
        EC_POINT_get_affine_coordinates(group, P.get(), px.get(), py.get(), ctx.get()) != 1) {
        return Error("Failed to compute public key");
    }
    err = negateIfOddY(d.get(), py.get(), curve.n);
    if (err.hasError()) {
        return err;
    }
    std::vector<uint8_t> pBytes = bnToBytes(px.get());

    // t = bytes(d) xor hash_aux(a)
    auto auxHash = TaggedHash(TAG_AUX, auxRand);
    if (!auxHash.ok()) {
        return auxHash.error();
    }
    std::vector<uint8_t> t = bnToBytes(d.get());
    for (size_t i = 0; i < t.size(); ++i) {
        t[i] ^= auxHash.value()[i];
    }

    BNPtr k = newBN();
    if (!k) {
        return Error("Failed to allocate BIGNUM");
    }
    err = hashToScalar(TAG_NONCE, concat({&t, &pBytes, &message}), curve.n, ctx.get(), k.get());
    if (err.hasError()) {
        return err;
    }
    BIGNUM* kBN = k.get();
    if (BN_is_zero(kBN)) {
        return Error("nonce is zero");
    }

    PointPtr R(EC_POINT_new(group), &EC_POINT_free);
    BNPtr rx = newBN();
    BNPtr ry = newBN();
    if (!R || !rx || !ry ||
        EC_POINT_mul(group, R.get(), kBN, nullptr, nullptr, ctx.get()) != 1 ||
        EC_POINT_get_affine_coordinates(group, R.get(), rx.get(), ry.get(), ctx.get()) != 1) {
        return Error("Failed to compute nonce point");
    }
    err = negateIfOddY(kBN, ry.get(), curve.n);
    if (err.hasError()) {
        return err;
    }
    std::vector<uint8_t> rBytes = bnToBytes(rx.get());

    BNPtr e = newBN();
    if (!e) {
        return Error("Failed to allocate BIGNUM");
    }
    err = hashToScalar(TAG_CHALLENGE, concat({&rBytes, &pBytes, &message}), curve.n, ctx.get(), e.get());
    if (err.hasError()) {
        return err;
    }

    // s = (k + e*d) mod n
    BNPtr s = newBN();
    if (!s ||
        BN_mod_mul(s.get(), e.get(), d.get(), curve.n, ctx.get()) != 1 ||
        BN_mod_add(s.get(), s.get(), kBN, curve.n, ctx.get()) != 1) {
        return Error("Failed to compute signature scalar");
    }

    std::vector<uint8_t> sBytes = bnToBytes(s.get());
    std::vector<uint8_t> signature = concat({&rBytes, &sBytes});

    SchnorrVerifier verifier;
    err = verifier.Verify(pBytes, signature, message);
    if (err.hasError()) {
        return Error("produced signature does not verify: " + err.what());
    }
    return signature;
}

} // namespace crypto
} // namespace nostrfs
