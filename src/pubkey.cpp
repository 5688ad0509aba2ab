// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <pubkey.h>
#include <crypto/hash.h>
#include <util/base58.h>

#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <memory>

namespace {

struct ECGroupDeleter {
    void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};

struct ECPointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

const EC_GROUP* Secp256k1Group() {
    // Created once, only ever used read-only afterwards
    static std::unique_ptr<EC_GROUP, ECGroupDeleter> group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    return group.get();
}

bool EncodePoint(const std::vector<uint8_t>& in, bool fCompressed, std::vector<uint8_t>& out) {
    const EC_GROUP* group = Secp256k1Group();
    if (group == nullptr) {
        return false;
    }

    std::unique_ptr<EC_POINT, ECPointDeleter> point(EC_POINT_new(group));
    if (!point || EC_POINT_oct2point(group, point.get(), in.data(), in.size(), nullptr) != 1) {
        return false;
    }

    if (EC_POINT_is_at_infinity(group, point.get())) {
        return false;
    }

    point_conversion_form_t form = fCompressed ? POINT_CONVERSION_COMPRESSED : POINT_CONVERSION_UNCOMPRESSED;
    out.resize(fCompressed ? COMPRESSED_PUBLIC_KEY_SIZE : UNCOMPRESSED_PUBLIC_KEY_SIZE);
    size_t written = EC_POINT_point2oct(group, point.get(), form, out.data(), out.size(), nullptr);
    if (written != out.size()) {
        out.clear();
        return false;
    }
    return true;
}

} // namespace

bool CPubKey::Set(const uint8_t* pbegin, const uint8_t* pend)
{
    vch.clear();

    if (pbegin == nullptr || pend <= pbegin) {
        return false;
    }

    size_t len = static_cast<size_t>(pend - pbegin);
    uint8_t header = pbegin[0];

    // Only plain SEC1 encodings; OpenSSL would also take hybrid (0x06/0x07)
    bool fCompressedForm = (len == COMPRESSED_PUBLIC_KEY_SIZE && (header == 0x02 || header == 0x03));
    bool fUncompressedForm = (len == UNCOMPRESSED_PUBLIC_KEY_SIZE && header == 0x04);
    if (!fCompressedForm && !fUncompressedForm) {
        return false;
    }

    std::vector<uint8_t> encoded(pbegin, pend);
    std::vector<uint8_t> compressed;
    if (!EncodePoint(encoded, true, compressed)) {
        return false;
    }

    vch = compressed;
    return true;
}

std::vector<uint8_t> CPubKey::Serialize(bool fCompressed) const
{
    if (!IsValid() || fCompressed) {
        return vch;
    }

    std::vector<uint8_t> uncompressed;
    if (!EncodePoint(vch, false, uncompressed)) {
        return std::vector<uint8_t>();
    }
    return uncompressed;
}

std::vector<uint8_t> CPubKey::GetID() const
{
    if (!IsValid()) {
        return std::vector<uint8_t>();
    }
    return Hash160(vch);
}

std::vector<uint8_t> CPubKey::GetUncompressedID() const
{
    std::vector<uint8_t> uncompressed = Serialize(false);
    if (uncompressed.empty()) {
        return std::vector<uint8_t>();
    }
    return Hash160(uncompressed);
}

std::string CPubKey::GetAddress() const
{
    if (!IsValid()) {
        return "";
    }

    std::vector<uint8_t> data;
    data.reserve(1 + HASH160_SIZE);
    data.push_back(PUBKEY_ADDRESS_VERSION);
    std::vector<uint8_t> id = GetID();
    data.insert(data.end(), id.begin(), id.end());
    return EncodeBase58Check(data);
}
