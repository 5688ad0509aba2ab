// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_PUBKEY_H
#define TALLY_PUBKEY_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

static const size_t COMPRESSED_PUBLIC_KEY_SIZE = 33;
static const size_t UNCOMPRESSED_PUBLIC_KEY_SIZE = 65;

// Version byte prepended to the key id in display addresses
static const uint8_t PUBKEY_ADDRESS_VERSION = 0x00;

/**
 * CPubKey: an encapsulated secp256k1 public key.
 *
 * Accepts SEC1 compressed (33 bytes) or uncompressed (65 bytes) encodings.
 * The point is decoded through OpenSSL, so bytes that are not on the curve
 * are rejected. Internally the key is always kept in compressed form, so two
 * encodings of the same point compare equal and serialize identically.
 */
class CPubKey
{
private:
    //! Compressed SEC1 encoding, empty when invalid
    std::vector<uint8_t> vch;

public:
    //! Construct an invalid public key
    CPubKey() {}

    //! Initialize from data
    CPubKey(const uint8_t* pbegin, const uint8_t* pend) { Set(pbegin, pend); }
    explicit CPubKey(const std::vector<uint8_t>& data) { Set(data.data(), data.data() + data.size()); }

    friend bool operator==(const CPubKey& a, const CPubKey& b) { return a.vch == b.vch; }
    friend bool operator!=(const CPubKey& a, const CPubKey& b) { return !(a == b); }
    friend bool operator<(const CPubKey& a, const CPubKey& b) { return a.vch < b.vch; }

    /**
     * Parse an encoded point
     * @return true if the bytes are a valid secp256k1 point
     */
    bool Set(const uint8_t* pbegin, const uint8_t* pend);

    bool IsValid() const { return !vch.empty(); }

    /**
     * Serialize the key. Compressed form is the canonical wallet address.
     */
    std::vector<uint8_t> Serialize(bool fCompressed = true) const;

    //! Key id: HASH160 of the compressed encoding
    std::vector<uint8_t> GetID() const;

    //! Key id of the uncompressed encoding (legacy scripts)
    std::vector<uint8_t> GetUncompressedID() const;

    //! Base58Check display address (version byte + key id)
    std::string GetAddress() const;
};

#endif // TALLY_PUBKEY_H
