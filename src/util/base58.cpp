// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <util/base58.h>
#include <crypto/hash.h>
#include <algorithm>
#include <cstring>

static const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Address strings are tens of characters; the decode below is quadratic
static const size_t MAX_BASE58_LEN = 1024;

static const size_t CHECKSUM_SIZE = 4;

/** Character value in the alphabet, or -1 */
static int Base58Digit(char c) {
    const char* p = strchr(BASE58_ALPHABET, c);
    if (c == '\0' || p == nullptr) {
        return -1;
    }
    return static_cast<int>(p - BASE58_ALPHABET);
}

/**
 * Divide the big-endian number in num by divisor in place, returning the
 * remainder. Leading zero digits are left in num.
 */
static int DivMod(std::vector<uint8_t>& num, size_t start, int base, int divisor) {
    int remainder = 0;
    for (size_t i = start; i < num.size(); ++i) {
        int acc = remainder * base + num[i];
        num[i] = static_cast<uint8_t>(acc / divisor);
        remainder = acc % divisor;
    }
    return remainder;
}

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    size_t nLeadingZeros = 0;
    while (nLeadingZeros < data.size() && data[nLeadingZeros] == 0) {
        nLeadingZeros++;
    }

    std::vector<uint8_t> num(data);
    std::string digits;
    size_t start = nLeadingZeros;
    while (start < num.size()) {
        digits += BASE58_ALPHABET[DivMod(num, start, 256, 58)];
        while (start < num.size() && num[start] == 0) {
            start++;
        }
    }

    digits.append(nLeadingZeros, BASE58_ALPHABET[0]);
    std::reverse(digits.begin(), digits.end());
    return digits;
}

bool DecodeBase58(const std::string& str, std::vector<uint8_t>& data) {
    if (str.size() > MAX_BASE58_LEN) {
        return false;
    }

    std::vector<uint8_t> num;
    num.reserve(str.size());
    for (char c : str) {
        int digit = Base58Digit(c);
        if (digit < 0) {
            return false;
        }
        num.push_back(static_cast<uint8_t>(digit));
    }

    size_t nLeadingOnes = 0;
    while (nLeadingOnes < num.size() && num[nLeadingOnes] == 0) {
        nLeadingOnes++;
    }

    // Repeatedly divide the base-58 number by 256 to collect bytes
    std::vector<uint8_t> bytes;
    size_t start = nLeadingOnes;
    while (start < num.size()) {
        bytes.push_back(static_cast<uint8_t>(DivMod(num, start, 58, 256)));
        while (start < num.size() && num[start] == 0) {
            start++;
        }
    }

    data.assign(nLeadingOnes, 0);
    data.insert(data.end(), bytes.rbegin(), bytes.rend());
    return true;
}

std::string EncodeBase58Check(const std::vector<uint8_t>& data) {
    uint256 hash = Hash256(data);
    std::vector<uint8_t> vch(data);
    vch.insert(vch.end(), hash.begin(), hash.begin() + CHECKSUM_SIZE);
    return EncodeBase58(vch);
}

bool DecodeBase58Check(const std::string& str, std::vector<uint8_t>& data) {
    std::vector<uint8_t> vch;
    if (!DecodeBase58(str, vch) || vch.size() < CHECKSUM_SIZE) {
        return false;
    }

    std::vector<uint8_t> payload(vch.begin(), vch.end() - CHECKSUM_SIZE);
    uint256 hash = Hash256(payload);
    if (!std::equal(hash.begin(), hash.begin() + CHECKSUM_SIZE, vch.end() - CHECKSUM_SIZE)) {
        return false;
    }

    data.swap(payload);
    return true;
}
