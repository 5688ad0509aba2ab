// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_UINT256_H
#define TALLY_UINT256_H

#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <string>

/**
 * 256-bit hash (transaction ids), stored in internal byte order: the
 * order it appears on the wire and in the coin store. GetHex/SetHex use
 * display order, which is reversed.
 */
class uint256 {
public:
    static const size_t WIDTH = 32;

    uint8_t data[WIDTH];

    uint256() { memset(data, 0, WIDTH); }

    bool IsNull() const;

    /** memcmp order over internal bytes; a container key, not a numeric order */
    int Compare(const uint256& other) const { return memcmp(data, other.data, WIDTH); }

    bool operator<(const uint256& other) const { return Compare(other) < 0; }
    bool operator==(const uint256& other) const { return Compare(other) == 0; }
    bool operator!=(const uint256& other) const { return Compare(other) != 0; }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + WIDTH; }
    const uint8_t* end() const { return data + WIDTH; }
    static size_t size() { return WIDTH; }

    std::string GetHex() const;

    /** Parse display-order hex, optional 0x prefix; invalid input yields zero */
    void SetHex(const std::string& str);
};

std::ostream& operator<<(std::ostream& os, const uint256& h);

#endif // TALLY_UINT256_H
