// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <uint256.h>
#include <util/strencodings.h>

#include <algorithm>
#include <ostream>
#include <vector>

const size_t uint256::WIDTH;

bool uint256::IsNull() const {
    return std::all_of(begin(), end(), [](uint8_t b) { return b == 0; });
}

std::string uint256::GetHex() const {
    std::vector<uint8_t> display(begin(), end());
    std::reverse(display.begin(), display.end());
    return HexStr(display);
}

void uint256::SetHex(const std::string& str) {
    memset(data, 0, WIDTH);

    std::string hex = str;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (hex.size() > 2 * WIDTH) {
        hex = hex.substr(hex.size() - 2 * WIDTH);
    }
    if (hex.size() % 2 != 0) {
        hex = "0" + hex;
    }
    if (!IsHex(hex)) {
        return;
    }

    // Least significant display byte is the first internal byte
    std::vector<uint8_t> bytes = ParseHex(hex);
    std::reverse_copy(bytes.begin(), bytes.end(), data);
}

std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}
