// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <serialize.h>
#include <cstring>

bool CDataReader::ReadByte(uint8_t& value) {
    if (m_pos >= m_end) {
        return false;
    }
    value = *m_pos++;
    return true;
}

bool CDataReader::ReadBytes(size_t n, uint8_t* out) {
    if (Remaining() < n) {
        return false;
    }
    if (n > 0) {
        std::memcpy(out, m_pos, n);
    }
    m_pos += n;
    return true;
}

bool CDataReader::ReadBytes(size_t n, std::vector<uint8_t>& out) {
    if (Remaining() < n) {
        return false;
    }
    out.assign(m_pos, m_pos + n);
    m_pos += n;
    return true;
}

bool CDataReader::ReadVarBytes(std::vector<uint8_t>& out) {
    if (IsEmpty()) {
        return false;
    }
    size_t len = m_pos[0];
    if (Remaining() - 1 < len) {
        return false;
    }
    out.assign(m_pos + 1, m_pos + 1 + len);
    m_pos += 1 + len;
    return true;
}

bool CDataReader::ReadUint32LE(uint32_t& value) {
    if (Remaining() < 4) {
        return false;
    }
    value = static_cast<uint32_t>(m_pos[0]) |
            (static_cast<uint32_t>(m_pos[1]) << 8) |
            (static_cast<uint32_t>(m_pos[2]) << 16) |
            (static_cast<uint32_t>(m_pos[3]) << 24);
    m_pos += 4;
    return true;
}

bool CDataReader::ReadUint64LE(uint64_t& value) {
    if (Remaining() < 8) {
        return false;
    }
    value = 0;
    for (int i = 7; i >= 0; i--) {
        value = (value << 8) | m_pos[i];
    }
    m_pos += 8;
    return true;
}

bool CDataReader::ReadCompactSize(uint64_t& value) {
    const uint8_t* start = m_pos;
    uint8_t first;
    if (!ReadByte(first)) {
        return false;
    }

    bool ok = true;
    if (first < 253) {
        value = first;
    } else if (first == 253) {
        if (Remaining() < 2) {
            ok = false;
        } else {
            value = static_cast<uint64_t>(m_pos[0]) | (static_cast<uint64_t>(m_pos[1]) << 8);
            m_pos += 2;
        }
    } else if (first == 254) {
        uint32_t value32 = 0;
        ok = ReadUint32LE(value32);
        value = value32;
    } else {
        ok = ReadUint64LE(value);
    }

    if (!ok) {
        m_pos = start;
    }
    return ok;
}

void WriteUint32LE(std::vector<uint8_t>& data, uint32_t value) {
    for (int i = 0; i < 4; i++) {
        data.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void WriteUint64LE(std::vector<uint8_t>& data, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        data.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void WriteCompactSize(std::vector<uint8_t>& data, uint64_t size) {
    if (size < 253) {
        data.push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        data.push_back(253);
        data.push_back(static_cast<uint8_t>(size));
        data.push_back(static_cast<uint8_t>(size >> 8));
    } else if (size <= 0xFFFFFFFF) {
        data.push_back(254);
        WriteUint32LE(data, static_cast<uint32_t>(size));
    } else {
        data.push_back(255);
        WriteUint64LE(data, size);
    }
}

size_t GetCompactSizeLength(uint64_t size) {
    if (size < 253) return 1;
    if (size <= 0xFFFF) return 3;
    if (size <= 0xFFFFFFFF) return 5;
    return 9;
}
