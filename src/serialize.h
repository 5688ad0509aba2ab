// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_SERIALIZE_H
#define TALLY_SERIALIZE_H

#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * Positional binary reader over an untrusted byte buffer.
 *
 * Every read either consumes exactly what it asked for and returns true, or
 * leaves the cursor untouched and returns false. Callers that expect the
 * buffer to be fully consumed check IsEmpty() at the end.
 */
class CDataReader {
private:
    const uint8_t* m_begin;
    const uint8_t* m_pos;
    const uint8_t* m_end;

public:
    CDataReader(const uint8_t* data, size_t len)
        : m_begin(data), m_pos(data), m_end(data + len) {}

    explicit CDataReader(const std::vector<uint8_t>& data)
        : CDataReader(data.data(), data.size()) {}

    size_t Remaining() const { return static_cast<size_t>(m_end - m_pos); }
    size_t Position() const { return static_cast<size_t>(m_pos - m_begin); }
    bool IsEmpty() const { return m_pos == m_end; }

    /** Read one byte */
    bool ReadByte(uint8_t& value);

    /** Read exactly n bytes (fixed-length field) */
    bool ReadBytes(size_t n, uint8_t* out);
    bool ReadBytes(size_t n, std::vector<uint8_t>& out);

    /** Read a one-byte length, then that many bytes */
    bool ReadVarBytes(std::vector<uint8_t>& out);

    bool ReadUint32LE(uint32_t& value);
    bool ReadUint64LE(uint64_t& value);

    /** Bitcoin-style variable length integer (1, 3, 5 or 9 bytes) */
    bool ReadCompactSize(uint64_t& value);
};

void WriteUint32LE(std::vector<uint8_t>& data, uint32_t value);
void WriteUint64LE(std::vector<uint8_t>& data, uint64_t value);
void WriteCompactSize(std::vector<uint8_t>& data, uint64_t size);

/** Encoded length of a compact size */
size_t GetCompactSizeLength(uint64_t size);

#endif // TALLY_SERIALIZE_H
