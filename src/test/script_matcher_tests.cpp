// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

/**
 * Script template matcher tests
 *
 * Covers the three template decoders and the output matcher:
 * exact-match decoding, marker corruption, truncation, trailing bytes and
 * the legacy signature script form.
 */

#include <boost/test/unit_test.hpp>

#include <script/matcher.h>
#include <script/script.h>
#include <util/logging.h>
#include <test/util/wallet_test_util.h>

BOOST_AUTO_TEST_SUITE(script_matcher_tests)

static std::vector<uint8_t> TestHash160() {
    return ParseHex(TEST_PUBKEY_G_HASH160);
}

// ============================================================================
// Pay-to-public-key-hash
// ============================================================================

BOOST_AUTO_TEST_CASE(p2pkh_roundtrip) {
    std::vector<uint8_t> hash = TestHash160();
    std::vector<uint8_t> script = BuildPayToPubKeyHash(hash);
    BOOST_CHECK_EQUAL(script.size(), 25U);
    BOOST_CHECK_EQUAL(HexStr(script), "76a914" + std::string(TEST_PUBKEY_G_HASH160) + "88ac");

    CPayToPubKeyHash out;
    std::string error;
    BOOST_CHECK(DecodePayToPubKeyHash(script, out, &error) == ScriptMatchStatus::OK);
    BOOST_CHECK(out.vchHash == hash);
}

BOOST_AUTO_TEST_CASE(p2pkh_corrupted_markers) {
    const std::vector<uint8_t> script = BuildPayToPubKeyHash(TestHash160());

    // Fixed bytes: OP_DUP, OP_HASH160, push-20, OP_EQUALVERIFY, OP_CHECKSIG
    const size_t positions[] = {0, 1, 2, 23, 24};
    for (size_t pos : positions) {
        std::vector<uint8_t> bad = script;
        bad[pos] ^= 0xff;

        CPayToPubKeyHash out;
        std::string error;
        BOOST_CHECK_MESSAGE(DecodePayToPubKeyHash(bad, out, &error) == ScriptMatchStatus::DECODE_ERROR,
                            "corrupted byte " << pos << " was accepted");
        BOOST_CHECK(!error.empty());
        BOOST_CHECK(out.vchHash.empty());
    }
}

BOOST_AUTO_TEST_CASE(p2pkh_truncated_and_trailing) {
    const std::vector<uint8_t> script = BuildPayToPubKeyHash(TestHash160());
    CPayToPubKeyHash out;

    for (size_t len = 0; len < script.size(); ++len) {
        std::vector<uint8_t> shortScript(script.begin(), script.begin() + len);
        BOOST_CHECK(DecodePayToPubKeyHash(shortScript, out) == ScriptMatchStatus::DECODE_ERROR);
    }

    std::vector<uint8_t> longScript = script;
    longScript.push_back(0x00);
    std::string error;
    BOOST_CHECK(DecodePayToPubKeyHash(longScript, out, &error) == ScriptMatchStatus::DECODE_ERROR);
    BOOST_CHECK(error.find("trailing") != std::string::npos);
}

// ============================================================================
// Pay-to-public-key
// ============================================================================

BOOST_AUTO_TEST_CASE(p2pk_roundtrip) {
    std::vector<uint8_t> pubkey = ParseHex(TEST_PUBKEY_G);
    std::vector<uint8_t> script = BuildPayToPubKey(pubkey);
    BOOST_CHECK_EQUAL(script.size(), 35U);
    BOOST_CHECK_EQUAL(script[0], 33);
    BOOST_CHECK_EQUAL(script.back(), OP_CHECKSIG);

    CPayToPubKey out;
    BOOST_CHECK(DecodePayToPubKey(script, out) == ScriptMatchStatus::OK);
    BOOST_CHECK(out.vchPubKey == pubkey);

    // Uncompressed keys use the same template
    std::vector<uint8_t> uncompressed = ParseHex(TEST_PUBKEY_G_UNCOMPRESSED);
    BOOST_CHECK(DecodePayToPubKey(BuildPayToPubKey(uncompressed), out) == ScriptMatchStatus::OK);
    BOOST_CHECK(out.vchPubKey == uncompressed);
}

BOOST_AUTO_TEST_CASE(p2pk_wrong_final_opcode) {
    std::vector<uint8_t> script = BuildPayToPubKey(ParseHex(TEST_PUBKEY_G));
    script.back() = OP_EQUALVERIFY;

    CPayToPubKey out;
    std::string error;
    BOOST_CHECK(DecodePayToPubKey(script, out, &error) == ScriptMatchStatus::DECODE_ERROR);
    BOOST_CHECK(error.find("OP_CHECKSIG") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(p2pk_length_mismatch) {
    std::vector<uint8_t> script = BuildPayToPubKey(ParseHex(TEST_PUBKEY_G));

    // Length byte claims more than is present
    std::vector<uint8_t> longer = script;
    longer[0] = 40;
    CPayToPubKey out;
    BOOST_CHECK(DecodePayToPubKey(longer, out) == ScriptMatchStatus::DECODE_ERROR);

    // Length byte claims less, leaving key bytes after the "checksig" position
    std::vector<uint8_t> shorter = script;
    shorter[0] = 20;
    BOOST_CHECK(DecodePayToPubKey(shorter, out) == ScriptMatchStatus::DECODE_ERROR);

    std::vector<uint8_t> empty;
    BOOST_CHECK(DecodePayToPubKey(empty, out) == ScriptMatchStatus::DECODE_ERROR);
}

// ============================================================================
// Signature scripts
// ============================================================================

BOOST_AUTO_TEST_CASE(scriptsig_roundtrip) {
    std::vector<uint8_t> pubkey = ParseHex(TEST_PUBKEY_G);
    std::vector<uint8_t> r(32, 0x11);
    std::vector<uint8_t> s(31, 0x22);
    std::vector<uint8_t> script = BuildScriptSig(r, s, pubkey);

    CScriptSigHeader header;
    CScriptSigTail tail;
    std::string error;
    BOOST_REQUIRE(DecodeScriptSig(script, header, tail, &error) == ScriptMatchStatus::OK);

    BOOST_CHECK_EQUAL(header.nSequenceMarker, DER_SEQUENCE_MARKER);
    BOOST_CHECK_EQUAL(header.nRSLength, 4 + 32 + 31);
    BOOST_CHECK_EQUAL(header.nSigLength, 2 + 4 + 32 + 31 + 1);
    BOOST_CHECK(header.vchR == r);
    BOOST_CHECK(header.vchS == s);
    BOOST_CHECK_EQUAL(tail.nHashType, SIGHASH_ALL);
    BOOST_CHECK(tail.vchPubKey == pubkey);
}

BOOST_AUTO_TEST_CASE(scriptsig_header_leaves_reader_at_tail) {
    std::vector<uint8_t> pubkey = ParseHex(TEST_PUBKEY_2G);
    std::vector<uint8_t> script = MakeTestScriptSig(pubkey);

    CDataReader reader(script);
    CScriptSigHeader header;
    BOOST_REQUIRE(DecodeScriptSigHeader(reader, header) == ScriptMatchStatus::OK);
    BOOST_CHECK_EQUAL(reader.Remaining(), 2 + pubkey.size());

    CScriptSigTail tail;
    BOOST_CHECK(DecodeScriptSigTail(reader, tail) == ScriptMatchStatus::OK);
    BOOST_CHECK(reader.IsEmpty());
    BOOST_CHECK(tail.vchPubKey == pubkey);
}

BOOST_AUTO_TEST_CASE(scriptsig_corrupted_markers) {
    const std::vector<uint8_t> script = MakeTestScriptSig(ParseHex(TEST_PUBKEY_G));

    // 0x30 at 1, R marker at 3, S marker after R (4 + 1 + 32)
    const size_t positions[] = {1, 3, 37};
    for (size_t pos : positions) {
        std::vector<uint8_t> bad = script;
        bad[pos] = 0x05;

        CDataReader reader(bad);
        CScriptSigHeader header;
        std::string error;
        BOOST_CHECK_MESSAGE(DecodeScriptSigHeader(reader, header, &error) == ScriptMatchStatus::DECODE_ERROR,
                            "corrupted marker at " << pos << " was accepted");
        BOOST_CHECK(error.find("marker") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(scriptsig_legacy_form_is_unsupported) {
    // Header only, nothing after S
    std::vector<uint8_t> full = MakeTestScriptSig(ParseHex(TEST_PUBKEY_G));
    std::vector<uint8_t> headerOnly(full.begin(), full.begin() + 2 + 4 + 32 + 32 + 1);

    CDataReader reader(headerOnly);
    CScriptSigHeader header;
    std::string error;
    BOOST_CHECK(DecodeScriptSigHeader(reader, header, &error) == ScriptMatchStatus::UNSUPPORTED_FORMAT);
    BOOST_CHECK(!error.empty());

    // The empty-remainder check comes before the marker checks
    std::vector<uint8_t> badMarker = headerOnly;
    badMarker[1] = 0x31;
    CDataReader reader2(badMarker);
    BOOST_CHECK(DecodeScriptSigHeader(reader2, header) == ScriptMatchStatus::UNSUPPORTED_FORMAT);
}

BOOST_AUTO_TEST_CASE(scriptsig_truncated_header) {
    std::vector<uint8_t> full = MakeTestScriptSig(ParseHex(TEST_PUBKEY_G));

    // Cut inside R
    std::vector<uint8_t> cut(full.begin(), full.begin() + 20);
    CDataReader reader(cut);
    CScriptSigHeader header;
    BOOST_CHECK(DecodeScriptSigHeader(reader, header) == ScriptMatchStatus::DECODE_ERROR);
    // A failed decode does not consume anything visible to the caller
    BOOST_CHECK_EQUAL(header.vchR.size(), 0U);
}

BOOST_AUTO_TEST_CASE(scriptsig_tail_errors) {
    std::vector<uint8_t> pubkey = ParseHex(TEST_PUBKEY_G);
    CScriptSigHeader header;
    CScriptSigTail tail;

    // Trailing byte after the key
    std::vector<uint8_t> trailing = MakeTestScriptSig(pubkey);
    trailing.push_back(0x00);
    BOOST_CHECK(DecodeScriptSig(trailing, header, tail) == ScriptMatchStatus::DECODE_ERROR);

    // Key length larger than what is left
    std::vector<uint8_t> shortKey = MakeTestScriptSig(pubkey);
    shortKey.pop_back();
    BOOST_CHECK(DecodeScriptSig(shortKey, header, tail) == ScriptMatchStatus::DECODE_ERROR);

    // Hash type other than SIGHASH_ALL
    std::vector<uint8_t> otherHashType = MakeTestScriptSig(pubkey, 0x03);
    std::string error;
    BOOST_CHECK(DecodeScriptSig(otherHashType, header, tail, &error) == ScriptMatchStatus::UNSUPPORTED_FORMAT);
    BOOST_CHECK(error.find("0x03") != std::string::npos);
}

// ============================================================================
// Output matching
// ============================================================================

BOOST_AUTO_TEST_CASE(match_output_prefers_p2pkh) {
    std::vector<uint8_t> hash = TestHash160();
    COutputMatch match;
    BOOST_CHECK(MatchOutputScript(BuildPayToPubKeyHash(hash), match) == ScriptMatchStatus::OK);
    BOOST_CHECK(match.type == CoinType::PUBKEYHASH);
    BOOST_CHECK(match.vchData == hash);

    std::vector<uint8_t> pubkey = ParseHex(TEST_PUBKEY_3G);
    BOOST_CHECK(MatchOutputScript(BuildPayToPubKey(pubkey), match) == ScriptMatchStatus::OK);
    BOOST_CHECK(match.type == CoinType::PUBKEY);
    BOOST_CHECK(match.vchData == pubkey);
}

BOOST_AUTO_TEST_CASE(match_output_reports_both_errors) {
    std::vector<uint8_t> script = {0x6a, 0x04, 0xde, 0xad, 0xbe, 0xef};  // OP_RETURN data

    COutputMatch match;
    std::string error;
    BOOST_CHECK(MatchOutputScript(script, match, &error) == ScriptMatchStatus::DECODE_ERROR);
    BOOST_CHECK(error.find("pubkeyhash") != std::string::npos);
    BOOST_CHECK(error.find("pubkey:") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(rejections_log_under_script_category) {
    CLogger& logger = CLogger::GetInstance();
    CLoggingConfig& logging = CLoggingConfig::GetInstance();
    logging.SetCategories(static_cast<uint32_t>(LogCategory::SCRIPT));

    std::vector<uint8_t> unknown = {0x6a, 0x01, 0x00};
    std::vector<uint8_t> otherHashType = MakeTestScriptSig(ParseHex(TEST_PUBKEY_G), 0x03);
    COutputMatch match;
    CScriptSigHeader header;
    CScriptSigTail tail;

    uint64_t before = logger.GetMessageCount();
    BOOST_CHECK(MatchOutputScript(unknown, match) == ScriptMatchStatus::DECODE_ERROR);
    BOOST_CHECK(DecodeScriptSig(otherHashType, header, tail) == ScriptMatchStatus::UNSUPPORTED_FORMAT);
    BOOST_CHECK_EQUAL(logger.GetMessageCount(), before + 2);

    // Accepted scripts are not logged
    BOOST_CHECK(MatchOutputScript(BuildPayToPubKeyHash(TestHash160()), match) == ScriptMatchStatus::OK);
    BOOST_CHECK_EQUAL(logger.GetMessageCount(), before + 2);

    logging.DisableCategory(LogCategory::SCRIPT);
    BOOST_CHECK(MatchOutputScript(unknown, match) == ScriptMatchStatus::DECODE_ERROR);
    BOOST_CHECK_EQUAL(logger.GetMessageCount(), before + 2);

    logging.SetCategories(static_cast<uint32_t>(LogCategory::ALL));
}

BOOST_AUTO_TEST_CASE(status_names) {
    BOOST_CHECK_EQUAL(std::string(GetScriptMatchStatusName(ScriptMatchStatus::OK)), "ok");
    BOOST_CHECK_EQUAL(std::string(GetScriptMatchStatusName(ScriptMatchStatus::UNSUPPORTED_FORMAT)),
                      "unsupported format");
    BOOST_CHECK_EQUAL(std::string(GetCoinTypeName(CoinType::PUBKEY)), "pubkey");
}

BOOST_AUTO_TEST_SUITE_END()
