#include "sealstream/base64.hpp"
#include "sealstream/sealstream.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

using sealstream::test::Bytes;
using sealstream::test::FastOptions;
using sealstream::test::FromHex;
using sealstream::test::Pattern;
using sealstream::test::ToBytes;

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path()
                / ("sealstream-test-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string File(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

void WriteFile(const std::string& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

}  // namespace

TEST(ByteArrayLayer, PasswordRoundTrip) {
    auto options = FastOptions();
    for (const Bytes& plain : {Bytes(), ToBytes("hello"), Pattern(4096)}) {
        Bytes sealed = sealstream::EncryptWithPassword(plain, "pw", options);
        EXPECT_EQ(sealstream::DecryptWithPassword(sealed, "pw", options), plain);
    }
}

TEST(ByteArrayLayer, KeyedRoundTripAndSizeValidation) {
    for (std::size_t key_size : {16u, 24u, 32u}) {
        Bytes key = sealstream::GenerateKey(key_size);
        Bytes plain = Pattern(77);
        Bytes sealed = sealstream::EncryptWithKey(plain, key);
        EXPECT_EQ(sealed.size(), 16u + 80u);
        EXPECT_EQ(sealstream::DecryptWithKey(sealed, key), plain);
    }
    EXPECT_THROW(sealstream::EncryptWithKey(Pattern(5), Pattern(15)), sealstream::InvalidArgument);
    EXPECT_THROW(sealstream::EncryptWithKey(Pattern(5), Pattern(20)), sealstream::InvalidArgument);
    EXPECT_THROW(sealstream::DecryptWithKey(Pattern(32), Pattern(20)), sealstream::InvalidArgument);
    EXPECT_THROW(sealstream::Encrypt(Pattern(5), Pattern(16), Pattern(17)), sealstream::InvalidArgument);
}

TEST(ByteArrayLayer, ExplicitIvFormMatchesKnownVector) {
    Bytes key = FromHex("2b7e151628aed2a6abf7158809cf4f3c");
    Bytes iv = FromHex("000102030405060708090a0b0c0d0e0f");
    Bytes plain = FromHex("6bc1bee22e409f96e93d7e117393172a");
    Bytes ct = sealstream::Encrypt(plain, key, iv);
    ASSERT_EQ(ct.size(), 32u);
    EXPECT_EQ(Bytes(ct.begin(), ct.begin() + 16), FromHex("7649abac8119b246cee98e9b12e9197d"));
    EXPECT_EQ(sealstream::Decrypt(ct, key, iv), plain);
}

TEST(ByteArrayLayer, InjectedRandomDrivesTheKeyedEnvelope) {
    sealstream::test::CountingRandom rng;
    Bytes key = Pattern(32);
    Bytes sealed = sealstream::EncryptWithKey(ToBytes("abc"), key, &rng);
    ASSERT_FALSE(rng.issued().empty());
    EXPECT_EQ(Bytes(sealed.begin(), sealed.begin() + 16), rng.issued()[0]);
}

TEST(TextLayer, Utf8TextRoundTripsThroughBase64) {
    auto options = FastOptions(24);
    std::string text = "gr\xC3\xBC\xC3\x9F" "e \xE2\x9C\x93";
    std::string sealed = sealstream::EncryptTextWithPassword(text, "pw", options);
    bool ok = false;
    Bytes raw = sealstream::base64::Decode(sealed, &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(raw.size(), 4u + 24u + 16u + 16u);
    EXPECT_EQ(sealstream::DecryptTextWithPassword(sealed, "pw", options), text);
}

TEST(TextLayer, InvalidBase64IsMalformed) {
    EXPECT_THROW(sealstream::DecryptTextWithPassword("not base64!", "pw", FastOptions()),
                 sealstream::MalformedEnvelope);
}

TEST(FileLayer, PasswordFileRoundTrip) {
    TempDir dir;
    Bytes plain = Pattern(200000);
    WriteFile(dir.File("plain.bin"), plain);
    auto options = FastOptions();

    std::uint64_t written = sealstream::EncryptFileWithPassword(dir.File("plain.bin"), dir.File("plain.bin.sse"),
                                                                "pw", options);
    EXPECT_EQ(written, fs::file_size(dir.File("plain.bin.sse")));
    EXPECT_EQ(written, 4u + 32u + 16u + 200000u + 16u - 200000u % 16u);

    sealstream::DecryptFileWithPassword(dir.File("plain.bin.sse"), dir.File("plain.out"), "pw", options);
    EXPECT_EQ(sealstream::ReadFile(dir.File("plain.out")), plain);
}

TEST(FileLayer, KeyedFileRoundTrip) {
    TempDir dir;
    Bytes plain = Pattern(1000);
    Bytes key = sealstream::GenerateKey(16);
    WriteFile(dir.File("in"), plain);
    sealstream::EncryptFileWithKey(dir.File("in"), dir.File("in.sse"), key);
    sealstream::DecryptFileWithKey(dir.File("in.sse"), dir.File("out"), key);
    EXPECT_EQ(sealstream::ReadFile(dir.File("out")), plain);
}

TEST(FileLayer, FailedDecryptRemovesPartialOutput) {
    TempDir dir;
    WriteFile(dir.File("truncated.sse"), Pattern(30));
    EXPECT_THROW(sealstream::DecryptFileWithKey(dir.File("truncated.sse"), dir.File("out"), Pattern(32)),
                 sealstream::CryptographicFailure);
    EXPECT_FALSE(fs::exists(dir.File("out")));
}

TEST(FileLayer, ArgumentErrorLeavesExistingOutputUntouched) {
    TempDir dir;
    WriteFile(dir.File("in"), Pattern(64));
    WriteFile(dir.File("out"), ToBytes("precious"));

    EXPECT_THROW(sealstream::EncryptFileWithPassword(dir.File("in"), dir.File("out"), "pw", FastOptions(20)),
                 sealstream::InvalidArgument);
    EXPECT_THROW(sealstream::EncryptFileWithKey(dir.File("in"), dir.File("out"), Pattern(20)),
                 sealstream::InvalidArgument);
    ASSERT_TRUE(fs::exists(dir.File("out")));
    EXPECT_EQ(sealstream::ReadFile(dir.File("out")), ToBytes("precious"));
}

TEST(FileLayer, FailedDecryptKeepsExistingOutputAndLeavesNoTempFile) {
    TempDir dir;
    WriteFile(dir.File("bad.sse"), Pattern(40));
    WriteFile(dir.File("out"), ToBytes("precious"));

    EXPECT_THROW(sealstream::DecryptFileWithPassword(dir.File("bad.sse"), dir.File("out"), "pw", FastOptions()),
                 sealstream::MalformedEnvelope);
    EXPECT_EQ(sealstream::ReadFile(dir.File("out")), ToBytes("precious"));

    std::size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir.File(""))) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 2u);
}

TEST(FileLayer, SuccessfulEncryptReplacesExistingOutput) {
    TempDir dir;
    Bytes key = Pattern(32, 9);
    WriteFile(dir.File("in"), Pattern(33));
    WriteFile(dir.File("out"), ToBytes("stale"));

    std::uint64_t written = sealstream::EncryptFileWithKey(dir.File("in"), dir.File("out"), key);
    EXPECT_EQ(written, 16u + 48u);
    EXPECT_EQ(sealstream::DecryptWithKey(sealstream::ReadFile(dir.File("out")), key), Pattern(33));
}

TEST(FileLayer, RejectsSamePathAndMissingInput) {
    TempDir dir;
    WriteFile(dir.File("a"), Pattern(10));
    EXPECT_THROW(sealstream::EncryptFileWithKey(dir.File("a"), dir.File("a"), Pattern(32)),
                 sealstream::InvalidArgument);
    EXPECT_THROW(sealstream::EncryptFileWithKey(dir.File("missing"), dir.File("b"), Pattern(32)),
                 std::runtime_error);
}

TEST(Inspect, ReportsEnvelopeFields) {
    sealstream::test::CountingRandom rng;
    auto options = FastOptions(16);
    options.rng = &rng;
    Bytes sealed = sealstream::EncryptWithPassword(Pattern(40), "pw", options);

    auto info = sealstream::InspectEnvelope(sealed, sealstream::password::KeySizeEncoding::kSaltLength);
    EXPECT_EQ(info.header_len, 20u);
    EXPECT_EQ(info.salt_len, 16u);
    EXPECT_EQ(info.key_size, 16u);
    EXPECT_EQ(info.iv_base64, sealstream::base64::Encode(rng.issued()[1]));
    EXPECT_EQ(info.ciphertext_len, 48u);
    EXPECT_TRUE(info.ciphertext_aligned);

    Bytes truncated(sealed.begin(), sealed.begin() + 25);
    EXPECT_THROW(sealstream::InspectEnvelope(truncated, sealstream::password::KeySizeEncoding::kSaltLength),
                 sealstream::MalformedEnvelope);
}

TEST(Keys, GenerateKeyValidatesSize) {
    EXPECT_EQ(sealstream::GenerateKey().size(), 32u);
    EXPECT_EQ(sealstream::GenerateKey(24).size(), 24u);
    EXPECT_THROW(sealstream::GenerateKey(20), sealstream::InvalidArgument);
    EXPECT_NE(sealstream::GenerateKey(16), sealstream::GenerateKey(16));
}

TEST(Passwords, ResolvePasswordReadsAnExistingFile) {
    TempDir dir;
    WriteFile(dir.File("secret.txt"), ToBytes("from-file"));
    EXPECT_EQ(sealstream::ResolvePassword(dir.File("secret.txt")), "from-file");
    EXPECT_EQ(sealstream::ResolvePassword("plain-password"), "plain-password");
    EXPECT_EQ(sealstream::ResolvePassword(""), "");
}

TEST(Keys, ParseKeySizeAcceptsOnlyWholeSupportedValues) {
    EXPECT_EQ(sealstream::ParseKeySize("16"), 16u);
    EXPECT_EQ(sealstream::ParseKeySize("24"), 24u);
    EXPECT_EQ(sealstream::ParseKeySize("32"), 32u);
    for (const char* bad : {"16abc", "32 ", " 16", "+16", "-16", "", "20", "0x10", "99999999999999999999999"}) {
        EXPECT_THROW(sealstream::ParseKeySize(bad), sealstream::InvalidArgument) << bad;
    }
}
