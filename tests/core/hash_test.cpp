#include "dfm/core/hash.hpp"
#include "support/test_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace dfm::hash;

namespace {

const std::uint8_t* bytes(const std::string& text) {
    return reinterpret_cast<const std::uint8_t*>(text.data());
}

} // namespace

TEST(HashTest, Sha256OfKnownInputs) {
    Sha256Hasher empty;
    EXPECT_EQ(empty.hex_digest(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    Sha256Hasher abc;
    const std::string text = "abc";
    abc.update(bytes(text), text.size());
    EXPECT_EQ(abc.hex_digest(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashTest, IncrementalMatchesOneShot) {
    const std::string data = dfm::test::make_bytes(100000, 7);

    Sha256Hasher whole;
    whole.update(bytes(data), data.size());

    Sha256Hasher pieces;
    for (std::size_t offset = 0; offset < data.size(); offset += 333) {
        const std::size_t size = std::min<std::size_t>(333, data.size() - offset);
        pieces.update(bytes(data) + offset, size);
    }

    EXPECT_EQ(whole.hex_digest(), pieces.hex_digest());
}

TEST(HashTest, Sha256File) {
    dfm::test::TempDir dir;
    const auto file = dir.path() / "abc.txt";
    dfm::test::write_file(file, "abc");

    auto digest = sha256_file(file);
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto missing = sha256_file(dir.path() / "missing");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, dfm::ErrorKind::LocalIo);
}

TEST(HashTest, WindowDigestIsMd5) {
    const std::string text = "abc";
    const auto digest = digest_window(bytes(text), text.size());
    EXPECT_EQ(to_hex(digest), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(HashTest, WindowDigestDistinguishesContent) {
    const std::string a = dfm::test::make_bytes(4096, 1);
    std::string b = a;
    b[2048] = static_cast<char>(b[2048] ^ 0x01);

    EXPECT_EQ(digest_window(bytes(a), a.size()), digest_window(bytes(a), a.size()));
    EXPECT_NE(digest_window(bytes(a), a.size()), digest_window(bytes(b), b.size()));
}
