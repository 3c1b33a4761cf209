#include "common/Digest.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "unit/FakeRuntime.hpp"

using rwd::common::Digest;

TEST(DigestTest, Sha256OfKnownVector) {
  EXPECT_EQ(Digest::sha256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, Sha256OfEmptyInput) {
  EXPECT_EQ(Digest::sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, FileHashMatchesStringHash) {
  rwd::test::TempDir td;
  // Larger than one read chunk so the streaming path is exercised
  std::string sContent(200 * 1024, 'x');
  sContent += "tail";
  rwd::test::writeFile(td.path() / "big.bin", sContent);

  EXPECT_EQ(Digest::sha256File(td.path() / "big.bin"), Digest::sha256Hex(sContent));
}

TEST(DigestTest, MissingFileThrows) {
  rwd::test::TempDir td;
  EXPECT_THROW(Digest::sha256File(td.path() / "absent"), std::runtime_error);
}

TEST(DigestTest, RandomHexHasRequestedLength) {
  const auto sHex = Digest::randomHex(6);
  ASSERT_EQ(sHex.size(), 12u);
  for (char c : sHex) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << sHex;
  }
}

TEST(DigestTest, RandomHexDoesNotRepeat) {
  std::set<std::string> setSeen;
  for (int i = 0; i < 100; ++i) {
    setSeen.insert(Digest::randomHex(6));
  }
  EXPECT_EQ(setSeen.size(), 100u);
}
