#include "TestUtil.hh"
#include "hashing/HashingHandler.hh"

class HashingHandlerTest : public TempDirTest {};

TEST_F(HashingHandlerTest, KnownVectors) {
    HashingHandler hasher(_conf, _fs);
    string hex;

    writeBytes(path("empty"), "");
    ASSERT_EQ(hasher.digestFile(path("empty"), &hex), SUCCESS);
    EXPECT_EQ(hex, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    writeBytes(path("abc"), "abc");
    ASSERT_EQ(hasher.digestFile(path("abc"), &hex), SUCCESS);
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashingHandlerTest, Sha1) {
    _conf->_hashAlg = "sha1";
    HashingHandler hasher(_conf, _fs);
    writeBytes(path("abc"), "abc");
    string hex;
    ASSERT_EQ(hasher.digestFile(path("abc"), &hex), SUCCESS);
    EXPECT_EQ(hex, "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(HashingHandlerTest, IndependentOfBlockSize) {
    writeBytes(path("data"), pattern(100003));
    string whole;
    {
        HashingHandler hasher(_conf, _fs);
        ASSERT_EQ(hasher.digestFile(path("data"), &whole), SUCCESS);
    }
    int sizes[] = {1, 7, 4096, 100003, 1 << 20};
    for (size_t i = 0; i < sizeof(sizes) / sizeof(sizes[0]); i++) {
        _conf->_pktSize = sizes[i];
        HashingHandler hasher(_conf, _fs);
        string hex;
        ASSERT_EQ(hasher.digestFile(path("data"), &hex), SUCCESS);
        EXPECT_EQ(hex, whole) << "packet size " << sizes[i];
    }
}

TEST_F(HashingHandlerTest, IncrementalMatchesFile) {
    string data = pattern(5000);
    writeBytes(path("data"), data);
    HashingHandler hasher(_conf, _fs);
    string fromFile, incremental;
    ASSERT_EQ(hasher.digestFile(path("data"), &fromFile), SUCCESS);
    ASSERT_EQ(hasher.init(), SUCCESS);
    ASSERT_EQ(hasher.update(data.data(), 1234), SUCCESS);
    ASSERT_EQ(hasher.update(data.data() + 1234, data.size() - 1234), SUCCESS);
    ASSERT_EQ(hasher.finish(&incremental), SUCCESS);
    EXPECT_EQ(incremental, fromFile);
}

TEST_F(HashingHandlerTest, MissingFile) {
    HashingHandler hasher(_conf, _fs);
    string hex = "untouched";
    EXPECT_EQ(hasher.digestFile(path("missing"), &hex), ERR_NOT_FOUND);
    EXPECT_EQ(hex, "untouched");
}

TEST_F(HashingHandlerTest, DirectoryIsNotAFile) {
    HashingHandler hasher(_conf, _fs);
    string hex;
    EXPECT_EQ(hasher.digestFile(_dir, &hex), ERR_NOT_FOUND);
}

TEST_F(HashingHandlerTest, UnknownAlgorithm) {
    _conf->_hashAlg = "md4";
    HashingHandler hasher(_conf, _fs);
    writeBytes(path("abc"), "abc");
    string hex;
    EXPECT_EQ(hasher.digestFile(path("abc"), &hex), ERR_HASH_ALG);
}

TEST_F(HashingHandlerTest, HexLengthFollowsAlgorithm) {
    {
        HashingHandler hasher(_conf, _fs);
        EXPECT_EQ(hasher.hexLength(), 64u);
    }
    _conf->_hashAlg = "sha1";
    {
        HashingHandler hasher(_conf, _fs);
        EXPECT_EQ(hasher.hexLength(), 40u);
    }
    _conf->_hashAlg = "md4";
    HashingHandler hasher(_conf, _fs);
    EXPECT_EQ(hasher.hexLength(), 0u);
}

TEST(HashingHandlerHexTest, ToHex) {
    unsigned char d[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(HashingHandler::toHex(d, 4), "000fa0ff");
}
