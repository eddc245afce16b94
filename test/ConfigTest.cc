#include "TestUtil.hh"

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, Defaults) {
    Config conf;
    EXPECT_EQ(conf._chunkSizeMB, 50u);
    EXPECT_EQ(conf._pktSize, DEFAULT_PKT_BASE);
    EXPECT_EQ(conf._hashAlg, "sha256");
    EXPECT_TRUE(conf._verbose);
}

TEST_F(ConfigTest, ParsesAllKeys) {
    writeBytes(path("sys.conf"),
               "# comment\n"
               "\n"
               "chunk_size_mb 8\n"
               "packet_size 65536\n"
               "hash_algorithm sha1\n"
               "verbose false\n");
    Config conf;
    ASSERT_EQ(conf.parseConf(path("sys.conf")), SUCCESS);
    EXPECT_EQ(conf._chunkSizeMB, 8u);
    EXPECT_EQ(conf._pktSize, 65536);
    EXPECT_EQ(conf._hashAlg, "sha1");
    EXPECT_FALSE(conf._verbose);
}

TEST_F(ConfigTest, ChunkSizeMustFitInBytes) {
    writeBytes(path("max.conf"), "chunk_size_mb 17592186044415\n");
    Config ok;
    ASSERT_EQ(ok.parseConf(path("max.conf")), SUCCESS);
    EXPECT_EQ(ok._chunkSizeMB, (uint64_t)MAX_CHUNK_SIZE_MB);

    writeBytes(path("over.conf"), "chunk_size_mb 17592186044417\n");
    Config over;
    EXPECT_EQ(over.parseConf(path("over.conf")), ERR_CONFIG_FILE);
    EXPECT_EQ(over._chunkSizeMB, 50u);
}

TEST_F(ConfigTest, MissingFile) {
    Config conf;
    EXPECT_EQ(conf.parseConf(path("nope.conf")), ERR_CONFIG_FILE);
    EXPECT_EQ(conf._chunkSizeMB, 50u);
}

TEST_F(ConfigTest, RejectsBadValues) {
    const char* bad[] = {
        "chunk_size_mb 0\n",
        "chunk_size_mb ten\n",
        "packet_size 0\n",
        "hash_algorithm md5\n",
        "verbose yes\n",
        "no_such_key 1\n",
        "chunk_size_mb\n",
    };
    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
        writeBytes(path("bad.conf"), bad[i]);
        Config conf;
        EXPECT_EQ(conf.parseConf(path("bad.conf")), ERR_CONFIG_FILE) << bad[i];
    }
}
