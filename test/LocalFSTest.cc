#include "TestUtil.hh"

class LocalFSTest : public TempDirTest {};

TEST_F(LocalFSTest, WriteThenRead) {
    string p = path("f");
    {
        unique_ptr<BaseFile> out(_fs->openFile(p, "write"));
        ASSERT_TRUE(out != nullptr);
        EXPECT_EQ(_fs->writeFile(out.get(), "hello world", 11), 11);
        EXPECT_EQ(_fs->closeFile(out.get()), SUCCESS);
    }
    uint64_t size = 0;
    ASSERT_EQ(_fs->getFileSize(p, &size), SUCCESS);
    EXPECT_EQ(size, 11u);

    unique_ptr<BaseFile> in(_fs->openFile(p, "read"));
    ASSERT_TRUE(in != nullptr);
    char buf[8];
    EXPECT_EQ(_fs->readFile(in.get(), buf, 8), 8);
    EXPECT_EQ(string(buf, 8), "hello wo");
    EXPECT_EQ(_fs->readFile(in.get(), buf, 8), 3);
    EXPECT_EQ(_fs->readFile(in.get(), buf, 8), 0);
}

TEST_F(LocalFSTest, OpenMissingOrBadMode) {
    EXPECT_TRUE(_fs->openFile(path("missing"), "read") == nullptr);
    EXPECT_TRUE(_fs->openFile(path("f"), "append") == nullptr);
}

TEST_F(LocalFSTest, FileSizeOfMissingFile) {
    uint64_t size = 42;
    EXPECT_EQ(_fs->getFileSize(path("missing"), &size), ERR_NOT_FOUND);
    EXPECT_EQ(size, 42u);
}

TEST_F(LocalFSTest, MakeDirIsIdempotent) {
    string d = path("sub");
    EXPECT_EQ(_fs->makeDir(d), SUCCESS);
    EXPECT_EQ(_fs->makeDir(d), SUCCESS);
    EXPECT_TRUE(_fs->isDir(d));
    EXPECT_FALSE(_fs->isFile(d));

    writeBytes(path("plain"), "x");
    EXPECT_EQ(_fs->makeDir(path("plain")), ERR_IO);
}

TEST_F(LocalFSTest, ListDirIsSorted) {
    writeBytes(path("b"), "");
    writeBytes(path("c"), "");
    writeBytes(path("a"), "");
    vector<string> names;
    ASSERT_EQ(_fs->listDir(_dir, &names), SUCCESS);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "a");
    EXPECT_EQ(names[1], "b");
    EXPECT_EQ(names[2], "c");

    vector<string> none;
    EXPECT_EQ(_fs->listDir(path("missing"), &none), ERR_NOT_FOUND);
}

TEST_F(LocalFSTest, RemoveFile) {
    writeBytes(path("f"), "x");
    EXPECT_EQ(_fs->removeFile(path("f")), SUCCESS);
    EXPECT_FALSE(_fs->exists(path("f")));
    EXPECT_EQ(_fs->removeFile(path("f")), ERR_NOT_FOUND);
}

TEST(FSUtilTest, BaseName) {
    EXPECT_EQ(FSUtil::baseName("a.bin"), "a.bin");
    EXPECT_EQ(FSUtil::baseName("/data/in/a.bin"), "a.bin");
    EXPECT_EQ(FSUtil::baseName("rel/dir/"), "dir");
}

TEST(FSUtilTest, JoinPath) {
    EXPECT_EQ(FSUtil::joinPath(".", "a"), "a");
    EXPECT_EQ(FSUtil::joinPath("", "a"), "a");
    EXPECT_EQ(FSUtil::joinPath("d", "a"), "d/a");
    EXPECT_EQ(FSUtil::joinPath("d/", "a"), "d/a");
}
