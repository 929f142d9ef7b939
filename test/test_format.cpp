#include "test_util.hpp"
#include "format.hpp"
#include "dataphile.hpp"

using namespace std;

TEST(FormatTest, NamesAndAliases) {
    EXPECT_EQ(name2fmt["gzip"], GZIP);
    EXPECT_EQ(name2fmt["gz"], GZIP);
    EXPECT_EQ(name2fmt["bzip"], BZIP2);
    EXPECT_EQ(name2fmt["bzip2"], BZIP2);
    EXPECT_EQ(name2fmt["bz2"], BZIP2);
    EXPECT_EQ(name2fmt["lzma"], LZMA);
    EXPECT_EQ(name2fmt["xz"], LZMA);

    EXPECT_EQ(name2fmt["zip"], UNKNOWN);
    EXPECT_EQ(name2fmt["GZIP"], UNKNOWN);
    EXPECT_EQ(name2fmt[""], UNKNOWN);
}

TEST(FormatTest, CanonicalNames) {
    EXPECT_STREQ(fmt2name[GZIP], "gzip");
    EXPECT_STREQ(fmt2name[BZIP2], "bzip");
    EXPECT_STREQ(fmt2name[LZMA], "lzma");
    EXPECT_STREQ(fmt2name[UNKNOWN], "raw");

    for (format_t fmt : { GZIP, BZIP2, LZMA })
        EXPECT_EQ(name2fmt[fmt2name[fmt]], fmt);
}

TEST(FormatTest, DetectByExtension) {
    EXPECT_EQ(check_ext("logs/app.log.gz"), GZIP);
    EXPECT_EQ(check_ext("ARCHIVE.GZ"), GZIP);
    EXPECT_EQ(check_ext("data.bz2"), BZIP2);
    EXPECT_EQ(check_ext("data.bz"), BZIP2);
    EXPECT_EQ(check_ext("data.xz"), LZMA);
    EXPECT_EQ(check_ext("data.lzma"), LZMA);

    EXPECT_EQ(check_ext("data.txt"), UNKNOWN);
    EXPECT_EQ(check_ext("gz"), UNKNOWN);
    EXPECT_EQ(check_ext("data.gz.txt"), UNKNOWN);
}

TEST(FormatTest, DetectByMagic) {
    EXPECT_EQ(check_fmt("\x1f\x8b\x08\x00", 4), GZIP);
    EXPECT_EQ(check_fmt("BZh91AY&SY", 10), BZIP2);
    EXPECT_EQ(check_fmt("\xfd" "7zXZ\x00\x00", 7), LZMA);

    // Legacy .lzma header with an unknown size
    string lzma("\x5d\x00\x00\x80\x00\xff\xff\xff\xff\xff\xff\xff\xff\x00", 14);
    EXPECT_EQ(check_fmt(lzma.data(), lzma.size()), LZMA);

    EXPECT_EQ(check_fmt("plain text", 10), UNKNOWN);
    // Too short to tell
    EXPECT_EQ(check_fmt("\x1f", 1), UNKNOWN);
    EXPECT_EQ(check_fmt("BZ", 2), UNKNOWN);
    EXPECT_EQ(check_fmt("", 0), UNKNOWN);
}

TEST(FormatTest, Supported) {
    EXPECT_FALSE(SUPPORTED(UNKNOWN));
    EXPECT_TRUE(SUPPORTED(GZIP));
    EXPECT_TRUE(SUPPORTED(BZIP2));
    EXPECT_TRUE(SUPPORTED(LZMA));
}

TEST(FormatTest, ErrorStrings) {
    EXPECT_STREQ(err2str(ERR_NONE), "success");
    EXPECT_STREQ(err2str(ERR_CONFIG), "invalid configuration");
    EXPECT_STREQ(err2str(ERR_NOT_FOUND), "source not found");
    EXPECT_STREQ(err2str(ERR_UNSUPPORTED), "unsupported algorithm");
    EXPECT_STREQ(err2str(ERR_CORRUPT), "corrupt stream");
    EXPECT_STREQ(err2str(ERR_IO), "I/O error");
}
