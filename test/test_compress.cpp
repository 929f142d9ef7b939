/**
 * Incremental codecs: chunk_codec, compress() / decompress() pipelines
 * and the codec streams underneath them.
 */

#include <random>

#include "test_util.hpp"
#include "compress.hpp"

using namespace std;

// Pull chunks from a vector, one per call
static chunk_source from(const vector<string> &chunks) {
    auto idx = make_shared<size_t>(0);
    return [&chunks, idx](string &chunk) {
        if (*idx >= chunks.size())
            return false;
        chunk = chunks[(*idx)++];
        return true;
    };
}

static chunk_sink into(vector<string> &chunks) {
    return [&chunks](const string &chunk) {
        chunks.push_back(chunk);
        return true;
    };
}

static string sample_data(size_t len) {
    // Mix of repetitive text and noise so every backend has work to do
    mt19937 rng(1234);
    string words[] = { "alpha ", "beta ", "gamma\n", "delta ", "epsilon " };
    string out;
    while (out.size() < len) {
        if (rng() % 4 == 0)
            out.push_back(static_cast<char>(rng() & 0xff));
        else
            out += words[rng() % 5];
    }
    out.resize(len);
    return out;
}

static string compress_all(const vector<string> &chunks, format_t fmt, int level = DEFAULT_LEVEL) {
    vector<string> out;
    EXPECT_EQ(compress(from(chunks), into(out), fmt, nullptr, level), ERR_NONE);
    return join(out);
}

static err_t decompress_all(const vector<string> &chunks, format_t fmt, string &result,
                            const char *encoding = nullptr) {
    vector<string> out;
    err_t err = decompress(from(chunks), into(out), fmt, encoding);
    result = join(out);
    return err;
}

static const format_t all_formats[] = { GZIP, BZIP2, LZMA };

// ============================================================================
// Round trips
// ============================================================================

TEST(CodecTest, GzipTwoChunks) {
    vector<string> packed;
    ASSERT_EQ(compress(from({ "abc", "def" }), into(packed), GZIP, nullptr, 6), ERR_NONE);
    // One output per input chunk plus the flush
    EXPECT_EQ(packed.size(), 3u);

    string result;
    ASSERT_EQ(decompress_all(packed, GZIP, result), ERR_NONE);
    EXPECT_EQ(result, "abcdef");
}

TEST(CodecTest, RoundTripAnyChunking) {
    string data = sample_data(300000);
    for (format_t fmt : all_formats) {
        for (size_t in_sz : { 1000, 4096, 65536, 300000 }) {
            string packed = compress_all(split(data, in_sz), fmt);
            ASSERT_FALSE(packed.empty()) << fmt2name[fmt];
            for (size_t out_sz : { 1, 333, 1 << 20 }) {
                if (out_sz == 1 && packed.size() > 50000)
                    continue;
                string result;
                ASSERT_EQ(decompress_all(split(packed, out_sz), fmt, result), ERR_NONE)
                    << fmt2name[fmt] << " " << in_sz << " " << out_sz;
                EXPECT_EQ(result, data) << fmt2name[fmt] << " " << in_sz << " " << out_sz;
            }
        }
    }
}

TEST(CodecTest, SingleByteChunks) {
    string data = "the quick brown fox jumps over the lazy dog\n";
    for (format_t fmt : all_formats) {
        string packed = compress_all(split(data, 1), fmt);
        string result;
        ASSERT_EQ(decompress_all(split(packed, 1), fmt, result), ERR_NONE) << fmt2name[fmt];
        EXPECT_EQ(result, data);
    }
}

TEST(CodecTest, EmptyInput) {
    for (format_t fmt : all_formats) {
        vector<string> packed;
        ASSERT_EQ(compress(from({}), into(packed), fmt), ERR_NONE);
        // Nothing but the flush, which still carries a valid empty stream
        ASSERT_EQ(packed.size(), 1u);
        EXPECT_FALSE(packed[0].empty());

        string result;
        ASSERT_EQ(decompress_all(packed, fmt, result), ERR_NONE);
        EXPECT_TRUE(result.empty());
    }
}

TEST(CodecTest, NothingToDecompress) {
    for (format_t fmt : all_formats) {
        string result;
        EXPECT_EQ(decompress_all({}, fmt, result), ERR_NONE);
        EXPECT_TRUE(result.empty());
    }
}

TEST(CodecTest, LevelsAreHonoured) {
    string data = sample_data(200000);
    for (format_t fmt : all_formats) {
        int low = fmt == BZIP2 ? 1 : 0;
        string fast = compress_all(split(data, 8192), fmt, low);
        string best = compress_all(split(data, 8192), fmt, 9);
        string result;
        ASSERT_EQ(decompress_all({ fast }, fmt, result), ERR_NONE);
        EXPECT_EQ(result, data);
        ASSERT_EQ(decompress_all({ best }, fmt, result), ERR_NONE);
        EXPECT_EQ(result, data);
        // Level 0 is stored blocks
        if (fmt == GZIP)
            EXPECT_LT(best.size(), fast.size());
    }
}

// ============================================================================
// Concatenated streams and trailing data
// ============================================================================

TEST(CodecTest, ConcatenatedStreams) {
    for (format_t fmt : all_formats) {
        string packed = compress_all({ "first part, " }, fmt) + compress_all({ "second part" }, fmt);
        for (size_t sz : { 1, 5, 4096 }) {
            string result;
            ASSERT_EQ(decompress_all(split(packed, sz), fmt, result), ERR_NONE) << fmt2name[fmt];
            EXPECT_EQ(result, "first part, second part") << fmt2name[fmt] << " " << sz;
        }
    }
}

TEST(CodecTest, XzStreamPadding) {
    // Null padding in multiples of four bytes may separate xz streams
    string packed = compress_all({ "AAAA\n" }, LZMA) + string(4, '\0') + compress_all({ "BBBB\n" }, LZMA);
    for (size_t sz : { 1, 3, 4096 }) {
        string result;
        ASSERT_EQ(decompress_all(split(packed, sz), LZMA, result), ERR_NONE) << sz;
        EXPECT_EQ(result, "AAAA\nBBBB\n");
    }
}

TEST(CodecTest, PartialBzip2HeaderIsDropped) {
    string packed = compress_all({ "payload" }, BZIP2) + "BZ";
    string result;
    ASSERT_EQ(decompress_all({ packed }, BZIP2, result), ERR_NONE);
    EXPECT_EQ(result, "payload");
}

TEST(CodecTest, TrailingGarbageIsDropped) {
    for (format_t fmt : { GZIP, BZIP2 }) {
        string packed = compress_all({ "payload" }, fmt) + "garbage that is not compressed";
        string result;
        ASSERT_EQ(decompress_all({ packed }, fmt, result), ERR_NONE) << fmt2name[fmt];
        EXPECT_EQ(result, "payload");
    }
}

// ============================================================================
// Failures
// ============================================================================

TEST(CodecTest, XzTrailingGarbageIsCorrupt) {
    string packed = compress_all({ "payload" }, LZMA) + "garbage that is not compressed";
    string result;
    EXPECT_EQ(decompress_all({ packed }, LZMA, result), ERR_CORRUPT);
}

TEST(CodecTest, TruncatedSecondMember) {
    for (format_t fmt : all_formats) {
        string second = compress_all({ string(5000, 'x') + "second member\n" }, fmt);
        string packed = compress_all({ "first member\n" }, fmt) + second.substr(0, second.size() - 8);
        for (size_t sz : { 1, 7, 4096 }) {
            string result;
            EXPECT_EQ(decompress_all(split(packed, sz), fmt, result), ERR_CORRUPT)
                    << fmt2name[fmt] << " " << sz;
        }
    }
}

TEST(CodecTest, UnsupportedFailsBeforeReading) {
    bool pulled = false;
    chunk_source next = [&](string &) { pulled = true; return false; };
    vector<string> out;
    EXPECT_EQ(compress(next, into(out), UNKNOWN), ERR_UNSUPPORTED);
    EXPECT_EQ(decompress(next, into(out), UNKNOWN), ERR_UNSUPPORTED);
    EXPECT_FALSE(pulled);
    EXPECT_TRUE(out.empty());

    err_t err = ERR_NONE;
    EXPECT_EQ(chunk_codec::make(UNKNOWN, COMPRESS, -1, nullptr, &err), nullptr);
    EXPECT_EQ(err, ERR_UNSUPPORTED);
}

TEST(CodecTest, NotCompressedIsCorrupt) {
    for (format_t fmt : all_formats) {
        string result;
        EXPECT_EQ(decompress_all({ string(64, '\xff') + "this is plain text, not a compressed stream" }, fmt, result),
                  ERR_CORRUPT) << fmt2name[fmt];
    }
}

TEST(CodecTest, TruncatedIsCorrupt) {
    string data = sample_data(50000);
    for (format_t fmt : all_formats) {
        string packed = compress_all({ data }, fmt);
        packed.resize(packed.size() - 12);
        string result;
        EXPECT_EQ(decompress_all(split(packed, 1000), fmt, result), ERR_CORRUPT) << fmt2name[fmt];
    }
}

TEST(CodecTest, LargeBzip2Blocks) {
    // Smallest blocks, so compressed output overflows a buffer mid-input
    string data = sample_data(3 << 20);
    for (size_t in_sz : { (size_t) 65536, data.size() }) {
        string packed = compress_all(split(data, in_sz), BZIP2, 1);
        string result;
        ASSERT_EQ(decompress_all(split(packed, 100000), BZIP2, result), ERR_NONE) << in_sz;
        EXPECT_TRUE(result == data) << in_sz;
    }
}

TEST(CodecTest, InvalidLevel) {
    err_t err = ERR_NONE;
    EXPECT_EQ(chunk_codec::make(GZIP, COMPRESS, 42, nullptr, &err), nullptr);
    EXPECT_EQ(err, ERR_CONFIG);
    EXPECT_EQ(chunk_codec::make(BZIP2, COMPRESS, 0, nullptr, &err), nullptr);
    EXPECT_EQ(err, ERR_CONFIG);
    EXPECT_EQ(chunk_codec::make(LZMA, COMPRESS, 10, nullptr, &err), nullptr);
    EXPECT_EQ(err, ERR_CONFIG);
}

TEST(CodecTest, FlushHappensOnce) {
    auto codec = chunk_codec::make(GZIP, COMPRESS);
    ASSERT_NE(codec, nullptr);
    string out;
    ASSERT_TRUE(codec->feed("data", out));
    ASSERT_TRUE(codec->flush(out));
    EXPECT_FALSE(out.empty());
    EXPECT_FALSE(codec->flush(out));
    EXPECT_FALSE(codec->feed("more", out));
}

TEST(CodecTest, ErrorIsSticky) {
    auto codec = chunk_codec::make(GZIP, DECOMPRESS);
    ASSERT_NE(codec, nullptr);
    string out;
    EXPECT_FALSE(codec->feed(string(32, 'z'), out));
    EXPECT_EQ(codec->error(), ERR_CORRUPT);
    EXPECT_FALSE(codec->feed(string(32, 'z'), out));
    EXPECT_FALSE(codec->flush(out));
    EXPECT_EQ(codec->error(), ERR_CORRUPT);
}

// ============================================================================
// Text boundary
// ============================================================================

TEST(CodecTest, EncodeBeforeCompress) {
    // UTF-8 in, Latin-1 inside the compressed stream
    string text = "h\xc3\xa9llo w\xc3\xb6rld";
    vector<string> packed;
    // Split inside a multibyte sequence
    ASSERT_EQ(compress(from({ "h\xc3", "\xa9llo w\xc3", "\xb6rld" }), into(packed), GZIP, "ISO-8859-1"),
              ERR_NONE);

    string raw;
    ASSERT_EQ(decompress_all(packed, GZIP, raw), ERR_NONE);
    EXPECT_EQ(raw, "h\xe9llo w\xf6rld");

    string decoded;
    ASSERT_EQ(decompress_all(packed, GZIP, decoded, "ISO-8859-1"), ERR_NONE);
    EXPECT_EQ(decoded, text);
}

TEST(CodecTest, DecodeSplitSequence) {
    string text = "\xe2\x82\xac" "100 \xe2\x82\xac" "200";
    string packed = compress_all({ text }, BZIP2);
    for (size_t sz : { 1, 2, 3 }) {
        string result;
        ASSERT_EQ(decompress_all(split(packed, sz), BZIP2, result, "UTF-8"), ERR_NONE);
        EXPECT_EQ(result, text);
    }
}

TEST(CodecTest, UnknownEncoding) {
    err_t err = ERR_NONE;
    EXPECT_EQ(chunk_codec::make(GZIP, COMPRESS, -1, "NO-SUCH-CHARSET", &err), nullptr);
    EXPECT_EQ(err, ERR_CONFIG);
}

TEST(CodecTest, IncompleteTextIsCorrupt) {
    string packed = compress_all({ "abc\xc3" }, LZMA);
    string result;
    EXPECT_EQ(decompress_all({ packed }, LZMA, result, "UTF-8"), ERR_CORRUPT);
}

TEST(CodecTest, InvalidTextIsCorrupt) {
    vector<string> out;
    EXPECT_EQ(compress(from({ "ok", "\xff\xfe" }), into(out), GZIP, "ISO-8859-1"), ERR_CORRUPT);
}

// ============================================================================
// Codec streams
// ============================================================================

TEST(CodecStreamTest, EncoderIntoByteStream) {
    string packed;
    auto enc = get_encoder(LZMA, make_unique<byte_stream>(packed), 1);
    ASSERT_NE(enc, nullptr);
    ASSERT_TRUE(enc->write("streamed ", 9));
    ASSERT_TRUE(enc->write("through", 7));
    ASSERT_TRUE(enc->finish());
    EXPECT_EQ(check_fmt(packed.data(), packed.size()), LZMA);

    string plain;
    auto dec = get_decoder(LZMA, make_unique<byte_stream>(plain));
    ASSERT_NE(dec, nullptr);
    ASSERT_TRUE(dec->write(packed.data(), packed.size()));
    ASSERT_TRUE(dec->finish());
    EXPECT_EQ(plain, "streamed through");
}

TEST(CodecStreamTest, DestructorFinishes) {
    string packed;
    {
        auto enc = get_encoder(BZIP2, make_unique<byte_stream>(packed));
        ASSERT_NE(enc, nullptr);
        ASSERT_TRUE(enc->write("closed by scope", 15));
    }
    string result;
    ASSERT_EQ(decompress_all({ packed }, BZIP2, result), ERR_NONE);
    EXPECT_EQ(result, "closed by scope");
}

TEST(CodecStreamTest, UnknownFormat) {
    string sink;
    EXPECT_EQ(get_encoder(UNKNOWN, make_unique<byte_stream>(sink)), nullptr);
    EXPECT_EQ(get_decoder(UNKNOWN, make_unique<byte_stream>(sink)), nullptr);
}
