// Tests for HLS media and variant playlist parsing

#include <QtTest>

#include <segmented_stream_platform/ssp_hls_playlist.h>

using ssp::ErrorCode;
namespace hls = ssp::hls;

class TestHlsPlaylist : public QObject
{
    Q_OBJECT

private slots:
    void test_media_playlist_basic() {
        const std::string text =
            "#EXTM3U\n"
            "#EXT-X-VERSION:3\n"
            "#EXT-X-TARGETDURATION:10\n"
            "#EXT-X-MEDIA-SEQUENCE:100\n"
            "#EXT-X-PLAYLIST-TYPE:VOD\n"
            "#EXTINF:9.5,first\n"
            "seg100.ts\n"
            "#EXTINF:10,\n"
            "http://cdn.example.com/seg101.ts\n"
            "#EXT-X-DISCONTINUITY\n"
            "#EXTINF:4.25\n"
            "/abs/seg102.ts\n"
            "#EXT-X-ENDLIST\n";
        auto parsed = hls::ParseMediaPlaylist(text, "http://host/vod/index.m3u8");
        QVERIFY(parsed.is_ok());
        const auto& pl = parsed.value();
        QCOMPARE(pl.target_duration, 10.0);
        QCOMPARE(pl.media_sequence, int64_t(100));
        QCOMPARE(pl.playlist_type, std::string("VOD"));
        QVERIFY(pl.end_list);
        QCOMPARE(pl.segments.size(), size_t(3));
        QCOMPARE(pl.first_sequence(), int64_t(100));
        QCOMPARE(pl.last_sequence(), int64_t(102));

        QCOMPARE(pl.segments[0].uri, std::string("http://host/vod/seg100.ts"));
        QCOMPARE(pl.segments[0].duration, 9.5);
        QCOMPARE(pl.segments[0].title, std::string("first"));
        QCOMPARE(pl.segments[1].uri, std::string("http://cdn.example.com/seg101.ts"));
        QCOMPARE(pl.segments[2].uri, std::string("http://host/abs/seg102.ts"));
        QVERIFY(pl.segments[2].discontinuity);
        QVERIFY(!pl.segments[1].discontinuity);
    }

    void test_crlf_and_blank_lines() {
        const std::string text = "#EXTM3U\r\n\r\n#EXT-X-TARGETDURATION:6\r\n#EXTINF:6,\r\na.ts\r\n";
        auto parsed = hls::ParseMediaPlaylist(text, "http://host/p.m3u8");
        QVERIFY(parsed.is_ok());
        QCOMPARE(parsed.value().segments.size(), size_t(1));
        QCOMPARE(parsed.value().segments[0].uri, std::string("http://host/a.ts"));
        QVERIFY(!parsed.value().end_list);
    }

    void test_keys_apply_until_changed() {
        const std::string text =
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:4\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"key1.bin\"\n"
            "#EXTINF:4,\n"
            "a.ts\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"https://keys/k2\",IV=0x000102030405060708090a0b0c0d0e0f\n"
            "#EXTINF:4,\n"
            "b.ts\n"
            "#EXT-X-KEY:METHOD=NONE\n"
            "#EXTINF:4,\n"
            "c.ts\n";
        auto parsed = hls::ParseMediaPlaylist(text, "http://host/live/p.m3u8");
        QVERIFY(parsed.is_ok());
        const auto& segs = parsed.value().segments;
        QCOMPARE(segs.size(), size_t(3));

        QVERIFY(segs[0].key.has_value());
        QCOMPARE(segs[0].key->method, std::string("AES-128"));
        QCOMPARE(segs[0].key->uri, std::string("http://host/live/key1.bin"));
        QVERIFY(!segs[0].key->iv.has_value());

        QVERIFY(segs[1].key.has_value());
        QCOMPARE(segs[1].key->uri, std::string("https://keys/k2"));
        QVERIFY(segs[1].key->iv.has_value());
        QCOMPARE(int((*segs[1].key->iv)[0]), 0x00);
        QCOMPARE(int((*segs[1].key->iv)[1]), 0x01);
        QCOMPARE(int((*segs[1].key->iv)[15]), 0x0f);

        QVERIFY(!segs[2].key.has_value());
    }

    void test_short_iv_is_right_aligned() {
        const std::string text =
            "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"k\",IV=0x1F\n#EXTINF:1,\na.ts\n";
        auto parsed = hls::ParseMediaPlaylist(text, "http://h/p.m3u8");
        QVERIFY(parsed.is_ok());
        const auto& iv = *parsed.value().segments[0].key->iv;
        QCOMPARE(int(iv[14]), 0);
        QCOMPARE(int(iv[15]), 0x1f);
    }

    void test_byterange_offsets_carry_over_per_uri() {
        const std::string text =
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:4\n"
            "#EXTINF:4,\n#EXT-X-BYTERANGE:1000@0\nmain.ts\n"
            "#EXTINF:4,\n#EXT-X-BYTERANGE:500\nmain.ts\n"
            "#EXTINF:4,\n#EXT-X-BYTERANGE:200\nother.ts\n"
            "#EXTINF:4,\n#EXT-X-BYTERANGE:300\nmain.ts\n"
            "#EXT-X-ENDLIST\n";
        auto parsed = hls::ParseMediaPlaylist(text, "http://h/p.m3u8");
        QVERIFY(parsed.is_ok());
        const auto& segs = parsed.value().segments;
        QCOMPARE(segs.size(), size_t(4));
        QCOMPARE(segs[0].byterange->offset, int64_t(0));
        QCOMPARE(segs[1].byterange->offset, int64_t(1000));
        QCOMPARE(segs[2].byterange->offset, int64_t(0));
        QCOMPARE(segs[3].byterange->offset, int64_t(1500));
        QCOMPARE(segs[3].byterange->range().first, int64_t(1500));
        QCOMPARE(*segs[3].byterange->range().last, int64_t(1799));
    }

    void test_rejects_invalid_playlists() {
        auto no_header = hls::ParseMediaPlaylist("#EXTINF:1,\na.ts\n", "http://h/p.m3u8");
        QVERIFY(no_header.is_error());
        QCOMPARE(no_header.error().code, ErrorCode::PlaylistInvalid);

        auto master = hls::ParseMediaPlaylist("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\nv.m3u8\n",
                                              "http://h/p.m3u8");
        QVERIFY(master.is_error());
        QCOMPARE(master.error().code, ErrorCode::PlaylistInvalid);

        auto iframes = hls::ParseMediaPlaylist("#EXTM3U\n#EXT-X-I-FRAMES-ONLY\n#EXTINF:1,\na.ts\n",
                                               "http://h/p.m3u8");
        QVERIFY(iframes.is_error());

        auto bad_duration = hls::ParseMediaPlaylist("#EXTM3U\n#EXTINF:abc,\na.ts\n", "http://h/p.m3u8");
        QVERIFY(bad_duration.is_error());

        auto bad_iv = hls::ParseMediaPlaylist(
            "#EXTM3U\n#EXT-X-KEY:METHOD=AES-128,URI=\"k\",IV=0xZZ\n#EXTINF:1,\na.ts\n", "http://h/p.m3u8");
        QVERIFY(bad_iv.is_error());
    }

    void test_attribute_list() {
        auto attrs = hls::parse_attribute_list(
            "BANDWIDTH=1280000,CODECS=\"avc1.4d401f,mp4a.40.2\",RESOLUTION=1280x720,VIDEO=\"hi\"");
        QCOMPARE(attrs["BANDWIDTH"], std::string("1280000"));
        QCOMPARE(attrs["CODECS"], std::string("avc1.4d401f,mp4a.40.2"));
        QCOMPARE(attrs["RESOLUTION"], std::string("1280x720"));
        QCOMPARE(attrs["VIDEO"], std::string("hi"));
    }

    void test_variant_naming() {
        const std::string text =
            "#EXTM3U\n"
            "#EXT-X-MEDIA:TYPE=VIDEO,GROUP-ID=\"src\",NAME=\"source\",DEFAULT=YES\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=5000000,RESOLUTION=1920x1080,VIDEO=\"src\"\n"
            "source/index.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=1500000,RESOLUTION=1280x720\n"
            "720/index.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=1280x720\n"
            "720b/index.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=64000\n"
            "audio/index.m3u8\n"
            "#EXT-X-I-FRAME-STREAM-INF:BANDWIDTH=90000,URI=\"iframes.m3u8\"\n";
        auto parsed = hls::ParseVariantPlaylist(text, "http://host/master.m3u8");
        QVERIFY(parsed.is_ok());
        const auto& variants = parsed.value();
        QCOMPARE(variants.size(), size_t(3));

        QCOMPARE(variants[0].name, std::string("source"));
        QCOMPARE(variants[0].uri, std::string("http://host/source/index.m3u8"));
        QCOMPARE(variants[0].bandwidth, int64_t(5000000));
        QCOMPARE(variants[0].resolution->height, 1080);

        // Duplicate "720p" keeps the first variant
        QCOMPARE(variants[1].name, std::string("720p"));
        QCOMPARE(variants[1].uri, std::string("http://host/720/index.m3u8"));

        QCOMPARE(variants[2].name, std::string("64k"));
    }

    void test_variant_playlist_requires_master() {
        auto parsed = hls::ParseVariantPlaylist("#EXTM3U\n#EXTINF:1,\na.ts\n", "http://h/p.m3u8");
        QVERIFY(parsed.is_error());
        QCOMPARE(parsed.error().code, ErrorCode::PlaylistInvalid);
        QVERIFY(hls::IsMasterPlaylist("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\nv.m3u8\n"));
    }
};

QTEST_MAIN(TestHlsPlaylist)
#include "test_hls_playlist.moc"
