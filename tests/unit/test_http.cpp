// Tests for the transport helpers: URL resolution, range headers and
// response accessors

#include <QtTest>

#include <segmented_stream_platform/ssp_http.h>
#include <segmented_stream_platform/ssp_segment.h>

class TestHttp : public QObject
{
    Q_OBJECT

private slots:
    void test_resolve_relative() {
        const std::string base = "http://host/live/index.m3u8";
        QCOMPARE(ssp::resolve_url(base, "seg1.ts"), std::string("http://host/live/seg1.ts"));
        QCOMPARE(ssp::resolve_url(base, "../other/seg.ts"), std::string("http://host/other/seg.ts"));
        QCOMPARE(ssp::resolve_url(base, "./a/seg.ts"), std::string("http://host/live/a/seg.ts"));
        QCOMPARE(ssp::resolve_url(base, "/abs/seg.ts"), std::string("http://host/abs/seg.ts"));
    }

    void test_resolve_absolute_and_scheme_relative() {
        const std::string base = "https://host/live/index.m3u8";
        QCOMPARE(ssp::resolve_url(base, "http://cdn/x.ts"), std::string("http://cdn/x.ts"));
        QCOMPARE(ssp::resolve_url(base, "//cdn/x.ts"), std::string("https://cdn/x.ts"));
    }

    void test_resolve_strips_base_query() {
        QCOMPARE(ssp::resolve_url("http://host/live/index.m3u8?token=1", "seg.ts?x=1"),
                 std::string("http://host/live/seg.ts?x=1"));
    }

    void test_byte_range_header() {
        QCOMPARE((ssp::ByteRange{0, 99}.header_value()), std::string("bytes=0-99"));
        QCOMPARE((ssp::ByteRange{100, std::nullopt}.header_value()), std::string("bytes=100-"));
    }

    void test_ignored_range_detection() {
        ssp::HttpRequest request;
        request.url = "http://host/file.ts";
        QVERIFY(!ssp::is_ignored_range(request, 200));

        // A bounded range from zero answered with the whole file
        request.range = ssp::ByteRange{0, 8191};
        QVERIFY(ssp::is_ignored_range(request, 200));
        QVERIFY(!ssp::is_ignored_range(request, 206));

        request.range = ssp::ByteRange{8192, 16383};
        QVERIFY(ssp::is_ignored_range(request, 200));

        // "bytes=0-" and the full body are the same thing
        request.range = ssp::ByteRange{0, std::nullopt};
        QVERIFY(!ssp::is_ignored_range(request, 200));
        request.range = ssp::ByteRange{10, std::nullopt};
        QVERIFY(ssp::is_ignored_range(request, 200));
    }

    void test_content_length() {
        ssp::HttpResponse res;
        QVERIFY(!res.content_length());
        res.headers["content-length"] = "1234";
        QCOMPARE(*res.content_length(), int64_t(1234));
        res.headers["content-length"] = "junk";
        QVERIFY(!res.content_length());
    }

    void test_sequence_iv_is_big_endian() {
        auto iv = ssp::sequence_iv(0x0102);
        for (size_t i = 0; i < 14; ++i) {
            QCOMPARE(int(iv[i]), 0);
        }
        QCOMPARE(int(iv[14]), 0x01);
        QCOMPARE(int(iv[15]), 0x02);
    }

    void test_segment_describe() {
        ssp::Segment s;
        s.sequence = 4;
        s.group_id = 2;
        s.range = ssp::ByteRange{0, 1023};
        QCOMPARE(s.describe(), std::string("seq 4 bytes 0-1023 group 2"));
    }
};

QTEST_MAIN(TestHttp)
#include "test_http.moc"
