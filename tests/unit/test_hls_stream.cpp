// Tests for HLS playback: live edge, reloads, seeking, AES-128 and variants

#include <QtTest>

#include "test_base.h"
#include "fake_http_client.h"

#include <segmented_stream_platform/ssp_hls_stream.h>

#include <openssl/evp.h>

#include <sstream>

using ssp::Bytes;
using ssp::ErrorCode;
using ssp::SegmentSource;

namespace {

const std::string kBase = "http://hls.example.com/show/";

Bytes make_payload(size_t size, uint8_t seed) {
    Bytes data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(seed + i * 7);
    }
    return data;
}

// AES-128-CBC with PKCS#7 padding, as a packager would produce it
Bytes encrypt(const Bytes& plain, const Bytes& key, const std::array<uint8_t, 16>& iv) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    Bytes out(plain.size() + 16);
    int len = 0;
    int total = 0;
    EVP_EncryptInit_ex(ctx, EVP_aes_128_cbc(), nullptr, key.data(), iv.data());
    EVP_EncryptUpdate(ctx, out.data(), &len, plain.data(), static_cast<int>(plain.size()));
    total = len;
    EVP_EncryptFinal_ex(ctx, out.data() + total, &len);
    total += len;
    EVP_CIPHER_CTX_free(ctx);
    out.resize(static_cast<size_t>(total));
    return out;
}

// Media playlist with segN.ts entries starting at first_sequence
std::string media_playlist(int64_t first_sequence, int count, bool end_list,
                           const std::string& type = std::string(), int target = 1) {
    std::ostringstream out;
    out << "#EXTM3U\n#EXT-X-VERSION:3\n#EXT-X-TARGETDURATION:" << target << "\n";
    out << "#EXT-X-MEDIA-SEQUENCE:" << first_sequence << "\n";
    if (!type.empty()) {
        out << "#EXT-X-PLAYLIST-TYPE:" << type << "\n";
    }
    for (int i = 0; i < count; ++i) {
        out << "#EXTINF:" << target << ".0,\nseg" << (first_sequence + i) << ".ts\n";
    }
    if (end_list) {
        out << "#EXT-X-ENDLIST\n";
    }
    return out.str();
}

std::string segment_url(int64_t sequence) {
    return kBase + "seg" + std::to_string(sequence) + ".ts";
}

ssp::StreamOptions test_options() {
    ssp::StreamOptions options = ssp::default_options();
    options.segment_attempts = 1;
    options.hls_timeout = std::chrono::milliseconds(5000);
    options.seek_timeout = std::chrono::milliseconds(5000);
    options.seek_meta_threads = 4;
    return options;
}

Bytes read_all(ssp::StreamReader& reader, bool* ok) {
    Bytes out;
    *ok = true;
    while (true) {
        auto data = reader.Read(4096);
        if (data.is_error()) {
            *ok = false;
            return out;
        }
        if (data.value().empty()) {
            return out;
        }
        out.insert(out.end(), data.value().begin(), data.value().end());
    }
}

Bytes read_exactly(ssp::StreamReader& reader, size_t n) {
    Bytes out;
    while (out.size() < n) {
        auto data = reader.Read(n - out.size());
        if (data.is_error() || data.value().empty()) {
            break;
        }
        out.insert(out.end(), data.value().begin(), data.value().end());
    }
    return out;
}

} // namespace

class TestHlsStream : public TestBase
{
    Q_OBJECT

private:
    // Registers segments first..first+count-1 with distinct payloads
    std::vector<Bytes> addSegments(FakeHttpClient& http, int64_t first, int count,
                                   const std::vector<size_t>& sizes) {
        std::vector<Bytes> payloads;
        for (int i = 0; i < count; ++i) {
            Bytes payload = make_payload(sizes[static_cast<size_t>(i) % sizes.size()],
                                         static_cast<uint8_t>(first + i));
            http.add(segment_url(first + i), payload);
            payloads.push_back(payload);
        }
        return payloads;
    }

private slots:
    void test_live_playlist_starts_at_live_edge() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "live.m3u8", media_playlist(10, 6, false, std::string(), 2));

        auto options = test_options();
        options.hls_live_edge = 3;
        ssp::HlsSource source(kBase + "live.m3u8", http, options);
        QVERIFY(source.Prepare().is_ok());
        QVERIFY(source.IsLive());
        QVERIFY(!source.SupportsSeek());
        QCOMPARE(source.NextSequence(), int64_t(13));
        QCOMPARE(source.ReloadDelay().count(), int64_t(2000));

        for (int64_t expected = 13; expected <= 15; ++expected) {
            auto next = source.NextSegment();
            QVERIFY(next.is_ok());
            QVERIFY(next.value().kind == SegmentSource::Next::Kind::Segment);
            QCOMPARE(next.value().segment.sequence, expected);
            QCOMPARE(next.value().segment.url, segment_url(expected));
            QVERIFY(!next.value().segment.is_last);
        }

        // Nothing new until the reload delay has passed
        auto next = source.NextSegment();
        QVERIFY(next.is_ok());
        QVERIFY(next.value().kind == SegmentSource::Next::Kind::Wait);
        QVERIFY(next.value().wait.count() > 0);
        QVERIFY(next.value().wait.count() <= 2000);
    }

    void test_live_edge_larger_than_playlist_starts_at_first() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "live.m3u8", media_playlist(5, 2, false));

        auto options = test_options();
        options.hls_live_edge = 10;
        ssp::HlsSource source(kBase + "live.m3u8", http, options);
        QVERIFY(source.Prepare().is_ok());
        QCOMPARE(source.NextSequence(), int64_t(5));
    }

    void test_live_reload_picks_up_new_segments() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "live.m3u8", media_playlist(0, 3, false));

        auto options = test_options();
        options.hls_live_edge = 1;
        ssp::HlsSource source(kBase + "live.m3u8", http, options);
        QVERIFY(source.Prepare().is_ok());

        auto next = source.NextSegment();
        QVERIFY(next.is_ok());
        QCOMPARE(next.value().segment.sequence, int64_t(2));

        // Window slides forward by two segments
        http->add(kBase + "live.m3u8", media_playlist(2, 3, false));
        QTest::qWait(1100);

        next = source.NextSegment();
        QVERIFY(next.is_ok());
        QVERIFY(next.value().kind == SegmentSource::Next::Kind::Segment);
        QCOMPARE(next.value().segment.sequence, int64_t(3));
        QCOMPARE(http->requestCount(kBase + "live.m3u8"), 2);
    }

    void test_unchanged_playlist_halves_reload_delay() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "live.m3u8", media_playlist(0, 2, false, std::string(), 3));

        auto options = test_options();
        options.hls_live_edge = 1;
        ssp::HlsSource source(kBase + "live.m3u8", http, options);
        QVERIFY(source.Prepare().is_ok());
        QCOMPARE(source.ReloadDelay().count(), int64_t(3000));

        auto next = source.NextSegment();
        QVERIFY(next.is_ok());
        QCOMPARE(next.value().segment.sequence, int64_t(1));

        QTest::qWait(3100);
        next = source.NextSegment();
        QVERIFY(next.is_ok());
        QVERIFY(next.value().kind == SegmentSource::Next::Kind::Wait);
        QCOMPARE(source.ReloadDelay().count(), int64_t(1500));
        QCOMPARE(http->requestCount(kBase + "live.m3u8"), 2);
    }

    void test_vod_reads_all_segments() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "vod.m3u8", media_playlist(0, 3, true, "VOD"));
        auto payloads = addSegments(*http, 0, 3, {5000, 7000, 3000});

        ssp::HlsStream stream(kBase + "vod.m3u8", test_options(), http);
        QCOMPARE(stream.describe(), "hls " + kBase + "vod.m3u8");
        auto opened = stream.Open();
        QVERIFY(opened.is_ok());
        auto& reader = *opened.value();
        QVERIFY(reader.SupportsSeek());
        QCOMPARE(reader.CompleteLength().value_or(-1), int64_t(15000));

        bool ok = false;
        Bytes out = read_all(reader, &ok);
        QVERIFY(ok);
        Bytes expected;
        for (const auto& p : payloads) expected.insert(expected.end(), p.begin(), p.end());
        QVERIFY(out == expected);
    }

    void test_vod_seek_skips_into_segment() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "vod.m3u8", media_playlist(0, 3, true, "VOD"));
        auto payloads = addSegments(*http, 0, 3, {5000, 7000, 3000});
        Bytes expected;
        for (const auto& p : payloads) expected.insert(expected.end(), p.begin(), p.end());

        auto options = test_options();
        options.writer_threads = 2;
        options.segment_threads = 2;
        ssp::HlsStream stream(kBase + "vod.m3u8", options, http);
        auto opened = stream.Open();
        QVERIFY(opened.is_ok());
        auto& reader = *opened.value();

        Bytes head = read_exactly(reader, 100);
        QVERIFY(head == Bytes(expected.begin(), expected.begin() + 100));

        // Lands 1000 bytes into the second segment
        QVERIFY(reader.Seek(6000).is_ok());
        bool ok = false;
        Bytes out = read_all(reader, &ok);
        QVERIFY(ok);
        QVERIFY(out == Bytes(expected.begin() + 6000, expected.end()));
    }

    void test_seek_meta_failure_disables_seek() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "vod.m3u8", media_playlist(0, 3, true, "VOD"));
        addSegments(*http, 0, 3, {1000});
        http->failHead(segment_url(1));

        ssp::HlsSource source(kBase + "vod.m3u8", http, test_options());
        QVERIFY(source.Prepare().is_ok());
        QVERIFY(!source.IsLive());
        QVERIFY(!source.SupportsSeek());
        QVERIFY(!source.CompleteLength().has_value());
        QCOMPARE(source.SeekTo(10).error().code, ErrorCode::Unsupported);
    }

    void test_byterange_playlist_uses_tag_lengths() {
        auto http = std::make_shared<FakeHttpClient>();
        const std::string playlist =
            "#EXTM3U\n#EXT-X-TARGETDURATION:2\n#EXT-X-PLAYLIST-TYPE:VOD\n"
            "#EXTINF:2,\n#EXT-X-BYTERANGE:4000@0\nall.ts\n"
            "#EXTINF:2,\n#EXT-X-BYTERANGE:6000\nall.ts\n"
            "#EXT-X-ENDLIST\n";
        http->add(kBase + "br.m3u8", playlist);
        Bytes all = make_payload(10000, 3);
        http->add(kBase + "all.ts", all);
        http->failHead(kBase + "all.ts");

        ssp::HlsSource source(kBase + "br.m3u8", http, test_options());
        QVERIFY(source.Prepare().is_ok());
        QVERIFY(source.SupportsSeek());
        QCOMPARE(source.CompleteLength().value_or(-1), int64_t(10000));
        QCOMPARE(source.Duration().value_or(0.0), 4.0);

        QVERIFY(source.SeekTo(4500).is_ok());
        auto next = source.NextSegment();
        QVERIFY(next.is_ok());
        QCOMPARE(next.value().segment.sequence, int64_t(1));
        QCOMPARE(next.value().segment.skip_bytes, int64_t(500));
        QCOMPARE(next.value().segment.range->first, int64_t(4000));
        QCOMPARE(next.value().segment.range->last.value_or(-1), int64_t(9999));
        QVERIFY(next.value().segment.is_last);

        next = source.NextSegment();
        QVERIFY(next.is_ok());
        QVERIFY(next.value().kind == SegmentSource::Next::Kind::End);
    }

    void test_aes128_segments_are_decrypted() {
        auto http = std::make_shared<FakeHttpClient>();
        Bytes key = make_payload(16, 0x42);
        http->add(kBase + "key.bin", key);

        std::array<uint8_t, 16> explicit_iv{};
        for (size_t i = 0; i < explicit_iv.size(); ++i) explicit_iv[i] = static_cast<uint8_t>(i);

        Bytes plain7 = make_payload(5001, 7);
        Bytes plain8 = make_payload(4096, 8);
        http->add(segment_url(7), encrypt(plain7, key, explicit_iv));
        // No IV attribute: the media sequence number is the IV
        http->add(segment_url(8), encrypt(plain8, key, ssp::sequence_iv(8)));

        const std::string playlist =
            "#EXTM3U\n#EXT-X-TARGETDURATION:1\n#EXT-X-MEDIA-SEQUENCE:7\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\",IV=0x000102030405060708090A0B0C0D0E0F\n"
            "#EXTINF:1,\nseg7.ts\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\"\n"
            "#EXTINF:1,\nseg8.ts\n"
            "#EXT-X-ENDLIST\n";
        http->add(kBase + "enc.m3u8", playlist);

        ssp::HlsStream stream(kBase + "enc.m3u8", test_options(), http);
        auto opened = stream.Open();
        QVERIFY(opened.is_ok());

        bool ok = false;
        Bytes out = read_all(*opened.value(), &ok);
        QVERIFY(ok);
        Bytes expected = plain7;
        expected.insert(expected.end(), plain8.begin(), plain8.end());
        QCOMPARE(out.size(), expected.size());
        QVERIFY(out == expected);

        // Key fetched once for both segments
        QCOMPARE(http->requestCount(kBase + "key.bin"), 1);
    }

    void test_unsupported_cipher_is_fatal() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(segment_url(0), make_payload(100, 1));
        http->add(kBase + "enc.m3u8",
                  "#EXTM3U\n#EXT-X-TARGETDURATION:1\n#EXT-X-KEY:METHOD=SAMPLE-AES,URI=\"k\"\n"
                  "#EXTINF:1,\nseg0.ts\n#EXT-X-ENDLIST\n");

        ssp::HlsStream stream(kBase + "enc.m3u8", test_options(), http);
        auto opened = stream.Open();
        QVERIFY(opened.is_ok());

        auto data = opened.value()->Read(1024);
        QVERIFY(data.is_error());
        QCOMPARE(data.error().code, ErrorCode::DecryptionFailed);
    }

    void test_live_failed_segment_is_dropped() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "live.m3u8", media_playlist(0, 4, false));
        auto payloads = addSegments(*http, 0, 4, {2000});
        http->alwaysFail(segment_url(2));

        auto options = test_options();
        options.hls_live_edge = 4;
        ssp::HlsStream stream(kBase + "live.m3u8", options, http);
        auto opened = stream.Open();
        QVERIFY(opened.is_ok());
        QVERIFY(!opened.value()->SupportsSeek());

        Bytes expected = payloads[0];
        expected.insert(expected.end(), payloads[1].begin(), payloads[1].end());
        expected.insert(expected.end(), payloads[3].begin(), payloads[3].end());

        Bytes out = read_exactly(*opened.value(), expected.size());
        QVERIFY(out == expected);

        auto* segmented = dynamic_cast<ssp::SegmentedStreamReader*>(opened.value().get());
        QVERIFY(segmented != nullptr);
        QCOMPARE(segmented->DroppedSegments(), int64_t(1));
        opened.value()->Close();
    }

    void test_live_drop_with_multiple_writers() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "live.m3u8", media_playlist(0, 8, false));
        auto payloads = addSegments(*http, 0, 8, {2000, 3000});
        http->alwaysFail(segment_url(2));

        auto options = test_options();
        options.hls_live_edge = 8;
        options.writer_threads = 3;
        options.segment_threads = 3;
        ssp::HlsStream stream(kBase + "live.m3u8", options, http);
        auto opened = stream.Open();
        QVERIFY(opened.is_ok());

        // The reorder buffer must not wait on the lost segment
        for (size_t i = 0; i < payloads.size(); ++i) {
            if (i == 2) continue;
            Bytes out = read_exactly(*opened.value(), payloads[i].size());
            QVERIFY2(out == payloads[i], qPrintable(QString("segment %1").arg(i)));
        }

        auto* segmented = dynamic_cast<ssp::SegmentedStreamReader*>(opened.value().get());
        QVERIFY(segmented != nullptr);
        QCOMPARE(segmented->DroppedSegments(), int64_t(1));
        opened.value()->Close();
    }

    void test_seek_encrypted_vod() {
        auto http = std::make_shared<FakeHttpClient>();
        Bytes key = make_payload(16, 0x11);
        http->add(kBase + "key.bin", key);

        std::vector<Bytes> plain;
        for (int64_t seq = 0; seq < 3; ++seq) {
            // Sizes not a multiple of 16 so padding changes every length
            plain.push_back(make_payload(3000 + static_cast<size_t>(seq) * 5, static_cast<uint8_t>(seq)));
            http->add(segment_url(seq), encrypt(plain.back(), key, ssp::sequence_iv(seq)));
        }
        http->add(kBase + "enc.m3u8",
                  "#EXTM3U\n#EXT-X-TARGETDURATION:1\n#EXT-X-PLAYLIST-TYPE:VOD\n"
                  "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\"\n"
                  "#EXTINF:1,\nseg0.ts\n#EXTINF:1,\nseg1.ts\n#EXTINF:1,\nseg2.ts\n"
                  "#EXT-X-ENDLIST\n");

        ssp::HlsStream stream(kBase + "enc.m3u8", test_options(), http);
        auto opened = stream.Open();
        QVERIFY(opened.is_ok());
        auto& reader = *opened.value();
        QVERIFY(!reader.SupportsSeek());
        QVERIFY(!reader.CompleteLength().has_value());

        auto seeked = reader.Seek(3000);
        QVERIFY(seeked.is_error());
        QCOMPARE(seeked.error().code, ErrorCode::Unsupported);

        bool ok = false;
        Bytes out = read_all(reader, &ok);
        QVERIFY(ok);
        Bytes expected;
        for (const auto& p : plain) expected.insert(expected.end(), p.begin(), p.end());
        QVERIFY(out == expected);

        // No HEAD requests for seek metadata
        for (int64_t seq = 0; seq < 3; ++seq) {
            QCOMPARE(http->requestCount(segment_url(seq)), 1);
        }
    }

    void test_missing_playlist_fails_open() {
        auto http = std::make_shared<FakeHttpClient>();
        ssp::HlsStream stream(kBase + "missing.m3u8", test_options(), http);
        auto opened = stream.Open();
        QVERIFY(opened.is_error());
        QCOMPARE(opened.error().code, ErrorCode::HttpFailed);
    }

    void test_master_playlist_fails_open() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "master.m3u8", "#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1000,RESOLUTION=640x360\nlow.m3u8\n");
        ssp::HlsStream stream(kBase + "master.m3u8", test_options(), http);
        auto opened = stream.Open();
        QVERIFY(opened.is_error());
        QCOMPARE(opened.error().code, ErrorCode::PlaylistInvalid);
    }

    void test_variant_playlist_opens_named_streams() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "master.m3u8",
                  "#EXTM3U\n"
                  "#EXT-X-STREAM-INF:BANDWIDTH=2000000,RESOLUTION=1280x720\nhigh/index.m3u8\n"
                  "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=854x480\nlow/index.m3u8\n");
        http->add(kBase + "low/index.m3u8", "#EXTM3U\n#EXT-X-TARGETDURATION:1\n#EXTINF:1,\na.ts\n#EXT-X-ENDLIST\n");
        Bytes payload = make_payload(3000, 9);
        http->add(kBase + "low/a.ts", payload);

        auto streams = ssp::HlsStream::FromVariantPlaylist(kBase + "master.m3u8", test_options(), http);
        QVERIFY(streams.is_ok());
        QCOMPARE(streams.value().size(), size_t(2));
        QVERIFY(streams.value().count("720p") == 1);
        QVERIFY(streams.value().count("480p") == 1);
        QCOMPARE(streams.value()["720p"]->url(), kBase + "high/index.m3u8");

        auto opened = streams.value()["480p"]->Open();
        QVERIFY(opened.is_ok());
        bool ok = false;
        Bytes out = read_all(*opened.value(), &ok);
        QVERIFY(ok);
        QVERIFY(out == payload);
    }

    void test_variant_playlist_rejects_media_playlist() {
        auto http = std::make_shared<FakeHttpClient>();
        http->add(kBase + "vod.m3u8", media_playlist(0, 1, true));
        auto streams = ssp::HlsStream::FromVariantPlaylist(kBase + "vod.m3u8", test_options(), http);
        QVERIFY(streams.is_error());
        QCOMPARE(streams.error().code, ErrorCode::PlaylistInvalid);
    }
};

QTEST_MAIN(TestHlsStream)
#include "test_hls_stream.moc"
