#include <segmented_stream_platform/ssp_segmented_stream.h>
#include <segmented_stream_platform/ssp_message_broker.h>
#include <segmented_stream_platform/ssp_reordering_ring_buffer.h>
#include <segmented_stream_platform/ssp_ring_buffer.h>
#include <segmented_stream_platform/ssp_thread_pool.h>

#include "impl/aes_decryptor.h"
#include "impl/segment_fetch.h"
#include "impl/work_queue.h"

#include <QLoggingCategory>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <set>
#include <thread>
#include <vector>

Q_LOGGING_CATEGORY(sspEngine, "ssp.engine")

namespace {
template<typename F>
struct ScopeExit {
    F fn;
    ~ScopeExit() { fn(); }
};
template<typename F>
ScopeExit<F> make_scope_exit(F fn) { return {std::move(fn)}; }

// Liveness polling interval for queue and fetch waits
constexpr std::chrono::milliseconds kPollInterval(200);

// Bytes pulled from a segment download per buffer write
constexpr size_t kChunkSize = 8192;
} // namespace

namespace ssp {

std::string mailbox::writer(int index) {
    return "writer-" + std::to_string(index);
}

// ============================================================================
// Engine state
// ============================================================================

struct WorkItem {
    std::optional<Segment> segment;  // nullopt: end of stream marker
    std::shared_ptr<impl::SegmentFetch> fetch;
};

struct SegmentedStreamReader::Impl {
    StreamOptions options;
    std::shared_ptr<HttpClient> http;
    std::unique_ptr<SegmentSource> source;
    std::string name;

    bool seekable = false;
    bool live = false;
    std::optional<int64_t> complete_length;
    std::chrono::milliseconds read_timeout{60000};

    MessageBroker broker;
    std::shared_ptr<Mailbox> reader_box;
    std::shared_ptr<Mailbox> worker_box;
    std::shared_ptr<Mailbox> coordinator_box;
    std::vector<std::shared_ptr<Mailbox>> writer_boxes;

    std::unique_ptr<GenerationalThreadPool> pool;
    std::unique_ptr<impl::WorkQueue<WorkItem>> work_queue;
    std::unique_ptr<impl::KeyCache> keys;
    impl::FetchSettings fetch_settings;

    // Swapped by the seek coordinator while every writer is paused
    mutable std::mutex buffer_mutex;
    std::shared_ptr<ByteBuffer> buffer;

    std::atomic<bool> closed{false};
    mutable std::mutex state_mutex;
    std::condition_variable state_cv;
    StreamState state = StreamState::Running;

    std::mutex error_mutex;
    std::optional<Error> fatal;
    std::atomic<int64_t> dropped_segments{0};

    // Sequences claimed by writers and not finished yet
    std::mutex inflight_mutex;
    std::condition_variable inflight_cv;
    std::multiset<int64_t> inflight;

    // Every fetch handed to the pool, so Close() can unblock them
    std::mutex fetches_mutex;
    std::vector<std::weak_ptr<impl::SegmentFetch>> fetches;

    std::mutex seek_mutex;

    std::thread worker_thread;
    std::thread coordinator_thread;
    std::vector<std::thread> writer_threads;

    std::shared_ptr<ByteBuffer> make_buffer() const;
    std::shared_ptr<ByteBuffer> current_buffer() const;
    void set_state(StreamState s);
    StreamState get_state() const;

    bool has_fatal();
    void fail_stream(const Error& err);
    void handle_segment_failure(const Segment& segment, const Error& err);

    // Park on seek events (seekable streams); false means "exit thread"
    bool idle_or_exit(Mailbox& box);

    // Worker
    void worker_run();
    void worker_seek(const MessagePtr& seek, int64_t& group_id);
    bool enqueue(WorkItem item);
    std::shared_ptr<impl::SegmentFetch> submit_fetch(const Segment& segment);

    // Writers
    void writer_run(int index);
    void pause_for_restart(Mailbox& box, const MessagePtr& seek);
    bool write_segment(const WorkItem& item, const std::shared_ptr<ByteBuffer>& buf);
    bool finish_stream(Mailbox& box);
    void release_sequence(int64_t sequence);

    // Seek coordinator
    void coordinator_run();
    bool coordinate_seek();
    void drop_queued_work();

    void shutdown();
};

std::shared_ptr<ByteBuffer> SegmentedStreamReader::Impl::make_buffer() const {
    size_t capacity = static_cast<size_t>(options.ringbuffer_size);
    if (options.writer_threads > 1) {
        return std::make_shared<ReorderingRingBuffer>(capacity, options.reorder);
    }
    return std::make_shared<RingBuffer>(capacity);
}

std::shared_ptr<ByteBuffer> SegmentedStreamReader::Impl::current_buffer() const {
    std::lock_guard<std::mutex> lock(buffer_mutex);
    return buffer;
}

void SegmentedStreamReader::Impl::set_state(StreamState s) {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (state == StreamState::Closed) return;
        state = s;
    }
    state_cv.notify_all();
}

StreamState SegmentedStreamReader::Impl::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return state;
}

bool SegmentedStreamReader::Impl::has_fatal() {
    std::lock_guard<std::mutex> lock(error_mutex);
    return fatal.has_value();
}

void SegmentedStreamReader::Impl::fail_stream(const Error& err) {
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (fatal) return;
        fatal = err;
    }
    qCCritical(sspEngine, "%s: %s (%s)", name.c_str(), err.message.c_str(),
               error_code_to_string(err.code));
    current_buffer()->Close();
}

void SegmentedStreamReader::Impl::handle_segment_failure(const Segment& segment, const Error& err) {
    if (live) {
        dropped_segments++;
        qCWarning(sspEngine, "Dropping %s: %s", segment.describe().c_str(), err.message.c_str());
        return;
    }
    fail_stream(err);
}

bool SegmentedStreamReader::Impl::idle_or_exit(Mailbox& box) {
    if (!seekable || closed.load()) {
        return false;
    }
    auto seek = box.Get(msg::kSeekEvent, true, std::nullopt, std::nullopt, true);
    return seek.is_ok();
}

// ============================================================================
// Worker
// ============================================================================

std::shared_ptr<impl::SegmentFetch> SegmentedStreamReader::Impl::submit_fetch(const Segment& segment) {
    impl::FetchSettings settings = fetch_settings;
    if (segment.range && segment.range->last) {
        settings.buffer_size = static_cast<size_t>(*segment.range->last - segment.range->first + 1);
    }

    auto fetch = std::make_shared<impl::SegmentFetch>(segment, http, *pool, settings);
    auto submitted = pool->Submit([fetch]() { fetch->Run(); }, segment.group_id);
    if (submitted.is_error()) {
        qCDebug(sspEngine, "Fetch of %s rejected: %s", segment.describe().c_str(),
                submitted.error().message.c_str());
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(fetches_mutex);
    fetches.erase(std::remove_if(fetches.begin(), fetches.end(),
                                 [](const std::weak_ptr<impl::SegmentFetch>& f) { return f.expired(); }),
                  fetches.end());
    fetches.push_back(fetch);
    return fetch;
}

// Push into the bounded work queue, giving up when a seek arrives
bool SegmentedStreamReader::Impl::enqueue(WorkItem item) {
    while (!closed.load()) {
        if (work_queue->push(item, kPollInterval)) {
            return true;
        }
        if (work_queue->closed() || has_fatal()) {
            break;
        }
        auto pending = worker_box->Get(msg::kSeekEvent, false, std::nullopt, std::nullopt, true);
        if (pending.is_error() || pending.value()) {
            break;
        }
    }
    if (item.fetch) {
        item.fetch->Cancel();
    }
    return false;
}

void SegmentedStreamReader::Impl::worker_seek(const MessagePtr& seek, int64_t& group_id) {
    auto handled = make_scope_exit([&seek]() { seek->SetHandled(); });

    int64_t offset = seek->IntData();
    ++group_id;
    qCDebug(sspEngine, "Worker received a seek event, new segments start at pos %lld, group id %lld",
            static_cast<long long>(offset), static_cast<long long>(group_id));

    auto moved = source->SeekTo(offset);

    if (worker_box->Send(msg::kWaitingOnRestart, {}, std::string(mailbox::kSeekCoordinator)).is_error()) {
        return;
    }
    qCDebug(sspEngine, "Worker thread paused, waiting on seek coordinator");
    if (worker_box->WaitOnMsg(msg::kRestart).is_error()) {
        return;
    }
    qCDebug(sspEngine, "Worker thread resumed");

    // Reported after the restart: the coordinator resets errors on the new buffer
    if (moved.is_error()) {
        fail_stream(moved.error());
    }
}

void SegmentedStreamReader::Impl::worker_run() {
    int64_t group_id = 0;
    bool at_end = false;

    while (!closed.load()) {
        auto seek = worker_box->Get(msg::kSeekEvent, false);
        if (seek.is_error()) {
            break;
        }
        if (seek.value()) {
            worker_seek(seek.value(), group_id);
            at_end = false;
            continue;
        }

        if (at_end || has_fatal()) {
            if (!idle_or_exit(*worker_box)) break;
            continue;
        }

        auto next = source->NextSegment();
        if (next.is_error()) {
            fail_stream(next.error());
            continue;
        }

        switch (next.value().kind) {
            case SegmentSource::Next::Kind::Wait: {
                // Reload delay, cut short by a seek event
                auto woke = worker_box->Get(msg::kSeekEvent, true, next.value().wait, std::nullopt, true);
                if (woke.is_error() && woke.error().code == ErrorCode::MailboxClosed) {
                    return;
                }
                break;
            }
            case SegmentSource::Next::Kind::End:
                qCDebug(sspEngine, "%s: no more segments", name.c_str());
                enqueue(WorkItem{std::nullopt, nullptr});
                at_end = true;
                break;
            case SegmentSource::Next::Kind::Segment: {
                Segment segment = next.value().segment;
                segment.group_id = group_id;
                auto fetch = submit_fetch(segment);
                if (!fetch) {
                    // Generation moved on: a seek event is on its way
                    break;
                }
                qCDebug(sspEngine, "Adding %s to queue", segment.describe().c_str());
                bool last = segment.is_last;
                if (enqueue(WorkItem{std::move(segment), fetch}) && last) {
                    at_end = true;
                }
                break;
            }
        }
    }
    qCDebug(sspEngine, "Worker thread exiting");
}

// ============================================================================
// Writers
// ============================================================================

void SegmentedStreamReader::Impl::pause_for_restart(Mailbox& box, const MessagePtr& seek) {
    auto handled = make_scope_exit([&seek]() { seek->SetHandled(); });

    if (box.Send(msg::kWaitingOnRestart, {}, std::string(mailbox::kSeekCoordinator)).is_error()) {
        return;
    }
    qCDebug(sspEngine, "%s paused, waiting on seek coordinator", box.Name().c_str());
    if (box.WaitOnMsg(msg::kRestart).is_ok()) {
        qCDebug(sspEngine, "%s resumed", box.Name().c_str());
    }
}

void SegmentedStreamReader::Impl::release_sequence(int64_t sequence) {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex);
        auto it = inflight.find(sequence);
        if (it != inflight.end()) {
            inflight.erase(it);
        }
    }
    inflight_cv.notify_all();
}

// Returns false when the stream failed
bool SegmentedStreamReader::Impl::write_segment(const WorkItem& item, const std::shared_ptr<ByteBuffer>& buf) {
    const Segment& segment = *item.segment;
    const auto& fetch = item.fetch;
    auto release = make_scope_exit([&]() {
        buf->EndSequence(segment.sequence);
        release_sequence(segment.sequence);
    });

    if (!fetch || !pool->IsCurrent(segment.group_id)) {
        if (fetch) fetch->Cancel();
        return true;
    }

    impl::AesCbcDecryptor decryptor;
    bool decrypt = false;
    if (segment.key && segment.key->method != "NONE") {
        if (segment.key->method != "AES-128") {
            fetch->Cancel();
            fail_stream(Error::decryption_failed("Unable to decrypt cipher " + segment.key->method));
            return false;
        }
        if (segment.key->uri.empty()) {
            fetch->Cancel();
            fail_stream(Error::decryption_failed("Missing URI to decryption key"));
            return false;
        }
        auto key = keys->get(segment.key->uri);
        if (key.is_error()) {
            fetch->Cancel();
            fail_stream(key.error());
            return false;
        }
        auto init = decryptor.init(key.value(), segment.key->iv.value_or(sequence_iv(segment.sequence)));
        if (init.is_error()) {
            fetch->Cancel();
            fail_stream(init.error());
            return false;
        }
        decrypt = true;
    }

    int64_t skip = segment.skip_bytes;
    auto emit = [&](Bytes data) {
        size_t offset = 0;
        if (skip > 0) {
            offset = static_cast<size_t>(std::min<int64_t>(skip, static_cast<int64_t>(data.size())));
            skip -= static_cast<int64_t>(offset);
        }
        if (offset < data.size()) {
            buf->Write(data.data() + offset, data.size() - offset, segment.sequence);
        }
    };

    qCDebug(sspEngine, "Streaming %s to output buffer", segment.describe().c_str());

    std::chrono::milliseconds waited(0);
    while (true) {
        if (closed.load() || !pool->IsCurrent(segment.group_id)) {
            fetch->Cancel();
            qCDebug(sspEngine, "Streaming of %s to buffer cancelled", segment.describe().c_str());
            return true;
        }

        auto chunk = fetch->Read(kChunkSize, kPollInterval);
        if (chunk.is_error()) {
            waited += kPollInterval;
            if (waited >= read_timeout) {
                fetch->Cancel();
                handle_segment_failure(segment, Error::segment_fetch_failed(
                    "No data received for " + segment.describe() + " within the read timeout"));
                return !has_fatal();
            }
            continue;
        }
        waited = std::chrono::milliseconds(0);
        if (chunk.value().empty()) {
            break;
        }

        if (decrypt) {
            auto plain = decryptor.update(chunk.value().data(), chunk.value().size());
            if (plain.is_error()) {
                fetch->Cancel();
                fail_stream(plain.error());
                return false;
            }
            emit(std::move(plain.value()));
        } else {
            emit(std::move(chunk.value()));
        }
    }

    if (auto failure = fetch->failure()) {
        handle_segment_failure(segment, *failure);
        return !has_fatal();
    }

    if (decrypt) {
        size_t residual = 0;
        auto tail = decryptor.finish(&residual);
        if (tail.is_error()) {
            fail_stream(tail.error());
            return false;
        }
        if (residual > 0) {
            qCWarning(sspEngine, "Cutting off %zu bytes of garbage at the end of %s", residual,
                      segment.describe().c_str());
        }
        if (pool->IsCurrent(segment.group_id)) {
            emit(std::move(tail.value()));
        }
    }

    qCDebug(sspEngine, "Streaming of %s to buffer complete", segment.describe().c_str());
    return true;
}

// End of stream: close the buffer once every earlier segment is written.
// Returns false when the writer should exit.
bool SegmentedStreamReader::Impl::finish_stream(Mailbox& box) {
    {
        std::unique_lock<std::mutex> lock(inflight_mutex);
        while (!inflight.empty() && !closed.load()) {
            inflight_cv.wait_for(lock, kPollInterval);
            lock.unlock();
            auto pending = box.Get(msg::kSeekEvent, false, std::nullopt, std::nullopt, true);
            lock.lock();
            if (pending.is_error()) return false;
            if (pending.value()) return true;
        }
    }

    current_buffer()->Close();
    qCInfo(sspEngine, "%s: end of stream reached%s", name.c_str(),
           seekable ? ", waiting for seek or close" : "");

    if (!seekable) {
        work_queue->close();
    }
    return idle_or_exit(box);
}

void SegmentedStreamReader::Impl::writer_run(int index) {
    Mailbox& box = *writer_boxes[static_cast<size_t>(index)];

    while (!closed.load()) {
        auto seek = box.Get(msg::kSeekEvent, false);
        if (seek.is_error()) {
            break;
        }
        if (seek.value()) {
            pause_for_restart(box, seek.value());
            continue;
        }

        if (has_fatal()) {
            if (!idle_or_exit(box)) break;
            continue;
        }

        std::shared_ptr<ByteBuffer> buf;
        auto item = work_queue->pop(kPollInterval, [this, &buf](const WorkItem& claimed) {
            if (claimed.segment) {
                std::lock_guard<std::mutex> lock(inflight_mutex);
                inflight.insert(claimed.segment->sequence);
                buf = current_buffer();
                buf->BeginSequence(claimed.segment->sequence);
            }
        });
        if (!item) {
            if (work_queue->closed()) break;
            continue;
        }

        if (!item->segment) {
            if (!finish_stream(box)) break;
            continue;
        }

        bool ok = write_segment(*item, buf);
        if (!ok) {
            continue;
        }
        if (item->segment->is_last && pool->IsCurrent(item->segment->group_id)) {
            if (!finish_stream(box)) break;
        }
    }
    qCDebug(sspEngine, "%s exiting", box.Name().c_str());
}

// ============================================================================
// Seek coordinator
// ============================================================================

void SegmentedStreamReader::Impl::drop_queued_work() {
    for (auto& item : work_queue->drain()) {
        if (item.segment) {
            qCDebug(sspEngine, "Dropping %s from the work queue", item.segment->describe().c_str());
        }
        if (item.fetch) {
            item.fetch->Cancel();
        }
    }
}

// Returns false when the coordinator should exit
bool SegmentedStreamReader::Impl::coordinate_seek() {
    Mailbox& box = *coordinator_box;

    // (a) Stale the old generation and unblock writers stuck on the buffer
    int64_t next_group = pool->ActiveGeneration() + 1;
    pool->SetActiveGeneration(next_group, false);
    current_buffer()->Close();

    // (b) Writers first, so none can block on an empty work queue
    qCDebug(sspEngine, "Waiting for writer threads");
    for (const auto& writer_box : writer_boxes) {
        if (box.WaitOnMsg(msg::kWaitingOnRestart, writer_box->Name()).is_error()) {
            return false;
        }
    }

    // (c) Flush the work queue while polling the worker
    qCDebug(sspEngine, "Flushing work queue and polling worker thread");
    bool worker_ready = false;
    while (!worker_ready) {
        drop_queued_work();
        auto ready = box.Get(msg::kWaitingOnRestart, true, kPollInterval, std::string(mailbox::kWorker));
        if (ready.is_error()) {
            if (ready.error().code == ErrorCode::MailboxTimeout) continue;
            return false;
        }
        if (ready.value()) {
            ready.value()->SetHandled();
            worker_ready = true;
        }
    }
    drop_queued_work();
    set_state(StreamState::PausedForRestart);

    // (d) Everyone is paused: fresh buffer, fresh error state
    {
        std::lock_guard<std::mutex> lock(inflight_mutex);
        inflight.clear();
    }
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        fatal.reset();
    }
    {
        std::lock_guard<std::mutex> lock(buffer_mutex);
        buffer = make_buffer();
    }

    // (e) Restart
    qCDebug(sspEngine, "Queue flush complete, restarting worker and writer threads");
    if (box.Send(msg::kRestart, {}, std::string(mailbox::kWorker)).is_error()) {
        return false;
    }
    for (const auto& writer_box : writer_boxes) {
        if (box.Send(msg::kRestart, {}, writer_box->Name()).is_error()) {
            return false;
        }
    }
    set_state(StreamState::Running);
    return true;
}

void SegmentedStreamReader::Impl::coordinator_run() {
    while (!closed.load()) {
        auto got = coordinator_box->Get(msg::kSeekEvent, true);
        if (got.is_error()) {
            break;
        }
        MessagePtr seek = got.value();
        if (!seek) {
            continue;
        }
        auto handled = make_scope_exit([&seek]() { seek->SetHandled(); });
        qCDebug(sspEngine, "Seek coordinator received a seek event to %lld",
                static_cast<long long>(seek->IntData()));
        if (!coordinate_seek()) {
            break;
        }
    }
    qCDebug(sspEngine, "Seek coordinator exiting");
}

// ============================================================================
// Lifecycle
// ============================================================================

void SegmentedStreamReader::Impl::shutdown() {
    if (closed.exchange(true)) {
        return;
    }
    qCDebug(sspEngine, "%s: closing", name.c_str());
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        state = StreamState::Closed;
    }
    state_cv.notify_all();

    // Stale every fetch, then wake every blocking point
    pool->SetActiveGeneration(pool->ActiveGeneration() + 1, false);
    {
        std::lock_guard<std::mutex> lock(fetches_mutex);
        for (auto& weak : fetches) {
            if (auto fetch = weak.lock()) fetch->Cancel();
        }
        fetches.clear();
    }
    current_buffer()->Close();
    work_queue->close();
    inflight_cv.notify_all();

    for (auto* box : {&reader_box, &worker_box, &coordinator_box}) {
        if (*box) (*box)->Close();
    }
    for (auto& box : writer_boxes) {
        box->Close();
    }

    if (worker_thread.joinable()) worker_thread.join();
    for (auto& t : writer_threads) {
        if (t.joinable()) t.join();
    }
    if (coordinator_thread.joinable()) coordinator_thread.join();

    drop_queued_work();
    pool->Shutdown();
}

// ============================================================================
// SegmentedStreamReader
// ============================================================================

SegmentedStreamReader::SegmentedStreamReader()
    : m_impl(std::make_unique<Impl>()) {
}

SegmentedStreamReader::~SegmentedStreamReader() {
    Close();
}

Result<std::unique_ptr<SegmentedStreamReader>> SegmentedStreamReader::Start(
        std::unique_ptr<SegmentSource> source, std::shared_ptr<HttpClient> http,
        const StreamOptions& options, const std::string& name) {
    auto valid = validate_options(options);
    if (valid.is_error()) {
        return valid.error();
    }
    if (!source || !http) {
        return Error::invalid_arg("SegmentedStreamReader::Start: source and http client are required");
    }

    auto prepared = source->Prepare();
    if (prepared.is_error()) {
        return prepared.error();
    }

    std::unique_ptr<SegmentedStreamReader> reader(new SegmentedStreamReader());
    Impl& d = *reader->m_impl;
    d.options = options;
    d.http = std::move(http);
    d.source = std::move(source);
    d.name = name;
    d.seekable = d.source->SupportsSeek();
    d.live = d.source->IsLive();
    d.complete_length = d.source->CompleteLength();
    d.read_timeout = d.source->ReadTimeout();

    d.fetch_settings.attempts = options.segment_attempts;
    d.fetch_settings.timeout = options.segment_timeout;
    d.fetch_settings.headers = options.http_headers;
    d.fetch_settings.buffer_size = static_cast<size_t>(options.segment_size);

    d.pool = std::make_unique<GenerationalThreadPool>(std::max(options.segment_threads, options.writer_threads));
    d.work_queue = std::make_unique<impl::WorkQueue<WorkItem>>(static_cast<size_t>(options.work_queue_size));
    d.keys = std::make_unique<impl::KeyCache>(d.http, d.fetch_settings);
    d.buffer = d.make_buffer();

    // Mailboxes and subscriptions exist before any thread runs
    auto reader_box = d.broker.Register(mailbox::kReader);
    auto worker_box = d.broker.Register(mailbox::kWorker);
    if (reader_box.is_error()) return reader_box.error();
    if (worker_box.is_error()) return worker_box.error();
    d.reader_box = reader_box.value();
    d.worker_box = worker_box.value();
    auto sub = d.worker_box->Subscribe(msg::kSeekEvent);
    if (sub.is_error()) return sub.error();

    for (int i = 0; i < options.writer_threads; ++i) {
        auto box = d.broker.Register(mailbox::writer(i));
        if (box.is_error()) return box.error();
        auto writer_sub = box.value()->Subscribe(msg::kSeekEvent);
        if (writer_sub.is_error()) return writer_sub.error();
        d.writer_boxes.push_back(box.value());
    }

    if (d.seekable) {
        auto box = d.broker.Register(mailbox::kSeekCoordinator);
        if (box.is_error()) return box.error();
        auto coord_sub = box.value()->Subscribe(msg::kSeekEvent);
        if (coord_sub.is_error()) return coord_sub.error();
        d.coordinator_box = box.value();
    }

    qCInfo(sspEngine, "Opening %s (%d writer(s), %d pool thread(s), seek %s)", name.c_str(),
           options.writer_threads, d.pool->ThreadCount(), d.seekable ? "supported" : "unsupported");

    for (int i = 0; i < options.writer_threads; ++i) {
        d.writer_threads.emplace_back(&Impl::writer_run, &d, i);
    }
    d.worker_thread = std::thread(&Impl::worker_run, &d);
    if (d.seekable) {
        d.coordinator_thread = std::thread(&Impl::coordinator_run, &d);
    }

    return std::move(reader);
}

Result<Bytes> SegmentedStreamReader::Read(size_t n) {
    Impl& d = *m_impl;
    while (true) {
        if (d.closed.load()) {
            return Bytes();
        }

        auto buf = d.current_buffer();
        auto data = buf->Read(n, true, d.read_timeout);
        if (data.is_error() || !data.value().empty()) {
            return data;
        }

        // Buffer closed and drained: a seek in progress, a failure or the end
        {
            std::unique_lock<std::mutex> lock(d.state_mutex);
            d.state_cv.wait(lock, [&d] { return d.state == StreamState::Running ||
                                                d.state == StreamState::Closed; });
        }
        if (d.current_buffer() != buf) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(d.error_mutex);
            if (d.fatal) {
                return *d.fatal;
            }
        }
        return Bytes();
    }
}

Result<void> SegmentedStreamReader::Seek(int64_t position) {
    Impl& d = *m_impl;
    if (!d.seekable) {
        return Error::unsupported("Stream does not support seeking");
    }
    if (d.closed.load()) {
        return Error::mailbox_closed(mailbox::kReader);
    }
    if (position < 0 || (d.complete_length && position >= *d.complete_length)) {
        return Error::invalid_arg("Seek position " + std::to_string(position) + " is out of range");
    }

    std::lock_guard<std::mutex> lock(d.seek_mutex);
    qCInfo(sspEngine, "%s: seeking to %lld", d.name.c_str(), static_cast<long long>(position));
    d.set_state(StreamState::SeekPending);

    auto sent = d.reader_box->Send(msg::kSeekEvent, position, std::nullopt, true, d.options.seek_timeout);
    if (sent.is_error()) {
        if (!d.closed.load()) {
            d.fail_stream(Error::internal("Seek to " + std::to_string(position) + " failed: " +
                                          sent.error().message));
            d.set_state(StreamState::Running);
        }
        return sent.error();
    }
    d.set_state(StreamState::Running);
    return Result<void>();
}

bool SegmentedStreamReader::SupportsSeek() const {
    return m_impl->seekable;
}

std::optional<int64_t> SegmentedStreamReader::CompleteLength() const {
    return m_impl->complete_length;
}

StreamState SegmentedStreamReader::State() const {
    return m_impl->get_state();
}

void SegmentedStreamReader::Close() {
    if (m_impl) {
        m_impl->shutdown();
    }
}

int64_t SegmentedStreamReader::DroppedSegments() const {
    return m_impl->dropped_segments.load();
}

// ============================================================================
// SegmentedStream
// ============================================================================

SegmentedStream::SegmentedStream(StreamOptions options, std::shared_ptr<HttpClient> http)
    : m_options(std::move(options))
    , m_http(http ? std::move(http) : create_http_client(m_options)) {
}

Result<std::unique_ptr<StreamReader>> SegmentedStream::Open() {
    auto source = create_source();
    if (source.is_error()) {
        return source.error();
    }
    auto reader = SegmentedStreamReader::Start(std::move(source.value()), m_http, m_options, describe());
    if (reader.is_error()) {
        return reader.error();
    }
    return std::unique_ptr<StreamReader>(std::move(reader.value()));
}

} // namespace ssp
