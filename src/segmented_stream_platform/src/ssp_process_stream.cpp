#include <segmented_stream_platform/ssp_process_stream.h>
#include <segmented_stream_platform/ssp_ring_buffer.h>

#include <QLoggingCategory>
#include <QProcess>
#include <QStringList>

#include <atomic>
#include <future>
#include <thread>

Q_LOGGING_CATEGORY(sspProcess, "ssp.process")

namespace {
// A process that dies this quickly with an error never produced a stream
constexpr int kStartupCheckMs = 500;
constexpr int kPollMs = 200;
} // namespace

namespace ssp {

namespace {

class ProcessStreamReader : public StreamReader {
public:
    ProcessStreamReader(std::string program, std::vector<std::string> arguments, const StreamOptions& options)
        : m_program(std::move(program))
        , m_arguments(std::move(arguments))
        , m_buffer(static_cast<size_t>(options.ringbuffer_size))
        , m_timeout(options.http_stream_timeout) {
    }

    ~ProcessStreamReader() override {
        Close();
    }

    Result<void> start() {
        std::promise<Result<void>> started;
        auto ready = started.get_future();
        m_pump = std::thread(&ProcessStreamReader::pump, this, std::move(started));
        auto result = ready.get();
        if (result.is_error()) {
            Close();
        }
        return result;
    }

    Result<Bytes> Read(size_t n) override {
        return m_buffer.Read(n, true, m_timeout);
    }

    Result<void> Seek(int64_t) override {
        return Error::unsupported("Process streams do not support seeking");
    }

    bool SupportsSeek() const override { return false; }
    std::optional<int64_t> CompleteLength() const override { return std::nullopt; }

    StreamState State() const override {
        return m_closed.load() ? StreamState::Closed : StreamState::Running;
    }

    void Close() override {
        if (m_closed.exchange(true)) {
            return;
        }
        m_buffer.Close();
        if (m_pump.joinable()) {
            m_pump.join();
        }
    }

private:
    // Owns the QProcess for its whole life; stdout goes into the buffer
    void pump(std::promise<Result<void>> started) {
        QProcess process;
        QStringList args;
        for (const auto& a : m_arguments) {
            args << QString::fromStdString(a);
        }
        process.setProcessChannelMode(QProcess::SeparateChannels);
        process.setStandardErrorFile(QProcess::nullDevice());
        process.start(QString::fromStdString(m_program), args);

        if (!process.waitForStarted()) {
            started.set_value(Error::internal("Unable to start " + m_program + ": " +
                                              process.errorString().toStdString()));
            m_buffer.Close();
            return;
        }
        qCInfo(sspProcess, "Started %s (pid %lld)", m_program.c_str(),
               static_cast<long long>(process.processId()));

        if (process.waitForFinished(kStartupCheckMs) &&
            (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0)) {
            started.set_value(Error::internal("Error while executing " + m_program + " (exit code " +
                                              std::to_string(process.exitCode()) + ")"));
            m_buffer.Close();
            return;
        }
        started.set_value(Result<void>());

        while (!m_closed.load()) {
            QByteArray data = process.readAllStandardOutput();
            if (!data.isEmpty()) {
                m_buffer.Write(reinterpret_cast<const uint8_t*>(data.constData()),
                               static_cast<size_t>(data.size()));
                continue;
            }
            if (process.state() == QProcess::NotRunning) {
                break;
            }
            process.waitForReadyRead(kPollMs);
        }

        if (process.state() != QProcess::NotRunning) {
            qCDebug(sspProcess, "Stopping %s", m_program.c_str());
            process.kill();
            process.waitForFinished();
        } else if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
            qCWarning(sspProcess, "%s exited with code %d", m_program.c_str(), process.exitCode());
        } else {
            qCDebug(sspProcess, "%s finished", m_program.c_str());
        }
        m_buffer.Close();
    }

    const std::string m_program;
    const std::vector<std::string> m_arguments;
    RingBuffer m_buffer;
    std::chrono::milliseconds m_timeout;
    std::atomic<bool> m_closed{false};
    std::thread m_pump;
};

} // namespace

ProcessStream::ProcessStream(std::string program, std::vector<std::string> arguments, StreamOptions options)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
    , m_options(std::move(options)) {
}

std::string ProcessStream::describe() const {
    std::string cmdline = m_program;
    for (const auto& a : m_arguments) {
        cmdline += " " + a;
    }
    return "process " + cmdline;
}

Result<std::unique_ptr<StreamReader>> ProcessStream::Open() {
    auto valid = validate_options(m_options);
    if (valid.is_error()) {
        return valid.error();
    }
    auto reader = std::make_unique<ProcessStreamReader>(m_program, m_arguments, m_options);
    auto started = reader->start();
    if (started.is_error()) {
        return started.error();
    }
    return std::unique_ptr<StreamReader>(std::move(reader));
}

} // namespace ssp
