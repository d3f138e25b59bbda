#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>

#include <segmented_stream_platform/ssp_hls_stream.h>
#include <segmented_stream_platform/ssp_options.h>
#include <segmented_stream_platform/ssp_process_stream.h>
#include <segmented_stream_platform/ssp_segmented_http_stream.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

Q_LOGGING_CATEGORY(sspMain, "ssp.main")

namespace {

// Bytes requested from the reader per loop
constexpr size_t kCopyChunk = 64 * 1024;

// Picks one named stream of a master playlist
ssp::Result<std::shared_ptr<ssp::Stream>> select_variant(const std::string& url, const std::string& name,
                                                         const ssp::StreamOptions& options) {
    auto variants = ssp::HlsStream::FromVariantPlaylist(url, options);
    if (variants.is_error()) {
        return variants.error();
    }

    std::string names;
    for (const auto& entry : variants.value()) {
        names += (names.empty() ? "" : ", ") + entry.first;
    }
    qCInfo(sspMain, "Available streams: %s", names.c_str());

    auto it = variants.value().find(name);
    if (it == variants.value().end()) {
        return ssp::Error::invalid_arg("Stream '" + name + "' not found, available: " + names);
    }
    return std::shared_ptr<ssp::Stream>(it->second);
}

ssp::Result<std::shared_ptr<ssp::Stream>> make_stream(const QString& type, const QStringList& positional,
                                                      const QString& variant,
                                                      const ssp::StreamOptions& options) {
    const std::string target = positional.first().toStdString();
    if (type == "process") {
        std::vector<std::string> args;
        for (int i = 1; i < positional.size(); ++i) {
            args.push_back(positional[i].toStdString());
        }
        return std::shared_ptr<ssp::Stream>(std::make_shared<ssp::ProcessStream>(target, args, options));
    }
    if (type == "http") {
        return std::shared_ptr<ssp::Stream>(std::make_shared<ssp::SegmentedHttpStream>(target, options));
    }
    if (!variant.isEmpty()) {
        return select_variant(target, variant.toStdString(), options);
    }
    return std::shared_ptr<ssp::Stream>(std::make_shared<ssp::HlsStream>(target, options));
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ssp");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Segmented stream fetcher: writes the stream to stdout");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "JSON options file.", "file");
    QCommandLineOption typeOption("type", "Stream type: hls, http or process.", "type", "hls");
    QCommandLineOption seekOption("seek", "Start at byte offset.", "bytes");
    QCommandLineOption variantOption("variant",
                                     "Open a named stream of an HLS master playlist (e.g. 720p).",
                                     "name");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Enable debug logging.");
    parser.addOption(configOption);
    parser.addOption(typeOption);
    parser.addOption(seekOption);
    parser.addOption(variantOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("source", "Stream URL, or program and arguments for --type process.",
                                 "URL|COMMAND...");
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption) ? "ssp.*.debug=true"
                                                                 : "ssp.*.debug=false");

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }

    const QString type = parser.value(typeOption);
    if (type != "hls" && type != "http" && type != "process") {
        qCCritical(sspMain, "Unknown stream type: %s", qPrintable(type));
        return 2;
    }

    ssp::StreamOptions options = ssp::default_options();
    if (parser.isSet(configOption)) {
        auto loaded = ssp::load_options_file(parser.value(configOption).toStdString(), options);
        if (loaded.is_error()) {
            qCCritical(sspMain, "Invalid configuration: %s", loaded.error().message.c_str());
            return 2;
        }
        options = loaded.value();
    }

    if (parser.isSet(variantOption) && type != "hls") {
        qCCritical(sspMain, "--variant requires --type hls");
        return 2;
    }

    auto created = make_stream(type, positional, parser.value(variantOption), options);
    if (created.is_error()) {
        qCCritical(sspMain, "Could not resolve stream: %s", created.error().message.c_str());
        return 1;
    }
    std::shared_ptr<ssp::Stream> stream = created.value();
    qCInfo(sspMain, "Opening %s", stream->describe().c_str());

    auto opened = stream->Open();
    if (opened.is_error()) {
        qCCritical(sspMain, "Could not open stream: %s", opened.error().message.c_str());
        return 1;
    }
    std::unique_ptr<ssp::StreamReader> reader = std::move(opened.value());

    if (parser.isSet(seekOption)) {
        bool ok = false;
        qlonglong offset = parser.value(seekOption).toLongLong(&ok);
        if (!ok) {
            qCCritical(sspMain, "Invalid seek offset: %s", qPrintable(parser.value(seekOption)));
            return 2;
        }
        auto seeked = reader->Seek(offset);
        if (seeked.is_error()) {
            qCCritical(sspMain, "Seek failed: %s", seeked.error().message.c_str());
            return 1;
        }
    }

    int64_t written = 0;
    while (true) {
        auto data = reader->Read(kCopyChunk);
        if (data.is_error() && data.error().code == ssp::ErrorCode::ReadTimeout) {
            qCWarning(sspMain, "No data received in time, waiting");
            continue;
        }
        if (data.is_error()) {
            qCCritical(sspMain, "Error when reading from stream: %s (%s)", data.error().message.c_str(),
                       ssp::error_code_to_string(data.error().code));
            reader->Close();
            return 1;
        }
        if (data.value().empty()) {
            break;
        }
        if (std::fwrite(data.value().data(), 1, data.value().size(), stdout) != data.value().size()) {
            qCCritical(sspMain, "Error when writing to output, exiting");
            reader->Close();
            return 1;
        }
        written += static_cast<int64_t>(data.value().size());
    }
    std::fflush(stdout);

    qCInfo(sspMain, "Stream ended, %lld bytes written", static_cast<long long>(written));
    reader->Close();
    return 0;
}
