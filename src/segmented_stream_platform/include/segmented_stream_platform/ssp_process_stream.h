#pragma once

#include "ssp_options.h"
#include "ssp_stream.h"

#include <string>
#include <vector>

namespace ssp {

// Output of an external program (an rtmpdump-style dumper writing the media
// to stdout). Never seekable.
class ProcessStream : public Stream {
public:
    ProcessStream(std::string program, std::vector<std::string> arguments,
                  StreamOptions options = default_options());

    StreamType type() const override { return StreamType::Process; }
    std::string describe() const override;

    // Starts the process. Fails when it cannot be started or exits with an
    // error right away.
    Result<std::unique_ptr<StreamReader>> Open() override;

    const std::string& program() const { return m_program; }
    const std::vector<std::string>& arguments() const { return m_arguments; }

private:
    std::string m_program;
    std::vector<std::string> m_arguments;
    StreamOptions m_options;
};

} // namespace ssp
