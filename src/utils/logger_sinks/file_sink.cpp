#include "cdt_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace conduit::utils
{

FileSink::FileSink(const std::string &path) : m_path(std::filesystem::absolute(path))
{
    std::error_code ec;
    if (m_path.has_parent_path())
    {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error(fmt::format("Failed to create log directory '{}': {}",
                                                 m_path.parent_path().string(), ec.message()));
        }
    }
    m_file = std::fopen(m_path.string().c_str(), "ab");
    if (m_file == nullptr)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path.string(), std::strerror(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fflush(m_file);
        std::fclose(m_file);
    }
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const auto line = format_logmsg(msg, mode);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::runtime_error(fmt::format("Short write to log file '{}'", m_path.string()));
    }
    if (mode == Sink::SYNC_WRITE)
    {
        std::fflush(m_file);
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace conduit::utils
