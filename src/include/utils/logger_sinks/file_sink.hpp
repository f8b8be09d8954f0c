#pragma once

#include <cstdio>
#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace conduit::utils
{

// Appends formatted messages to a file. Missing parent directories are created.
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened for appending.
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    std::FILE *m_file{nullptr};
};

} // namespace conduit::utils
