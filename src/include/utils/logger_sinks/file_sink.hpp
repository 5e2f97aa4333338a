#pragma once

#include "sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace sfhost::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a single file.
 *
 * The file is opened in the constructor and closed in the destructor.
 * Write failures throw std::system_error; the Logger reports them through its
 * write-error callback.
 */
class SFHOST_EXPORT FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened for appending.
     */
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

    const std::filesystem::path &path() const { return m_path; }

  private:
    std::filesystem::path m_path;
    std::FILE *m_file = nullptr;
};

} // namespace sfhost::utils
