#pragma once

#include "sink.hh"

#include <fstream>
#include <string_view>

namespace pzarr {
class FileSink : public Sink
{
  public:
    /**
     * @brief Open @p filename for writing, truncating any existing contents.
     * @note Missing parent directories are created.
     * @throw std::runtime_error if the file cannot be opened.
     */
    explicit FileSink(std::string_view filename);

    bool write(size_t offset, std::span<const std::byte> data) override;

  protected:
    bool flush_() override;

  private:
    std::ofstream file_;
};
} // namespace pzarr
