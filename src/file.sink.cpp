#include "file.sink.hh"
#include "macros.hh"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

pzarr::FileSink::FileSink(std::string_view filename)
{
    const fs::path path(filename);

    // other workers may be creating the same directories concurrently
    if (const auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        EXPECT(fs::is_directory(parent),
               "Failed to create directory ",
               parent.string(),
               ": ",
               ec.message());
    }

    file_.open(path, std::ios::binary | std::ios::trunc);
    EXPECT(file_.is_open(), "Failed to open file ", path.string());
}

bool
pzarr::FileSink::write(size_t offset, std::span<const std::byte> data)
{
    const auto bytes_of_buf = data.size();
    if (data.data() == nullptr || bytes_of_buf == 0) {
        return true;
    }

    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(bytes_of_buf));
    return file_.good();
}

bool
pzarr::FileSink::flush_()
{
    file_.flush();
    return file_.good();
}
