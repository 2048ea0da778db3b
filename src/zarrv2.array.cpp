#include "zarrv2.array.hh"
#include "file.sink.hh"
#include "macros.hh"
#include "pzarr.common.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {
const std::vector<std::string> supported_codecs = { "blosclz", "lz4",
                                                    "lz4hc",   "zlib",
                                                    "zstd" };

/// Copy a C-ordered block of @p extent elements from @p src, a buffer of
/// shape @p src_shape, starting at @p src_start, into @p dst, a buffer of
/// shape @p dst_shape, starting at @p dst_start.
void
copy_block(const std::byte* src,
           const std::vector<uint64_t>& src_shape,
           const std::vector<uint64_t>& src_start,
           std::byte* dst,
           const std::vector<uint64_t>& dst_shape,
           const std::vector<uint64_t>& dst_start,
           const std::vector<uint64_t>& extent,
           size_t bytes_per_element)
{
    const auto ndims = extent.size();

    std::vector<uint64_t> src_strides(ndims, 1), dst_strides(ndims, 1);
    for (auto i = ndims - 1; i > 0; --i) {
        src_strides[i - 1] = src_strides[i] * src_shape[i];
        dst_strides[i - 1] = dst_strides[i] * dst_shape[i];
    }

    // the last dimension is contiguous in both buffers
    const size_t bytes_of_run = extent.back() * bytes_per_element;

    std::vector<uint64_t> idx(ndims, 0);
    while (true) {
        uint64_t src_offset = 0, dst_offset = 0;
        for (auto i = 0; i < ndims; ++i) {
            src_offset += (src_start[i] + idx[i]) * src_strides[i];
            dst_offset += (dst_start[i] + idx[i]) * dst_strides[i];
        }

        std::memcpy(dst + dst_offset * bytes_per_element,
                    src + src_offset * bytes_per_element,
                    bytes_of_run);

        int i = static_cast<int>(ndims) - 2;
        for (; i >= 0; --i) {
            if (++idx[i] < extent[i]) {
                break;
            }
            idx[i] = 0;
        }

        if (i < 0) {
            break;
        }
    }
}

std::vector<uint64_t>
region_start(const std::vector<uint64_t>& lo,
             const std::vector<uint64_t>& origin)
{
    std::vector<uint64_t> start(lo.size());
    for (auto i = 0; i < lo.size(); ++i) {
        start[i] = lo[i] - origin[i];
    }
    return start;
}

std::vector<uint64_t>
region_extent(const std::vector<uint64_t>& lo, const std::vector<uint64_t>& hi)
{
    std::vector<uint64_t> extent(lo.size());
    for (auto i = 0; i < lo.size(); ++i) {
        extent[i] = hi[i] - lo[i];
    }
    return extent;
}
} // namespace

bool
pzarr::validate_array_config(const ZarrV2ArrayConfig& config)
{
    if (is_empty_string(config.store_path, "Store path is empty")) {
        return false;
    }

    if (config.dimensions.empty()) {
        LOG_ERROR("Array must have at least one dimension");
        return false;
    }

    for (const auto& dim : config.dimensions) {
        if (dim.chunk_size == 0) {
            LOG_ERROR("Invalid chunk size for dimension '", dim.name, "': 0");
            return false;
        }
    }

    if (config.dtype < 0 || config.dtype >= PzarrDataTypeCount) {
        LOG_ERROR("Invalid data type: ", config.dtype);
        return false;
    }

    if (config.compression_params) {
        const auto& params = *config.compression_params;
        if (std::find(supported_codecs.begin(),
                      supported_codecs.end(),
                      params.codec_id) == supported_codecs.end()) {
            LOG_ERROR("Unsupported Blosc codec: '", params.codec_id, "'");
            return false;
        }

        if (params.clevel > 9) {
            LOG_ERROR("Invalid compression level: ", int(params.clevel));
            return false;
        }

        if (params.shuffle > BLOSC_BITSHUFFLE) {
            LOG_ERROR("Invalid shuffle: ", int(params.shuffle));
            return false;
        }
    }

    return true;
}

pzarr::ZarrV2Array::ZarrV2Array(ZarrV2ArrayConfig&& config)
  : config_{ std::move(config) }
{
}

std::shared_ptr<pzarr::ZarrV2Array>
pzarr::ZarrV2Array::create(const ZarrV2ArrayConfig& config)
{
    EXPECT_VALID_ARGUMENT(validate_array_config(config),
                          "Invalid array configuration for ",
                          config.store_path);

    ZarrV2ArrayConfig copy = config;
    std::shared_ptr<ZarrV2Array> array(new ZarrV2Array(std::move(copy)));
    array->write_array_metadata_();

    return array;
}

std::shared_ptr<pzarr::ZarrV2Array>
pzarr::ZarrV2Array::open(std::string_view store_path)
{
    using json = nlohmann::json;

    const fs::path root(store_path);
    const auto metadata_path = root / ".zarray";
    EXPECT(fs::is_regular_file(metadata_path),
           "Array metadata not found at ",
           metadata_path.string());

    ZarrV2ArrayConfig config;
    config.store_path = std::string(store_path);

    try {
        std::ifstream f(metadata_path);
        const json metadata = json::parse(f);

        EXPECT(metadata.at("zarr_format").get<int>() == 2,
               "Unsupported Zarr format: ",
               metadata.at("zarr_format").dump());

        const auto shape = metadata.at("shape").get<std::vector<uint64_t>>();
        const auto chunks =
          metadata.at("chunks").get<std::vector<uint64_t>>();
        EXPECT(shape.size() == chunks.size(),
               "Shape and chunks have different ranks");

        std::vector<std::string> names;
        const auto attrs_path = root / ".zattrs";
        if (fs::is_regular_file(attrs_path)) {
            std::ifstream af(attrs_path);
            const json attrs = json::parse(af);
            if (attrs.contains("_ARRAY_DIMENSIONS")) {
                names = attrs.at("_ARRAY_DIMENSIONS")
                          .get<std::vector<std::string>>();
            }
        }

        for (auto i = 0; i < shape.size(); ++i) {
            const auto name =
              i < names.size() ? names[i] : "dim_" + std::to_string(i);
            config.dimensions.emplace_back(name, shape[i], chunks[i]);
        }

        config.dtype =
          dtype_from_string(metadata.at("dtype").get<std::string>());

        if (const auto& compressor = metadata.at("compressor");
            !compressor.is_null()) {
            EXPECT(compressor.at("id").get<std::string>() == "blosc",
                   "Unsupported compressor: ",
                   compressor.at("id").dump());
            config.compression_params = BloscCompressionParams(
              compressor.at("cname").get<std::string>(),
              compressor.at("clevel").get<uint8_t>(),
              compressor.at("shuffle").get<uint8_t>());
        }
    } catch (const json::exception& exc) {
        const std::string err = LOG_ERROR("Malformed array metadata at ",
                                          metadata_path.string(),
                                          ": ",
                                          exc.what());
        throw std::runtime_error(err);
    }

    EXPECT(validate_array_config(config),
           "Invalid array metadata at ",
           metadata_path.string());

    return std::shared_ptr<ZarrV2Array>(new ZarrV2Array(std::move(config)));
}

size_t
pzarr::ZarrV2Array::bytes_per_chunk_() const
{
    auto n_bytes = bytes_of_type(config_.dtype);
    for (const auto& dim : config_.dimensions) {
        n_bytes *= dim.chunk_size;
    }

    return n_bytes;
}

std::string
pzarr::ZarrV2Array::chunk_path_(const std::vector<uint64_t>& chunk_index) const
{
    fs::path path(config_.store_path);
    for (const auto& idx : chunk_index) {
        path /= std::to_string(idx);
    }

    return path.string();
}

void
pzarr::ZarrV2Array::write_array_metadata_() const
{
    using json = nlohmann::json;

    std::vector<uint64_t> array_shape, chunk_shape;
    std::vector<std::string> names;
    for (const auto& dim : config_.dimensions) {
        array_shape.push_back(dim.array_size);
        chunk_shape.push_back(dim.chunk_size);
        names.push_back(dim.name);
    }

    json metadata;
    metadata["zarr_format"] = 2;
    metadata["shape"] = array_shape;
    metadata["chunks"] = chunk_shape;
    metadata["dtype"] = dtype_to_string(config_.dtype);
    metadata["fill_value"] = 0;
    metadata["order"] = "C";
    metadata["filters"] = nullptr;
    metadata["dimension_separator"] = "/";

    if (config_.compression_params) {
        const BloscCompressionParams bcp = *config_.compression_params;
        metadata["compressor"] = json{ { "id", "blosc" },
                                       { "cname", bcp.codec_id },
                                       { "clevel", bcp.clevel },
                                       { "shuffle", bcp.shuffle },
                                       { "blocksize", 0 } };
    } else {
        metadata["compressor"] = nullptr;
    }

    json attributes;
    attributes["_ARRAY_DIMENSIONS"] = names;

    const fs::path root(config_.store_path);
    const std::pair<fs::path, std::string> documents[] = {
        { root / ".zarray", metadata.dump(4) },
        { root / ".zattrs", attributes.dump(4) },
    };

    for (const auto& [path, text] : documents) {
        std::unique_ptr<Sink> sink = std::make_unique<FileSink>(path.string());
        std::span data{ reinterpret_cast<const std::byte*>(text.data()),
                        text.size() };
        EXPECT(sink->write(0, data), "Failed to write ", path.string());
        EXPECT(finalize_sink(std::move(sink)),
               "Failed to finalize ",
               path.string());
    }
}

std::vector<std::byte>
pzarr::ZarrV2Array::read_chunk_(const std::vector<uint64_t>& chunk_index) const
{
    const auto bytes_of_chunk = bytes_per_chunk_();
    std::vector<std::byte> chunk(bytes_of_chunk, std::byte{ 0 });

    const auto path = chunk_path_(chunk_index);
    if (!fs::is_regular_file(path)) {
        return chunk;
    }

    std::ifstream file(path, std::ios::binary);
    EXPECT(file.is_open(), "Failed to open chunk ", path);

    std::vector<char> encoded((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());

    if (!config_.compression_params) {
        EXPECT(encoded.size() == bytes_of_chunk,
               "Chunk ",
               path,
               " has ",
               encoded.size(),
               " bytes, expected ",
               bytes_of_chunk);
        std::memcpy(chunk.data(), encoded.data(), bytes_of_chunk);
        return chunk;
    }

    EXPECT(encoded.size() >= BLOSC_MIN_HEADER_LENGTH,
           "Compressed chunk ",
           path,
           " is truncated");

    size_t nbytes = 0, cbytes = 0, blocksize = 0;
    blosc_cbuffer_sizes(encoded.data(), &nbytes, &cbytes, &blocksize);
    EXPECT(nbytes == bytes_of_chunk && cbytes == encoded.size(),
           "Corrupt compressed chunk ",
           path);

    const auto nb =
      blosc_decompress_ctx(encoded.data(), chunk.data(), chunk.size(), 1);
    EXPECT(nb == static_cast<int>(bytes_of_chunk),
           "Failed to decompress chunk ",
           path,
           ": ",
           nb);

    return chunk;
}

void
pzarr::ZarrV2Array::write_chunk_(const std::vector<uint64_t>& chunk_index,
                                 std::span<const std::byte> chunk) const
{
    const auto path = chunk_path_(chunk_index);

    std::vector<std::byte> compressed;
    std::span<const std::byte> data = chunk;

    if (config_.compression_params) {
        const auto& params = *config_.compression_params;
        const auto bytes_per_px = bytes_of_type(config_.dtype);

        const auto tmp_size = chunk.size() + BLOSC_MAX_OVERHEAD;
        compressed.resize(tmp_size);
        const auto nb = blosc_compress_ctx(params.clevel,
                                           params.shuffle,
                                           bytes_per_px,
                                           chunk.size(),
                                           chunk.data(),
                                           compressed.data(),
                                           tmp_size,
                                           params.codec_id.c_str(),
                                           0 /* blocksize - 0:automatic */,
                                           1);
        EXPECT(nb > 0, "Failed to compress chunk ", path, ": ", nb);

        compressed.resize(nb);
        data = compressed;
    }

    std::unique_ptr<Sink> sink = std::make_unique<FileSink>(path);
    EXPECT(sink->write(0, data), "Failed to write chunk ", path);
    EXPECT(finalize_sink(std::move(sink)), "Failed to finalize chunk ", path);
}

template<typename Visit>
void
pzarr::ZarrV2Array::for_each_chunk_(const std::vector<uint64_t>& offset,
                                    const std::vector<uint64_t>& extent,
                                    Visit&& visit) const
{
    const auto& dims = config_.dimensions;
    const auto ndims = dims.size();

    std::vector<uint64_t> first(ndims), last(ndims);
    for (auto i = 0; i < ndims; ++i) {
        first[i] = offset[i] / dims[i].chunk_size;
        last[i] = (offset[i] + extent[i] - 1) / dims[i].chunk_size;
    }

    std::vector<uint64_t> chunk_index = first;
    while (true) {
        std::vector<uint64_t> origin(ndims), lo(ndims), hi(ndims);
        bool covers_chunk = true;
        for (auto i = 0; i < ndims; ++i) {
            const auto chunk_size = dims[i].chunk_size;
            origin[i] = chunk_index[i] * chunk_size;
            const auto chunk_end =
              std::min(origin[i] + chunk_size, dims[i].array_size);

            lo[i] = std::max(offset[i], origin[i]);
            hi[i] = std::min(offset[i] + extent[i], chunk_end);
            covers_chunk = covers_chunk && lo[i] == origin[i] &&
                           hi[i] == chunk_end;
        }

        visit(chunk_index, origin, lo, hi, covers_chunk);

        int i = static_cast<int>(ndims) - 1;
        for (; i >= 0; --i) {
            if (++chunk_index[i] <= last[i]) {
                break;
            }
            chunk_index[i] = first[i];
        }

        if (i < 0) {
            break;
        }
    }
}

void
pzarr::ZarrV2Array::write_region(const std::vector<uint64_t>& offset,
                                 const std::vector<uint64_t>& extent,
                                 std::span<const std::byte> data)
{
    check_region_(offset, extent, data.size());
    if (std::find(extent.begin(), extent.end(), 0) != extent.end()) {
        return;
    }

    const auto bytes_per_px = bytes_of_type(config_.dtype);
    const auto chunk_shape = chunks();

    for_each_chunk_(
      offset,
      extent,
      [&](const std::vector<uint64_t>& chunk_index,
          const std::vector<uint64_t>& origin,
          const std::vector<uint64_t>& lo,
          const std::vector<uint64_t>& hi,
          bool covers_chunk) {
          // chunks only partly covered by the region keep their other values
          auto chunk = covers_chunk
                         ? std::vector<std::byte>(bytes_per_chunk_(),
                                                  std::byte{ 0 })
                         : read_chunk_(chunk_index);

          copy_block(data.data(),
                     extent,
                     region_start(lo, offset),
                     chunk.data(),
                     chunk_shape,
                     region_start(lo, origin),
                     region_extent(lo, hi),
                     bytes_per_px);

          write_chunk_(chunk_index, chunk);
      });
}

void
pzarr::ZarrV2Array::read_region(const std::vector<uint64_t>& offset,
                                const std::vector<uint64_t>& extent,
                                std::span<std::byte> out) const
{
    check_region_(offset, extent, out.size());
    if (std::find(extent.begin(), extent.end(), 0) != extent.end()) {
        return;
    }

    const auto bytes_per_px = bytes_of_type(config_.dtype);
    const auto chunk_shape = chunks();

    for_each_chunk_(offset,
                    extent,
                    [&](const std::vector<uint64_t>& chunk_index,
                        const std::vector<uint64_t>& origin,
                        const std::vector<uint64_t>& lo,
                        const std::vector<uint64_t>& hi,
                        bool) {
                        const auto chunk = read_chunk_(chunk_index);
                        copy_block(chunk.data(),
                                   chunk_shape,
                                   region_start(lo, origin),
                                   out.data(),
                                   extent,
                                   region_start(lo, offset),
                                   region_extent(lo, hi),
                                   bytes_per_px);
                    });
}
