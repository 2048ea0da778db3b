#pragma once

#include "blosc.compression.params.hh"
#include "chunked.array.hh"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pzarr {
struct ZarrV2ArrayConfig final
{
    std::string store_path;
    std::vector<ArrayDimension> dimensions;
    PzarrDataType dtype{ PzarrDataType_uint8 };
    std::optional<BloscCompressionParams> compression_params;
};

/**
 * @brief Check that @p config describes an array we can create.
 * @return True if the config is valid, false otherwise. Problems are logged.
 */
[[nodiscard]] bool
validate_array_config(const ZarrV2ArrayConfig& config);

/**
 * @brief A Zarr v2 array on the local filesystem.
 * @details Chunks are stored at full chunk size under nested directories
 * ("/" dimension separator), either raw or Blosc-compressed. Chunks never
 * written read back as zeros, the array's fill value.
 * Region writes to distinct chunks are safe from concurrent processes; two
 * writers touching the same chunk are not.
 */
class ZarrV2Array final : public ChunkedArray
{
  public:
    /**
     * @brief Create a new array, writing its metadata.
     * @throw std::invalid_argument if @p config is invalid.
     */
    static std::shared_ptr<ZarrV2Array> create(const ZarrV2ArrayConfig& config);

    /**
     * @brief Open an existing array from its metadata.
     * @throw std::runtime_error if the metadata is missing or malformed.
     */
    static std::shared_ptr<ZarrV2Array> open(std::string_view store_path);

    const std::vector<ArrayDimension>& dimensions() const override
    {
        return config_.dimensions;
    }
    PzarrDataType dtype() const override { return config_.dtype; }
    const std::string& store_path() const { return config_.store_path; }
    const std::optional<BloscCompressionParams>& compression_params() const
    {
        return config_.compression_params;
    }

    void write_region(const std::vector<uint64_t>& offset,
                      const std::vector<uint64_t>& extent,
                      std::span<const std::byte> data) override;
    void read_region(const std::vector<uint64_t>& offset,
                     const std::vector<uint64_t>& extent,
                     std::span<std::byte> out) const override;

  private:
    explicit ZarrV2Array(ZarrV2ArrayConfig&& config);

    ZarrV2ArrayConfig config_;

    size_t bytes_per_chunk_() const;
    std::string chunk_path_(const std::vector<uint64_t>& chunk_index) const;

    void write_array_metadata_() const;

    /// @brief Decoded chunk contents, or zeros if the chunk does not exist.
    std::vector<std::byte> read_chunk_(
      const std::vector<uint64_t>& chunk_index) const;
    void write_chunk_(const std::vector<uint64_t>& chunk_index,
                      std::span<const std::byte> chunk) const;

    template<typename Visit>
    void for_each_chunk_(const std::vector<uint64_t>& offset,
                         const std::vector<uint64_t>& extent,
                         Visit&& visit) const;
};
} // namespace pzarr
