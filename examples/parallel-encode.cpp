/// @file
/// @brief Encode a Blosc-compressed genotype-like array of 10,000 variants by
/// 64 samples in parallel. The variants are split into chunk-aligned slices,
/// each written by its own worker process, with progress shown on stderr.
/// Usage: parallel-encode [store path] [worker count]

#include "buffered.array.writer.hh"
#include "macros.hh"
#include "slice.aligner.hh"
#include "work.manager.hh"
#include "zarrv2.array.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
const uint64_t n_variants = 10000, n_samples = 64;
const uint64_t variants_per_chunk = 1000, samples_per_chunk = 16;

json
encode_slice(const std::string& store_path, pzarr::RowSlice slice)
{
    std::shared_ptr<pzarr::ChunkedArray> array =
      pzarr::ZarrV2Array::open(store_path);

    pzarr::BufferedArrayWriter writer(array, slice.start);
    for (auto v = slice.start; v < slice.stop; ++v) {
        auto row = writer.row_as<int8_t>(writer.next_row());
        for (auto s = 0; s < row.size(); ++s) {
            row[s] = static_cast<int8_t>((v * 31 + s * 7) % 3);
        }
    }
    writer.close();

    return { { "start", slice.start }, { "stop", slice.stop } };
}
} // namespace

int
main(int argc, char* argv[])
{
    const std::string store_path =
      argc > 1 ? argv[1] : (fs::temp_directory_path() / "example.zarr").string();
    const int n_workers =
      argc > 2 ? std::stoi(argv[2])
               : static_cast<int>(std::thread::hardware_concurrency());

    Logger::set_log_level(PzarrLogLevel_Info);

    try {
        pzarr::ZarrV2ArrayConfig config{
            .store_path = store_path,
            .dimensions = { { "variants", n_variants, variants_per_chunk },
                            { "samples", n_samples, samples_per_chunk } },
            .dtype = pzarr::min_int_dtype(0, 2),
            .compression_params =
              pzarr::BloscCompressionParams(
                pzarr::blosc_codec_to_string(PzarrCompressionCodec_BloscZstd),
                7,
                BLOSC_BITSHUFFLE),
        };
        auto array = pzarr::ZarrV2Array::create(config);

        const auto slices = pzarr::chunk_aligned_slices(
          *array, static_cast<uint32_t>(std::max(n_workers, 1)));

        pzarr::WorkManager manager(
          n_workers,
          { .total = n_variants * n_samples,
            .units = "B",
            .title = "Encode",
            .show = true });

        for (const auto& slice : slices) {
            manager.submit(
              [&store_path, slice] { return encode_slice(store_path, slice); });
        }

        auto completed = manager.results_as_completed();
        while (auto result = completed.next()) {
            LOG_DEBUG("Encoded variants [",
                      result->at("start").get<uint64_t>(),
                      ", ",
                      result->at("stop").get<uint64_t>(),
                      ")");
        }
        manager.close();

        LOG_INFO("Wrote ", store_path);
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
        return 1;
    }

    return 0;
}
