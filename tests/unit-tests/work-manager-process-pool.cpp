#include "buffered.array.writer.hh"
#include "progress.state.hh"
#include "slice.aligner.hh"
#include "work.manager.hh"
#include "zarrv2.array.hh"
#include "unit.test.macros.hh"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {
const fs::path base_dir = fs::temp_directory_path() / TEST;

const uint64_t n_variants = 100, n_samples = 6;
const uint64_t variants_per_chunk = 10, samples_per_chunk = 4;
const uint64_t total_bytes = n_variants * n_samples * sizeof(int32_t);

std::shared_ptr<pzarr::ZarrV2Array>
make_array(const std::string& name)
{
    pzarr::ZarrV2ArrayConfig config{
        .store_path = (base_dir / name).string(),
        .dimensions = { { "variants", n_variants, variants_per_chunk },
                        { "samples", n_samples, samples_per_chunk } },
        .dtype = PzarrDataType_int32,
        .compression_params = pzarr::BloscCompressionParams("lz4", 5, 1),
    };
    return pzarr::ZarrV2Array::create(config);
}

/// Fill rows [slice.start, slice.stop) of the array at @p store_path.
nlohmann::json
encode_slice(const std::string& store_path, pzarr::RowSlice slice)
{
    std::shared_ptr<pzarr::ChunkedArray> array =
      pzarr::ZarrV2Array::open(store_path);

    pzarr::BufferedArrayWriter writer(array, slice.start);
    for (auto v = slice.start; v < slice.stop; ++v) {
        auto row = writer.row_as<int32_t>(writer.next_row());
        for (auto s = 0; s < n_samples; ++s) {
            row[s] = static_cast<int32_t>(v * 10 + s);
        }
    }
    writer.close();

    return { { "start", slice.start },
             { "stop", slice.stop },
             { "pid", static_cast<int>(getpid()) } };
}

/// Encode the array at @p store_path with @p n_workers workers.
/// @return The number of rows reported by the units.
uint64_t
encode(const std::string& store_path, int n_workers)
{
    auto array = pzarr::ZarrV2Array::open(store_path);
    const auto slices = pzarr::chunk_aligned_slices(*array, 4);
    EXPECT_EQ(size_t, slices.size(), 4);

    pzarr::WorkManager manager(n_workers,
                               { .total = total_bytes,
                                 .units = "B",
                                 .title = "Encode",
                                 .show = false });

    for (const auto& slice : slices) {
        manager.submit(
          [store_path, slice] { return encode_slice(store_path, slice); });
    }

    uint64_t n_rows = 0;
    auto completed = manager.results_as_completed();
    while (auto result = completed.next()) {
        const auto start = result->at("start").get<uint64_t>();
        const auto stop = result->at("stop").get<uint64_t>();
        n_rows += stop - start;

        if (n_workers > 0) {
            CHECK(result->at("pid").get<int>() != static_cast<int>(getpid()));
        }
    }
    manager.close();

    EXPECT_EQ(uint64_t, pzarr::ProgressState::read(), total_bytes);
    return n_rows;
}

std::string
slurp(const fs::path& path)
{
    std::ifstream f(path, std::ios::binary);
    return { std::istreambuf_iterator<char>(f),
             std::istreambuf_iterator<char>() };
}

/// Check every chunk under @p store_path against its counterpart under
/// @p other_path, byte for byte.
/// @return The number of chunks compared.
size_t
compare_chunks(const std::string& store_path, const std::string& other_path)
{
    size_t n_chunks = 0;
    for (const auto& entry : fs::recursive_directory_iterator(store_path)) {
        if (!entry.is_regular_file() ||
            entry.path().filename().string().front() == '.') {
            continue;
        }

        const auto counterpart =
          fs::path(other_path) / fs::relative(entry.path(), store_path);
        CHECK(fs::is_regular_file(counterpart));
        CHECK(slurp(entry.path()) == slurp(counterpart));
        ++n_chunks;
    }

    return n_chunks;
}
} // namespace

int
main()
{
    int retval = 0;

    try {
        auto parallel = make_array("parallel.zarr");
        auto serial = make_array("serial.zarr");

        EXPECT_EQ(uint64_t, encode(parallel->store_path(), 3), n_variants);
        EXPECT_EQ(uint64_t, encode(serial->store_path(), 0), n_variants);

        std::vector<int32_t> values(n_variants * n_samples);
        parallel->read_region({ 0, 0 },
                              { n_variants, n_samples },
                              std::as_writable_bytes(std::span(values)));
        for (auto v = 0; v < n_variants; ++v) {
            for (auto s = 0; s < n_samples; ++s) {
                EXPECT_EQ(int32_t, values[v * n_samples + s], v * 10 + s);
            }
        }

        // the number of workers has no effect on what ends up in storage
        auto single = make_array("single.zarr");
        EXPECT_EQ(uint64_t, encode(single->store_path(), 1), n_variants);

        EXPECT_EQ(size_t,
                  compare_chunks(parallel->store_path(), serial->store_path()),
                  10 * 2);
        EXPECT_EQ(size_t,
                  compare_chunks(single->store_path(), serial->store_path()),
                  10 * 2);

        // a timeout returns without losing the unit
        {
            pzarr::WorkManager manager(1);
            manager.submit([] {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                return nlohmann::json("done");
            });

            const auto done =
              manager.wait_for_completed(std::chrono::milliseconds(10));
            CHECK(done.empty());
            EXPECT_EQ(size_t, manager.n_outstanding(), 1);

            const auto later = manager.wait_for_completed();
            EXPECT_EQ(size_t, later.size(), 1);
            EXPECT_STR_EQ(later[0]->result().get<std::string>(), "done");
            manager.close();
        }

        // more units than workers
        {
            pzarr::WorkManager manager(2);
            std::vector<pzarr::WorkHandlePtr> handles;
            for (auto i = 0; i < 7; ++i) {
                handles.push_back(
                  manager.submit([i] { return nlohmann::json(i + 1); }));
            }
            manager.close();

            int sum = 0;
            for (const auto& handle : handles) {
                CHECK(handle->state() == pzarr::WorkHandle::State::Finished);
                sum += handle->result().get<int>();
            }
            EXPECT_EQ(int, sum, 28);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
