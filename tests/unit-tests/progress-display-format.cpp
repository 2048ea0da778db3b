#include "progress.display.hh"
#include "unit.test.macros.hh"

#include <sstream>

int
main()
{
    int retval = 0;

    try {
        {
            std::ostringstream out;
            pzarr::ProgressDisplay display(
              { .total = 2000, .units = "B", .title = "Encode", .show = true },
              out);

            display.update(500);
            display.update(1500);
            EXPECT_EQ(uint64_t, display.n(), 2000);

            display.close();
            const auto text = out.str();
            CHECK(text.find("Encode") != std::string::npos);
            CHECK(text.find("100%") != std::string::npos);
            CHECK(text.find("2.00kB") != std::string::npos);
            CHECK(text.back() == '\n');

            // closing again draws nothing more
            display.close();
            EXPECT_EQ(size_t, out.str().size(), text.size());
        }

        {
            // without a total, only the count is shown
            std::ostringstream out;
            pzarr::ProgressDisplay display({ .units = "B", .show = true }, out);
            display.update(42);
            display.close();
            CHECK(out.str().find("42B") != std::string::npos);
            CHECK(out.str().find('%') == std::string::npos);
        }

        {
            // hidden displays count without drawing
            std::ostringstream out;
            pzarr::ProgressDisplay display({ .total = 10, .show = false }, out);
            display.update(10);
            display.close();
            EXPECT_EQ(uint64_t, display.n(), 10);
            CHECK(out.str().empty());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
