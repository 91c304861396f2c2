#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <boost/filesystem.hpp>
#include "OutputUtils.h"

using archetypeinfer::utils::TeeStream;
using archetypeinfer::utils::createOutputFilePath;

namespace fs = boost::filesystem;

TEST_CASE("TeeStream writes to both streams", "[OutputUtils]")
{
    std::ostringstream console;
    std::ostringstream logFile;

    {
        TeeStream tee(console, logFile);
        tee << "[Batch] 12 cells selected" << std::endl;
        tee << 42 << ' ' << 0.5;
        tee.flush();
    }

    REQUIRE(console.str() == "[Batch] 12 cells selected\n42 0.5");
    REQUIRE(logFile.str() == console.str());
}

TEST_CASE("Output paths are created inside the output directory", "[OutputUtils]")
{
    const std::string dir("output_utils_test_dir/nested");
    const std::string path = createOutputFilePath(dir, "summary.json");

    REQUIRE(fs::is_directory(dir));
    REQUIRE(fs::path(path).filename().string() == "summary.json");
    REQUIRE(fs::path(path).parent_path() == fs::path(dir));

    fs::remove_all("output_utils_test_dir");
}
