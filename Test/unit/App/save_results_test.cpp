#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "save_results.hpp"
#include "test_images.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sifinder_app;

namespace {

std::vector<std::string> readLines(const fs::path& file)
{
    std::ifstream in(file);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

class SaveResultsTest : public ::testing::Test {
protected:
    sifinder_test::TempDir tempDir{ "sifinder_csv" };
};

TEST_F(SaveResultsTest, HashesWithHeader) {
    const auto out = tempDir / "hashes.csv";
    std::vector<HashedImage> images{
        { "/p/a.png", sifinder::Fingerprint(0x00000000ffffffffULL), "" },
        { "/p/b.jpg", sifinder::Fingerprint(0x8000000000000001ULL), "" },
    };

    ASSERT_TRUE(saveHashesCSV(out.string(), images));

    EXPECT_THAT(readLines(out), ::testing::ElementsAre(
        "filepath,phash_hex",
        "\"/p/a.png\",00000000ffffffff",
        "\"/p/b.jpg\",8000000000000001"));
}

TEST_F(SaveResultsTest, FailedImageHasEmptyHash) {
    const auto out = tempDir / "hashes.csv";
    std::vector<HashedImage> images{ { "/p/broken.jpg", std::nullopt, "cannot decode" } };

    ASSERT_TRUE(saveHashesCSV(out.string(), images));

    EXPECT_THAT(readLines(out), ::testing::ElementsAre("filepath,phash_hex", "\"/p/broken.jpg\","));
}

TEST_F(SaveResultsTest, MatchesWithSimilarity) {
    const auto out = tempDir / "matches.csv";
    std::vector<sifinder::Match> matches{ { 0, "/p/a.png" }, { 8, "/p/b.png" } };

    ASSERT_TRUE(saveMatchesCSV(out.string(), "/q.png", matches));

    EXPECT_THAT(readLines(out), ::testing::ElementsAre(
        "query,match,distance,similarity",
        "\"/q.png\",\"/p/a.png\",0,100.00",
        "\"/q.png\",\"/p/b.png\",8,87.50"));
}

TEST_F(SaveResultsTest, QuotesAndCommasInPathsAreEscaped) {
    const auto out = tempDir / "matches.csv";
    std::vector<sifinder::Match> matches{ { 1, "/p/say \"hi\", again.png" } };

    ASSERT_TRUE(saveMatchesCSV(out.string(), "/q.png", matches));

    const auto lines = readLines(out);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "\"/q.png\",\"/p/say \"\"hi\"\", again.png\",1,98.44");
}

TEST_F(SaveResultsTest, EmptyMatchesWriteOnlyHeader) {
    const auto out = tempDir / "matches.csv";

    ASSERT_TRUE(saveMatchesCSV(out.string(), "/q.png", {}));

    EXPECT_THAT(readLines(out), ::testing::ElementsAre("query,match,distance,similarity"));
}

TEST_F(SaveResultsTest, UnwritablePathReturnsFalse) {
    const auto out = tempDir / "missing_dir" / "hashes.csv";

    testing::internal::CaptureStderr();
    const bool saved = saveHashesCSV(out.string(), {});
    const auto err = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(saved);
    EXPECT_THAT(err, ::testing::HasSubstr("Cannot create output file"));
    EXPECT_FALSE(fs::exists(out));
}
