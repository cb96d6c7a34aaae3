#include <gtest/gtest.h>

#include "pipeline/PatternFilter.hpp"
#include "fakes.hpp"

using namespace lc::pipeline;
using namespace lc::test;

class PatternFilterTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(PatternFilterTest, MatchesAnyConfiguredGlob) {
    const PatternFilter filter({"*.pdf", "*.PDF"}, {});
    writeFile(dir / "066-129999-9.pdf", PDF_BYTES);
    writeFile(dir / "066-129999-9.PDF", PDF_BYTES);
    writeFile(dir / "066-129999-9.txt", "hello");

    EXPECT_TRUE(filter.matches(dir / "066-129999-9.pdf"));
    EXPECT_TRUE(filter.matches(dir / "066-129999-9.PDF"));
    EXPECT_FALSE(filter.matches(dir / "066-129999-9.txt"));
}

TEST_F(PatternFilterTest, LeadingDotIsNotMatchedByWildcard) {
    const PatternFilter filter({"*.pdf"}, {});
    EXPECT_FALSE(filter.matchesName(".066-129999-9.pdf.part"));
    EXPECT_FALSE(filter.matchesName(".hidden.pdf"));
    EXPECT_TRUE(filter.matchesName("visible.pdf"));
}

TEST_F(PatternFilterTest, RejectsEmptyMissingAndNonRegularFiles) {
    const PatternFilter filter({"*.pdf"}, {});
    writeFile(dir / "empty.pdf", "");
    fs::create_directory(dir / "folder.pdf");

    EXPECT_FALSE(filter.matches(dir / "empty.pdf"));
    EXPECT_FALSE(filter.matches(dir / "missing.pdf"));
    EXPECT_FALSE(filter.matches(dir / "folder.pdf"));
}

TEST_F(PatternFilterTest, RejectsSymlinksEvenToMatchingFiles) {
    const PatternFilter filter({"*.pdf"}, {});
    writeFile(dir / "real.pdf", PDF_BYTES);
    fs::create_symlink(dir / "real.pdf", dir / "link.pdf");

    EXPECT_TRUE(filter.matches(dir / "real.pdf"));
    EXPECT_FALSE(filter.matches(dir / "link.pdf"));
}

TEST_F(PatternFilterTest, MimeAllowListUsesSniffer) {
    const PatternFilter filter({"*.pdf"}, {"application/pdf"}, [](const fs::path& p) {
        return readFile(p).starts_with("%PDF") ? std::string("application/pdf") : std::string("text/plain");
    });
    writeFile(dir / "good.pdf", PDF_BYTES);
    writeFile(dir / "fake.pdf", "just some text");

    EXPECT_TRUE(filter.matches(dir / "good.pdf"));
    EXPECT_FALSE(filter.matches(dir / "fake.pdf"));
}

TEST_F(PatternFilterTest, SnifferFailureCountsAsMismatch) {
    const PatternFilter filter({"*.pdf"}, {"application/pdf"}, [](const fs::path&) -> std::string {
        throw std::runtime_error("magic database missing");
    });
    writeFile(dir / "good.pdf", PDF_BYTES);

    EXPECT_FALSE(filter.matches(dir / "good.pdf"));
    EXPECT_EQ(filter.mimeTypeOf(dir / "good.pdf"), "");
}

TEST_F(PatternFilterTest, LibmagicRecognizesPdf) {
    const PatternFilter filter({"*.pdf"}, {"application/pdf"});
    writeFile(dir / "good.pdf", PDF_BYTES);
    writeFile(dir / "fake.pdf", "plain words, no pdf header here\n");

    EXPECT_EQ(filter.mimeTypeOf(dir / "good.pdf"), "application/pdf");
    EXPECT_TRUE(filter.matches(dir / "good.pdf"));
    EXPECT_FALSE(filter.matches(dir / "fake.pdf"));
}

TEST_F(PatternFilterTest, MatchingLeavesFileUntouched) {
    const PatternFilter filter({"*.pdf"}, {"application/pdf"});
    const auto path = dir / "good.pdf";
    writeFile(path, PDF_BYTES);
    const auto before = fs::last_write_time(path);

    ASSERT_TRUE(filter.matches(path));
    EXPECT_EQ(readFile(path), PDF_BYTES);
    EXPECT_EQ(fs::last_write_time(path), before);
}
