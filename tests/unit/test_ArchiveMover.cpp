#include <gtest/gtest.h>

#include "pipeline/ArchiveMover.hpp"
#include "pipeline/errors.hpp"
#include "fakes.hpp"

using namespace lc::pipeline;
using namespace lc::test;

class ArchiveMoverTest : public ::testing::Test {
protected:
    TempDir dir;
    fs::path source() const { return dir / "outbox"; }
    fs::path archive() const { return dir / "sent"; }

    fs::path drop(const std::string& name, const std::string& content = PDF_BYTES) const {
        writeFile(source() / name, content);
        return source() / name;
    }
};

TEST_F(ArchiveMoverTest, MovesFileIntoArchive) {
    const ArchiveMover mover;
    const auto src = drop("066-129999-9.pdf");

    const auto archived = mover.archive(src, archive());

    EXPECT_EQ(archived, archive() / "066-129999-9.pdf");
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(readFile(archived), PDF_BYTES);
}

TEST_F(ArchiveMoverTest, NeverOverwritesExistingArchiveEntries) {
    const ArchiveMover mover;
    writeFile(archive() / "066-129999-9.pdf", "first");
    writeFile(archive() / "066-129999-9_1.pdf", "second");

    const auto archived = mover.archive(drop("066-129999-9.pdf", "third"), archive());

    EXPECT_EQ(archived, archive() / "066-129999-9_2.pdf");
    EXPECT_EQ(readFile(archive() / "066-129999-9.pdf"), "first");
    EXPECT_EQ(readFile(archive() / "066-129999-9_1.pdf"), "second");
    EXPECT_EQ(readFile(archived), "third");
}

TEST_F(ArchiveMoverTest, GivesUpAfterMaxCollisionsAndKeepsSource) {
    const ArchiveMover mover(2);
    writeFile(archive() / "r.pdf", "0");
    writeFile(archive() / "r_1.pdf", "1");
    writeFile(archive() / "r_2.pdf", "2");
    const auto src = drop("r.pdf");

    try {
        (void)mover.archive(src, archive());
        FAIL() << "expected CollisionUnresolved";
    } catch (const ArchiveError& e) {
        EXPECT_EQ(e.reason(), FailureReason::CollisionUnresolved);
        EXPECT_FALSE(e.retryable());
    }

    EXPECT_TRUE(fs::exists(src));
    EXPECT_EQ(readFile(archive() / "r.pdf"), "0");
}

TEST_F(ArchiveMoverTest, CreatesArchiveDirectory) {
    const ArchiveMover mover;
    const auto archived = mover.archive(drop("a.pdf"), archive() / "2024");
    EXPECT_EQ(archived, archive() / "2024" / "a.pdf");
    EXPECT_TRUE(fs::exists(archived));
}

TEST_F(ArchiveMoverTest, MissingSourceIsTerminalLocalFailure) {
    const ArchiveMover mover;
    fs::create_directories(source());

    try {
        (void)mover.archive(source() / "gone.pdf", archive());
        FAIL() << "expected LocalIOFailure";
    } catch (const ArchiveError& e) {
        EXPECT_EQ(e.reason(), FailureReason::LocalIOFailure);
        EXPECT_FALSE(e.retryable());
    }
}

TEST(ArchiveMoverNamingTest, CandidateNamesKeepExtension) {
    EXPECT_EQ(ArchiveMover::candidateName("a.pdf", 0), "a.pdf");
    EXPECT_EQ(ArchiveMover::candidateName("a.pdf", 3), "a_3.pdf");
    EXPECT_EQ(ArchiveMover::candidateName("noext", 1), "noext_1");
    EXPECT_EQ(ArchiveMover::candidateName("066-129999-9.final.pdf", 1), "066-129999-9.final_1.pdf");
}

TEST_F(ArchiveMoverTest, CopyMoveAcrossDevicesKeepsContentAndMtime) {
    const ArchiveMover mover;
    const auto src = drop("066-129999-9.pdf");
    fs::create_directories(archive());
    fs::last_write_time(src, fs::last_write_time(src) - std::chrono::hours(24));
    const auto mtime = fs::last_write_time(src);

    EXPECT_EQ(mover.moveAcrossDevices(src, archive() / "066-129999-9.pdf"), ArchiveMover::MoveResult::Moved);

    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(readFile(archive() / "066-129999-9.pdf"), PDF_BYTES);
    EXPECT_EQ(fs::last_write_time(archive() / "066-129999-9.pdf"), mtime);
    EXPECT_FALSE(fs::exists(archive() / ".066-129999-9.pdf.part"));
}

TEST_F(ArchiveMoverTest, CopyMoveAcrossDevicesNeverReplaces) {
    const ArchiveMover mover;
    const auto src = drop("066-129999-9.pdf", "new");
    writeFile(archive() / "066-129999-9.pdf", "old");

    EXPECT_EQ(mover.moveAcrossDevices(src, archive() / "066-129999-9.pdf"), ArchiveMover::MoveResult::Exists);

    EXPECT_EQ(readFile(src), "new");
    EXPECT_EQ(readFile(archive() / "066-129999-9.pdf"), "old");
    EXPECT_FALSE(fs::exists(archive() / ".066-129999-9.pdf.part"));
}

TEST_F(ArchiveMoverTest, UnremovableSourceRollsBackCopy) {
    const ArchiveMover mover(100, [](const fs::path&, std::error_code& ec) {
        ec = std::make_error_code(std::errc::read_only_file_system);
        return false;
    });
    const auto src = drop("066-129999-9.pdf");
    fs::create_directories(archive());

    try {
        (void)mover.moveAcrossDevices(src, archive() / "066-129999-9.pdf");
        FAIL() << "expected LocalIOFailure";
    } catch (const ArchiveError& e) {
        EXPECT_EQ(e.reason(), FailureReason::LocalIOFailure);
        EXPECT_TRUE(e.retryable());
    }

    EXPECT_EQ(readFile(src), PDF_BYTES);
    EXPECT_FALSE(fs::exists(archive() / "066-129999-9.pdf"));
    EXPECT_FALSE(fs::exists(archive() / ".066-129999-9.pdf.part"));
}
