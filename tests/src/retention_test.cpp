#include "gtest/gtest.h"
#include "helpers/TestHelpers.hpp"

#include "retention.hpp"

#include <stdexcept>

class RetentionTest : public ScratchTest
{
protected:
    /**
     * @brief Creates one artifact per timestamp, oldest first, with increasing mtimes.
     */
    void MakeArtifacts(ArtifactKind kind, const std::vector<std::string>& timestamps)
    {
        BackupLayout layout{scratch};
        auto age = std::chrono::hours(static_cast<int>(timestamps.size()) + 1);
        for (const auto& timestamp : timestamps)
        {
            auto path = layout.artifactPath("site.test", kind, timestamp);
            WriteFile(path, timestamp);
            SetModifiedAgo(path, age);
            age -= std::chrono::hours(1);
        }
    }
};

TEST_F(RetentionTest, KeepsNewestFileArchives)
{
    // Arrange
    MakeArtifacts(ArtifactKind::Files, {"2024-01-01_000000", "2024-01-02_000000", "2024-01-03_000000",
                                        "2024-01-04_000000", "2024-01-05_000000"});
    RetentionManager retention(BackupLayout{scratch}, RetentionPolicy{3, 20});

    // Act
    auto removed = retention.rotate("site.test", ArtifactKind::Files);

    // Assert
    ASSERT_TRUE(removed.has_value()) << removed.error();
    EXPECT_EQ(*removed, 2u);
    EXPECT_EQ(GetFileNames(scratch / "site.test"),
              (std::vector<std::string>{"files_2024-01-03_000000.tar.gz", "files_2024-01-04_000000.tar.gz",
                                        "files_2024-01-05_000000.tar.gz"}));
}

TEST_F(RetentionTest, LeavesForeignFilesAndOtherKindsAlone)
{
    MakeArtifacts(ArtifactKind::Files, {"2024-01-01_000000", "2024-01-02_000000"});
    MakeArtifacts(ArtifactKind::Database, {"2024-01-01_000000", "2024-01-02_000000", "2024-01-03_000000"});
    WriteFile(scratch / "site.test" / "notes.txt", "keep me");
    WriteFile(scratch / "site.test" / "files_2024-01-06_000000.tar.gz.partial", "in flight");
    RetentionManager retention(BackupLayout{scratch}, RetentionPolicy{1, 2});

    auto files = retention.rotate("site.test", ArtifactKind::Files);
    auto dumps = retention.rotate("site.test", ArtifactKind::Database);

    ASSERT_TRUE(files.has_value());
    ASSERT_TRUE(dumps.has_value());
    EXPECT_EQ(*files, 1u);
    EXPECT_EQ(*dumps, 1u);
    EXPECT_EQ(GetFileNames(scratch / "site.test"),
              (std::vector<std::string>{"files_2024-01-02_000000.tar.gz", "files_2024-01-06_000000.tar.gz.partial",
                                        "notes.txt"}));
    EXPECT_EQ(GetFileNames(scratch / "site.test" / "database"),
              (std::vector<std::string>{"db_2024-01-02_000000.sql.gz", "db_2024-01-03_000000.sql.gz"}));
}

TEST_F(RetentionTest, DanglingLinkInBackupDirectoryDoesNotStopRotation)
{
    // Arrange
    MakeArtifacts(ArtifactKind::Files, {"2024-01-01_000000", "2024-01-02_000000", "2024-01-03_000000"});
    fs::create_symlink(scratch / "nowhere", scratch / "site.test" / "0-dangling");
    RetentionManager retention(BackupLayout{scratch}, RetentionPolicy{1, 1});

    // Act
    auto removed = retention.rotate("site.test", ArtifactKind::Files);

    // Assert
    ASSERT_TRUE(removed.has_value()) << removed.error();
    EXPECT_EQ(*removed, 2u);
    EXPECT_EQ(GetFileNames(scratch / "site.test"), std::vector<std::string>{"files_2024-01-03_000000.tar.gz"});
}

TEST_F(RetentionTest, OrdersByModificationTimeNotName)
{
    BackupLayout layout{scratch};
    auto older = layout.artifactPath("site.test", ArtifactKind::Files, "2024-06-01_000000");
    auto newer = layout.artifactPath("site.test", ArtifactKind::Files, "2024-01-01_000000");
    WriteFile(older, "a");
    WriteFile(newer, "b");
    SetModifiedAgo(older, std::chrono::hours(48));
    SetModifiedAgo(newer, std::chrono::hours(1));
    RetentionManager retention(layout, RetentionPolicy{1, 1});

    auto removed = retention.rotate("site.test", ArtifactKind::Files);

    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(fs::exists(older));
    EXPECT_TRUE(fs::exists(newer));
}

TEST_F(RetentionTest, NothingToDoForMissingSiteOrFewArtifacts)
{
    MakeArtifacts(ArtifactKind::Database, {"2024-01-01_000000"});
    RetentionManager retention(BackupLayout{scratch}, RetentionPolicy{});

    EXPECT_EQ(retention.rotate("unknown.test", ArtifactKind::Files).value(), 0u);
    EXPECT_EQ(retention.rotate("site.test", ArtifactKind::Database).value(), 0u);
    EXPECT_EQ(GetFileNames(scratch / "site.test" / "database").size(), 1u);
}

TEST_F(RetentionTest, RejectsNonPositiveMaxima)
{
    EXPECT_THROW(RetentionManager(BackupLayout{scratch}, RetentionPolicy{0, 20}), std::invalid_argument);
    EXPECT_THROW(RetentionManager(BackupLayout{scratch}, RetentionPolicy{5, -1}), std::invalid_argument);
}

TEST_F(RetentionTest, DefaultPolicyKeepsFiveArchivesAndTwentyDumps)
{
    RetentionPolicy policy;

    EXPECT_EQ(policy.maxKept(ArtifactKind::Files), 5);
    EXPECT_EQ(policy.maxKept(ArtifactKind::Database), 20);
}
