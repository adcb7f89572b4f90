#include "gtest/gtest.h"
#include "helpers/LocalShell.hpp"
#include "helpers/TestHelpers.hpp"

#include "file_backup.hpp"
#include "logger.hpp"
#include "remote_backup.hpp"
#include "retention.hpp"

#include <stdexcept>

namespace
{

const BackupResult* FindResult(const std::vector<BackupResult>& results, ArtifactKind kind)
{
    for (const auto& result : results)
    {
        if (result.kind == kind)
        {
            return &result;
        }
    }
    return nullptr;
}

bool RanCommandContaining(const LocalShell& shell, const std::string& needle)
{
    for (const auto& command : shell.commands)
    {
        if (command.find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

} // namespace

class RemoteBackupTest : public ScratchTest
{
protected:
    LocalShell shell;
    Logger logger;
    BackupLayout layout;
    fs::path remoteTemp;
    Site site;

    void SetUp() override
    {
        ScratchTest::SetUp();
        layout = BackupLayout{scratch / "local-backups"};
        remoteTemp = scratch / "remote-tmp";

        auto bin = scratch / "remote-bin";
        WriteScript(bin / "mysqldump", "echo \"-- remote dump of $7\"\n");
        shell.preamble = "PATH=" + shellQuote(bin.string()) + ":$PATH; export PATH; ";

        auto root = scratch / "remote-www" / "app" / "public";
        WriteFile(root / "index.php", "<?php // app");
        WriteFile(root / "node_modules" / "dep.js", "dep");
        site = Site{"app.example.com", root.string(), DatabaseConfig{"", "app_db", "app_user", "pw"}};
    }

    RemoteBackupOptions Options(RemoteTransferMode mode = RemoteTransferMode::SecureCopy, bool oncePerDay = false)
    {
        RemoteBackupOptions options;
        options.tempDirectory = remoteTemp.string();
        options.transferMode = mode;
        options.oncePerDay = oncePerDay;
        return options;
    }

    std::vector<BackupResult> Run(RemoteBackupOptions options, RetentionPolicy policy = {})
    {
        RetentionManager retention(layout, policy);
        RemoteBackupOrchestrator orchestrator(shell, layout, retention, logger, options);
        auto results = orchestrator.run({site});
        EXPECT_TRUE(results.has_value()) << results.error();
        return results.value_or(std::vector<BackupResult>{});
    }
};

TEST_F(RemoteBackupTest, PullsArchiveAndDumpIntoLocalLayout)
{
    // Act
    auto results = Run(Options());

    // Assert
    ASSERT_EQ(results.size(), 2u);
    const auto* files = FindResult(results, ArtifactKind::Files);
    const auto* database = FindResult(results, ArtifactKind::Database);
    ASSERT_NE(files, nullptr);
    ASSERT_NE(database, nullptr);
    ASSERT_EQ(files->outcome, UnitOutcome::Created) << files->detail;
    ASSERT_EQ(database->outcome, UnitOutcome::Created) << database->detail;
    EXPECT_EQ(fs::path(files->detail).parent_path(), layout.siteDirectory("app.example.com"));
    EXPECT_EQ(fs::path(database->detail).parent_path(), layout.siteDirectory("app.example.com") / "database");

    ArchiveEngine engine;
    auto restored = scratch / "restored";
    ASSERT_TRUE(engine.extract(files->detail, restored).has_value());
    EXPECT_EQ(ReadFile(restored / "index.php"), "<?php // app");
    EXPECT_FALSE(fs::exists(restored / "node_modules"));

    EXPECT_TRUE(GetTreeEntries(remoteTemp).empty());
    EXPECT_EQ(shell.transfers.size(), 2u);
    EXPECT_NE(shell.commands.front().find("mkdir -p"), std::string::npos);
}

TEST_F(RemoteBackupTest, StreamModeUsesTheCommandChannel)
{
    auto results = Run(Options(RemoteTransferMode::ChannelStream));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(allSucceeded(results));
    EXPECT_TRUE(shell.transfers.empty());
    EXPECT_TRUE(RanCommandContaining(shell, "cat "));
    EXPECT_EQ(GetFileNames(layout.siteDirectory("app.example.com") / "database").size(), 1u);
}

TEST_F(RemoteBackupTest, UntouchedTreeSkipsFilesButStillDumps)
{
    AgeTree(site.documentRoot, std::chrono::hours(48));

    auto results = Run(Options());

    ASSERT_EQ(results.size(), 2u);
    const auto* files = FindResult(results, ArtifactKind::Files);
    const auto* database = FindResult(results, ArtifactKind::Database);
    ASSERT_NE(files, nullptr);
    ASSERT_NE(database, nullptr);
    EXPECT_EQ(files->outcome, UnitOutcome::Skipped);
    EXPECT_EQ(files->detail, "no files modified in the last 24 hours");
    EXPECT_EQ(database->outcome, UnitOutcome::Created);
    EXPECT_FALSE(RanCommandContaining(shell, "tar "));
}

TEST_F(RemoteBackupTest, TodaysArtifactSkipsTheWholeSite)
{
    // Arrange
    auto today = layout.artifactPath("app.example.com", ArtifactKind::Database,
                                     artifactTimestamp(std::chrono::system_clock::now()));
    WriteFile(today, "dump");

    // Act
    auto results = Run(Options(RemoteTransferMode::SecureCopy, true));

    // Assert
    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results)
    {
        EXPECT_EQ(result.outcome, UnitOutcome::Skipped);
        EXPECT_EQ(result.detail, "already backed up today");
    }
    EXPECT_FALSE(RanCommandContaining(shell, "tar "));
    EXPECT_FALSE(RanCommandContaining(shell, "mysqldump"));
}

TEST_F(RemoteBackupTest, OlderArtifactsDoNotCountAsToday)
{
    WriteFile(layout.artifactPath("app.example.com", ArtifactKind::Files, "2020-01-01_120000"), "old");
    RetentionManager retention(layout, RetentionPolicy{});
    RemoteBackupOrchestrator orchestrator(shell, layout, retention, logger, Options(RemoteTransferMode::SecureCopy, true));

    EXPECT_FALSE(orchestrator.hasBackupFromToday("app.example.com"));
    EXPECT_FALSE(orchestrator.hasBackupFromToday("unknown.example.com"));
}

TEST_F(RemoteBackupTest, TransferFailureLeavesNothingBehind)
{
    shell.failTransfers = true;

    auto results = Run(Options());

    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results)
    {
        EXPECT_EQ(result.outcome, UnitOutcome::Failed);
        EXPECT_NE(result.detail.find("simulated transfer failure"), std::string::npos);
    }
    EXPECT_TRUE(GetFileNames(layout.siteDirectory("app.example.com")).empty());
    EXPECT_TRUE(GetFileNames(layout.siteDirectory("app.example.com") / "database").empty());
    EXPECT_TRUE(GetTreeEntries(remoteTemp).empty());
}

TEST_F(RemoteBackupTest, RemoteDumpFailureIsReportedPerUnit)
{
    WriteScript(scratch / "remote-bin" / "mysqldump", "echo 'Access denied' >&2\nexit 2\n");

    auto results = Run(Options());

    const auto* files = FindResult(results, ArtifactKind::Files);
    const auto* database = FindResult(results, ArtifactKind::Database);
    ASSERT_NE(files, nullptr);
    ASSERT_NE(database, nullptr);
    EXPECT_EQ(files->outcome, UnitOutcome::Created);
    EXPECT_EQ(database->outcome, UnitOutcome::Failed);
    EXPECT_NE(database->detail.find("Failed to create database backup"), std::string::npos);
}

TEST_F(RemoteBackupTest, RotationAppliesToPulledArtifacts)
{
    for (const auto* stamp : {"2020-01-01_000000", "2020-01-02_000000"})
    {
        auto old = layout.artifactPath("app.example.com", ArtifactKind::Files, stamp);
        WriteFile(old, "old");
        SetModifiedAgo(old, std::chrono::hours(72));
    }

    auto results = Run(Options(), RetentionPolicy{1, 1});

    ASSERT_TRUE(allSucceeded(results));
    auto remaining = GetFileNames(layout.siteDirectory("app.example.com"));
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0], fs::path(FindResult(results, ArtifactKind::Files)->detail).filename().string());
}

TEST_F(RemoteBackupTest, UnpreparableTempDirectoryAbortsTheRun)
{
    shell.failOn = "rm -rf";
    RetentionManager retention(layout, RetentionPolicy{});
    RemoteBackupOrchestrator orchestrator(shell, layout, retention, logger, Options());

    auto results = orchestrator.run({site});

    ASSERT_FALSE(results.has_value());
    EXPECT_NE(results.error().find("temp directory"), std::string::npos);
    EXPECT_EQ(shell.commands.size(), 1u);
}

TEST_F(RemoteBackupTest, DangerousTempDirectoriesAreRejected)
{
    RetentionManager retention(layout, RetentionPolicy{});
    for (const auto* temp : {"", "/", "~", "~/"})
    {
        RemoteBackupOptions options;
        options.tempDirectory = temp;
        EXPECT_THROW(RemoteBackupOrchestrator(shell, layout, retention, logger, options), std::invalid_argument) << temp;
    }
}

class RemoteConfigSourceTest : public ScratchTest
{
protected:
    LocalShell shell;
    Logger logger;
};

TEST_F(RemoteConfigSourceTest, ReadsFilesAndClassifiesFailures)
{
    WriteFile(scratch / "site.conf", "ServerName remote.example.com\n");
    RemoteConfigSource source(shell, logger);

    auto present = source.readFile((scratch / "site.conf").string());
    auto missing = source.readFile((scratch / "absent.conf").string());

    ASSERT_TRUE(present.has_value());
    EXPECT_EQ(*present, "ServerName remote.example.com\n");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ReadError::NotFound);
}

TEST_F(RemoteConfigSourceTest, FallsBackToDefaultConfigLocations)
{
    shell.failOn = "find /etc";
    RemoteConfigSource source(shell, logger);

    auto files = source.configFiles();

    EXPECT_EQ(files, (std::vector<std::string>{"/etc/apache2/apache2.conf", "/etc/apache2/httpd.conf",
                                               "/etc/httpd/conf/httpd.conf"}));
}
