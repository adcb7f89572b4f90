#include "gtest/gtest.h"
#include "helpers/TestHelpers.hpp"

#include "file_backup.hpp"

#include <archive.h>
#include <archive_entry.h>

class ArchiveEngineTest : public ScratchTest
{
protected:
    fs::path source;
    fs::path restored;

    void SetUp() override
    {
        ScratchTest::SetUp();
        source = scratch / "site";
        restored = scratch / "restored";
        WriteFile(source / "index.php", "<?php echo 'hello';");
        WriteFile(source / "config" / "app.php", "<?php return [];");
        WriteFile(source / "node_modules" / "left-pad" / "index.js", "module.exports = 1;");
        WriteFile(source / "vendor" / "node_modules" / "nested.js", "nested");
        fs::create_directories(source / "storage" / "empty");
    }

    /**
     * @brief Writes a tar.gz holding a single regular file entry with the given path.
     */
    static void WriteSingleEntryArchive(const fs::path& archivePath, const std::string& entryPath)
    {
        struct archive* a = archive_write_new();
        archive_write_add_filter_gzip(a);
        archive_write_set_format_pax_restricted(a);
        ASSERT_EQ(archive_write_open_filename(a, archivePath.c_str()), ARCHIVE_OK);

        const std::string content = "payload";
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, entryPath.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
        archive_write_header(a, entry);
        archive_write_data(a, content.data(), content.size());
        archive_entry_free(entry);

        archive_write_close(a);
        archive_write_free(a);
    }
};

TEST_F(ArchiveEngineTest, RoundTripsTreeWithoutExcludedDirectory)
{
    // Arrange
    ArchiveEngine engine;
    auto archive = scratch / "backups" / "files_2024-01-01_000000.tar.gz";

    // Act
    auto created = engine.create(source, archive);
    auto extracted = engine.extract(archive, restored);

    // Assert
    ASSERT_TRUE(created.has_value()) << created.error();
    ASSERT_TRUE(extracted.has_value()) << extracted.error();
    EXPECT_EQ(GetTreeEntries(restored),
              (std::vector<std::string>{"config", "config/app.php", "index.php", "storage", "storage/empty", "vendor"}));
    EXPECT_EQ(ReadFile(restored / "index.php"), "<?php echo 'hello';");
    EXPECT_FALSE(fs::exists(archive.string() + ".partial"));
}

TEST_F(ArchiveEngineTest, EmptyExclusionKeepsEverything)
{
    ArchiveEngine engine(ArchiveOptions{""});
    auto archive = scratch / "all.tar.gz";

    ASSERT_TRUE(engine.create(source, archive).has_value());
    ASSERT_TRUE(engine.extract(archive, restored).has_value());

    EXPECT_TRUE(fs::exists(restored / "node_modules" / "left-pad" / "index.js"));
    EXPECT_TRUE(fs::exists(restored / "vendor" / "node_modules" / "nested.js"));
    EXPECT_FALSE(engine.isExcludedDirectory(""));
}

TEST_F(ArchiveEngineTest, SymlinksAreNotArchived)
{
    fs::create_symlink(source / "index.php", source / "link.php");
    fs::create_directory_symlink(source / "config", source / "config-link");
    ArchiveEngine engine;
    auto archive = scratch / "links.tar.gz";

    ASSERT_TRUE(engine.create(source, archive).has_value());
    ASSERT_TRUE(engine.extract(archive, restored).has_value());

    EXPECT_FALSE(fs::exists(fs::symlink_status(restored / "link.php")));
    EXPECT_FALSE(fs::exists(fs::symlink_status(restored / "config-link")));
}

TEST_F(ArchiveEngineTest, MissingSourceFailsWithoutLeavingAnArchive)
{
    ArchiveEngine engine;
    auto archive = scratch / "backups" / "missing.tar.gz";

    auto created = engine.create(scratch / "does-not-exist", archive);

    ASSERT_FALSE(created.has_value());
    EXPECT_NE(created.error().find("Source directory does not exist"), std::string::npos);
    EXPECT_FALSE(fs::exists(archive));
    EXPECT_FALSE(fs::exists(archive.string() + ".partial"));
}

TEST_F(ArchiveEngineTest, RefusesEntriesEscapingTheDestination)
{
    auto archive = scratch / "evil.tar.gz";
    WriteSingleEntryArchive(archive, "../escaped.txt");
    ArchiveEngine engine;

    auto extracted = engine.extract(archive, restored);

    ASSERT_FALSE(extracted.has_value());
    EXPECT_NE(extracted.error().find("Refusing unsafe archive entry"), std::string::npos);
    EXPECT_FALSE(fs::exists(scratch / "escaped.txt"));
}

TEST_F(ArchiveEngineTest, UnreadableArchiveIsAnError)
{
    WriteFile(scratch / "broken.tar.gz", "this is not gzip data");
    ArchiveEngine engine;

    auto extracted = engine.extract(scratch / "broken.tar.gz", restored);

    EXPECT_FALSE(extracted.has_value());
}
