#include "gtest/gtest.h"
#include "helpers/TestHelpers.hpp"

#include "logger.hpp"
#include "site_directory.hpp"

#include <map>
#include <set>

namespace
{

/**
 * @brief ConfigSource serving fixed text, with selected paths reported unreadable.
 */
class MemoryConfigSource : public ConfigSource
{
public:
    std::vector<std::string> files;
    std::map<std::string, std::string> contents;
    std::vector<std::string> unreadable;
    std::vector<std::string> reads;

    std::vector<std::string> configFiles() override
    {
        return files;
    }

    std::expected<std::string, ReadError> readFile(const std::string& path) override
    {
        reads.push_back(path);
        if (std::find(unreadable.begin(), unreadable.end(), path) != unreadable.end())
        {
            return std::unexpected(ReadError::Unreadable);
        }
        auto it = contents.find(path);
        if (it == contents.end())
        {
            return std::unexpected(ReadError::NotFound);
        }
        return it->second;
    }
};

} // namespace

TEST(VirtualHostParsing, PairsNameWithFollowingRoot)
{
    // Arrange
    const std::string config =
        "<VirtualHost *:80>\n"
        "    ServerName app.example.com\n"
        "    ServerAlias www.app.example.com\n"
        "    DocumentRoot /var/www/app/public\n"
        "</VirtualHost>\n"
        "<VirtualHost *:443>\n"
        "    servername \"shop.example.com\"\n"
        "    DOCUMENTROOT \"/var/www/shop dir/public\"\n"
        "</VirtualHost>\n";

    // Act
    auto hosts = SiteDirectory::parseVirtualHosts(config);

    // Assert
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].serverName, "app.example.com");
    EXPECT_EQ(hosts[0].documentRoot, "/var/www/app/public");
    EXPECT_EQ(hosts[1].serverName, "shop.example.com");
    EXPECT_EQ(hosts[1].documentRoot, "/var/www/shop dir/public");
}

TEST(VirtualHostParsing, RootWithoutPrecedingNameInBlockIsIgnored)
{
    const std::string config =
        "<VirtualHost *:80>\n"
        "    ServerName first.example.com\n"
        "</VirtualHost>\n"
        "<VirtualHost *:80>\n"
        "    DocumentRoot /var/www/orphan\n"
        "    ServerName late.example.com\n"
        "</VirtualHost>\n"
        "# ServerName commented.example.com\n"
        "# DocumentRoot /var/www/commented\n";

    auto hosts = SiteDirectory::parseVirtualHosts(config);

    EXPECT_TRUE(hosts.empty());
}

TEST(VirtualHostParsing, NameIsConsumedByItsRoot)
{
    const std::string config =
        "ServerName one.example.com\n"
        "DocumentRoot /var/www/one\n"
        "DocumentRoot /var/www/two\n";

    auto hosts = SiteDirectory::parseVirtualHosts(config);

    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].documentRoot, "/var/www/one");
}

TEST(EnvironmentParsing, ExtractsDatabaseKeys)
{
    const std::string env =
        "APP_NAME=Shop\n"
        "# DB_DATABASE=commented\n"
        "DB_HOST=127.0.0.1\n"
        "DB_DATABASE=\"shop\"\n"
        "DB_USERNAME='shop_user'\n"
        "DB_PASSWORD= s3cr=t \n"
        "DB_DATABASE=second\n"
        "garbage line\n";

    auto config = SiteDirectory::parseEnvironment(env);

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.name, "shop");
    EXPECT_EQ(config.user, "shop_user");
    EXPECT_EQ(config.password, "s3cr=t");
}

TEST(EnvironmentParsing, MissingKeysStayEmpty)
{
    auto config = SiteDirectory::parseEnvironment("DB_DATABASE=shop\n");

    EXPECT_EQ(config.name, "shop");
    EXPECT_TRUE(config.user.empty());
    EXPECT_FALSE(config.usable());
}

TEST(EnvironmentParsing, CandidatesStartAtTheDocumentRoot)
{
    auto candidates = SiteDirectory::environmentCandidates("/var/www/app/public");

    ASSERT_GE(candidates.size(), 3u);
    EXPECT_EQ(candidates[0], "/var/www/app/public/.env");
    EXPECT_EQ(candidates[1], "/var/www/app/.env");
    EXPECT_EQ(candidates[2], "/var/www/.env");
}

TEST(SiteDiscovery, DeduplicatesAndAttachesCredentials)
{
    // Arrange
    Logger logger;
    MemoryConfigSource source;
    source.files = {"/etc/apache2/sites-enabled/a.conf", "/etc/apache2/sites-enabled/b.conf", "/etc/apache2/missing.conf"};
    source.contents["/etc/apache2/sites-enabled/a.conf"] =
        "<VirtualHost *:80>\nServerName app.example.com\nDocumentRoot /var/www/app/public\n</VirtualHost>\n";
    source.contents["/etc/apache2/sites-enabled/b.conf"] =
        "<VirtualHost *:443>\nServerName app.example.com\nDocumentRoot /var/www/app/public\n</VirtualHost>\n"
        "<VirtualHost *:80>\nServerName static.example.com\nDocumentRoot /var/www/static\n</VirtualHost>\n";
    source.contents["/var/www/app/.env"] = "DB_DATABASE=app\nDB_USERNAME=app_user\nDB_PASSWORD=pw\n";

    // Act
    SiteDirectory directory(logger);
    auto sites = directory.discover(source);

    // Assert
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].serverName, "app.example.com");
    EXPECT_EQ(sites[0].documentRoot, "/var/www/app/public");
    EXPECT_EQ(sites[0].database.name, "app");
    EXPECT_EQ(sites[0].database.user, "app_user");
    EXPECT_EQ(sites[0].database.password, "pw");
    EXPECT_EQ(sites[1].serverName, "static.example.com");
    EXPECT_TRUE(sites[1].database.empty());
}

TEST(SiteDiscovery, SkipsInvalidNamesAndRelativeRoots)
{
    Logger logger;
    MemoryConfigSource source;
    source.files = {"/etc/httpd.conf"};
    source.contents["/etc/httpd.conf"] =
        "ServerName ..\nDocumentRoot /var/www/dots\n"
        "ServerName rel.example.com\nDocumentRoot www/rel\n"
        "ServerName ok.example.com\nDocumentRoot /var/www/ok\n";

    SiteDirectory directory(logger);
    auto sites = directory.discover(source);

    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites[0].serverName, "ok.example.com");
}

TEST(SiteDiscovery, SitesSharingANameGetSeparateBackupNames)
{
    // Arrange
    Logger logger;
    MemoryConfigSource source;
    source.files = {"/etc/httpd.conf"};
    source.contents["/etc/httpd.conf"] =
        "ServerName shop.example.com\nDocumentRoot /var/www/shop\n"
        "ServerName shop.example.com\nDocumentRoot /var/www/shop-staging\n"
        "ServerName shop.example.com\nDocumentRoot /var/www/shop-staging\n"
        "ServerName a+b\nDocumentRoot /var/www/ab-plus\n"
        "ServerName a_b\nDocumentRoot /var/www/ab-underscore\n";

    // Act
    SiteDirectory directory(logger);
    auto sites = directory.discover(source);
    auto again = directory.discover(source);

    // Assert
    ASSERT_EQ(sites.size(), 4u);
    EXPECT_EQ(sites[0].serverName, "shop.example.com");
    EXPECT_EQ(sites[1].documentRoot, "/var/www/shop-staging");
    EXPECT_EQ(sites[1].serverName.rfind("shop.example.com-", 0), 0u);
    EXPECT_EQ(sites[1].serverName.size(), std::string("shop.example.com-").size() + 8);
    EXPECT_EQ(sites[2].serverName, "a_b");
    EXPECT_EQ(sites[3].documentRoot, "/var/www/ab-underscore");
    EXPECT_NE(sites[3].serverName, "a_b");

    std::set<std::string> names;
    for (const auto& site : sites)
    {
        EXPECT_TRUE(sanitizeSiteName(site.serverName).has_value());
        names.insert(site.serverName);
    }
    EXPECT_EQ(names.size(), sites.size());

    ASSERT_EQ(again.size(), sites.size());
    for (std::size_t i = 0; i < sites.size(); ++i)
    {
        EXPECT_EQ(again[i].serverName, sites[i].serverName);
    }
}

TEST(SiteDiscovery, UnreadableEnvironmentIsReportedAndLaterCandidatesAreTried)
{
    Logger logger;
    MemoryConfigSource source;
    source.unreadable = {"/srv/site/public/.env"};
    source.contents["/srv/site/.env"] = "DB_DATABASE=site\nDB_USERNAME=site_user\n";

    SiteDirectory directory(logger);
    auto found = directory.locateEnvironment(source, "/srv/site/public");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "site");

    MemoryConfigSource locked;
    locked.unreadable = {"/srv/site/public/.env"};
    auto missing = directory.locateEnvironment(locked, "/srv/site/public");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ReadError::Unreadable);

    MemoryConfigSource empty;
    auto none = directory.locateEnvironment(empty, "/srv/site/public");
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error(), ReadError::NotFound);
}

class LocalConfigSourceTest : public ScratchTest
{
};

TEST_F(LocalConfigSourceTest, DistinguishesMissingFromUnreadable)
{
    // Arrange
    WriteFile(scratch / "site.conf", "ServerName local.example.com\n");
    fs::create_directories(scratch / "a_directory");
    LocalConfigSource source({(scratch / "site.conf").string()});

    // Act
    auto present = source.readFile((scratch / "site.conf").string());
    auto missing = source.readFile((scratch / "absent.conf").string());
    auto directory = source.readFile((scratch / "a_directory").string());

    // Assert
    ASSERT_TRUE(present.has_value());
    EXPECT_EQ(*present, "ServerName local.example.com\n");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), ReadError::NotFound);
    ASSERT_FALSE(directory.has_value());
    EXPECT_EQ(directory.error(), ReadError::Unreadable);
    EXPECT_EQ(source.configFiles().size(), 1u);
}

TEST_F(LocalConfigSourceTest, DiscoversSitesFromFiles)
{
    auto docroot = scratch / "www" / "app" / "public";
    fs::create_directories(docroot);
    WriteFile(scratch / "www" / "app" / ".env", "DB_DATABASE=app\nDB_USERNAME=app\n");
    WriteFile(scratch / "vhosts.conf",
              "<VirtualHost *:80>\nServerName app.test\nDocumentRoot " + docroot.string() + "\n</VirtualHost>\n");
    Logger logger;
    LocalConfigSource source({(scratch / "vhosts.conf").string(), (scratch / "missing.conf").string()});

    auto sites = SiteDirectory(logger).discover(source);

    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites[0].serverName, "app.test");
    EXPECT_TRUE(sites[0].database.usable());
}
