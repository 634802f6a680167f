#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include "manifest/tier_manifest_loader.hpp"

namespace fs = std::filesystem;

namespace manifest
{
    class TierManifestLoaderTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            dir = fs::temp_directory_path() /
                  (std::string("tierwatch_manifest_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::create_directories(dir);
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }

        std::string write(const std::string& text)
        {
            auto path = dir / "tierwatch.yaml";
            std::ofstream out(path);
            out << text;
            return path.string();
        }

        static Result<TierManifest> parse(const std::string& text)
        {
            return TierManifestLoader::parse(YAML::Load(text));
        }

        fs::path dir;
    };

    TEST_F(TierManifestLoaderTest, LoadsFullManifest)
    {
        auto path = write(R"(
database:
  unit: db-support
  run_as: dbadm
  probe_command: "dbctl status"
  start_command: "dbctl start"
  healthy_token: ONLINE
  max_retries: 4
  retry_interval_sec: 2
  settle_delay_sec: 1
  ready_delay_sec: 0
services: [app-core, app-auth]
service_settle_delay_sec: 3
watcher:
  self_install: false
  name: dbwatch.service
  unit_dir: /run/systemd/system
  log_file: /var/log/dbwatch.log
  start_after_install: true
)");

        auto r = TierManifestLoader::load(path);
        ASSERT_TRUE(r) << r.error().value_or("");

        const auto& m = r.value();
        EXPECT_EQ(m.source, fs::path(path).lexically_normal().string());
        EXPECT_EQ(m.database.unit, "db-support");
        EXPECT_EQ(m.database.run_as, "dbadm");
        EXPECT_EQ(m.database.probe_command, "dbctl status");
        EXPECT_EQ(m.database.start_command, "dbctl start");
        EXPECT_EQ(m.database.healthy_token, "ONLINE");
        EXPECT_EQ(m.database.max_retries, 4u);
        EXPECT_EQ(m.database.retry_interval_sec, 2u);
        EXPECT_EQ(m.database.settle_delay_sec, 1u);
        EXPECT_EQ(m.database.ready_delay_sec, 0u);
        EXPECT_EQ(m.services, (std::vector<std::string>{"app-core", "app-auth"}));
        EXPECT_EQ(m.service_settle_delay_sec, 3u);
        EXPECT_FALSE(m.watcher.self_install);
        EXPECT_EQ(m.watcher.name, "dbwatch.service");
        EXPECT_EQ(m.watcher.unit_dir, "/run/systemd/system");
        EXPECT_EQ(m.watcher.log_file, "/var/log/dbwatch.log");
        EXPECT_TRUE(m.watcher.working_dir.empty());
        EXPECT_TRUE(m.watcher.start_after_install);
    }

    TEST_F(TierManifestLoaderTest, MinimalManifestTakesDefaults)
    {
        auto r = parse("services: [app-core]\n");
        ASSERT_TRUE(r);

        const auto& m = r.value();
        EXPECT_EQ(m.database.unit, "sapinit");
        EXPECT_EQ(m.database.run_as, "hdbadm");
        EXPECT_EQ(m.database.healthy_token, "GREEN");
        EXPECT_EQ(m.database.max_retries, 20u);
        EXPECT_EQ(m.database.retry_interval_sec, 20u);
        EXPECT_EQ(m.database.settle_delay_sec, 30u);
        EXPECT_EQ(m.database.ready_delay_sec, 30u);
        EXPECT_EQ(m.service_settle_delay_sec, 5u);
        EXPECT_TRUE(m.watcher.self_install);
        EXPECT_EQ(m.watcher.name, "tierwatch.service");
        EXPECT_EQ(m.watcher.unit_dir, "/etc/systemd/system");
        EXPECT_FALSE(m.watcher.start_after_install);
        EXPECT_TRUE(m.source.empty());
    }

    TEST_F(TierManifestLoaderTest, EmptyRunAsIsAllowed)
    {
        auto r = parse("database: {run_as: ''}\nservices: [a]\n");
        ASSERT_TRUE(r);
        EXPECT_TRUE(r.value().database.run_as.empty());
    }

    TEST_F(TierManifestLoaderTest, MissingFileIsNotFound)
    {
        auto r = TierManifestLoader::load((dir / "absent.yaml").string());
        EXPECT_EQ(r.code(), ResultCode::NotFound);
    }

    TEST_F(TierManifestLoaderTest, MalformedYamlIsInvalidArgument)
    {
        auto path = write("services: [app-core\n");
        auto r = TierManifestLoader::load(path);
        EXPECT_EQ(r.code(), ResultCode::InvalidArgument);
        ASSERT_TRUE(r.error().has_value());
        EXPECT_NE(r.error()->find(path), std::string::npos);
    }

    TEST_F(TierManifestLoaderTest, RejectsBadValues)
    {
        EXPECT_EQ(parse("{}").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: []").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a, '']").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: a").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a]\ndatabase: {max_retries: -1}").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a]\ndatabase: {retry_interval_sec: soon}").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a]\ndatabase: {healthy_token: ''}").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a]\ndatabase: {unit: ''}").code(), ResultCode::InvalidArgument);
    }

    TEST_F(TierManifestLoaderTest, DuplicateServiceIsAlreadyExists)
    {
        auto r = parse("services: [app-core, app-auth, app-core]");
        EXPECT_EQ(r.code(), ResultCode::AlreadyExists);
        ASSERT_TRUE(r.error().has_value());
        EXPECT_NE(r.error()->find("app-core"), std::string::npos);
    }

    TEST_F(TierManifestLoaderTest, WatcherNameMustBeAServiceUnit)
    {
        EXPECT_EQ(parse("services: [a]\nwatcher: {name: tierwatch}").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a]\nwatcher: {name: .service}").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a]\nwatcher: {name: ../x.service}").code(), ResultCode::InvalidArgument);
        EXPECT_EQ(parse("services: [a]\nwatcher: {unit_dir: ''}").code(), ResultCode::InvalidArgument);
        EXPECT_TRUE(parse("services: [a]\nwatcher: {name: x.service}"));
    }

    TEST_F(TierManifestLoaderTest, ShippedSampleIsValid)
    {
        auto r = TierManifestLoader::load(TIERWATCH_SAMPLE_CONFIG);
        ASSERT_TRUE(r) << r.error().value_or("");
        EXPECT_FALSE(r.value().services.empty());
    }
}
