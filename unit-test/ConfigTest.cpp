#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace labjudge;

TEST(ConfigTest, DefaultsAreValidTest) {
    labjudge_config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.backend, "runguard");
    EXPECT_EQ(config.make_sandbox()->name(), "runguard");

    auto manager = config.make_sandbox_manager_config();
    EXPECT_EQ(manager.max_sandboxes, 4);
    EXPECT_DOUBLE_EQ(manager.grace, 1);
    EXPECT_EQ(manager.defaults.process_limit, 64);

    auto grading = config.make_grading_config();
    EXPECT_DOUBLE_EQ(grading.deadline_factor, 3);
    EXPECT_DOUBLE_EQ(grading.watchdog_factor, 6);
}

TEST(ConfigTest, PartialOverrideTest) {
    labjudge_config config;
    config.workers = 8;
    R"({"backend": "container", "max_sandboxes": 2, "grace_seconds": 0.5, "debug": true})"_json.get_to(config);

    EXPECT_EQ(config.workers, 8);
    EXPECT_EQ(config.backend, "container");
    EXPECT_EQ(config.max_sandboxes, 2);
    EXPECT_EQ(config.make_sandbox()->name(), "container");
    EXPECT_TRUE(config.make_sandbox_manager_config().keep_files);
    EXPECT_DOUBLE_EQ(config.make_container_config().grace, 0.5);
    EXPECT_DOUBLE_EQ(config.make_runguard_config().grace, 0.5);
}

TEST(ConfigTest, ValidateTest) {
    auto invalid = [](auto mutate) {
        labjudge_config config;
        mutate(config);
        EXPECT_THROW(config.validate(), invalid_argument);
    };
    invalid([](labjudge_config &c) { c.backend = "vm"; });
    invalid([](labjudge_config &c) { c.workers = 0; });
    invalid([](labjudge_config &c) { c.max_sandboxes = 0; });
    invalid([](labjudge_config &c) { c.sandbox_retries = -1; });
    invalid([](labjudge_config &c) { c.cpu_quota = 0; });
    invalid([](labjudge_config &c) { c.deadline_factor = 0.5; });
    invalid([](labjudge_config &c) { c.watchdog_factor = 2; });
    invalid([](labjudge_config &c) { c.watchdog_slack_seconds = 5; });
    invalid([](labjudge_config &c) { c.toolchains = 3; });
}

TEST(ConfigTest, LoadConfigFileTest) {
    auto dir = test::make_temp_dir("config");
    write_file_content(dir / "toolchains.json",
                       R"({"languages": [{"language": "bash", "extension": ".sh", "run_command": ["bash", "{source}"]}]})");
    write_file_content(dir / "labjudge.json", R"({"run_dir": "/srv/run", "toolchains": "toolchains.json"})");
    write_file_content(dir / "broken.json", "{ run_dir");

    auto config = load_config(dir / "labjudge.json");
    EXPECT_EQ(config.run_dir.string(), "/srv/run");
    EXPECT_EQ(config.toolchains.get<string>(), (dir / "toolchains.json").string());

    auto registry = config.make_toolchains();
    EXPECT_TRUE(registry.supports("bash"));
    EXPECT_TRUE(registry.supports("python"));

    EXPECT_THROW(load_config(dir / "broken.json"), invalid_argument);
    filesystem::remove_all(dir);
}

TEST(ConfigTest, InlineToolchainsTest) {
    labjudge_config config;
    config.toolchains = R"({"aliases": {"golang": "cpp"}})"_json;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.make_toolchains().lookup("golang").language, "cpp");
}
