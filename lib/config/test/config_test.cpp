#include <lib/config/src/config.h>
#include <gtest/gtest.h>

namespace {

using pgagent::AgentConfig;
using pgagent::parse_config;

TEST(Config, Defaults) {
  AgentConfig config;
  EXPECT_EQ(config.connection.psql, "psql");
  EXPECT_TRUE(config.connection.host.empty());
  EXPECT_EQ(config.connection.port, 5432);
  EXPECT_EQ(config.connection.connect_timeout, 3);
  EXPECT_EQ(config.connection.query_timeout_millis, 5000);
  EXPECT_EQ(config.databases, std::vector<std::string>{"postgres"});
  EXPECT_EQ(config.poll_interval, 60);
  EXPECT_TRUE(config.tags.empty());
}

TEST(Config, ParseFile) {
  auto maybe_config = pgagent::parse_config_file("lib/config/test/resources/agent.conf");
  ASSERT_TRUE(maybe_config.has_value());
  const auto& config = maybe_config.value();

  EXPECT_EQ(config.connection.host, "db.example.com");
  EXPECT_EQ(config.connection.port, 6432);
  EXPECT_EQ(config.connection.user, "atlas");
  EXPECT_EQ(config.connection.query_timeout_millis, 2500);
  EXPECT_EQ(config.connection.connect_timeout, 3);
  std::vector<std::string> expected_dbs{"app", "reporting"};
  EXPECT_EQ(config.databases, expected_dbs);
  EXPECT_EQ(config.poll_interval, 30);
  std::unordered_map<std::string, std::string> expected_tags{{"nf.app", "pg"},
                                                             {"nf.cluster", "pg-main"}};
  EXPECT_EQ(config.tags, expected_tags);
}

TEST(Config, MissingFileUsesDefaults) {
  auto config = pgagent::parse_config_file("lib/config/test/resources/does-not-exist.conf");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->connection.port, 5432);
  EXPECT_EQ(config->poll_interval, 60);
}

TEST(Config, InvalidValue) {
  EXPECT_FALSE(pgagent::parse_config_file("lib/config/test/resources/invalid_port.conf"));
  EXPECT_FALSE(parse_config({"port=70000"}));
  EXPECT_FALSE(parse_config({"poll_interval=0"}));
  EXPECT_FALSE(parse_config({"connect_timeout=-1"}));
  EXPECT_FALSE(parse_config({"databases= , ,"}));
}

TEST(Config, SkipsMalformedAndUnknown) {
  auto config = parse_config({"  # comment", "no equals sign", "=value", "color=blue", "port=1"});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->connection.port, 1);
}

TEST(Config, LayersOnBase) {
  AgentConfig base;
  base.connection.host = "primary";
  base.poll_interval = 10;
  auto config = parse_config({"poll_interval=20"}, base);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->connection.host, "primary");
  EXPECT_EQ(config->poll_interval, 20);
}

TEST(Config, ApplySetting) {
  AgentConfig config;
  EXPECT_TRUE(pgagent::apply_setting("host", "10.0.0.1", &config));
  EXPECT_EQ(config.connection.host, "10.0.0.1");
  EXPECT_FALSE(pgagent::apply_setting("psql", "", &config));
  EXPECT_FALSE(pgagent::apply_setting("unknown", "x", &config));
  EXPECT_FALSE(pgagent::apply_setting("port", "54x", &config));
  EXPECT_EQ(config.connection.port, 5432);
}

TEST(Config, ParseDatabases) {
  std::vector<std::string> expected{"a", "b c", "d"};
  EXPECT_EQ(pgagent::parse_databases("a, b c ,,d,"), expected);
  EXPECT_TRUE(pgagent::parse_databases("").empty());
}

}  // namespace
