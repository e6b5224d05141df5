#include <gtest/gtest.h>

#include "TestSupport.h"
#include "utils/config.hpp"

using namespace test_support;
using namespace std::chrono_literals;

TEST(PreviewConfig, LoadsProjectsAndSettings) {
  TempDir dir;
  write_file(dir / "hotpreview.yaml", R"(
host: 127.0.0.1
gateway_port: 4001
debounce_ms: 150
compile_timeout_ms: 5000
max_channels: 8
quiet: true
exclude:
  - node_modules
  - "*.bak"
access:
  blocked:
    - secrets
projects:
  - id: shop
    name: Shop
    root: sites/shop
    entry: app.html
    proxy:
      - prefix: /api
        target: http://127.0.0.1:9000
    compile:
      command: make
      timeout_ms: 2500
)");

  auto config = PreviewConfig::load(dir / "hotpreview.yaml");
  EXPECT_EQ(config.gateway_port, 4001);
  EXPECT_EQ(config.debounce_window, 150ms);
  EXPECT_EQ(config.compile_timeout, 5000ms);
  EXPECT_EQ(config.max_channels, 8u);
  EXPECT_TRUE(config.quiet);
  EXPECT_EQ(config.exclude, (std::vector<std::string>{"node_modules", "*.bak"}));
  ASSERT_EQ(config.blocked_paths.size(), 1u);
  EXPECT_EQ(config.blocked_paths[0], dir / "secrets");

  ASSERT_EQ(config.projects.size(), 1u);
  const auto &project = config.projects[0];
  EXPECT_EQ(project.id, "shop");
  EXPECT_EQ(project.root, dir / "sites/shop");
  EXPECT_EQ(project.entry_document, "app.html");
  ASSERT_EQ(project.proxy_rules.size(), 1u);
  EXPECT_EQ(project.proxy_rules[0].target, "http://127.0.0.1:9000");
  ASSERT_TRUE(project.compile_step.has_value());
  EXPECT_EQ(project.compile_step->command, "make");
  EXPECT_EQ(project.compile_step->working_dir, dir / "sites/shop");
  EXPECT_EQ(project.compile_step->timeout, 2500ms);
}

TEST(PreviewConfig, DefaultsApply) {
  TempDir dir;
  write_file(dir / "hotpreview.yaml", "projects: []\n");

  auto config = PreviewConfig::load(dir / "hotpreview.yaml");
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.gateway_port, 3001);
  EXPECT_EQ(config.debounce_window, 300ms);
  EXPECT_EQ(config.compile_timeout, 30000ms);
  EXPECT_EQ(config.max_error_bytes, 4096u);
  EXPECT_EQ(config.mailbox_capacity, 64u);
  EXPECT_EQ(config.max_channels, 50u);
  EXPECT_TRUE(config.inject_livereload);
  EXPECT_EQ(config.exclude, ExcludeRules::default_patterns());
  EXPECT_TRUE(config.projects.empty());
}

TEST(PreviewConfig, MissingFileIsAnError) {
  TempDir dir;
  EXPECT_THROW(PreviewConfig::load(dir / "absent.yaml"), ConfigurationError);
}

TEST(PreviewConfig, MalformedYamlIsAnError) {
  TempDir dir;
  write_file(dir / "bad.yaml", "projects: [unclosed\n");
  EXPECT_THROW(PreviewConfig::load(dir / "bad.yaml"), ConfigurationError);
}

TEST(PreviewConfig, InvalidValuesAreErrors) {
  TempDir dir;

  write_file(dir / "negative.yaml", "debounce_ms: -5\n");
  EXPECT_THROW(PreviewConfig::load(dir / "negative.yaml"), ConfigurationError);

  write_file(dir / "port.yaml", "gateway_port: 70000\n");
  EXPECT_THROW(PreviewConfig::load(dir / "port.yaml"), ConfigurationError);

  write_file(dir / "type.yaml", "max_channels: many\n");
  EXPECT_THROW(PreviewConfig::load(dir / "type.yaml"), ConfigurationError);

  write_file(dir / "noroot.yaml", "projects:\n  - id: lost\n");
  EXPECT_THROW(PreviewConfig::load(dir / "noroot.yaml"), ConfigurationError);

  write_file(dir / "nocommand.yaml",
             "projects:\n  - root: .\n    compile:\n      timeout_ms: 10\n");
  EXPECT_THROW(PreviewConfig::load(dir / "nocommand.yaml"), ConfigurationError);
}

TEST(PreviewConfig, AbsoluteRootsAreKept) {
  TempDir dir;
  write_file(dir / "hotpreview.yaml",
             "projects:\n  - root: " + dir.path().string() + "\n");

  auto config = PreviewConfig::load(dir / "hotpreview.yaml");
  ASSERT_EQ(config.projects.size(), 1u);
  EXPECT_EQ(config.projects[0].root, dir.path());
  EXPECT_TRUE(config.projects[0].id.empty());
}
