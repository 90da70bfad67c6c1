#include "sandbox/config.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/flags.hpp"

namespace {

using namespace sandbox;

TEST(ConfigTest, TestDefaults) {
  SandboxConfig config;
  EXPECT_EQ(config.backend, "local");
  EXPECT_EQ(config.default_timeout_sec, 30);
  EXPECT_EQ(config.max_output_kb, 10);
  EXPECT_EQ(config.container.image, "python:3.12-slim");
  EXPECT_FALSE(config.container.network_enabled);
  EXPECT_DOUBLE_EQ(config.container.cpu_limit, 0.5);
  EXPECT_EQ(config.container.memory_limit_mb, 256);
  const Interpreter* python = config.FindInterpreter("python");
  ASSERT_NE(python, nullptr);
  EXPECT_EQ(python->command, "python3");
  EXPECT_EQ(python->file_name, "main.py");
  EXPECT_EQ(config.FindInterpreter("ruby"), nullptr);
  EXPECT_NO_THROW(config.Validate());
}

TEST(ConfigTest, TestParseLanguages) {
  auto languages = SandboxConfig::ParseLanguages(
      "python=python3:main.py, sh=/bin/sh:main.sh,node=node");
  ASSERT_EQ(languages.size(), 3u);
  EXPECT_EQ(languages["python"].command, "python3");
  EXPECT_EQ(languages["python"].file_name, "main.py");
  EXPECT_EQ(languages["sh"].command, "/bin/sh");
  EXPECT_EQ(languages["sh"].file_name, "main.sh");
  EXPECT_EQ(languages["node"].command, "node");
  EXPECT_EQ(languages["node"].file_name, "main");
  EXPECT_TRUE(SandboxConfig::ParseLanguages("").empty());
}

TEST(ConfigTest, TestParseInvalidLanguages) {
  EXPECT_THROW(SandboxConfig::ParseLanguages("python"), config_error);
  EXPECT_THROW(SandboxConfig::ParseLanguages("=python3"), config_error);
  EXPECT_THROW(SandboxConfig::ParseLanguages("python="), config_error);
  EXPECT_THROW(SandboxConfig::ParseLanguages("python=a:b:c"), config_error);
  EXPECT_THROW(SandboxConfig::ParseLanguages("python=python3:../x.py"),
               config_error);
  EXPECT_THROW(SandboxConfig::ParseLanguages("python=python3:"),
               config_error);
  EXPECT_THROW(SandboxConfig::ParseLanguages("python=python3,python=pypy"),
               config_error);
}

TEST(ConfigTest, TestValidate) {
  SandboxConfig config;
  config.default_timeout_sec = 0;
  EXPECT_THROW(config.Validate(), config_error);

  config = SandboxConfig();
  config.max_output_kb = -1;
  EXPECT_THROW(config.Validate(), config_error);

  config = SandboxConfig();
  config.languages.clear();
  EXPECT_THROW(config.Validate(), config_error);

  config = SandboxConfig();
  config.container.cpu_limit = 0;
  EXPECT_THROW(config.Validate(), config_error);

  config = SandboxConfig();
  config.container.memory_limit_mb = 0;
  EXPECT_THROW(config.Validate(), config_error);

  config = SandboxConfig();
  config.container.image = "";
  EXPECT_THROW(config.Validate(), config_error);

  config = SandboxConfig();
  config.container.workdir = "workspace";
  EXPECT_THROW(config.Validate(), config_error);
}

TEST(ConfigTest, TestFromFlags) {
  gflags::FlagSaver saver;
  FLAGS_backend = "container";
  FLAGS_default_timeout = 12;
  FLAGS_max_output_kb = 3;
  FLAGS_temp_directory = "/var/tmp/codebox";
  FLAGS_languages = "sh=/bin/sh:main.sh,python=python3.12:main.py";
  FLAGS_local_memory_limit_mb = 128;
  FLAGS_container_image = "python:3.11-alpine";
  FLAGS_container_network = true;
  FLAGS_container_cpus = 1.5;
  FLAGS_container_memory_mb = 512;
  FLAGS_container_user = "1000:1000";
  FLAGS_container_pids_limit = 16;
  FLAGS_docker_binary = "podman";

  SandboxConfig config = SandboxConfig::FromFlags();
  EXPECT_EQ(config.backend, "container");
  EXPECT_EQ(config.default_timeout_sec, 12);
  EXPECT_EQ(config.max_output_kb, 3);
  EXPECT_EQ(config.scratch_root, "/var/tmp/codebox");
  ASSERT_EQ(config.languages.size(), 2u);
  EXPECT_EQ(config.languages["sh"].command, "/bin/sh");
  EXPECT_EQ(config.languages["python"].command, "python3.12");
  EXPECT_EQ(config.local_memory_limit_mb, 128);
  EXPECT_EQ(config.container.image, "python:3.11-alpine");
  EXPECT_TRUE(config.container.network_enabled);
  EXPECT_DOUBLE_EQ(config.container.cpu_limit, 1.5);
  EXPECT_EQ(config.container.memory_limit_mb, 512);
  EXPECT_EQ(config.container.user, "1000:1000");
  EXPECT_EQ(config.container.pids_limit, 16);
  EXPECT_EQ(config.container.docker_binary, "podman");
  EXPECT_EQ(config.container.workdir, "/workspace");
  EXPECT_NO_THROW(config.Validate());
}

TEST(ConfigTest, TestFromFlagsInvalidLanguages) {
  gflags::FlagSaver saver;
  FLAGS_languages = "python";
  EXPECT_THROW(SandboxConfig::FromFlags(), config_error);
}

TEST(ConfigTest, TestFlagValidators) {
  gflags::FlagSaver saver;
  EXPECT_EQ(gflags::SetCommandLineOption("default_timeout", "0"), "");
  EXPECT_EQ(gflags::SetCommandLineOption("container_cpus", "0.001"), "");
  EXPECT_NE(gflags::SetCommandLineOption("container_cpus", "0.25"), "");
  EXPECT_DOUBLE_EQ(FLAGS_container_cpus, 0.25);
}

TEST(ConfigTest, TestCpuLimitResolution) {
  SandboxConfig config;
  config.container.cpu_limit = 0.001;
  EXPECT_THROW(config.Validate(), config_error);
  config.container.cpu_limit = 0.01;
  EXPECT_NO_THROW(config.Validate());
}

}  // namespace
