#include "sandbox/sandbox_factory.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using ::testing::HasSubstr;

using namespace sandbox;

// Echoes the code back.
class EchoSandbox : public Sandbox {
 public:
  explicit EchoSandbox(SandboxConfig config) : Sandbox(std::move(config)) {}
  std::string Name() const override { return "echo"; }

 protected:
  ExecutionResult ExecuteInternal(const ExecutionRequest& request,
                                  const Interpreter& interpreter) override {
    ExecutionResult result;
    result.stdout_data = interpreter.command + ": " + request.code;
    return result;
  }
};

TEST(SandboxFactoryTest, TestBuiltinBackends) {
  EXPECT_THAT(SandboxFactory::Backends(), Contains("local"));
  EXPECT_THAT(SandboxFactory::Backends(), Contains("container"));

  SandboxConfig config;
  config.backend = "local";
  std::unique_ptr<Sandbox> local = SandboxFactory::Get(config);
  ASSERT_TRUE(local);
  EXPECT_EQ(local->Name(), "local");

  config.backend = "container";
  std::unique_ptr<Sandbox> container = SandboxFactory::Get(config);
  ASSERT_TRUE(container);
  EXPECT_EQ(container->Name(), "container");
}

TEST(SandboxFactoryTest, TestUnknownBackend) {
  SandboxConfig config;
  config.backend = "vm";
  try {
    SandboxFactory::Get(config);
    FAIL() << "config_error not thrown";
  } catch (const config_error& exc) {
    EXPECT_THAT(exc.what(), HasSubstr("vm"));
    EXPECT_THAT(exc.what(), HasSubstr("local"));
  }
}

TEST(SandboxFactoryTest, TestInvalidConfig) {
  SandboxConfig config;
  config.max_output_kb = 0;
  EXPECT_THROW(SandboxFactory::Get(config), config_error);
}

TEST(SandboxFactoryTest, TestRegister) {
  SandboxFactory::Register<EchoSandbox>("echo");
  EXPECT_THAT(SandboxFactory::Backends(), Contains("echo"));
  SandboxConfig config;
  config.backend = "echo";
  std::unique_ptr<Sandbox> sandbox = SandboxFactory::Get(config);
  ASSERT_TRUE(sandbox);
  ExecutionResult result =
      sandbox->Execute(ExecutionRequest("print(1)", "python", 5));
  EXPECT_EQ(result.stdout_data, "python3: print(1)");
  EXPECT_EQ(result.meta["backend"], "echo");
}

}  // namespace
