#ifndef SANDBOX_LOCAL_HPP
#define SANDBOX_LOCAL_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs the interpreter as a child process of the current one, inside a fresh
// scratch directory that is removed afterwards. The only isolation is the
// process boundary: the code runs with the user, the permissions and the
// network access of the current process.
class LocalSandbox : public Sandbox {
 public:
  explicit LocalSandbox(SandboxConfig config) : Sandbox(std::move(config)) {}
  std::string Name() const override { return "local"; }

 protected:
  ExecutionResult ExecuteInternal(const ExecutionRequest& request,
                                  const Interpreter& interpreter) override;
};

}  // namespace sandbox
#endif
