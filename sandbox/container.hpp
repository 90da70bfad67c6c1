#ifndef SANDBOX_CONTAINER_HPP
#define SANDBOX_CONTAINER_HPP

#include <string>
#include <vector>

#include "sandbox/process.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs the interpreter inside a new container for each execution, driving the
// container runtime through its command line client (docker, or anything
// accepting the same arguments).
// The scratch directory is the only host path visible in the container,
// mounted read-write at ContainerConfig::workdir; the root filesystem is
// read-only, network is disabled unless configured otherwise, cpu, memory and
// number of processes are limited, all capabilities are dropped and the code
// runs as an unprivileged user. Containers are always removed after use.
// The first execution may have to pull the image: that time counts against
// the timeout of the execution.
class ContainerSandbox : public Sandbox {
 public:
  explicit ContainerSandbox(SandboxConfig config)
      : Sandbox(std::move(config)) {}
  std::string Name() const override { return "container"; }

  // Arguments to pass to the client to create a container called name, with
  // host_dir mounted as working directory, that runs the interpreter.
  std::vector<std::string> CreateArgs(const std::string& name,
                                      const std::string& host_dir,
                                      const Interpreter& interpreter) const;

  // User the code runs as inside the container, as uid:gid.
  std::string User() const;

 protected:
  ExecutionResult ExecuteInternal(const ExecutionRequest& request,
                                  const Interpreter& interpreter) override;

 private:
  // Removes a container when destroyed, unless Remove was already called.
  class ContainerGuard {
   public:
    ContainerGuard(const ContainerSandbox* sandbox, std::string client,
                   std::string name)
        : sandbox_(sandbox), client_(std::move(client)), name_(std::move(name)) {}
    ~ContainerGuard();
    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;
    ContainerGuard(ContainerGuard&&) = delete;
    ContainerGuard& operator=(ContainerGuard&&) = delete;

    // Forcibly removes the container, stopping it if needed. Failures are
    // logged.
    void Remove();

   private:
    const ContainerSandbox* sandbox_;
    std::string client_;
    std::string name_;
    bool removed_ = false;
  };

  // Runs the client with the given arguments. Returns false and sets
  // error_msg if the client could not be started.
  bool RunClient(const std::string& client,
                 const std::vector<std::string>& args, int64_t wall_limit_millis,
                 size_t max_output_bytes, const CancellationToken* cancel,
                 ProcessInfo* info, std::string* error_msg) const;
};

}  // namespace sandbox

#endif
