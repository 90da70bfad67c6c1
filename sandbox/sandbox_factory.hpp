#ifndef SANDBOX_SANDBOX_FACTORY_HPP
#define SANDBOX_SANDBOX_FACTORY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Creates sandboxes by backend name. "local" and "container" are always
// available; other backends can be added with Register, without changes to
// the code that uses the sandboxes.
// Registering a backend is not thread-safe and should be done before any
// threads are created.
class SandboxFactory {
 public:
  using create_t =
      std::function<std::unique_ptr<Sandbox>(const SandboxConfig& config)>;

  // Returns a sandbox of the backend named by config.backend. Throws
  // config_error if the backend is unknown or the configuration is invalid;
  // nothing is executed in that case.
  static std::unique_ptr<Sandbox> Get(const SandboxConfig& config);

  // Makes a backend available under the given name, replacing any backend
  // previously registered with it.
  static void Register(const std::string& name, create_t create);

  template <typename T>
  static void Register(const std::string& name) {
    Register(name, [](const SandboxConfig& config) {
      return std::unique_ptr<Sandbox>(new T(config));
    });
  }

  // Names of the registered backends, sorted.
  static std::vector<std::string> Backends();

 private:
  using store_t = std::map<std::string, create_t>;
  static store_t* Backends_();
};

}  // namespace sandbox

#endif
