#include "sandbox/sandbox_factory.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "sandbox/container.hpp"
#include "sandbox/local.hpp"

namespace sandbox {

SandboxFactory::store_t* SandboxFactory::Backends_() {
  static store_t* backends = [] {
    auto* store = new store_t;
    (*store)["local"] = [](const SandboxConfig& config) {
      return std::unique_ptr<Sandbox>(new LocalSandbox(config));
    };
    (*store)["container"] = [](const SandboxConfig& config) {
      return std::unique_ptr<Sandbox>(new ContainerSandbox(config));
    };
    return store;
  }();
  return backends;
}

void SandboxFactory::Register(const std::string& name, create_t create) {
  CHECK(!name.empty()) << "Backends need a name";
  (*Backends_())[name] = std::move(create);
}

std::vector<std::string> SandboxFactory::Backends() {
  std::vector<std::string> names;
  for (const auto& backend : *Backends_()) names.push_back(backend.first);
  return names;
}

std::unique_ptr<Sandbox> SandboxFactory::Get(const SandboxConfig& config) {
  const store_t& backends = *Backends_();
  auto it = backends.find(config.backend);
  if (it == backends.end()) {
    throw config_error(absl::StrCat("Unknown sandbox backend \"",
                                    config.backend, "\", available: ",
                                    absl::StrJoin(Backends(), ", ")));
  }
  config.Validate();
  LOG(INFO) << "Using the " << config.backend << " sandbox backend";
  return it->second(config);
}

}  // namespace sandbox
