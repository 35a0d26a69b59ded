#pragma once
#include "collectors/IInputCollector.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace vigil::collectors {

// Endpoint health documents written by the endpoint collector script:
//   system_info.json, disk.json, resource.json      (required)
//   services.json, reboot.json, defender.json        (optional)
class EndpointCollector : public IInputCollector {
public:
  // Services named in `service_allowlist` (case-insensitive) are not
  // counted as stopped.
  EndpointCollector(std::filesystem::path dir, std::vector<std::string> service_allowlist);

  void collect(CollectedInput& out) override;
  [[nodiscard]] const char* name() const override { return "EndpointCollector"; }

private:
  std::filesystem::path dir_;
  std::vector<std::string> allowlist_;
};

} // namespace vigil::collectors
