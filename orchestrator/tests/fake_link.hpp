#pragma once

#include <map>
#include <memory>
#include <string>

#include "exception.hpp"
#include "fake_guest_channel.hpp"
#include "fake_qemu.hpp"
#include "hypervisor_link.hpp"
#include "monitor_session.hpp"
#include "orchestrator.hpp"

namespace vmpilot {
namespace fake {

/**
 * @brief In-memory hypervisor whose VMs are `fake_qemu_t` peers
 */
class fake_link_t : public hypervisor_link_t {
public:
  struct vm_t {
    domain_info_t info;
    bool has_socket;
    std::shared_ptr<fake_qemu_t> qemu;
    std::shared_ptr<fake_agent_t> agent;
  };

  std::shared_ptr<fake_qemu_t> add(const std::string &name,
                                   bool has_socket = true) {
    auto qemu = std::make_shared<fake_qemu_t>();
    uint32_t id = static_cast<uint32_t>(vms.size() + 1);
    vms[name] = vm_t{{name, fmt::format("00000000-0000-0000-0000-{:012}", id),
                      id, 1},
                     has_socket,
                     qemu,
                     nullptr};
    return qemu;
  }

  std::shared_ptr<fake_agent_t> add_agent(const std::string &name) {
    auto agent = std::make_shared<fake_agent_t>();
    vms.at(name).agent = agent;
    return agent;
  }

  std::vector<domain_info_t> list_active() override {
    std::vector<domain_info_t> rv;
    for (const auto &[name, vm] : vms)
      rv.push_back(vm.info);
    return rv;
  }

  std::optional<domain_handle_t> lookup(const std::string &name) override {
    auto it = vms.find(name);
    if (it == vms.end())
      return std::nullopt;
    return domain_handle_t{name, it->second.info.uuid, it->second.info.id};
  }

  std::string monitor_endpoint(const domain_handle_t &domain) override {
    if (!vms.at(domain.name).has_socket)
      throw exception<vm_not_found>(domain.name, "no monitor socket");
    return "/run/fake/" + domain.name + ".sock";
  }

  std::unique_ptr<qga::guest_channel_t>
  open_guest_channel(const domain_handle_t &domain) override {
    auto agent = vms.at(domain.name).agent;
    if (!agent)
      return nullptr;
    return make_guest_channel(agent);
  }

  /**
   * @brief Opens sessions on the fake peers by endpoint
   */
  session_opener_t opener() {
    return [this](const std::string &endpoint,
                  const session_options_t &options) {
      for (const auto &[name, vm] : vms) {
        if (endpoint == "/run/fake/" + name + ".sock")
          return monitor_session_t::connect(make_stream(vm.qemu), options);
      }
      throw exception<disconnected>("no such socket: " + endpoint);
    };
  }

  std::map<std::string, vm_t> vms;
};

} // namespace fake
} // namespace vmpilot
