/**
 * @file hypervisor_link.hpp
 * @brief Access to the hypervisor that runs the VMs
 * @details
 *
 * `hypervisor_link_t` finds running VMs and tells where their monitor sockets
 * are. `libvirt_link_t` (libvirt_link.hpp) implements it over libvirt.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "guest_agent.hpp"

namespace vmpilot {

/**
 * @brief Reference to one VM known to the hypervisor
 */
struct domain_handle_t {
  std::string name;

  std::string uuid;

  /**
   * @brief Runtime id, only while the VM runs
   */
  std::optional<uint32_t> id;
};

struct domain_info_t {
  std::string name;

  std::string uuid;

  std::optional<uint32_t> id;

  /**
   * @brief Hypervisor specific state code (libvirt `virDomainState`)
   */
  int state;
};

class hypervisor_link_t {
public:
  virtual ~hypervisor_link_t() = default;

  virtual std::vector<domain_info_t> list_active() = 0;

  virtual std::optional<domain_handle_t> lookup(const std::string &name) = 0;

  /**
   * @brief Path of the QMP socket of the VM
   * @throw exception_t<vm_not_found> if the VM has no reachable monitor
   */
  virtual std::string monitor_endpoint(const domain_handle_t &domain) = 0;

  /**
   * @return A channel to the guest agent, or `nullptr` if the link cannot
   * reach guest agents
   */
  virtual std::unique_ptr<qga::guest_channel_t>
  open_guest_channel(const domain_handle_t &) {
    return nullptr;
  }
};

} // namespace vmpilot
