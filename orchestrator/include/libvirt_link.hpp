/**
 * @file libvirt_link.hpp
 * @brief `hypervisor_link_t` over libvirt
 * @details
 *
 * The connection is opened lazily on first use and closed with the link.
 * Guest channels share the connection and stay usable after the link is gone.
 *
 * ```cpp
 * auto link = std::make_shared<vmpilot::libvirt_link_t>("qemu:///system");
 * for (const auto &vm : link->list_active())
 *   vmpilot::info("{} {}", vm.name, vm.uuid);
 * ```
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <libvirt/libvirt.h>

#include "hypervisor_link.hpp"

namespace vmpilot {

constexpr const char *libvirt_default_uri = "qemu:///system";

class libvirt_link_t : public hypervisor_link_t {
public:
  explicit libvirt_link_t(const std::string &uri = libvirt_default_uri);

  libvirt_link_t(const libvirt_link_t &) = delete;

  libvirt_link_t &operator=(const libvirt_link_t &) = delete;

  std::vector<domain_info_t> list_active() override;

  std::optional<domain_handle_t> lookup(const std::string &name) override;

  /**
   * @details `/var/lib/libvirt/qemu/domain-{id}-{name}/monitor.sock`, which
   * must exist
   */
  std::string monitor_endpoint(const domain_handle_t &domain) override;

  /**
   * @brief Guest agent commands through `virDomainQemuAgentCommand`
   */
  std::unique_ptr<qga::guest_channel_t>
  open_guest_channel(const domain_handle_t &domain) override;

  const std::string &uri() const { return uri_; }

  bool is_connected() const;

private:
  /**
   * @throw exception_t<runtime_error> if libvirt cannot be reached
   */
  std::shared_ptr<virConnect> ensure_connected();

  std::string uri_;

  mutable std::mutex mutex_;

  std::shared_ptr<virConnect> conn_;
};

} // namespace vmpilot
