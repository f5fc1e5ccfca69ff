#include "libvirt_link.hpp"

#include <cstdlib>
#include <filesystem>
#include <type_traits>

#include <libvirt/libvirt-qemu.h>
#include <libvirt/virterror.h>

#include "exception.hpp"
#include "logging.hpp"

namespace vmpilot {

namespace {

using domain_ptr_t =
    std::unique_ptr<std::remove_pointer_t<virDomainPtr>, decltype(&virDomainFree)>;

std::string last_error() {
  virErrorPtr e = virGetLastError();
  return (e && e->message) ? e->message : "unknown";
}

domain_ptr_t wrap(virDomainPtr domain) {
  return domain_ptr_t(domain, &virDomainFree);
}

domain_handle_t handle_of(virDomainPtr domain) {
  domain_handle_t rv;
  const char *name = virDomainGetName(domain);
  if (!name)
    throw exception<runtime_error>("libvirt: cannot get domain name: " +
                                   last_error());
  rv.name = name;

  char uuid[VIR_UUID_STRING_BUFLEN];
  if (virDomainGetUUIDString(domain, uuid) < 0)
    throw exception<runtime_error>(fmt::format(
        "libvirt: cannot get UUID of {}: {}", rv.name, last_error()));
  rv.uuid = uuid;

  unsigned int id = virDomainGetID(domain);
  if (id != static_cast<unsigned int>(-1))
    rv.id = id;
  return rv;
}

class libvirt_guest_channel_t : public qga::guest_channel_t {
public:
  libvirt_guest_channel_t(std::shared_ptr<virConnect> conn,
                          domain_ptr_t domain, std::string name)
      : conn_(std::move(conn)), domain_(std::move(domain)),
        name_(std::move(name)) {}

  std::string transact(const std::string &request,
                       const duration_t &timeout) override {
    auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    if (seconds < 1)
      seconds = 1;
    char *reply = virDomainQemuAgentCommand(domain_.get(), request.c_str(),
                                            static_cast<int>(seconds), 0);
    if (!reply)
      throw exception<guest_agent_error>(
          fmt::format("{}: {}", name_, last_error()));
    std::string rv(reply);
    std::free(reply);
    return rv;
  }

private:
  std::shared_ptr<virConnect> conn_;

  domain_ptr_t domain_;

  std::string name_;
};

} // namespace

libvirt_link_t::libvirt_link_t(const std::string &uri) : uri_(uri) {}

bool libvirt_link_t::is_connected() const {
  std::scoped_lock lock(mutex_);
  return conn_ != nullptr;
}

std::shared_ptr<virConnect> libvirt_link_t::ensure_connected() {
  std::scoped_lock lock(mutex_);
  if (conn_)
    return conn_;
  virConnectPtr conn = virConnectOpen(uri_.c_str());
  if (!conn)
    throw exception<runtime_error>(
        fmt::format("libvirt: connect to {} failed: {}", uri_, last_error()));
  conn_ = std::shared_ptr<virConnect>(conn, [uri = uri_](virConnectPtr c) {
    if (virConnectClose(c) < 0)
      error("[Libvirt] closing {} failed: {}", uri, last_error());
  });
  info("[Libvirt] connected to {}", uri_);
  return conn_;
}

std::vector<domain_info_t> libvirt_link_t::list_active() {
  auto conn = ensure_connected();
  virDomainPtr *domains = nullptr;
  int n = virConnectListAllDomains(conn.get(), &domains,
                                   VIR_CONNECT_LIST_DOMAINS_ACTIVE);
  if (n < 0)
    throw exception<runtime_error>("libvirt: listing domains failed: " +
                                   last_error());

  std::vector<domain_ptr_t> owned;
  for (int i = 0; i < n; i++)
    owned.push_back(wrap(domains[i]));
  std::free(domains);

  std::vector<domain_info_t> rv;
  for (const auto &domain : owned) {
    auto handle = handle_of(domain.get());
    int state = VIR_DOMAIN_NOSTATE;
    int reason = 0;
    if (virDomainGetState(domain.get(), &state, &reason, 0) < 0)
      throw exception<runtime_error>(fmt::format(
          "libvirt: cannot get state of {}: {}", handle.name, last_error()));
    rv.push_back({handle.name, handle.uuid, handle.id, state});
  }
  debug("[Libvirt] {} active domains", rv.size());
  return rv;
}

std::optional<domain_handle_t>
libvirt_link_t::lookup(const std::string &name) {
  auto conn = ensure_connected();
  auto domain = wrap(virDomainLookupByName(conn.get(), name.c_str()));
  if (!domain) {
    debug("[Libvirt] {} not found: {}", name, last_error());
    return std::nullopt;
  }
  return handle_of(domain.get());
}

std::string libvirt_link_t::monitor_endpoint(const domain_handle_t &domain) {
  if (!domain.id.has_value())
    throw exception<vm_not_found>(domain.name, "not running");
  auto path = fmt::format("/var/lib/libvirt/qemu/domain-{}-{}/monitor.sock",
                          domain.id.value(), domain.name);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec))
    throw exception<vm_not_found>(domain.name,
                                  fmt::format("no monitor socket at {}", path));
  return path;
}

std::unique_ptr<qga::guest_channel_t>
libvirt_link_t::open_guest_channel(const domain_handle_t &domain) {
  auto conn = ensure_connected();
  auto dom = wrap(virDomainLookupByUUIDString(conn.get(), domain.uuid.c_str()));
  if (!dom)
    throw exception<vm_not_found>(domain.name, last_error());
  return std::make_unique<libvirt_guest_channel_t>(conn, std::move(dom),
                                                   domain.name);
}

} // namespace vmpilot
