/**
 * @file orchestrator.hpp
 * @brief Runs one actor per VM and fans commands out to them
 * @details
 *
 * `orchestrator_t` keeps a registry of VM actors keyed by VM name. Each actor
 * runs on its own thread and owns its monitor session; the orchestrator only
 * holds the command sender and event receiver of each actor.
 *
 * ```cpp
 * auto link = std::make_shared<vmpilot::libvirt_link_t>();
 * vmpilot::orchestrator_t orchestrator(link,
 *                                      vmpilot::orchestrator_options_t::from_env());
 * for (const auto &vm : orchestrator.discover())
 *   orchestrator.spawn(vm.name);
 * auto results = orchestrator.run_batch_test("T1");
 * orchestrator.shutdown_all();
 * orchestrator.wait_all();
 * ```
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "hypervisor_link.hpp"
#include "vm_actor.hpp"

namespace vmpilot {

struct orchestrator_options_t {
  std::string libvirt_uri = "qemu:///system";

  keyboard_layout_t layout = keyboard_layout_t::en_us;

  session_options_t session;

  actor_options_t actor;

  qga::guest_options_t guest;

  /**
   * @brief Maximum wait for the verdicts of one batch test
   */
  duration_t batch_timeout = std::chrono::seconds(60);

  size_t mailbox_size = mailbox_limit;

  /**
   * @brief Defaults overridden by `VMPILOT_LIBVIRT_URI`,
   * `VMPILOT_KEY_DELAY_MS`, `VMPILOT_COMMAND_TIMEOUT_MS`,
   * `VMPILOT_BATCH_TIMEOUT_MS` and `VMPILOT_KEYBOARD_LAYOUT`
   * @note Malformed values are logged and ignored
   */
  static orchestrator_options_t from_env();
};

/**
 * @brief Opens a monitor session on a socket path
 */
using session_opener_t = std::function<std::unique_ptr<monitor_session_t>(
    const std::string &endpoint, const session_options_t &options)>;

/**
 * @brief Owns one actor thread per VM
 * @details Not thread-safe; drive it from a single thread.
 */
class orchestrator_t {
public:
  /**
   * @param opener Defaults to `monitor_session_t::connect_unix`
   * @param evaluator Defaults to `typed_text_evaluator_t`
   */
  orchestrator_t(std::shared_ptr<hypervisor_link_t> link,
                 const orchestrator_options_t &options = {},
                 session_opener_t opener = nullptr,
                 std::shared_ptr<test_evaluator_t> evaluator = nullptr);

  orchestrator_t(const orchestrator_t &) = delete;

  orchestrator_t &operator=(const orchestrator_t &) = delete;

  /**
   * @brief Shuts down and joins the remaining actors
   */
  ~orchestrator_t();

  /**
   * @brief Lists the running VMs
   */
  std::vector<domain_info_t> discover();

  /**
   * @brief Connects to the VM and starts its actor
   * @throw exception_t<actor_already_exists>, exception_t<vm_not_found>, or
   * the error of the monitor handshake. The registry is unchanged then.
   */
  void spawn(const std::string &name);

  /**
   * @brief Enqueues a command without waiting for it
   * @throw exception_t<actor_not_found>, exception_t<command_rejected>
   */
  void send(const std::string &name, vm_command_t command);

  /**
   * @brief Sends a copy of the command to every actor
   * @details Every actor is tried; the first failure is rethrown afterwards.
   */
  void broadcast(const vm_command_t &command);

  /**
   * @return The next event of the actor, `std::nullopt` on timeout or once the
   * actor's events are exhausted
   * @throw exception_t<actor_not_found>
   */
  std::optional<vm_event_t> recv_event(const std::string &name,
                                       const duration_t &timeout);

  /**
   * @brief Runs a test case on every actor
   * @details Each call tags its submissions with a fresh run number; verdicts
   * left over from an earlier call are skipped.
   * @param timeout Overrides `batch_timeout` for this call
   * @return Verdict per VM, for every VM registered at the time of the call
   */
  std::map<std::string, bool>
  run_batch_test(const std::string &test_id,
                 const std::optional<duration_t> &timeout = std::nullopt);

  void shutdown_all();

  /**
   * @brief Joins every actor thread, in name order
   * @details Joined actors leave the registry, so their names can be spawned
   * again.
   */
  void wait_all();

  size_t actor_count() const { return actors_.size(); }

  std::vector<std::string> names() const;

  const std::shared_ptr<const key_compiler_t> &compiler() const {
    return compiler_;
  }

private:
  struct actor_slot_t {
    vm_actor_handle_t handle;

    std::thread thread;
  };

  bool await_verdict(actor_slot_t &slot, const run_test_case_t &command,
                     const time_point_t &due);

  std::shared_ptr<hypervisor_link_t> link_;

  orchestrator_options_t options_;

  session_opener_t opener_;

  std::shared_ptr<const key_compiler_t> compiler_;

  std::shared_ptr<test_evaluator_t> evaluator_;

  std::map<std::string, actor_slot_t> actors_;

  uint64_t last_run_ = 0;
};

} // namespace vmpilot
