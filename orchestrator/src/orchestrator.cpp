#include "orchestrator.hpp"

#include <cstdlib>
#include <exception>
#include <set>

#include "exception.hpp"
#include "logging.hpp"

namespace vmpilot {

static std::optional<long long> env_number(const char *key) {
  const char *value = std::getenv(key);
  if (!value)
    return std::nullopt;
  try {
    size_t pos = 0;
    long long rv = std::stoll(value, &pos);
    if (pos != std::string(value).size() || rv < 0)
      throw std::invalid_argument(value);
    return rv;
  } catch (const std::logic_error &) {
    warn("[Orchestrator] ignoring {}={}: not a non-negative integer", key,
         value);
    return std::nullopt;
  }
}

orchestrator_options_t orchestrator_options_t::from_env() {
  orchestrator_options_t rv;
  if (const char *uri = std::getenv("VMPILOT_LIBVIRT_URI"))
    rv.libvirt_uri = uri;
  if (auto ms = env_number("VMPILOT_KEY_DELAY_MS"))
    rv.actor.key_delay = std::chrono::milliseconds(ms.value());
  if (auto ms = env_number("VMPILOT_COMMAND_TIMEOUT_MS"))
    rv.session.command_timeout = std::chrono::milliseconds(ms.value());
  if (auto ms = env_number("VMPILOT_BATCH_TIMEOUT_MS"))
    rv.batch_timeout = std::chrono::milliseconds(ms.value());
  if (const char *layout = std::getenv("VMPILOT_KEYBOARD_LAYOUT")) {
    if (auto parsed = parse_keyboard_layout(layout))
      rv.layout = parsed.value();
    else
      warn("[Orchestrator] ignoring VMPILOT_KEYBOARD_LAYOUT={}: unknown layout",
           layout);
  }
  return rv;
}

static void deliver(vm_actor_handle_t &handle, vm_command_t command) {
  switch (handle.commands.send(std::move(command))) {
  case send_result_t::ok:
    return;
  case send_result_t::full:
    throw exception<command_rejected>(handle.name, "mailbox is full");
  case send_result_t::closed:
    throw exception<command_rejected>(handle.name, "actor has stopped");
  }
}

orchestrator_t::orchestrator_t(std::shared_ptr<hypervisor_link_t> link,
                               const orchestrator_options_t &options,
                               session_opener_t opener,
                               std::shared_ptr<test_evaluator_t> evaluator)
    : link_(std::move(link)), options_(options), opener_(std::move(opener)),
      compiler_(std::make_shared<const key_compiler_t>(options.layout)),
      evaluator_(std::move(evaluator)) {
  if (!link_)
    throw exception<value_error>("orchestrator_t", "link is null");
  if (!opener_)
    opener_ = [](const std::string &endpoint,
                 const session_options_t &session_options) {
      return monitor_session_t::connect_unix(endpoint, session_options);
    };
  if (!evaluator_)
    evaluator_ = std::make_shared<typed_text_evaluator_t>(compiler_);
}

orchestrator_t::~orchestrator_t() {
  for (auto &[name, slot] : actors_) {
    if (!slot.thread.joinable())
      continue;
    if (slot.handle.commands.send(shutdown_t{}) != send_result_t::ok)
      debug("[Orchestrator] {} did not take shutdown, closing its mailbox",
            name);
    slot.handle.commands.release();
  }
  for (auto &[name, slot] : actors_) {
    if (slot.thread.joinable())
      slot.thread.join();
  }
}

std::vector<domain_info_t> orchestrator_t::discover() {
  auto domains = link_->list_active();
  for (const auto &domain : domains)
    info("[Orchestrator] found {} (UUID: {})", domain.name, domain.uuid);
  return domains;
}

void orchestrator_t::spawn(const std::string &name) {
  if (actors_.contains(name))
    throw exception<actor_already_exists>(name);

  auto domain = link_->lookup(name);
  if (!domain.has_value())
    throw exception<vm_not_found>(name);
  auto endpoint = link_->monitor_endpoint(domain.value());
  info("[Orchestrator] {} monitor at {}", name, endpoint);
  auto session = opener_(endpoint, options_.session);

  actor_collaborators_t collaborators;
  collaborators.evaluator = evaluator_;
  if (auto channel = link_->open_guest_channel(domain.value())) {
    collaborators.guest_agent = std::make_unique<qga::guest_agent_t>(
        std::move(channel), options_.guest);
    if (auto ping_channel = link_->open_guest_channel(domain.value()))
      collaborators.agent_signal = std::make_shared<guest_ping_signal_t>(
          std::make_unique<qga::guest_agent_t>(std::move(ping_channel),
                                               options_.guest));
  }

  auto [handle, endpoints] = make_actor_channels(name, options_.mailbox_size);
  auto actor = std::make_shared<vm_actor_t>(
      name, std::move(session), compiler_, std::move(endpoints.commands),
      std::move(endpoints.events), std::move(collaborators), options_.actor);
  actor_slot_t slot{std::move(handle), std::thread([actor] { actor->run(); })};
  actors_.emplace(name, std::move(slot));
  info("[Orchestrator] {} actor started", name);
}

void orchestrator_t::send(const std::string &name, vm_command_t command) {
  auto it = actors_.find(name);
  if (it == actors_.end())
    throw exception<actor_not_found>(name);
  deliver(it->second.handle, std::move(command));
}

void orchestrator_t::broadcast(const vm_command_t &command) {
  std::exception_ptr first;
  for (auto &[name, slot] : actors_) {
    debug("[Orchestrator] {} -> {}", name, command_name(command));
    try {
      deliver(slot.handle, command);
    } catch (const exception_t<command_rejected> &e) {
      warn("[Orchestrator] {}", e.message());
      if (!first)
        first = std::current_exception();
    }
  }
  if (first)
    std::rethrow_exception(first);
}

std::optional<vm_event_t>
orchestrator_t::recv_event(const std::string &name,
                           const duration_t &timeout) {
  auto it = actors_.find(name);
  if (it == actors_.end())
    throw exception<actor_not_found>(name);
  return it->second.handle.events.recv(timeout);
}

std::map<std::string, bool>
orchestrator_t::run_batch_test(const std::string &test_id,
                               const std::optional<duration_t> &timeout) {
  run_test_case_t command{test_id, ++last_run_};
  info("[Orchestrator] batch test {} (run {}) on {} VMs", test_id, command.run,
       actors_.size());
  std::map<std::string, bool> results;
  std::set<std::string> submitted;
  for (auto &[name, slot] : actors_) {
    results[name] = false;
    try {
      deliver(slot.handle, command);
      submitted.insert(name);
    } catch (const exception_t<command_rejected> &e) {
      warn("[Orchestrator] {}", e.message());
    }
  }

  auto due = now() + timeout.value_or(options_.batch_timeout);
  for (auto &[name, slot] : actors_) {
    if (submitted.contains(name))
      results[name] = await_verdict(slot, command, due);
  }

  size_t passed = 0;
  for (const auto &[name, ok] : results)
    passed += ok ? 1 : 0;
  info("[Orchestrator] batch test {}: {}/{} passed", test_id, passed,
       results.size());
  return results;
}

bool orchestrator_t::await_verdict(actor_slot_t &slot,
                                   const run_test_case_t &command,
                                   const time_point_t &due) {
  const auto &name = slot.handle.name;
  const auto &test_id = command.test_id;
  auto origin = command_origin(command);
  while (true) {
    auto current = now();
    if (current >= due) {
      warn("[Orchestrator] {}: no verdict for {} in time", name, test_id);
      return false;
    }
    auto event = slot.handle.events.recv(due - current);
    if (!event.has_value()) {
      if (slot.handle.events.is_closed()) {
        warn("[Orchestrator] {}: events closed before a verdict", name);
        return false;
      }
      continue;
    }

    if (auto *done = std::get_if<test_case_completed_t>(&event.value())) {
      if (done->test_id == test_id && done->run == command.run)
        return done->passed;
      if (done->test_id == test_id)
        debug("[Orchestrator] {}: dropping verdict of stale run {}", name,
              done->run);
    } else if (auto *err = std::get_if<command_error_t>(&event.value())) {
      if (err->origin == origin) {
        warn("[Orchestrator] {}: {} failed: {}", name, test_id, err->message);
        return false;
      }
    } else if (std::holds_alternative<stopped_t>(event.value())) {
      warn("[Orchestrator] {}: stopped before a verdict", name);
      return false;
    }
    debug("[Orchestrator] {}: skipping {}", name, event_name(event.value()));
  }
}

void orchestrator_t::shutdown_all() {
  info("[Orchestrator] shutting down {} actors", actors_.size());
  broadcast(shutdown_t{});
}

void orchestrator_t::wait_all() {
  for (auto it = actors_.begin(); it != actors_.end();) {
    if (it->second.thread.joinable())
      it->second.thread.join();
    debug("[Orchestrator] {} joined", it->first);
    it = actors_.erase(it);
  }
  info("[Orchestrator] all actors finished");
}

std::vector<std::string> orchestrator_t::names() const {
  std::vector<std::string> rv;
  for (const auto &[name, slot] : actors_)
    rv.push_back(name);
  return rv;
}

} // namespace vmpilot
