#include <lemu/emulator/function.hpp>

#include <lemu/common/exceptions.hpp>

namespace lemu::emulator::function {

  std::string to_string(State state)
  {
    switch (state) {
    case State::UNBUILT:
      return "Unbuilt";
    case State::BUILDING:
      return "Building";
    case State::STARTING:
      return "Starting";
    case State::READY:
      return "Ready";
    case State::INVOKING:
      return "Invoking";
    case State::CRASHED:
      return "Crashed";
    case State::REBUILDING:
      return "Rebuilding";
    }
    return "Unknown";
  }

  invocation::InvocationPtr InvocationQueue::_next()
  {
    while (!_queue.empty()) {
      auto inv = std::move(_queue.front());
      _queue.pop_front();

      // Timed out while waiting in the queue.
      if (!inv->fulfilled()) {
        return inv;
      }
    }
    return nullptr;
  }

  std::optional<InvocationQueue::Handoff> InvocationQueue::push(invocation::InvocationPtr inv)
  {
    _queue.push_back(std::move(inv));

    if (!_poller.has_value() || _outstanding) {
      return std::nullopt;
    }

    auto next = _next();
    if (!next) {
      return std::nullopt;
    }

    _outstanding = next;
    Handoff handoff{std::move(_poller.value()), std::move(next)};
    _poller.reset();
    return handoff;
  }

  std::optional<InvocationQueue::Handoff> InvocationQueue::poll(poller_t&& poller)
  {
    auto next = _next();
    if (!next) {
      _poller = std::move(poller);
      return std::nullopt;
    }

    _outstanding = next;
    return Handoff{std::move(poller), std::move(next)};
  }

  invocation::InvocationPtr InvocationQueue::finish(const std::string& id)
  {
    if (!_outstanding || _outstanding->id() != id) {
      throw common::UnknownInvocationId(_function, id);
    }

    return std::move(_outstanding);
  }

  std::deque<invocation::InvocationPtr> InvocationQueue::drain()
  {
    std::deque<invocation::InvocationPtr> result;
    result.swap(_queue);
    return result;
  }

  invocation::InvocationPtr InvocationQueue::take_outstanding()
  {
    return std::move(_outstanding);
  }

  std::optional<InvocationQueue::poller_t> InvocationQueue::take_poller()
  {
    std::optional<poller_t> result;
    result.swap(_poller);
    return result;
  }

} // namespace lemu::emulator::function
