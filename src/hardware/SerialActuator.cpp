/* @file SerialActuator.cpp
 * @brief request/acknowledge exchange with the servo + pump MCU over serial
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <utility>

// PFD headers
#include "hardware/SerialActuator.hpp"
#include "protocols/Response.hpp"

using namespace pfd::hardware;

SerialActuator::SerialActuator(std::unique_ptr<io::SerialChannel> channel)
    : channel_(std::move(channel)) {
  assert(channel_ && "[SerialActuator] serial channel is nullptr");
}

bool SerialActuator::connect(const std::string& device, speed_t baud) {
  angles_.reset();
  dispenser_.reset();
  return channel_->open(device, baud);
}

LinkStatus SerialActuator::transact(const protocols::Command& cmd,
                                    std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  // a reply that missed the previous deadline must not answer this request
  while (std::chrono::steady_clock::now() < deadline &&
         channel_->readLine(std::chrono::milliseconds{ 0 })) {
  }

  const auto writeBudget = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (!channel_->writeLine(cmd.toWire(), writeBudget))
    return std::chrono::steady_clock::now() >= deadline ? LinkStatus::Timeout
                                                        : LinkStatus::Failed;

  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left <= std::chrono::milliseconds::zero())
      return LinkStatus::Timeout;

    auto line = channel_->readLine(left);
    if (!line)
      return channel_->isOpen() ? LinkStatus::Timeout : LinkStatus::Failed;

    // the MCU may interleave boot or debug chatter; only OK/ERR answer us
    if (auto rsp = protocols::Response::fromWire(*line))
      return rsp->ok ? LinkStatus::Ok : LinkStatus::Failed;
  }
}

LinkStatus SerialActuator::setAngles(const core::ActuatorAngles& angles,
                                     std::chrono::milliseconds timeout) {
  if (angles_ && *angles_ == angles)
    return LinkStatus::Ok;

  const auto status = transact(protocols::Command::angles(angles.a1, angles.a2), timeout);
  if (status == LinkStatus::Ok)
    angles_ = angles;
  else
    angles_.reset();
  return status;
}

LinkStatus SerialActuator::setDispenser(bool on, std::chrono::milliseconds timeout) {
  if (dispenser_ && *dispenser_ == on)
    return LinkStatus::Ok;

  const auto status = transact(protocols::Command::pump(on), timeout);
  if (status == LinkStatus::Ok)
    dispenser_ = on;
  else
    dispenser_.reset();
  return status;
}
