/* @file ControlPlane.cpp
 * @brief DND set/get + health over a serial line (phone side of the desk)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <utility>

// PFD headers
#include "core/ControlPlane.hpp"
#include "core/DndState.hpp"
#include "core/Logger.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/Command.hpp"

using namespace pfd::core;
using pfd::protocols::Command;
using pfd::protocols::Response;

namespace {
  constexpr const char* kTag = "ControlPlane";
}

ControlPlane::ControlPlane(std::unique_ptr<io::SerialChannel> channel, DndState& dnd,
                           std::shared_ptr<Logger> logger)
    : channel_(std::move(channel)), dnd_(dnd), logger_(std::move(logger)) {
  assert(channel_ && "[ControlPlane] serial channel is nullptr");
  assert(logger_ && "[ControlPlane] logger is nullptr");
}

ControlPlane::~ControlPlane() { stop(); }

bool ControlPlane::start(const std::string& device, speed_t baud) {
  if (running_.load())
    return true;

  device_ = device;
  baud_ = baud;
  if (!channel_->open(device_, baud_)) {
    logger_->error(kTag, "cannot open control link " + device_);
    return false;
  }

  running_.store(true);
  worker_ = std::thread([this] { serve(); });
  logger_->info(kTag, "listening on " + device_);
  return true;
}

void ControlPlane::stop() {
  if (!running_.exchange(false))
    return;
  if (worker_.joinable())
    worker_.join();
  channel_->close();
  logger_->info(kTag, "stopped");
}

Response ControlPlane::handle(const std::string& line) {
  const auto cmd = Command::fromWire(line);
  if (!cmd)
    return Response::failure("empty-command");

  if (cmd->verb == "DND?" && cmd->args.empty()) {
    const auto st = dnd_.get();
    return Response::success(std::string("DND ") + (st.active ? "1" : "0") + ' ' +
                             formatTimestamp(st.lastUpdated));
  }

  if (cmd->verb == "DND") {
    if (cmd->args.size() != 1)
      return Response::failure("bad-argument");
    const auto& arg = cmd->args.front();
    bool active = false;
    if (arg == "1" || arg == "on")
      active = true;
    else if (arg == "0" || arg == "off")
      active = false;
    else
      return Response::failure("bad-argument");

    const bool before = dnd_.get().active;
    dnd_.set(active);
    if (before != active)
      logger_->info(kTag, std::string("DND set to ") + (active ? "on" : "off"));
    return Response::success(std::string("DND ") + (active ? "1" : "0"));
  }

  if (cmd->verb == "HEALTH" && cmd->args.empty())
    return Response::success(formatTimestamp(std::chrono::system_clock::now()));

  return Response::failure("unknown-command");
}

void ControlPlane::serve() {
  auto lastAttempt = std::chrono::steady_clock::now();

  while (running_.load()) {
    if (!channel_->isOpen()) {
      if (std::chrono::steady_clock::now() - lastAttempt < kReconnectDelay) {
        std::this_thread::sleep_for(kPollInterval);
        continue;
      }
      lastAttempt = std::chrono::steady_clock::now();
      if (channel_->open(device_, baud_))
        logger_->info(kTag, "control link reopened");
      continue;
    }

    auto line = channel_->readLine(kPollInterval);
    if (!line) {
      if (!channel_->isOpen()) {
        logger_->warn(kTag, "control link dropped; DND keeps its last value");
        lastAttempt = std::chrono::steady_clock::now();
      }
      continue;
    }
    if (line->find_first_not_of(" \t\r") == std::string::npos)
      continue; // keep-alive newline

    const auto rsp = handle(*line);
    if (!channel_->writeLine(rsp.toWire(), kReplyTimeout))
      logger_->warn(kTag, "failed to write reply");
  }
}
