/* @file Protocol.cpp
 * @brief line codec for Command / Response
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <iomanip>
#include <sstream>

#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

using namespace pfd::protocols;

namespace {
  std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
      return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
  }

  std::string fixed2(double v) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << v;
    return out.str();
  }
} // namespace

std::string Command::toWire() const {
  std::string out = verb;
  for (const auto& a : args)
    out += ' ' + a;
  return out;
}

std::optional<Command> Command::fromWire(const std::string& line) {
  std::istringstream in(trim(line));
  Command cmd;
  if (!(in >> cmd.verb))
    return std::nullopt;
  for (std::string tok; in >> tok;)
    cmd.args.push_back(tok);
  return cmd;
}

Command Command::angles(double a1, double a2) { return { "ANGLES", { fixed2(a1), fixed2(a2) } }; }

Command Command::pump(bool on) { return { "PUMP", { on ? "1" : "0" } }; }

std::optional<Response> Response::fromWire(const std::string& line) {
  const std::string body = trim(line);
  auto tagged = [&body](const std::string& tag) {
    return body == tag || body.starts_with(tag + ' ');
  };

  if (tagged("OK"))
    return Response{ true, trim(body.substr(2)) };
  if (tagged("ERR"))
    return Response{ false, trim(body.substr(3)) };
  return std::nullopt;
}
