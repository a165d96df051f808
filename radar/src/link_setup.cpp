#include "radar/link_setup.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <utility>

#include <sys/wait.h>

#include <common/errors.hpp>
#include <common/logging.hpp>
#include "io/can/can_link.hpp"

namespace tradar::radar {

std::string ShellQuote(const std::string& token) {
  if (!token.empty() &&
      token.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                              "0123456789-_./=:@%+,") == std::string::npos) {
    return token;
  }
  std::string quoted = "'";
  for (char c : token) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

void ShellLinkConfigurator::Run(const std::vector<std::string>& args, bool ignore_errors) {
  std::ostringstream cmd;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      cmd << ' ';
    }
    cmd << ShellQuote(args[i]);
  }
  const std::string command = cmd.str();
  const int status = std::system((command + " > /dev/null 2>&1").c_str());
  const int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
  if (exit_code == 0) {
    log::Logf(log::Level::kDebug, "Ran: %s", command.c_str());
    return;
  }
  if (ignore_errors) {
    log::Logf(log::Level::kWarning, "Ignoring failure (%d) of: %s", exit_code, command.c_str());
    return;
  }
  throw errors::TransportError("Command failed with exit code " + std::to_string(exit_code),
                               command);
}

std::vector<LinkCommand> BuildLinkCommands(const RadarConfig& config, const std::string& channel) {
  std::vector<std::string> prefix;
  if (config.use_sudo) {
    prefix.push_back("sudo");
  }
  prefix.insert(prefix.end(), config.setup_extra_args.begin(), config.setup_extra_args.end());

  LinkCommand bitrate{prefix, true};
  for (const char* token : {"ip", "link", "set"}) {
    bitrate.args.push_back(token);
  }
  bitrate.args.push_back(channel);
  for (const char* token : {"type", "can", "bitrate"}) {
    bitrate.args.push_back(token);
  }
  bitrate.args.push_back(std::to_string(config.bitrate));

  LinkCommand up{prefix, false};
  for (const char* token : {"ip", "link", "set"}) {
    up.args.push_back(token);
  }
  up.args.push_back(channel);
  up.args.push_back("up");

  return {bitrate, up};
}

void BringUpLinks(LinkConfigurator& configurator, const RadarConfig& config) {
  const std::pair<std::string, std::string> buses[] = {
      {config.car_channel, config.CarInterface()},
      {config.radar_channel, config.RadarInterface()},
  };
  std::vector<std::string> done;
  for (const auto& [channel, interface_name] : buses) {
    if (io::can::canonicalize_interface(interface_name) != io::can::kInterfaceSocketCan) {
      continue;
    }
    if (std::find(done.begin(), done.end(), channel) != done.end()) {
      continue;
    }
    done.push_back(channel);
    log::Logf(log::Level::kInfo, "Bringing up %s at %u bit/s", channel.c_str(), config.bitrate);
    for (const auto& command : BuildLinkCommands(config, channel)) {
      configurator.Run(command.args, command.ignore_errors);
    }
  }
}

}  // namespace tradar::radar
