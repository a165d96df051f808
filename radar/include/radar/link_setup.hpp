#pragma once

#include <string>
#include <vector>

#include "radar_types.hpp"

namespace tradar::radar {

// Runs OS commands that configure CAN network links.
class LinkConfigurator {
 public:
  virtual ~LinkConfigurator() = default;

  // Throws errors::TransportError on failure unless `ignore_errors` is set.
  virtual void Run(const std::vector<std::string>& args, bool ignore_errors) = 0;
};

// Executes the command through the shell with its output discarded.
class ShellLinkConfigurator : public LinkConfigurator {
 public:
  void Run(const std::vector<std::string>& args, bool ignore_errors) override;
};

struct LinkCommand {
  std::vector<std::string> args;
  bool ignore_errors{false};
};

// "ip link set <channel> type can bitrate <N>" (tolerated) followed by
// "ip link set <channel> up" (fatal), with sudo and extra tokens prepended.
std::vector<LinkCommand> BuildLinkCommands(const RadarConfig& config, const std::string& channel);

// Brings up the car channel then the radar channel, each once. Channels on
// non-SocketCAN interfaces are skipped.
void BringUpLinks(LinkConfigurator& configurator, const RadarConfig& config);

std::string ShellQuote(const std::string& token);

}  // namespace tradar::radar
