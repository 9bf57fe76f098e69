#include "infra/logging.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rwc {

void InitLogging(const LoggingConfig& cfg) {
  const auto level = spdlog::level::from_str(cfg.level);
  // from_str maps anything it doesn't know to "off"
  if (level == spdlog::level::off && cfg.level != "off") {
    throw std::runtime_error("logging.level: unknown level '" + cfg.level + "'");
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!cfg.file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      throw std::runtime_error("logging.file_path: " + std::string(e.what()));
    }
  }

  auto logger = std::make_shared<spdlog::logger>("rwc", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern(cfg.pattern);
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(std::move(logger));
}

}
