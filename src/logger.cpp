#include "logger.hpp"

#include <cstdint>
#include <ctime>

void Logger::log(const std::string &stmt) {
  std::time_t now = std::time(nullptr);
  out << "[" << static_cast<uint32_t>(now) << "]";
  if (!tag.empty()) out << " [" << tag << "]";
  out << ": " << stmt << std::endl;
}
