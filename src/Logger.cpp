#include "Logger.h"

namespace spi {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_log_stream << message << std::endl;
}

void Logger::dump(std::ostream& os) {
    std::lock_guard<std::mutex> lock(m_mutex);
    os << "--- SPI LOG DUMP ---\n"
       << m_log_stream.str()
       << "--- END LOG DUMP ---\n";
}

std::string Logger::contents() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_log_stream.str();
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_log_stream.str("");
    m_log_stream.clear();
}

} // namespace spi
