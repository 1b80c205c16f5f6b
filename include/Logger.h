#ifndef SPI_LOGGER_H
#define SPI_LOGGER_H

#include <string>
#include <sstream>
#include <mutex>
#include <iostream>

namespace spi {

class Logger {
public:
    // Singleton access
    static Logger& instance();

    // Log a message
    void log(const std::string& message);

    // Dumps the entire log content to a stream (like std::cerr)
    void dump(std::ostream& os);

    // Returns the buffered log text.
    std::string contents();

    // Discards everything logged so far.
    void clear();

private:
    Logger() = default; // Private constructor
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::stringstream m_log_stream;
    std::mutex m_mutex;
};

} // namespace spi

// A convenience macro for easy logging from anywhere in the code.
#define SPI_LOG(msg) ::spi::Logger::instance().log(msg)

#endif // SPI_LOGGER_H
