/**
 * @file ConsoleFeedback.cpp
 * @brief Implementation of ConsoleFeedback.
 */

#include "infrastructure/ConsoleFeedback.hpp"

namespace voicetasks::infrastructure {

ConsoleFeedback::ConsoleFeedback(std::ostream& out, bool showNotices)
    : m_out(out), m_showNotices(showNotices) {}

void ConsoleFeedback::deliver(const domain::CommandResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << result.message << std::endl;
}

void ConsoleFeedback::notice(const std::string& message) {
    if (!m_showNotices) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << "* " << message << std::endl;
}

} // namespace voicetasks::infrastructure
