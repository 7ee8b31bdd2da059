/**
 * @file ConsoleFeedback.hpp
 * @brief FeedbackSink that prints to a text stream.
 */

#pragma once

#include "domain/FeedbackSink.hpp"
#include <mutex>
#include <ostream>

namespace voicetasks::infrastructure {

/**
 * @class ConsoleFeedback
 * @brief Writes result messages to @p out, one per line.
 *
 * Notices are prefixed with "* " so they can be told apart from results.
 * Safe to share between the listening and typed paths.
 */
class ConsoleFeedback : public domain::FeedbackSink {
public:
    explicit ConsoleFeedback(std::ostream& out, bool showNotices = true);

    void deliver(const domain::CommandResult& result) override;
    void notice(const std::string& message) override;

private:
    std::ostream& m_out;
    bool m_showNotices;
    std::mutex m_mutex;
};

} // namespace voicetasks::infrastructure
