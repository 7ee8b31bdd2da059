/**
 * @file VoiceCommandListener.hpp
 * @brief Background producer that feeds recognized speech into the session.
 */

#pragma once
#include <atomic>
#include <memory>
#include <thread>
#include "application/SessionCoordinator.hpp"
#include "domain/FeedbackSink.hpp"
#include "domain/SpeechRecognizer.hpp"

namespace voicetasks::application {

/**
 * @class VoiceCommandListener
 * @brief Runs the listening path on its own thread.
 *
 * Each cycle asks the recognizer for one utterance, submits the text to the
 * SessionCoordinator and hands the result to the feedback sink. Nothing
 * recognized means nothing is submitted. A slow recognizer only delays this
 * thread; typed submissions keep flowing through the coordinator.
 */
class VoiceCommandListener {
public:
    VoiceCommandListener(SessionCoordinator& coordinator,
                         std::shared_ptr<domain::SpeechRecognizer> recognizer,
                         std::shared_ptr<domain::FeedbackSink> feedback);
    ~VoiceCommandListener();

    /** @brief Starts the listening thread. No effect if already running. */
    void start();

    /**
     * @brief Asks the thread to stop and joins it.
     *
     * Returns after the utterance currently being recognized (if any) has been handled.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Runs a single listen/submit/feedback cycle on the calling thread.
     * @return False if the listener should stop (session shut down or storage failure).
     */
    bool listenOnce();

private:
    void listenLoop();

    SessionCoordinator& m_coordinator;
    std::shared_ptr<domain::SpeechRecognizer> m_recognizer;
    std::shared_ptr<domain::FeedbackSink> m_feedback;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
};

} // namespace voicetasks::application
