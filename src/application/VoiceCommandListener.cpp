/**
 * @file VoiceCommandListener.cpp
 * @brief Implementation of VoiceCommandListener.
 */

#include "application/VoiceCommandListener.hpp"
#include "domain/TaskErrors.hpp"
#include <iostream>

namespace voicetasks::application {

VoiceCommandListener::VoiceCommandListener(SessionCoordinator& coordinator,
                                           std::shared_ptr<domain::SpeechRecognizer> recognizer,
                                           std::shared_ptr<domain::FeedbackSink> feedback)
    : m_coordinator(coordinator), m_recognizer(std::move(recognizer)), m_feedback(std::move(feedback)) {}

VoiceCommandListener::~VoiceCommandListener() {
    stop();
}

void VoiceCommandListener::start() {
    if (m_running.exchange(true)) {
        return;
    }
    if (m_thread.joinable()) {
        m_thread.join(); // previous run ended on its own
    }
    m_stopRequested = false;
    m_thread = std::thread(&VoiceCommandListener::listenLoop, this);
}

void VoiceCommandListener::stop() {
    m_stopRequested = true;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
}

bool VoiceCommandListener::listenOnce() {
    m_feedback->notice("Listening for command");

    auto text = m_recognizer->listen();
    if (!text || text->empty()) {
        m_feedback->notice("Sorry, I didn't catch that.");
        return true;
    }

    std::cerr << "[VoiceCommandListener] Heard: " << *text << std::endl;

    try {
        m_feedback->deliver(m_coordinator.submit(*text));
        return true;
    } catch (const domain::SubmissionCancelledError&) {
        return false;
    } catch (const domain::PersistFailedError& e) {
        std::cerr << "[VoiceCommandListener] Stopping: " << e.what() << std::endl;
        m_feedback->notice("I could not save your tasks. Voice commands are paused.");
        return false;
    }
}

void VoiceCommandListener::listenLoop() {
    while (!m_stopRequested) {
        if (!listenOnce()) {
            break;
        }
    }
    m_running = false;
}

} // namespace voicetasks::application
