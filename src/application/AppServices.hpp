/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/SessionCoordinator.hpp"
#include "application/VoiceCommandListener.hpp"
#include "domain/FeedbackSink.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace voicetasks::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::unique_ptr<SessionCoordinator> coordinator;
    std::shared_ptr<domain::FeedbackSink> typedFeedback; ///< Results of typed commands.
    std::shared_ptr<domain::FeedbackSink> voiceFeedback; ///< Results of spoken commands.
    std::unique_ptr<VoiceCommandListener> listener; ///< Null unless listening is enabled.
};

} // namespace voicetasks::application
