#include "app/VoiceTasksApp.hpp"

int main(int argc, char** argv) {
    voicetasks::app::VoiceTasksApp app;
    return app.Run(argc, argv);
}
