#include "app/CrowdPulseApp.hpp"

int main(int argc, char** argv) {
    crowdpulse::app::CrowdPulseApp app;
    return app.Run(argc, argv);
}
