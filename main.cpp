#include "app/GeoFlowApp.hpp"

int main(int argc, char** argv) {
    geoflow::app::GeoFlowApp app;
    return app.Run(argc, argv);
}
