#include "app/ParaSyncApp.hpp"

int main(int argc, char** argv) {
    parasync::app::ParaSyncApp app;
    return app.Run(argc, argv);
}
