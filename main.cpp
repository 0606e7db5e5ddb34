#include "app/ParasiteRegApp.hpp"

int main(int argc, char** argv) {
    parasitereg::app::ParasiteRegApp app;
    return app.Run(argc, argv);
}
