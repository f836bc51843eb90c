#include "app/ReflectCoreApp.hpp"

int main(int argc, char** argv) {
    reflectcore::app::ReflectCoreApp app;
    return app.Run(argc, argv);
}
