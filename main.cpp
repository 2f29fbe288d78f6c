#include "app/ReflectApp.hpp"

int main(int argc, char** argv) {
    reflect::app::ReflectApp app;
    return app.Run(argc, argv);
}
