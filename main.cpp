#include "app/DirTreeApp.hpp"

int main(int argc, char** argv) {
    dirtree::app::DirTreeApp app;
    return app.Run(argc, argv);
}
